#ifndef PID_IMAGE_SOURCE_HPP_
#define PID_IMAGE_SOURCE_HPP_

#include <pid_image/pid_image_export.h>
#include <pid_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace pid_image {

// ============================================================================
// Byte Source Interface
// ============================================================================

/**
 * Random-access view over raw PID bytes.
 * Reads take an absolute offset and never advance anything; callers are
 * expected to keep offset + width <= size() (byte_cursor enforces this).
 */
class PID_IMAGE_EXPORT byte_source {
public:
    virtual ~byte_source() = default;

    [[nodiscard]] virtual std::size_t size() const noexcept = 0;
    [[nodiscard]] virtual std::uint8_t read_u8(std::size_t offset) const = 0;
    [[nodiscard]] virtual std::uint32_t read_u32_le(std::size_t offset) const = 0;
    [[nodiscard]] virtual std::int32_t read_i32_le(std::size_t offset) const = 0;
};

// ============================================================================
// Span Source
// ============================================================================

/**
 * Byte source over memory owned by the caller.
 * The span must outlive the source.
 */
class PID_IMAGE_EXPORT span_source : public byte_source {
public:
    explicit span_source(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] std::size_t size() const noexcept override { return data_.size(); }
    [[nodiscard]] std::uint8_t read_u8(std::size_t offset) const override;
    [[nodiscard]] std::uint32_t read_u32_le(std::size_t offset) const override;
    [[nodiscard]] std::int32_t read_i32_le(std::size_t offset) const override;

private:
    std::span<const std::uint8_t> data_;
};

// ============================================================================
// Host Source
// ============================================================================

/**
 * Byte source whose bytes live in a host environment (e.g. a JavaScript
 * ArrayBuffer behind a WebAssembly import) and are fetched through
 * host-provided accessors. Offsets are 32-bit, matching the host ABI.
 */
class PID_IMAGE_EXPORT host_source : public byte_source {
public:
    struct accessors {
        std::uint8_t (*get_u8)(std::uint32_t offset) = nullptr;
        std::uint32_t (*get_u32_le)(std::uint32_t offset) = nullptr;
        std::int32_t (*get_i32_le)(std::uint32_t offset) = nullptr;
    };

    /**
     * @param fns Host accessors; all three must be set
     * @param length Number of bytes the host holds
     */
    host_source(const accessors& fns, std::uint32_t length) noexcept
        : fns_(fns), length_(length) {}

    [[nodiscard]] bool valid() const noexcept {
        return fns_.get_u8 && fns_.get_u32_le && fns_.get_i32_le;
    }

    [[nodiscard]] std::size_t size() const noexcept override {
        return valid() ? length_ : 0;
    }
    [[nodiscard]] std::uint8_t read_u8(std::size_t offset) const override;
    [[nodiscard]] std::uint32_t read_u32_le(std::size_t offset) const override;
    [[nodiscard]] std::int32_t read_i32_le(std::size_t offset) const override;

private:
    accessors fns_;
    std::uint32_t length_ = 0;
};

// ============================================================================
// Byte Cursor
// ============================================================================

/**
 * Sequential little-endian reader over a byte source.
 *
 * Every read checks offset + width against the source size first. On
 * failure it returns decode_error::out_of_bounds and the offset is left
 * unchanged; on success the value is stored and the offset advances by
 * the width of the read (1 or 4).
 */
class PID_IMAGE_EXPORT byte_cursor {
public:
    explicit byte_cursor(const byte_source& source, std::size_t offset = 0) noexcept
        : source_(source), offset_(offset) {}

    [[nodiscard]] decode_result next_u8(std::uint8_t& value);
    [[nodiscard]] decode_result next_u32_le(std::uint32_t& value);
    [[nodiscard]] decode_result next_i32_le(std::int32_t& value);

    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
    [[nodiscard]] std::size_t remaining() const noexcept {
        return offset_ < source_.size() ? source_.size() - offset_ : 0;
    }

private:
    [[nodiscard]] decode_result check(std::size_t width) const;

    const byte_source& source_;
    std::size_t offset_ = 0;
};

} // namespace pid_image

#endif // PID_IMAGE_SOURCE_HPP_
