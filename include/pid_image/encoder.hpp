#ifndef PID_IMAGE_ENCODER_HPP_
#define PID_IMAGE_ENCODER_HPP_

#include <pid_image/pid_image_export.h>
#include <pid_image/types.hpp>
#include <pid_image/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace pid_image {

// ============================================================================
// Encoder Interface
// ============================================================================

/**
 * Abstract base class for image file encoders.
 * Used by the encoder registry for runtime polymorphism.
 */
class PID_IMAGE_EXPORT encoder {
public:
    virtual ~encoder() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::span<const std::string_view> extensions() const noexcept = 0;

    /**
     * Encode an RGBA surface.
     * @return Encoded file bytes, or empty vector on failure
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> encode(const memory_surface& surf) const = 0;
};

// ============================================================================
// Encoder Registry
// ============================================================================

/**
 * Registry for image encoders.
 * Built-in encoders (png, tga, bmp) are registered by default.
 * User code can add new encoders at runtime.
 */
class PID_IMAGE_EXPORT encoder_registry {
public:
    /**
     * Get the global encoder registry instance.
     */
    [[nodiscard]] static encoder_registry& instance();

    /**
     * Register an encoder.
     * @param enc Unique pointer to encoder (ownership transferred)
     */
    void register_encoder(std::unique_ptr<encoder> enc);

    /**
     * Find encoder by name.
     * @param name Encoder name (e.g., "png")
     * @return Pointer to encoder if found, nullptr otherwise
     */
    [[nodiscard]] const encoder* find_encoder(std::string_view name) const;

    /**
     * Find encoder by the extension of an output path (case-insensitive).
     * @param path Output file path
     * @return Pointer to encoder if found, nullptr otherwise
     */
    [[nodiscard]] const encoder* find_encoder_for_path(const std::filesystem::path& path) const;

    [[nodiscard]] std::size_t encoder_count() const noexcept {
        return encoders_.size();
    }

    /**
     * Get encoder at index.
     * @param index Encoder index (0 to encoder_count()-1)
     * @return Pointer to encoder, or nullptr if index out of range
     */
    [[nodiscard]] const encoder* encoder_at(std::size_t index) const noexcept {
        return index < encoders_.size() ? encoders_[index].get() : nullptr;
    }

private:
    encoder_registry();
    ~encoder_registry();

    encoder_registry(const encoder_registry&) = delete;
    encoder_registry& operator=(const encoder_registry&) = delete;

    void register_builtin_encoders();

    std::vector<std::unique_ptr<encoder>> encoders_;
};

// ============================================================================
// Convenience Save Function
// ============================================================================

/**
 * Encode a surface in the format implied by the path extension and write it.
 * Nothing is left on disk unless the whole file was written.
 * @param surf Source surface
 * @param path Output file path
 * @return invalid_format for an unknown extension, io_error if encoding or
 *         writing failed
 */
[[nodiscard]] PID_IMAGE_EXPORT decode_result save_image(const memory_surface& surf,
                                                         const std::filesystem::path& path);

} // namespace pid_image

#endif // PID_IMAGE_ENCODER_HPP_
