#ifndef PID_IMAGE_CODECS_PID_HPP_
#define PID_IMAGE_CODECS_PID_HPP_

#include <pid_image/pid_image_export.h>
#include <pid_image/types.hpp>
#include <pid_image/surface.hpp>
#include <pid_image/source.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace pid_image {

// ============================================================================
// PID Format Types
// ============================================================================

constexpr std::size_t PID_HEADER_SIZE = 32;
constexpr std::size_t PID_PALETTE_COLORS = 256;
constexpr std::size_t PID_PALETTE_SIZE = PID_PALETTE_COLORS * 3;

enum class compression_method {
    standard,    // literal bytes <= 192, runs of 1..63 encoded as 193..255 + value
    run_length   // zero runs of 1..127 encoded as 129..255, literal spans of 0..128
};

/**
 * Bit accessors over the 32-bit PID flag word.
 * Only transparency, compression and palette presence affect decoding;
 * the remaining bits are exposed as parsed.
 */
struct image_flags {
    std::uint32_t bits = 0;

    static constexpr std::uint32_t TRANSPARENCY      = 0x01;
    static constexpr std::uint32_t VIDEO_MEMORY      = 0x02;
    static constexpr std::uint32_t SYSTEM_MEMORY     = 0x04;
    static constexpr std::uint32_t MIRROR_HORIZONTAL = 0x08;
    static constexpr std::uint32_t MIRROR_VERTICAL   = 0x10;
    static constexpr std::uint32_t RUN_LENGTH        = 0x20;
    static constexpr std::uint32_t LIGHTS            = 0x40;
    static constexpr std::uint32_t PALETTE           = 0x80;

    [[nodiscard]] constexpr bool use_transparency() const noexcept { return (bits & TRANSPARENCY) != 0; }
    [[nodiscard]] constexpr bool use_video_memory() const noexcept { return (bits & VIDEO_MEMORY) != 0; }
    [[nodiscard]] constexpr bool use_system_memory() const noexcept { return (bits & SYSTEM_MEMORY) != 0; }
    [[nodiscard]] constexpr bool is_flipped_horizontally() const noexcept { return (bits & MIRROR_HORIZONTAL) != 0; }
    [[nodiscard]] constexpr bool is_flipped_vertically() const noexcept { return (bits & MIRROR_VERTICAL) != 0; }
    [[nodiscard]] constexpr bool has_lights() const noexcept { return (bits & LIGHTS) != 0; }
    [[nodiscard]] constexpr bool has_palette() const noexcept { return (bits & PALETTE) != 0; }

    [[nodiscard]] constexpr compression_method compression() const noexcept {
        return (bits & RUN_LENGTH) == 0 ? compression_method::standard
                                        : compression_method::run_length;
    }
};

struct pid_rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

using pid_palette = std::array<pid_rgb, PID_PALETTE_COLORS>;

struct pid_header {
    std::int32_t id = 0;
    image_flags flags;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::array<std::int32_t, 4> user_values{};

    [[nodiscard]] constexpr std::uint64_t pixel_count() const noexcept {
        return static_cast<std::uint64_t>(width) * height;
    }
};

/**
 * Result of parsing and decompressing a PID stream, before color resolution.
 */
struct decoded_image {
    pid_header header;
    std::vector<std::uint8_t> pixels;    // width * height palette indices, row-major
    std::optional<pid_palette> palette;
    std::size_t bytes_consumed = 0;      // cursor offset after the last byte read
};

// ============================================================================
// PID Decoder
// ============================================================================

class PID_IMAGE_EXPORT pid_decoder {
public:
    /**
     * Decode PID image data to an RGBA surface.
     * @param data Raw file data
     * @param surf Destination surface
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});

    /**
     * Parse and decompress a PID stream without resolving colors.
     * @param source Raw bytes
     * @param image Receives header, index pixels and palette
     * @param options Decode options (max_pixels is enforced here)
     */
    [[nodiscard]] static decode_result decode_image(const byte_source& source,
                                                     decoded_image& image,
                                                     const decode_options& options = {});

    /**
     * Resolve index pixels to RGBA and write them to a surface.
     * Uses the image palette, else options.fallback_palette; fails with
     * palette_absent if neither is available.
     */
    [[nodiscard]] static decode_result resolve(const decoded_image& image,
                                                surface& surf,
                                                const decode_options& options = {});

    // RGBA for a single index. Transparent black for index 0 when the
    // transparency flag is set, else the opaque palette color.
    [[nodiscard]] static std::array<std::uint8_t, 4> resolve_pixel(std::uint8_t index,
                                                                   const pid_palette& palette,
                                                                   image_flags flags) noexcept;

    [[nodiscard]] static decode_result parse_header(byte_cursor& cursor, pid_header& header);

    // Dispatch on the compression method. Appends exactly `count` indices.
    [[nodiscard]] static decode_result decompress(byte_cursor& cursor,
                                                   compression_method method,
                                                   std::size_t count,
                                                   std::vector<std::uint8_t>& pixels);

    [[nodiscard]] static decode_result decompress_standard(byte_cursor& cursor,
                                                            std::size_t count,
                                                            std::vector<std::uint8_t>& pixels);

    [[nodiscard]] static decode_result decompress_run_length(byte_cursor& cursor,
                                                              std::size_t count,
                                                              std::vector<std::uint8_t>& pixels);

    [[nodiscard]] static decode_result read_palette(byte_cursor& cursor, pid_palette& palette);
};

/**
 * Read a PID file from disk and decode it to a surface.
 * @return io_error if the file cannot be read, else the decode result
 */
[[nodiscard]] PID_IMAGE_EXPORT decode_result load_pid(const std::filesystem::path& path,
                                                       surface& surf,
                                                       const decode_options& options = {});

} // namespace pid_image

#endif // PID_IMAGE_CODECS_PID_HPP_
