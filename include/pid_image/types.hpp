#ifndef PID_IMAGE_TYPES_HPP_
#define PID_IMAGE_TYPES_HPP_

#include <pid_image/pid_image_export.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace pid_image {

// ============================================================================
// Pixel Layout
// ============================================================================

// Decoded images are always 8-bit RGBA, byte order R, G, B, A.
constexpr std::size_t RGBA_BYTES_PER_PIXEL = 4;

// Pixel capacity of the embedded (host canvas) targets
constexpr std::size_t EMBEDDED_MAX_PIXELS = 65536;

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    invalid_format,
    out_of_bounds,
    palette_absent,
    dimensions_exceeded,
    io_error,
    internal_error
};

[[nodiscard]] PID_IMAGE_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed width * height (0 = unbounded)
    std::size_t max_pixels = 0;

    // RGB triplets used when the image carries no palette of its own.
    // Must hold exactly 256 * 3 bytes, anything else counts as absent.
    std::span<const std::uint8_t> fallback_palette;
};

} // namespace pid_image

#endif // PID_IMAGE_TYPES_HPP_
