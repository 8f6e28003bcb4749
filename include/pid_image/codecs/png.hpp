#ifndef PID_IMAGE_CODECS_PNG_HPP_
#define PID_IMAGE_CODECS_PNG_HPP_

#include <pid_image/pid_image_export.h>
#include <pid_image/surface.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace pid_image {

// ============================================================================
// PNG Encoder Functions
// ============================================================================

struct png_format {
    static constexpr std::string_view name = "png";
    static constexpr std::string_view extensions[] = {".png"};
};

/**
 * Encode a memory surface to 8-bit RGBA PNG.
 * @param surf Source surface
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] PID_IMAGE_EXPORT std::vector<std::uint8_t> encode_png(const memory_surface& surf);

} // namespace pid_image

#endif // PID_IMAGE_CODECS_PNG_HPP_
