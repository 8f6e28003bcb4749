#ifndef PID_IMAGE_CODECS_TGA_HPP_
#define PID_IMAGE_CODECS_TGA_HPP_

#include <pid_image/pid_image_export.h>
#include <pid_image/surface.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace pid_image {

// ============================================================================
// TGA Encoder
// ============================================================================

struct tga_format {
    static constexpr std::string_view name = "tga";
    static constexpr std::string_view extensions[] = {".tga"};
};

/**
 * Encode a memory surface to an uncompressed 32-bit TGA.
 * Rows are stored top-down (image descriptor bit 5) with 8 alpha bits.
 * @param surf Source surface
 * @return TGA-encoded data, or empty vector on failure
 */
[[nodiscard]] PID_IMAGE_EXPORT std::vector<std::uint8_t> encode_tga(const memory_surface& surf);

} // namespace pid_image

#endif // PID_IMAGE_CODECS_TGA_HPP_
