#ifndef PID_IMAGE_CODECS_BMP_HPP_
#define PID_IMAGE_CODECS_BMP_HPP_

#include <pid_image/pid_image_export.h>
#include <pid_image/surface.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace pid_image {

// ============================================================================
// BMP Encoder
// ============================================================================

struct bmp_format {
    static constexpr std::string_view name = "bmp";
    static constexpr std::string_view extensions[] = {".bmp", ".dib"};
};

/**
 * Encode a memory surface to a 32-bit BI_RGB BMP.
 * Rows are stored bottom-up as B, G, R, A.
 * @param surf Source surface
 * @return BMP-encoded data, or empty vector on failure
 */
[[nodiscard]] PID_IMAGE_EXPORT std::vector<std::uint8_t> encode_bmp(const memory_surface& surf);

} // namespace pid_image

#endif // PID_IMAGE_CODECS_BMP_HPP_
