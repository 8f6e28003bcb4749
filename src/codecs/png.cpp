#include <pid_image/codecs/png.hpp>
#include <lodepng.h>

namespace pid_image {

// ============================================================================
// PNG Encoder
// ============================================================================

std::vector<std::uint8_t> encode_png(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    const auto w = static_cast<unsigned>(surf.width());
    const auto h = static_cast<unsigned>(surf.height());
    const auto pixels = surf.pixels();

    std::vector<std::uint8_t> png_data;
    unsigned error = lodepng::encode(png_data, pixels.data(), w, h);
    if (error) {
        return {};
    }

    return png_data;
}

} // namespace pid_image
