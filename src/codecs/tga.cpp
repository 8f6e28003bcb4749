#include <pid_image/codecs/tga.hpp>
#include "byte_io.hpp"

#include <limits>

namespace pid_image {

namespace {

constexpr std::size_t TGA_HEADER_SIZE = 18;
constexpr std::uint8_t TGA_TYPE_TRUECOLOR = 2;    // uncompressed true-color
constexpr std::uint8_t TGA_PIXEL_DEPTH = 32;
constexpr std::uint8_t TGA_ALPHA_BITS = 8;
constexpr std::uint8_t TGA_ORIGIN_TOP_LEFT = 0x20;

} // namespace

std::vector<std::uint8_t> encode_tga(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    // Dimensions are 16-bit fields
    constexpr int max_dimension = std::numeric_limits<std::uint16_t>::max();
    if (surf.width() > max_dimension || surf.height() > max_dimension) {
        return {};
    }

    const auto w = static_cast<std::size_t>(surf.width());
    const auto h = static_cast<std::size_t>(surf.height());
    const auto pixels = surf.pixels();

    std::vector<std::uint8_t> out(TGA_HEADER_SIZE + w * h * 4, 0);

    // Header: no image ID, no color map, x/y origin zero
    out[2] = TGA_TYPE_TRUECOLOR;
    write_le16(out.data() + 12, static_cast<std::uint16_t>(w));
    write_le16(out.data() + 14, static_cast<std::uint16_t>(h));
    out[16] = TGA_PIXEL_DEPTH;
    out[17] = TGA_ORIGIN_TOP_LEFT | TGA_ALPHA_BITS;

    // Pixels: B, G, R, A in natural row order
    std::uint8_t* dst = out.data() + TGA_HEADER_SIZE;
    for (std::size_t i = 0; i < w * h; ++i) {
        dst[i * 4 + 0] = pixels[i * 4 + 2];
        dst[i * 4 + 1] = pixels[i * 4 + 1];
        dst[i * 4 + 2] = pixels[i * 4 + 0];
        dst[i * 4 + 3] = pixels[i * 4 + 3];
    }

    return out;
}

} // namespace pid_image
