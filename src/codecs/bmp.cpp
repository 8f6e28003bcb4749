#include <pid_image/codecs/bmp.hpp>
#include "byte_io.hpp"

#include <limits>

namespace pid_image {

namespace {

constexpr std::size_t BMP_FILE_HEADER_SIZE = 14;
constexpr std::size_t BMP_INFO_HEADER_SIZE = 40;    // BITMAPINFOHEADER
constexpr std::size_t BMP_DATA_OFFSET = BMP_FILE_HEADER_SIZE + BMP_INFO_HEADER_SIZE;
constexpr std::uint16_t BMP_BITS_PER_PIXEL = 32;
constexpr std::uint32_t BMP_BI_RGB = 0;

} // namespace

std::vector<std::uint8_t> encode_bmp(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    const auto w = static_cast<std::size_t>(surf.width());
    const auto h = static_cast<std::size_t>(surf.height());

    // 32bpp rows need no padding
    const std::size_t row_size = w * 4;
    const std::size_t image_size = row_size * h;
    if (BMP_DATA_OFFSET + image_size > std::numeric_limits<std::uint32_t>::max()) {
        return {};
    }

    std::vector<std::uint8_t> out(BMP_DATA_OFFSET + image_size, 0);
    std::uint8_t* p = out.data();

    // BITMAPFILEHEADER
    p[0] = 'B';
    p[1] = 'M';
    write_le32(p + 2, static_cast<std::uint32_t>(out.size()));
    write_le32(p + 10, static_cast<std::uint32_t>(BMP_DATA_OFFSET));

    // BITMAPINFOHEADER, positive height => bottom-up
    write_le32(p + 14, static_cast<std::uint32_t>(BMP_INFO_HEADER_SIZE));
    write_le32(p + 18, static_cast<std::uint32_t>(w));
    write_le32(p + 22, static_cast<std::uint32_t>(h));
    write_le16(p + 26, 1);
    write_le16(p + 28, BMP_BITS_PER_PIXEL);
    write_le32(p + 30, BMP_BI_RGB);
    write_le32(p + 34, static_cast<std::uint32_t>(image_size));

    const auto pixels = surf.pixels();
    std::uint8_t* dst = p + BMP_DATA_OFFSET;
    for (std::size_t y = 0; y < h; ++y) {
        const std::uint8_t* src = pixels.data() + (h - 1 - y) * surf.pitch();
        for (std::size_t x = 0; x < w; ++x) {
            dst[x * 4 + 0] = src[x * 4 + 2];
            dst[x * 4 + 1] = src[x * 4 + 1];
            dst[x * 4 + 2] = src[x * 4 + 0];
            dst[x * 4 + 3] = src[x * 4 + 3];
        }
        dst += row_size;
    }

    return out;
}

} // namespace pid_image
