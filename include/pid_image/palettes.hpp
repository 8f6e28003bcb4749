#ifndef PID_IMAGE_PALETTES_HPP_
#define PID_IMAGE_PALETTES_HPP_

#include <pid_image/pid_image_export.h>
#include <pid_image/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace pid_image {

// ============================================================================
// Fallback Palettes
// ============================================================================
//
// PID files without an embedded color table are drawn with a palette the
// application supplies (decode_options::fallback_palette). All palettes are
// RGB888 triplets, 3 bytes per color.

// Generate n-level grayscale palette
template <std::size_t N>
[[nodiscard]] constexpr std::array<std::uint8_t, N * 3> grayscale_palette() noexcept {
    static_assert(N >= 2, "grayscale palette needs at least two levels");
    std::array<std::uint8_t, N * 3> palette{};
    for (std::size_t i = 0; i < N; ++i) {
        std::uint8_t gray = static_cast<std::uint8_t>((i * 255) / (N - 1));
        palette[i * 3 + 0] = gray;
        palette[i * 3 + 1] = gray;
        palette[i * 3 + 2] = gray;
    }
    return palette;
}

// 256-level ramp, index i maps to (i, i, i)
[[nodiscard]] constexpr std::array<std::uint8_t, 256 * 3> grayscale_8bit_palette() noexcept {
    return grayscale_palette<256>();
}

/**
 * Load a raw palette file: 256 RGB triplets, 768 bytes, no header
 * (the layout of a game .PAL file).
 * @param path Palette file
 * @param palette Receives the 768 bytes
 * @return io_error if unreadable, invalid_format if the size is not 768 bytes
 */
[[nodiscard]] PID_IMAGE_EXPORT decode_result load_palette_file(const std::filesystem::path& path,
                                                                std::vector<std::uint8_t>& palette);

} // namespace pid_image

#endif // PID_IMAGE_PALETTES_HPP_
