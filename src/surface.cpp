#include <pid_image/surface.hpp>
#include "codecs/byte_io.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>

namespace pid_image {

namespace {

// Additional sanity check - limit to reasonable maximum (1GB)
constexpr std::size_t MAX_BUFFER_SIZE = 1024ULL * 1024ULL * 1024ULL;

// Computes width * height * 4 with overflow and sanity checks.
// Returns false if the buffer would be unreasonably large.
bool rgba_buffer_size(int width, int height, std::size_t& pitch, std::size_t& total) {
    if (width < 0 || height < 0) {
        return false;
    }

    const std::size_t w = static_cast<std::size_t>(width);
    const std::size_t h = static_cast<std::size_t>(height);

    // Check for overflow in pitch calculation (width * bpp)
    if (w > std::numeric_limits<std::size_t>::max() / RGBA_BYTES_PER_PIXEL) {
        return false;
    }
    pitch = w * RGBA_BYTES_PER_PIXEL;

    // Check for overflow in total size calculation (pitch * height)
    if (h != 0 && pitch > std::numeric_limits<std::size_t>::max() / h) {
        return false;
    }
    total = pitch * h;

    return total <= MAX_BUFFER_SIZE;
}

} // namespace

// ============================================================================
// Memory Surface
// ============================================================================

bool memory_surface::set_size(int width, int height) {
    std::size_t pitch = 0;
    std::size_t total_size = 0;
    if (!rgba_buffer_size(width, height, pitch, total_size)) {
        return false;
    }

    try {
        pixels_.assign(total_size, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    pitch_ = pitch;

    return true;
}

void memory_surface::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (y < 0 || y >= height_ || x < 0 || count <= 0 || !pixels) {
        return;
    }

    const std::size_t x_offset = static_cast<std::size_t>(x);

    // Guard against x >= pitch_ to prevent underflow in max_bytes calculation
    if (x_offset >= pitch_) {
        return;
    }

    const std::size_t offset = static_cast<std::size_t>(y) * pitch_ + x_offset;
    const std::size_t max_bytes = pitch_ - x_offset;
    const std::size_t bytes_to_copy = std::min(static_cast<std::size_t>(count), max_bytes);

    // Final bounds check before memcpy
    if (offset + bytes_to_copy <= pixels_.size()) {
        std::memcpy(pixels_.data() + offset, pixels, bytes_to_copy);
    }
}

// ============================================================================
// Canvas Surface
// ============================================================================

bool canvas_surface::set_size(int width, int height) {
    if (!allocate_) {
        return false;
    }

    std::size_t pitch = 0;
    std::size_t total_size = 0;
    if (!rgba_buffer_size(width, height, pitch, total_size)) {
        return false;
    }

    const auto w = static_cast<std::uint32_t>(width);
    const auto h = static_cast<std::uint32_t>(height);

    std::uint8_t* region = allocate_(w, h, user_);
    if (!region) {
        return false;
    }

    write_le32(region, w);
    write_le32(region + 4, h);
    std::fill(region + HEADER_SIZE, region + HEADER_SIZE + total_size, std::uint8_t{0});

    region_ = region;
    size_ = HEADER_SIZE + total_size;
    width_ = width;
    height_ = height;

    return true;
}

void canvas_surface::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (!region_ || y < 0 || y >= height_ || x < 0 || count <= 0 || !pixels) {
        return;
    }

    const std::size_t pitch = static_cast<std::size_t>(width_) * RGBA_BYTES_PER_PIXEL;
    const std::size_t x_offset = static_cast<std::size_t>(x);
    if (x_offset >= pitch) {
        return;
    }

    const std::size_t offset = HEADER_SIZE + static_cast<std::size_t>(y) * pitch + x_offset;
    const std::size_t bytes_to_copy = std::min(static_cast<std::size_t>(count), pitch - x_offset);

    if (offset + bytes_to_copy <= size_) {
        std::memcpy(region_ + offset, pixels, bytes_to_copy);
    }
}

} // namespace pid_image
