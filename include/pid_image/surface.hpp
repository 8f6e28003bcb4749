#ifndef PID_IMAGE_SURFACE_HPP_
#define PID_IMAGE_SURFACE_HPP_

#include <pid_image/pid_image_export.h>
#include <pid_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pid_image {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract base class for RGBA output surfaces.
 * The decoder writes resolved pixels through this interface, so the
 * destination buffer (owned memory, a host canvas, a texture upload
 * buffer, ...) stays under the caller's control.
 */
class PID_IMAGE_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Set the surface dimensions.
     * Called once, before any pixel writes. Zero dimensions are legal
     * and describe an empty image.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height) = 0;

    /**
     * Write a horizontal run of RGBA pixel data.
     *
     * NOTE: The x parameter is a BYTE OFFSET within the row, not a pixel coordinate.
     * Use x = pixel_x * 4.
     *
     * @param x Starting byte offset within the row (NOT pixel coordinate)
     * @param y Y coordinate (row number)
     * @param count Number of bytes to write
     * @param pixels Pointer to pixel data
     */
    virtual void write_pixels(int x, int y, int count, const std::uint8_t* pixels) = 0;
};

// ============================================================================
// Memory Surface (default implementation)
// ============================================================================

/**
 * Simple in-memory surface implementation.
 * Stores zero-initialized RGBA pixels in a contiguous buffer.
 */
class PID_IMAGE_EXPORT memory_surface : public surface {
public:
    memory_surface() = default;
    ~memory_surface() override = default;

    memory_surface(const memory_surface&) = delete;
    memory_surface& operator=(const memory_surface&) = delete;
    memory_surface(memory_surface&&) noexcept = default;
    memory_surface& operator=(memory_surface&&) noexcept = default;

    // Surface interface
    bool set_size(int width, int height) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;

    // Accessors (read-only)
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }

private:
    std::vector<std::uint8_t> pixels_;
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
};

// ============================================================================
// Canvas Surface (host-allocated)
// ============================================================================

/**
 * Surface backed by a buffer that a host environment allocates.
 *
 * On set_size() the host allocator is asked for a region of
 * canvas_surface::region_size(width, height) bytes laid out as
 *
 *     [width:uint32_le][height:uint32_le][r,g,b,a][r,g,b,a]...
 *
 * The surface writes the two dimension words, then pixel rows. The region
 * belongs to the host; the surface never frees it.
 */
class PID_IMAGE_EXPORT canvas_surface : public surface {
public:
    /**
     * Host allocation callback.
     * Must return a writable region of at least region_size(width, height)
     * bytes, or nullptr on failure.
     */
    using allocate_fn = std::uint8_t* (*)(std::uint32_t width, std::uint32_t height, void* user);

    static constexpr std::size_t HEADER_SIZE = 8;

    explicit canvas_surface(allocate_fn allocate, void* user = nullptr) noexcept
        : allocate_(allocate), user_(user) {}

    bool set_size(int width, int height) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;

    [[nodiscard]] static constexpr std::size_t region_size(std::uint32_t width,
                                                           std::uint32_t height) noexcept {
        return HEADER_SIZE + static_cast<std::size_t>(width) * height * RGBA_BYTES_PER_PIXEL;
    }

    // Start of the host region, or nullptr before a successful set_size()
    [[nodiscard]] std::uint8_t* data() const noexcept { return region_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }

private:
    allocate_fn allocate_ = nullptr;
    void* user_ = nullptr;
    std::uint8_t* region_ = nullptr;
    std::size_t size_ = 0;
    int width_ = 0;
    int height_ = 0;
};

} // namespace pid_image

#endif // PID_IMAGE_SURFACE_HPP_
