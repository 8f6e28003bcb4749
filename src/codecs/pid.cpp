#include <pid_image/codecs/pid.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <limits>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace pid_image {

namespace {

// Standard compression: control bytes above this value encode a run
constexpr std::uint8_t STANDARD_RUN_BASE = 192;

// Run-length compression: control bytes above this value encode a zero run
constexpr std::uint8_t ZERO_RUN_BASE = 128;

// Largest number of pixels a single input byte can expand to (a 0xFF zero run)
constexpr std::uint64_t MAX_EXPANSION = 255 - ZERO_RUN_BASE;

decode_result with_context(decode_result result, const char* what) {
    result.message = std::string(what) + ": " + result.message;
    return result;
}

// Rows are handed to a surface as int byte counts
decode_result check_surface_dimensions(const pid_header& header) {
    constexpr auto max_int = static_cast<std::uint32_t>(std::numeric_limits<int>::max());
    if (header.width > max_int / RGBA_BYTES_PER_PIXEL || header.height > max_int) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "PID dimensions " + std::to_string(header.width) + "x" + std::to_string(header.height) +
            " exceed maximum supported size");
    }
    return decode_result::success();
}

} // namespace

// ============================================================================
// Header
// ============================================================================

decode_result pid_decoder::parse_header(byte_cursor& cursor, pid_header& header) {
    decode_result result = cursor.next_i32_le(header.id);
    if (result) result = cursor.next_u32_le(header.flags.bits);
    if (result) result = cursor.next_u32_le(header.width);
    if (result) result = cursor.next_u32_le(header.height);
    for (auto& value : header.user_values) {
        if (result) result = cursor.next_i32_le(value);
    }

    if (!result) {
        return with_context(std::move(result), "PID header truncated");
    }
    return result;
}

// ============================================================================
// Decompression
// ============================================================================

decode_result pid_decoder::decompress(byte_cursor& cursor,
                                      compression_method method,
                                      std::size_t count,
                                      std::vector<std::uint8_t>& pixels) {
    switch (method) {
        case compression_method::standard:
            return decompress_standard(cursor, count, pixels);
        case compression_method::run_length:
            return decompress_run_length(cursor, count, pixels);
    }
    return decode_result::failure(decode_error::internal_error, "Unknown compression method");
}

decode_result pid_decoder::decompress_standard(byte_cursor& cursor,
                                               std::size_t count,
                                               std::vector<std::uint8_t>& pixels) {
    std::size_t produced = 0;

    while (produced < count) {
        std::uint8_t control = 0;
        auto result = cursor.next_u8(control);
        if (!result) {
            return with_context(std::move(result), "PID pixel data truncated");
        }

        std::size_t run = 1;
        std::uint8_t value = control;
        if (control > STANDARD_RUN_BASE) {
            // Run of 1..63 copies of the following byte
            run = static_cast<std::size_t>(control - STANDARD_RUN_BASE);
            result = cursor.next_u8(value);
            if (!result) {
                return with_context(std::move(result), "PID pixel data truncated: incomplete run");
            }
        }

        // Runs crossing the end of the image are cut at the pixel count
        const std::size_t to_write = std::min(run, count - produced);
        pixels.insert(pixels.end(), to_write, value);
        produced += to_write;
    }

    return decode_result::success();
}

decode_result pid_decoder::decompress_run_length(byte_cursor& cursor,
                                                 std::size_t count,
                                                 std::vector<std::uint8_t>& pixels) {
    std::size_t produced = 0;

    while (produced < count) {
        std::uint8_t control = 0;
        auto result = cursor.next_u8(control);
        if (!result) {
            return with_context(std::move(result), "PID pixel data truncated");
        }

        if (control > ZERO_RUN_BASE) {
            // Run of 1..127 transparent/background pixels
            const std::size_t run = static_cast<std::size_t>(control - ZERO_RUN_BASE);
            const std::size_t to_write = std::min(run, count - produced);
            pixels.insert(pixels.end(), to_write, std::uint8_t{0});
            produced += to_write;
            continue;
        }

        // Literal span of 0..128 bytes; stop reading once the image is full
        for (std::uint8_t i = 0; i < control && produced < count; ++i) {
            std::uint8_t value = 0;
            result = cursor.next_u8(value);
            if (!result) {
                return with_context(std::move(result), "PID pixel data truncated: incomplete literal span");
            }
            pixels.push_back(value);
            ++produced;
        }
    }

    return decode_result::success();
}

// ============================================================================
// Palette
// ============================================================================

decode_result pid_decoder::read_palette(byte_cursor& cursor, pid_palette& palette) {
    if (cursor.remaining() < PID_PALETTE_SIZE) {
        return decode_result::failure(decode_error::out_of_bounds,
            "PID palette truncated: expected " + std::to_string(PID_PALETTE_SIZE) +
            " bytes at offset " + std::to_string(cursor.offset()) + ", " +
            std::to_string(cursor.remaining()) + " available");
    }

    for (auto& color : palette) {
        decode_result result = cursor.next_u8(color.r);
        if (result) result = cursor.next_u8(color.g);
        if (result) result = cursor.next_u8(color.b);
        if (!result) {
            return with_context(std::move(result), "PID palette truncated");
        }
    }

    return decode_result::success();
}

// ============================================================================
// Color Resolution
// ============================================================================

std::array<std::uint8_t, 4> pid_decoder::resolve_pixel(std::uint8_t index,
                                                       const pid_palette& palette,
                                                       image_flags flags) noexcept {
    if (flags.use_transparency() && index == 0) {
        return {{0, 0, 0, 0}};
    }
    const pid_rgb& color = palette[index];
    return {{color.r, color.g, color.b, 255}};
}

decode_result pid_decoder::resolve(const decoded_image& image,
                                   surface& surf,
                                   const decode_options& options) {
    const pid_header& header = image.header;

    pid_palette fallback;
    const pid_palette* palette = nullptr;
    if (image.palette) {
        palette = &*image.palette;
    } else if (options.fallback_palette.size() == PID_PALETTE_SIZE) {
        const auto* src = options.fallback_palette.data();
        for (std::size_t i = 0; i < PID_PALETTE_COLORS; ++i) {
            fallback[i] = {src[i * 3 + 0], src[i * 3 + 1], src[i * 3 + 2]};
        }
        palette = &fallback;
    }

    if (!palette) {
        return decode_result::failure(decode_error::palette_absent,
            "PID image has no palette and no fallback palette was provided");
    }

    if (image.pixels.size() != header.pixel_count()) {
        return decode_result::failure(decode_error::internal_error,
            "Pixel buffer does not match image dimensions");
    }

    auto result = check_surface_dimensions(header);
    if (!result) {
        return result;
    }

    const int width = static_cast<int>(header.width);
    const int height = static_cast<int>(header.height);

    if (!surf.set_size(width, height)) {
        return decode_result::failure(decode_error::dimensions_exceeded, "Failed to allocate surface");
    }

    const std::size_t row_bytes = static_cast<std::size_t>(width) * RGBA_BYTES_PER_PIXEL;
    std::vector<std::uint8_t> row(row_bytes);
    const std::uint8_t* indices = image.pixels.data();

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const auto rgba = resolve_pixel(*indices++, *palette, header.flags);
            std::copy(rgba.begin(), rgba.end(), row.begin() + static_cast<std::ptrdiff_t>(x) * 4);
        }
        surf.write_pixels(0, y, static_cast<int>(row_bytes), row.data());
    }

    return decode_result::success();
}

// ============================================================================
// Decoding
// ============================================================================

decode_result pid_decoder::decode_image(const byte_source& source,
                                        decoded_image& image,
                                        const decode_options& options) {
    image = decoded_image{};
    byte_cursor cursor(source);

    auto result = parse_header(cursor, image.header);
    if (!result) {
        return result;
    }

    const std::uint64_t pixel_count = image.header.pixel_count();
    result = validate_pixel_count(pixel_count, options);
    if (!result) {
        return result;
    }

    // Never reserve more than the remaining input could possibly expand to
    const std::uint64_t reachable = static_cast<std::uint64_t>(cursor.remaining()) * MAX_EXPANSION;
    try {
        image.pixels.reserve(static_cast<std::size_t>(std::min(pixel_count, reachable)));
    } catch (const std::bad_alloc&) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate pixel buffer");
    } catch (const std::length_error&) {
        return decode_result::failure(decode_error::dimensions_exceeded, "Pixel buffer too large");
    }

    try {
        result = decompress(cursor, image.header.flags.compression(),
                            static_cast<std::size_t>(pixel_count), image.pixels);
    } catch (const std::bad_alloc&) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate pixel buffer");
    }
    if (!result) {
        return result;
    }

    if (image.header.flags.has_palette()) {
        pid_palette palette;
        result = read_palette(cursor, palette);
        if (!result) {
            return result;
        }
        image.palette = palette;
    }

    image.bytes_consumed = cursor.offset();
    return decode_result::success();
}

decode_result pid_decoder::decode(std::span<const std::uint8_t> data,
                                  surface& surf,
                                  const decode_options& options) {
    const span_source source(data);

    // Reject images no surface can hold before decompressing them
    pid_header header;
    byte_cursor cursor(source);
    auto result = parse_header(cursor, header);
    if (!result) {
        return result;
    }
    result = check_surface_dimensions(header);
    if (!result) {
        return result;
    }

    decoded_image image;
    result = decode_image(source, image, options);
    if (!result) {
        return result;
    }

    return resolve(image, surf, options);
}

decode_result load_pid(const std::filesystem::path& path,
                       surface& surf,
                       const decode_options& options) {
    std::vector<std::uint8_t> data;
    if (!read_file(path, data)) {
        return decode_result::failure(decode_error::io_error,
            "Failed to read file: " + path.string());
    }
    return pid_decoder::decode(data, surf, options);
}

} // namespace pid_image
