#pragma once

#include <pid_image/types.hpp>

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

namespace pid_image {

// Validate width * height against the configured pixel capacity,
// returning failure result if exceeded.
// Returns success() if the pixel count is within limits
inline decode_result validate_pixel_count(std::uint64_t pixel_count,
                                          const decode_options& options) {
    if (options.max_pixels > 0 && pixel_count > options.max_pixels) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Image has " + std::to_string(pixel_count) + " pixels, limit is " +
            std::to_string(options.max_pixels));
    }
    if (pixel_count > std::numeric_limits<std::size_t>::max()) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Image dimensions exceed addressable memory");
    }
    return decode_result::success();
}

// Read a whole file into memory. Returns false if it cannot be opened or read.
inline bool read_file(const std::filesystem::path& path, std::vector<std::uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    const auto size = file.tellg();
    if (size < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return static_cast<bool>(file);
}

} // namespace pid_image
