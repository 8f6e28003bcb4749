#include <pid_image/palettes.hpp>
#include <pid_image/codecs/pid.hpp>
#include "codecs/decode_helpers.hpp"

#include <string>
#include <utility>

namespace pid_image {

decode_result load_palette_file(const std::filesystem::path& path,
                                std::vector<std::uint8_t>& palette) {
    std::vector<std::uint8_t> data;
    if (!read_file(path, data)) {
        return decode_result::failure(decode_error::io_error,
            "Failed to read palette file: " + path.string());
    }

    if (data.size() != PID_PALETTE_SIZE) {
        return decode_result::failure(decode_error::invalid_format,
            "Palette file must hold " + std::to_string(PID_PALETTE_SIZE) +
            " bytes, got " + std::to_string(data.size()));
    }

    palette = std::move(data);
    return decode_result::success();
}

} // namespace pid_image
