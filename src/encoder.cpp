#include <pid_image/encoder.hpp>
#include <pid_image/codecs/png.hpp>
#include <pid_image/codecs/tga.hpp>
#include <pid_image/codecs/bmp.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <system_error>

namespace pid_image {

// ============================================================================
// Encoder Wrappers
// ============================================================================

namespace {

template <typename Format, std::vector<std::uint8_t> (*Encode)(const memory_surface&)>
class encoder_impl : public encoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return Format::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return Format::extensions;
    }

    [[nodiscard]] std::vector<std::uint8_t> encode(const memory_surface& surf) const override {
        return Encode(surf);
    }
};

using png_encoder_impl = encoder_impl<png_format, &encode_png>;
using tga_encoder_impl = encoder_impl<tga_format, &encode_tga>;
using bmp_encoder_impl = encoder_impl<bmp_format, &encode_bmp>;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ============================================================================
// Encoder Registry
// ============================================================================

encoder_registry& encoder_registry::instance() {
    static encoder_registry registry;
    return registry;
}

encoder_registry::encoder_registry() {
    register_builtin_encoders();
}

encoder_registry::~encoder_registry() = default;

void encoder_registry::register_builtin_encoders() {
    encoders_.push_back(std::make_unique<png_encoder_impl>());
    encoders_.push_back(std::make_unique<tga_encoder_impl>());
    encoders_.push_back(std::make_unique<bmp_encoder_impl>());
}

void encoder_registry::register_encoder(std::unique_ptr<encoder> enc) {
    if (enc) {
        encoders_.push_back(std::move(enc));
    }
}

const encoder* encoder_registry::find_encoder(std::string_view name) const {
    for (const auto& enc : encoders_) {
        if (enc->name() == name) {
            return enc.get();
        }
    }
    return nullptr;
}

const encoder* encoder_registry::find_encoder_for_path(const std::filesystem::path& path) const {
    const std::string ext = to_lower(path.extension().string());
    if (ext.empty()) {
        return nullptr;
    }

    for (const auto& enc : encoders_) {
        for (const auto& candidate : enc->extensions()) {
            if (candidate == ext) {
                return enc.get();
            }
        }
    }
    return nullptr;
}

// ============================================================================
// Convenience Functions
// ============================================================================

decode_result save_image(const memory_surface& surf, const std::filesystem::path& path) {
    const auto* enc = encoder_registry::instance().find_encoder_for_path(path);
    if (!enc) {
        return decode_result::failure(decode_error::invalid_format,
            "No encoder for output file: " + path.string());
    }

    const auto data = enc->encode(surf);
    if (data.empty()) {
        return decode_result::failure(decode_error::io_error,
            std::string("Failed to encode image as ") + std::string(enc->name()));
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return decode_result::failure(decode_error::io_error,
            "Failed to open output file: " + path.string());
    }

    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
        // Do not leave a partial file behind
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return decode_result::failure(decode_error::io_error,
            "Failed to write file: " + path.string());
    }

    return decode_result::success();
}

} // namespace pid_image
