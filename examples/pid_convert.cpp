#include <pid_image/pid_image.hpp>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <input.pid> <output>\n";
    std::cout << "Converts a PID image to the format implied by the output extension.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -p, --palette <gray|file>  Palette for images without one\n";
    std::cout << "  -l, --list                 List available output formats\n";
    std::cout << "  -h, --help                 Show this help\n";
}

void list_encoders() {
    std::cout << "Available output formats:\n";
    const auto& registry = pid_image::encoder_registry::instance();
    for (std::size_t i = 0; i < registry.encoder_count(); ++i) {
        const auto* encoder = registry.encoder_at(i);
        std::cout << "  " << encoder->name() << " (";
        bool first = true;
        for (const auto& ext : encoder->extensions()) {
            if (!first) std::cout << ", ";
            std::cout << ext;
            first = false;
        }
        std::cout << ")\n";
    }
}

bool is_option(const char* arg, const char* short_name, const char* long_name) {
    return std::strcmp(arg, short_name) == 0 || std::strcmp(arg, long_name) == 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::filesystem::path> paths;
    const char* palette_arg = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (is_option(argv[i], "-h", "--help")) {
            print_usage(argv[0]);
            return 0;
        }
        if (is_option(argv[i], "-l", "--list")) {
            list_encoders();
            return 0;
        }
        if (is_option(argv[i], "-p", "--palette")) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << argv[i] << " requires an argument\n";
                return 1;
            }
            palette_arg = argv[++i];
            continue;
        }
        paths.emplace_back(argv[i]);
    }

    if (paths.size() < 2) {
        std::cout << "Please provide 2 arguments: input file path and output file path.\n";
        print_usage(argv[0]);
        return 0;
    }

    const auto& input_path = paths[0];
    const auto& output_path = paths[1];

    if (!pid_image::encoder_registry::instance().find_encoder_for_path(output_path)) {
        std::cerr << "Error: Unsupported output format: " << output_path << "\n";
        return 1;
    }

    // Fallback palette for images that carry none
    std::vector<std::uint8_t> palette;
    if (palette_arg) {
        if (std::strcmp(palette_arg, "gray") == 0) {
            const auto gray = pid_image::grayscale_8bit_palette();
            palette.assign(gray.begin(), gray.end());
        } else {
            auto result = pid_image::load_palette_file(palette_arg, palette);
            if (!result) {
                std::cerr << "Error: " << result.message << "\n";
                return 1;
            }
        }
    }

    pid_image::decode_options options;
    options.fallback_palette = palette;

    pid_image::memory_surface surface;
    auto result = pid_image::load_pid(input_path, surface, options);
    if (!result) {
        std::cerr << "Error: Failed to decode " << input_path << ": " << result.message
                  << " (" << pid_image::to_string(result.error) << ")\n";
        return 1;
    }

    std::cout << "Decoded: " << surface.width() << "x" << surface.height() << "\n";

    result = pid_image::save_image(surface, output_path);
    if (!result) {
        std::cerr << "Error: " << result.message << "\n";
        return 1;
    }

    std::cout << "Saved: " << output_path << "\n";

    return 0;
}
