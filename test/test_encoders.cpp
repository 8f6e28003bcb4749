#include <doctest/doctest.h>
#include <pid_image/pid_image.hpp>

#include <lodepng.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace {

// 2x2 surface: red, green / blue, half-transparent white
void fill_test_surface(pid_image::memory_surface& surf) {
    REQUIRE(surf.set_size(2, 2));
    const std::uint8_t top[8] = {255, 0, 0, 255, 0, 255, 0, 255};
    const std::uint8_t bottom[8] = {0, 0, 255, 255, 255, 255, 255, 128};
    surf.write_pixels(0, 0, 8, top);
    surf.write_pixels(0, 1, 8, bottom);
}

// Raw RGBA dump, registered at runtime
class raw_encoder : public pid_image::encoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return "raw_rgba";
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return extensions_;
    }

    [[nodiscard]] std::vector<std::uint8_t> encode(const pid_image::memory_surface& surf) const override {
        return {surf.pixels().begin(), surf.pixels().end()};
    }

private:
    static constexpr std::string_view extensions_[] = {".rgba"};
};

std::vector<std::uint8_t> read_all(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

} // namespace

TEST_CASE("Encoder registry: built-in encoders") {
    auto& registry = pid_image::encoder_registry::instance();
    REQUIRE(registry.encoder_count() >= 3);
    CHECK(registry.encoder_at(registry.encoder_count()) == nullptr);

    SUBCASE("Lookup by name") {
        REQUIRE(registry.find_encoder("png") != nullptr);
        CHECK(registry.find_encoder("png")->name() == "png");
        CHECK(registry.find_encoder("tga") != nullptr);
        CHECK(registry.find_encoder("bmp") != nullptr);
        CHECK(registry.find_encoder("gif") == nullptr);
    }

    SUBCASE("Lookup by path extension ignores case") {
        CHECK(registry.find_encoder_for_path("out.png") == registry.find_encoder("png"));
        CHECK(registry.find_encoder_for_path("OUT.PNG") == registry.find_encoder("png"));
        CHECK(registry.find_encoder_for_path("dir/sprite.Tga") == registry.find_encoder("tga"));
        CHECK(registry.find_encoder_for_path("sprite.dib") == registry.find_encoder("bmp"));
    }

    SUBCASE("Unknown or missing extension") {
        CHECK(registry.find_encoder_for_path("sprite.jpg") == nullptr);
        CHECK(registry.find_encoder_for_path("sprite") == nullptr);
    }
}

TEST_CASE("Encoder registry: runtime registration") {
    auto& registry = pid_image::encoder_registry::instance();

    if (!registry.find_encoder("raw_rgba")) {
        const std::size_t before = registry.encoder_count();
        registry.register_encoder(std::make_unique<raw_encoder>());
        CHECK(registry.encoder_count() == before + 1);
        CHECK(registry.encoder_at(before) == registry.find_encoder("raw_rgba"));
    }

    SUBCASE("Lookup by name and extension") {
        const auto* enc = registry.find_encoder("raw_rgba");
        REQUIRE(enc != nullptr);
        CHECK(registry.find_encoder_for_path("dump.RGBA") == enc);
        CHECK(registry.find_encoder("png") != enc);
    }

    SUBCASE("Null encoder is ignored") {
        const std::size_t before = registry.encoder_count();
        registry.register_encoder(nullptr);
        CHECK(registry.encoder_count() == before);
    }

    SUBCASE("save_image uses the registered encoder") {
        pid_image::memory_surface surf;
        fill_test_surface(surf);
        const auto path = std::filesystem::temp_directory_path() / "pid_image_save_test.rgba";
        std::filesystem::remove(path);

        REQUIRE(pid_image::save_image(surf, path).ok);
        CHECK(read_all(path) == std::vector<std::uint8_t>(surf.pixels().begin(), surf.pixels().end()));
        std::filesystem::remove(path);
    }
}

TEST_CASE("PNG encoder: decodes back to the same pixels") {
    pid_image::memory_surface surf;
    fill_test_surface(surf);

    const auto png = pid_image::encode_png(surf);
    REQUIRE_FALSE(png.empty());

    std::vector<unsigned char> decoded;
    unsigned width = 0;
    unsigned height = 0;
    REQUIRE(lodepng::decode(decoded, width, height, png) == 0);
    CHECK(width == 2);
    CHECK(height == 2);
    CHECK(std::vector<std::uint8_t>(decoded.begin(), decoded.end()) ==
          std::vector<std::uint8_t>(surf.pixels().begin(), surf.pixels().end()));
}

TEST_CASE("TGA encoder: header and BGRA pixels") {
    pid_image::memory_surface surf;
    fill_test_surface(surf);

    const auto tga = pid_image::encode_tga(surf);
    REQUIRE(tga.size() == 18 + 16);

    CHECK(tga[2] == 2);
    CHECK(tga[12] == 2);
    CHECK(tga[13] == 0);
    CHECK(tga[14] == 2);
    CHECK(tga[16] == 32);
    CHECK(tga[17] == 0x28);

    // First pixel is red, stored B, G, R, A
    CHECK(tga[18] == 0);
    CHECK(tga[19] == 0);
    CHECK(tga[20] == 255);
    CHECK(tga[21] == 255);
    // Last pixel keeps its alpha
    CHECK(tga[33] == 128);
}

TEST_CASE("BMP encoder: bottom-up rows") {
    pid_image::memory_surface surf;
    fill_test_surface(surf);

    const auto bmp = pid_image::encode_bmp(surf);
    REQUIRE(bmp.size() == 54 + 16);

    CHECK(bmp[0] == 'B');
    CHECK(bmp[1] == 'M');
    CHECK(bmp[2] == 70);
    CHECK(bmp[10] == 54);
    CHECK(bmp[18] == 2);
    CHECK(bmp[22] == 2);
    CHECK(bmp[28] == 32);

    // First stored row is the bottom one: blue, then white
    CHECK(bmp[54] == 255);
    CHECK(bmp[55] == 0);
    CHECK(bmp[56] == 0);
    CHECK(bmp[61] == 128);
    // Second stored row starts with red
    CHECK(bmp[62] == 0);
    CHECK(bmp[64] == 255);
}

TEST_CASE("Encoders: empty surface cannot be encoded") {
    pid_image::memory_surface surf;
    REQUIRE(surf.set_size(0, 0));
    CHECK(pid_image::encode_png(surf).empty());
    CHECK(pid_image::encode_tga(surf).empty());
    CHECK(pid_image::encode_bmp(surf).empty());
}

TEST_CASE("save_image") {
    pid_image::memory_surface surf;
    fill_test_surface(surf);
    const auto dir = std::filesystem::temp_directory_path();

    SUBCASE("Writes the encoded file") {
        const auto path = dir / "pid_image_save_test.tga";
        std::filesystem::remove(path);

        REQUIRE(pid_image::save_image(surf, path).ok);
        CHECK(read_all(path) == pid_image::encode_tga(surf));
        std::filesystem::remove(path);
    }

    SUBCASE("Unknown extension") {
        const auto path = dir / "pid_image_save_test.xyz";
        auto result = pid_image::save_image(surf, path);
        CHECK_FALSE(result.ok);
        CHECK(result.error == pid_image::decode_error::invalid_format);
        CHECK_FALSE(std::filesystem::exists(path));
    }

    SUBCASE("Empty surface") {
        pid_image::memory_surface empty;
        REQUIRE(empty.set_size(0, 0));
        const auto path = dir / "pid_image_save_empty.png";
        std::filesystem::remove(path);

        auto result = pid_image::save_image(empty, path);
        CHECK(result.error == pid_image::decode_error::io_error);
        CHECK_FALSE(std::filesystem::exists(path));
    }

    SUBCASE("Unwritable path") {
        const auto path = dir / "pid_image_no_such_dir" / "out.bmp";
        auto result = pid_image::save_image(surf, path);
        CHECK(result.error == pid_image::decode_error::io_error);
    }
}
