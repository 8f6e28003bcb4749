#include <doctest/doctest.h>
#include <pid_image/pid_image.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace {

std::uint8_t* allocate_into(std::uint32_t width, std::uint32_t height, void* user) {
    auto* storage = static_cast<std::vector<std::uint8_t>*>(user);
    storage->assign(pid_image::canvas_surface::region_size(width, height), 0xEE);
    return storage->data();
}

std::uint8_t* refuse_allocation(std::uint32_t, std::uint32_t, void*) {
    return nullptr;
}

} // namespace

TEST_CASE("Memory surface: sizing") {
    pid_image::memory_surface surf;

    SUBCASE("Pixels start zeroed") {
        REQUIRE(surf.set_size(3, 2));
        CHECK(surf.width() == 3);
        CHECK(surf.height() == 2);
        CHECK(surf.pitch() == 12);
        REQUIRE(surf.pixels().size() == 24);
        CHECK(std::all_of(surf.pixels().begin(), surf.pixels().end(),
                          [](std::uint8_t b) { return b == 0; }));
    }

    SUBCASE("Zero size is an empty image") {
        REQUIRE(surf.set_size(0, 5));
        CHECK(surf.width() == 0);
        CHECK(surf.height() == 5);
        CHECK(surf.pixels().empty());
    }

    SUBCASE("Negative size is rejected") {
        CHECK_FALSE(surf.set_size(-1, 4));
        CHECK_FALSE(surf.set_size(4, -1));
        CHECK(surf.width() == 0);
    }

    SUBCASE("Oversized buffer is rejected") {
        CHECK_FALSE(surf.set_size(65536, 65536));
    }
}

TEST_CASE("Memory surface: writes are clipped to the row") {
    pid_image::memory_surface surf;
    REQUIRE(surf.set_size(2, 2));

    const std::uint8_t row[12] = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};

    surf.write_pixels(4, 1, 12, row);
    const auto pixels = surf.pixels();
    CHECK(pixels[8] == 0);
    CHECK(pixels[12] == 1);
    CHECK(pixels[15] == 4);

    // Out-of-range rows and offsets are ignored
    surf.write_pixels(0, 2, 8, row);
    surf.write_pixels(8, 0, 8, row);
    surf.write_pixels(0, -1, 8, row);
    CHECK(std::all_of(pixels.begin(), pixels.begin() + 12, [](std::uint8_t b) { return b == 0; }));
}

TEST_CASE("Canvas surface: region layout") {
    std::vector<std::uint8_t> storage;
    pid_image::canvas_surface canvas(&allocate_into, &storage);

    CHECK(canvas.data() == nullptr);
    REQUIRE(canvas.set_size(2, 1));
    CHECK(canvas.width() == 2);
    CHECK(canvas.height() == 1);
    CHECK(canvas.size() == pid_image::canvas_surface::region_size(2, 1));
    REQUIRE(storage.size() == 16);

    const std::uint8_t pixel[4] = {9, 8, 7, 6};
    canvas.write_pixels(4, 0, 4, pixel);

    const std::vector<std::uint8_t> expected = {2, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0, 9, 8, 7, 6};
    CHECK(storage == expected);
}

TEST_CASE("Canvas surface: empty image still writes dimensions") {
    std::vector<std::uint8_t> storage;
    pid_image::canvas_surface canvas(&allocate_into, &storage);

    REQUIRE(canvas.set_size(0, 7));
    CHECK(storage == std::vector<std::uint8_t>{0, 0, 0, 0, 7, 0, 0, 0});
}

TEST_CASE("Canvas surface: allocation failure") {
    SUBCASE("Allocator returns null") {
        pid_image::canvas_surface canvas(&refuse_allocation);
        CHECK_FALSE(canvas.set_size(4, 4));
        CHECK(canvas.data() == nullptr);
    }

    SUBCASE("No allocator") {
        pid_image::canvas_surface canvas(nullptr);
        CHECK_FALSE(canvas.set_size(1, 1));
    }

    SUBCASE("Decode reports the failure") {
        const std::vector<std::uint8_t> data = {
            1, 0, 0, 0,  0x80, 0, 0, 0,  1, 0, 0, 0,  1, 0, 0, 0,
            0, 0, 0, 0,  0, 0, 0, 0,     0, 0, 0, 0,  0, 0, 0, 0,
            3};
        std::vector<std::uint8_t> with_palette = data;
        with_palette.resize(data.size() + pid_image::PID_PALETTE_SIZE, 0);

        pid_image::canvas_surface canvas(&refuse_allocation);
        auto result = pid_image::pid_decoder::decode(with_palette, canvas);
        CHECK_FALSE(result.ok);
        CHECK(result.error == pid_image::decode_error::dimensions_exceeded);
    }
}
