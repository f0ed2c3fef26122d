#include <doctest/doctest.h>
#include <wan_codec/wan_codec.hpp>

#include <cstdint>
#include <vector>

TEST_CASE("Nibble codec: pair packing") {
    CHECK(wan_codec::pack_pair(0x1, 0x2) == 0x12);
    CHECK(wan_codec::pack_pair(0xF, 0x0) == 0xF0);
    CHECK(wan_codec::high_nibble(0xAB) == 0xA);
    CHECK(wan_codec::low_nibble(0xAB) == 0xB);
}

TEST_CASE("Nibble codec: pack and unpack") {
    SUBCASE("High nibble first") {
        const std::vector<std::uint8_t> pixels = {1, 2, 3, 4, 15, 0};
        std::vector<std::uint8_t> bytes;

        REQUIRE(wan_codec::pack_pixels(pixels, bytes).ok);
        CHECK(bytes == std::vector<std::uint8_t>{0x12, 0x34, 0xF0});

        std::vector<std::uint8_t> unpacked;
        wan_codec::unpack_pixels(bytes, unpacked);
        CHECK(unpacked == pixels);
    }

    SUBCASE("Appends to existing output") {
        std::vector<std::uint8_t> bytes = {0xEE};
        REQUIRE(wan_codec::pack_pixels(std::vector<std::uint8_t>{5, 6}, bytes).ok);
        CHECK(bytes == std::vector<std::uint8_t>{0xEE, 0x56});
    }

    SUBCASE("Odd pixel count") {
        std::vector<std::uint8_t> bytes;
        const auto result = wan_codec::pack_pixels(std::vector<std::uint8_t>{1, 2, 3}, bytes);
        CHECK_FALSE(result.ok);
        CHECK(result.error == wan_codec::encode_error::odd_pixel_count);
        CHECK(bytes.empty());
    }

    SUBCASE("Index out of 4-bit range") {
        std::vector<std::uint8_t> bytes;
        const auto result = wan_codec::pack_pixels(std::vector<std::uint8_t>{1, 16}, bytes);
        CHECK_FALSE(result.ok);
        CHECK(result.error == wan_codec::encode_error::invalid_pixel_value);
    }
}
