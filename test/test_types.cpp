#include <doctest/doctest.h>
#include <wan_codec/wan_codec.hpp>

#include <string>

TEST_CASE("Types: strategy names") {
    SUBCASE("to_string") {
        CHECK(wan_codec::to_string(wan_codec::compression_strategy::original()) == std::string("original"));
        CHECK(wan_codec::to_string(wan_codec::compression_strategy::none()) == std::string("none"));
        CHECK(wan_codec::to_string(wan_codec::compression_strategy::optimised(16, 32)) ==
              std::string("optimised(16,32)"));
    }

    SUBCASE("parse_strategy") {
        wan_codec::compression_strategy strategy;

        REQUIRE(wan_codec::parse_strategy("none", strategy));
        CHECK(strategy == wan_codec::compression_strategy::none());

        REQUIRE(wan_codec::parse_strategy("original", strategy));
        CHECK(strategy == wan_codec::compression_strategy::original());

        REQUIRE(wan_codec::parse_strategy("optimised", strategy, 8, 24));
        CHECK(strategy.method == wan_codec::compression_method::optimised);
        CHECK(strategy.multiple_of_value == 8);
        CHECK(strategy.min_transparent_to_compress == 24);

        CHECK_FALSE(wan_codec::parse_strategy("lz77", strategy));
    }
}

TEST_CASE("Types: flips") {
    CHECK(wan_codec::make_flip(false, false) == wan_codec::fragment_flip::none);
    CHECK(wan_codec::make_flip(true, false) == wan_codec::fragment_flip::horizontal);
    CHECK(wan_codec::make_flip(false, true) == wan_codec::fragment_flip::vertical);
    CHECK(wan_codec::make_flip(true, true) == wan_codec::fragment_flip::both);

    CHECK(wan_codec::is_flipped_horizontally(wan_codec::fragment_flip::both));
    CHECK_FALSE(wan_codec::is_flipped_horizontally(wan_codec::fragment_flip::vertical));
    CHECK(wan_codec::is_flipped_vertically(wan_codec::fragment_flip::vertical));
    CHECK_FALSE(wan_codec::is_flipped_vertically(wan_codec::fragment_flip::horizontal));

    CHECK(std::string(wan_codec::to_string(wan_codec::fragment_flip::horizontal)) == "horizontal");
}

TEST_CASE("Types: assembly entries") {
    const auto literal = wan_codec::assembly_entry::literal(0, 64, 3);
    CHECK_FALSE(literal.is_filler());
    CHECK(literal.source_offset == 0);
    CHECK(literal.byte_count == 32);
    CHECK(literal.z_index == 3);

    // A filler at offset 0 is still told apart from a literal at offset 0
    const auto filler = wan_codec::assembly_entry::filler(64, 3);
    CHECK(filler.is_filler());
    CHECK(filler.source_offset == literal.source_offset);
    CHECK_FALSE(filler == literal);

    CHECK(std::string(wan_codec::to_string(wan_codec::encode_error::unaligned_tile_count)) ==
          "unaligned_tile_count");
    CHECK(std::string(wan_codec::to_string(wan_codec::decode_error::out_of_bounds)) ==
          "out_of_bounds");
}
