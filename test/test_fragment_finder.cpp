#include <doctest/doctest.h>
#include <wan_codec/wan_codec.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace {

// 8x8 fragment with a distinct value in each corner, so no flip is a no-op
wan_codec::indexed_image make_fragment() {
    wan_codec::indexed_image image;
    image.width = 8;
    image.height = 8;
    image.pixels.assign(64, 0);
    image.pixels[0] = 1;
    image.pixels[7] = 2;
    image.pixels[56] = 3;
    image.pixels[63] = 4;
    image.pixels[9] = 5;
    return image;
}

wan_codec::indexed_image flipped(const wan_codec::indexed_image& image, wan_codec::fragment_flip flip) {
    wan_codec::indexed_image out;
    REQUIRE(wan_codec::flip_image(image, flip, out).ok);
    return out;
}

} // namespace

TEST_CASE("Fragment finder: flips") {
    wan_codec::fragment_library library;
    const auto fragment = make_fragment();
    REQUIRE(library.add({3}, fragment).ok);

    std::optional<wan_codec::fragment_match> match;

    SUBCASE("Fragment finds itself unflipped") {
        REQUIRE(library.find_matching_fragment(fragment, match).ok);
        REQUIRE(match.has_value());
        CHECK(match->reference.image_index == 3);
        CHECK(match->flip == wan_codec::fragment_flip::none);
    }

    SUBCASE("Horizontal mirror") {
        REQUIRE(library.find_matching_fragment(flipped(fragment, wan_codec::fragment_flip::horizontal), match).ok);
        REQUIRE(match.has_value());
        CHECK(match->flip == wan_codec::fragment_flip::horizontal);
    }

    SUBCASE("Vertical mirror") {
        REQUIRE(library.find_matching_fragment(flipped(fragment, wan_codec::fragment_flip::vertical), match).ok);
        REQUIRE(match.has_value());
        CHECK(match->flip == wan_codec::fragment_flip::vertical);
    }

    SUBCASE("Both mirrors") {
        REQUIRE(library.find_matching_fragment(flipped(fragment, wan_codec::fragment_flip::both), match).ok);
        REQUIRE(match.has_value());
        CHECK(match->flip == wan_codec::fragment_flip::both);
    }

    SUBCASE("One pixel off") {
        auto candidate = fragment;
        candidate.pixels[20] = 9;
        match = wan_codec::fragment_match{};
        REQUIRE(library.find_matching_fragment(candidate, match).ok);
        CHECK_FALSE(match.has_value());
    }

    SUBCASE("Flips can be disabled") {
        wan_codec::finder_options options;
        options.allow_flips = false;
        REQUIRE(library.find_matching_fragment(flipped(fragment, wan_codec::fragment_flip::horizontal),
                                               match, options).ok);
        CHECK_FALSE(match.has_value());

        REQUIRE(library.find_matching_fragment(fragment, match, options).ok);
        CHECK(match.has_value());
    }
}

TEST_CASE("Fragment finder: search order") {
    wan_codec::fragment_library library;
    const auto fragment = make_fragment();
    std::optional<wan_codec::fragment_match> match;

    SUBCASE("Earlier registration wins") {
        REQUIRE(library.add({5}, flipped(fragment, wan_codec::fragment_flip::horizontal)).ok);
        REQUIRE(library.add({7}, fragment).ok);

        // Fragment 5 matches through a flip before fragment 7 is even tried
        REQUIRE(library.find_matching_fragment(fragment, match).ok);
        REQUIRE(match.has_value());
        CHECK(match->reference.image_index == 5);
        CHECK(match->flip == wan_codec::fragment_flip::horizontal);
    }

    SUBCASE("Symmetric fragment reports no flip") {
        const wan_codec::indexed_image blank{8, 8, std::vector<std::uint8_t>(64, 6)};
        REQUIRE(library.add({1}, blank).ok);
        REQUIRE(library.find_matching_fragment(blank, match).ok);
        REQUIRE(match.has_value());
        CHECK(match->flip == wan_codec::fragment_flip::none);
    }

    SUBCASE("Empty library") {
        REQUIRE(library.find_matching_fragment(fragment, match).ok);
        CHECK_FALSE(match.has_value());
    }
}

TEST_CASE("Fragment finder: padding") {
    wan_codec::fragment_library library;
    std::optional<wan_codec::fragment_match> match;

    wan_codec::indexed_image small;
    small.width = 7;
    small.height = 5;
    for (int i = 0; i < 35; ++i) {
        small.pixels.push_back(static_cast<std::uint8_t>(i % 15 + 1));
    }

    SUBCASE("Registered fragments are padded to whole tiles") {
        REQUIRE(library.add({0}, small).ok);
        const auto* canonical = library.canonical_at(0);
        REQUIRE(canonical != nullptr);
        CHECK(canonical->width == 8);
        CHECK(canonical->height == 8);
        CHECK(canonical->pixels[0] == small.pixels[0]);
        CHECK(canonical->pixels[7] == 0);
        CHECK(canonical->pixels[8] == small.pixels[7]);
        CHECK(canonical->pixels[63] == 0);
        CHECK(library.canonical_at(1) == nullptr);
    }

    SUBCASE("Unpadded candidate matches its padded registration") {
        REQUIRE(library.add({0}, small).ok);
        REQUIRE(library.find_matching_fragment(small, match).ok);
        REQUIRE(match.has_value());
        CHECK(match->flip == wan_codec::fragment_flip::none);
    }

    SUBCASE("Same pixel count, different shape") {
        const wan_codec::indexed_image tall{8, 16, std::vector<std::uint8_t>(128, 0)};
        const wan_codec::indexed_image wide{16, 8, std::vector<std::uint8_t>(128, 0)};
        REQUIRE(library.add({0}, tall).ok);
        REQUIRE(library.find_matching_fragment(wide, match).ok);
        CHECK_FALSE(match.has_value());
    }

    SUBCASE("Invalid candidate") {
        auto broken = small;
        broken.pixels.pop_back();
        const auto result = library.find_matching_fragment(broken, match);
        CHECK(result.error == wan_codec::encode_error::invalid_dimensions);
        CHECK(library.add({0}, broken).error == wan_codec::encode_error::invalid_dimensions);
        CHECK(library.empty());
    }
}
