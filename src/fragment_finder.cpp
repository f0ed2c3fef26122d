#include <wan_codec/fragment_finder.hpp>

#include <array>
#include <utility>

namespace wan_codec {

namespace {

constexpr std::array<fragment_flip, 4> SEARCH_FLIPS = {
    fragment_flip::none,
    fragment_flip::horizontal,
    fragment_flip::vertical,
    fragment_flip::both
};

} // namespace

encode_result fragment_library::add(fragment_reference reference, const indexed_image& image) {
    indexed_image canonical;
    auto result = pad_to_tile(image, canonical);
    if (!result) return result;

    entries_.push_back({reference, std::move(canonical)});
    return encode_result::success();
}

encode_result fragment_library::find_matching_fragment(const indexed_image& candidate,
                                                       std::optional<fragment_match>& match,
                                                       const finder_options& options) const {
    match.reset();

    indexed_image padded;
    auto result = pad_to_tile(candidate, padded);
    if (!result) return result;

    const std::size_t variant_count = options.allow_flips ? SEARCH_FLIPS.size() : 1;
    std::array<indexed_image, SEARCH_FLIPS.size()> variants;
    for (std::size_t i = 0; i < variant_count; ++i) {
        result = flip_image(padded, SEARCH_FLIPS[i], variants[i]);
        if (!result) return result;
    }

    for (const auto& registered : entries_) {
        for (std::size_t i = 0; i < variant_count; ++i) {
            if (variants[i] == registered.canonical) {
                match = fragment_match{registered.reference, SEARCH_FLIPS[i]};
                return encode_result::success();
            }
        }
    }

    return encode_result::success();
}

} // namespace wan_codec
