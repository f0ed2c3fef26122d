#ifndef WAN_CODEC_FRAGMENT_FINDER_HPP_
#define WAN_CODEC_FRAGMENT_FINDER_HPP_

#include <wan_codec/wan_codec_export.h>
#include <wan_codec/types.hpp>
#include <wan_codec/tiles.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace wan_codec {

// ============================================================================
// Fragment Identity
// ============================================================================

// Identity assigned by the archive assembly layer, e.g. an image store index.
struct fragment_reference {
    std::size_t image_index = 0;

    bool operator==(const fragment_reference&) const = default;
};

struct fragment_match {
    fragment_reference reference;
    // Flip that turns the padded candidate into the registered fragment
    fragment_flip flip = fragment_flip::none;

    bool operator==(const fragment_match&) const = default;
};

// ============================================================================
// Fragment Library
// ============================================================================

/**
 * Registered fragments, searched to reuse pixel data instead of encoding a
 * duplicate. Each fragment is kept in canonical form: padded to whole 8x8
 * tiles, row-major.
 *
 * The search is a linear scan, O(fragments x flips x pixels) per candidate;
 * it runs during offline archive assembly.
 */
class WAN_CODEC_EXPORT fragment_library {
public:
    /**
     * Register a fragment.
     * @param reference Identity reported back on a match
     * @param image Fragment pixels; padded to whole tiles on registration
     * @return invalid_dimensions if image is not valid()
     */
    [[nodiscard]] encode_result add(fragment_reference reference, const indexed_image& image);

    /**
     * Look for a registered fragment identical to the candidate.
     *
     * The candidate is padded to whole tiles, then each flip (none,
     * horizontal, vertical, both) is compared with every fragment. Earlier
     * registrations win; for one fragment, flips are tried in that order.
     *
     * @param candidate Image to look up
     * @param match Set to the match, or reset if nothing matches
     * @param options Finder options
     * @return invalid_dimensions if candidate is not valid()
     */
    [[nodiscard]] encode_result find_matching_fragment(const indexed_image& candidate,
                                                       std::optional<fragment_match>& match,
                                                       const finder_options& options = {}) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    void clear() noexcept { entries_.clear(); }

    /**
     * Canonical (tile-padded) pixels of the fragment at index.
     * @return nullptr if index is out of range
     */
    [[nodiscard]] const indexed_image* canonical_at(std::size_t index) const noexcept {
        return index < entries_.size() ? &entries_[index].canonical : nullptr;
    }

private:
    struct entry {
        fragment_reference reference;
        indexed_image canonical;
    };

    std::vector<entry> entries_;
};

} // namespace wan_codec

#endif // WAN_CODEC_FRAGMENT_FINDER_HPP_
