#ifndef WAN_CODEC_FRAGMENT_RESOLUTION_HPP_
#define WAN_CODEC_FRAGMENT_RESOLUTION_HPP_

#include <wan_codec/wan_codec_export.h>

#include <cstddef>

namespace wan_codec {

// ============================================================================
// Fragment Resolution
// ============================================================================
//
// WAN fragments come in twelve sizes, addressed in frame metadata by a
// (shape, size) index pair:
//
//   shape 0 (square): 8x8   16x16  32x32  64x64
//   shape 1 (wide):   16x8  32x8   32x16  64x32
//   shape 2 (tall):   8x16  8x32   16x32  32x64

struct WAN_CODEC_EXPORT fragment_resolution {
    int width = 0;
    int height = 0;

    [[nodiscard]] std::size_t pixel_count() const noexcept {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }

    /**
     * Resolve a (shape, size) index pair.
     * @return false if either index is out of range
     */
    [[nodiscard]] static bool from_indices(int shape, int size, fragment_resolution& out) noexcept;

    /**
     * Find the (shape, size) index pair of this resolution.
     * @return false if this is not one of the twelve WAN sizes
     */
    [[nodiscard]] bool to_indices(int& shape, int& size) const noexcept;

    /**
     * Smallest WAN size covering width x height.
     * Ties on area resolve to the first size in shape/size order.
     * @return false if nothing covers the area (wider or taller than 64)
     */
    [[nodiscard]] static bool smallest_fitting(int width, int height, fragment_resolution& out) noexcept;

    bool operator==(const fragment_resolution&) const = default;
};

} // namespace wan_codec

#endif // WAN_CODEC_FRAGMENT_RESOLUTION_HPP_
