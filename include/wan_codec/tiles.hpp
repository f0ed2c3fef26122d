#ifndef WAN_CODEC_TILES_HPP_
#define WAN_CODEC_TILES_HPP_

#include <wan_codec/wan_codec_export.h>
#include <wan_codec/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace wan_codec {

// ============================================================================
// Indexed Image
// ============================================================================

/**
 * Row-major 4-bit index image, one byte per pixel.
 */
struct indexed_image {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] bool valid() const noexcept {
        return width > 0 && height > 0 &&
               pixels.size() == static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }

    bool operator==(const indexed_image&) const = default;
};

// ============================================================================
// Tile Layout
// ============================================================================
//
// Fragment pixels are stored tile by tile: the image is cut into 8x8 tiles,
// tiles are visited left to right then top to bottom, and the 64 pixels of
// each tile are stored row-major. This is the order the original
// compression strategy scans.

[[nodiscard]] constexpr int round_up_to_tile(int value) noexcept {
    return (value + TILE_SIZE - 1) / TILE_SIZE * TILE_SIZE;
}

/**
 * Pad an image to a multiple of 8 in both dimensions.
 * Transparent columns are appended on the right and transparent rows at the
 * bottom; existing pixels keep their coordinates.
 * @param image Source image
 * @param out Padded copy
 * @return invalid_dimensions if image is not valid()
 */
[[nodiscard]] WAN_CODEC_EXPORT encode_result pad_to_tile(const indexed_image& image,
                                                         indexed_image& out);

/**
 * Reorder a row-major image into tile order.
 * @param image Image whose width and height are multiples of 8
 * @param out Tile-ordered pixels (replaces contents)
 */
[[nodiscard]] WAN_CODEC_EXPORT encode_result to_tile_order(const indexed_image& image,
                                                           std::vector<std::uint8_t>& out);

/**
 * Rebuild a row-major image from tile-ordered pixels.
 * @param tiled Tile-ordered pixels, width * height of them
 * @param width Image width, multiple of 8
 * @param height Image height, multiple of 8
 * @param out Reconstructed image
 */
[[nodiscard]] WAN_CODEC_EXPORT encode_result from_tile_order(std::span<const std::uint8_t> tiled,
                                                             int width, int height,
                                                             indexed_image& out);

/**
 * Mirror an image.
 * Every flip is its own inverse.
 */
[[nodiscard]] WAN_CODEC_EXPORT encode_result flip_image(const indexed_image& image,
                                                        fragment_flip flip,
                                                        indexed_image& out);

} // namespace wan_codec

#endif // WAN_CODEC_TILES_HPP_
