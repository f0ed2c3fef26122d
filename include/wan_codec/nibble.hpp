#ifndef WAN_CODEC_NIBBLE_HPP_
#define WAN_CODEC_NIBBLE_HPP_

#include <wan_codec/wan_codec_export.h>
#include <wan_codec/types.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace wan_codec {

// ============================================================================
// Nibble Pixel Codec
// ============================================================================

// Pack two 4-bit pixels into one byte, first pixel in the high nibble.
[[nodiscard]] constexpr std::uint8_t pack_pair(std::uint8_t first, std::uint8_t second) noexcept {
    return static_cast<std::uint8_t>(((first & MAX_PIXEL_VALUE) << 4) | (second & MAX_PIXEL_VALUE));
}

[[nodiscard]] constexpr std::uint8_t high_nibble(std::uint8_t byte) noexcept {
    return static_cast<std::uint8_t>((byte >> 4) & MAX_PIXEL_VALUE);
}

[[nodiscard]] constexpr std::uint8_t low_nibble(std::uint8_t byte) noexcept {
    return static_cast<std::uint8_t>(byte & MAX_PIXEL_VALUE);
}

/**
 * Check that a buffer can be nibble-packed.
 * @param pixels Color indices
 * @return odd_pixel_count or invalid_pixel_value on failure
 */
[[nodiscard]] WAN_CODEC_EXPORT encode_result validate_pixels(std::span<const std::uint8_t> pixels);

/**
 * Pack pixels two per byte, appending to out.
 * @param pixels Color indices, even length, values 0-15
 * @param out Destination, bytes are appended
 */
[[nodiscard]] WAN_CODEC_EXPORT encode_result pack_pixels(std::span<const std::uint8_t> pixels,
                                                         std::vector<std::uint8_t>& out);

/**
 * Unpack bytes into two pixels each (high nibble first), appending to out.
 */
WAN_CODEC_EXPORT void unpack_pixels(std::span<const std::uint8_t> bytes,
                                    std::vector<std::uint8_t>& out);

} // namespace wan_codec

#endif // WAN_CODEC_NIBBLE_HPP_
