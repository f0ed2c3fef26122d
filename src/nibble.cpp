#include <wan_codec/nibble.hpp>

#include <string>

namespace wan_codec {

encode_result validate_pixels(std::span<const std::uint8_t> pixels) {
    if (pixels.size() % 2 != 0) {
        return encode_result::failure(encode_error::odd_pixel_count,
            "Pixel count must be even: " + std::to_string(pixels.size()));
    }

    for (std::size_t i = 0; i < pixels.size(); ++i) {
        if (pixels[i] > MAX_PIXEL_VALUE) {
            return encode_result::failure(encode_error::invalid_pixel_value,
                "Pixel " + std::to_string(i) + " exceeds 4-bit range: " +
                std::to_string(pixels[i]));
        }
    }

    return encode_result::success();
}

encode_result pack_pixels(std::span<const std::uint8_t> pixels,
                          std::vector<std::uint8_t>& out) {
    auto result = validate_pixels(pixels);
    if (!result) return result;

    out.reserve(out.size() + pixels.size() / 2);
    for (std::size_t i = 0; i < pixels.size(); i += 2) {
        out.push_back(pack_pair(pixels[i], pixels[i + 1]));
    }

    return encode_result::success();
}

void unpack_pixels(std::span<const std::uint8_t> bytes,
                   std::vector<std::uint8_t>& out) {
    out.reserve(out.size() + bytes.size() * 2);
    for (const auto byte : bytes) {
        out.push_back(high_nibble(byte));
        out.push_back(low_nibble(byte));
    }
}

} // namespace wan_codec
