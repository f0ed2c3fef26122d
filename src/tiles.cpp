#include <wan_codec/tiles.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace wan_codec {

namespace {

encode_result invalid_image() {
    return encode_result::failure(encode_error::invalid_dimensions,
        "Image dimensions do not match its pixel count");
}

bool tile_aligned(int width, int height) {
    return width > 0 && height > 0 && width % TILE_SIZE == 0 && height % TILE_SIZE == 0;
}

} // namespace

encode_result pad_to_tile(const indexed_image& image, indexed_image& out) {
    if (!image.valid()) {
        return invalid_image();
    }

    const int padded_w = round_up_to_tile(image.width);
    const int padded_h = round_up_to_tile(image.height);
    const auto src_w = static_cast<std::size_t>(image.width);
    const auto dst_w = static_cast<std::size_t>(padded_w);

    std::vector<std::uint8_t> padded(dst_w * static_cast<std::size_t>(padded_h), TRANSPARENT_PIXEL);
    for (int y = 0; y < image.height; ++y) {
        const auto row = static_cast<std::size_t>(y);
        std::copy_n(image.pixels.begin() + static_cast<std::ptrdiff_t>(row * src_w),
                    src_w,
                    padded.begin() + static_cast<std::ptrdiff_t>(row * dst_w));
    }

    out.width = padded_w;
    out.height = padded_h;
    out.pixels = std::move(padded);
    return encode_result::success();
}

encode_result to_tile_order(const indexed_image& image, std::vector<std::uint8_t>& out) {
    if (!image.valid()) {
        return invalid_image();
    }
    if (!tile_aligned(image.width, image.height)) {
        return encode_result::failure(encode_error::invalid_dimensions,
            "Image must be a multiple of 8 pixels in both dimensions, got " +
            std::to_string(image.width) + "x" + std::to_string(image.height));
    }

    const auto width = static_cast<std::size_t>(image.width);
    const int tiles_x = image.width / TILE_SIZE;
    const int tiles_y = image.height / TILE_SIZE;

    out.clear();
    out.reserve(image.pixels.size());
    for (int ty = 0; ty < tiles_y; ++ty) {
        for (int tx = 0; tx < tiles_x; ++tx) {
            for (int y = 0; y < TILE_SIZE; ++y) {
                const auto row = static_cast<std::size_t>(ty * TILE_SIZE + y);
                const auto col = static_cast<std::size_t>(tx * TILE_SIZE);
                const auto* src = image.pixels.data() + row * width + col;
                out.insert(out.end(), src, src + TILE_SIZE);
            }
        }
    }

    return encode_result::success();
}

encode_result from_tile_order(std::span<const std::uint8_t> tiled,
                              int width, int height,
                              indexed_image& out) {
    if (!tile_aligned(width, height)) {
        return encode_result::failure(encode_error::invalid_dimensions,
            "Image must be a multiple of 8 pixels in both dimensions, got " +
            std::to_string(width) + "x" + std::to_string(height));
    }

    const auto row_pixels = static_cast<std::size_t>(width);
    if (tiled.size() != row_pixels * static_cast<std::size_t>(height)) {
        return encode_result::failure(encode_error::invalid_dimensions,
            "Expected " + std::to_string(row_pixels * static_cast<std::size_t>(height)) +
            " tiled pixels, got " + std::to_string(tiled.size()));
    }

    const int tiles_x = width / TILE_SIZE;
    const int tiles_y = height / TILE_SIZE;

    std::vector<std::uint8_t> pixels(tiled.size());
    std::size_t src = 0;
    for (int ty = 0; ty < tiles_y; ++ty) {
        for (int tx = 0; tx < tiles_x; ++tx) {
            for (int y = 0; y < TILE_SIZE; ++y) {
                const auto row = static_cast<std::size_t>(ty * TILE_SIZE + y);
                const auto col = static_cast<std::size_t>(tx * TILE_SIZE);
                std::copy_n(tiled.begin() + static_cast<std::ptrdiff_t>(src), TILE_SIZE,
                            pixels.begin() + static_cast<std::ptrdiff_t>(row * row_pixels + col));
                src += TILE_SIZE;
            }
        }
    }

    out.width = width;
    out.height = height;
    out.pixels = std::move(pixels);
    return encode_result::success();
}

encode_result flip_image(const indexed_image& image, fragment_flip flip, indexed_image& out) {
    if (!image.valid()) {
        return invalid_image();
    }

    const bool mirror_x = is_flipped_horizontally(flip);
    const bool mirror_y = is_flipped_vertically(flip);
    const auto w = static_cast<std::size_t>(image.width);
    const auto h = static_cast<std::size_t>(image.height);

    std::vector<std::uint8_t> flipped(image.pixels.size());
    for (std::size_t y = 0; y < h; ++y) {
        const std::size_t src_y = mirror_y ? h - 1 - y : y;
        for (std::size_t x = 0; x < w; ++x) {
            const std::size_t src_x = mirror_x ? w - 1 - x : x;
            flipped[y * w + x] = image.pixels[src_y * w + src_x];
        }
    }

    out.width = image.width;
    out.height = image.height;
    out.pixels = std::move(flipped);
    return encode_result::success();
}

} // namespace wan_codec
