#include <wan_codec/fragment_resolution.hpp>

namespace wan_codec {

namespace {

constexpr int SHAPE_COUNT = 3;
constexpr int SIZE_COUNT = 4;

constexpr fragment_resolution RESOLUTIONS[SHAPE_COUNT][SIZE_COUNT] = {
    {{8, 8}, {16, 16}, {32, 32}, {64, 64}},     // square
    {{16, 8}, {32, 8}, {32, 16}, {64, 32}},     // wide
    {{8, 16}, {8, 32}, {16, 32}, {32, 64}},     // tall
};

} // namespace

bool fragment_resolution::from_indices(int shape, int size, fragment_resolution& out) noexcept {
    if (shape < 0 || shape >= SHAPE_COUNT || size < 0 || size >= SIZE_COUNT) {
        return false;
    }
    out = RESOLUTIONS[shape][size];
    return true;
}

bool fragment_resolution::to_indices(int& shape, int& size) const noexcept {
    for (int s = 0; s < SHAPE_COUNT; ++s) {
        for (int z = 0; z < SIZE_COUNT; ++z) {
            if (RESOLUTIONS[s][z] == *this) {
                shape = s;
                size = z;
                return true;
            }
        }
    }
    return false;
}

bool fragment_resolution::smallest_fitting(int width, int height, fragment_resolution& out) noexcept {
    if (width <= 0 || height <= 0) {
        return false;
    }

    const fragment_resolution* best = nullptr;
    for (const auto& row : RESOLUTIONS) {
        for (const auto& candidate : row) {
            if (candidate.width < width || candidate.height < height) {
                continue;
            }
            if (!best || candidate.pixel_count() < best->pixel_count()) {
                best = &candidate;
            }
        }
    }

    if (!best) {
        return false;
    }
    out = *best;
    return true;
}

} // namespace wan_codec
