#ifndef WAN_CODEC_TYPES_HPP_
#define WAN_CODEC_TYPES_HPP_

#include <wan_codec/wan_codec_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace wan_codec {

// ============================================================================
// Pixel Constants
// ============================================================================

constexpr std::uint8_t TRANSPARENT_PIXEL = 0;
constexpr std::uint8_t MAX_PIXEL_VALUE = 0x0F;

constexpr int TILE_SIZE = 8;
constexpr std::size_t PIXELS_PER_TILE = 64;
constexpr std::size_t BYTES_PER_TILE = 32;

// ============================================================================
// Assembly Table
// ============================================================================

enum class entry_kind {
    literal,    // bytes were written to the sink at source_offset
    filler      // all-transparent run, never written
};

/**
 * One run of an assembly table.
 * Replaying entries in table order reproduces the encoded pixel buffer.
 * source_offset is only meaningful for literal entries; 0 is a valid offset.
 */
struct assembly_entry {
    entry_kind kind = entry_kind::literal;
    std::uint64_t source_offset = 0;
    std::uint64_t pixel_count = 0;
    std::uint64_t byte_count = 0;
    std::uint32_t z_index = 0;

    [[nodiscard]] static assembly_entry literal(std::uint64_t offset,
                                                std::uint64_t pixels,
                                                std::uint32_t z = 0) {
        return {entry_kind::literal, offset, pixels, pixels / 2, z};
    }

    [[nodiscard]] static assembly_entry filler(std::uint64_t pixels, std::uint32_t z = 0) {
        return {entry_kind::filler, 0, pixels, pixels / 2, z};
    }

    [[nodiscard]] bool is_filler() const noexcept { return kind == entry_kind::filler; }

    bool operator==(const assembly_entry&) const = default;
};

// ============================================================================
// Compression Strategy
// ============================================================================

enum class compression_method {
    original,   // 8x8 tile granularity, merges null tiles
    optimised,  // pixel granularity, aligned transparent runs
    none        // single literal entry
};

/**
 * Strategy chosen per image at encode time.
 * The two optimised parameters are ignored by the other methods.
 */
struct compression_strategy {
    compression_method method = compression_method::original;
    std::size_t multiple_of_value = 0;
    std::size_t min_transparent_to_compress = 0;

    [[nodiscard]] static compression_strategy original() {
        return {compression_method::original, 0, 0};
    }

    [[nodiscard]] static compression_strategy optimised(std::size_t multiple_of_value,
                                                        std::size_t min_transparent_to_compress) {
        return {compression_method::optimised, multiple_of_value, min_transparent_to_compress};
    }

    [[nodiscard]] static compression_strategy none() {
        return {compression_method::none, 0, 0};
    }

    bool operator==(const compression_strategy&) const = default;
};

[[nodiscard]] WAN_CODEC_EXPORT const char* to_string(compression_method method) noexcept;

/**
 * Describe a strategy, e.g. "optimised(16,32)".
 */
[[nodiscard]] WAN_CODEC_EXPORT std::string to_string(const compression_strategy& strategy);

/**
 * Look up a strategy by name ("original", "optimised" or "none").
 * The optimised parameters are taken from the arguments.
 * @return true if the name is known
 */
[[nodiscard]] WAN_CODEC_EXPORT bool parse_strategy(std::string_view name,
                                                   compression_strategy& strategy,
                                                   std::size_t multiple_of_value = 16,
                                                   std::size_t min_transparent_to_compress = 32);

// ============================================================================
// Fragment Flips
// ============================================================================

enum class fragment_flip {
    none,
    horizontal,
    vertical,
    both
};

[[nodiscard]] constexpr fragment_flip make_flip(bool horizontal, bool vertical) noexcept {
    if (horizontal) {
        return vertical ? fragment_flip::both : fragment_flip::horizontal;
    }
    return vertical ? fragment_flip::vertical : fragment_flip::none;
}

[[nodiscard]] constexpr bool is_flipped_horizontally(fragment_flip flip) noexcept {
    return flip == fragment_flip::horizontal || flip == fragment_flip::both;
}

[[nodiscard]] constexpr bool is_flipped_vertically(fragment_flip flip) noexcept {
    return flip == fragment_flip::vertical || flip == fragment_flip::both;
}

[[nodiscard]] WAN_CODEC_EXPORT const char* to_string(fragment_flip flip) noexcept;

// ============================================================================
// Encode Errors
// ============================================================================

enum class encode_error {
    none,
    odd_pixel_count,
    unaligned_tile_count,
    invalid_pixel_value,
    invalid_strategy,
    invalid_dimensions,
    io_error,
    internal_error
};

[[nodiscard]] WAN_CODEC_EXPORT const char* to_string(encode_error err) noexcept;

struct encode_result {
    bool ok = false;
    encode_error error = encode_error::none;
    std::string message;

    [[nodiscard]] static encode_result success() {
        return {true, encode_error::none, {}};
    }

    [[nodiscard]] static encode_result failure(encode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    invalid_entry,
    out_of_bounds,
    length_mismatch,
    limit_exceeded,
    io_error
};

[[nodiscard]] WAN_CODEC_EXPORT const char* to_string(decode_error err) noexcept;

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Options
// ============================================================================

struct encode_options {
    // Stamped on every emitted entry
    std::uint32_t z_index = 0;
};

struct decode_options {
    // Maximum pixels a table may expand to (0 = use default)
    std::uint64_t max_pixel_count = 16 * 1024 * 1024;
};

struct finder_options {
    // When false only the unflipped candidate is compared
    bool allow_flips = true;
};

} // namespace wan_codec

#endif // WAN_CODEC_TYPES_HPP_
