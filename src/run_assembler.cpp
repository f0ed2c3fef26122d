#include <wan_codec/run_assembler.hpp>
#include <wan_codec/nibble.hpp>

#include <algorithm>
#include <array>
#include <string>

namespace wan_codec {

namespace {

bool all_transparent(std::span<const std::uint8_t> pixels) noexcept {
    return std::all_of(pixels.begin(), pixels.end(),
                       [](std::uint8_t p) { return p == TRANSPARENT_PIXEL; });
}

encode_result write_failed(std::size_t count) {
    return encode_result::failure(encode_error::io_error,
        "Failed to write " + std::to_string(count) + " bytes to sink");
}

// ----------------------------------------------------------------------------
// Tile run state (original strategy)
// ----------------------------------------------------------------------------

// Entry being grown while tiles of the same nullity keep coming.
struct open_entry {
    bool active = false;
    entry_kind kind = entry_kind::filler;
    std::uint64_t start = 0;
    std::uint64_t pixels = 0;

    [[nodiscard]] assembly_entry close(std::uint32_t z_index) const {
        return kind == entry_kind::filler
            ? assembly_entry::filler(pixels, z_index)
            : assembly_entry::literal(start, pixels, z_index);
    }
};

enum class tile_step {
    extend,     // same nullity, grow the open entry
    reopen,     // nullity changed, close the open entry and start a new one
    invalid
};

tile_step next_step(const open_entry& entry, bool null_tile) noexcept {
    if (!entry.active) {
        return tile_step::reopen;
    }
    switch (entry.kind) {
        case entry_kind::filler:  return null_tile ? tile_step::extend : tile_step::reopen;
        case entry_kind::literal: return null_tile ? tile_step::reopen : tile_step::extend;
    }
    return tile_step::invalid;
}

} // namespace

encode_result run_assembler::compress(const compression_strategy& strategy,
                                      std::span<const std::uint8_t> pixels,
                                      byte_sink& sink,
                                      std::vector<assembly_entry>& table,
                                      const encode_options& options) {
    table.clear();

    auto result = validate_pixels(pixels);
    if (!result) return result;

    switch (strategy.method) {
        case compression_method::original:
            if (pixels.size() % PIXELS_PER_TILE != 0) {
                return encode_result::failure(encode_error::unaligned_tile_count,
                    "Original compression needs a multiple of 64 pixels, got " +
                    std::to_string(pixels.size()));
            }
            result = compress_original(pixels, sink, table, options.z_index);
            break;

        case compression_method::optimised:
            if (strategy.multiple_of_value == 0 || strategy.multiple_of_value % 2 != 0) {
                return encode_result::failure(encode_error::invalid_strategy,
                    "multiple_of_value must be a positive even number, got " +
                    std::to_string(strategy.multiple_of_value));
            }
            result = compress_optimised(pixels, strategy.multiple_of_value,
                                        strategy.min_transparent_to_compress,
                                        sink, table, options.z_index);
            break;

        case compression_method::none:
            result = compress_none(pixels, sink, table, options.z_index);
            break;

        default:
            return encode_result::failure(encode_error::invalid_strategy,
                "Unknown compression method");
    }

    if (!result) {
        table.clear();
    }
    return result;
}

encode_result run_assembler::compress_original(std::span<const std::uint8_t> pixels,
                                               byte_sink& sink,
                                               std::vector<assembly_entry>& table,
                                               std::uint32_t z_index) {
    open_entry entry;
    std::array<std::uint8_t, BYTES_PER_TILE> packed{};

    for (std::size_t offset = 0; offset < pixels.size(); offset += PIXELS_PER_TILE) {
        const auto tile = pixels.subspan(offset, PIXELS_PER_TILE);
        const bool null_tile = all_transparent(tile);

        const std::uint64_t tile_start = sink.position();
        if (!null_tile) {
            for (std::size_t i = 0; i < BYTES_PER_TILE; ++i) {
                packed[i] = pack_pair(tile[i * 2], tile[i * 2 + 1]);
            }
            if (!sink.write(packed)) {
                return write_failed(packed.size());
            }
        }

        switch (next_step(entry, null_tile)) {
            case tile_step::extend:
                entry.pixels += PIXELS_PER_TILE;
                break;

            case tile_step::reopen:
                if (entry.active) {
                    table.push_back(entry.close(z_index));
                }
                entry.active = true;
                entry.kind = null_tile ? entry_kind::filler : entry_kind::literal;
                entry.start = tile_start;
                entry.pixels = PIXELS_PER_TILE;
                break;

            case tile_step::invalid:
                return encode_result::failure(encode_error::internal_error,
                    "Tile run in an unknown state");
        }
    }

    if (entry.active) {
        table.push_back(entry.close(z_index));
    }

    return encode_result::success();
}

encode_result run_assembler::compress_optimised(std::span<const std::uint8_t> pixels,
                                                std::size_t multiple_of_value,
                                                std::size_t min_transparent_to_compress,
                                                byte_sink& sink,
                                                std::vector<assembly_entry>& table,
                                                std::uint32_t z_index) {
    const std::size_t count = pixels.size();
    std::vector<std::uint8_t> pending;

    // Literal bytes are buffered until a transparent run opens or input ends,
    // then written in one go at the sink position the entry records.
    auto flush_literal = [&]() -> encode_result {
        if (pending.empty()) {
            return encode_result::success();
        }
        const std::uint64_t start = sink.position();
        if (!sink.write(pending)) {
            return write_failed(pending.size());
        }
        table.push_back(assembly_entry::literal(start, pending.size() * 2, z_index));
        pending.clear();
        return encode_result::success();
    };

    std::size_t pos = 0;
    while (pos < count) {
        if (pos % multiple_of_value == 0 &&
            min_transparent_to_compress <= count - pos &&
            all_transparent(pixels.subspan(pos, min_transparent_to_compress))) {
            std::size_t end = pos + min_transparent_to_compress;
            while (end < count && pixels[end] == TRANSPARENT_PIXEL) {
                ++end;
            }
            // Keep later runs aligned; the tail goes back to the literal path
            end -= end % multiple_of_value;

            if (end > pos) {
                auto result = flush_literal();
                if (!result) return result;

                table.push_back(assembly_entry::filler(end - pos, z_index));
                pos = end;
                continue;
            }
        }

        pending.push_back(pack_pair(pixels[pos], pixels[pos + 1]));
        pos += 2;
    }

    return flush_literal();
}

encode_result run_assembler::compress_none(std::span<const std::uint8_t> pixels,
                                           byte_sink& sink,
                                           std::vector<assembly_entry>& table,
                                           std::uint32_t z_index) {
    if (pixels.empty()) {
        return encode_result::success();
    }

    std::vector<std::uint8_t> packed;
    auto result = pack_pixels(pixels, packed);
    if (!result) return result;

    const std::uint64_t start = sink.position();
    if (!sink.write(packed)) {
        return write_failed(packed.size());
    }
    table.push_back(assembly_entry::literal(start, pixels.size(), z_index));

    return encode_result::success();
}

} // namespace wan_codec
