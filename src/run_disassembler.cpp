#include <wan_codec/run_disassembler.hpp>
#include <wan_codec/nibble.hpp>

#include <new>
#include <string>

namespace wan_codec {

namespace {

constexpr std::uint64_t DEFAULT_MAX_PIXEL_COUNT = 16 * 1024 * 1024;

decode_result check_entry(const assembly_entry& entry, std::size_t index) {
    if (entry.pixel_count % 2 != 0 || entry.byte_count != entry.pixel_count / 2) {
        return decode_result::failure(decode_error::invalid_entry,
            "Entry " + std::to_string(index) + " has " + std::to_string(entry.pixel_count) +
            " pixels but " + std::to_string(entry.byte_count) + " bytes");
    }
    return decode_result::success();
}

} // namespace

decode_result run_disassembler::decompress(std::span<const assembly_entry> table,
                                           byte_source& source,
                                           std::uint64_t expected_pixel_count,
                                           std::vector<std::uint8_t>& pixels,
                                           const decode_options& options) {
    pixels.clear();

    const std::uint64_t max_pixels = options.max_pixel_count > 0
        ? options.max_pixel_count : DEFAULT_MAX_PIXEL_COUNT;
    if (expected_pixel_count > max_pixels) {
        return decode_result::failure(decode_error::limit_exceeded,
            "Expected pixel count exceeds limit: " + std::to_string(expected_pixel_count));
    }

    try {
        pixels.reserve(static_cast<std::size_t>(expected_pixel_count));
    } catch (const std::bad_alloc&) {
        return decode_result::failure(decode_error::limit_exceeded,
            "Failed to allocate pixel buffer");
    }

    std::vector<std::uint8_t> bytes;
    std::uint64_t produced = 0;

    for (std::size_t i = 0; i < table.size(); ++i) {
        const auto& entry = table[i];

        auto result = check_entry(entry, i);
        if (!result) {
            pixels.clear();
            return result;
        }

        // Stop before allocating anything a bad table claims
        if (entry.pixel_count > expected_pixel_count - produced) {
            pixels.clear();
            return decode_result::failure(decode_error::length_mismatch,
                "Assembly table expands past " + std::to_string(expected_pixel_count) +
                " pixels at entry " + std::to_string(i));
        }

        if (entry.is_filler()) {
            pixels.insert(pixels.end(), static_cast<std::size_t>(entry.pixel_count),
                          TRANSPARENT_PIXEL);
            produced += entry.pixel_count;
            continue;
        }

        if (entry.source_offset > source.size() ||
            entry.byte_count > source.size() - entry.source_offset) {
            pixels.clear();
            return decode_result::failure(decode_error::out_of_bounds,
                "Entry " + std::to_string(i) + " reads " + std::to_string(entry.byte_count) +
                " bytes at offset " + std::to_string(entry.source_offset) +
                " past end of source (" + std::to_string(source.size()) + " bytes)");
        }

        bytes.resize(static_cast<std::size_t>(entry.byte_count));
        if (!source.seek(entry.source_offset) || !source.read(bytes)) {
            pixels.clear();
            return decode_result::failure(decode_error::io_error,
                "Failed to read entry " + std::to_string(i) + " at offset " +
                std::to_string(entry.source_offset));
        }

        unpack_pixels(bytes, pixels);
        produced += entry.pixel_count;
    }

    if (produced != expected_pixel_count) {
        pixels.clear();
        return decode_result::failure(decode_error::length_mismatch,
            "Assembly table produced " + std::to_string(produced) + " pixels, expected " +
            std::to_string(expected_pixel_count));
    }

    return decode_result::success();
}

} // namespace wan_codec
