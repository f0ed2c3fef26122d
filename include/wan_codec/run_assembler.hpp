#ifndef WAN_CODEC_RUN_ASSEMBLER_HPP_
#define WAN_CODEC_RUN_ASSEMBLER_HPP_

#include <wan_codec/wan_codec_export.h>
#include <wan_codec/types.hpp>
#include <wan_codec/byte_stream.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace wan_codec {

// ============================================================================
// Run Assembler
// ============================================================================
//
// Turns a flat pixel buffer into nibble-packed bytes plus an assembly table.
// Transparent runs selected by the strategy become filler entries and are
// never written; everything else is packed two pixels per byte into literal
// entries whose source_offset is the sink position of their first byte.

class WAN_CODEC_EXPORT run_assembler {
public:
    /**
     * Encode pixels with the given strategy.
     *
     * On failure the table is left empty and the sink may hold a partial
     * write that the caller must discard.
     *
     * @param strategy Compression strategy
     * @param pixels Color indices 0-15, even length; a multiple of 64 in
     *               tile order for the original strategy
     * @param sink Destination for literal bytes
     * @param table Resulting assembly table (replaces contents)
     * @param options Encode options
     * @return Encode result with success/error status
     */
    [[nodiscard]] static encode_result compress(const compression_strategy& strategy,
                                                std::span<const std::uint8_t> pixels,
                                                byte_sink& sink,
                                                std::vector<assembly_entry>& table,
                                                const encode_options& options = {});

private:
    [[nodiscard]] static encode_result compress_original(std::span<const std::uint8_t> pixels,
                                                         byte_sink& sink,
                                                         std::vector<assembly_entry>& table,
                                                         std::uint32_t z_index);

    [[nodiscard]] static encode_result compress_optimised(std::span<const std::uint8_t> pixels,
                                                          std::size_t multiple_of_value,
                                                          std::size_t min_transparent_to_compress,
                                                          byte_sink& sink,
                                                          std::vector<assembly_entry>& table,
                                                          std::uint32_t z_index);

    [[nodiscard]] static encode_result compress_none(std::span<const std::uint8_t> pixels,
                                                     byte_sink& sink,
                                                     std::vector<assembly_entry>& table,
                                                     std::uint32_t z_index);
};

} // namespace wan_codec

#endif // WAN_CODEC_RUN_ASSEMBLER_HPP_
