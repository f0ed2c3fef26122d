#ifndef WAN_CODEC_RUN_DISASSEMBLER_HPP_
#define WAN_CODEC_RUN_DISASSEMBLER_HPP_

#include <wan_codec/wan_codec_export.h>
#include <wan_codec/types.hpp>
#include <wan_codec/byte_stream.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace wan_codec {

// ============================================================================
// Run Disassembler
// ============================================================================

class WAN_CODEC_EXPORT run_disassembler {
public:
    /**
     * Replay an assembly table into a flat pixel buffer.
     * Filler entries expand to transparent pixels without touching the
     * source; literal entries are read from source_offset and unpacked
     * high nibble first. The result does not depend on the strategy that
     * produced the table.
     *
     * @param table Assembly table, in order
     * @param source Bytes the table's literal offsets point into
     * @param expected_pixel_count Length the replay must produce
     * @param pixels Decoded pixels (replaces contents)
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decompress(std::span<const assembly_entry> table,
                                                  byte_source& source,
                                                  std::uint64_t expected_pixel_count,
                                                  std::vector<std::uint8_t>& pixels,
                                                  const decode_options& options = {});
};

} // namespace wan_codec

#endif // WAN_CODEC_RUN_DISASSEMBLER_HPP_
