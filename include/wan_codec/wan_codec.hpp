#ifndef WAN_CODEC_WAN_CODEC_HPP_
#define WAN_CODEC_WAN_CODEC_HPP_

#include <wan_codec/wan_codec_export.h>
#include <wan_codec/types.hpp>
#include <wan_codec/byte_stream.hpp>
#include <wan_codec/nibble.hpp>
#include <wan_codec/tiles.hpp>
#include <wan_codec/fragment_resolution.hpp>
#include <wan_codec/run_assembler.hpp>
#include <wan_codec/run_disassembler.hpp>
#include <wan_codec/fragment_finder.hpp>

namespace wan_codec {

// All public API is included via the headers above.
// See:
//   - types.hpp:               assembly_entry, compression_strategy, fragment_flip,
//                              encode/decode results and options
//   - byte_stream.hpp:         byte_sink/byte_source and memory/stream implementations
//   - nibble.hpp:              4-bit pixel packing
//   - tiles.hpp:               indexed_image, tile order, padding, flips
//   - fragment_resolution.hpp: the twelve WAN fragment sizes
//   - run_assembler.hpp:       pixels -> bytes + assembly table
//   - run_disassembler.hpp:    assembly table + bytes -> pixels
//   - fragment_finder.hpp:     fragment_library deduplication search

} // namespace wan_codec

#endif // WAN_CODEC_WAN_CODEC_HPP_
