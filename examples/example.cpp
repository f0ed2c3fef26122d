#include <wan_codec/wan_codec.hpp>
#include <lodepng.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <indexed_png> [output_png]\n";
    std::cerr << "Encodes a 16-color indexed PNG as WAN fragment data and decodes it back.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -s, --strategy <name>   original, optimised or none (default: original)\n";
    std::cerr << "  -m, --multiple <n>      optimised: run alignment (default: 16)\n";
    std::cerr << "  -t, --transparent <n>   optimised: minimum run to compress (default: 32)\n";
    std::cerr << "  -h, --help              Show this help\n";
}

bool parse_size(const char* text, std::size_t& value) {
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(text, &end, 10);
    if (end == text || *end != '\0') {
        return false;
    }
    value = static_cast<std::size_t>(parsed);
    return true;
}

// Load a palette PNG as 4-bit indices, keeping its palette for re-encoding
bool load_indexed_png(const std::filesystem::path& path,
                      wan_codec::indexed_image& image,
                      std::vector<std::uint8_t>& palette_rgba) {
    std::vector<unsigned char> file_data;
    unsigned error = lodepng::load_file(file_data, path.string());
    if (error) {
        std::cerr << "Error: Failed to read file: " << path << ": " << lodepng_error_text(error) << "\n";
        return false;
    }

    lodepng::State state;
    state.info_raw.colortype = LCT_PALETTE;
    state.info_raw.bitdepth = 8;

    unsigned width = 0;
    unsigned height = 0;
    std::vector<unsigned char> indices;
    error = lodepng::decode(indices, width, height, state, file_data);
    if (error) {
        std::cerr << "Error: Not an indexed PNG: " << path << ": " << lodepng_error_text(error) << "\n";
        return false;
    }

    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (indices[i] > wan_codec::MAX_PIXEL_VALUE) {
            std::cerr << "Error: Pixel " << i << " uses palette index "
                      << static_cast<int>(indices[i]) << ", only 16 colors are supported\n";
            return false;
        }
    }

    const auto& color = state.info_png.color;
    palette_rgba.assign(color.palette, color.palette + color.palettesize * 4);

    image.width = static_cast<int>(width);
    image.height = static_cast<int>(height);
    image.pixels.assign(indices.begin(), indices.end());
    return true;
}

bool save_indexed_png(const std::filesystem::path& path,
                      const wan_codec::indexed_image& image,
                      const std::vector<std::uint8_t>& palette_rgba) {
    lodepng::State state;
    state.info_raw.colortype = LCT_PALETTE;
    state.info_raw.bitdepth = 8;
    state.info_png.color.colortype = LCT_PALETTE;
    state.info_png.color.bitdepth = 4;
    state.encoder.auto_convert = 0;

    // 4-bit output holds at most 16 palette entries
    const std::size_t palette_bytes = std::min<std::size_t>(palette_rgba.size(), 16 * 4);
    for (std::size_t i = 0; i + 3 < palette_bytes; i += 4) {
        lodepng_palette_add(&state.info_raw, palette_rgba[i], palette_rgba[i + 1],
                            palette_rgba[i + 2], palette_rgba[i + 3]);
        lodepng_palette_add(&state.info_png.color, palette_rgba[i], palette_rgba[i + 1],
                            palette_rgba[i + 2], palette_rgba[i + 3]);
    }

    std::vector<unsigned char> png_data;
    unsigned error = lodepng::encode(png_data, image.pixels,
                                     static_cast<unsigned>(image.width),
                                     static_cast<unsigned>(image.height), state);
    if (error) {
        std::cerr << "Error: PNG encode failed: " << lodepng_error_text(error) << "\n";
        return false;
    }

    error = lodepng::save_file(png_data, path.string());
    if (error) {
        std::cerr << "Error: Failed to save: " << path << ": " << lodepng_error_text(error) << "\n";
        return false;
    }
    return true;
}

void print_table(const std::vector<wan_codec::assembly_entry>& table) {
    std::cout << "Assembly table (" << table.size() << " entries):\n";
    for (const auto& entry : table) {
        if (entry.is_filler()) {
            std::cout << "  filler              pixels=" << entry.pixel_count
                      << " bytes=" << entry.byte_count << "\n";
        } else {
            std::cout << "  literal @" << entry.source_offset
                      << " pixels=" << entry.pixel_count
                      << " bytes=" << entry.byte_count << "\n";
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string strategy_name = "original";
    std::size_t multiple_of_value = 16;
    std::size_t min_transparent = 32;
    std::vector<const char*> positional;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if ((std::strcmp(arg, "-s") == 0 || std::strcmp(arg, "--strategy") == 0) && has_value) {
            strategy_name = argv[++i];
        } else if ((std::strcmp(arg, "-m") == 0 || std::strcmp(arg, "--multiple") == 0) && has_value) {
            if (!parse_size(argv[++i], multiple_of_value)) {
                std::cerr << "Error: Invalid number: " << argv[i] << "\n";
                return 1;
            }
        } else if ((std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--transparent") == 0) && has_value) {
            if (!parse_size(argv[++i], min_transparent)) {
                std::cerr << "Error: Invalid number: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    wan_codec::compression_strategy strategy;
    if (!wan_codec::parse_strategy(strategy_name, strategy, multiple_of_value, min_transparent)) {
        std::cerr << "Error: Unknown strategy: " << strategy_name << "\n";
        return 1;
    }

    const std::filesystem::path input_path(positional[0]);
    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    wan_codec::indexed_image image;
    std::vector<std::uint8_t> palette;
    if (!load_indexed_png(input_path, image, palette)) {
        return 1;
    }
    std::cout << "Loaded: " << image.width << "x" << image.height << "\n";

    // Fragments are stored as whole 8x8 tiles in tile order
    wan_codec::indexed_image padded;
    std::vector<std::uint8_t> tiled;
    auto prepared = wan_codec::pad_to_tile(image, padded);
    if (prepared) {
        prepared = wan_codec::to_tile_order(padded, tiled);
    }
    if (!prepared) {
        std::cerr << "Error: " << prepared.message << "\n";
        return 1;
    }

    wan_codec::memory_sink sink;
    std::vector<wan_codec::assembly_entry> table;
    const auto encoded = wan_codec::run_assembler::compress(strategy, tiled, sink, table);
    if (!encoded) {
        std::cerr << "Error: Failed to encode (" << wan_codec::to_string(encoded.error)
                  << "): " << encoded.message << "\n";
        return 1;
    }

    std::cout << "Strategy: " << wan_codec::to_string(strategy) << "\n";
    std::cout << "Encoded: " << tiled.size() << " pixels into " << sink.data().size() << " bytes\n";
    print_table(table);

    wan_codec::memory_source source(sink.data());
    std::vector<std::uint8_t> decoded;
    const auto replayed = wan_codec::run_disassembler::decompress(table, source, tiled.size(), decoded);
    if (!replayed) {
        std::cerr << "Error: Failed to decode (" << wan_codec::to_string(replayed.error)
                  << "): " << replayed.message << "\n";
        return 1;
    }

    if (decoded != tiled) {
        std::cerr << "Error: Round trip mismatch\n";
        return 1;
    }
    std::cout << "Round trip: ok\n";

    // A mirrored copy of a registered fragment is found instead of re-encoded
    wan_codec::fragment_library library;
    wan_codec::indexed_image mirrored;
    std::optional<wan_codec::fragment_match> match;
    auto searched = library.add({0}, padded);
    if (searched) {
        searched = wan_codec::flip_image(padded, wan_codec::fragment_flip::horizontal, mirrored);
    }
    if (searched) {
        searched = library.find_matching_fragment(mirrored, match);
    }
    if (!searched) {
        std::cerr << "Error: " << searched.message << "\n";
        return 1;
    }
    if (match) {
        std::cout << "Mirrored copy matches fragment " << match->reference.image_index
                  << " with flip " << wan_codec::to_string(match->flip) << "\n";
    } else {
        std::cout << "Mirrored copy needs its own fragment\n";
    }

    if (positional.size() >= 2) {
        wan_codec::indexed_image restored;
        const auto untiled = wan_codec::from_tile_order(decoded, padded.width, padded.height, restored);
        if (!untiled) {
            std::cerr << "Error: " << untiled.message << "\n";
            return 1;
        }

        const std::filesystem::path output_path(positional[1]);
        if (!save_indexed_png(output_path, restored, palette)) {
            return 1;
        }
        std::cout << "Saved: " << output_path << "\n";
    }

    return 0;
}
