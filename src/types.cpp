#include <wan_codec/types.hpp>

namespace wan_codec {

const char* to_string(compression_method method) noexcept {
    switch (method) {
        case compression_method::original:  return "original";
        case compression_method::optimised: return "optimised";
        case compression_method::none:      return "none";
    }
    return "unknown";
}

std::string to_string(const compression_strategy& strategy) {
    std::string result = to_string(strategy.method);
    if (strategy.method == compression_method::optimised) {
        result += "(" + std::to_string(strategy.multiple_of_value) + "," +
                  std::to_string(strategy.min_transparent_to_compress) + ")";
    }
    return result;
}

bool parse_strategy(std::string_view name,
                    compression_strategy& strategy,
                    std::size_t multiple_of_value,
                    std::size_t min_transparent_to_compress) {
    if (name == "original") {
        strategy = compression_strategy::original();
    } else if (name == "optimised" || name == "optimized") {
        strategy = compression_strategy::optimised(multiple_of_value, min_transparent_to_compress);
    } else if (name == "none") {
        strategy = compression_strategy::none();
    } else {
        return false;
    }
    return true;
}

const char* to_string(fragment_flip flip) noexcept {
    switch (flip) {
        case fragment_flip::none:       return "none";
        case fragment_flip::horizontal: return "horizontal";
        case fragment_flip::vertical:   return "vertical";
        case fragment_flip::both:       return "both";
    }
    return "unknown";
}

const char* to_string(encode_error err) noexcept {
    switch (err) {
        case encode_error::none:                 return "none";
        case encode_error::odd_pixel_count:      return "odd_pixel_count";
        case encode_error::unaligned_tile_count: return "unaligned_tile_count";
        case encode_error::invalid_pixel_value:  return "invalid_pixel_value";
        case encode_error::invalid_strategy:     return "invalid_strategy";
        case encode_error::invalid_dimensions:   return "invalid_dimensions";
        case encode_error::io_error:             return "io_error";
        case encode_error::internal_error:       return "internal_error";
    }
    return "unknown";
}

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:            return "none";
        case decode_error::invalid_entry:   return "invalid_entry";
        case decode_error::out_of_bounds:   return "out_of_bounds";
        case decode_error::length_mismatch: return "length_mismatch";
        case decode_error::limit_exceeded:  return "limit_exceeded";
        case decode_error::io_error:        return "io_error";
    }
    return "unknown";
}

} // namespace wan_codec
