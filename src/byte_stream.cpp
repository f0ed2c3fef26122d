#include <wan_codec/byte_stream.hpp>

#include <cstring>
#include <limits>
#include <new>

namespace wan_codec {

// ============================================================================
// Memory Sink / Source
// ============================================================================

bool memory_sink::write(std::span<const std::uint8_t> bytes) {
    try {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    } catch (const std::bad_alloc&) {
        return false;
    }
    return true;
}

bool memory_source::seek(std::uint64_t offset) {
    if (offset > data_.size()) {
        return false;
    }
    pos_ = static_cast<std::size_t>(offset);
    return true;
}

bool memory_source::read(std::span<std::uint8_t> out) {
    if (out.size() > data_.size() - pos_) {
        return false;
    }
    if (!out.empty()) {
        std::memcpy(out.data(), data_.data() + pos_, out.size());
    }
    pos_ += out.size();
    return true;
}

// ============================================================================
// Stream Sink / Source
// ============================================================================

stream_sink::stream_sink(std::ostream& stream)
    : stream_(stream) {
    const auto pos = stream_.tellp();
    position_ = pos < 0 ? 0 : static_cast<std::uint64_t>(pos);
}

bool stream_sink::write(std::span<const std::uint8_t> bytes) {
    if (!stream_) {
        return false;
    }
    stream_.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    if (!stream_) {
        return false;
    }
    position_ += bytes.size();
    return true;
}

stream_source::stream_source(std::istream& stream)
    : stream_(stream) {
    const auto start = stream_.tellg();
    stream_.seekg(0, std::ios::end);
    const auto end = stream_.tellg();
    if (end >= 0) {
        size_ = static_cast<std::uint64_t>(end);
    }
    if (start >= 0) {
        stream_.seekg(start);
    }
}

bool stream_source::seek(std::uint64_t offset) {
    if (offset > size_ ||
        offset > static_cast<std::uint64_t>(std::numeric_limits<std::streamoff>::max())) {
        return false;
    }
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    return static_cast<bool>(stream_);
}

bool stream_source::read(std::span<std::uint8_t> out) {
    if (out.empty()) {
        return true;
    }
    stream_.read(reinterpret_cast<char*>(out.data()),
                 static_cast<std::streamsize>(out.size()));
    return stream_.gcount() == static_cast<std::streamsize>(out.size());
}

} // namespace wan_codec
