#ifndef WAN_CODEC_BYTE_STREAM_HPP_
#define WAN_CODEC_BYTE_STREAM_HPP_

#include <wan_codec/wan_codec_export.h>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <span>
#include <utility>
#include <vector>

namespace wan_codec {

// ============================================================================
// Sink Interface
// ============================================================================

/**
 * Append-only destination for encoded pixel bytes.
 * The assembler only appends and queries the position; it never rewinds.
 *
 * Implement this interface to write straight into an archive being built
 * by the container layer.
 */
class WAN_CODEC_EXPORT byte_sink {
public:
    virtual ~byte_sink() = default;

    /**
     * Offset the next written byte will land at.
     */
    [[nodiscard]] virtual std::uint64_t position() const noexcept = 0;

    /**
     * Append bytes at the current position.
     * @param bytes Data to append
     * @return true on success
     */
    [[nodiscard]] virtual bool write(std::span<const std::uint8_t> bytes) = 0;
};

// ============================================================================
// Source Interface
// ============================================================================

/**
 * Seekable origin of encoded pixel bytes.
 */
class WAN_CODEC_EXPORT byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * Total number of readable bytes.
     */
    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;

    /**
     * Move the read position.
     * @param offset Absolute offset, must not exceed size()
     * @return true on success
     */
    [[nodiscard]] virtual bool seek(std::uint64_t offset) = 0;

    /**
     * Read exactly out.size() bytes from the current position.
     * @return true if every byte was read
     */
    [[nodiscard]] virtual bool read(std::span<std::uint8_t> out) = 0;
};

// ============================================================================
// Memory Sink / Source (default implementations)
// ============================================================================

/**
 * Sink that collects bytes in a vector.
 * base_offset models bytes already present before the sink in the final
 * archive (a header, earlier images); positions are reported relative to
 * the start of the archive.
 */
class WAN_CODEC_EXPORT memory_sink : public byte_sink {
public:
    memory_sink() = default;
    explicit memory_sink(std::uint64_t base_offset) : base_offset_(base_offset) {}
    ~memory_sink() override = default;

    memory_sink(const memory_sink&) = delete;
    memory_sink& operator=(const memory_sink&) = delete;
    memory_sink(memory_sink&&) noexcept = default;
    memory_sink& operator=(memory_sink&&) noexcept = default;

    [[nodiscard]] std::uint64_t position() const noexcept override {
        return base_offset_ + data_.size();
    }
    [[nodiscard]] bool write(std::span<const std::uint8_t> bytes) override;

    [[nodiscard]] std::uint64_t base_offset() const noexcept { return base_offset_; }
    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return data_; }
    [[nodiscard]] std::vector<std::uint8_t> release() noexcept { return std::move(data_); }

private:
    std::vector<std::uint8_t> data_;
    std::uint64_t base_offset_ = 0;
};

/**
 * Source over a caller-owned byte range.
 * The range must outlive the source.
 */
class WAN_CODEC_EXPORT memory_source : public byte_source {
public:
    explicit memory_source(std::span<const std::uint8_t> data) noexcept : data_(data) {}
    ~memory_source() override = default;

    [[nodiscard]] std::uint64_t size() const noexcept override { return data_.size(); }
    [[nodiscard]] bool seek(std::uint64_t offset) override;
    [[nodiscard]] bool read(std::span<std::uint8_t> out) override;

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

// ============================================================================
// Stream Sink / Source
// ============================================================================

/**
 * Sink over a caller-owned output stream (typically a std::ofstream opened
 * in binary mode). Positions are stream positions.
 */
class WAN_CODEC_EXPORT stream_sink : public byte_sink {
public:
    explicit stream_sink(std::ostream& stream);
    ~stream_sink() override = default;

    stream_sink(const stream_sink&) = delete;
    stream_sink& operator=(const stream_sink&) = delete;

    [[nodiscard]] std::uint64_t position() const noexcept override { return position_; }
    [[nodiscard]] bool write(std::span<const std::uint8_t> bytes) override;

private:
    std::ostream& stream_;
    std::uint64_t position_ = 0;
};

/**
 * Source over a caller-owned input stream (typically a std::ifstream opened
 * in binary mode).
 */
class WAN_CODEC_EXPORT stream_source : public byte_source {
public:
    explicit stream_source(std::istream& stream);
    ~stream_source() override = default;

    stream_source(const stream_source&) = delete;
    stream_source& operator=(const stream_source&) = delete;

    [[nodiscard]] std::uint64_t size() const noexcept override { return size_; }
    [[nodiscard]] bool seek(std::uint64_t offset) override;
    [[nodiscard]] bool read(std::span<std::uint8_t> out) override;

private:
    std::istream& stream_;
    std::uint64_t size_ = 0;
};

} // namespace wan_codec

#endif // WAN_CODEC_BYTE_STREAM_HPP_
