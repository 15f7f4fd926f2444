#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file byte_stream.h
 * \brief Seekable byte stream interface used by the segment reader/writer.
 */

namespace jpegseg {

/// Status code for \ref ByteStream operations.
enum class StreamStatus : uint8_t {
    Ok,
    OpenFailed,
    ReadFailed,
    WriteFailed,
    SeekFailed,
};

/// Returns a stable lowercase name for \p status.
const char*
stream_status_name(StreamStatus status) noexcept;

/**
 * \brief Byte-addressable stream with sequential read/write and absolute seek.
 *
 * Reading past the end is not an error: \ref read reports the number of bytes
 * actually transferred (0 at end of stream). A stream instance is owned by one
 * reader or writer at a time; nothing here is thread-safe.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /// Reads up to `out.size()` bytes; `*got` receives the count transferred.
    virtual StreamStatus read(std::span<std::byte> out, size_t* got) noexcept
        = 0;
    /// Writes all of \p bytes at the current position.
    virtual StreamStatus write(std::span<const std::byte> bytes) noexcept = 0;
    /// Reports the current absolute position.
    virtual StreamStatus tell(uint64_t* pos) noexcept = 0;
    /// Moves to absolute position \p pos.
    virtual StreamStatus seek(uint64_t pos) noexcept = 0;
};

/**
 * \brief Growable in-memory stream.
 *
 * Writes past the end extend the buffer (gaps created by seeking beyond the
 * end are zero-filled).
 */
class MemoryStream final : public ByteStream {
public:
    MemoryStream() noexcept = default;
    /// Creates a stream holding a copy of \p bytes, positioned at 0.
    explicit MemoryStream(std::span<const std::byte> bytes);
    explicit MemoryStream(std::vector<std::byte> bytes) noexcept;

    StreamStatus read(std::span<std::byte> out, size_t* got) noexcept override;
    StreamStatus write(std::span<const std::byte> bytes) noexcept override;
    StreamStatus tell(uint64_t* pos) noexcept override;
    StreamStatus seek(uint64_t pos) noexcept override;

    std::span<const std::byte> bytes() const noexcept { return bytes_; }
    uint64_t size() const noexcept { return bytes_.size(); }
    uint64_t position() const noexcept { return pos_; }

    /// Moves the contents out, leaving the stream empty.
    std::vector<std::byte> release() noexcept;

private:
    std::vector<std::byte> bytes_;
    uint64_t pos_ = 0;
};

}  // namespace jpegseg
