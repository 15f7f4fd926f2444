#pragma once

#include "jpegseg/byte_stream.h"

#include <cstdint>
#include <cstdio>

/**
 * \file file_stream.h
 * \brief File-backed \ref ByteStream.
 */

namespace jpegseg {

/// Open mode for \ref FileStream.
enum class FileMode : uint8_t {
    /// Existing file, read-only.
    Read,
    /// Create or truncate; read/write so a written region can be patched.
    ReadWriteTruncate,
};

/**
 * \brief Buffered, seekable file stream (64-bit offsets).
 *
 * Owns the underlying handle; closing is idempotent and happens on
 * destruction. Write errors that only surface on flush are reported by
 * \ref close.
 */
class FileStream final : public ByteStream {
public:
    FileStream() noexcept;
    ~FileStream() noexcept override;

    FileStream(const FileStream&)            = delete;
    FileStream& operator=(const FileStream&) = delete;

    FileStream(FileStream&& other) noexcept;
    FileStream& operator=(FileStream&& other) noexcept;

    StreamStatus open(const char* path, FileMode mode) noexcept;

    /// Flushes and closes. Returns WriteFailed if buffered data was lost.
    StreamStatus close() noexcept;

    bool is_open() const noexcept;

    StreamStatus read(std::span<std::byte> out, size_t* got) noexcept override;
    StreamStatus write(std::span<const std::byte> bytes) noexcept override;
    StreamStatus tell(uint64_t* pos) noexcept override;
    StreamStatus seek(uint64_t pos) noexcept override;

private:
    std::FILE* file_ = nullptr;
    // stdio requires a positioning call between a write and a following read.
    bool last_was_write_ = false;
};

}  // namespace jpegseg
