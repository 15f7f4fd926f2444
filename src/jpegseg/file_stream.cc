#include "jpegseg/file_stream.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <utility>

#if !defined(_WIN32)
#    include <sys/types.h>
#endif

namespace jpegseg {
namespace {

    static bool file_seek(std::FILE* f, uint64_t pos) noexcept
    {
#if defined(_WIN32)
        if (pos > static_cast<uint64_t>(std::numeric_limits<__int64>::max())) {
            return false;
        }
        return ::_fseeki64(f, static_cast<__int64>(pos), SEEK_SET) == 0;
#else
        if (pos > static_cast<uint64_t>(std::numeric_limits<off_t>::max())) {
            return false;
        }
        return ::fseeko(f, static_cast<off_t>(pos), SEEK_SET) == 0;
#endif
    }


    static bool file_tell(std::FILE* f, uint64_t* out) noexcept
    {
#if defined(_WIN32)
        const __int64 p = ::_ftelli64(f);
#else
        const off_t p = ::ftello(f);
#endif
        if (p < 0) {
            return false;
        }
        *out = static_cast<uint64_t>(p);
        return true;
    }

}  // namespace

FileStream::FileStream() noexcept = default;


FileStream::~FileStream() noexcept
{
    (void)close();
}


FileStream::FileStream(FileStream&& other) noexcept
{
    *this = std::move(other);
}


FileStream&
FileStream::operator=(FileStream&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    (void)close();

    file_                 = other.file_;
    last_was_write_       = other.last_was_write_;
    other.file_           = nullptr;
    other.last_was_write_ = false;
    return *this;
}


StreamStatus
FileStream::open(const char* path, FileMode mode) noexcept
{
    (void)close();

    if (!path || !*path) {
        return StreamStatus::OpenFailed;
    }

    const char* fmode = (mode == FileMode::Read) ? "rb" : "w+b";
    std::FILE* f      = std::fopen(path, fmode);
    if (!f) {
        return StreamStatus::OpenFailed;
    }

    file_           = f;
    last_was_write_ = false;
    return StreamStatus::Ok;
}


StreamStatus
FileStream::close() noexcept
{
    if (!file_) {
        return StreamStatus::Ok;
    }
    const int rc    = std::fclose(file_);
    file_           = nullptr;
    last_was_write_ = false;
    return rc == 0 ? StreamStatus::Ok : StreamStatus::WriteFailed;
}


bool
FileStream::is_open() const noexcept
{
    return file_ != nullptr;
}


StreamStatus
FileStream::read(std::span<std::byte> out, size_t* got) noexcept
{
    if (!got) {
        return StreamStatus::ReadFailed;
    }
    *got = 0;
    if (!file_) {
        return StreamStatus::ReadFailed;
    }
    if (last_was_write_) {
        if (std::fflush(file_) != 0) {
            return StreamStatus::WriteFailed;
        }
        last_was_write_ = false;
    }
    if (out.empty()) {
        return StreamStatus::Ok;
    }
    const size_t n = std::fread(out.data(), 1, out.size(), file_);
    if (n < out.size() && std::ferror(file_) != 0) {
        std::clearerr(file_);
        return StreamStatus::ReadFailed;
    }
    *got = n;
    return StreamStatus::Ok;
}


StreamStatus
FileStream::write(std::span<const std::byte> bytes) noexcept
{
    if (!file_) {
        return StreamStatus::WriteFailed;
    }
    if (bytes.empty()) {
        return StreamStatus::Ok;
    }
    if (!last_was_write_) {
        // Switching from reading to writing needs a positioning call.
        uint64_t pos = 0;
        if (!file_tell(file_, &pos) || !file_seek(file_, pos)) {
            return StreamStatus::SeekFailed;
        }
        last_was_write_ = true;
    }
    const size_t n = std::fwrite(bytes.data(), 1, bytes.size(), file_);
    if (n != bytes.size()) {
        return StreamStatus::WriteFailed;
    }
    return StreamStatus::Ok;
}


StreamStatus
FileStream::tell(uint64_t* pos) noexcept
{
    if (!file_ || !pos) {
        return StreamStatus::SeekFailed;
    }
    return file_tell(file_, pos) ? StreamStatus::Ok : StreamStatus::SeekFailed;
}


StreamStatus
FileStream::seek(uint64_t pos) noexcept
{
    if (!file_) {
        return StreamStatus::SeekFailed;
    }
    if (!file_seek(file_, pos)) {
        return StreamStatus::SeekFailed;
    }
    last_was_write_ = false;
    return StreamStatus::Ok;
}

}  // namespace jpegseg
