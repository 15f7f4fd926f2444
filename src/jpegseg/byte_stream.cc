#include "jpegseg/byte_stream.h"

#include <cstring>
#include <limits>
#include <utility>

namespace jpegseg {

const char*
stream_status_name(StreamStatus status) noexcept
{
    switch (status) {
    case StreamStatus::Ok: return "ok";
    case StreamStatus::OpenFailed: return "open_failed";
    case StreamStatus::ReadFailed: return "read_failed";
    case StreamStatus::WriteFailed: return "write_failed";
    case StreamStatus::SeekFailed: return "seek_failed";
    }
    return "unknown";
}


MemoryStream::MemoryStream(std::span<const std::byte> bytes)
    : bytes_(bytes.begin(), bytes.end())
{
}


MemoryStream::MemoryStream(std::vector<std::byte> bytes) noexcept
    : bytes_(std::move(bytes))
{
}


StreamStatus
MemoryStream::read(std::span<std::byte> out, size_t* got) noexcept
{
    if (!got) {
        return StreamStatus::ReadFailed;
    }
    *got = 0;
    if (pos_ >= bytes_.size() || out.empty()) {
        return StreamStatus::Ok;
    }
    const uint64_t avail = static_cast<uint64_t>(bytes_.size()) - pos_;
    const size_t n       = avail < out.size() ? static_cast<size_t>(avail)
                                              : out.size();
    std::memcpy(out.data(), bytes_.data() + static_cast<size_t>(pos_), n);
    pos_ += n;
    *got = n;
    return StreamStatus::Ok;
}


StreamStatus
MemoryStream::write(std::span<const std::byte> bytes) noexcept
{
    if (bytes.empty()) {
        return StreamStatus::Ok;
    }
    const uint64_t end = pos_ + bytes.size();
    if (end < pos_ || end > static_cast<uint64_t>(bytes_.max_size())) {
        return StreamStatus::WriteFailed;
    }
    if (end > bytes_.size()) {
        bytes_.resize(static_cast<size_t>(end));
    }
    std::memcpy(bytes_.data() + static_cast<size_t>(pos_), bytes.data(),
                bytes.size());
    pos_ = end;
    return StreamStatus::Ok;
}


StreamStatus
MemoryStream::tell(uint64_t* pos) noexcept
{
    if (!pos) {
        return StreamStatus::SeekFailed;
    }
    *pos = pos_;
    return StreamStatus::Ok;
}


StreamStatus
MemoryStream::seek(uint64_t pos) noexcept
{
    if (pos > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
        return StreamStatus::SeekFailed;
    }
    pos_ = pos;
    return StreamStatus::Ok;
}


std::vector<std::byte>
MemoryStream::release() noexcept
{
    std::vector<std::byte> out = std::move(bytes_);
    bytes_.clear();
    pos_ = 0;
    return out;
}

}  // namespace jpegseg
