#include "jpegseg/jpeg_segment_io.h"

#include "jpegseg/jpeg_markers.h"

#include <cstring>
#include <limits>

namespace jpegseg {
namespace {

    static constexpr uint32_t kDefaultReadBlockBytes = 16U * 1024U;

    static constexpr std::byte kStuffByte { 0x00 };

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static JpegStatus write_bytes(ByteStream& out,
                                  std::span<const std::byte> bytes) noexcept
    {
        const StreamStatus st = out.write(bytes);
        if (st != StreamStatus::Ok) {
            return jpeg_status_from_stream(st);
        }
        return JpegStatus::Ok;
    }


    // Reads exactly `out.size()` bytes; a short read is Truncated.
    static JpegStatus read_exact(ByteStream& in,
                                 std::span<std::byte> out) noexcept
    {
        size_t done = 0;
        while (done < out.size()) {
            size_t got            = 0;
            const StreamStatus st = in.read(out.subspan(done), &got);
            if (st != StreamStatus::Ok) {
                return jpeg_status_from_stream(st);
            }
            if (got == 0) {
                return JpegStatus::Truncated;
            }
            done += got;
        }
        return JpegStatus::Ok;
    }


    static JpegStatus read_byte(ByteStream& in, uint8_t* out) noexcept
    {
        std::byte b {};
        const JpegStatus st = read_exact(in, std::span<std::byte>(&b, 1));
        if (st != JpegStatus::Ok) {
            return st;
        }
        *out = u8(b);
        return JpegStatus::Ok;
    }


    static JpegStatus seek_to(ByteStream& in, uint64_t pos) noexcept
    {
        const StreamStatus st = in.seek(pos);
        if (st != StreamStatus::Ok) {
            return jpeg_status_from_stream(st);
        }
        return JpegStatus::Ok;
    }

}  // namespace

const char*
jpeg_status_name(JpegStatus status) noexcept
{
    switch (status) {
    case JpegStatus::Ok: return "ok";
    case JpegStatus::ReadFailed: return "read_failed";
    case JpegStatus::WriteFailed: return "write_failed";
    case JpegStatus::SeekFailed: return "seek_failed";
    case JpegStatus::MissingStartMarker: return "missing_start_marker";
    case JpegStatus::ExpectedMarkerPrefix: return "expected_marker_prefix";
    case JpegStatus::InvalidMarkerZero: return "invalid_marker_zero";
    case JpegStatus::Truncated: return "truncated";
    case JpegStatus::InvalidLength: return "invalid_length";
    case JpegStatus::SegmentTooLarge: return "segment_too_large";
    case JpegStatus::PastEndOfImage: return "past_end_of_image";
    case JpegStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


JpegStatus
jpeg_status_from_stream(StreamStatus status) noexcept
{
    switch (status) {
    case StreamStatus::Ok: return JpegStatus::Ok;
    case StreamStatus::OpenFailed:
    case StreamStatus::ReadFailed: return JpegStatus::ReadFailed;
    case StreamStatus::WriteFailed: return JpegStatus::WriteFailed;
    case StreamStatus::SeekFailed: return JpegStatus::SeekFailed;
    }
    return JpegStatus::ReadFailed;
}


bool
is_jpeg_header(std::span<const std::byte> bytes) noexcept
{
    return bytes.size() >= kJpegHeaderSize && u8(bytes[0]) == 0xFF
           && u8(bytes[1]) == kMarkerSoi;
}


JpegStatus
read_header(ByteStream& in) noexcept
{
    std::byte hdr[kJpegHeaderSize] = {};
    const JpegStatus st = read_exact(in, std::span<std::byte>(hdr));
    if (st != JpegStatus::Ok) {
        return st;
    }
    if (!is_jpeg_header(std::span<const std::byte>(hdr))) {
        return JpegStatus::MissingStartMarker;
    }
    return JpegStatus::Ok;
}


JpegStatus
write_header(ByteStream& out) noexcept
{
    return write_marker(out, kMarkerSoi);
}


JpegStatus
read_marker(ByteStream& in, uint8_t* marker) noexcept
{
    if (!marker) {
        return JpegStatus::ReadFailed;
    }
    uint8_t b     = 0;
    JpegStatus st = read_byte(in, &b);
    if (st != JpegStatus::Ok) {
        return st;
    }
    if (b != 0xFF) {
        return JpegStatus::ExpectedMarkerPrefix;
    }
    do {
        st = read_byte(in, &b);
        if (st != JpegStatus::Ok) {
            return st;
        }
    } while (b == 0xFF);
    if (b == 0x00) {
        return JpegStatus::InvalidMarkerZero;
    }
    *marker = b;
    return JpegStatus::Ok;
}


JpegStatus
write_marker(ByteStream& out, uint8_t marker) noexcept
{
    const std::byte buf[2] = { std::byte { 0xFF }, std::byte { marker } };
    return write_bytes(out, std::span<const std::byte>(buf));
}


JpegStatus
read_data(ByteStream& in, std::vector<std::byte>* buf) noexcept
{
    if (!buf) {
        return JpegStatus::ReadFailed;
    }
    buf->clear();

    std::byte len_buf[2] = {};
    const JpegStatus st  = read_exact(in, std::span<std::byte>(len_buf));
    if (st != JpegStatus::Ok) {
        return st;
    }
    const uint32_t seg_len = (static_cast<uint32_t>(u8(len_buf[0])) << 8)
                             | static_cast<uint32_t>(u8(len_buf[1]));
    if (seg_len < 2) {
        return JpegStatus::InvalidLength;
    }
    buf->resize(seg_len - 2);
    return read_exact(in, std::span<std::byte>(buf->data(), buf->size()));
}


JpegStatus
write_data(ByteStream& out, std::span<const std::byte> payload) noexcept
{
    if (payload.size() > kMaxSegmentPayloadBytes) {
        return JpegStatus::SegmentTooLarge;
    }
    const uint32_t seg_len    = static_cast<uint32_t>(payload.size()) + 2U;
    const std::byte len_buf[2] = {
        std::byte { static_cast<uint8_t>((seg_len >> 8) & 0xFF) },
        std::byte { static_cast<uint8_t>((seg_len >> 0) & 0xFF) },
    };
    const JpegStatus st = write_bytes(out, std::span<const std::byte>(len_buf));
    if (st != JpegStatus::Ok) {
        return st;
    }
    return write_bytes(out, payload);
}


JpegStatus
read_image_data(ByteStream& in, std::vector<std::byte>* buf,
                const JpegScanLimits& limits) noexcept
{
    if (!buf) {
        return JpegStatus::ReadFailed;
    }
    buf->clear();

    uint64_t start        = 0;
    const StreamStatus ts = in.tell(&start);
    if (ts != StreamStatus::Ok) {
        return jpeg_status_from_stream(ts);
    }

    const size_t block = limits.read_block_bytes != 0U
                             ? static_cast<size_t>(limits.read_block_bytes)
                             : static_cast<size_t>(kDefaultReadBlockBytes);

    // `kept` unstuffed bytes sit at the front of `buf`; each block is read in
    // right behind them and compacted in place.
    size_t kept       = 0;
    uint64_t consumed = 0;
    bool pending_ff   = false;  // Previous block ended on 0xFF.
    for (;;) {
        if (static_cast<uint64_t>(kept) > limits.max_scan_data_bytes
            || kept > buf->max_size() - block) {
            buf->clear();
            return JpegStatus::LimitExceeded;
        }
        buf->resize(kept + block);
        std::byte* base = buf->data();

        size_t got            = 0;
        const StreamStatus rs = in.read(std::span<std::byte>(base + kept,
                                                             block),
                                        &got);
        if (rs != StreamStatus::Ok) {
            buf->resize(kept);
            return jpeg_status_from_stream(rs);
        }
        if (got == 0) {
            buf->resize(kept);
            return JpegStatus::Truncated;
        }

        const uint64_t block_raw = consumed;
        consumed += got;

        const size_t end = kept + got;
        size_t r         = kept;
        size_t w         = kept;

        if (pending_ff) {
            pending_ff = false;
            if (u8(base[r]) == 0x00) {
                r += 1;
            } else {
                // The 0xFF closing the previous block starts the marker.
                buf->resize(w - 1);
                return seek_to(in, start + block_raw - 1);
            }
        }

        while (r < end) {
            const void* hit = std::memchr(base + r, 0xFF, end - r);
            const size_t ff_pos
                = hit ? static_cast<size_t>(static_cast<const std::byte*>(hit)
                                            - base)
                      : end;
            const size_t run = (hit ? ff_pos + 1 : end) - r;
            if (w != r) {
                std::memmove(base + w, base + r, run);
            }
            w += run;
            r += run;
            if (!hit) {
                break;
            }
            if (r == end) {
                pending_ff = true;
                break;
            }
            if (u8(base[r]) == 0x00) {
                r += 1;
                continue;
            }

            // 0xFF followed by a non-zero byte: a real marker.
            const uint64_t ff_raw = block_raw
                                    + static_cast<uint64_t>(ff_pos - kept);
            buf->resize(w - 1);
            if (static_cast<uint64_t>(buf->size())
                > limits.max_scan_data_bytes) {
                buf->clear();
                return JpegStatus::LimitExceeded;
            }
            return seek_to(in, start + ff_raw);
        }
        kept = w;
    }
}


JpegStatus
write_image_data(ByteStream& out, std::span<const std::byte> data) noexcept
{
    size_t pos = 0;
    while (pos < data.size()) {
        const void* hit = std::memchr(data.data() + pos, 0xFF,
                                      data.size() - pos);
        if (!hit) {
            return write_bytes(out, data.subspan(pos));
        }
        const size_t ff_pos = static_cast<size_t>(
            static_cast<const std::byte*>(hit) - data.data());
        JpegStatus st = write_bytes(out, data.subspan(pos, ff_pos + 1 - pos));
        if (st != JpegStatus::Ok) {
            return st;
        }
        st = write_bytes(out, std::span<const std::byte>(&kStuffByte, 1));
        if (st != JpegStatus::Ok) {
            return st;
        }
        pos = ff_pos + 1;
    }
    return JpegStatus::Ok;
}

}  // namespace jpegseg
