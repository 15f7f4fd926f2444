#pragma once

#include "jpegseg/byte_stream.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file jpeg_segment_io.h
 * \brief Low-level JPEG marker, segment and scan-data codec.
 */

namespace jpegseg {

/// JPEG read/write status: format errors plus propagated stream failures.
enum class JpegStatus : uint8_t {
    Ok,
    /// The underlying stream failed to read.
    ReadFailed,
    /// The underlying stream failed to write.
    WriteFailed,
    /// The underlying stream failed to report or change its position.
    SeekFailed,
    /// The stream does not start with `FF D8`.
    MissingStartMarker,
    /// A marker was expected but the byte is not 0xFF.
    ExpectedMarkerPrefix,
    /// `FF 00` where a marker was expected.
    InvalidMarkerZero,
    /// End of stream inside a marker, segment or scan data.
    Truncated,
    /// Segment length field below 2.
    InvalidLength,
    /// Segment payload longer than \ref kMaxSegmentPayloadBytes.
    SegmentTooLarge,
    /// Read requested after the end-of-image marker.
    PastEndOfImage,
    /// A configured limit was hit (see \ref JpegScanLimits).
    LimitExceeded,
};

/// Returns a stable lowercase name for \p status.
const char*
jpeg_status_name(JpegStatus status) noexcept;

/// Maps a failed stream operation onto the matching \ref JpegStatus.
JpegStatus
jpeg_status_from_stream(StreamStatus status) noexcept;

/// Size of the JPEG start-of-image header (`FF D8`).
inline constexpr uint32_t kJpegHeaderSize = 2;

/// Largest payload whose length field (payload + 2) fits 16 bits.
inline constexpr uint32_t kMaxSegmentPayloadBytes = 65533;

/// Limits applied while reading scan data.
struct JpegScanLimits final {
    /// Upper bound on unstuffed bytes returned by one scan-data read.
    uint64_t max_scan_data_bytes = 0xFFFFFFFFULL;
    /// Size of each block read while searching for the terminating marker.
    uint32_t read_block_bytes = 16U * 1024U;
};

/// True if \p bytes starts with the JPEG start-of-image signature.
bool
is_jpeg_header(std::span<const std::byte> bytes) noexcept;

/// Consumes 2 bytes and checks them against `FF D8`. Fill bytes are not allowed.
JpegStatus
read_header(ByteStream& in) noexcept;

/// Writes `FF D8`.
JpegStatus
write_header(ByteStream& out) noexcept;

/**
 * \brief Reads a marker: 0xFF, any number of 0xFF fill bytes, then the code.
 *
 * Fill bytes are discarded. A 0x00 code is rejected.
 */
JpegStatus
read_marker(ByteStream& in, uint8_t* marker) noexcept;

/// Writes `FF <marker>`.
JpegStatus
write_marker(ByteStream& out, uint8_t marker) noexcept;

/**
 * \brief Reads a length-prefixed segment payload into \p buf.
 *
 * The big-endian length includes its own two bytes; `00 02` yields an empty
 * payload. \p buf is resized to the payload size, reusing its capacity.
 */
JpegStatus
read_data(ByteStream& in, std::vector<std::byte>* buf) noexcept;

/// Writes the length field (payload size + 2) followed by \p payload.
JpegStatus
write_data(ByteStream& out, std::span<const std::byte> payload) noexcept;

/**
 * \brief Reads entropy-coded scan data up to the next marker.
 *
 * Stuffed `FF 00` pairs are collapsed to `FF`. On success the stream is left
 * positioned on the 0xFF that starts the terminating marker, and \p buf holds
 * the unstuffed bytes (possibly none). Reads are done in blocks of
 * `limits.read_block_bytes`.
 */
JpegStatus
read_image_data(ByteStream& in, std::vector<std::byte>* buf,
                const JpegScanLimits& limits) noexcept;

/// Writes scan data, following each 0xFF byte with a 0x00 byte.
JpegStatus
write_image_data(ByteStream& out, std::span<const std::byte> data) noexcept;

}  // namespace jpegseg
