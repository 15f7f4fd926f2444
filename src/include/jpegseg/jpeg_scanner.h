#pragma once

#include "jpegseg/byte_stream.h"
#include "jpegseg/jpeg_markers.h"
#include "jpegseg/jpeg_segment_io.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file jpeg_scanner.h
 * \brief Pull-based JPEG segment reader and its writer counterpart.
 */

namespace jpegseg {

/**
 * \brief One item produced by \ref JpegScanner::scan.
 *
 * - `marker == kImageDataMarker`: `data` holds unstuffed scan data.
 * - `has_data == false`: a marker without a segment (RSTn, EOI, TEM).
 * - otherwise `data` is the segment payload (possibly empty).
 *
 * \warning `data` borrows the scanner's internal buffer and is invalidated by
 * the next \ref JpegScanner::scan call and by destroying the scanner. Copy it
 * (for example into a \ref Segment) to keep it.
 */
struct SegmentView final {
    uint8_t marker = kImageDataMarker;
    bool has_data  = false;
    std::span<const std::byte> data;
};

/// Owned copy of a marker and its segment payload.
struct Segment final {
    uint8_t marker = kImageDataMarker;
    bool has_data  = false;
    std::vector<std::byte> data;
};

/// Makes an owned copy of \p view.
Segment
copy_segment(const SegmentView& view);

/// Scanner state.
enum class ScanState : uint8_t {
    /// The start-of-image header has not been checked yet.
    AwaitingHeader,
    /// Next call reads a marker (and its segment, if any).
    AwaitingMarker,
    /// Next call reads entropy-coded data after SOS or RSTn.
    AwaitingScanData,
    /// EOI was returned.
    Finished,
    /// A previous call failed; the traversal cannot continue.
    Failed,
};

/**
 * \brief Reads one JPEG image marker by marker.
 *
 * Each \ref scan call returns either a marker (with its payload when it has
 * one) or a chunk of scan data. The caller stops after EOI; scanning further
 * fails with \ref JpegStatus::PastEndOfImage.
 *
 * The stream must support seeking: the scan-data reader rewinds onto the
 * marker that terminates the data.
 */
class JpegScanner final {
public:
    explicit JpegScanner(ByteStream& in,
                         const JpegScanLimits& limits = {}) noexcept;

    JpegScanner(const JpegScanner&)            = delete;
    JpegScanner& operator=(const JpegScanner&) = delete;

    /// Checks the `FF D8` header. Called implicitly by the first \ref scan.
    JpegStatus open() noexcept;

    /// Reads the next marker/segment or scan-data chunk into \p out.
    JpegStatus scan(SegmentView* out) noexcept;

    ScanState state() const noexcept { return state_; }
    ByteStream& stream() const noexcept { return *in_; }

private:
    JpegStatus fail(JpegStatus status) noexcept;

    ByteStream* in_ = nullptr;
    JpegScanLimits limits_;
    std::vector<std::byte> buf_;
    ScanState state_    = ScanState::AwaitingHeader;
    JpegStatus failure_ = JpegStatus::Ok;
};

/**
 * \brief Writes JPEG markers, segments and scan data.
 *
 * The `FF D8` header is written by \ref open, or before the first
 * \ref dump if \ref open was not called.
 */
class JpegDumper final {
public:
    explicit JpegDumper(ByteStream& out) noexcept;

    JpegDumper(const JpegDumper&)            = delete;
    JpegDumper& operator=(const JpegDumper&) = delete;

    JpegStatus open() noexcept;

    /**
     * \brief Writes one item.
     *
     * `kImageDataMarker` writes \p data as stuffed scan data with no marker.
     * Otherwise the marker is written, followed by a length-prefixed segment
     * when \p has_data is true.
     */
    JpegStatus dump(uint8_t marker, std::span<const std::byte> data,
                    bool has_data) noexcept;

    JpegStatus dump(const SegmentView& seg) noexcept;
    JpegStatus dump(const Segment& seg) noexcept;

    bool header_written() const noexcept { return header_written_; }
    ByteStream& stream() const noexcept { return *out_; }

private:
    ByteStream* out_     = nullptr;
    bool header_written_ = false;
};

/**
 * \brief Reads the header and all segments up to and including SOS.
 *
 * \p out receives owned copies (appended). Scan data is not read.
 */
JpegStatus
read_segments(ByteStream& in, std::vector<Segment>* out,
              const JpegScanLimits& limits = {}) noexcept;

/// Writes the header followed by each segment in \p segments.
JpegStatus
write_segments(ByteStream& out, std::span<const Segment> segments) noexcept;

}  // namespace jpegseg
