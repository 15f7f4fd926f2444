#pragma once

#include "jpegseg/byte_stream.h"
#include "jpegseg/jpeg_segment_io.h"
#include "jpegseg/mpf_index.h"
#include "jpegseg/tiff_directory.h"

#include <cstdint>
#include <string>
#include <vector>

/**
 * \file jpeg_report.h
 * \brief Human-readable segment listing of a JPEG / MPF file.
 */

namespace jpegseg {

struct JpegReportOptions final {
    JpegScanLimits scan_limits;
    TiffLimits tiff_limits;
    /// List the images referenced by the MPF index after the primary image.
    bool follow_mpf = true;
    /// COM text / APPn identifier bytes appended to segment lines (0 = none).
    uint32_t max_preview_bytes = 32;
};

/**
 * \brief Listing produced by \ref report_jpeg.
 *
 * `lines` holds everything listed before a failure, so a partial listing is
 * still available when `jpeg` or `mpf` is not Ok.
 */
struct JpegReport final {
    JpegStatus jpeg = JpegStatus::Ok;
    MpfStatus mpf   = MpfStatus::Ok;
    uint32_t images = 0;
    std::vector<std::string> lines;
};

/**
 * \brief Lists the segments of the image at the current position of \p in,
 * then those of every further MPF image.
 *
 * Line forms:
 * - `SOI`, `EOI` and other markers without a segment: the marker name
 * - `<name>, <n> bytes` for segments, with ` (MPF segment)` for MPF APP2,
 *   ` "<text>"` for COM and ` [<id>]` for APPn identifiers
 * - `<n> bytes of image data` (plus ` and <k> reset markers`) before the
 *   marker that ends a run of scan data
 * - `MPF image <i> at offset <o>, size <s>` (1-based) before each extra image
 */
JpegReport
report_jpeg(ByteStream& in, const JpegReportOptions& options = {}) noexcept;

}  // namespace jpegseg
