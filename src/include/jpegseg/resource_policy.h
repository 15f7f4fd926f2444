#pragma once

#include "jpegseg/jpeg_report.h"
#include "jpegseg/jpeg_segment_io.h"
#include "jpegseg/mpf_rewrite.h"
#include "jpegseg/tiff_directory.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource budgets for reading untrusted JPEG/MPF input.
 */

namespace jpegseg {

/**
 * \brief Storage-agnostic limits gathered in one place.
 *
 * Budgets bound what a single read may buffer; they never cap the file size,
 * so large multi-picture files still pass when each piece is in bounds.
 */
struct JpegSegResourcePolicy final {
    /// Scan-data buffering and block size.
    JpegScanLimits scan_limits;

    /// MPF tag directory budgets.
    TiffLimits tiff_limits;

    /// Preview bytes shown per segment in listings.
    uint32_t max_preview_bytes = 32;
};

inline void
apply_resource_policy(const JpegSegResourcePolicy& policy,
                      MpfCopyOptions* copy, StripOptions* strip) noexcept
{
    if (copy) {
        copy->scan_limits = policy.scan_limits;
        copy->tiff_limits = policy.tiff_limits;
    }
    if (strip) {
        strip->scan_limits = policy.scan_limits;
    }
}

inline void
apply_resource_policy(const JpegSegResourcePolicy& policy,
                      JpegReportOptions* report) noexcept
{
    if (report) {
        report->scan_limits       = policy.scan_limits;
        report->tiff_limits       = policy.tiff_limits;
        report->max_preview_bytes = policy.max_preview_bytes;
    }
}

}  // namespace jpegseg
