#pragma once

#include "jpegseg/byte_stream.h"
#include "jpegseg/jpeg_segment_io.h"
#include "jpegseg/mpf_index.h"
#include "jpegseg/mpf_process.h"
#include "jpegseg/tiff_directory.h"

#include <cstdint>
#include <span>
#include <vector>

/**
 * \file mpf_rewrite.h
 * \brief Image copy, multi-picture copy with index backpatch, and strip.
 */

namespace jpegseg {

/// Result of copying one image.
struct CopyImageResult final {
    JpegStatus jpeg = JpegStatus::Ok;
    MpfStatus mpf   = MpfStatus::Ok;
    bool found_mpf  = false;
    /// Items written (markers, segments and scan-data chunks).
    uint32_t segments = 0;
};

/**
 * \brief Copies one image (SOI through EOI) from \p in to \p out.
 *
 * Every APP2 payload is routed through \p processor and the payload it
 * returns is written instead. Reading stops after EOI; \p in is left right
 * after it.
 */
CopyImageResult
copy_jpeg_image(ByteStream& out, ByteStream& in, MpfProcessor& processor,
                const JpegScanLimits& limits = {}) noexcept;

struct MpfCopyOptions final {
    JpegScanLimits scan_limits;
    TiffLimits tiff_limits;
};

/// Result of \ref copy_mpf_file.
struct MpfCopyResult final {
    JpegStatus jpeg = JpegStatus::Ok;
    MpfStatus mpf   = MpfStatus::Ok;
    /// Images copied (1 for a plain JPEG).
    uint32_t images_written = 0;
    /// Output position after the last image.
    uint64_t bytes_written = 0;
    /// Output positions of each image (first is 0). Empty without MPF.
    std::vector<uint32_t> offsets;
    std::vector<uint32_t> lengths;
};

/**
 * \brief Copies a JPEG file including all images listed by its MPF index.
 *
 * The index segment of the first image is reserved with its final size,
 * every further image is copied from its input offset, then the index is
 * overwritten with the output offsets and lengths.
 */
MpfCopyResult
copy_mpf_file(ByteStream& in, ByteStream& out,
              const MpfCopyOptions& options = {}) noexcept;

/**
 * \brief Overwrites a reserved MPF APP2 segment in place.
 *
 * \p app2_write_pos is the output position of the segment's marker and
 * \p reserved_size the payload size written there. Offsets become relative to
 * `app2_write_pos + 8`; lengths are derived from \p offsets and \p end (the
 * output end position) and stored in \p lengths when non-null. When the new
 * payload differs from \p reserved_size nothing is written and
 * \ref MpfStatus::SizeMismatch is returned. On success \p out is left at
 * \p end.
 */
MpfStatus
rewrite_mpf_segment(ByteStream& out, TiffTree* tree, uint64_t app2_write_pos,
                    uint64_t reserved_size, std::span<const uint32_t> offsets,
                    uint64_t end, std::vector<uint32_t>* lengths) noexcept;

struct StripOptions final {
    bool drop_com = true;
    bool drop_app = true;
    bool drop_jpg = true;
    JpegScanLimits scan_limits;
};

struct StripResult final {
    JpegStatus status         = JpegStatus::Ok;
    uint32_t segments_written = 0;
    uint32_t segments_dropped = 0;
};

/**
 * \brief Copies the first image, dropping COM, APPn and JPGn segments.
 *
 * Nothing after the first EOI is read or written.
 */
StripResult
strip_jpeg(ByteStream& in, ByteStream& out,
           const StripOptions& options = {}) noexcept;

}  // namespace jpegseg
