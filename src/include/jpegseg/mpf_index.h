#pragma once

#include "jpegseg/byte_stream.h"
#include "jpegseg/jpeg_segment_io.h"
#include "jpegseg/tiff_directory.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

/**
 * \file mpf_index.h
 * \brief Multi-Picture Format (CIPA DC-007) index model.
 */

namespace jpegseg {

/// Signature at the start of an MPF APP2 payload.
inline constexpr std::array<std::byte, 4> kMpfSignature = {
    std::byte { 'M' },
    std::byte { 'P' },
    std::byte { 'F' },
    std::byte { 0x00 },
};
inline constexpr uint32_t kMpfHeaderSize = 4;

/// Bytes from an APP2 marker to the first MPF TIFF byte (marker, length, signature).
inline constexpr uint32_t kMpfApp2Preamble = 2 + 2 + kMpfHeaderSize;

/// Bytes per image in the MP Entry table.
inline constexpr uint32_t kMpfEntryBytes = 16;

// MP Index IFD tags.
inline constexpr uint16_t kMpfTagVersion        = 0xB000;
inline constexpr uint16_t kMpfTagNumberOfImages = 0xB001;
inline constexpr uint16_t kMpfTagEntry          = 0xB002;
inline constexpr uint16_t kMpfTagImageUidList   = 0xB003;
inline constexpr uint16_t kMpfTagTotalFrames    = 0xB004;

// MP Attribute IFD tags (0xB000 version is shared).
inline constexpr uint16_t kMpfTagIndividualImageNumber       = 0xB101;
inline constexpr uint16_t kMpfTagPanoramaScanningOrientation = 0xB201;
inline constexpr uint16_t kMpfTagPanoramaHorizontalOverlap   = 0xB202;
inline constexpr uint16_t kMpfTagPanoramaVerticalOverlap     = 0xB203;
inline constexpr uint16_t kMpfTagBaseViewpointNumber         = 0xB204;
inline constexpr uint16_t kMpfTagConvergenceAngle            = 0xB205;
inline constexpr uint16_t kMpfTagBaselineLength              = 0xB206;
inline constexpr uint16_t kMpfTagDivergenceAngle             = 0xB207;
inline constexpr uint16_t kMpfTagHorizontalAxisDistance      = 0xB208;
inline constexpr uint16_t kMpfTagVerticalAxisDistance        = 0xB209;
inline constexpr uint16_t kMpfTagCollimationAxisDistance     = 0xB20A;
inline constexpr uint16_t kMpfTagYawAngle                    = 0xB20B;
inline constexpr uint16_t kMpfTagPitchAngle                  = 0xB20C;
inline constexpr uint16_t kMpfTagRollAngle                   = 0xB20D;

/// MPF processing status.
enum class MpfStatus : uint8_t {
    Ok,
    /// The APP2 payload does not carry the `MPF\0` signature.
    NotMpf,
    /// The embedded TIFF header is not recognized.
    Unsupported,
    /// The embedded TIFF structure is inconsistent.
    Malformed,
    /// A \ref TiffLimits bound was hit.
    LimitExceeded,
    /// `NumberOfImages` is missing or zero.
    ZeroImageCount,
    /// `MPEntry` is missing or shorter than 16 bytes per image.
    EntryTableTooShort,
    /// First image offset is non-zero, a later one is zero, or offsets do not increase.
    InvalidOffsetPattern,
    /// A relative offset plus the base does not fit 32 bits.
    OffsetOverflow,
    /// Sizes disagree (rewritten segment vs. reserved space, offsets vs. lengths).
    SizeMismatch,
    ReadFailed,
    WriteFailed,
    SeekFailed,
};

/// Returns a stable lowercase name for \p status.
const char*
mpf_status_name(MpfStatus status) noexcept;

MpfStatus
mpf_status_from_tiff(TiffStatus status) noexcept;

MpfStatus
mpf_status_from_stream(StreamStatus status) noexcept;

/// Returns the MPF tag name for \p tag in \p space, or an empty view.
std::string_view
mpf_tag_name(TagSpace space, uint16_t tag) noexcept;

/**
 * \brief Image locations described by an MP Index IFD.
 *
 * Offsets are absolute file positions; the primary image has offset 0.
 */
struct MpfIndex final {
    /// File position of the first byte after `MPF\0`; MPF offsets are relative to it.
    uint32_t relative_offset_base = 0;
    std::vector<uint32_t> image_offsets;
    std::vector<uint32_t> image_lengths;
};

/// True if an APP2 payload starts with `MPF\0`.
bool
has_mpf_header(std::span<const std::byte> segment) noexcept;

/**
 * \brief Parses the TIFF structure that follows `MPF\0` in an APP2 payload.
 *
 * Use \ref TagSpace::MpfIndex for the primary image and
 * \ref TagSpace::MpfAttribute for later images.
 */
MpfStatus
parse_mpf_segment(std::span<const std::byte> segment, TagSpace space,
                  TiffTree* out, const TiffLimits& limits) noexcept;

/// Serializes `MPF\0` + \p tree into \p out (replacing its contents).
MpfStatus
make_mpf_segment(const TiffTree& tree, std::vector<std::byte>* out) noexcept;

/// Size of the APP2 payload \ref make_mpf_segment would produce.
uint64_t
mpf_segment_size(const TiffTree& tree) noexcept;

/**
 * \brief Derives the MPF offset base of an APP2 payload just read.
 *
 * \p read_pos is the stream position right after the payload.
 */
MpfStatus
mpf_base_from_read_position(uint64_t read_pos, size_t segment_size,
                            uint32_t* out) noexcept;

/**
 * \brief Extracts image offsets/lengths from the MP Index IFD of \p tree.
 *
 * \p base is the file position of the TIFF header inside the MPF segment.
 */
MpfStatus
decode_mpf_index(const TiffTree& tree, uint32_t base, MpfIndex* out) noexcept;

/**
 * \brief Writes offsets (made relative to `index.relative_offset_base`) and
 * lengths back into the existing MPEntry field of \p tree.
 *
 * The field keeps its size, so the serialized tree keeps its size too.
 */
MpfStatus
encode_mpf_index(const MpfIndex& index, TiffTree* tree) noexcept;

/**
 * \brief Lengths of consecutive images: each runs up to the next offset,
 * the last one up to \p end.
 */
MpfStatus
compute_image_lengths(std::span<const uint32_t> offsets, uint64_t end,
                      std::vector<uint32_t>* lengths) noexcept;

/// \ref compute_image_lengths followed by \ref encode_mpf_index.
MpfStatus
set_mpf_positions(TiffTree* tree, uint32_t base,
                  std::span<const uint32_t> offsets, uint64_t end) noexcept;

/// Receives each image of a multi-picture file (see \ref for_each_mpf_image).
class MpfImageVisitor {
public:
    virtual ~MpfImageVisitor() = default;
    /// \p in is positioned at the image's first byte.
    virtual JpegStatus on_image(ByteStream& in, uint32_t index,
                                uint32_t length) noexcept
        = 0;
};

/// Seeks \p in to each image listed in \p index in turn and calls \p visitor.
JpegStatus
for_each_mpf_image(ByteStream& in, const MpfIndex& index,
                   MpfImageVisitor& visitor) noexcept;

}  // namespace jpegseg
