#include "jpegseg/mpf_index.h"

#include <cstring>
#include <limits>
#include <utility>

namespace jpegseg {

namespace {

    struct MpfTagNameEntry final {
        uint16_t tag     = 0;
        const char* name = nullptr;
    };

    // Sorted by tag.
    static constexpr MpfTagNameEntry kMpfIndexTags[] = {
        { kMpfTagVersion, "MPFVersion" },
        { kMpfTagNumberOfImages, "NumberOfImages" },
        { kMpfTagEntry, "MPEntry" },
        { kMpfTagImageUidList, "ImageUIDList" },
        { kMpfTagTotalFrames, "TotalFrames" },
    };

    static constexpr MpfTagNameEntry kMpfAttributeTags[] = {
        { kMpfTagVersion, "MPFVersion" },
        { kMpfTagIndividualImageNumber, "MPIndividualNum" },
        { kMpfTagPanoramaScanningOrientation, "PanOrientation" },
        { kMpfTagPanoramaHorizontalOverlap, "PanOverlapH" },
        { kMpfTagPanoramaVerticalOverlap, "PanOverlapV" },
        { kMpfTagBaseViewpointNumber, "BaseViewpointNum" },
        { kMpfTagConvergenceAngle, "ConvergenceAngle" },
        { kMpfTagBaselineLength, "BaselineLength" },
        { kMpfTagDivergenceAngle, "VerticalDivergence" },
        { kMpfTagHorizontalAxisDistance, "AxisDistanceX" },
        { kMpfTagVerticalAxisDistance, "AxisDistanceY" },
        { kMpfTagCollimationAxisDistance, "AxisDistanceZ" },
        { kMpfTagYawAngle, "YawAngle" },
        { kMpfTagPitchAngle, "PitchAngle" },
        { kMpfTagRollAngle, "RollAngle" },
    };

    static std::string_view find_tag_name(std::span<const MpfTagNameEntry> entries,
                                          uint16_t tag) noexcept
    {
        size_t lo = 0;
        size_t hi = entries.size();
        while (lo < hi) {
            const size_t mid = lo + (hi - lo) / 2;
            if (entries[mid].tag < tag) {
                lo = mid + 1;
            } else {
                hi = mid;
            }
        }
        if (lo < entries.size() && entries[lo].tag == tag) {
            return entries[lo].name;
        }
        return {};
    }

    // Word layout of one 16-byte MP Entry: attribute, size, offset, dependents.
    static constexpr uint32_t kEntryWords      = kMpfEntryBytes / 4;
    static constexpr uint32_t kEntrySizeWord   = 1;
    static constexpr uint32_t kEntryOffsetWord = 2;

}  // namespace


const char*
mpf_status_name(MpfStatus status) noexcept
{
    switch (status) {
    case MpfStatus::Ok: return "ok";
    case MpfStatus::NotMpf: return "not_mpf";
    case MpfStatus::Unsupported: return "unsupported";
    case MpfStatus::Malformed: return "malformed";
    case MpfStatus::LimitExceeded: return "limit_exceeded";
    case MpfStatus::ZeroImageCount: return "zero_image_count";
    case MpfStatus::EntryTableTooShort: return "entry_table_too_short";
    case MpfStatus::InvalidOffsetPattern: return "invalid_offset_pattern";
    case MpfStatus::OffsetOverflow: return "offset_overflow";
    case MpfStatus::SizeMismatch: return "size_mismatch";
    case MpfStatus::ReadFailed: return "read_failed";
    case MpfStatus::WriteFailed: return "write_failed";
    case MpfStatus::SeekFailed: return "seek_failed";
    }
    return "unknown";
}


MpfStatus
mpf_status_from_tiff(TiffStatus status) noexcept
{
    switch (status) {
    case TiffStatus::Ok: return MpfStatus::Ok;
    case TiffStatus::Unsupported: return MpfStatus::Unsupported;
    case TiffStatus::Malformed: return MpfStatus::Malformed;
    case TiffStatus::LimitExceeded: return MpfStatus::LimitExceeded;
    }
    return MpfStatus::Malformed;
}


MpfStatus
mpf_status_from_stream(StreamStatus status) noexcept
{
    switch (status) {
    case StreamStatus::Ok: return MpfStatus::Ok;
    case StreamStatus::OpenFailed:
    case StreamStatus::ReadFailed: return MpfStatus::ReadFailed;
    case StreamStatus::WriteFailed: return MpfStatus::WriteFailed;
    case StreamStatus::SeekFailed: return MpfStatus::SeekFailed;
    }
    return MpfStatus::ReadFailed;
}


std::string_view
mpf_tag_name(TagSpace space, uint16_t tag) noexcept
{
    switch (space) {
    case TagSpace::MpfIndex: return find_tag_name(kMpfIndexTags, tag);
    case TagSpace::MpfAttribute: return find_tag_name(kMpfAttributeTags, tag);
    }
    return {};
}


bool
has_mpf_header(std::span<const std::byte> segment) noexcept
{
    if (segment.size() < kMpfHeaderSize) {
        return false;
    }
    return std::memcmp(segment.data(), kMpfSignature.data(), kMpfHeaderSize)
           == 0;
}


MpfStatus
parse_mpf_segment(std::span<const std::byte> segment, TagSpace space,
                  TiffTree* out, const TiffLimits& limits) noexcept
{
    if (!out) {
        return MpfStatus::Malformed;
    }
    if (!has_mpf_header(segment)) {
        return MpfStatus::NotMpf;
    }
    return mpf_status_from_tiff(
        parse_tiff_tree(segment.subspan(kMpfHeaderSize), space, out, limits));
}


MpfStatus
make_mpf_segment(const TiffTree& tree, std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return MpfStatus::Malformed;
    }
    out->assign(kMpfSignature.begin(), kMpfSignature.end());
    return mpf_status_from_tiff(serialize_tiff_tree(tree, out));
}


uint64_t
mpf_segment_size(const TiffTree& tree) noexcept
{
    return kMpfHeaderSize + tiff_tree_size(tree);
}


MpfStatus
mpf_base_from_read_position(uint64_t read_pos, size_t segment_size,
                            uint32_t* out) noexcept
{
    if (!out) {
        return MpfStatus::Malformed;
    }
    if (segment_size < kMpfHeaderSize) {
        return MpfStatus::NotMpf;
    }
    const uint64_t tiff_bytes = segment_size - kMpfHeaderSize;
    if (read_pos < tiff_bytes) {
        return MpfStatus::Malformed;
    }
    const uint64_t base = read_pos - tiff_bytes;
    if (base > std::numeric_limits<uint32_t>::max()) {
        return MpfStatus::OffsetOverflow;
    }
    *out = static_cast<uint32_t>(base);
    return MpfStatus::Ok;
}


MpfStatus
decode_mpf_index(const TiffTree& tree, uint32_t base, MpfIndex* out) noexcept
{
    if (!out) {
        return MpfStatus::Malformed;
    }
    if (tree.ifds.empty()) {
        return MpfStatus::ZeroImageCount;
    }
    const TiffIfd& ifd = tree.ifds[0];

    uint32_t count            = 0;
    const TiffField* count_fd = find_field(ifd, kMpfTagNumberOfImages);
    if (!count_fd || !field_get_u32(*count_fd, tree.little_endian, 0, &count)
        || count == 0) {
        return MpfStatus::ZeroImageCount;
    }

    const TiffField* entry = find_field(ifd, kMpfTagEntry);
    if (!entry
        || entry->data.size() < uint64_t(count) * uint64_t(kMpfEntryBytes)) {
        return MpfStatus::EntryTableTooShort;
    }

    MpfIndex index;
    index.relative_offset_base = base;
    index.image_offsets.reserve(count);
    index.image_lengths.reserve(count);

    for (uint32_t i = 0; i < count; ++i) {
        uint32_t length = 0;
        uint32_t rel    = 0;
        if (!field_get_u32(*entry, tree.little_endian,
                           i * kEntryWords + kEntrySizeWord, &length)
            || !field_get_u32(*entry, tree.little_endian,
                              i * kEntryWords + kEntryOffsetWord, &rel)) {
            return MpfStatus::EntryTableTooShort;
        }
        uint32_t abs = 0;
        if (i == 0) {
            if (rel != 0) {
                return MpfStatus::InvalidOffsetPattern;
            }
        } else {
            if (rel == 0) {
                return MpfStatus::InvalidOffsetPattern;
            }
            if (rel > std::numeric_limits<uint32_t>::max() - base) {
                return MpfStatus::OffsetOverflow;
            }
            abs = rel + base;
        }
        index.image_offsets.push_back(abs);
        index.image_lengths.push_back(length);
    }

    *out = std::move(index);
    return MpfStatus::Ok;
}


MpfStatus
encode_mpf_index(const MpfIndex& index, TiffTree* tree) noexcept
{
    if (!tree) {
        return MpfStatus::Malformed;
    }
    const size_t count = index.image_offsets.size();
    if (index.image_lengths.size() != count) {
        return MpfStatus::SizeMismatch;
    }
    if (tree->ifds.empty()) {
        return MpfStatus::EntryTableTooShort;
    }
    TiffField* entry = find_field(tree->ifds[0], kMpfTagEntry);
    if (!entry
        || entry->data.size() < uint64_t(count) * uint64_t(kMpfEntryBytes)) {
        return MpfStatus::EntryTableTooShort;
    }

    const uint32_t base = index.relative_offset_base;
    for (size_t i = 0; i < count; ++i) {
        const uint32_t abs = index.image_offsets[i];
        uint32_t rel       = 0;
        if (abs != 0) {
            if (abs <= base) {
                return MpfStatus::OffsetOverflow;
            }
            rel = abs - base;
        }
        const uint32_t word = static_cast<uint32_t>(i) * kEntryWords;
        if (!field_set_u32(*entry, tree->little_endian, word + kEntrySizeWord,
                           index.image_lengths[i])
            || !field_set_u32(*entry, tree->little_endian,
                              word + kEntryOffsetWord, rel)) {
            return MpfStatus::EntryTableTooShort;
        }
    }
    return MpfStatus::Ok;
}


MpfStatus
compute_image_lengths(std::span<const uint32_t> offsets, uint64_t end,
                      std::vector<uint32_t>* lengths) noexcept
{
    if (!lengths) {
        return MpfStatus::Malformed;
    }
    if (offsets.empty()) {
        return MpfStatus::ZeroImageCount;
    }
    std::vector<uint32_t> out;
    out.reserve(offsets.size());
    for (size_t i = 0; i < offsets.size(); ++i) {
        const bool last     = i + 1 == offsets.size();
        const uint64_t next = last ? end : uint64_t(offsets[i + 1]);
        if (next < offsets[i] || (!last && next == offsets[i])) {
            return MpfStatus::InvalidOffsetPattern;
        }
        const uint64_t len = next - offsets[i];
        if (len > std::numeric_limits<uint32_t>::max()) {
            return MpfStatus::OffsetOverflow;
        }
        out.push_back(static_cast<uint32_t>(len));
    }
    *lengths = std::move(out);
    return MpfStatus::Ok;
}


MpfStatus
set_mpf_positions(TiffTree* tree, uint32_t base,
                  std::span<const uint32_t> offsets, uint64_t end) noexcept
{
    MpfIndex index;
    index.relative_offset_base = base;
    MpfStatus st = compute_image_lengths(offsets, end, &index.image_lengths);
    if (st != MpfStatus::Ok) {
        return st;
    }
    index.image_offsets.assign(offsets.begin(), offsets.end());
    return encode_mpf_index(index, tree);
}


JpegStatus
for_each_mpf_image(ByteStream& in, const MpfIndex& index,
                   MpfImageVisitor& visitor) noexcept
{
    for (size_t i = 0; i < index.image_offsets.size(); ++i) {
        const StreamStatus ss = in.seek(index.image_offsets[i]);
        if (ss != StreamStatus::Ok) {
            return jpeg_status_from_stream(ss);
        }
        const uint32_t length = i < index.image_lengths.size()
                                    ? index.image_lengths[i]
                                    : 0U;
        const JpegStatus st = visitor.on_image(in, static_cast<uint32_t>(i),
                                               length);
        if (st != JpegStatus::Ok) {
            return st;
        }
    }
    return JpegStatus::Ok;
}

}  // namespace jpegseg
