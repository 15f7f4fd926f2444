#include "jpegseg/mpf_process.h"

namespace jpegseg {

namespace {

    static MpfStatus read_mpf_base(ByteStream& reader,
                                   std::span<const std::byte> segment,
                                   uint32_t* base) noexcept
    {
        uint64_t pos          = 0;
        const StreamStatus ss = reader.tell(&pos);
        if (ss != StreamStatus::Ok) {
            return mpf_status_from_stream(ss);
        }
        return mpf_base_from_read_position(pos, segment.size(), base);
    }


    static MpfStatus decode_index_segment(ByteStream& reader,
                                          std::span<const std::byte> segment,
                                          const TiffLimits& limits,
                                          TiffTree* tree,
                                          MpfIndex* index) noexcept
    {
        MpfStatus st = parse_mpf_segment(segment, TagSpace::MpfIndex, tree,
                                         limits);
        if (st != MpfStatus::Ok) {
            return st;
        }
        uint32_t base = 0;
        st            = read_mpf_base(reader, segment, &base);
        if (st != MpfStatus::Ok) {
            return st;
        }
        return decode_mpf_index(*tree, base, index);
    }

}  // namespace


const char*
mpf_processor_kind_name(MpfProcessorKind kind) noexcept
{
    switch (kind) {
    case MpfProcessorKind::Noop: return "noop";
    case MpfProcessorKind::Check: return "check";
    case MpfProcessorKind::GetIndex: return "get_index";
    case MpfProcessorKind::IndexRewriter: return "index_rewriter";
    case MpfProcessorKind::AttributeRewriter: return "attribute_rewriter";
    }
    return "unknown";
}


bool
MpfProcessor::pass_through(std::span<const std::byte> segment,
                           MpfApp2Output* out) noexcept
{
    const bool is_mpf = has_mpf_header(segment);
    if (is_mpf) {
        mpf_segments_ += 1;
    }
    if (out) {
        out->is_mpf  = is_mpf;
        out->segment = segment;
    }
    return is_mpf;
}


MpfStatus
MpfNoop::process_app2(ByteStream* /*writer*/, ByteStream& /*reader*/,
                      std::span<const std::byte> segment,
                      MpfApp2Output* out) noexcept
{
    pass_through(segment, out);
    return MpfStatus::Ok;
}


MpfStatus
MpfCheck::process_app2(ByteStream* /*writer*/, ByteStream& reader,
                       std::span<const std::byte> segment,
                       MpfApp2Output* out) noexcept
{
    if (!pass_through(segment, out)) {
        return MpfStatus::Ok;
    }
    TiffTree tree;
    if (space_ == TagSpace::MpfIndex) {
        MpfIndex index;
        return decode_index_segment(reader, segment, limits_, &tree, &index);
    }
    return parse_mpf_segment(segment, space_, &tree, limits_);
}


MpfStatus
MpfGetIndex::process_app2(ByteStream* /*writer*/, ByteStream& reader,
                          std::span<const std::byte> segment,
                          MpfApp2Output* out) noexcept
{
    if (!pass_through(segment, out) || found_) {
        return MpfStatus::Ok;
    }
    const MpfStatus st = decode_index_segment(reader, segment, limits_, &tree_,
                                              &index_);
    if (st != MpfStatus::Ok) {
        return st;
    }
    found_ = true;
    return MpfStatus::Ok;
}


MpfStatus
MpfIndexRewriter::process_app2(ByteStream* writer, ByteStream& reader,
                               std::span<const std::byte> segment,
                               MpfApp2Output* out) noexcept
{
    if (!pass_through(segment, out) || found_) {
        return MpfStatus::Ok;
    }
    if (!writer) {
        return MpfStatus::WriteFailed;
    }

    MpfStatus st = decode_index_segment(reader, segment, limits_, &tree_,
                                        &index_);
    if (st != MpfStatus::Ok) {
        return st;
    }

    // Placeholder: same layout, input offsets. Only the values change later.
    st = make_mpf_segment(tree_, &segment_);
    if (st != MpfStatus::Ok) {
        return st;
    }
    if (segment_.size() > kMaxSegmentPayloadBytes) {
        return MpfStatus::LimitExceeded;
    }

    const StreamStatus ss = writer->tell(&app2_write_pos_);
    if (ss != StreamStatus::Ok) {
        return mpf_status_from_stream(ss);
    }
    reserved_size_ = segment_.size();
    found_         = true;
    if (out) {
        out->segment = std::span<const std::byte>(segment_.data(),
                                                  segment_.size());
    }
    return MpfStatus::Ok;
}


MpfStatus
MpfAttributeRewriter::process_app2(ByteStream* /*writer*/,
                                   ByteStream& /*reader*/,
                                   std::span<const std::byte> segment,
                                   MpfApp2Output* out) noexcept
{
    if (!pass_through(segment, out)) {
        return MpfStatus::Ok;
    }
    MpfStatus st = parse_mpf_segment(segment, TagSpace::MpfAttribute, &tree_,
                                     limits_);
    if (st != MpfStatus::Ok) {
        return st;
    }
    st = make_mpf_segment(tree_, &segment_);
    if (st != MpfStatus::Ok) {
        return st;
    }
    if (segment_.size() > kMaxSegmentPayloadBytes) {
        return MpfStatus::LimitExceeded;
    }
    if (out) {
        out->segment = std::span<const std::byte>(segment_.data(),
                                                  segment_.size());
    }
    return MpfStatus::Ok;
}

}  // namespace jpegseg
