#pragma once

#include "jpegseg/byte_stream.h"
#include "jpegseg/mpf_index.h"
#include "jpegseg/tiff_directory.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file mpf_process.h
 * \brief APP2 handlers used while copying or inspecting a JPEG image.
 */

namespace jpegseg {

enum class MpfProcessorKind : uint8_t {
    Noop,
    Check,
    GetIndex,
    IndexRewriter,
    AttributeRewriter,
};

/// Returns a stable lowercase name for \p kind.
const char*
mpf_processor_kind_name(MpfProcessorKind kind) noexcept;

/**
 * \brief What to do with one APP2 payload.
 *
 * `segment` is the payload to emit in place of the input payload. It aliases
 * either the input or storage owned by the processor, and stays valid until
 * the next \ref MpfProcessor::process_app2 call on the same processor.
 */
struct MpfApp2Output final {
    bool is_mpf = false;
    std::span<const std::byte> segment;
};

/**
 * \brief Handler invoked for every APP2 segment of an image.
 *
 * Implementations are exactly \ref MpfNoop, \ref MpfCheck, \ref MpfGetIndex,
 * \ref MpfIndexRewriter and \ref MpfAttributeRewriter.
 *
 * \p reader must be positioned right after \p segment (the MPF offset base is
 * derived from it). \p writer is the output stream positioned where the APP2
 * marker will be written, or null when nothing is being written.
 */
class MpfProcessor {
public:
    virtual ~MpfProcessor() = default;

    virtual MpfProcessorKind kind() const noexcept = 0;

    virtual MpfStatus process_app2(ByteStream* writer, ByteStream& reader,
                                   std::span<const std::byte> segment,
                                   MpfApp2Output* out) noexcept
        = 0;

    /// Number of MPF segments seen so far.
    uint32_t mpf_segments() const noexcept { return mpf_segments_; }

protected:
    /// Fills \p out with a pass-through result and counts MPF segments.
    bool pass_through(std::span<const std::byte> segment,
                      MpfApp2Output* out) noexcept;

    uint32_t mpf_segments_ = 0;
};

/// Recognizes MPF segments but leaves every payload untouched.
class MpfNoop final : public MpfProcessor {
public:
    MpfProcessorKind kind() const noexcept override
    {
        return MpfProcessorKind::Noop;
    }
    MpfStatus process_app2(ByteStream* writer, ByteStream& reader,
                           std::span<const std::byte> segment,
                           MpfApp2Output* out) noexcept override;
};

/**
 * \brief Validates MPF segments without changing them.
 *
 * The tag directory is parsed in the configured space; for the index space
 * the image table is decoded as well.
 */
class MpfCheck final : public MpfProcessor {
public:
    explicit MpfCheck(TagSpace space = TagSpace::MpfIndex,
                      const TiffLimits& limits = {}) noexcept
        : space_(space)
        , limits_(limits)
    {
    }

    MpfProcessorKind kind() const noexcept override
    {
        return MpfProcessorKind::Check;
    }
    MpfStatus process_app2(ByteStream* writer, ByteStream& reader,
                           std::span<const std::byte> segment,
                           MpfApp2Output* out) noexcept override;

private:
    TagSpace space_;
    TiffLimits limits_;
};

/// Extracts the image index from the first MPF segment.
class MpfGetIndex final : public MpfProcessor {
public:
    explicit MpfGetIndex(const TiffLimits& limits = {}) noexcept
        : limits_(limits)
    {
    }

    MpfProcessorKind kind() const noexcept override
    {
        return MpfProcessorKind::GetIndex;
    }
    MpfStatus process_app2(ByteStream* writer, ByteStream& reader,
                           std::span<const std::byte> segment,
                           MpfApp2Output* out) noexcept override;

    bool found() const noexcept { return found_; }
    const MpfIndex& index() const noexcept { return index_; }
    const TiffTree& tree() const noexcept { return tree_; }

private:
    TiffLimits limits_;
    bool found_ = false;
    MpfIndex index_;
    TiffTree tree_;
};

/**
 * \brief Decodes the index of the first MPF segment and re-emits it as a
 * placeholder of the final size.
 *
 * Records where the APP2 marker is written and how many payload bytes are
 * reserved, so the segment can be overwritten once the real image positions
 * are known. Later MPF segments in the same image pass through unchanged.
 */
class MpfIndexRewriter final : public MpfProcessor {
public:
    explicit MpfIndexRewriter(const TiffLimits& limits = {}) noexcept
        : limits_(limits)
    {
    }

    MpfProcessorKind kind() const noexcept override
    {
        return MpfProcessorKind::IndexRewriter;
    }
    MpfStatus process_app2(ByteStream* writer, ByteStream& reader,
                           std::span<const std::byte> segment,
                           MpfApp2Output* out) noexcept override;

    bool found() const noexcept { return found_; }
    /// Image positions in the input file.
    const MpfIndex& input_index() const noexcept { return index_; }
    TiffTree& tree() noexcept { return tree_; }
    const TiffTree& tree() const noexcept { return tree_; }
    /// Output position of the APP2 marker (its 0xFF byte).
    uint64_t app2_write_pos() const noexcept { return app2_write_pos_; }
    /// Payload bytes written for the placeholder.
    uint64_t reserved_size() const noexcept { return reserved_size_; }

private:
    TiffLimits limits_;
    bool found_ = false;
    MpfIndex index_;
    TiffTree tree_;
    std::vector<std::byte> segment_;
    uint64_t app2_write_pos_ = 0;
    uint64_t reserved_size_  = 0;
};

/// Re-serializes MP Attribute segments of non-primary images.
class MpfAttributeRewriter final : public MpfProcessor {
public:
    explicit MpfAttributeRewriter(const TiffLimits& limits = {}) noexcept
        : limits_(limits)
    {
    }

    MpfProcessorKind kind() const noexcept override
    {
        return MpfProcessorKind::AttributeRewriter;
    }
    MpfStatus process_app2(ByteStream* writer, ByteStream& reader,
                           std::span<const std::byte> segment,
                           MpfApp2Output* out) noexcept override;

    const TiffTree& tree() const noexcept { return tree_; }

private:
    TiffLimits limits_;
    TiffTree tree_;
    std::vector<std::byte> segment_;
};

}  // namespace jpegseg
