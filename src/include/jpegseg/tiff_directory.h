#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file tiff_directory.h
 * \brief Minimal classic-TIFF tag directory codec (as embedded in MPF segments).
 */

namespace jpegseg {

/// TIFF directory codec status.
enum class TiffStatus : uint8_t {
    Ok,
    /// Not a classic TIFF header (`II*\0` / `MM\0*`).
    Unsupported,
    /// Offsets, counts or types are inconsistent with the byte stream.
    Malformed,
    /// A \ref TiffLimits bound was hit.
    LimitExceeded,
};

/// Returns a stable lowercase name for \p status.
const char*
tiff_status_name(TiffStatus status) noexcept;

/// Tag namespace a directory belongs to.
enum class TagSpace : uint8_t {
    /// MP Index IFD (first IFD of the primary image's MPF segment).
    MpfIndex,
    /// MP Attribute IFD (following IFDs, and the only IFD of later images).
    MpfAttribute,
};

/// TIFF field types understood by the codec.
enum class TiffType : uint16_t {
    Byte      = 1,
    Ascii     = 2,
    Short     = 3,
    Long      = 4,
    Rational  = 5,
    SByte     = 6,
    Undefined = 7,
    SShort    = 8,
    SLong     = 9,
    SRational = 10,
    Float     = 11,
    Double    = 12,
};

/// Resource limits for \ref parse_tiff_tree.
struct TiffLimits final {
    uint32_t max_ifds            = 16;
    uint32_t max_entries_per_ifd = 1024;
    uint64_t max_value_bytes     = 65535;
};

/**
 * \brief One IFD entry with its value bytes copied out of the source.
 *
 * `data` is in the tree's byte order and holds exactly
 * `count * tiff_type_size(type)` bytes.
 */
struct TiffField final {
    uint16_t tag   = 0;
    uint16_t type  = 0;
    uint32_t count = 0;
    std::vector<std::byte> data;
};

struct TiffIfd final {
    TagSpace space = TagSpace::MpfIndex;
    std::vector<TiffField> fields;
};

/**
 * \brief A TIFF header plus its IFD chain (first IFD at index 0).
 *
 * The tree owns all value bytes; it does not alias the parsed buffer.
 */
struct TiffTree final {
    bool little_endian = true;
    std::vector<TiffIfd> ifds;
};

/// Size in bytes of one value of TIFF \p type (0 for unknown types).
uint32_t
tiff_type_size(uint16_t type) noexcept;

/**
 * \brief Parses a TIFF header and follows the IFD chain.
 *
 * The first IFD is tagged with \p first_space; any IFD reached through a
 * next-IFD pointer is tagged \ref TagSpace::MpfAttribute.
 */
TiffStatus
parse_tiff_tree(std::span<const std::byte> bytes, TagSpace first_space,
                TiffTree* out, const TiffLimits& limits) noexcept;

/**
 * \brief Serialized size of \p tree (header included).
 *
 * The size depends only on the number of IFDs, fields and their byte counts,
 * never on field values.
 */
uint64_t
tiff_tree_size(const TiffTree& tree) noexcept;

/**
 * \brief Appends the serialized tree to \p out.
 *
 * Layout: 8-byte header, first IFD at offset 8, each IFD followed by its
 * out-of-line values (each padded to an even size), then the next IFD.
 * Offsets are relative to the header.
 */
TiffStatus
serialize_tiff_tree(const TiffTree& tree, std::vector<std::byte>* out) noexcept;

const TiffField*
find_field(const TiffIfd& ifd, uint16_t tag) noexcept;

TiffField*
find_field(TiffIfd& ifd, uint16_t tag) noexcept;

/// Reads the \p index-th 32-bit word of `field.data`. False if out of range.
bool
field_get_u32(const TiffField& field, bool little_endian, uint32_t index,
              uint32_t* out) noexcept;

/// Overwrites the \p index-th 32-bit word of `field.data` in place.
bool
field_set_u32(TiffField& field, bool little_endian, uint32_t index,
              uint32_t value) noexcept;

}  // namespace jpegseg
