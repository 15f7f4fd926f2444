#include "jpegseg/tiff_directory.h"

#include <cstring>
#include <utility>

namespace jpegseg {
namespace {

    static constexpr uint32_t kTiffHeaderSize   = 8;
    static constexpr uint32_t kIfdEntrySize     = 12;
    static constexpr uint32_t kInlineValueBytes = 4;

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    struct ByteOrder final {
        bool le = true;
    };

    static bool read_u16(ByteOrder order, std::span<const std::byte> bytes,
                         uint64_t offset, uint16_t* out) noexcept
    {
        if (offset + 2U > bytes.size()) {
            return false;
        }
        const uint16_t b0 = u8(bytes[offset + 0]);
        const uint16_t b1 = u8(bytes[offset + 1]);
        *out = order.le ? static_cast<uint16_t>(b0 | (b1 << 8))
                        : static_cast<uint16_t>((b0 << 8) | b1);
        return true;
    }


    static bool read_u32(ByteOrder order, std::span<const std::byte> bytes,
                         uint64_t offset, uint32_t* out) noexcept
    {
        if (offset + 4U > bytes.size()) {
            return false;
        }
        uint32_t v = 0;
        for (uint32_t i = 0; i < 4; ++i) {
            const uint32_t b = u8(bytes[offset + i]);
            v |= order.le ? (b << (i * 8)) : (b << ((3 - i) * 8));
        }
        *out = v;
        return true;
    }


    static void put_u16(ByteOrder order, std::byte* dst, uint16_t v) noexcept
    {
        if (order.le) {
            dst[0] = std::byte { static_cast<uint8_t>(v & 0xFF) };
            dst[1] = std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) };
        } else {
            dst[0] = std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) };
            dst[1] = std::byte { static_cast<uint8_t>(v & 0xFF) };
        }
    }


    static void put_u32(ByteOrder order, std::byte* dst, uint32_t v) noexcept
    {
        for (uint32_t i = 0; i < 4; ++i) {
            const uint32_t shift = order.le ? (i * 8) : ((3 - i) * 8);
            dst[i] = std::byte { static_cast<uint8_t>((v >> shift) & 0xFF) };
        }
    }


    static uint64_t padded(uint64_t n) noexcept { return n + (n & 1U); }


    static uint64_t out_of_line_bytes(const TiffIfd& ifd) noexcept
    {
        uint64_t total = 0;
        for (const TiffField& f : ifd.fields) {
            if (f.data.size() > kInlineValueBytes) {
                total += padded(f.data.size());
            }
        }
        return total;
    }


    static uint64_t ifd_size(const TiffIfd& ifd) noexcept
    {
        return 2U + static_cast<uint64_t>(ifd.fields.size()) * kIfdEntrySize
               + 4U + out_of_line_bytes(ifd);
    }


    static TiffStatus parse_ifd(ByteOrder order,
                                std::span<const std::byte> bytes,
                                uint64_t ifd_off, const TiffLimits& limits,
                                TiffIfd* out, uint32_t* next_off) noexcept
    {
        uint16_t entry_count = 0;
        if (!read_u16(order, bytes, ifd_off, &entry_count)) {
            return TiffStatus::Malformed;
        }
        if (entry_count > limits.max_entries_per_ifd) {
            return TiffStatus::LimitExceeded;
        }
        const uint64_t entries_off = ifd_off + 2U;
        const uint64_t table_end   = entries_off
                                   + static_cast<uint64_t>(entry_count)
                                         * kIfdEntrySize;
        if (!read_u32(order, bytes, table_end, next_off)) {
            return TiffStatus::Malformed;
        }

        out->fields.clear();
        out->fields.reserve(entry_count);
        for (uint32_t i = 0; i < entry_count; ++i) {
            const uint64_t eoff = entries_off
                                  + static_cast<uint64_t>(i) * kIfdEntrySize;
            TiffField field;
            uint32_t value_or_off = 0;
            if (!read_u16(order, bytes, eoff + 0, &field.tag)
                || !read_u16(order, bytes, eoff + 2, &field.type)
                || !read_u32(order, bytes, eoff + 4, &field.count)
                || !read_u32(order, bytes, eoff + 8, &value_or_off)) {
                return TiffStatus::Malformed;
            }

            const uint32_t unit = tiff_type_size(field.type);
            if (unit == 0) {
                return TiffStatus::Malformed;
            }
            const uint64_t value_bytes = static_cast<uint64_t>(field.count)
                                         * unit;
            if (value_bytes > limits.max_value_bytes) {
                return TiffStatus::LimitExceeded;
            }

            uint64_t value_off = eoff + 8U;
            if (value_bytes > kInlineValueBytes) {
                value_off = value_or_off;
            }
            if (value_off > bytes.size()
                || value_bytes > bytes.size() - value_off) {
                return TiffStatus::Malformed;
            }
            field.data.assign(bytes.begin() + static_cast<ptrdiff_t>(value_off),
                              bytes.begin()
                                  + static_cast<ptrdiff_t>(value_off
                                                           + value_bytes));
            out->fields.push_back(std::move(field));
        }
        return TiffStatus::Ok;
    }


    static void write_ifd(ByteOrder order, const TiffIfd& ifd,
                          uint64_t ifd_off, uint32_t next_off,
                          std::byte* base) noexcept
    {
        std::byte* p = base + ifd_off;
        put_u16(order, p, static_cast<uint16_t>(ifd.fields.size()));

        uint64_t value_off = ifd_off + 2U
                             + static_cast<uint64_t>(ifd.fields.size())
                                   * kIfdEntrySize
                             + 4U;
        for (size_t i = 0; i < ifd.fields.size(); ++i) {
            const TiffField& f = ifd.fields[i];
            std::byte* e       = p + 2U + i * kIfdEntrySize;
            put_u16(order, e + 0, f.tag);
            put_u16(order, e + 2, f.type);
            put_u32(order, e + 4, f.count);
            if (f.data.size() <= kInlineValueBytes) {
                std::memset(e + 8, 0, kInlineValueBytes);
                if (!f.data.empty()) {
                    std::memcpy(e + 8, f.data.data(), f.data.size());
                }
                continue;
            }
            put_u32(order, e + 8, static_cast<uint32_t>(value_off));
            std::memcpy(base + value_off, f.data.data(), f.data.size());
            if (f.data.size() & 1U) {
                base[value_off + f.data.size()] = std::byte { 0 };
            }
            value_off += padded(f.data.size());
        }
        put_u32(order, p + 2U + ifd.fields.size() * kIfdEntrySize, next_off);
    }

}  // namespace

const char*
tiff_status_name(TiffStatus status) noexcept
{
    switch (status) {
    case TiffStatus::Ok: return "ok";
    case TiffStatus::Unsupported: return "unsupported";
    case TiffStatus::Malformed: return "malformed";
    case TiffStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


uint32_t
tiff_type_size(uint16_t type) noexcept
{
    switch (type) {
    case 1:  // BYTE
    case 2:  // ASCII
    case 6:  // SBYTE
    case 7:  // UNDEFINED
        return 1U;
    case 3:  // SHORT
    case 8:  // SSHORT
        return 2U;
    case 4:   // LONG
    case 9:   // SLONG
    case 11:  // FLOAT
        return 4U;
    case 5:   // RATIONAL
    case 10:  // SRATIONAL
    case 12:  // DOUBLE
        return 8U;
    default: return 0U;
    }
}


TiffStatus
parse_tiff_tree(std::span<const std::byte> bytes, TagSpace first_space,
                TiffTree* out, const TiffLimits& limits) noexcept
{
    if (!out) {
        return TiffStatus::Malformed;
    }
    out->ifds.clear();

    if (bytes.size() < kTiffHeaderSize) {
        return TiffStatus::Unsupported;
    }
    ByteOrder order;
    if (u8(bytes[0]) == 'I' && u8(bytes[1]) == 'I') {
        order.le = true;
    } else if (u8(bytes[0]) == 'M' && u8(bytes[1]) == 'M') {
        order.le = false;
    } else {
        return TiffStatus::Unsupported;
    }
    uint16_t magic   = 0;
    uint32_t ifd_off = 0;
    if (!read_u16(order, bytes, 2, &magic) || magic != 42U
        || !read_u32(order, bytes, 4, &ifd_off)) {
        return TiffStatus::Unsupported;
    }
    out->little_endian = order.le;

    // IFDs must move strictly forward; this also rules out cycles.
    uint64_t min_off = kTiffHeaderSize;
    TagSpace space   = first_space;
    while (ifd_off != 0U) {
        if (out->ifds.size() >= limits.max_ifds) {
            return TiffStatus::LimitExceeded;
        }
        if (ifd_off < min_off) {
            return TiffStatus::Malformed;
        }
        TiffIfd ifd;
        ifd.space         = space;
        uint32_t next_off = 0;
        const TiffStatus st = parse_ifd(order, bytes, ifd_off, limits, &ifd,
                                        &next_off);
        if (st != TiffStatus::Ok) {
            return st;
        }
        min_off = static_cast<uint64_t>(ifd_off) + 2U
                  + static_cast<uint64_t>(ifd.fields.size()) * kIfdEntrySize
                  + 4U;
        out->ifds.push_back(std::move(ifd));
        ifd_off = next_off;
        space   = TagSpace::MpfAttribute;
    }
    return TiffStatus::Ok;
}


uint64_t
tiff_tree_size(const TiffTree& tree) noexcept
{
    uint64_t total = kTiffHeaderSize;
    for (const TiffIfd& ifd : tree.ifds) {
        total += ifd_size(ifd);
    }
    return total;
}


TiffStatus
serialize_tiff_tree(const TiffTree& tree, std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return TiffStatus::Malformed;
    }
    for (const TiffIfd& ifd : tree.ifds) {
        if (ifd.fields.size() > 0xFFFFU) {
            return TiffStatus::LimitExceeded;
        }
        for (const TiffField& f : ifd.fields) {
            if (static_cast<uint64_t>(f.count) * tiff_type_size(f.type)
                != f.data.size()) {
                return TiffStatus::Malformed;
            }
        }
    }
    const uint64_t size = tiff_tree_size(tree);
    if (size > 0xFFFFFFFFULL) {
        return TiffStatus::LimitExceeded;
    }

    const size_t start = out->size();
    out->resize(start + static_cast<size_t>(size));
    std::byte* base = out->data() + start;

    const ByteOrder order { tree.little_endian };
    base[0] = std::byte { static_cast<uint8_t>(order.le ? 'I' : 'M') };
    base[1] = base[0];
    put_u16(order, base + 2, 42);
    put_u32(order, base + 4, tree.ifds.empty() ? 0U : kTiffHeaderSize);

    uint64_t ifd_off = kTiffHeaderSize;
    for (size_t i = 0; i < tree.ifds.size(); ++i) {
        const uint64_t this_size = ifd_size(tree.ifds[i]);
        const uint32_t next_off  = (i + 1 < tree.ifds.size())
                                       ? static_cast<uint32_t>(ifd_off
                                                               + this_size)
                                       : 0U;
        write_ifd(order, tree.ifds[i], ifd_off, next_off, base);
        ifd_off += this_size;
    }
    return TiffStatus::Ok;
}


const TiffField*
find_field(const TiffIfd& ifd, uint16_t tag) noexcept
{
    for (const TiffField& f : ifd.fields) {
        if (f.tag == tag) {
            return &f;
        }
    }
    return nullptr;
}


TiffField*
find_field(TiffIfd& ifd, uint16_t tag) noexcept
{
    for (TiffField& f : ifd.fields) {
        if (f.tag == tag) {
            return &f;
        }
    }
    return nullptr;
}


bool
field_get_u32(const TiffField& field, bool little_endian, uint32_t index,
              uint32_t* out) noexcept
{
    if (!out) {
        return false;
    }
    const uint64_t off = static_cast<uint64_t>(index) * 4U;
    return read_u32(ByteOrder { little_endian },
                    std::span<const std::byte>(field.data.data(),
                                               field.data.size()),
                    off, out);
}


bool
field_set_u32(TiffField& field, bool little_endian, uint32_t index,
              uint32_t value) noexcept
{
    const uint64_t off = static_cast<uint64_t>(index) * 4U;
    if (off + 4U > field.data.size()) {
        return false;
    }
    put_u32(ByteOrder { little_endian },
            field.data.data() + static_cast<size_t>(off), value);
    return true;
}

}  // namespace jpegseg
