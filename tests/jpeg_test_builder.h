#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>
#include <vector>

// Byte builders shared by the unit tests: hand-assembled JPEG streams and
// MPF segments with known layouts.

namespace jpegseg::test {

inline void
append_u8(std::vector<std::byte>* out, uint8_t v)
{
    out->push_back(std::byte { v });
}


inline void
append_u16be(std::vector<std::byte>* out, uint16_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


inline void
append_u32be(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


inline void
append_u16le(std::vector<std::byte>* out, uint16_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
}


inline void
append_u32le(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
}


inline void
append_bytes(std::vector<std::byte>* out, std::string_view s)
{
    out->insert(out->end(), reinterpret_cast<const std::byte*>(s.data()),
                reinterpret_cast<const std::byte*>(s.data() + s.size()));
}


inline void
append_span(std::vector<std::byte>* out, std::span<const std::byte> s)
{
    out->insert(out->end(), s.begin(), s.end());
}


inline std::vector<std::byte>
bytes_of(std::initializer_list<uint8_t> values)
{
    std::vector<std::byte> out;
    out.reserve(values.size());
    for (uint8_t v : values) {
        out.push_back(std::byte { v });
    }
    return out;
}


inline void
append_marker(std::vector<std::byte>* out, uint8_t marker)
{
    append_u8(out, 0xFF);
    append_u8(out, marker);
}


inline void
append_segment(std::vector<std::byte>* out, uint8_t marker,
               std::span<const std::byte> payload)
{
    append_marker(out, marker);
    append_u16be(out, static_cast<uint16_t>(payload.size() + 2));
    append_span(out, payload);
}


inline void
append_u16(std::vector<std::byte>* out, bool le, uint16_t v)
{
    if (le) {
        append_u16le(out, v);
    } else {
        append_u16be(out, v);
    }
}


inline void
append_u32(std::vector<std::byte>* out, bool le, uint32_t v)
{
    if (le) {
        append_u32le(out, v);
    } else {
        append_u32be(out, v);
    }
}


struct MpfEntrySpec final {
    uint32_t length          = 0;
    uint32_t relative_offset = 0;
};

/// Size of the APP2 payload built by \ref make_mpf_index_payload.
inline constexpr uint32_t
mpf_index_payload_size(uint32_t count)
{
    // "MPF\0" + header + IFD(count, 3 entries, next) + entry table.
    return 4U + 8U + 2U + 3U * 12U + 4U + 16U * count;
}

/**
 * "MPF\0" + TIFF with one MP Index IFD: MPFVersion "0100", NumberOfImages,
 * MPEntry (UNDEFINED, 16 bytes per image, stored right after the IFD).
 */
inline std::vector<std::byte>
make_mpf_index_payload(std::span<const MpfEntrySpec> entries, bool le = true,
                       uint32_t declared_count = 0xFFFFFFFFU)
{
    const uint32_t count = static_cast<uint32_t>(entries.size());
    const uint32_t n     = declared_count == 0xFFFFFFFFU ? count
                                                         : declared_count;
    std::vector<std::byte> out;
    append_bytes(&out, std::string_view("MPF\0", 4));
    append_bytes(&out, le ? "II" : "MM");
    append_u16(&out, le, 42);
    append_u32(&out, le, 8);

    append_u16(&out, le, 3);

    append_u16(&out, le, 0xB000);
    append_u16(&out, le, 7);
    append_u32(&out, le, 4);
    append_bytes(&out, "0100");

    append_u16(&out, le, 0xB001);
    append_u16(&out, le, 4);
    append_u32(&out, le, 1);
    append_u32(&out, le, n);

    append_u16(&out, le, 0xB002);
    append_u16(&out, le, 7);
    append_u32(&out, le, 16U * count);
    append_u32(&out, le, 8U + 2U + 3U * 12U + 4U);

    append_u32(&out, le, 0);

    for (uint32_t i = 0; i < count; ++i) {
        append_u32(&out, le, i == 0 ? 0x20030000U : 0x00020002U);
        append_u32(&out, le, entries[i].length);
        append_u32(&out, le, entries[i].relative_offset);
        append_u16(&out, le, 0);
        append_u16(&out, le, 0);
    }
    return out;
}

/// "MPF\0" + big-endian TIFF with one MP Attribute IFD.
inline std::vector<std::byte>
make_mpf_attribute_payload(uint32_t individual_number)
{
    std::vector<std::byte> out;
    append_bytes(&out, std::string_view("MPF\0", 4));
    append_bytes(&out, "MM");
    append_u16be(&out, 42);
    append_u32be(&out, 8);

    append_u16be(&out, 2);

    append_u16be(&out, 0xB000);
    append_u16be(&out, 7);
    append_u32be(&out, 4);
    append_bytes(&out, "0100");

    append_u16be(&out, 0xB101);
    append_u16be(&out, 4);
    append_u32be(&out, 1);
    append_u32be(&out, individual_number);

    append_u32be(&out, 0);
    return out;
}

/// Raw (already stuffed) scan data: contains a stuffed FF and a restart.
inline std::vector<std::byte>
stuffed_scan_data()
{
    return bytes_of({ 0x11, 0x22, 0xFF, 0x00, 0x33, 0xFF, 0xD0, 0x44, 0x55 });
}

/**
 * SOI, optional APP2, DQT, SOS, scan data, EOI.
 *
 * Scan data unstuffs to 11 22 FF 33 before RST0 and 44 55 after it.
 */
inline std::vector<std::byte>
make_image(std::span<const std::byte> app2_payload)
{
    std::vector<std::byte> out;
    append_marker(&out, 0xD8);
    if (!app2_payload.empty()) {
        append_segment(&out, 0xE2, app2_payload);
    }
    const std::vector<std::byte> dqt = bytes_of({ 0x00, 0x01, 0x02, 0x03 });
    append_segment(&out, 0xDB, dqt);
    const std::vector<std::byte> sos
        = bytes_of({ 0x01, 0x01, 0x00, 0x00, 0x3F, 0x00 });
    append_segment(&out, 0xDA, sos);
    append_span(&out, stuffed_scan_data());
    append_marker(&out, 0xD9);
    return out;
}


/// A three-image MPF file and the positions used to build it.
struct MpfFile final {
    std::vector<std::byte> bytes;
    std::vector<uint32_t> offsets;  // absolute
    std::vector<uint32_t> sizes;
};

/// APP2 starts right after SOI, so the MPF offset base is 2 + 8.
inline constexpr uint32_t kPrimaryMpfBase = 10;

/**
 * Primary image with an MP Index, a second image with an MP Attribute
 * segment, a plain third image. \p padding bytes of junk precede each extra
 * image.
 */
inline MpfFile
make_mpf_file(uint32_t padding, bool le = true)
{
    const std::vector<std::byte> attr = make_mpf_attribute_payload(2);
    const std::vector<std::byte> img1 = make_image(attr);
    const std::vector<std::byte> img2 = make_image({});

    std::vector<MpfEntrySpec> entries(3);
    std::vector<std::byte> img0
        = make_image(make_mpf_index_payload(entries, le));
    const uint32_t s0 = static_cast<uint32_t>(img0.size());
    const uint32_t s1 = static_cast<uint32_t>(img1.size());
    const uint32_t s2 = static_cast<uint32_t>(img2.size());
    const uint32_t o1 = s0 + padding;
    const uint32_t o2 = o1 + s1 + padding;

    entries[0] = { s0, 0 };
    entries[1] = { s1, o1 - kPrimaryMpfBase };
    entries[2] = { s2, o2 - kPrimaryMpfBase };
    img0       = make_image(make_mpf_index_payload(entries, le));

    MpfFile file;
    append_span(&file.bytes, img0);
    file.bytes.insert(file.bytes.end(), padding, std::byte { 0x5A });
    append_span(&file.bytes, img1);
    file.bytes.insert(file.bytes.end(), padding, std::byte { 0x5A });
    append_span(&file.bytes, img2);
    file.offsets = { 0, o1, o2 };
    file.sizes   = { s0, s1, s2 };
    return file;
}

}  // namespace jpegseg::test
