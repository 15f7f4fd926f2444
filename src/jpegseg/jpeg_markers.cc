#include "jpegseg/jpeg_markers.h"

#include <array>
#include <cstdint>

namespace jpegseg {
namespace {

    struct MarkerNameEntry final {
        char text[8] = {};
        uint8_t len  = 0;
    };

    using MarkerNameTable = std::array<MarkerNameEntry, 256>;

    static constexpr char kHexDigits[] = "0123456789ABCDEF";

    static constexpr void set_literal(MarkerNameTable& table, uint8_t code,
                                      std::string_view name) noexcept
    {
        MarkerNameEntry& e = table[code];
        e.len              = 0;
        for (char c : name) {
            e.text[e.len++] = c;
        }
    }


    static constexpr void set_hex(MarkerNameTable& table, uint8_t code,
                                  std::string_view prefix) noexcept
    {
        set_literal(table, code, prefix);
        MarkerNameEntry& e = table[code];
        e.text[e.len++]    = kHexDigits[(code >> 4) & 0x0F];
        e.text[e.len++]    = kHexDigits[code & 0x0F];
    }


    static constexpr void set_numbered(MarkerNameTable& table, uint8_t code,
                                       std::string_view family,
                                       uint32_t index) noexcept
    {
        set_literal(table, code, family);
        MarkerNameEntry& e = table[code];
        if (index >= 10) {
            e.text[e.len++] = static_cast<char>('0' + index / 10);
        }
        e.text[e.len++] = static_cast<char>('0' + index % 10);
    }


    static constexpr MarkerNameTable make_marker_names() noexcept
    {
        MarkerNameTable table {};

        for (uint32_t i = 0x02; i <= 0xBF; ++i) {
            set_hex(table, static_cast<uint8_t>(i), "RES");
        }
        for (uint32_t n = 0; n <= 0x0F; ++n) {
            if (n == 4 || n == 8 || n == 12) {
                continue;
            }
            set_numbered(table, static_cast<uint8_t>(kMarkerSof0 + n), "SOF",
                         n);
        }
        for (uint32_t n = 0; n <= 7; ++n) {
            set_numbered(table, static_cast<uint8_t>(kMarkerRst0 + n), "RST",
                         n);
        }
        for (uint32_t n = 0; n <= 0x0F; ++n) {
            set_numbered(table, static_cast<uint8_t>(kMarkerApp0 + n), "APP",
                         n);
        }
        for (uint32_t n = 0; n <= 0x0D; ++n) {
            set_numbered(table, static_cast<uint8_t>(kMarkerJpg0 + n), "JPG",
                         n);
        }

        set_literal(table, 0x00, "NUL");
        set_literal(table, kMarkerTem, "TEM");
        set_literal(table, kMarkerDht, "DHT");
        set_literal(table, kMarkerJpg, "JPG");
        set_literal(table, kMarkerDac, "DAC");
        set_literal(table, kMarkerSoi, "SOI");
        set_literal(table, kMarkerEoi, "EOI");
        set_literal(table, kMarkerSos, "SOS");
        set_literal(table, kMarkerDqt, "DQT");
        set_literal(table, kMarkerDnl, "DNL");
        set_literal(table, kMarkerDri, "DRI");
        set_literal(table, kMarkerDhp, "DHP");
        set_literal(table, kMarkerExp, "EXP");
        set_literal(table, kMarkerCom, "COM");
        set_literal(table, kMarkerFill, "FILL");
        return table;
    }

    static constexpr MarkerNameTable kMarkerNames = make_marker_names();

    static_assert(kMarkerNames[0xC4].len == 3);
    static_assert(kMarkerNames[0xEF].len == 5);

}  // namespace

std::string_view
marker_name(uint8_t marker) noexcept
{
    const MarkerNameEntry& e = kMarkerNames[marker];
    return std::string_view(e.text, e.len);
}

}  // namespace jpegseg
