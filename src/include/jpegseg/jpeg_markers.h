#pragma once

#include <cstdint>
#include <string_view>

/**
 * \file jpeg_markers.h
 * \brief JPEG marker codes and their display names.
 */

namespace jpegseg {

/// Pseudo-marker reported for entropy-coded scan data (never a real marker).
inline constexpr uint8_t kImageDataMarker = 0x00;

inline constexpr uint8_t kMarkerTem  = 0x01;
inline constexpr uint8_t kMarkerSof0 = 0xC0;  // SOFn = SOF0 + n, except 4, 8, 12
inline constexpr uint8_t kMarkerDht  = 0xC4;
inline constexpr uint8_t kMarkerJpg  = 0xC8;
inline constexpr uint8_t kMarkerDac  = 0xCC;
inline constexpr uint8_t kMarkerRst0 = 0xD0;  // RSTn = RST0 + n, n = 0..7
inline constexpr uint8_t kMarkerSoi  = 0xD8;
inline constexpr uint8_t kMarkerEoi  = 0xD9;
inline constexpr uint8_t kMarkerSos  = 0xDA;
inline constexpr uint8_t kMarkerDqt  = 0xDB;
inline constexpr uint8_t kMarkerDnl  = 0xDC;
inline constexpr uint8_t kMarkerDri  = 0xDD;
inline constexpr uint8_t kMarkerDhp  = 0xDE;
inline constexpr uint8_t kMarkerExp  = 0xDF;
inline constexpr uint8_t kMarkerApp0 = 0xE0;  // APPn = APP0 + n, n = 0..15
inline constexpr uint8_t kMarkerApp2 = 0xE2;
inline constexpr uint8_t kMarkerJpg0 = 0xF0;  // JPGn = JPG0 + n, n = 0..13
inline constexpr uint8_t kMarkerCom  = 0xFE;
inline constexpr uint8_t kMarkerFill = 0xFF;

/**
 * \brief Returns the display name of a marker code.
 *
 * Every code 0x00..0xFF has a name: singleton markers use their standard
 * mnemonic (`SOI`, `DHT`, ...), the four families are numbered (`SOF3`,
 * `RST7`, `APP15`, `JPG13`) and unassigned codes read `RESxx` (upper-case
 * hex). 0x00 is `NUL`, 0xFF is `FILL`.
 *
 * The returned view refers to static storage.
 */
std::string_view
marker_name(uint8_t marker) noexcept;

constexpr bool
is_rst_marker(uint8_t marker) noexcept
{
    return marker >= kMarkerRst0 && marker <= kMarkerRst0 + 7;
}


constexpr bool
is_app_marker(uint8_t marker) noexcept
{
    return marker >= kMarkerApp0 && marker <= kMarkerApp0 + 0x0F;
}


constexpr bool
is_jpg_marker(uint8_t marker) noexcept
{
    return marker >= kMarkerJpg0 && marker <= kMarkerJpg0 + 0x0D;
}


/// True for markers followed by a length-prefixed segment. Only EOI, TEM
/// and RST0..7 stand alone; a SOI after the header carries a payload.
constexpr bool
marker_has_payload(uint8_t marker) noexcept
{
    return marker != kImageDataMarker && marker != kMarkerTem
           && marker != kMarkerEoi && !is_rst_marker(marker);
}


/// True for markers that are followed by entropy-coded scan data.
constexpr bool
starts_scan_data(uint8_t marker) noexcept
{
    return marker == kMarkerSos || is_rst_marker(marker);
}

}  // namespace jpegseg
