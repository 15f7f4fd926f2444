#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace jpegseg {

// Appends an ASCII-only, terminal-safe rendering of segment bytes to `out`.
//
// - `\n`, `\r`, `\t`, `\\` and `"` are backslash-escaped
// - other control bytes and non-ASCII become `\xNN`
// - at most `max_bytes` input bytes are rendered (0 = all), then "..."
//
// Returns true when anything was escaped or truncated.
bool
append_escaped_text(std::span<const std::byte> bytes, uint32_t max_bytes,
                    std::string* out) noexcept;

// Appends uppercase hex, no separators. Same truncation rule as above.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

// Returns the NUL-terminated identifier that opens most APPn payloads
// ("JFIF", "Exif", "MPF", "http://ns.adobe.com/xap/1.0/"), or an empty view
// when the payload does not start with printable ASCII followed by NUL
// within `max_bytes`.
std::string_view
app_identifier(std::span<const std::byte> payload, uint32_t max_bytes) noexcept;

}  // namespace jpegseg
