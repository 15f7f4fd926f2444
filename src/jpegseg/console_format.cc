#include "jpegseg/console_format.h"

#include <cstddef>
#include <cstdio>

namespace jpegseg {

namespace {

    static size_t clamp_count(size_t size, uint32_t max_bytes) noexcept
    {
        if (max_bytes == 0U || size < max_bytes) {
            return size;
        }
        return max_bytes;
    }

}  // namespace


bool
append_escaped_text(std::span<const std::byte> bytes, uint32_t max_bytes,
                    std::string* out) noexcept
{
    if (!out) {
        return false;
    }
    bool escaped     = false;
    const size_t n = clamp_count(bytes.size(), max_bytes);

    out->reserve(out->size() + n);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t c = static_cast<uint8_t>(bytes[i]);
        switch (c) {
        case '\\':
        case '"':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            escaped = true;
            continue;
        case '\n': out->append("\\n"); escaped = true; continue;
        case '\r': out->append("\\r"); escaped = true; continue;
        case '\t': out->append("\\t"); escaped = true; continue;
        default: break;
        }
        if (c < 0x20U || c >= 0x7FU) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(c));
            out->append(buf);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < bytes.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    if (!out) {
        return;
    }
    static constexpr char kHex[] = "0123456789ABCDEF";
    const size_t n               = clamp_count(bytes.size(), max_bytes);

    out->reserve(out->size() + n * 2U);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t v = static_cast<uint8_t>(bytes[i]);
        out->push_back(kHex[v >> 4]);
        out->push_back(kHex[v & 0x0F]);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}


std::string_view
app_identifier(std::span<const std::byte> payload, uint32_t max_bytes) noexcept
{
    const size_t n = clamp_count(payload.size(), max_bytes);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t c = static_cast<uint8_t>(payload[i]);
        if (c == 0) {
            if (i == 0) {
                return {};
            }
            return std::string_view(reinterpret_cast<const char*>(
                                        payload.data()),
                                    i);
        }
        if (c < 0x20U || c >= 0x7FU) {
            return {};
        }
    }
    return {};
}

}  // namespace jpegseg
