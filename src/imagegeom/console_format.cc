#include "imagegeom/console_format.h"

#include <cstdio>

namespace imagegeom {
namespace {

    static void append_escaped_byte(unsigned char c, std::string* out) noexcept
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(c));
        out->append(buf);
    }


    static uint32_t clamp_len(size_t size, uint32_t max_bytes) noexcept
    {
        if (max_bytes == 0U || size < max_bytes) {
            return static_cast<uint32_t>(size);
        }
        return max_bytes;
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool escaped     = false;
    const uint32_t n = clamp_len(s.size(), max_bytes);

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '\\':
        case '"':
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        case '\n':
            out->append("\\n");
            escaped = true;
            continue;
        case '\r':
            out->append("\\r");
            escaped = true;
            continue;
        case '\t':
            out->append("\\t");
            escaped = true;
            continue;
        default: break;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            append_escaped_byte(c, out);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    static constexpr char kHexDigits[] = "0123456789ABCDEF";

    const uint32_t n = clamp_len(bytes.size(), max_bytes);
    out->reserve(out->size() + static_cast<size_t>(n) * 2U);
    for (uint32_t i = 0; i < n; ++i) {
        const uint8_t v = static_cast<uint8_t>(bytes[i]);
        out->push_back(kHexDigits[(v >> 4) & 0x0F]);
        out->push_back(kHexDigits[v & 0x0F]);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}


void
append_fourcc_text(uint32_t fourcc_value, std::string* out) noexcept
{
    for (int shift = 24; shift >= 0; shift -= 8) {
        const unsigned char c = static_cast<unsigned char>(
            (fourcc_value >> shift) & 0xFFU);
        if (c < 0x20U || c >= 0x7FU) {
            append_escaped_byte(c, out);
        } else {
            out->push_back(static_cast<char>(c));
        }
    }
}


void
append_source_label(ImageFormat format, uint32_t source_id,
                    std::string* out) noexcept
{
    switch (format) {
    case ImageFormat::Webp:
    case ImageFormat::Png: append_fourcc_text(source_id, out); return;
    case ImageFormat::Jpeg: {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "SOF%u",
                      static_cast<unsigned>(source_id & 0x0FU));
        out->append(buf);
        return;
    }
    case ImageFormat::Unknown: return;
    }
}

}  // namespace imagegeom
