#pragma once

#include "imagegeom/image_geometry.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace imagegeom {

// Appends an ASCII-only, terminal-safe rendering of `s` (typically a file
// path) into `out`.
//
// - Escapes `\n`, `\r`, `\t`, backslash and double quote
// - Escapes other control bytes and non-ASCII as `\xNN`
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when any control byte was escaped or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends uppercase hex bytes into `out` (no "0x" prefix), e.g. the magic
// prefix of an unrecognized file.
// Truncates to `max_bytes` (0 = unlimited) and appends "..." when truncated.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

// Appends a FourCC as four printable characters; non-printable bytes are
// rendered as `\xNN`. Trailing spaces are kept ("VP8 ").
void
append_fourcc_text(uint32_t fourcc_value, std::string* out) noexcept;

// Appends a short label for DimensionsResult::source_id:
// - WebP/PNG: the chunk FourCC
// - JPEG: "SOFn" for the 0xFFCn frame marker
// Appends nothing for ImageFormat::Unknown.
void
append_source_label(ImageFormat format, uint32_t source_id,
                    std::string* out) noexcept;

}  // namespace imagegeom
