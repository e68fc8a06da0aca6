#pragma once

#include "imagegeom/image_geometry.h"

#include <cstring>

namespace imagegeom::byte_internal {

// Bounds-checked, byte-order explicit readers shared by the format decoders.
// Every reader returns false (leaving *out untouched) when the field would
// extend past the end of `bytes`.

inline constexpr uint8_t
u8(std::byte b) noexcept
{
    return static_cast<uint8_t>(b);
}


inline bool
fits(std::span<const std::byte> bytes, uint64_t offset, uint64_t len) noexcept
{
    const uint64_t size = static_cast<uint64_t>(bytes.size());
    return offset <= size && len <= size - offset;
}


inline bool
match(std::span<const std::byte> bytes, uint64_t offset, const char* s,
      uint32_t s_len) noexcept
{
    if (!fits(bytes, offset, s_len)) {
        return false;
    }
    return std::memcmp(bytes.data() + static_cast<size_t>(offset), s,
                       static_cast<size_t>(s_len))
           == 0;
}


inline bool
match_bytes(std::span<const std::byte> bytes, uint64_t offset,
            const std::byte* data, uint32_t data_len) noexcept
{
    if (!fits(bytes, offset, data_len)) {
        return false;
    }
    return std::memcmp(bytes.data() + static_cast<size_t>(offset), data,
                       static_cast<size_t>(data_len))
           == 0;
}


inline bool
read_u16be(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (!fits(bytes, offset, 2)) {
        return false;
    }
    *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 8)
                                 | (u8(bytes[offset + 1]) << 0));
    return true;
}


inline bool
read_u16le(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (!fits(bytes, offset, 2)) {
        return false;
    }
    *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 0)
                                 | (u8(bytes[offset + 1]) << 8));
    return true;
}


// Exactly three bytes; never touches offset + 3.
inline bool
read_u24le(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!fits(bytes, offset, 3)) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 0)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16);
    return true;
}


inline bool
read_u32be(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!fits(bytes, offset, 4)) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
           | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
    return true;
}


inline bool
read_u32le(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!fits(bytes, offset, 4)) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 0)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16)
           | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 24);
    return true;
}


inline DimensionsResult
dimensions_failure(GeometryStatus status) noexcept
{
    DimensionsResult res;
    res.status = status;
    return res;
}

}  // namespace imagegeom::byte_internal
