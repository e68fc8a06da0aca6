#include "imagegeom/image_geometry.h"

#include "byte_read_internal.h"

namespace imagegeom {
namespace {

    using byte_internal::dimensions_failure;
    using byte_internal::read_u16le;
    using byte_internal::read_u24le;
    using byte_internal::read_u32be;
    using byte_internal::read_u32le;

    static constexpr uint64_t kRiffHeaderSize  = 12;
    static constexpr uint64_t kChunkHeaderSize = 8;

    // VP8 key frame: 3-byte frame tag, 3-byte start code, then 14-bit
    // width/height fields (upper 2 bits are the scaling mode).
    static constexpr uint64_t kVp8DimensionOffset = 6;
    // VP8L: 1-byte signature (0x2F), then a packed u32 (14-bit w-1, h-1).
    static constexpr uint64_t kVp8lHeaderOffset = 1;
    // VP8X: flags(1) + reserved(3), then canvas width-1 and height-1 as u24le.
    static constexpr uint64_t kVp8xWidthOffset  = 4;
    static constexpr uint64_t kVp8xHeightOffset = 7;

    static constexpr uint32_t kDimension14Mask = 0x3FFFU;


    static DimensionsResult make_result(uint32_t width, uint32_t height,
                                        uint32_t type,
                                        uint64_t chunk_off) noexcept
    {
        DimensionsResult res;
        res.dimensions.width  = width;
        res.dimensions.height = height;
        res.dimensions.format = ImageFormat::Webp;
        res.source_id         = type;
        res.source_offset     = chunk_off;
        return res;
    }


    static bool read_vp8(std::span<const std::byte> bytes, uint64_t data_off,
                         uint32_t* width, uint32_t* height) noexcept
    {
        uint16_t w = 0;
        uint16_t h = 0;
        if (!read_u16le(bytes, data_off + kVp8DimensionOffset, &w)
            || !read_u16le(bytes, data_off + kVp8DimensionOffset + 2, &h)) {
            return false;
        }
        *width  = (static_cast<uint32_t>(w) & kDimension14Mask) + 1U;
        *height = (static_cast<uint32_t>(h) & kDimension14Mask) + 1U;
        return true;
    }


    static bool read_vp8l(std::span<const std::byte> bytes, uint64_t data_off,
                          uint32_t* width, uint32_t* height) noexcept
    {
        uint32_t bits = 0;
        if (!read_u32le(bytes, data_off + kVp8lHeaderOffset, &bits)) {
            return false;
        }
        *width  = (bits & kDimension14Mask) + 1U;
        *height = ((bits >> 14) & kDimension14Mask) + 1U;
        return true;
    }


    static bool read_vp8x(std::span<const std::byte> bytes, uint64_t data_off,
                          uint32_t* width, uint32_t* height) noexcept
    {
        uint32_t w = 0;
        uint32_t h = 0;
        if (!read_u24le(bytes, data_off + kVp8xWidthOffset, &w)
            || !read_u24le(bytes, data_off + kVp8xHeightOffset, &h)) {
            return false;
        }
        *width  = w + 1U;
        *height = h + 1U;
        return true;
    }

}  // namespace

DimensionsResult
decode_webp_dimensions(std::span<const std::byte> bytes) noexcept
{
    if (classify_image(bytes) != ImageFormat::Webp) {
        return dimensions_failure(GeometryStatus::UnsupportedFormat);
    }

    const uint64_t size = static_cast<uint64_t>(bytes.size());
    uint64_t offset     = kRiffHeaderSize;
    while (offset + kChunkHeaderSize <= size) {
        const uint64_t chunk_off = offset;
        uint32_t type            = 0;
        uint32_t chunk_size      = 0;
        if (!read_u32be(bytes, offset, &type)
            || !read_u32le(bytes, offset + 4, &chunk_size)) {
            break;
        }
        const uint64_t data_off = offset + kChunkHeaderSize;

        uint32_t width  = 0;
        uint32_t height = 0;
        if (type == fourcc('V', 'P', '8', ' ')) {
            if (!read_vp8(bytes, data_off, &width, &height)) {
                break;
            }
            return make_result(width, height, type, chunk_off);
        }
        if (type == fourcc('V', 'P', '8', 'L')) {
            if (!read_vp8l(bytes, data_off, &width, &height)) {
                break;
            }
            return make_result(width, height, type, chunk_off);
        }
        if (type == fourcc('V', 'P', '8', 'X')) {
            if (!read_vp8x(bytes, data_off, &width, &height)) {
                break;
            }
            return make_result(width, height, type, chunk_off);
        }

        uint64_t next = data_off + static_cast<uint64_t>(chunk_size);
        if ((chunk_size & 1U) != 0U) {
            next += 1;
        }
        if (next > size) {
            break;
        }
        offset = next;
    }

    return dimensions_failure(GeometryStatus::DimensionsNotFound);
}

}  // namespace imagegeom
