#include "imagegeom/image_geometry.h"

#include "byte_read_internal.h"

namespace imagegeom {
namespace {

    using byte_internal::dimensions_failure;
    using byte_internal::read_u32be;

    // IHDR must be the first chunk, directly after the 8-byte signature.
    static constexpr uint64_t kIhdrOffset       = 8;
    static constexpr uint64_t kIhdrWidthOffset  = 16;
    static constexpr uint64_t kIhdrHeightOffset = 20;
    static constexpr uint32_t kIhdrMinLength    = 13;

}  // namespace

DimensionsResult
decode_png_dimensions(std::span<const std::byte> bytes) noexcept
{
    if (classify_image(bytes) != ImageFormat::Png) {
        return dimensions_failure(GeometryStatus::UnsupportedFormat);
    }

    uint32_t len    = 0;
    uint32_t type   = 0;
    uint32_t width  = 0;
    uint32_t height = 0;
    if (!read_u32be(bytes, kIhdrOffset, &len)
        || !read_u32be(bytes, kIhdrOffset + 4, &type)
        || !read_u32be(bytes, kIhdrWidthOffset, &width)
        || !read_u32be(bytes, kIhdrHeightOffset, &height)) {
        return dimensions_failure(GeometryStatus::MalformedHeader);
    }
    if (type != fourcc('I', 'H', 'D', 'R') || len < kIhdrMinLength) {
        return dimensions_failure(GeometryStatus::MalformedHeader);
    }
    if (width == 0 || height == 0) {
        return dimensions_failure(GeometryStatus::MalformedHeader);
    }

    DimensionsResult res;
    res.dimensions.width  = width;
    res.dimensions.height = height;
    res.dimensions.format = ImageFormat::Png;
    res.source_id         = type;
    res.source_offset     = kIhdrOffset;
    return res;
}

}  // namespace imagegeom
