#include "imagegeom/image_geometry.h"

#include "byte_read_internal.h"

namespace imagegeom {
namespace {

    using byte_internal::dimensions_failure;
    using byte_internal::read_u16be;
    using byte_internal::u8;

    static constexpr uint64_t kSoiSize = 2;

    // Offsets from the 0xFF marker prefix of a SOFn segment:
    //   FF Cn | u16 length | u8 precision | u16 height | u16 width
    static constexpr uint64_t kSofHeightOffset = 5;
    static constexpr uint64_t kSofWidthOffset  = 7;


    // SOF0-3, SOF5-7, SOF9-11, SOF13-15. C4 (DHT), C8 (JPG) and CC (DAC)
    // share the range but carry no frame header.
    static constexpr bool is_sof_marker(uint8_t marker) noexcept
    {
        return (marker >= 0xC0 && marker <= 0xC3)
               || (marker >= 0xC5 && marker <= 0xC7)
               || (marker >= 0xC9 && marker <= 0xCB)
               || (marker >= 0xCD && marker <= 0xCF);
    }

}  // namespace

DimensionsResult
decode_jpeg_dimensions(std::span<const std::byte> bytes) noexcept
{
    if (classify_image(bytes) != ImageFormat::Jpeg) {
        return dimensions_failure(GeometryStatus::UnsupportedFormat);
    }

    const uint64_t size = static_cast<uint64_t>(bytes.size());
    uint64_t offset     = kSoiSize;
    while (offset + 2 <= size) {
        if (u8(bytes[offset]) != 0xFF) {
            offset += 1;
            continue;
        }
        const uint8_t marker = u8(bytes[offset + 1]);

        if (is_sof_marker(marker)) {
            uint16_t height = 0;
            uint16_t width  = 0;
            if (!read_u16be(bytes, offset + kSofHeightOffset, &height)
                || !read_u16be(bytes, offset + kSofWidthOffset, &width)) {
                break;
            }
            if (width == 0 || height == 0) {
                // Height 0 defers to a DNL segment after the scan; not handled.
                return dimensions_failure(GeometryStatus::MalformedHeader);
            }
            DimensionsResult res;
            res.dimensions.width  = width;
            res.dimensions.height = height;
            res.dimensions.format = ImageFormat::Jpeg;
            res.source_id     = 0xFF00U | static_cast<uint32_t>(marker);
            res.source_offset = offset;
            return res;
        }

        // The length field counts itself but not the marker.
        uint16_t seg_len = 0;
        if (!read_u16be(bytes, offset + 2, &seg_len)) {
            break;
        }
        offset += 2 + static_cast<uint64_t>(seg_len);
    }

    return dimensions_failure(GeometryStatus::DimensionsNotFound);
}

}  // namespace imagegeom
