#include "imagegeom/image_geometry.h"

#include "byte_read_internal.h"

#include <array>

namespace imagegeom {
namespace {

    using byte_internal::match;
    using byte_internal::match_bytes;

    static constexpr uint32_t kWebpMinSize = 12;
    static constexpr uint32_t kJpegMinSize = 3;
    // Signature plus the IHDR length/type/width/height fields.
    static constexpr uint32_t kPngMinSize = 24;

    static constexpr std::array<std::byte, 3> kJpegSignature = {
        std::byte { 0xFF },
        std::byte { 0xD8 },
        std::byte { 0xFF },
    };

    static constexpr uint32_t kPngSignatureSize                             = 8;
    static constexpr std::array<std::byte, kPngSignatureSize> kPngSignature = {
        std::byte { 0x89 }, std::byte { 0x50 }, std::byte { 0x4E },
        std::byte { 0x47 }, std::byte { 0x0D }, std::byte { 0x0A },
        std::byte { 0x1A }, std::byte { 0x0A },
    };


    static bool is_webp(std::span<const std::byte> bytes) noexcept
    {
        return bytes.size() >= kWebpMinSize && match(bytes, 0, "RIFF", 4)
               && match(bytes, 8, "WEBP", 4);
    }


    static bool is_jpeg(std::span<const std::byte> bytes) noexcept
    {
        return bytes.size() >= kJpegMinSize
               && match_bytes(bytes, 0, kJpegSignature.data(),
                              static_cast<uint32_t>(kJpegSignature.size()));
    }


    static bool is_png(std::span<const std::byte> bytes) noexcept
    {
        return bytes.size() >= kPngMinSize
               && match_bytes(bytes, 0, kPngSignature.data(),
                              kPngSignatureSize);
    }

}  // namespace

ImageFormat
classify_image(std::span<const std::byte> bytes) noexcept
{
    if (is_webp(bytes)) {
        return ImageFormat::Webp;
    }
    if (is_jpeg(bytes)) {
        return ImageFormat::Jpeg;
    }
    if (is_png(bytes)) {
        return ImageFormat::Png;
    }
    return ImageFormat::Unknown;
}

}  // namespace imagegeom
