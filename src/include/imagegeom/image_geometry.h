#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file image_geometry.h
 * \brief Pixel geometry extraction for WebP, JPEG and PNG byte buffers.
 *
 * The extractor reads only the container headers needed to locate the pixel
 * width/height; it never decodes image data. All entry points are pure,
 * allocation-free and safe to call concurrently on independent buffers.
 */

namespace imagegeom {

/// Status code shared by the geometry entry points.
enum class GeometryStatus : uint8_t {
    Ok,
    /// No known signature matched, or the buffer is too short to classify.
    UnsupportedFormat,
    /// The format was recognized but a fixed header structure is inconsistent.
    MalformedHeader,
    /// No dimension-bearing chunk/segment was found before the buffer ended.
    DimensionsNotFound,
    /// A zero width or height was passed to aspect-ratio reduction.
    InvalidDimensions,
};

enum class ImageFormat : uint8_t {
    Unknown,
    Webp,
    Jpeg,
    Png,
};

struct ImageDimensions final {
    uint32_t width     = 0;
    uint32_t height    = 0;
    ImageFormat format = ImageFormat::Unknown;
};

struct AspectRatio final {
    uint32_t width  = 0;
    uint32_t height = 0;
};

struct DimensionsResult final {
    GeometryStatus status = GeometryStatus::Ok;
    ImageDimensions dimensions;

    // Where the dimensions were read from:
    // - WebP: chunk type (FourCC, e.g. "VP8X")
    // - JPEG: SOF marker (0xFFCn)
    // - PNG: chunk type ("IHDR")
    uint32_t source_id = 0;
    // Byte offset of the chunk/segment header that carried the dimensions.
    uint64_t source_offset = 0;
};

struct AspectRatioResult final {
    GeometryStatus status = GeometryStatus::Ok;
    AspectRatio ratio;
};

/// Options for \ref detect_image_dimensions and \ref probe_image_geometry.
struct DetectOptions final {
    /// Inspect at most this many leading bytes (0 = the whole buffer).
    uint64_t max_scan_bytes = 0;
};

/// Dimensions plus the reduced aspect ratio, as attached to an outgoing post.
struct GeometryProbe final {
    GeometryStatus status = GeometryStatus::Ok;
    ImageDimensions dimensions;
    AspectRatio aspect_ratio;
    uint32_t source_id     = 0;
    uint64_t source_offset = 0;
};

static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

/**
 * \brief Classifies \p bytes by magic signature.
 *
 * Checks run in a fixed order (WebP, JPEG, PNG) and the first match wins.
 * Each check also requires a minimum buffer length (12, 3 and 24 bytes).
 * Returns \ref ImageFormat::Unknown when nothing matches.
 */
ImageFormat
classify_image(std::span<const std::byte> bytes) noexcept;

/// Classifies \p bytes and runs the matching format decoder.
DimensionsResult
detect_image_dimensions(std::span<const std::byte> bytes) noexcept;

DimensionsResult
detect_image_dimensions(std::span<const std::byte> bytes,
                        const DetectOptions& options) noexcept;

// Format-specific decoders. Each re-checks its own signature and returns
// GeometryStatus::UnsupportedFormat when it does not match.
DimensionsResult
decode_webp_dimensions(std::span<const std::byte> bytes) noexcept;
DimensionsResult
decode_jpeg_dimensions(std::span<const std::byte> bytes) noexcept;
DimensionsResult
decode_png_dimensions(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Reduces \p width : \p height to lowest terms.
 *
 * Returns GeometryStatus::InvalidDimensions when either input is zero.
 */
AspectRatioResult
reduce_aspect_ratio(uint32_t width, uint32_t height) noexcept;

/// Greatest common divisor (Euclid). Returns the other operand when one is 0.
uint32_t
greatest_common_divisor(uint32_t a, uint32_t b) noexcept;

/// classify -> detect -> reduce in one call; reports the first failure.
GeometryProbe
probe_image_geometry(std::span<const std::byte> bytes) noexcept;

GeometryProbe
probe_image_geometry(std::span<const std::byte> bytes,
                     const DetectOptions& options) noexcept;

/// Stable lowercase name (e.g. "dimensions_not_found").
const char*
geometry_status_name(GeometryStatus status) noexcept;

/// Stable lowercase name ("webp", "jpeg", "png", "unknown").
const char*
image_format_name(ImageFormat format) noexcept;

}  // namespace imagegeom
