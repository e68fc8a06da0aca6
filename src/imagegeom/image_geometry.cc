#include "imagegeom/image_geometry.h"

#include "byte_read_internal.h"

namespace imagegeom {
namespace {

    static std::span<const std::byte>
    scan_window(std::span<const std::byte> bytes,
                const DetectOptions& options) noexcept
    {
        if (options.max_scan_bytes == 0U
            || options.max_scan_bytes >= static_cast<uint64_t>(bytes.size())) {
            return bytes;
        }
        return bytes.first(static_cast<size_t>(options.max_scan_bytes));
    }

}  // namespace

DimensionsResult
detect_image_dimensions(std::span<const std::byte> bytes) noexcept
{
    switch (classify_image(bytes)) {
    case ImageFormat::Webp: return decode_webp_dimensions(bytes);
    case ImageFormat::Jpeg: return decode_jpeg_dimensions(bytes);
    case ImageFormat::Png: return decode_png_dimensions(bytes);
    case ImageFormat::Unknown: break;
    }
    return byte_internal::dimensions_failure(
        GeometryStatus::UnsupportedFormat);
}


DimensionsResult
detect_image_dimensions(std::span<const std::byte> bytes,
                        const DetectOptions& options) noexcept
{
    return detect_image_dimensions(scan_window(bytes, options));
}


GeometryProbe
probe_image_geometry(std::span<const std::byte> bytes) noexcept
{
    return probe_image_geometry(bytes, DetectOptions {});
}


GeometryProbe
probe_image_geometry(std::span<const std::byte> bytes,
                     const DetectOptions& options) noexcept
{
    GeometryProbe probe;
    const DimensionsResult dims = detect_image_dimensions(bytes, options);
    if (dims.status != GeometryStatus::Ok) {
        probe.status = dims.status;
        return probe;
    }
    probe.dimensions    = dims.dimensions;
    probe.source_id     = dims.source_id;
    probe.source_offset = dims.source_offset;

    const AspectRatioResult ratio
        = reduce_aspect_ratio(dims.dimensions.width, dims.dimensions.height);
    probe.status       = ratio.status;
    probe.aspect_ratio = ratio.ratio;
    return probe;
}


const char*
geometry_status_name(GeometryStatus status) noexcept
{
    switch (status) {
    case GeometryStatus::Ok: return "ok";
    case GeometryStatus::UnsupportedFormat: return "unsupported_format";
    case GeometryStatus::MalformedHeader: return "malformed_header";
    case GeometryStatus::DimensionsNotFound: return "dimensions_not_found";
    case GeometryStatus::InvalidDimensions: return "invalid_dimensions";
    }
    return "unknown";
}


const char*
image_format_name(ImageFormat format) noexcept
{
    switch (format) {
    case ImageFormat::Unknown: return "unknown";
    case ImageFormat::Webp: return "webp";
    case ImageFormat::Jpeg: return "jpeg";
    case ImageFormat::Png: return "png";
    }
    return "unknown";
}

}  // namespace imagegeom
