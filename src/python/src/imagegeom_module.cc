#include "imagegeom/build_info.h"
#include "imagegeom/build_info_generated.h"
#include "imagegeom/console_format.h"
#include "imagegeom/image_file.h"
#include "imagegeom/image_geometry.h"
#include "imagegeom/resource_policy.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace nb = nanobind;
using namespace nb::literals;

namespace imagegeom {
namespace {

    static std::span<const std::byte> py_bytes_view(const nb::bytes& data)
    {
        return std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.data()), data.size());
    }


    static std::pair<std::string, std::string>
    tool_header(uint64_t max_file_bytes, uint64_t max_scan_bytes)
    {
        ImageGeomResourcePolicy policy;
        policy.max_file_bytes = max_file_bytes;
        policy.max_scan_bytes = max_scan_bytes;

        std::string banner;
        std::string limits;
        format_tool_header(policy, &banner, &limits);
        return { std::move(banner), std::move(limits) };
    }


    static std::string source_label(ImageFormat format, uint32_t source_id)
    {
        std::string out;
        append_source_label(format, source_id, &out);
        return out;
    }


    static GeometryProbe probe_file(const std::string& path,
                                    uint64_t max_file_bytes,
                                    uint64_t max_scan_bytes)
    {
        ImageGeomResourcePolicy policy;
        policy.max_file_bytes = max_file_bytes;
        policy.max_scan_bytes = max_scan_bytes;

        ImageFile file;
        const ImageFileStatus st = file.open(path.c_str(),
                                             policy.max_file_bytes,
                                             policy.max_scan_bytes);
        if (st != ImageFileStatus::Ok) {
            throw std::runtime_error(std::string("imagegeom: ") + path + ": "
                                     + image_file_status_name(st));
        }

        DetectOptions options;
        apply_resource_policy(policy, &options);

        nb::gil_scoped_release gil_release;
        return probe_image_geometry(file.bytes(), options);
    }

}  // namespace
}  // namespace imagegeom


NB_MODULE(_imagegeom, m)
{
    using namespace imagegeom;

    m.doc()               = "ImageGeom image dimension bindings (nanobind).";
    m.attr("__version__") = IMAGEGEOM_VERSION_STRING;
    m.attr("DEFAULT_MAX_FILE_BYTES") = kDefaultMaxImageFileBytes;

    nb::enum_<GeometryStatus>(m, "GeometryStatus")
        .value("Ok", GeometryStatus::Ok)
        .value("UnsupportedFormat", GeometryStatus::UnsupportedFormat)
        .value("MalformedHeader", GeometryStatus::MalformedHeader)
        .value("DimensionsNotFound", GeometryStatus::DimensionsNotFound)
        .value("InvalidDimensions", GeometryStatus::InvalidDimensions);

    nb::enum_<ImageFormat>(m, "ImageFormat")
        .value("Unknown", ImageFormat::Unknown)
        .value("Webp", ImageFormat::Webp)
        .value("Jpeg", ImageFormat::Jpeg)
        .value("Png", ImageFormat::Png);

    nb::class_<ImageDimensions>(m, "ImageDimensions")
        .def(nb::init<>())
        .def_ro("width", &ImageDimensions::width)
        .def_ro("height", &ImageDimensions::height)
        .def_ro("format", &ImageDimensions::format);

    nb::class_<AspectRatio>(m, "AspectRatio")
        .def(nb::init<>())
        .def_ro("width", &AspectRatio::width)
        .def_ro("height", &AspectRatio::height);

    nb::class_<DimensionsResult>(m, "DimensionsResult")
        .def_ro("status", &DimensionsResult::status)
        .def_ro("dimensions", &DimensionsResult::dimensions)
        .def_ro("source_id", &DimensionsResult::source_id)
        .def_ro("source_offset", &DimensionsResult::source_offset)
        .def_prop_ro("source_label", [](const DimensionsResult& r) {
            return source_label(r.dimensions.format, r.source_id);
        });

    nb::class_<AspectRatioResult>(m, "AspectRatioResult")
        .def_ro("status", &AspectRatioResult::status)
        .def_ro("ratio", &AspectRatioResult::ratio);

    nb::class_<GeometryProbe>(m, "GeometryProbe")
        .def_ro("status", &GeometryProbe::status)
        .def_ro("dimensions", &GeometryProbe::dimensions)
        .def_ro("aspect_ratio", &GeometryProbe::aspect_ratio)
        .def_ro("source_id", &GeometryProbe::source_id)
        .def_ro("source_offset", &GeometryProbe::source_offset)
        .def_prop_ro("source_label", [](const GeometryProbe& p) {
            return source_label(p.dimensions.format, p.source_id);
        });

    m.def(
        "classify",
        [](nb::bytes data) { return classify_image(py_bytes_view(data)); },
        "data"_a);

    m.def(
        "detect_dimensions",
        [](nb::bytes data, uint64_t max_scan_bytes) {
            DetectOptions options;
            options.max_scan_bytes = max_scan_bytes;
            return detect_image_dimensions(py_bytes_view(data), options);
        },
        "data"_a, "max_scan_bytes"_a = 0ULL);

    m.def("reduce_aspect_ratio", &reduce_aspect_ratio, "width"_a, "height"_a);

    m.def(
        "probe",
        [](nb::bytes data, uint64_t max_scan_bytes) {
            DetectOptions options;
            options.max_scan_bytes = max_scan_bytes;
            return probe_image_geometry(py_bytes_view(data), options);
        },
        "data"_a, "max_scan_bytes"_a = 0ULL);

    m.def("probe_file", &probe_file, "path"_a,
          "max_file_bytes"_a = kDefaultMaxImageFileBytes,
          "max_scan_bytes"_a = 0ULL);

    m.def("status_name", [](GeometryStatus s) {
        return std::string(geometry_status_name(s));
    });
    m.def("format_name", [](ImageFormat f) {
        return std::string(image_format_name(f));
    });
    m.def("tool_header", &tool_header,
          "max_file_bytes"_a = kDefaultMaxImageFileBytes,
          "max_scan_bytes"_a = 0ULL);
}
