#include "imagegeom/build_info.h"

#include "imagegeom/build_info_generated.h"

#include <string>

namespace imagegeom {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/IMAGEGEOM_VERSION_STRING,
        /*build_type=*/IMAGEGEOM_BUILD_TYPE,
        /*compiler=*/IMAGEGEOM_COMPILER,
        /*target=*/IMAGEGEOM_TARGET,
        /*build_timestamp_utc=*/IMAGEGEOM_BUILD_TIMESTAMP_UTC,
    };


    static void append_limit(const char* label, const char* cmp,
                             uint64_t value, const char* when_zero,
                             std::string* out)
    {
        out->append(label);
        if (value == 0U) {
            out->append("=");
            out->append(when_zero);
            return;
        }
        out->append(cmp);
        out->append(std::to_string(value));
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_tool_header(const BuildInfo& info,
                   const ImageGeomResourcePolicy& policy, std::string* banner,
                   std::string* limits) noexcept
{
    if (banner) {
        banner->assign("ImageGeom v");
        banner->append(info.version);
        if (!info.build_type.empty()) {
            banner->append(" ");
            banner->append(info.build_type);
        }
        banner->append(" (");
        banner->append(info.compiler);
        banner->append(", ");
        banner->append(info.target);
        if (!info.build_timestamp_utc.empty()) {
            banner->append(", ");
            banner->append(info.build_timestamp_utc);
        }
        banner->append(")");
    }

    if (limits) {
        limits->assign("limits: ");
        append_limit("file", "<=", policy.max_file_bytes, "unlimited", limits);
        limits->append(" ");
        append_limit("scan", "=", policy.max_scan_bytes, "all", limits);
    }
}


void
format_tool_header(const ImageGeomResourcePolicy& policy, std::string* banner,
                   std::string* limits) noexcept
{
    format_tool_header(build_info(), policy, banner, limits);
}

}  // namespace imagegeom
