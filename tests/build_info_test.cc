#include "imagegeom/build_info.h"

#include <gtest/gtest.h>

#include <string>

namespace imagegeom {
namespace {

    TEST(BuildInfo, LinkedLibraryHeader)
    {
        std::string banner;
        std::string limits;
        format_tool_header(ImageGeomResourcePolicy {}, &banner, &limits);

        EXPECT_EQ(banner.rfind("ImageGeom v", 0), 0U) << banner;
        EXPECT_EQ(banner.back(), ')') << banner;
        EXPECT_EQ(limits, "limits: file<=1000000 scan=all");
        EXPECT_FALSE(build_info().version.empty());
    }


    TEST(BuildInfo, FormatsExplicitValues)
    {
        BuildInfo bi;
        bi.version    = "1.2.3";
        bi.build_type = "Release";
        bi.compiler   = "GNU-13.2.0";
        bi.target     = "Linux/x86_64";

        std::string banner;
        format_tool_header(bi, ImageGeomResourcePolicy {}, &banner, nullptr);
        EXPECT_EQ(banner, "ImageGeom v1.2.3 Release (GNU-13.2.0, Linux/x86_64)");

        bi.build_type          = {};
        bi.build_timestamp_utc = "2026-01-02T03:04:05Z";
        format_tool_header(bi, ImageGeomResourcePolicy {}, &banner, nullptr);
        EXPECT_EQ(banner, "ImageGeom v1.2.3 (GNU-13.2.0, Linux/x86_64, "
                          "2026-01-02T03:04:05Z)");
    }


    TEST(BuildInfo, LimitsLineShowsAppliedCaps)
    {
        ImageGeomResourcePolicy policy;
        policy.max_file_bytes = 0;
        policy.max_scan_bytes = 4096;

        std::string limits = "stale";
        format_tool_header(policy, nullptr, &limits);
        EXPECT_EQ(limits, "limits: file=unlimited scan=4096");

        policy.max_file_bytes = 250000;
        policy.max_scan_bytes = 0;
        format_tool_header(policy, nullptr, &limits);
        EXPECT_EQ(limits, "limits: file<=250000 scan=all");
    }

}  // namespace
}  // namespace imagegeom
