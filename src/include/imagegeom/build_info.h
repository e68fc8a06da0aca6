#pragma once

#include "imagegeom/resource_policy.h"

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Version banner and effective limits printed by the tools.
 */

namespace imagegeom {

/// Configure-time facts about the linked library.
struct BuildInfo final {
    std::string_view version;
    std::string_view build_type;
    /// `<compiler id>-<compiler version>`, e.g. "GNU-13.2.0".
    std::string_view compiler;
    /// `<system>/<processor>`, e.g. "Linux/x86_64".
    std::string_view target;
    /// UTC ISO-8601, empty when not recorded.
    std::string_view build_timestamp_utc;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats the tool header.
 *
 * - \p banner: `ImageGeom vX.Y.Z [<build_type>] (<compiler>, <target>[, <ts>])`
 * - \p limits: `limits: file<=<N>|unlimited scan=<N>|all`
 *
 * Either output may be null.
 */
void
format_tool_header(const BuildInfo& info,
                   const ImageGeomResourcePolicy& policy, std::string* banner,
                   std::string* limits) noexcept;

/// Header for the linked library and \p policy.
void
format_tool_header(const ImageGeomResourcePolicy& policy, std::string* banner,
                   std::string* limits) noexcept;

}  // namespace imagegeom
