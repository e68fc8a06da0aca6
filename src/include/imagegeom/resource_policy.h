#pragma once

#include "imagegeom/image_file.h"
#include "imagegeom/image_geometry.h"

#include <cstdint>

/**
 * \file resource_policy.h
 * \brief Resource limits for probing untrusted image files.
 */

namespace imagegeom {

/**
 * \brief Storage-agnostic limits applied by tools and bindings.
 *
 * The decoders themselves run in time proportional to the inspected bytes;
 * these caps bound that input before a call is made.
 */
struct ImageGeomResourcePolicy final {
    /// Whole-file size cap (0 = unlimited). Defaults to the posting upload cap.
    uint64_t max_file_bytes = kDefaultMaxImageFileBytes;

    /// Map and inspect at most this many leading bytes (0 = unlimited).
    uint64_t max_scan_bytes = 0;
};

inline void
apply_resource_policy(const ImageGeomResourcePolicy& policy,
                      DetectOptions* options) noexcept
{
    if (options) {
        options->max_scan_bytes = policy.max_scan_bytes;
    }
}

}  // namespace imagegeom
