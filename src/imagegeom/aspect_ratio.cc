#include "imagegeom/image_geometry.h"

namespace imagegeom {

uint32_t
greatest_common_divisor(uint32_t a, uint32_t b) noexcept
{
    while (b != 0U) {
        const uint32_t r = a % b;
        a                = b;
        b                = r;
    }
    return a;
}


AspectRatioResult
reduce_aspect_ratio(uint32_t width, uint32_t height) noexcept
{
    AspectRatioResult res;
    if (width == 0U || height == 0U) {
        res.status = GeometryStatus::InvalidDimensions;
        return res;
    }

    const uint32_t g = greatest_common_divisor(width, height);
    res.ratio.width  = width / g;
    res.ratio.height = height / g;
    return res;
}

}  // namespace imagegeom
