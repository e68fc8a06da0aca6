#include "imagegeom/image_geometry.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

namespace imagegeom {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static void
verify_probe(std::span<const std::byte> bytes, const GeometryProbe& probe) noexcept
{
    if (probe.status != GeometryStatus::Ok) {
        return;
    }
    if (probe.dimensions.width == 0U || probe.dimensions.height == 0U) {
        fuzz_trap();
    }
    if (probe.dimensions.format != classify_image(bytes)) {
        fuzz_trap();
    }
    if (probe.source_offset >= static_cast<uint64_t>(bytes.size())) {
        fuzz_trap();
    }
    if (greatest_common_divisor(probe.aspect_ratio.width,
                                probe.aspect_ratio.height)
        != 1U) {
        fuzz_trap();
    }
}

}  // namespace imagegeom

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace imagegeom;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    verify_probe(bytes, probe_image_geometry(bytes));

    // A prefix window must never see past its own end either.
    DetectOptions options;
    options.max_scan_bytes = size / 2U;
    const GeometryProbe half = probe_image_geometry(bytes, options);
    if (half.status == GeometryStatus::Ok && options.max_scan_bytes != 0U
        && half.source_offset >= options.max_scan_bytes) {
        fuzz_trap();
    }
    return 0;
}
