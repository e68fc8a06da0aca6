#include "imagegeom/build_info.h"
#include "imagegeom/console_format.h"
#include "imagegeom/image_file.h"
#include "imagegeom/image_geometry.h"
#include "imagegeom/resource_policy.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace imagegeom {
namespace {

    static constexpr uint32_t kMagicPreviewBytes = 12;
    static constexpr uint32_t kMaxPathEcho       = 512;

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "\n"
            "Prints pixel dimensions and the reduced aspect ratio of WebP, JPEG\n"
            "and PNG files without decoding them.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print the ImageGeom version banner\n"
            "  --no-build-info        Hide the version/limits header\n"
            "  --quiet                Print only `<W>x<H> <w>:<h>` per file\n"
            "  --max-file-bytes N     File mapping cap in bytes\n"
            "                         (default: 1000000, 0=unlimited)\n"
            "  --max-scan-bytes N     Inspect at most N leading bytes\n"
            "                         (default: 0=whole file)\n",
            argv0 ? argv0 : "imgdim");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static std::string console_path(const char* path)
    {
        std::string out;
        (void)append_console_escaped_ascii(path ? path : "", kMaxPathEcho,
                                           &out);
        return out;
    }


    // Consumes the value following the option at argv[*i].
    // Returns 0 on success, or the usage exit code after reporting.
    static int take_u64_value(int argc, char** argv, int* i, uint64_t* out)
    {
        const char* opt = argv[*i];
        if (*i + 1 >= argc || !argv[*i + 1]) {
            std::fprintf(stderr, "imgdim: missing value for %s\n", opt);
            return 2;
        }
        if (!parse_u64_arg(argv[*i + 1], out)) {
            std::fprintf(stderr, "imgdim: invalid value for %s: %s\n", opt,
                         console_path(argv[*i + 1]).c_str());
            return 2;
        }
        *i += 1;
        return 0;
    }


    static void print_version()
    {
        std::string banner;
        format_tool_header(ImageGeomResourcePolicy {}, &banner, nullptr);
        std::printf("%s\n", banner.c_str());
    }


    static void print_tool_header(const ImageGeomResourcePolicy& policy)
    {
        std::string banner;
        std::string limits;
        format_tool_header(policy, &banner, &limits);
        std::printf("%s\n%s\n", banner.c_str(), limits.c_str());
    }


    // Geometry failures are warnings; they do not change the exit code.
    static void warn_geometry_failure(const std::string& path,
                                      const GeometryProbe& probe,
                                      std::span<const std::byte> bytes)
    {
        std::string magic;
        append_hex_bytes(bytes, kMagicPreviewBytes, &magic);
        std::fprintf(stderr, "warning: %s: %s (magic=%s)\n", path.c_str(),
                     geometry_status_name(probe.status),
                     magic.empty() ? "-" : magic.c_str());
    }


    static void print_probe(const std::string& path, const GeometryProbe& probe,
                            bool quiet)
    {
        if (quiet) {
            std::printf("%ux%u %u:%u\n", probe.dimensions.width,
                        probe.dimensions.height, probe.aspect_ratio.width,
                        probe.aspect_ratio.height);
            return;
        }

        std::string source;
        append_source_label(probe.dimensions.format, probe.source_id, &source);
        std::printf("== %s\n", path.c_str());
        std::printf("  format=%s size=%ux%u aspect=%u:%u source=%s@%llu\n",
                    image_format_name(probe.dimensions.format),
                    probe.dimensions.width, probe.dimensions.height,
                    probe.aspect_ratio.width, probe.aspect_ratio.height,
                    source.c_str(),
                    static_cast<unsigned long long>(probe.source_offset));
    }

}  // namespace
}  // namespace imagegeom


int
main(int argc, char** argv)
{
    using namespace imagegeom;

    bool show_build_info = true;
    bool quiet           = false;
    ImageGeomResourcePolicy policy;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--quiet") == 0) {
            quiet = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0) {
            const int rc = take_u64_value(argc, argv, &i,
                                          &policy.max_file_bytes);
            if (rc != 0) {
                return rc;
            }
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-scan-bytes") == 0) {
            const int rc = take_u64_value(argc, argv, &i,
                                          &policy.max_scan_bytes);
            if (rc != 0) {
                return rc;
            }
            first_path += 2;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "imgdim: unknown option: %s\n", arg);
            return 2;
        }
        break;
    }

    std::vector<std::string> input_paths;
    for (int i = first_path; i < argc; ++i) {
        if (argv[i] && argv[i][0] != '\0') {
            input_paths.emplace_back(argv[i]);
        }
    }
    if (input_paths.empty()) {
        usage(argv[0]);
        return 2;
    }

    if (show_build_info && !quiet) {
        print_tool_header(policy);
    }

    DetectOptions options;
    apply_resource_policy(policy, &options);

    bool any_failed = false;
    for (size_t i = 0; i < input_paths.size(); ++i) {
        const char* path         = input_paths[i].c_str();
        const std::string echoed = console_path(path);

        ImageFile file;
        const ImageFileStatus st = file.open(path, policy.max_file_bytes,
                                             policy.max_scan_bytes);
        if (st != ImageFileStatus::Ok) {
            std::fprintf(stderr, "imgdim: %s: %s\n", echoed.c_str(),
                         image_file_status_name(st));
            any_failed = true;
            continue;
        }

        const GeometryProbe probe = probe_image_geometry(file.bytes(), options);
        if (probe.status != GeometryStatus::Ok) {
            warn_geometry_failure(echoed, probe, file.bytes());
            continue;
        }
        print_probe(echoed, probe, quiet);
    }

    return any_failed ? 1 : 0;
}
