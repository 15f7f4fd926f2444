#include "jpegseg/build_info.h"
#include "jpegseg/file_stream.h"
#include "jpegseg/mpf_rewrite.h"
#include "jpegseg/resource_policy.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace jpegseg {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <source> <destination>\n"
            "\n"
            "Copies a JPEG file segment by segment. Images listed in a\n"
            "Multi-Picture Format index are copied too, and the index is\n"
            "rewritten with their new offsets and sizes.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print JpegSeg build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --max-scan-bytes N     Max unstuffed scan bytes per chunk\n"
            "  --read-block-bytes N   Scan-data read block size (default: 16384)\n"
            "  --max-ifds N           Max MPF tag directories per segment (default: 16)\n",
            argv0 ? argv0 : "jsegcopy");
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


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    // Value-taking flags given as the last argument have no value.
    static const char* trailing_value_option(int argc, char** argv)
    {
        static const char* const kValueOptions[] = {
            "--max-scan-bytes",
            "--read-block-bytes",
            "--max-ifds",
        };
        if (argc < 2 || !argv[argc - 1]) {
            return nullptr;
        }
        for (const char* opt : kValueOptions) {
            if (std::strcmp(argv[argc - 1], opt) == 0) {
                return opt;
            }
        }
        return nullptr;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }

}  // namespace
}  // namespace jpegseg


int
main(int argc, char** argv)
{
    using namespace jpegseg;

    bool show_build_info = true;
    JpegSegResourcePolicy policy;

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
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-scan-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1],
                               &policy.scan_limits.max_scan_data_bytes)
                || policy.scan_limits.max_scan_data_bytes == 0U) {
                std::fprintf(stderr, "invalid --max-scan-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--read-block-bytes") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1],
                               &policy.scan_limits.read_block_bytes)
                || policy.scan_limits.read_block_bytes == 0U) {
                std::fprintf(stderr, "invalid --read-block-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-ifds") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &policy.tiff_limits.max_ifds)
                || policy.tiff_limits.max_ifds == 0U) {
                std::fprintf(stderr, "invalid --max-ifds value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    if (const char* opt = trailing_value_option(argc, argv)) {
        std::fprintf(stderr, "missing value for %s\n", opt);
        return 2;
    }

    if (argc - first_path != 2) {
        usage(argv[0]);
        return 2;
    }
    const char* in_path  = argv[first_path];
    const char* out_path = argv[first_path + 1];

    if (show_build_info) {
        print_build_info_header();
    }

    FileStream in;
    StreamStatus st = in.open(in_path, FileMode::Read);
    if (st != StreamStatus::Ok) {
        std::fprintf(stderr, "jsegcopy: %s: %s\n", in_path,
                     stream_status_name(st));
        return 1;
    }
    FileStream out;
    st = out.open(out_path, FileMode::ReadWriteTruncate);
    if (st != StreamStatus::Ok) {
        std::fprintf(stderr, "jsegcopy: %s: %s\n", out_path,
                     stream_status_name(st));
        return 1;
    }

    MpfCopyOptions options;
    apply_resource_policy(policy, &options, nullptr);
    const MpfCopyResult result = copy_mpf_file(in, out, options);
    if (result.jpeg != JpegStatus::Ok || result.mpf != MpfStatus::Ok) {
        std::fprintf(stderr, "jsegcopy: %s: jpeg=%s mpf=%s images=%u\n",
                     in_path, jpeg_status_name(result.jpeg),
                     mpf_status_name(result.mpf), result.images_written);
        return 1;
    }
    st = out.close();
    if (st != StreamStatus::Ok) {
        std::fprintf(stderr, "jsegcopy: %s: %s\n", out_path,
                     stream_status_name(st));
        return 1;
    }

    std::printf("images=%u bytes=%llu\n", result.images_written,
                static_cast<unsigned long long>(result.bytes_written));
    for (size_t i = 0; i < result.offsets.size(); ++i) {
        std::printf("  [%u] offset=%u size=%u\n", static_cast<unsigned>(i),
                    result.offsets[i],
                    i < result.lengths.size() ? result.lengths[i] : 0U);
    }
    return 0;
}
