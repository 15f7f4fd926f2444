#include "jpegseg/build_info.h"
#include "jpegseg/file_stream.h"
#include "jpegseg/jpeg_report.h"
#include "jpegseg/resource_policy.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace jpegseg {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file> [file...]\n"
            "\n"
            "Lists the markers and segments of JPEG files, then those of every\n"
            "image referenced by a Multi-Picture Format index.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print JpegSeg build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --no-mpf               List the primary image only\n"
            "  --preview-bytes N      COM/APPn preview bytes per line (default: 32, 0=off)\n"
            "  --max-scan-bytes N     Max unstuffed scan bytes per chunk\n"
            "  --read-block-bytes N   Scan-data read block size (default: 16384)\n"
            "  --max-ifds N           Max MPF tag directories per segment (default: 16)\n",
            argv0 ? argv0 : "jsegprint");
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
            "--preview-bytes",
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
    bool follow_mpf      = true;
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
        if (std::strcmp(arg, "--no-mpf") == 0) {
            follow_mpf = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--preview-bytes") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &policy.max_preview_bytes)) {
                std::fprintf(stderr, "invalid --preview-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
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

    if (show_build_info) {
        print_build_info_header();
    }

    JpegReportOptions options;
    apply_resource_policy(policy, &options);
    options.follow_mpf = follow_mpf;

    bool any_failed = false;
    for (const std::string& path : input_paths) {
        FileStream in;
        const StreamStatus open_st = in.open(path.c_str(), FileMode::Read);
        if (open_st != StreamStatus::Ok) {
            std::fprintf(stderr, "jsegprint: %s: %s\n", path.c_str(),
                         stream_status_name(open_st));
            any_failed = true;
            continue;
        }

        if (input_paths.size() > 1U) {
            std::printf("== %s\n", path.c_str());
        }
        const JpegReport report = report_jpeg(in, options);
        for (const std::string& line : report.lines) {
            std::printf("%s\n", line.c_str());
        }
        if (report.jpeg != JpegStatus::Ok || report.mpf != MpfStatus::Ok) {
            std::fprintf(stderr, "jsegprint: %s: jpeg=%s mpf=%s\n",
                         path.c_str(), jpeg_status_name(report.jpeg),
                         mpf_status_name(report.mpf));
            any_failed = true;
        }
    }

    return any_failed ? 1 : 0;
}
