#include "jpegseg/build_info.h"

#include "jpegseg/build_info_generated.h"
#include "jpegseg/jpeg_segment_io.h"
#include "jpegseg/tiff_directory.h"

#include <cstdio>
#include <utility>

namespace jpegseg {
namespace {

#if defined(JPEGSEG_BUILD_LINKAGE_SHARED) && JPEGSEG_BUILD_LINKAGE_SHARED
    static constexpr bool kLinkageShared = true;
#else
    static constexpr bool kLinkageShared = false;
#endif

#if defined(JPEGSEG_BUILD_LINKAGE_STATIC) && JPEGSEG_BUILD_LINKAGE_STATIC
    static constexpr bool kLinkageStatic = true;
#else
    static constexpr bool kLinkageStatic = false;
#endif

    static BuildInfo make_build_info() noexcept
    {
        BuildInfo bi;
        bi.version              = JPEGSEG_BUILDINFO_VERSION;
        bi.build_timestamp_utc  = JPEGSEG_BUILDINFO_BUILD_TIMESTAMP_UTC;
        bi.build_type           = JPEGSEG_BUILDINFO_BUILD_TYPE;
        bi.cmake_generator      = JPEGSEG_BUILDINFO_CMAKE_GENERATOR;
        bi.system_name          = JPEGSEG_BUILDINFO_SYSTEM_NAME;
        bi.system_processor     = JPEGSEG_BUILDINFO_SYSTEM_PROCESSOR;
        bi.cxx_compiler_id      = JPEGSEG_BUILDINFO_CXX_COMPILER_ID;
        bi.cxx_compiler_version = JPEGSEG_BUILDINFO_CXX_COMPILER_VERSION;
        bi.linkage_static       = kLinkageStatic;
        bi.linkage_shared       = kLinkageShared;
        bi.option_build_tools   = JPEGSEG_BUILDINFO_BUILD_TOOLS != 0;
        bi.option_build_python  = JPEGSEG_BUILDINFO_BUILD_PYTHON != 0;
        bi.option_build_fuzzers = JPEGSEG_BUILDINFO_BUILD_FUZZERS != 0;
        bi.default_read_block_bytes = JpegScanLimits {}.read_block_bytes;
        bi.default_max_ifds         = TiffLimits {}.max_ifds;
        return bi;
    }


    static void append_sv(std::string* out, std::string_view s) noexcept
    {
        out->append(s.data(), s.size());
    }

}  // namespace


const BuildInfo&
build_info() noexcept
{
    static const BuildInfo bi = make_build_info();
    return bi;
}


void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->assign("JpegSeg v");
        append_sv(line1, info.version);
        line1->push_back(' ');
        append_sv(line1, info.build_type);

        // Enabled components, comma separated.
        std::string options;
        const std::pair<bool, const char*> flags[] = {
            { info.option_build_tools, "tools" },
            { info.option_build_python, "python" },
            { info.option_build_fuzzers, "fuzzers" },
        };
        for (const auto& [enabled, name] : flags) {
            if (!enabled) {
                continue;
            }
            if (!options.empty()) {
                options.push_back(',');
            }
            options.append(name);
        }
        line1->append(" [");
        line1->append(options);
        line1->append("] ");
        line1->append(info.linkage_static   ? "static"
                      : info.linkage_shared ? "shared"
                                            : "unknown");

        char buf[64];
        std::snprintf(buf, sizeof(buf), " block=%u ifds=%u",
                      static_cast<unsigned>(info.default_read_block_bytes),
                      static_cast<unsigned>(info.default_max_ifds));
        line1->append(buf);
    }

    if (line2) {
        line2->assign("built with ");
        append_sv(line2, info.cxx_compiler_id);
        line2->push_back('-');
        append_sv(line2, info.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, info.system_name);
        line2->push_back('/');
        append_sv(line2, info.system_processor);
        if (!info.build_timestamp_utc.empty()) {
            line2->append(" (");
            append_sv(line2, info.build_timestamp_utc);
            line2->push_back(')');
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}

}  // namespace jpegseg
