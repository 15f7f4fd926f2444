#include "jpegseg/build_info.h"
#include "jpegseg/jpeg_segment_io.h"
#include "jpegseg/tiff_directory.h"

#include <gtest/gtest.h>

#include <string>

namespace jpegseg {

TEST(BuildInfo, FormatsBothLines)
{
    BuildInfo bi;
    bi.version              = "1.2.3";
    bi.build_type           = "Release";
    bi.system_name          = "Linux";
    bi.system_processor     = "x86_64";
    bi.cxx_compiler_id      = "GNU";
    bi.cxx_compiler_version = "13.2.0";
    bi.linkage_static       = true;
    bi.option_build_tools   = true;
    bi.option_build_fuzzers = true;
    bi.default_read_block_bytes = 16384;
    bi.default_max_ifds         = 16;

    std::string line1;
    std::string line2;
    format_build_info_lines(bi, &line1, &line2);
    EXPECT_EQ(line1, "JpegSeg v1.2.3 Release [tools,fuzzers] static block=16384 ifds=16");
    EXPECT_EQ(line2, "built with GNU-13.2.0 for Linux/x86_64");

    bi.build_timestamp_utc = "2026-01-02T03:04:05Z";
    bi.linkage_static      = false;
    bi.option_build_tools  = false;
    format_build_info_lines(bi, &line1, &line2);
    EXPECT_EQ(line1, "JpegSeg v1.2.3 Release [fuzzers] unknown block=16384 ifds=16");
    EXPECT_EQ(line2,
              "built with GNU-13.2.0 for Linux/x86_64 (2026-01-02T03:04:05Z)");
}


TEST(BuildInfo, LinkedInfoHasVersion)
{
    EXPECT_FALSE(build_info().version.empty());
    std::string line1;
    format_build_info_lines(&line1, nullptr);
    EXPECT_EQ(line1.rfind("JpegSeg v", 0), 0U);
    EXPECT_EQ(build_info().default_read_block_bytes,
              JpegScanLimits {}.read_block_bytes);
    EXPECT_EQ(build_info().default_max_ifds, TiffLimits {}.max_ifds);
}

}  // namespace jpegseg
