#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Configure-time facts about the linked JpegSeg library.
 */

namespace jpegseg {

/// Build facts plus the codec defaults compiled into the library.
struct BuildInfo final {
    std::string_view version;
    /// ISO-8601 UTC, empty when not recorded.
    std::string_view build_timestamp_utc;
    std::string_view build_type;
    std::string_view cmake_generator;
    std::string_view system_name;
    std::string_view system_processor;
    std::string_view cxx_compiler_id;
    std::string_view cxx_compiler_version;

    bool linkage_static = false;
    bool linkage_shared = false;

    bool option_build_tools   = false;
    bool option_build_python  = false;
    bool option_build_fuzzers = false;

    /// Default `JpegScanLimits::read_block_bytes`.
    uint32_t default_read_block_bytes = 0;
    /// Default `TiffLimits::max_ifds`.
    uint32_t default_max_ifds = 0;
};

const BuildInfo&
build_info() noexcept;

/**
 * \brief Two-line banner printed by the tools.
 *
 * - `JpegSeg vX.Y.Z <build_type> [<options>] <linkage> block=<n> ifds=<n>`
 * - `built with <compiler>-<version> for <system>/<arch>[ (<timestamp>)]`
 *
 * Either output pointer may be null.
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace jpegseg
