#include "jpegseg/build_info.h"
#include "jpegseg/byte_stream.h"
#include "jpegseg/jpeg_markers.h"
#include "jpegseg/jpeg_report.h"
#include "jpegseg/jpeg_scanner.h"
#include "jpegseg/mpf_process.h"
#include "jpegseg/mpf_rewrite.h"
#include "jpegseg/resource_policy.h"

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace jpegseg {
namespace {

    static nb::str sv_to_py(std::string_view s)
    {
        return nb::str(s.data(), s.size());
    }


    static nb::bytes to_py_bytes(std::span<const std::byte> b)
    {
        return nb::bytes(reinterpret_cast<const char*>(b.data()), b.size());
    }


    static MemoryStream stream_from_py(const nb::bytes& data)
    {
        return MemoryStream(std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(data.data()), data.size()));
    }


    [[noreturn]] static void throw_status(const char* what, JpegStatus jpeg,
                                          MpfStatus mpf)
    {
        std::string msg(what);
        msg.append(" failed: jpeg=");
        msg.append(jpeg_status_name(jpeg));
        msg.append(" mpf=");
        msg.append(mpf_status_name(mpf));
        throw std::runtime_error(msg);
    }


    static JpegScanLimits make_scan_limits(uint64_t max_scan_bytes,
                                           uint32_t read_block_bytes)
    {
        JpegScanLimits limits;
        if (max_scan_bytes != 0U) {
            limits.max_scan_data_bytes = max_scan_bytes;
        }
        if (read_block_bytes != 0U) {
            limits.read_block_bytes = read_block_bytes;
        }
        return limits;
    }


    static std::pair<std::string, std::string> info_lines()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        return { std::move(line1), std::move(line2) };
    }


    static std::string python_info_line()
    {
        const char* ver = Py_GetVersion();
        size_t n        = 0;
        while (ver && ver[n] && ver[n] != ' ') {
            n += 1;
        }

        std::string out("Python ");
        if (ver && n != 0U) {
            out.append(ver, n);
        } else {
            out.append("unknown");
        }
        char buf[64];
        std::snprintf(buf, sizeof(buf), " nanobind %d.%d.%d", NB_VERSION_MAJOR,
                      NB_VERSION_MINOR, NB_VERSION_PATCH);
        out.append(buf);
        return out;
    }


    // One (marker, name, payload) tuple per scanner item; payload is None for
    // markers without a segment.
    static nb::list scan_segments(const nb::bytes& data,
                                  uint64_t max_scan_bytes,
                                  uint32_t read_block_bytes)
    {
        MemoryStream in = stream_from_py(data);
        JpegScanner scanner(in,
                            make_scan_limits(max_scan_bytes, read_block_bytes));
        nb::list out;
        for (;;) {
            SegmentView view;
            const JpegStatus st = scanner.scan(&view);
            if (st != JpegStatus::Ok) {
                throw_status("scan", st, MpfStatus::Ok);
            }
            nb::object payload = view.has_data ? nb::object(to_py_bytes(view.data))
                                               : nb::none();
            out.append(nb::make_tuple(view.marker, sv_to_py(marker_name(view.marker)),
                                      payload));
            if (view.marker == kMarkerEoi) {
                return out;
            }
        }
    }


    static nb::object read_mpf_index(const nb::bytes& data, uint32_t max_ifds)
    {
        MemoryStream in = stream_from_py(data);
        TiffLimits tiff;
        if (max_ifds != 0U) {
            tiff.max_ifds = max_ifds;
        }
        MpfGetIndex get_index(tiff);
        JpegScanner scanner(in);
        for (;;) {
            SegmentView view;
            const JpegStatus st = scanner.scan(&view);
            if (st != JpegStatus::Ok) {
                throw_status("read_mpf_index", st, MpfStatus::Ok);
            }
            if (view.marker == kMarkerApp2 && view.has_data) {
                MpfApp2Output app2;
                const MpfStatus mst = get_index.process_app2(nullptr, in,
                                                             view.data, &app2);
                if (mst != MpfStatus::Ok) {
                    throw_status("read_mpf_index", JpegStatus::Ok, mst);
                }
            }
            if (get_index.found() || view.marker == kMarkerSos
                || view.marker == kMarkerEoi) {
                break;
            }
        }
        if (!get_index.found()) {
            return nb::none();
        }
        const MpfIndex& index = get_index.index();
        nb::dict d;
        d["relative_offset_base"] = index.relative_offset_base;
        d["offsets"]              = nb::cast(index.image_offsets);
        d["lengths"]              = nb::cast(index.image_lengths);
        return d;
    }


    static nb::tuple copy_mpf(const nb::bytes& data, uint64_t max_scan_bytes,
                              uint32_t read_block_bytes)
    {
        MemoryStream in = stream_from_py(data);
        MemoryStream out;
        MpfCopyOptions options;
        options.scan_limits = make_scan_limits(max_scan_bytes,
                                               read_block_bytes);
        MpfCopyResult result;
        {
            nb::gil_scoped_release gil_release;
            result = copy_mpf_file(in, out, options);
        }
        if (result.jpeg != JpegStatus::Ok || result.mpf != MpfStatus::Ok) {
            throw_status("copy_mpf", result.jpeg, result.mpf);
        }
        return nb::make_tuple(to_py_bytes(out.bytes()),
                              nb::cast(result.offsets),
                              nb::cast(result.lengths));
    }


    static nb::bytes strip(const nb::bytes& data, bool keep_com, bool keep_app,
                           bool keep_jpg)
    {
        MemoryStream in = stream_from_py(data);
        MemoryStream out;
        StripOptions options;
        options.drop_com = !keep_com;
        options.drop_app = !keep_app;
        options.drop_jpg = !keep_jpg;
        StripResult result;
        {
            nb::gil_scoped_release gil_release;
            result = strip_jpeg(in, out, options);
        }
        if (result.status != JpegStatus::Ok) {
            throw_status("strip", result.status, MpfStatus::Ok);
        }
        return to_py_bytes(out.bytes());
    }


    static std::vector<std::string> report(const nb::bytes& data,
                                           bool follow_mpf,
                                           uint32_t preview_bytes)
    {
        MemoryStream in = stream_from_py(data);
        JpegSegResourcePolicy policy;
        policy.max_preview_bytes = preview_bytes;
        JpegReportOptions options;
        apply_resource_policy(policy, &options);
        options.follow_mpf = follow_mpf;

        JpegReport r;
        {
            nb::gil_scoped_release gil_release;
            r = report_jpeg(in, options);
        }
        if (r.jpeg != JpegStatus::Ok || r.mpf != MpfStatus::Ok) {
            throw_status("report", r.jpeg, r.mpf);
        }
        return std::move(r.lines);
    }

}  // namespace
}  // namespace jpegseg

NB_MODULE(_jpegseg, m)
{
    using namespace jpegseg;

    m.doc()               = "JpegSeg JPEG segment / MPF bindings (nanobind).";
    m.attr("__version__") = sv_to_py(build_info().version);

    nb::enum_<JpegStatus>(m, "JpegStatus")
        .value("Ok", JpegStatus::Ok)
        .value("ReadFailed", JpegStatus::ReadFailed)
        .value("WriteFailed", JpegStatus::WriteFailed)
        .value("SeekFailed", JpegStatus::SeekFailed)
        .value("MissingStartMarker", JpegStatus::MissingStartMarker)
        .value("ExpectedMarkerPrefix", JpegStatus::ExpectedMarkerPrefix)
        .value("InvalidMarkerZero", JpegStatus::InvalidMarkerZero)
        .value("Truncated", JpegStatus::Truncated)
        .value("InvalidLength", JpegStatus::InvalidLength)
        .value("SegmentTooLarge", JpegStatus::SegmentTooLarge)
        .value("PastEndOfImage", JpegStatus::PastEndOfImage)
        .value("LimitExceeded", JpegStatus::LimitExceeded);

    nb::enum_<MpfStatus>(m, "MpfStatus")
        .value("Ok", MpfStatus::Ok)
        .value("NotMpf", MpfStatus::NotMpf)
        .value("Unsupported", MpfStatus::Unsupported)
        .value("Malformed", MpfStatus::Malformed)
        .value("LimitExceeded", MpfStatus::LimitExceeded)
        .value("ZeroImageCount", MpfStatus::ZeroImageCount)
        .value("EntryTableTooShort", MpfStatus::EntryTableTooShort)
        .value("InvalidOffsetPattern", MpfStatus::InvalidOffsetPattern)
        .value("OffsetOverflow", MpfStatus::OffsetOverflow)
        .value("SizeMismatch", MpfStatus::SizeMismatch)
        .value("ReadFailed", MpfStatus::ReadFailed)
        .value("WriteFailed", MpfStatus::WriteFailed)
        .value("SeekFailed", MpfStatus::SeekFailed);

    nb::enum_<TagSpace>(m, "TagSpace")
        .value("MpfIndex", TagSpace::MpfIndex)
        .value("MpfAttribute", TagSpace::MpfAttribute);

    m.def("jpeg_status_name", [](JpegStatus s) { return jpeg_status_name(s); });
    m.def("mpf_status_name", [](MpfStatus s) { return mpf_status_name(s); });

    m.def(
        "marker_name",
        [](uint8_t marker) { return sv_to_py(marker_name(marker)); },
        "marker"_a);

    m.def(
        "mpf_tag_name",
        [](TagSpace space, uint16_t tag) -> nb::object {
            const std::string_view n = mpf_tag_name(space, tag);
            if (n.empty()) {
                return nb::none();
            }
            return sv_to_py(n);
        },
        "space"_a, "tag"_a);

    m.def("scan_segments", &scan_segments, "data"_a, "max_scan_bytes"_a = 0ULL,
          "read_block_bytes"_a = 0U);
    m.def("read_mpf_index", &read_mpf_index, "data"_a, "max_ifds"_a = 0U);
    m.def("copy_mpf", &copy_mpf, "data"_a, "max_scan_bytes"_a = 0ULL,
          "read_block_bytes"_a = 0U);
    m.def("strip", &strip, "data"_a, "keep_com"_a = false,
          "keep_app"_a = false, "keep_jpg"_a = false);
    m.def("report", &report, "data"_a, "follow_mpf"_a = true,
          "preview_bytes"_a = 32U);

    m.def("build_info", []() {
        const BuildInfo& bi = build_info();
        nb::dict d;
        d["version"]              = sv_to_py(bi.version);
        d["build_timestamp_utc"]  = sv_to_py(bi.build_timestamp_utc);
        d["build_type"]           = sv_to_py(bi.build_type);
        d["cmake_generator"]      = sv_to_py(bi.cmake_generator);
        d["system_name"]          = sv_to_py(bi.system_name);
        d["system_processor"]     = sv_to_py(bi.system_processor);
        d["cxx_compiler_id"]      = sv_to_py(bi.cxx_compiler_id);
        d["cxx_compiler_version"] = sv_to_py(bi.cxx_compiler_version);
        d["linkage_static"]       = nb::bool_(bi.linkage_static);
        d["linkage_shared"]       = nb::bool_(bi.linkage_shared);
        d["default_read_block_bytes"] = nb::int_(bi.default_read_block_bytes);
        d["default_max_ifds"]         = nb::int_(bi.default_max_ifds);
        return d;
    });

    m.def("info_lines", &info_lines);
    m.def("python_info_line", &python_info_line);
}
