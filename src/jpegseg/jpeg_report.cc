#include "jpegseg/jpeg_report.h"

#include "jpegseg/console_format.h"
#include "jpegseg/jpeg_markers.h"
#include "jpegseg/jpeg_scanner.h"
#include "jpegseg/mpf_process.h"

#include <cstdio>

namespace jpegseg {

namespace {

    static void flush_scan_counts(uint64_t* data_bytes, uint32_t* resets,
                                  std::vector<std::string>* lines) noexcept
    {
        if (*data_bytes == 0 && *resets == 0) {
            return;
        }
        char buf[96];
        if (*resets > 0) {
            std::snprintf(buf, sizeof(buf),
                          "%llu bytes of image data and %u reset markers",
                          static_cast<unsigned long long>(*data_bytes),
                          static_cast<unsigned>(*resets));
        } else {
            std::snprintf(buf, sizeof(buf), "%llu bytes of image data",
                          static_cast<unsigned long long>(*data_bytes));
        }
        lines->emplace_back(buf);
        *data_bytes = 0;
        *resets     = 0;
    }


    static std::string segment_line(uint8_t marker,
                                    std::span<const std::byte> data,
                                    bool is_mpf, uint32_t preview) noexcept
    {
        std::string line(marker_name(marker));
        char buf[32];
        std::snprintf(buf, sizeof(buf), ", %llu bytes",
                      static_cast<unsigned long long>(data.size()));
        line.append(buf);

        if (is_mpf) {
            line.append(" (MPF segment)");
            return line;
        }
        if (preview == 0) {
            return line;
        }
        if (marker == kMarkerCom) {
            line.append(" \"");
            append_escaped_text(data, preview, &line);
            line.push_back('"');
        } else if (is_app_marker(marker)) {
            const std::string_view id = app_identifier(data, preview);
            if (!id.empty()) {
                line.append(" [");
                line.append(id.data(), id.size());
                line.push_back(']');
            }
        }
        return line;
    }


    static void list_image(ByteStream& in, const JpegReportOptions& options,
                           MpfProcessor& processor, JpegReport* report) noexcept
    {
        JpegScanner scanner(in, options.scan_limits);
        report->jpeg = scanner.open();
        if (report->jpeg != JpegStatus::Ok) {
            return;
        }
        report->lines.emplace_back("SOI");

        uint64_t data_bytes = 0;
        uint32_t resets     = 0;
        for (;;) {
            SegmentView view;
            report->jpeg = scanner.scan(&view);
            if (report->jpeg != JpegStatus::Ok) {
                return;
            }
            if (view.marker == kImageDataMarker) {
                data_bytes += view.data.size();
                continue;
            }
            if (is_rst_marker(view.marker)) {
                resets += 1;
                continue;
            }
            flush_scan_counts(&data_bytes, &resets, &report->lines);

            if (!view.has_data) {
                report->lines.emplace_back(marker_name(view.marker));
                if (view.marker == kMarkerEoi) {
                    report->images += 1;
                    return;
                }
                continue;
            }

            bool is_mpf = false;
            if (view.marker == kMarkerApp2) {
                MpfApp2Output app2;
                report->mpf = processor.process_app2(nullptr, in, view.data,
                                                     &app2);
                if (report->mpf != MpfStatus::Ok) {
                    return;
                }
                is_mpf = app2.is_mpf;
            }
            report->lines.push_back(segment_line(view.marker, view.data,
                                                 is_mpf,
                                                 options.max_preview_bytes));
        }
    }


    class MpfImageLister final : public MpfImageVisitor {
    public:
        MpfImageLister(const JpegReportOptions& options,
                       JpegReport* report) noexcept
            : options_(options)
            , report_(report)
        {
        }

        JpegStatus on_image(ByteStream& in, uint32_t index,
                            uint32_t length) noexcept override
        {
            // Image 0 is the one already listed.
            if (index == 0) {
                return JpegStatus::Ok;
            }
            uint64_t pos          = 0;
            const StreamStatus ss = in.tell(&pos);
            if (ss != StreamStatus::Ok) {
                return jpeg_status_from_stream(ss);
            }
            char buf[96];
            std::snprintf(buf, sizeof(buf), "MPF image %u at offset %llu, size %u",
                          static_cast<unsigned>(index + 1),
                          static_cast<unsigned long long>(pos),
                          static_cast<unsigned>(length));
            report_->lines.emplace_back(buf);

            MpfNoop noop;
            list_image(in, options_, noop, report_);
            return report_->jpeg;
        }

    private:
        const JpegReportOptions& options_;
        JpegReport* report_ = nullptr;
    };

}  // namespace


JpegReport
report_jpeg(ByteStream& in, const JpegReportOptions& options) noexcept
{
    JpegReport report;
    MpfGetIndex get_index(options.tiff_limits);
    list_image(in, options, get_index, &report);
    if (report.jpeg != JpegStatus::Ok || report.mpf != MpfStatus::Ok) {
        return report;
    }
    if (!options.follow_mpf || !get_index.found()) {
        return report;
    }
    MpfImageLister lister(options, &report);
    report.jpeg = for_each_mpf_image(in, get_index.index(), lister);
    return report;
}

}  // namespace jpegseg
