#include "jpegseg/mpf_rewrite.h"

#include "jpegseg/jpeg_markers.h"
#include "jpegseg/jpeg_scanner.h"

#include <limits>
#include <utility>

namespace jpegseg {

namespace {

    static MpfStatus mpf_status_from_write(JpegStatus status) noexcept
    {
        switch (status) {
        case JpegStatus::Ok: return MpfStatus::Ok;
        case JpegStatus::SeekFailed: return MpfStatus::SeekFailed;
        case JpegStatus::SegmentTooLarge: return MpfStatus::LimitExceeded;
        default: return MpfStatus::WriteFailed;
        }
    }


    static bool strip_drops(const StripOptions& options,
                            uint8_t marker) noexcept
    {
        if (marker == kMarkerCom) {
            return options.drop_com;
        }
        if (is_app_marker(marker)) {
            return options.drop_app;
        }
        if (is_jpg_marker(marker)) {
            return options.drop_jpg;
        }
        return false;
    }

}  // namespace


CopyImageResult
copy_jpeg_image(ByteStream& out, ByteStream& in, MpfProcessor& processor,
                const JpegScanLimits& limits) noexcept
{
    CopyImageResult result;
    JpegScanner scanner(in, limits);
    JpegDumper dumper(out);

    result.jpeg = dumper.open();
    if (result.jpeg != JpegStatus::Ok) {
        return result;
    }

    for (;;) {
        SegmentView view;
        result.jpeg = scanner.scan(&view);
        if (result.jpeg != JpegStatus::Ok) {
            return result;
        }

        std::span<const std::byte> payload = view.data;
        if (view.marker == kMarkerApp2 && view.has_data) {
            MpfApp2Output app2;
            result.mpf = processor.process_app2(&out, in, view.data, &app2);
            if (result.mpf != MpfStatus::Ok) {
                return result;
            }
            result.found_mpf = result.found_mpf || app2.is_mpf;
            payload          = app2.segment;
        }

        result.jpeg = dumper.dump(view.marker, payload, view.has_data);
        if (result.jpeg != JpegStatus::Ok) {
            return result;
        }
        result.segments += 1;
        if (view.marker == kMarkerEoi) {
            return result;
        }
    }
}


MpfStatus
rewrite_mpf_segment(ByteStream& out, TiffTree* tree, uint64_t app2_write_pos,
                    uint64_t reserved_size, std::span<const uint32_t> offsets,
                    uint64_t end, std::vector<uint32_t>* lengths) noexcept
{
    if (!tree) {
        return MpfStatus::Malformed;
    }
    const uint64_t base = app2_write_pos + kMpfApp2Preamble;
    if (base > std::numeric_limits<uint32_t>::max()) {
        return MpfStatus::OffsetOverflow;
    }

    MpfIndex index;
    index.relative_offset_base = static_cast<uint32_t>(base);
    MpfStatus st = compute_image_lengths(offsets, end, &index.image_lengths);
    if (st != MpfStatus::Ok) {
        return st;
    }
    index.image_offsets.assign(offsets.begin(), offsets.end());
    st = encode_mpf_index(index, tree);
    if (st != MpfStatus::Ok) {
        return st;
    }

    std::vector<std::byte> payload;
    st = make_mpf_segment(*tree, &payload);
    if (st != MpfStatus::Ok) {
        return st;
    }
    if (payload.size() != reserved_size) {
        return MpfStatus::SizeMismatch;
    }

    StreamStatus ss = out.seek(app2_write_pos);
    if (ss != StreamStatus::Ok) {
        return mpf_status_from_stream(ss);
    }
    st = mpf_status_from_write(write_marker(out, kMarkerApp2));
    if (st != MpfStatus::Ok) {
        return st;
    }
    st = mpf_status_from_write(write_data(out, payload));
    if (st != MpfStatus::Ok) {
        return st;
    }
    ss = out.seek(end);
    if (ss != StreamStatus::Ok) {
        return mpf_status_from_stream(ss);
    }

    if (lengths) {
        *lengths = std::move(index.image_lengths);
    }
    return MpfStatus::Ok;
}


MpfCopyResult
copy_mpf_file(ByteStream& in, ByteStream& out,
              const MpfCopyOptions& options) noexcept
{
    MpfCopyResult result;

    MpfIndexRewriter rewriter(options.tiff_limits);
    const CopyImageResult first = copy_jpeg_image(out, in, rewriter,
                                                  options.scan_limits);
    result.jpeg = first.jpeg;
    result.mpf  = first.mpf;
    if (first.jpeg != JpegStatus::Ok || first.mpf != MpfStatus::Ok) {
        return result;
    }
    result.images_written = 1;

    StreamStatus ss = StreamStatus::Ok;
    if (!rewriter.found()) {
        ss = out.tell(&result.bytes_written);
        if (ss != StreamStatus::Ok) {
            result.jpeg = jpeg_status_from_stream(ss);
        }
        return result;
    }

    const MpfIndex& source = rewriter.input_index();
    std::vector<uint32_t> offsets;
    offsets.reserve(source.image_offsets.size());
    offsets.push_back(0);

    for (size_t i = 1; i < source.image_offsets.size(); ++i) {
        ss = in.seek(source.image_offsets[i]);
        if (ss != StreamStatus::Ok) {
            result.jpeg = jpeg_status_from_stream(ss);
            return result;
        }
        uint64_t pos = 0;
        ss           = out.tell(&pos);
        if (ss != StreamStatus::Ok) {
            result.jpeg = jpeg_status_from_stream(ss);
            return result;
        }
        if (pos > std::numeric_limits<uint32_t>::max()) {
            result.mpf = MpfStatus::OffsetOverflow;
            return result;
        }
        offsets.push_back(static_cast<uint32_t>(pos));

        MpfAttributeRewriter attributes(options.tiff_limits);
        const CopyImageResult image = copy_jpeg_image(out, in, attributes,
                                                      options.scan_limits);
        result.jpeg = image.jpeg;
        result.mpf  = image.mpf;
        if (image.jpeg != JpegStatus::Ok || image.mpf != MpfStatus::Ok) {
            return result;
        }
        result.images_written += 1;
    }

    uint64_t end = 0;
    ss           = out.tell(&end);
    if (ss != StreamStatus::Ok) {
        result.jpeg = jpeg_status_from_stream(ss);
        return result;
    }

    result.mpf = rewrite_mpf_segment(out, &rewriter.tree(),
                                     rewriter.app2_write_pos(),
                                     rewriter.reserved_size(), offsets, end,
                                     &result.lengths);
    if (result.mpf != MpfStatus::Ok) {
        return result;
    }
    result.offsets       = std::move(offsets);
    result.bytes_written = end;
    return result;
}


StripResult
strip_jpeg(ByteStream& in, ByteStream& out, const StripOptions& options) noexcept
{
    StripResult result;
    JpegScanner scanner(in, options.scan_limits);
    JpegDumper dumper(out);

    result.status = dumper.open();
    if (result.status != JpegStatus::Ok) {
        return result;
    }

    for (;;) {
        SegmentView view;
        result.status = scanner.scan(&view);
        if (result.status != JpegStatus::Ok) {
            return result;
        }
        if (view.marker != kImageDataMarker
            && strip_drops(options, view.marker)) {
            result.segments_dropped += 1;
            continue;
        }
        result.status = dumper.dump(view);
        if (result.status != JpegStatus::Ok) {
            return result;
        }
        result.segments_written += 1;
        if (view.marker == kMarkerEoi) {
            return result;
        }
    }
}

}  // namespace jpegseg
