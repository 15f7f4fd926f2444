#include "jpegseg/jpeg_scanner.h"

namespace jpegseg {

Segment
copy_segment(const SegmentView& view)
{
    Segment seg;
    seg.marker   = view.marker;
    seg.has_data = view.has_data;
    seg.data.assign(view.data.begin(), view.data.end());
    return seg;
}


JpegScanner::JpegScanner(ByteStream& in, const JpegScanLimits& limits) noexcept
    : in_(&in)
    , limits_(limits)
{
}


JpegStatus
JpegScanner::fail(JpegStatus status) noexcept
{
    state_   = ScanState::Failed;
    failure_ = status;
    buf_.clear();
    return status;
}


JpegStatus
JpegScanner::open() noexcept
{
    if (state_ == ScanState::Failed) {
        return failure_;
    }
    if (state_ != ScanState::AwaitingHeader) {
        return JpegStatus::Ok;
    }
    const JpegStatus st = read_header(*in_);
    if (st != JpegStatus::Ok) {
        return fail(st);
    }
    state_ = ScanState::AwaitingMarker;
    return JpegStatus::Ok;
}


JpegStatus
JpegScanner::scan(SegmentView* out) noexcept
{
    if (!out) {
        return JpegStatus::ReadFailed;
    }
    *out = SegmentView {};

    switch (state_) {
    case ScanState::Failed: return failure_;
    case ScanState::Finished: return JpegStatus::PastEndOfImage;
    case ScanState::AwaitingHeader: {
        const JpegStatus st = open();
        if (st != JpegStatus::Ok) {
            return st;
        }
        break;
    }
    case ScanState::AwaitingMarker:
    case ScanState::AwaitingScanData: break;
    }

    if (state_ == ScanState::AwaitingScanData) {
        const JpegStatus st = read_image_data(*in_, &buf_, limits_);
        if (st != JpegStatus::Ok) {
            return fail(st);
        }
        state_        = ScanState::AwaitingMarker;
        out->marker   = kImageDataMarker;
        out->has_data = true;
        out->data     = std::span<const std::byte>(buf_.data(), buf_.size());
        return JpegStatus::Ok;
    }

    uint8_t marker = 0;
    JpegStatus st  = read_marker(*in_, &marker);
    if (st != JpegStatus::Ok) {
        return fail(st);
    }
    out->marker = marker;

    if (starts_scan_data(marker)) {
        state_ = ScanState::AwaitingScanData;
    }
    if (marker == kMarkerEoi) {
        state_ = ScanState::Finished;
    }
    if (!marker_has_payload(marker)) {
        buf_.clear();
        return JpegStatus::Ok;
    }

    st = read_data(*in_, &buf_);
    if (st != JpegStatus::Ok) {
        return fail(st);
    }
    out->has_data = true;
    out->data     = std::span<const std::byte>(buf_.data(), buf_.size());
    return JpegStatus::Ok;
}


JpegDumper::JpegDumper(ByteStream& out) noexcept
    : out_(&out)
{
}


JpegStatus
JpegDumper::open() noexcept
{
    if (header_written_) {
        return JpegStatus::Ok;
    }
    const JpegStatus st = write_header(*out_);
    if (st != JpegStatus::Ok) {
        return st;
    }
    header_written_ = true;
    return JpegStatus::Ok;
}


JpegStatus
JpegDumper::dump(uint8_t marker, std::span<const std::byte> data,
                 bool has_data) noexcept
{
    JpegStatus st = open();
    if (st != JpegStatus::Ok) {
        return st;
    }
    if (marker == kImageDataMarker) {
        return write_image_data(*out_, data);
    }
    st = write_marker(*out_, marker);
    if (st != JpegStatus::Ok) {
        return st;
    }
    if (!has_data) {
        return JpegStatus::Ok;
    }
    return write_data(*out_, data);
}


JpegStatus
JpegDumper::dump(const SegmentView& seg) noexcept
{
    return dump(seg.marker, seg.data, seg.has_data);
}


JpegStatus
JpegDumper::dump(const Segment& seg) noexcept
{
    return dump(seg.marker,
                std::span<const std::byte>(seg.data.data(), seg.data.size()),
                seg.has_data);
}


JpegStatus
read_segments(ByteStream& in, std::vector<Segment>* out,
              const JpegScanLimits& limits) noexcept
{
    if (!out) {
        return JpegStatus::ReadFailed;
    }
    JpegScanner scanner(in, limits);
    for (;;) {
        SegmentView view;
        const JpegStatus st = scanner.scan(&view);
        if (st != JpegStatus::Ok) {
            return st;
        }
        out->push_back(copy_segment(view));
        if (view.marker == kMarkerSos || view.marker == kMarkerEoi) {
            return JpegStatus::Ok;
        }
    }
}


JpegStatus
write_segments(ByteStream& out, std::span<const Segment> segments) noexcept
{
    JpegDumper dumper(out);
    JpegStatus st = dumper.open();
    if (st != JpegStatus::Ok) {
        return st;
    }
    for (const Segment& seg : segments) {
        st = dumper.dump(seg);
        if (st != JpegStatus::Ok) {
            return st;
        }
    }
    return JpegStatus::Ok;
}

}  // namespace jpegseg
