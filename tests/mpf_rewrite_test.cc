#include "jpegseg/file_stream.h"
#include "jpegseg/jpeg_markers.h"
#include "jpegseg/mpf_rewrite.h"

#include "jpeg_test_builder.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <numeric>
#include <string>
#include <vector>

namespace jpegseg {
namespace {

    using test::append_segment;
    using test::append_span;
    using test::bytes_of;

    static std::vector<std::byte> to_vector(const MemoryStream& s)
    {
        return std::vector<std::byte>(s.bytes().begin(), s.bytes().end());
    }


    // Reads the index of the first image of \p bytes.
    static MpfIndex read_index(const std::vector<std::byte>& bytes)
    {
        MemoryStream in(bytes);
        MemoryStream sink;
        MpfGetIndex get_index;
        const CopyImageResult r = copy_jpeg_image(sink, in, get_index);
        EXPECT_EQ(r.jpeg, JpegStatus::Ok);
        EXPECT_EQ(r.mpf, MpfStatus::Ok);
        EXPECT_TRUE(get_index.found());
        return get_index.index();
    }


    static bool soi_at(const std::vector<std::byte>& bytes, uint32_t pos)
    {
        return pos + 1U < bytes.size() && bytes[pos] == std::byte { 0xFF }
               && bytes[pos + 1U] == std::byte { kMarkerSoi };
    }

}  // namespace

TEST(MpfRewrite, CopyImageRoutesApp2ThroughProcessor)
{
    const std::vector<std::byte> attr = test::make_mpf_attribute_payload(1);
    std::vector<std::byte> bytes      = test::make_image(attr);
    const size_t image_size           = bytes.size();
    bytes.push_back(std::byte { 0x00 });

    MemoryStream in(bytes);
    MemoryStream out;
    MpfNoop noop;
    const CopyImageResult r = copy_jpeg_image(out, in, noop);
    ASSERT_EQ(r.jpeg, JpegStatus::Ok);
    ASSERT_EQ(r.mpf, MpfStatus::Ok);
    EXPECT_TRUE(r.found_mpf);
    // APP2, DQT, SOS, data, RST0, data, EOI
    EXPECT_EQ(r.segments, 7U);

    uint64_t pos = 0;
    ASSERT_EQ(in.tell(&pos), StreamStatus::Ok);
    EXPECT_EQ(pos, image_size);
    bytes.pop_back();
    EXPECT_EQ(to_vector(out), bytes);
}


TEST(MpfRewrite, CopyWithoutPaddingIsIdentity)
{
    const test::MpfFile file = test::make_mpf_file(0);
    MemoryStream in(file.bytes);
    MemoryStream out;
    const MpfCopyResult r = copy_mpf_file(in, out);
    ASSERT_EQ(r.jpeg, JpegStatus::Ok);
    ASSERT_EQ(r.mpf, MpfStatus::Ok);
    EXPECT_EQ(r.images_written, 3U);
    EXPECT_EQ(r.offsets, file.offsets);
    EXPECT_EQ(r.lengths, file.sizes);
    EXPECT_EQ(r.bytes_written, file.bytes.size());
    EXPECT_EQ(to_vector(out), file.bytes);
}


TEST(MpfRewrite, CopyDropsPaddingAndBackpatchesIndex)
{
    for (bool le : { true, false }) {
        const test::MpfFile file = test::make_mpf_file(13, le);
        MemoryStream in(file.bytes);
        MemoryStream out;
        const MpfCopyResult r = copy_mpf_file(in, out);
        ASSERT_EQ(r.jpeg, JpegStatus::Ok);
        ASSERT_EQ(r.mpf, MpfStatus::Ok);
        ASSERT_EQ(r.images_written, 3U);

        const std::vector<std::byte> written = to_vector(out);
        const uint64_t total = std::accumulate(file.sizes.begin(),
                                               file.sizes.end(), uint64_t(0));
        EXPECT_EQ(written.size(), total);
        EXPECT_EQ(r.bytes_written, total);
        EXPECT_EQ(r.offsets,
                  (std::vector<uint32_t> { 0, file.sizes[0],
                                           file.sizes[0] + file.sizes[1] }));
        EXPECT_EQ(r.lengths, file.sizes);

        const MpfIndex index = read_index(written);
        EXPECT_EQ(index.relative_offset_base, test::kPrimaryMpfBase);
        EXPECT_EQ(index.image_offsets, r.offsets);
        EXPECT_EQ(index.image_lengths, r.lengths);
        for (uint32_t off : index.image_offsets) {
            EXPECT_TRUE(soi_at(written, off)) << "offset=" << off;
        }
    }
}


TEST(MpfRewrite, CopyToFileBackpatchesInPlace)
{
    std::string path = ::testing::TempDir();
    if (!path.empty() && path.back() != '/') {
        path.push_back('/');
    }
    path.append("jpegseg_mpf_rewrite_test.jpg");

    const test::MpfFile file = test::make_mpf_file(3);
    MemoryStream in(file.bytes);
    MpfCopyResult r;
    {
        FileStream out;
        ASSERT_EQ(out.open(path.c_str(), FileMode::ReadWriteTruncate),
                  StreamStatus::Ok);
        r = copy_mpf_file(in, out);
        ASSERT_EQ(r.jpeg, JpegStatus::Ok);
        ASSERT_EQ(r.mpf, MpfStatus::Ok);
        ASSERT_EQ(out.close(), StreamStatus::Ok);
    }

    FileStream reread;
    ASSERT_EQ(reread.open(path.c_str(), FileMode::Read), StreamStatus::Ok);
    std::vector<std::byte> bytes(r.bytes_written + 16U);
    size_t got = 0;
    ASSERT_EQ(reread.read(bytes, &got), StreamStatus::Ok);
    ASSERT_EQ(got, r.bytes_written);
    bytes.resize(got);
    ASSERT_EQ(reread.close(), StreamStatus::Ok);
    std::remove(path.c_str());

    const MpfIndex index = read_index(bytes);
    EXPECT_EQ(index.image_offsets, r.offsets);
    EXPECT_EQ(index.image_lengths, file.sizes);
}


TEST(MpfRewrite, PlainJpegCopiesFirstImageOnly)
{
    const std::vector<std::byte> image = test::make_image({});
    std::vector<std::byte> bytes       = image;
    append_span(&bytes, bytes_of({ 0xDE, 0xAD }));

    MemoryStream in(bytes);
    MemoryStream out;
    const MpfCopyResult r = copy_mpf_file(in, out);
    ASSERT_EQ(r.jpeg, JpegStatus::Ok);
    ASSERT_EQ(r.mpf, MpfStatus::Ok);
    EXPECT_EQ(r.images_written, 1U);
    EXPECT_TRUE(r.offsets.empty());
    EXPECT_TRUE(r.lengths.empty());
    EXPECT_EQ(r.bytes_written, image.size());
    EXPECT_EQ(to_vector(out), image);
}


TEST(MpfRewrite, CopyFailsOnIndexIntoJunk)
{
    std::vector<test::MpfEntrySpec> entries(2);
    const uint32_t s0 = static_cast<uint32_t>(
        test::make_image(test::make_mpf_index_payload(entries)).size());
    entries[0] = { s0, 0 };
    entries[1] = { 4, s0 + 1U - test::kPrimaryMpfBase };
    std::vector<std::byte> bytes = test::make_image(
        test::make_mpf_index_payload(entries));
    bytes.insert(bytes.end(), 8, std::byte { 0x5A });

    MemoryStream in(bytes);
    MemoryStream out;
    const MpfCopyResult r = copy_mpf_file(in, out);
    EXPECT_EQ(r.jpeg, JpegStatus::MissingStartMarker);
    EXPECT_EQ(r.images_written, 1U);
}


TEST(MpfRewrite, CopyFailsOnTruncatedSecondImage)
{
    test::MpfFile file = test::make_mpf_file(0);
    file.bytes.resize(file.bytes.size() - 3);
    MemoryStream in(file.bytes);
    MemoryStream out;
    const MpfCopyResult r = copy_mpf_file(in, out);
    EXPECT_EQ(r.jpeg, JpegStatus::Truncated);
    EXPECT_EQ(r.images_written, 2U);
}


TEST(MpfRewrite, RewriteRejectsSizeChange)
{
    const test::MpfFile file = test::make_mpf_file(0);
    TiffTree tree;
    const std::vector<std::byte> payload = test::make_mpf_index_payload(
        std::vector<test::MpfEntrySpec>(3));
    ASSERT_EQ(parse_mpf_segment(payload, TagSpace::MpfIndex, &tree,
                                TiffLimits {}),
              MpfStatus::Ok);

    MemoryStream out(file.bytes);
    ASSERT_EQ(out.seek(file.bytes.size()), StreamStatus::Ok);
    std::vector<uint32_t> lengths;
    EXPECT_EQ(rewrite_mpf_segment(out, &tree, 2, payload.size() + 2U,
                                  file.offsets, file.bytes.size(), &lengths),
              MpfStatus::SizeMismatch);
    EXPECT_EQ(to_vector(out), file.bytes);
    EXPECT_TRUE(lengths.empty());

    ASSERT_EQ(rewrite_mpf_segment(out, &tree, 2, payload.size(), file.offsets,
                                  file.bytes.size(), &lengths),
              MpfStatus::Ok);
    EXPECT_EQ(lengths, file.sizes);
    EXPECT_EQ(to_vector(out), file.bytes);
    uint64_t pos = 0;
    ASSERT_EQ(out.tell(&pos), StreamStatus::Ok);
    EXPECT_EQ(pos, file.bytes.size());
}


TEST(MpfRewrite, StripDropsMetadataSegments)
{
    const std::vector<std::byte> plain = test::make_image({});
    std::vector<std::byte> bytes       = bytes_of({ 0xFF, 0xD8 });
    append_segment(&bytes, kMarkerApp0, bytes_of({ 'J', 'F', 'I', 'F', 0 }));
    append_segment(&bytes, kMarkerCom, bytes_of({ 'h', 'i' }));
    append_segment(&bytes, static_cast<uint8_t>(kMarkerJpg0 + 3), bytes_of({ 1 }));
    bytes.insert(bytes.end(), plain.begin() + 2, plain.end());
    append_span(&bytes, plain);  // second image is never read

    MemoryStream in(bytes);
    MemoryStream out;
    const StripResult r = strip_jpeg(in, out);
    ASSERT_EQ(r.status, JpegStatus::Ok);
    EXPECT_EQ(r.segments_dropped, 3U);
    EXPECT_EQ(r.segments_written, 6U);
    EXPECT_EQ(to_vector(out), plain);
}


TEST(MpfRewrite, StripKeepsSelectedKinds)
{
    std::vector<std::byte> bytes = bytes_of({ 0xFF, 0xD8 });
    append_segment(&bytes, kMarkerApp0, bytes_of({ 'J' }));
    append_segment(&bytes, kMarkerCom, bytes_of({ 'h' }));
    const std::vector<std::byte> plain = test::make_image({});
    bytes.insert(bytes.end(), plain.begin() + 2, plain.end());

    StripOptions options;
    options.drop_com = false;
    MemoryStream in(bytes);
    MemoryStream out;
    const StripResult r = strip_jpeg(in, out, options);
    ASSERT_EQ(r.status, JpegStatus::Ok);
    EXPECT_EQ(r.segments_dropped, 1U);
    EXPECT_EQ(r.segments_written, 7U);

    std::vector<std::byte> expected = bytes_of({ 0xFF, 0xD8 });
    append_segment(&expected, kMarkerCom, bytes_of({ 'h' }));
    expected.insert(expected.end(), plain.begin() + 2, plain.end());
    EXPECT_EQ(to_vector(out), expected);
}


TEST(MpfRewrite, StripReportsScanErrors)
{
    MemoryStream in(bytes_of({ 0xFF, 0xD8, 0xFF, 0x00 }));
    MemoryStream out;
    const StripResult r = strip_jpeg(in, out);
    EXPECT_EQ(r.status, JpegStatus::InvalidMarkerZero);
    EXPECT_EQ(r.segments_written, 0U);
}

}  // namespace jpegseg
