#include "jpegseg/mpf_process.h"

#include "jpeg_test_builder.h"

#include <gtest/gtest.h>

#include <vector>

namespace jpegseg {
namespace {

    using test::bytes_of;

    // Stream holding \p payload as the APP2 right after SOI, positioned just
    // past the payload (as a scanner leaves it).
    static MemoryStream reader_after_app2(const std::vector<std::byte>& payload)
    {
        MemoryStream in(test::make_image(payload));
        EXPECT_EQ(in.seek(2U + 4U + payload.size()), StreamStatus::Ok);
        return in;
    }


    static std::vector<std::byte> index_payload()
    {
        std::vector<test::MpfEntrySpec> entries(2);
        entries[0] = { 300, 0 };
        entries[1] = { 200, 290 };
        return test::make_mpf_index_payload(entries);
    }

}  // namespace

TEST(MpfProcess, KindNames)
{
    EXPECT_STREQ(mpf_processor_kind_name(MpfProcessorKind::Noop), "noop");
    EXPECT_STREQ(mpf_processor_kind_name(MpfProcessorKind::IndexRewriter),
                 "index_rewriter");
    MpfAttributeRewriter attr;
    EXPECT_EQ(attr.kind(), MpfProcessorKind::AttributeRewriter);
}


TEST(MpfProcess, NoopPassesEverythingThrough)
{
    const std::vector<std::byte> icc = bytes_of({ 'I', 'C', 'C', 0, 1 });
    const std::vector<std::byte> mpf = index_payload();
    MemoryStream reader = reader_after_app2(mpf);

    MpfNoop noop;
    MpfApp2Output out;
    ASSERT_EQ(noop.process_app2(nullptr, reader, icc, &out), MpfStatus::Ok);
    EXPECT_FALSE(out.is_mpf);
    EXPECT_EQ(out.segment.data(), icc.data());

    ASSERT_EQ(noop.process_app2(nullptr, reader, mpf, &out), MpfStatus::Ok);
    EXPECT_TRUE(out.is_mpf);
    EXPECT_EQ(out.segment.size(), mpf.size());
    EXPECT_EQ(noop.mpf_segments(), 1U);
}


TEST(MpfProcess, CheckValidatesInConfiguredSpace)
{
    const std::vector<std::byte> mpf = index_payload();
    MemoryStream reader              = reader_after_app2(mpf);
    MpfCheck check;
    MpfApp2Output out;
    EXPECT_EQ(check.process_app2(nullptr, reader, mpf, &out), MpfStatus::Ok);
    EXPECT_TRUE(out.is_mpf);

    // An attribute segment has no image table.
    const std::vector<std::byte> attr = test::make_mpf_attribute_payload(2);
    MemoryStream attr_reader          = reader_after_app2(attr);
    EXPECT_EQ(check.process_app2(nullptr, attr_reader, attr, &out),
              MpfStatus::ZeroImageCount);

    MpfCheck attr_check(TagSpace::MpfAttribute);
    EXPECT_EQ(attr_check.process_app2(nullptr, attr_reader, attr, &out),
              MpfStatus::Ok);

    std::vector<std::byte> broken = mpf;
    broken[4]                     = std::byte { 'X' };
    MemoryStream broken_reader    = reader_after_app2(broken);
    EXPECT_EQ(check.process_app2(nullptr, broken_reader, broken, &out),
              MpfStatus::Unsupported);
}


TEST(MpfProcess, GetIndexDecodesFirstSegmentOnly)
{
    const std::vector<std::byte> mpf = index_payload();
    MemoryStream reader              = reader_after_app2(mpf);

    MpfGetIndex get_index;
    EXPECT_FALSE(get_index.found());
    MpfApp2Output out;
    ASSERT_EQ(get_index.process_app2(nullptr, reader, mpf, &out),
              MpfStatus::Ok);
    ASSERT_TRUE(get_index.found());
    EXPECT_EQ(get_index.index().relative_offset_base, test::kPrimaryMpfBase);
    EXPECT_EQ(get_index.index().image_offsets,
              (std::vector<uint32_t> { 0, 300 }));
    EXPECT_EQ(get_index.index().image_lengths,
              (std::vector<uint32_t> { 300, 200 }));
    EXPECT_EQ(get_index.tree().ifds.size(), 1U);

    // A second, broken MPF segment is not decoded again.
    std::vector<std::byte> broken = mpf;
    broken[4]                     = std::byte { 'X' };
    ASSERT_EQ(get_index.process_app2(nullptr, reader, broken, &out),
              MpfStatus::Ok);
    EXPECT_EQ(get_index.mpf_segments(), 2U);
    EXPECT_EQ(get_index.index().image_offsets.size(), 2U);
}


TEST(MpfProcess, IndexRewriterReservesPlaceholder)
{
    const std::vector<std::byte> mpf = index_payload();
    MemoryStream reader              = reader_after_app2(mpf);
    MemoryStream writer;
    ASSERT_EQ(writer.seek(42), StreamStatus::Ok);

    MpfIndexRewriter rewriter;
    MpfApp2Output out;
    EXPECT_EQ(rewriter.process_app2(nullptr, reader, mpf, &out),
              MpfStatus::WriteFailed);
    EXPECT_FALSE(rewriter.found());

    ASSERT_EQ(rewriter.process_app2(&writer, reader, mpf, &out),
              MpfStatus::Ok);
    ASSERT_TRUE(rewriter.found());
    EXPECT_TRUE(out.is_mpf);
    EXPECT_NE(out.segment.data(), mpf.data());
    EXPECT_EQ(std::vector<std::byte>(out.segment.begin(), out.segment.end()),
              mpf);
    EXPECT_EQ(rewriter.app2_write_pos(), 42U);
    EXPECT_EQ(rewriter.reserved_size(), mpf.size());
    EXPECT_EQ(rewriter.input_index().image_offsets,
              (std::vector<uint32_t> { 0, 300 }));

    // Later MPF segments pass through untouched.
    const std::vector<std::byte> attr = test::make_mpf_attribute_payload(1);
    ASSERT_EQ(rewriter.process_app2(&writer, reader, attr, &out),
              MpfStatus::Ok);
    EXPECT_EQ(out.segment.data(), attr.data());
    EXPECT_EQ(rewriter.app2_write_pos(), 42U);
}


TEST(MpfProcess, IndexRewriterPropagatesDecodeErrors)
{
    std::vector<test::MpfEntrySpec> entries(2);
    entries[0] = { 1, 0 };
    entries[1] = { 1, 0 };
    const std::vector<std::byte> mpf = test::make_mpf_index_payload(entries);
    MemoryStream reader              = reader_after_app2(mpf);
    MemoryStream writer;
    MpfIndexRewriter rewriter;
    MpfApp2Output out;
    EXPECT_EQ(rewriter.process_app2(&writer, reader, mpf, &out),
              MpfStatus::InvalidOffsetPattern);
    EXPECT_FALSE(rewriter.found());
}


TEST(MpfProcess, AttributeRewriterReserializes)
{
    const std::vector<std::byte> attr = test::make_mpf_attribute_payload(3);
    MemoryStream reader               = reader_after_app2(attr);

    MpfAttributeRewriter rewriter;
    MpfApp2Output out;
    ASSERT_EQ(rewriter.process_app2(nullptr, reader, attr, &out),
              MpfStatus::Ok);
    EXPECT_TRUE(out.is_mpf);
    EXPECT_EQ(std::vector<std::byte>(out.segment.begin(), out.segment.end()),
              attr);
    ASSERT_EQ(rewriter.tree().ifds.size(), 1U);
    EXPECT_EQ(rewriter.tree().ifds[0].space, TagSpace::MpfAttribute);

    const std::vector<std::byte> exif = bytes_of({ 'E', 'x', 'i', 'f' });
    ASSERT_EQ(rewriter.process_app2(nullptr, reader, exif, &out),
              MpfStatus::Ok);
    EXPECT_FALSE(out.is_mpf);
    EXPECT_EQ(rewriter.mpf_segments(), 1U);
}

}  // namespace jpegseg
