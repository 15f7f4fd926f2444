#include "jpegseg/byte_stream.h"
#include "jpegseg/file_stream.h"

#include "jpeg_test_builder.h"

#include <gtest/gtest.h>

#include <array>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace jpegseg {
namespace {

    using test::bytes_of;

    static std::string temp_path(const char* name)
    {
        std::string path = ::testing::TempDir();
        if (!path.empty() && path.back() != '/') {
            path.push_back('/');
        }
        path.append(name);
        return path;
    }

}  // namespace

TEST(MemoryStream, ReadsUntilEndThenReportsZero)
{
    MemoryStream s(bytes_of({ 1, 2, 3 }));
    std::array<std::byte, 2> buf {};
    size_t got = 99;

    ASSERT_EQ(s.read(buf, &got), StreamStatus::Ok);
    EXPECT_EQ(got, 2U);
    EXPECT_EQ(buf[1], std::byte { 2 });

    ASSERT_EQ(s.read(buf, &got), StreamStatus::Ok);
    EXPECT_EQ(got, 1U);
    EXPECT_EQ(buf[0], std::byte { 3 });

    ASSERT_EQ(s.read(buf, &got), StreamStatus::Ok);
    EXPECT_EQ(got, 0U);
}


TEST(MemoryStream, OverwritesAndExtends)
{
    MemoryStream s(bytes_of({ 1, 2, 3, 4 }));
    ASSERT_EQ(s.seek(2), StreamStatus::Ok);
    const std::vector<std::byte> patch = bytes_of({ 9, 9, 9 });
    ASSERT_EQ(s.write(patch), StreamStatus::Ok);

    uint64_t pos = 0;
    ASSERT_EQ(s.tell(&pos), StreamStatus::Ok);
    EXPECT_EQ(pos, 5U);
    EXPECT_EQ(s.size(), 5U);
    EXPECT_EQ(s.release(), bytes_of({ 1, 2, 9, 9, 9 }));
    EXPECT_EQ(s.size(), 0U);
}


TEST(MemoryStream, SeekPastEndZeroFillsOnWrite)
{
    MemoryStream s;
    ASSERT_EQ(s.seek(3), StreamStatus::Ok);
    const std::vector<std::byte> one = bytes_of({ 7 });
    ASSERT_EQ(s.write(one), StreamStatus::Ok);
    EXPECT_EQ(s.release(), bytes_of({ 0, 0, 0, 7 }));
}


TEST(FileStream, OpenMissingFileFails)
{
    FileStream f;
    EXPECT_EQ(f.open(temp_path("jpegseg_does_not_exist.jpg").c_str(),
                     FileMode::Read),
              StreamStatus::OpenFailed);
    EXPECT_FALSE(f.is_open());

    uint64_t pos = 0;
    EXPECT_EQ(f.tell(&pos), StreamStatus::SeekFailed);
    EXPECT_EQ(f.open(nullptr, FileMode::Read), StreamStatus::OpenFailed);
}


TEST(FileStream, WritePatchAndReadBack)
{
    const std::string path = temp_path("jpegseg_file_stream_test.bin");
    {
        FileStream f;
        ASSERT_EQ(f.open(path.c_str(), FileMode::ReadWriteTruncate),
                  StreamStatus::Ok);
        const std::vector<std::byte> body = bytes_of({ 1, 2, 3, 4, 5, 6 });
        ASSERT_EQ(f.write(body), StreamStatus::Ok);

        // Backpatch the middle, then return to the end.
        ASSERT_EQ(f.seek(1), StreamStatus::Ok);
        const std::vector<std::byte> patch = bytes_of({ 0xAA, 0xBB });
        ASSERT_EQ(f.write(patch), StreamStatus::Ok);
        ASSERT_EQ(f.seek(6), StreamStatus::Ok);
        const std::vector<std::byte> tail = bytes_of({ 7 });
        ASSERT_EQ(f.write(tail), StreamStatus::Ok);

        // Read back through the same handle.
        ASSERT_EQ(f.seek(0), StreamStatus::Ok);
        std::array<std::byte, 16> buf {};
        size_t got = 0;
        ASSERT_EQ(f.read(buf, &got), StreamStatus::Ok);
        EXPECT_EQ(got, 7U);
        EXPECT_EQ(buf[1], std::byte { 0xAA });
        EXPECT_EQ(buf[6], std::byte { 7 });
        EXPECT_EQ(f.close(), StreamStatus::Ok);
        EXPECT_EQ(f.close(), StreamStatus::Ok);
    }

    FileStream r;
    ASSERT_EQ(r.open(path.c_str(), FileMode::Read), StreamStatus::Ok);
    std::array<std::byte, 16> buf {};
    size_t got = 0;
    ASSERT_EQ(r.read(buf, &got), StreamStatus::Ok);
    ASSERT_EQ(got, 7U);
    EXPECT_EQ(std::vector<std::byte>(buf.begin(), buf.begin() + 7),
              bytes_of({ 1, 0xAA, 0xBB, 4, 5, 6, 7 }));

    ASSERT_EQ(r.seek(4), StreamStatus::Ok);
    uint64_t pos = 0;
    ASSERT_EQ(r.tell(&pos), StreamStatus::Ok);
    EXPECT_EQ(pos, 4U);

    FileStream moved(std::move(r));
    EXPECT_TRUE(moved.is_open());
    EXPECT_FALSE(r.is_open());
    ASSERT_EQ(moved.close(), StreamStatus::Ok);
    std::remove(path.c_str());
}


TEST(StreamStatus, NamesAreStable)
{
    EXPECT_STREQ(stream_status_name(StreamStatus::Ok), "ok");
    EXPECT_STREQ(stream_status_name(StreamStatus::OpenFailed), "open_failed");
    EXPECT_STREQ(stream_status_name(StreamStatus::SeekFailed), "seek_failed");
}

}  // namespace jpegseg
