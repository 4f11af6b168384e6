// tests/digest_utility_test.cpp
#include <gtest/gtest.h>

#include "chunk_layout.hpp"
#include "digest_utility.hpp"
#include "file_io.hpp"
#include "repair_errors.hpp"
#include "test_helpers.hpp"

using namespace ChunkFix;
using namespace ChunkFix::Testing;

namespace
{
    std::vector<char> bytesOf(const std::string &text)
    {
        return std::vector<char>(text.begin(), text.end());
    }
}

TEST(DigestUtilityTest, KnownVectors)
{
    EXPECT_EQ(Digest::DigestUtility::digest(Digest::Algorithm::MD5, {}), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(Digest::DigestUtility::digest(Digest::Algorithm::MD5, bytesOf("abc")),
              "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(Digest::DigestUtility::digest(Digest::Algorithm::SHA1, bytesOf("abc")),
              "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(Digest::DigestUtility::digest(Digest::Algorithm::SHA256, bytesOf("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(DigestUtilityTest, HexLengthMatchesOutput)
{
    for (auto algorithm : {Digest::Algorithm::MD5, Digest::Algorithm::SHA1, Digest::Algorithm::SHA256})
    {
        EXPECT_EQ(Digest::DigestUtility::digest(algorithm, bytesOf("x")).size(), Digest::hexLength(algorithm));
    }
}

TEST(DigestUtilityTest, AlgorithmNamesRoundTrip)
{
    Digest::Algorithm parsed = Digest::Algorithm::MD5;
    ASSERT_TRUE(Digest::parseAlgorithm("SHA256", parsed));
    EXPECT_EQ(parsed, Digest::Algorithm::SHA256);
    ASSERT_TRUE(Digest::parseAlgorithm(Digest::algorithmName(Digest::Algorithm::SHA1), parsed));
    EXPECT_EQ(parsed, Digest::Algorithm::SHA1);
    EXPECT_FALSE(Digest::parseAlgorithm("crc32", parsed));
}

TEST(DigestUtilityTest, IncrementalMatchesOneShot)
{
    const auto data = patternBytes(10000, 1);
    Digest::Hasher hasher(Digest::Algorithm::SHA256);
    hasher.update(data.data(), 3000);
    hasher.update(data.data() + 3000, 7000);
    EXPECT_EQ(hasher.finish(), Digest::DigestUtility::digest(Digest::Algorithm::SHA256, data));
}

TEST(DigestUtilityTest, RangeDigestIsDeterministicAndMatchesBuffer)
{
    TempDir tmp;
    const auto data = patternBytes(3 * MiB + 123, 2);
    writeFile(tmp / "file.bin", data);

    IO::ByteRangeReader reader(tmp / "file.bin");
    const uint64_t offset = MiB - 10;
    const uint64_t length = 2 * MiB + 50; // spans several read blocks
    const std::string first = Digest::DigestUtility::digestRange(reader, offset, length, Digest::Algorithm::MD5);
    const std::string second = Digest::DigestUtility::digestRange(reader, offset, length, Digest::Algorithm::MD5);
    EXPECT_EQ(first, second);

    std::vector<char> slice(data.begin() + offset, data.begin() + offset + length);
    EXPECT_EQ(first, Digest::DigestUtility::digest(Digest::Algorithm::MD5, slice));
}

TEST(DigestUtilityTest, ShortReadIsFatal)
{
    TempDir tmp;
    writeFile(tmp / "small.bin", patternBytes(100, 3));
    IO::ByteRangeReader reader(tmp / "small.bin");
    EXPECT_THROW(Digest::DigestUtility::digestRange(reader, 50, 51, Digest::Algorithm::MD5), IoError);
}

TEST(DigestUtilityTest, ChunkDigestsFollowLayout)
{
    TempDir tmp;
    const auto data = patternBytes(2 * MiB + 5, 4);
    writeFile(tmp / "file.bin", data);

    IO::ByteRangeReader reader(tmp / "file.bin");
    Layout::ChunkLayout layout(reader.size(), MiB);
    const auto digests = Digest::DigestUtility::chunkDigests(reader, layout, Digest::Algorithm::MD5);
    ASSERT_EQ(digests.size(), 3u);
    EXPECT_EQ(digests[2], Digest::DigestUtility::digest(Digest::Algorithm::MD5,
                                                        std::vector<char>(data.end() - 5, data.end())));
    EXPECT_NE(digests[0], digests[1]);
}

TEST(FileIoTest, MissingFileIsIoError)
{
    TempDir tmp;
    EXPECT_THROW(IO::ByteRangeReader reader(tmp / "absent"), IoError);
    EXPECT_THROW(IO::fileSize(tmp / "absent"), IoError);
    EXPECT_THROW(IO::ByteRangeWriter writer(tmp / "absent"), IoError);
}

TEST(FileIoTest, TruncateOnlyShrinks)
{
    TempDir tmp;
    writeFile(tmp / "file.bin", patternBytes(1000, 5));
    EXPECT_THROW(IO::truncateFile(tmp / "file.bin", 1001), ValidationError);
    IO::truncateFile(tmp / "file.bin", 1000);
    EXPECT_EQ(IO::fileSize(tmp / "file.bin"), 1000u);
    IO::truncateFile(tmp / "file.bin", 400);
    EXPECT_EQ(IO::fileSize(tmp / "file.bin"), 400u);
}
