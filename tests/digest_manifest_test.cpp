// tests/digest_manifest_test.cpp
#include <gtest/gtest.h>

#include <sstream>

#include "digest_manifest.hpp"
#include "file_io.hpp"
#include "repair_errors.hpp"
#include "test_helpers.hpp"

using namespace ChunkFix;
using namespace ChunkFix::Testing;

namespace
{
    const std::string D0 = "0123456789abcdef0123456789abcdef";
    const std::string D1 = "fedcba9876543210fedcba9876543210";
    const std::string D2 = "00000000000000000000000000000000";

    Manifest::DigestManifest parseText(const std::string &text)
    {
        std::istringstream in(text);
        return Manifest::DigestManifest::parse(in, "test-manifest");
    }

    // 250 MiB in 100 MiB chunks needs exactly three entries
    std::string validText()
    {
        return "CHUNK_MiB 100\nTOTAL 262144000\nSUM md5\n" + D0 + " 0\n" + D1 + " 1\n" + D2 + " 2\n";
    }
}

TEST(DigestManifestTest, ParsesValidManifest)
{
    const auto manifest = parseText(validText());
    EXPECT_EQ(manifest.chunk_mib, 100u);
    EXPECT_EQ(manifest.total_size, 262144000u);
    EXPECT_EQ(manifest.algorithm, Digest::Algorithm::MD5);
    ASSERT_EQ(manifest.entries.size(), 3u);
    EXPECT_EQ(manifest.entries[1].digest, D1);
    EXPECT_EQ(manifest.entries[2].offset, 2u);
}

TEST(DigestManifestTest, TrailingNewlineIsOptional)
{
    std::string text = validText();
    text.pop_back();
    EXPECT_EQ(parseText(text).entries.size(), 3u);
}

TEST(DigestManifestTest, ToleratesCrLf)
{
    std::string text = "CHUNK_MiB 100\r\nTOTAL 262144000\r\nSUM md5\r\n" + D0 + " 0\r\n" + D1 + " 1\r\n" + D2 +
                       " 2\r\n";
    EXPECT_EQ(parseText(text).entries.size(), 3u);
}

TEST(DigestManifestTest, EmptyFileManifestIsHeaderOnly)
{
    const auto manifest = parseText("CHUNK_MiB 1\nTOTAL 0\nSUM sha256\n");
    EXPECT_TRUE(manifest.entries.empty());
    EXPECT_EQ(manifest.algorithm, Digest::Algorithm::SHA256);
}

TEST(DigestManifestTest, RejectsMalformedHeaders)
{
    const std::string body = D0 + " 0\n" + D1 + " 1\n" + D2 + " 2\n";
    EXPECT_THROW(parseText(""), ValidationError);
    EXPECT_THROW(parseText("CHUNK_MiB 0\nTOTAL 0\nSUM md5\n"), ValidationError);
    EXPECT_THROW(parseText("CHUNK_MiB -1\nTOTAL 0\nSUM md5\n"), ValidationError);
    EXPECT_THROW(parseText("CHUNK_MB 100\nTOTAL 262144000\nSUM md5\n" + body), ValidationError);
    EXPECT_THROW(parseText("CHUNK_MiB  100\nTOTAL 262144000\nSUM md5\n" + body), ValidationError);
    EXPECT_THROW(parseText("CHUNK_MiB 100\nTOTAL 25x\nSUM md5\n" + body), ValidationError);
    EXPECT_THROW(parseText("CHUNK_MiB 100\nTOTAL 262144000\nSUM crc32\n" + body), ValidationError);
    EXPECT_THROW(parseText("CHUNK_MiB 100\nTOTAL 262144000\n"), ValidationError);
}

TEST(DigestManifestTest, RejectsBadEntries)
{
    const std::string header = "CHUNK_MiB 100\nTOTAL 262144000\nSUM md5\n";
    // too few / too many
    EXPECT_THROW(parseText(header + D0 + " 0\n" + D1 + " 1\n"), ValidationError);
    EXPECT_THROW(parseText(header + D0 + " 0\n" + D1 + " 1\n" + D2 + " 2\n" + D2 + " 3\n"), ValidationError);
    // out of order
    EXPECT_THROW(parseText(header + D0 + " 0\n" + D1 + " 2\n" + D2 + " 1\n"), ValidationError);
    // wrong digest length and non-hex
    EXPECT_THROW(parseText(header + D0 + " 0\n" + D1 + "00 1\n" + D2 + " 2\n"), ValidationError);
    EXPECT_THROW(parseText(header + D0 + " 0\n" + std::string(32, 'g') + " 1\n" + D2 + " 2\n"), ValidationError);
    // blank line in the middle
    EXPECT_THROW(parseText(header + D0 + " 0\n\n" + D1 + " 1\n" + D2 + " 2\n"), ValidationError);
}

TEST(DigestManifestTest, ErrorNamesTheLine)
{
    try
    {
        parseText("CHUNK_MiB 100\nTOTAL 262144000\nSUM md5\n" + D0 + " 0\nnonsense\n");
        FAIL() << "expected ValidationError";
    }
    catch (const ValidationError &e)
    {
        EXPECT_NE(std::string(e.what()).find("line 5"), std::string::npos) << e.what();
        EXPECT_NE(std::string(e.what()).find("not a valid manifest"), std::string::npos) << e.what();
    }
}

TEST(DigestManifestTest, WriteThenReadReproducesManifest)
{
    TempDir tmp;
    writeFile(tmp / "file.bin", patternBytes(3 * MiB + 77, 9));

    IO::ByteRangeReader reader(tmp / "file.bin");
    const auto written = Manifest::DigestManifest::generate(reader, 1, Digest::Algorithm::SHA1);
    ASSERT_EQ(written.entries.size(), 4u);
    written.save(tmp / "file.bin.chunksums");

    const auto read = Manifest::DigestManifest::load(tmp / "file.bin.chunksums");
    EXPECT_EQ(read.chunk_mib, written.chunk_mib);
    EXPECT_EQ(read.total_size, written.total_size);
    EXPECT_EQ(read.algorithm, written.algorithm);
    ASSERT_EQ(read.entries.size(), written.entries.size());
    for (size_t i = 0; i < read.entries.size(); ++i)
    {
        EXPECT_EQ(read.entries[i].digest, written.entries[i].digest);
        EXPECT_EQ(read.entries[i].offset, i);
    }
}

TEST(DigestManifestTest, WrittenFormatIsLineOriented)
{
    Manifest::DigestManifest manifest(100, 262144000, Digest::Algorithm::MD5, {D0, D1, D2});
    std::ostringstream out;
    manifest.write(out);
    EXPECT_EQ(out.str(), validText());
}

TEST(DigestManifestTest, LoadMissingFileIsIoError)
{
    TempDir tmp;
    EXPECT_THROW(Manifest::DigestManifest::load(tmp / "nope"), IoError);
}

TEST(DigestManifestTest, ValidateCatchesInconsistentEntries)
{
    Manifest::DigestManifest manifest(100, 262144000, Digest::Algorithm::MD5, {D0, D1});
    EXPECT_THROW(manifest.validate(), ValidationError);
}
