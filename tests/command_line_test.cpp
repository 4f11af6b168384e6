// tests/command_line_test.cpp
#include <gtest/gtest.h>

#include <initializer_list>

#include "command_line.hpp"
#include "repair_errors.hpp"

using namespace ChunkFix;

namespace
{
    Cli::CommandLine parse(std::initializer_list<const char *> args)
    {
        std::vector<const char *> argv{"chunkfix"};
        argv.insert(argv.end(), args.begin(), args.end());
        return Cli::parseCommandLine(static_cast<int>(argv.size()), argv.data());
    }
}

TEST(CommandLineTest, PlainFileIsGenerateMode)
{
    const auto cli = parse({"big.iso"});
    EXPECT_EQ(cli.mode, Cli::Mode::Generate);
    EXPECT_EQ(cli.target, std::filesystem::path("big.iso"));
    EXPECT_EQ(cli.config.chunk_mib, Config::ChunkConfig::DEFAULT_CHUNK_MIB);
    EXPECT_FALSE(cli.chunk_explicit);
}

TEST(CommandLineTest, DiffModeWithOptions)
{
    const auto cli = parse({"-d", "--chunk-mib", "50", "-m", "sums.txt", "--artifact-dir=out", "-a", "sha1",
                            "-r", "report.json", "big.iso"});
    EXPECT_EQ(cli.mode, Cli::Mode::Diff);
    EXPECT_EQ(cli.config.chunk_mib, 50u);
    EXPECT_TRUE(cli.chunk_explicit);
    EXPECT_EQ(cli.config.manifest_path, std::filesystem::path("sums.txt"));
    EXPECT_EQ(cli.config.artifact_dir, std::filesystem::path("out"));
    EXPECT_EQ(cli.config.algorithm, Digest::Algorithm::SHA1);
    EXPECT_TRUE(cli.config.algorithm_explicit);
    EXPECT_EQ(cli.report_path, std::filesystem::path("report.json"));
}

TEST(CommandLineTest, RepairModeFromInjectAndTruncate)
{
    const auto cli = parse({"-c", "100", "-t", "209715200", "-i", "1,4", "-i7", "big.iso"});
    EXPECT_EQ(cli.mode, Cli::Mode::Repair);
    EXPECT_EQ(cli.inject, (std::vector<uint64_t>{1, 4, 7}));
    ASSERT_TRUE(cli.truncate_to.has_value());
    EXPECT_EQ(*cli.truncate_to, 209715200u);
}

TEST(CommandLineTest, RepairModeFromReport)
{
    const auto cli = parse({"-R", "report.json", "-v", "big.iso"});
    EXPECT_EQ(cli.mode, Cli::Mode::Repair);
    EXPECT_EQ(cli.from_report, std::filesystem::path("report.json"));
    EXPECT_TRUE(cli.config.verbose);
}

TEST(CommandLineTest, HelpNeedsNoFile)
{
    EXPECT_EQ(parse({"--help"}).mode, Cli::Mode::Help);
    EXPECT_NE(Cli::usageText().find("--inject"), std::string::npos);
}

TEST(CommandLineTest, DoubleDashEndsOptions)
{
    const auto cli = parse({"--", "-weird-name"});
    EXPECT_EQ(cli.target, std::filesystem::path("-weird-name"));
}

TEST(CommandLineTest, UsageErrors)
{
    EXPECT_THROW(parse({}), UsageError);
    EXPECT_THROW(parse({"a", "b"}), UsageError);
    EXPECT_THROW(parse({"--bogus", "a"}), UsageError);
    EXPECT_THROW(parse({"a", "-c"}), UsageError);
    EXPECT_THROW(parse({"-c", "ten", "a"}), UsageError);
    EXPECT_THROW(parse({"-t", "-5", "a"}), UsageError);
    EXPECT_THROW(parse({"-i", "1,x", "a"}), UsageError);
    EXPECT_THROW(parse({"-a", "crc32", "a"}), UsageError);
    EXPECT_THROW(parse({"--diff=yes", "a"}), UsageError);
}

TEST(CommandLineTest, DiffCannotCombineWithRepairFlags)
{
    EXPECT_THROW(parse({"-d", "-i", "1", "a"}), UsageError);
    EXPECT_THROW(parse({"-d", "-t", "10", "a"}), UsageError);
    EXPECT_THROW(parse({"-d", "-R", "r.json", "a"}), UsageError);
    EXPECT_THROW(parse({"-R", "r.json", "-i", "1", "a"}), UsageError);
    EXPECT_THROW(parse({"-r", "r.json", "a"}), UsageError);
}

TEST(CommandLineTest, ZeroChunkSizeIsValidationError)
{
    EXPECT_THROW(parse({"-c", "0", "a"}), ValidationError);
}
