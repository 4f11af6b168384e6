// include/command_line.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "chunk_config.hpp"

namespace ChunkFix
{
    namespace Cli
    {

        enum class Mode
        {
            Generate, // damaged side: write the manifest
            Diff,     // reference side: compare and extract artifacts
            Repair,   // damaged side: inject artifacts and/or truncate
            Help
        };

        struct CommandLine
        {
            Mode mode = Mode::Generate;
            std::filesystem::path target;
            Config::ChunkConfig config;
            bool chunk_explicit = false;
            std::vector<uint64_t> inject;
            std::optional<uint64_t> truncate_to;
            std::filesystem::path report_path;  // -r
            std::filesystem::path from_report;  // -R
        };

        // Throws UsageError for anything malformed or contradictory, and
        // ValidationError for a zero chunk size.
        CommandLine parseCommandLine(int argc, const char *const argv[]);

        std::string usageText();

    } // namespace Cli
} // namespace ChunkFix
