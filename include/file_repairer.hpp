// include/file_repairer.hpp
#pragma once

#include <filesystem>
#include <iostream>
#include <string>

#include "chunk_config.hpp"
#include "command_line.hpp"
#include "digest_manifest.hpp"
#include "patch_applier.hpp"
#include "repair_report.hpp"

namespace ChunkFix
{

    // Runs one of the three repair passes per call. Operator-facing output
    // (manifest lines, the repair command) goes to the stream given at construction.
    class FileRepairer
    {
    public:
        explicit FileRepairer(const Config::ChunkConfig &config, std::ostream &out = std::cout);

        // Pass 1, damaged side.
        // Digests every chunk of target, overwrites the manifest and echoes it.
        Manifest::DigestManifest generateManifest(const std::filesystem::path &target);

        // Pass 2, reference side.
        // Compares reference against the manifest, extracts the differing
        // chunks and prints the repair command. Writes a JSON report when
        // report_path is not empty.
        Report::RepairReport diffAndExtract(const std::filesystem::path &reference,
                                            const std::filesystem::path &report_path = {});

        // Pass 3, damaged side.
        // Injects the artifacts named by the plan, then truncates.
        Chunks::ApplyResult repair(const std::filesystem::path &target, const Chunks::RepairPlan &plan);

        // Pass 3 driven by a report written in pass 2.
        Chunks::ApplyResult repairFromReport(const std::filesystem::path &target,
                                             const std::filesystem::path &report_path);

    private:
        Config::ChunkConfig config;
        std::ostream &out;
    };

    // Dispatch a parsed command line. Returns the process exit code; all
    // RepairErrors are caught, logged and mapped here.
    int runCommandLine(const Cli::CommandLine &cli, std::ostream &out = std::cout);

} // namespace ChunkFix
