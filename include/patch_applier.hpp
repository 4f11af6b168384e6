// include/patch_applier.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "chunk_config.hpp"

namespace ChunkFix
{
    namespace Chunks
    {

        // What to do to the damaged file: inject these offsets, then optionally shrink it.
        struct RepairPlan
        {
            std::vector<uint64_t> offsets;
            std::optional<uint64_t> truncate_to;
            // Artifact digests known from a repair report, keyed by offset
            std::map<uint64_t, std::string> expected_digests;
            Digest::Algorithm digest_algorithm = Digest::Algorithm::MD5;
        };

        struct ApplyResult
        {
            std::vector<uint64_t> injected;
            uint64_t bytes_written = 0;
            std::optional<uint64_t> truncated_to;
            uint64_t final_size = 0;
        };

        // Overwrites chunks of the target in place. Every artifact is checked
        // before the first byte is written; truncation runs last.
        class PatchApplier
        {
        public:
            explicit PatchApplier(const Config::ChunkConfig &config);

            ApplyResult apply(const std::filesystem::path &target, const RepairPlan &plan) const;

        private:
            const Config::ChunkConfig &config;
        };

    } // namespace Chunks
} // namespace ChunkFix
