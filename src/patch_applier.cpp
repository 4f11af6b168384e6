// src/patch_applier.cpp
#include "patch_applier.hpp"
#include "chunk.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "repair_errors.hpp"

#include <algorithm>

namespace ChunkFix
{
    namespace Chunks
    {

        PatchApplier::PatchApplier(const Config::ChunkConfig &config) : config(config) {}

        ApplyResult PatchApplier::apply(const std::filesystem::path &target, const RepairPlan &plan) const
        {
            ApplyResult result;

            // Ascending order keeps appended chunks contiguous with the file's end
            std::vector<uint64_t> offsets = plan.offsets;
            std::sort(offsets.begin(), offsets.end());
            offsets.erase(std::unique(offsets.begin(), offsets.end()), offsets.end());

            std::vector<ChunkArtifact> artifacts;
            for (uint64_t offset : offsets)
            {
                ChunkArtifact artifact(offset);
                artifact.inspect(config);

                auto expected = plan.expected_digests.find(offset);
                if (expected != plan.expected_digests.end())
                {
                    if (artifact.computeDigest(plan.digest_algorithm, config) != expected->second)
                    {
                        throw ArtifactMismatchError(offset, artifact.getFullPath(config).string());
                    }
                    Logger::debug("Verified " + artifact.getFullPath(config).string());
                }
                artifacts.push_back(artifact);
            }

            if (plan.truncate_to)
            {
                // Catch a truncation that would have to extend the file before anything is written
                uint64_t projected = IO::fileSize(target);
                for (const auto &artifact : artifacts)
                {
                    projected = std::max(projected, artifact.offset * config.chunkBytes() + artifact.size);
                }
                if (*plan.truncate_to > projected)
                {
                    throw ValidationError("Cannot truncate " + target.string() + " to " +
                                          std::to_string(*plan.truncate_to) + " bytes: it would end up only " +
                                          std::to_string(projected) + " bytes long");
                }
            }

            if (!artifacts.empty())
            {
                IO::ByteRangeWriter writer(target);
                for (const auto &artifact : artifacts)
                {
                    result.bytes_written += artifact.injectInto(writer, config);
                    result.injected.push_back(artifact.offset);
                    Logger::info("Injected " + artifact.getFullPath(config).string() + " at byte " +
                                 std::to_string(artifact.offset * config.chunkBytes()));
                }
                writer.close();
            }

            if (plan.truncate_to)
            {
                IO::truncateFile(target, *plan.truncate_to);
                result.truncated_to = plan.truncate_to;
                Logger::info("Truncated " + target.string() + " to " + std::to_string(*plan.truncate_to) + " bytes");
            }

            result.final_size = IO::fileSize(target);
            return result;
        }

    } // namespace Chunks
} // namespace ChunkFix
