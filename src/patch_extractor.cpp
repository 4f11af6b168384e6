// src/patch_extractor.cpp
#include "patch_extractor.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "repair_errors.hpp"

namespace ChunkFix
{
    namespace Chunks
    {

        PatchExtractor::PatchExtractor(const Config::ChunkConfig &config) : config(config) {}

        std::vector<ChunkArtifact> PatchExtractor::extract(IO::ByteRangeReader &reference,
                                                           const std::vector<uint64_t> &offsets,
                                                           Digest::Algorithm algorithm) const
        {
            std::vector<ChunkArtifact> artifacts;
            if (offsets.empty())
            {
                return artifacts;
            }

            config.ensureArtifactDir();
            Layout::ChunkLayout layout(reference.size(), config.chunkBytes());
            for (uint64_t offset : offsets)
            {
                if (offset >= layout.count())
                {
                    throw ValidationError("Chunk offset " + std::to_string(offset) + " is past the end of " +
                                          reference.path().string());
                }
                artifacts.push_back(ChunkArtifact::extract(reference, layout, offset, algorithm, config));
                Logger::info("Extracted " + artifacts.back().getFullPath(config).string() + " (" +
                             std::to_string(artifacts.back().size) + " bytes)");
            }
            return artifacts;
        }

    } // namespace Chunks
} // namespace ChunkFix
