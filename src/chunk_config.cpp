// src/chunk_config.cpp
#include "chunk_config.hpp"
#include "chunk_layout.hpp"
#include "logger.hpp"
#include "repair_errors.hpp"

namespace fs = std::filesystem;

namespace ChunkFix
{
    namespace Config
    {

        uint64_t ChunkConfig::chunkBytes() const
        {
            return Layout::chunkBytesFromMiB(chunk_mib);
        }

        fs::path ChunkConfig::manifestPathFor(const fs::path &target) const
        {
            if (!manifest_path.empty())
            {
                return manifest_path;
            }
            fs::path derived = target;
            derived += MANIFEST_SUFFIX;
            return derived;
        }

        std::string ChunkConfig::artifactName(uint64_t chunk_offset)
        {
            return ARTIFACT_PREFIX + std::to_string(chunk_offset);
        }

        fs::path ChunkConfig::artifactPath(uint64_t chunk_offset) const
        {
            return artifact_dir / artifactName(chunk_offset);
        }

        fs::path ChunkConfig::ensureArtifactDir() const
        {
            try
            {
                if (!fs::exists(artifact_dir))
                {
                    if (fs::create_directories(artifact_dir))
                    {
                        Logger::info("Created directory: " + artifact_dir.string());
                    }
                    else if (!fs::exists(artifact_dir))
                    {
                        throw IoError("Failed to create directory: " + artifact_dir.string());
                    }
                }
                else if (!fs::is_directory(artifact_dir))
                {
                    throw IoError("Artifact path is not a directory: " + artifact_dir.string());
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw IoError("Filesystem error creating directory " + artifact_dir.string() + ": " + e.what());
            }
            return artifact_dir;
        }

    } // namespace Config
} // namespace ChunkFix
