// include/chunk_config.hpp
#pragma once

#include <string>
#include <cstdint>
#include <filesystem> // For std::filesystem::path

#include "digest_utility.hpp"

namespace ChunkFix
{
    namespace Config
    {

        class ChunkConfig
        {
        public:
            // Chunk sizes are expressed in MiB on the command line and in the manifest
            static constexpr uint64_t BYTES_PER_MIB = 1024 * 1024;
            static constexpr uint64_t DEFAULT_CHUNK_MIB = 100;

            // Artifacts are named ARTIFACT_PREFIX + decimal chunk offset
            inline static const std::string ARTIFACT_PREFIX = "BLOCK_";
            // Default manifest path is the target path + MANIFEST_SUFFIX
            inline static const std::string MANIFEST_SUFFIX = ".chunksums";
            inline static const std::string PROGRAM_NAME = "chunkfix";

            uint64_t chunk_mib = DEFAULT_CHUNK_MIB;
            Digest::Algorithm algorithm = Digest::Algorithm::MD5;
            // Set when the operator named the algorithm, so a diff run can refuse a different one
            bool algorithm_explicit = false;
            std::filesystem::path manifest_path; // empty means "derive from target"
            std::filesystem::path artifact_dir = ".";
            bool verbose = false;

            // Chunk size in bytes; throws ValidationError for 0 or overflow
            uint64_t chunkBytes() const;

            // Manifest path to use for the given target file
            std::filesystem::path manifestPathFor(const std::filesystem::path &target) const;

            // Full path of the artifact holding the chunk at this offset
            std::filesystem::path artifactPath(uint64_t chunk_offset) const;

            // Artifact file name for an offset, e.g. BLOCK_3
            static std::string artifactName(uint64_t chunk_offset);

            // Get the artifact directory, creating it if it doesn't exist
            std::filesystem::path ensureArtifactDir() const;
        };

    } // namespace Config
} // namespace ChunkFix
