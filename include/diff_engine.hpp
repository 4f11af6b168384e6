// include/diff_engine.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chunk_config.hpp"
#include "digest_manifest.hpp"

namespace ChunkFix
{
    namespace IO
    {
        class ByteRangeReader;
    }

    namespace Diff
    {

        // Outcome of comparing a damaged file's manifest with the reference file.
        struct DiffResult
        {
            // Chunk offsets whose digests differ, ascending
            std::vector<uint64_t> mismatched;
            // Reference chunks past the end of the manifest, ascending
            std::vector<uint64_t> appended;
            uint64_t compared = 0;
            uint64_t matched = 0;
            uint64_t manifest_size = 0;
            uint64_t reference_size = 0;
            // Set when the reference is shorter: the damaged file must shrink to this size
            std::optional<uint64_t> truncate_to;
            // Chunks were compared and none matched; incremental repair is pointless
            bool whole_file_mismatch = false;

            bool identical() const;
            bool referenceLonger() const { return reference_size > manifest_size; }

            // Chunks to copy out of the reference: mismatched then appended.
            // Empty for a whole-file mismatch.
            std::vector<uint64_t> offsetsToExtract() const;
        };

        class DiffEngine
        {
        public:
            // Refuses to diff when the manifest's chunk size (or an explicitly
            // requested algorithm) disagrees with this run's parameters.
            static void checkCompatible(const Manifest::DigestManifest &manifest, const Config::ChunkConfig &config);

            // Positional comparison of the manifest entries against the
            // reference digests. No I/O.
            static DiffResult compare(const Manifest::DigestManifest &manifest,
                                      const std::vector<std::string> &reference_digests,
                                      uint64_t reference_size);

            // Recomputes the reference digests with the manifest's parameters and compares.
            static DiffResult diffReference(const Manifest::DigestManifest &manifest, IO::ByteRangeReader &reference,
                                            const Config::ChunkConfig &config);
        };

    } // namespace Diff
} // namespace ChunkFix
