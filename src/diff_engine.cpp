// src/diff_engine.cpp
#include "diff_engine.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "repair_errors.hpp"

#include <algorithm>

namespace ChunkFix
{
    namespace Diff
    {

        bool DiffResult::identical() const
        {
            return mismatched.empty() && appended.empty() && !truncate_to && reference_size == manifest_size;
        }

        std::vector<uint64_t> DiffResult::offsetsToExtract() const
        {
            if (whole_file_mismatch)
            {
                return {};
            }
            std::vector<uint64_t> offsets = mismatched;
            offsets.insert(offsets.end(), appended.begin(), appended.end());
            return offsets;
        }

        void DiffEngine::checkCompatible(const Manifest::DigestManifest &manifest, const Config::ChunkConfig &config)
        {
            if (manifest.chunk_mib != config.chunk_mib)
            {
                throw ChunkSizeMismatchError(manifest.chunk_mib, config.chunk_mib);
            }
            if (config.algorithm_explicit && manifest.algorithm != config.algorithm)
            {
                throw ValidationError("Manifest digests use " + Digest::algorithmName(manifest.algorithm) +
                                      " but " + Digest::algorithmName(config.algorithm) +
                                      " was requested; re-run with -a " + Digest::algorithmName(manifest.algorithm));
            }
            manifest.validate();
        }

        DiffResult DiffEngine::compare(const Manifest::DigestManifest &manifest,
                                       const std::vector<std::string> &reference_digests,
                                       uint64_t reference_size)
        {
            DiffResult result;
            result.manifest_size = manifest.total_size;
            result.reference_size = reference_size;

            const uint64_t common = std::min<uint64_t>(manifest.entries.size(), reference_digests.size());
            for (uint64_t i = 0; i < common; ++i)
            {
                if (manifest.entries[i].digest == reference_digests[i])
                {
                    ++result.matched;
                }
                else
                {
                    result.mismatched.push_back(i);
                }
            }
            result.compared = common;

            for (uint64_t i = common; i < reference_digests.size(); ++i)
            {
                result.appended.push_back(i);
            }

            if (reference_size < manifest.total_size)
            {
                result.truncate_to = reference_size;
            }
            result.whole_file_mismatch = result.compared > 0 && result.matched == 0;
            return result;
        }

        DiffResult DiffEngine::diffReference(const Manifest::DigestManifest &manifest, IO::ByteRangeReader &reference,
                                             const Config::ChunkConfig &config)
        {
            checkCompatible(manifest, config);

            Layout::ChunkLayout layout(reference.size(), Layout::chunkBytesFromMiB(manifest.chunk_mib));
            Logger::info("Digesting " + reference.path().string() + " (" + std::to_string(layout.count()) +
                         " chunks of " + std::to_string(manifest.chunk_mib) + " MiB, " +
                         Digest::algorithmName(manifest.algorithm) + ")");
            const auto digests = Digest::DigestUtility::chunkDigests(reference, layout, manifest.algorithm);
            return compare(manifest, digests, reference.size());
        }

    } // namespace Diff
} // namespace ChunkFix
