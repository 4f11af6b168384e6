// include/patch_extractor.hpp
#pragma once

#include <cstdint>
#include <vector>

#include "chunk.hpp"
#include "chunk_config.hpp"

namespace ChunkFix
{
    namespace IO
    {
        class ByteRangeReader;
    }

    namespace Chunks
    {

        class PatchExtractor
        {
        public:
            explicit PatchExtractor(const Config::ChunkConfig &config);

            // Write one BLOCK_<offset> artifact per offset, in the order given.
            // Offsets must address chunks of the reference file.
            std::vector<ChunkArtifact> extract(IO::ByteRangeReader &reference, const std::vector<uint64_t> &offsets,
                                               Digest::Algorithm algorithm) const;

        private:
            const Config::ChunkConfig &config;
        };

    } // namespace Chunks
} // namespace ChunkFix
