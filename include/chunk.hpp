// include/chunk.hpp
#pragma once

#include <cstdint>
#include <string>
#include <filesystem>

#include "chunk_config.hpp"
#include "chunk_layout.hpp"
#include "digest_utility.hpp"

namespace ChunkFix {
namespace IO {
class ByteRangeReader;
class ByteRangeWriter;
}
namespace Chunks {

// One chunk's bytes carried between the two sites as a standalone file,
// named from its offset (BLOCK_<offset>).
class ChunkArtifact {
public:
    uint64_t offset = 0;  // in chunk-size units
    uint64_t size = 0;    // bytes, known after extract() or inspect()
    std::string digest;   // filled by extract(); empty when unknown

    explicit ChunkArtifact(uint64_t chunk_offset) : offset(chunk_offset) {}

    // Copy the chunk at this offset out of the reference file into the
    // artifact directory, replacing any previous artifact of the same name.
    static ChunkArtifact extract(IO::ByteRangeReader &reference, const Layout::ChunkLayout &layout,
                                 uint64_t chunk_offset, Digest::Algorithm algorithm,
                                 const Config::ChunkConfig &config);

    // Checks the artifact is present and plausibly sized; fills size.
    // Throws MissingArtifactError or ValidationError.
    void inspect(const Config::ChunkConfig &config);

    // Digest of the artifact file as it is on disk now.
    std::string computeDigest(Digest::Algorithm algorithm, const Config::ChunkConfig &config) const;

    // Write the artifact's bytes into the target at offset * chunk bytes.
    // Returns the number of bytes written.
    uint64_t injectInto(IO::ByteRangeWriter &target, const Config::ChunkConfig &config) const;

    // Get the full path where this artifact is stored
    std::filesystem::path getFullPath(const Config::ChunkConfig &config) const;
};

} // namespace Chunks
} // namespace ChunkFix
