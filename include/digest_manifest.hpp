// include/digest_manifest.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "chunk_layout.hpp"
#include "digest_utility.hpp"

namespace ChunkFix {
namespace IO {
class ByteRangeReader;
}
namespace Manifest {

struct ManifestEntry {
    std::string digest; // lowercase hex
    uint64_t offset;    // chunk index, always equal to the entry's position
};

// Per-chunk digests of one file state.
//
// On disk:
//   CHUNK_MiB <positive integer>
//   TOTAL <bytes>
//   SUM <algorithm tag>
//   <hex digest> <offset>      (one line per chunk, offsets 0..N-1)
class DigestManifest {
public:
    uint64_t chunk_mib = 0;
    uint64_t total_size = 0;
    Digest::Algorithm algorithm = Digest::Algorithm::MD5;
    std::vector<ManifestEntry> entries;

    DigestManifest() = default;

    // Builds a manifest from digests already in chunk order.
    DigestManifest(uint64_t chunk_mib, uint64_t total_size, Digest::Algorithm algorithm,
                   const std::vector<std::string> &digests);

    // Digests every chunk of the reader's file.
    static DigestManifest generate(IO::ByteRangeReader &reader, uint64_t chunk_mib, Digest::Algorithm algorithm);

    Layout::ChunkLayout layout() const;

    // Throws ValidationError if the entries disagree with the header.
    void validate() const;

    void write(std::ostream &out) const;

    // Overwrites the file at path in full.
    void save(const std::filesystem::path &path) const;

    // Strict parse. source_name only feeds error messages.
    static DigestManifest parse(std::istream &in, const std::string &source_name);

    static DigestManifest load(const std::filesystem::path &path);
};

} // namespace Manifest
} // namespace ChunkFix
