// include/chunk_layout.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ChunkFix
{
    namespace Layout
    {

        // Fixed-size partition of [0, total_size). Every chunk is chunk_bytes long
        // except the last, which holds the remainder. A total that is an exact
        // multiple of chunk_bytes has no short trailing chunk.
        class ChunkLayout
        {
        public:
            // Throws ValidationError when chunk_bytes is 0
            ChunkLayout(uint64_t total_size, uint64_t chunk_bytes);

            uint64_t totalSize() const { return total; }
            uint64_t chunkBytes() const { return chunk; }

            // ceil(total / chunk); 0 only for an empty file
            uint64_t count() const;

            // Byte position of chunk i
            uint64_t byteOffset(uint64_t index) const;

            // Byte length of chunk i (throws std::out_of_range past count())
            uint64_t byteLength(uint64_t index) const;

        private:
            uint64_t total;
            uint64_t chunk;
        };

        // MiB count to bytes. Rejects 0 and values that overflow 64 bits.
        uint64_t chunkBytesFromMiB(uint64_t chunk_mib);

        // Strict unsigned decimal: digits only, no sign, no leading zeros,
        // no overflow. Returns false on any deviation.
        bool parseU64(const std::string &text, uint64_t &out_value);

        // "1,4,7" -> {1, 4, 7}. Throws ValidationError on a malformed entry.
        std::vector<uint64_t> parseOffsetList(const std::string &text);

        // {1, 4, 7} -> "1,4,7"
        std::string joinOffsets(const std::vector<uint64_t> &offsets);

    } // namespace Layout
} // namespace ChunkFix
