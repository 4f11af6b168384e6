// include/digest_utility.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// OpenSSL EVP types, kept out of this header
struct evp_md_ctx_st;

namespace ChunkFix
{
    namespace IO
    {
        class ByteRangeReader;
    }
    namespace Layout
    {
        class ChunkLayout;
    }

    namespace Digest
    {

        // Digest algorithms a manifest may be written with. The tag stored in
        // the manifest's SUM line is algorithmName().
        enum class Algorithm
        {
            MD5,
            SHA1,
            SHA256
        };

        std::string algorithmName(Algorithm algorithm);

        // "md5" / "sha1" / "sha256" (case-insensitive). Returns false for anything else.
        bool parseAlgorithm(const std::string &name, Algorithm &out_algorithm);

        // Number of hex characters in a digest of this algorithm
        size_t hexLength(Algorithm algorithm);

        // Incremental digest over an OpenSSL EVP context.
        class Hasher
        {
        public:
            // Throws DigestUnavailableError if the host's OpenSSL refuses the algorithm
            explicit Hasher(Algorithm algorithm);
            ~Hasher();

            Hasher(const Hasher &) = delete;
            Hasher &operator=(const Hasher &) = delete;

            void update(const char *data, size_t length);

            // Lowercase hex digest. The hasher cannot be reused afterwards.
            std::string finish();

        private:
            Algorithm algo;
            evp_md_ctx_st *ctx;
            bool finished = false;
        };

        class DigestUtility
        {
        public:
            // Digest of an in-memory buffer, as lowercase hex.
            static std::string digest(Algorithm algorithm, const std::vector<char> &data_buffer);

            // Digest of exactly byte_length bytes of a file starting at byte_offset.
            // A short read is fatal (IoError).
            static std::string digestRange(IO::ByteRangeReader &reader, uint64_t byte_offset,
                                           uint64_t byte_length, Algorithm algorithm);

            // Digest of every chunk of the layout, in index order. Reads strictly forward.
            static std::vector<std::string> chunkDigests(IO::ByteRangeReader &reader,
                                                         const Layout::ChunkLayout &layout,
                                                         Algorithm algorithm);

            static std::string toHex(const unsigned char *bytes, size_t length);
        };

    } // namespace Digest
} // namespace ChunkFix
