// src/digest_utility.cpp
#include "digest_utility.hpp"
#include "chunk_layout.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "repair_errors.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip> // For std::hex, std::setw, std::setfill
#include <sstream> // For std::stringstream

// Ensure OpenSSL::Crypto is linked in CMakeLists.txt
#include <openssl/evp.h>

namespace ChunkFix
{
    namespace Digest
    {

        namespace
        {
            const EVP_MD *evpFor(Algorithm algorithm)
            {
                switch (algorithm)
                {
                case Algorithm::MD5:
                    return EVP_md5();
                case Algorithm::SHA1:
                    return EVP_sha1();
                case Algorithm::SHA256:
                    return EVP_sha256();
                }
                return nullptr;
            }
        } // namespace

        std::string algorithmName(Algorithm algorithm)
        {
            switch (algorithm)
            {
            case Algorithm::MD5:
                return "md5";
            case Algorithm::SHA1:
                return "sha1";
            case Algorithm::SHA256:
                return "sha256";
            }
            return "unknown";
        }

        bool parseAlgorithm(const std::string &name, Algorithm &out_algorithm)
        {
            std::string lower = name;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower == "md5")
                out_algorithm = Algorithm::MD5;
            else if (lower == "sha1")
                out_algorithm = Algorithm::SHA1;
            else if (lower == "sha256")
                out_algorithm = Algorithm::SHA256;
            else
                return false;
            return true;
        }

        size_t hexLength(Algorithm algorithm)
        {
            switch (algorithm)
            {
            case Algorithm::MD5:
                return 32;
            case Algorithm::SHA1:
                return 40;
            case Algorithm::SHA256:
                return 64;
            }
            return 0;
        }

        Hasher::Hasher(Algorithm algorithm) : algo(algorithm), ctx(EVP_MD_CTX_new())
        {
            if (!ctx)
            {
                throw std::runtime_error("Failed to create EVP_MD_CTX");
            }
            const EVP_MD *md = evpFor(algorithm);
            if (!md || EVP_DigestInit_ex(ctx, md, nullptr) != 1)
            {
                EVP_MD_CTX_free(ctx);
                throw DigestUnavailableError("The host's OpenSSL does not provide the " + algorithmName(algorithm) +
                                             " digest; choose another with -a");
            }
        }

        Hasher::~Hasher()
        {
            EVP_MD_CTX_free(ctx);
        }

        void Hasher::update(const char *data, size_t length)
        {
            if (finished)
            {
                throw std::logic_error("Hasher::update after finish");
            }
            if (EVP_DigestUpdate(ctx, data, length) != 1)
            {
                throw std::runtime_error("Failed to update " + algorithmName(algo) + " context with data.");
            }
        }

        std::string Hasher::finish()
        {
            if (finished)
            {
                throw std::logic_error("Hasher::finish called twice");
            }
            unsigned char hash[EVP_MAX_MD_SIZE];
            unsigned int hash_len = 0;
            if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1)
            {
                throw std::runtime_error("Failed to finalize " + algorithmName(algo) + " hash calculation.");
            }
            finished = true;
            return DigestUtility::toHex(hash, hash_len);
        }

        std::string DigestUtility::digest(Algorithm algorithm, const std::vector<char> &data_buffer)
        {
            Hasher hasher(algorithm);
            hasher.update(data_buffer.data(), data_buffer.size());
            return hasher.finish();
        }

        std::string DigestUtility::digestRange(IO::ByteRangeReader &reader, uint64_t byte_offset,
                                               uint64_t byte_length, Algorithm algorithm)
        {
            Hasher hasher(algorithm);
            reader.streamRange(byte_offset, byte_length,
                               [&hasher](const char *data, size_t length) { hasher.update(data, length); });
            return hasher.finish();
        }

        std::vector<std::string> DigestUtility::chunkDigests(IO::ByteRangeReader &reader,
                                                             const Layout::ChunkLayout &layout,
                                                             Algorithm algorithm)
        {
            std::vector<std::string> digests;
            const uint64_t count = layout.count();
            digests.reserve(static_cast<size_t>(count));
            for (uint64_t i = 0; i < count; ++i)
            {
                digests.push_back(digestRange(reader, layout.byteOffset(i), layout.byteLength(i), algorithm));
                Logger::debug("Chunk " + std::to_string(i + 1) + "/" + std::to_string(count) + " of " +
                              reader.path().string() + ": " + digests.back());
            }
            return digests;
        }

        std::string DigestUtility::toHex(const unsigned char *bytes, size_t length)
        {
            std::stringstream ss;
            for (size_t i = 0; i < length; i++)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
            }
            return ss.str();
        }

    } // namespace Digest
} // namespace ChunkFix
