// tests/test_helpers.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ChunkFix
{
    namespace Testing
    {

        constexpr uint64_t MiB = 1024 * 1024;

        // Fresh directory under the system temp dir, removed on destruction
        class TempDir
        {
        public:
            TempDir();
            ~TempDir();

            TempDir(const TempDir &) = delete;
            TempDir &operator=(const TempDir &) = delete;

            const std::filesystem::path &path() const { return dir; }
            std::filesystem::path operator/(const std::string &name) const { return dir / name; }

        private:
            std::filesystem::path dir;
        };

        // Deterministic pseudo-random bytes; different seeds give different content
        std::vector<char> patternBytes(uint64_t size, uint32_t seed);

        void writeFile(const std::filesystem::path &path, const std::vector<char> &bytes);
        std::vector<char> readFile(const std::filesystem::path &path);
        std::string readText(const std::filesystem::path &path);

    } // namespace Testing
} // namespace ChunkFix
