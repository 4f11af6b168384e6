// tests/test_helpers.cpp
#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace ChunkFix
{
    namespace Testing
    {

        TempDir::TempDir()
        {
            static std::atomic<unsigned> counter{0};
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            dir = fs::temp_directory_path() /
                  ("chunkfix_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
            fs::create_directories(dir);
        }

        TempDir::~TempDir()
        {
            std::error_code ec;
            fs::remove_all(dir, ec);
        }

        std::vector<char> patternBytes(uint64_t size, uint32_t seed)
        {
            std::vector<char> bytes(static_cast<size_t>(size));
            uint32_t state = seed * 2654435761u + 1;
            for (auto &b : bytes)
            {
                // xorshift32
                state ^= state << 13;
                state ^= state >> 17;
                state ^= state << 5;
                b = static_cast<char>(state & 0xff);
            }
            return bytes;
        }

        void writeFile(const fs::path &path, const std::vector<char> &bytes)
        {
            std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw std::runtime_error("test: cannot write " + path.string());
            }
            ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        }

        std::vector<char> readFile(const fs::path &path)
        {
            std::ifstream ifs(path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw std::runtime_error("test: cannot read " + path.string());
            }
            return std::vector<char>(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
        }

        std::string readText(const fs::path &path)
        {
            const auto bytes = readFile(path);
            return std::string(bytes.begin(), bytes.end());
        }

    } // namespace Testing
} // namespace ChunkFix
