// include/file_io.hpp
#pragma once

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <vector>

namespace ChunkFix
{
    namespace IO
    {

        // Largest piece read from disk at once. Chunk-sized work is streamed
        // through a buffer of this size.
        constexpr size_t READ_BLOCK_SIZE = 1024 * 1024;

        // Size of a regular file in bytes. Throws IoError if it is missing or not a regular file.
        uint64_t fileSize(const std::filesystem::path &path);

        // Shrink a file to new_size bytes. Throws ValidationError if that would extend it.
        void truncateFile(const std::filesystem::path &path, uint64_t new_size);

        // Sequential-friendly positioned reader over one file. The size is
        // captured at open time and every read must lie inside it.
        class ByteRangeReader
        {
        public:
            explicit ByteRangeReader(const std::filesystem::path &path);

            ByteRangeReader(const ByteRangeReader &) = delete;
            ByteRangeReader &operator=(const ByteRangeReader &) = delete;

            uint64_t size() const { return file_size; }
            const std::filesystem::path &path() const { return file_path; }

            // Read exactly length bytes at offset into out. Short reads throw IoError.
            void readRange(uint64_t offset, char *out, size_t length);

            // Stream [offset, offset+length) to sink in pieces of at most READ_BLOCK_SIZE.
            void streamRange(uint64_t offset, uint64_t length,
                             const std::function<void(const char *, size_t)> &sink);

        private:
            std::filesystem::path file_path;
            std::ifstream input;
            uint64_t file_size;
            std::vector<char> buffer;
        };

        // In-place writer. Opens an existing file without truncating it so that
        // bytes outside the written ranges are preserved.
        class ByteRangeWriter
        {
        public:
            explicit ByteRangeWriter(const std::filesystem::path &path);

            ByteRangeWriter(const ByteRangeWriter &) = delete;
            ByteRangeWriter &operator=(const ByteRangeWriter &) = delete;

            void writeAt(uint64_t offset, const char *data, size_t length);

            // Flush and close; errors surface here rather than in the destructor
            void close();

        private:
            std::filesystem::path file_path;
            std::fstream output;
        };

    } // namespace IO
} // namespace ChunkFix
