// src/file_io.cpp
#include "file_io.hpp"
#include "repair_errors.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace ChunkFix
{
    namespace IO
    {

        uint64_t fileSize(const fs::path &path)
        {
            std::error_code ec;
            if (!fs::is_regular_file(path, ec))
            {
                throw IoError("File not found or not a regular file: " + path.string());
            }
            const uintmax_t size = fs::file_size(path, ec);
            if (ec)
            {
                throw IoError("Failed to get size of " + path.string() + ": " + ec.message());
            }
            return static_cast<uint64_t>(size);
        }

        void truncateFile(const fs::path &path, uint64_t new_size)
        {
            const uint64_t current = fileSize(path);
            if (new_size > current)
            {
                throw ValidationError("Refusing to truncate " + path.string() + " to " + std::to_string(new_size) +
                                      " bytes: it is only " + std::to_string(current) +
                                      " bytes long and truncation never extends a file");
            }
            if (new_size == current)
            {
                return;
            }
            std::error_code ec;
            fs::resize_file(path, new_size, ec);
            if (ec)
            {
                throw IoError("Failed to truncate " + path.string() + ": " + ec.message());
            }
        }

        ByteRangeReader::ByteRangeReader(const fs::path &path)
            : file_path(path), file_size(fileSize(path))
        {
            input.open(path, std::ios::binary);
            if (!input.is_open())
            {
                throw IoError("Failed to open file for reading: " + path.string());
            }
        }

        void ByteRangeReader::readRange(uint64_t offset, char *out, size_t length)
        {
            if (offset > file_size || length > file_size - offset)
            {
                throw IoError("Read of " + std::to_string(length) + " bytes at " + std::to_string(offset) +
                              " is past the end of " + file_path.string());
            }
            input.clear();
            input.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
            input.read(out, static_cast<std::streamsize>(length));
            const auto got = static_cast<size_t>(input.gcount());
            if (got != length)
            {
                throw IoError("Short read from " + file_path.string() + " at byte " + std::to_string(offset) +
                              ": expected " + std::to_string(length) + ", got " + std::to_string(got));
            }
        }

        void ByteRangeReader::streamRange(uint64_t offset, uint64_t length,
                                          const std::function<void(const char *, size_t)> &sink)
        {
            if (buffer.empty())
            {
                buffer.resize(READ_BLOCK_SIZE);
            }
            uint64_t done = 0;
            while (done < length)
            {
                const size_t piece = static_cast<size_t>(std::min<uint64_t>(READ_BLOCK_SIZE, length - done));
                readRange(offset + done, buffer.data(), piece);
                sink(buffer.data(), piece);
                done += piece;
            }
        }

        ByteRangeWriter::ByteRangeWriter(const fs::path &path) : file_path(path)
        {
            std::error_code ec;
            if (!fs::is_regular_file(path, ec))
            {
                throw IoError("Target file not found: " + path.string());
            }
            // in|out keeps the existing content; plain out would truncate it
            output.open(path, std::ios::binary | std::ios::in | std::ios::out);
            if (!output.is_open())
            {
                throw IoError("Failed to open file for in-place writing: " + path.string());
            }
        }

        void ByteRangeWriter::writeAt(uint64_t offset, const char *data, size_t length)
        {
            output.seekp(static_cast<std::streamoff>(offset), std::ios::beg);
            output.write(data, static_cast<std::streamsize>(length));
            if (!output.good())
            {
                throw IoError("Failed to write " + std::to_string(length) + " bytes at byte " +
                              std::to_string(offset) + " of " + file_path.string());
            }
        }

        void ByteRangeWriter::close()
        {
            output.flush();
            if (!output.good())
            {
                throw IoError("Failed to flush " + file_path.string());
            }
            output.close();
        }

    } // namespace IO
} // namespace ChunkFix
