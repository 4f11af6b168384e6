// src/chunk_layout.cpp
#include "chunk_layout.hpp"
#include "chunk_config.hpp"
#include "repair_errors.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ChunkFix
{
    namespace Layout
    {

        ChunkLayout::ChunkLayout(uint64_t total_size, uint64_t chunk_bytes)
            : total(total_size), chunk(chunk_bytes)
        {
            if (chunk == 0)
            {
                throw ValidationError("Chunk size must be a positive number of bytes.");
            }
        }

        uint64_t ChunkLayout::count() const
        {
            // Written this way so total close to UINT64_MAX cannot overflow
            return total / chunk + (total % chunk != 0 ? 1 : 0);
        }

        uint64_t ChunkLayout::byteOffset(uint64_t index) const
        {
            return index * chunk;
        }

        uint64_t ChunkLayout::byteLength(uint64_t index) const
        {
            if (index >= count())
            {
                throw std::out_of_range("Chunk index " + std::to_string(index) + " is past the last chunk (" +
                                        std::to_string(count()) + " chunks)");
            }
            return std::min(chunk, total - byteOffset(index));
        }

        uint64_t chunkBytesFromMiB(uint64_t chunk_mib)
        {
            const uint64_t unit = Config::ChunkConfig::BYTES_PER_MIB;
            if (chunk_mib == 0)
            {
                throw ValidationError("Chunk size must be a positive number of MiB.");
            }
            if (chunk_mib > std::numeric_limits<uint64_t>::max() / unit)
            {
                throw ValidationError("Chunk size of " + std::to_string(chunk_mib) + " MiB is too large.");
            }
            return chunk_mib * unit;
        }

        bool parseU64(const std::string &text, uint64_t &out_value)
        {
            const uint64_t max_div10 = std::numeric_limits<uint64_t>::max() / 10;
            const uint64_t max_mod10 = std::numeric_limits<uint64_t>::max() % 10;

            if (text.empty())
                return false;
            if (text.size() >= 2 && text[0] == '0')
                return false;

            uint64_t value = 0;
            for (char ch : text)
            {
                if (ch < '0' || ch > '9')
                    return false;
                const uint64_t digit = static_cast<uint64_t>(ch - '0');
                if (value > max_div10 || (value == max_div10 && digit > max_mod10))
                    return false;
                value = value * 10 + digit;
            }
            out_value = value;
            return true;
        }

        std::vector<uint64_t> parseOffsetList(const std::string &text)
        {
            std::vector<uint64_t> offsets;
            std::string item;
            std::istringstream stream(text);
            while (std::getline(stream, item, ','))
            {
                uint64_t offset = 0;
                if (!parseU64(item, offset))
                {
                    throw ValidationError("Invalid chunk offset '" + item + "' in list '" + text + "'");
                }
                offsets.push_back(offset);
            }
            // getline drops an empty trailing field, so "1," must be caught here
            if (offsets.empty() || text.back() == ',')
            {
                throw ValidationError("Invalid chunk offset list '" + text + "'");
            }
            return offsets;
        }

        std::string joinOffsets(const std::vector<uint64_t> &offsets)
        {
            std::string joined;
            for (size_t i = 0; i < offsets.size(); ++i)
            {
                if (i > 0)
                    joined += ',';
                joined += std::to_string(offsets[i]);
            }
            return joined;
        }

    } // namespace Layout
} // namespace ChunkFix
