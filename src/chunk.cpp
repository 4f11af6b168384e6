// src/chunk.cpp
#include "chunk.hpp"
#include "file_io.hpp"
#include "repair_errors.hpp"

#include <fstream>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;

namespace ChunkFix
{
    namespace Chunks
    {

        ChunkArtifact ChunkArtifact::extract(IO::ByteRangeReader &reference, const Layout::ChunkLayout &layout,
                                             uint64_t chunk_offset, Digest::Algorithm algorithm,
                                             const Config::ChunkConfig &config)
        {
            ChunkArtifact artifact(chunk_offset);
            artifact.size = layout.byteLength(chunk_offset);
            fs::path artifact_path = artifact.getFullPath(config);

            std::ofstream ofs(artifact_path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw IoError("Failed to open file for writing chunk: " + artifact_path.string());
            }

            // Hash while copying so the artifact is read from disk only once
            Digest::Hasher hasher(algorithm);
            reference.streamRange(layout.byteOffset(chunk_offset), artifact.size,
                                  [&](const char *data, size_t length)
                                  {
                                      ofs.write(data, static_cast<std::streamsize>(length));
                                      if (!ofs.good())
                                      {
                                          throw IoError("Failed to write all data to chunk file: " +
                                                        artifact_path.string());
                                      }
                                      hasher.update(data, length);
                                  });
            ofs.close();
            if (ofs.fail())
            {
                throw IoError("Failed to close chunk file: " + artifact_path.string());
            }
            artifact.digest = hasher.finish();
            return artifact;
        }

        void ChunkArtifact::inspect(const Config::ChunkConfig &config)
        {
            // The whole chunk must stay addressable by a stream offset
            const uint64_t chunk_bytes = config.chunkBytes();
            const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<std::streamoff>::max());
            if (chunk_bytes > limit || offset > (limit - chunk_bytes) / chunk_bytes)
            {
                throw ValidationError("Chunk offset " + std::to_string(offset) + " is out of range");
            }
            fs::path artifact_path = getFullPath(config);
            std::error_code ec;
            if (!fs::is_regular_file(artifact_path, ec))
            {
                throw MissingArtifactError(offset, artifact_path.string());
            }
            size = IO::fileSize(artifact_path);
            if (size == 0)
            {
                throw ValidationError("Chunk artifact is empty: " + artifact_path.string());
            }
            if (size > config.chunkBytes())
            {
                throw ValidationError("Chunk artifact " + artifact_path.string() + " holds " + std::to_string(size) +
                                      " bytes, more than one " + std::to_string(config.chunk_mib) +
                                      " MiB chunk; was it extracted with a different -c?");
            }
        }

        std::string ChunkArtifact::computeDigest(Digest::Algorithm algorithm, const Config::ChunkConfig &config) const
        {
            IO::ByteRangeReader reader(getFullPath(config));
            return Digest::DigestUtility::digestRange(reader, 0, reader.size(), algorithm);
        }

        uint64_t ChunkArtifact::injectInto(IO::ByteRangeWriter &target, const Config::ChunkConfig &config) const
        {
            IO::ByteRangeReader reader(getFullPath(config));
            uint64_t position = offset * config.chunkBytes();
            reader.streamRange(0, reader.size(),
                               [&](const char *data, size_t length)
                               {
                                   target.writeAt(position, data, length);
                                   position += length;
                               });
            return reader.size();
        }

        std::filesystem::path ChunkArtifact::getFullPath(const Config::ChunkConfig &config) const
        {
            return config.artifactPath(offset);
        }

    } // namespace Chunks
} // namespace ChunkFix
