// include/repair_errors.hpp
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ChunkFix
{

    // Process exit codes, one per error category.
    namespace ExitCode
    {
        constexpr int Ok = 0;
        constexpr int Usage = 1;
        constexpr int Validation = 2;
        constexpr int Io = 3;
        constexpr int Unsupported = 4;
    } // namespace ExitCode

    // Base class for every fatal condition of a run.
    class RepairError : public std::runtime_error
    {
    public:
        RepairError(const std::string &message, int exit_code)
            : std::runtime_error(message), code(exit_code) {}

        int exitCode() const { return code; }

    private:
        int code;
    };

    // Bad or missing arguments, mutually exclusive flags.
    class UsageError : public RepairError
    {
    public:
        explicit UsageError(const std::string &message) : RepairError(message, ExitCode::Usage) {}
    };

    // Malformed manifest, bad chunk size, bad artifact shape.
    class ValidationError : public RepairError
    {
    public:
        explicit ValidationError(const std::string &message) : RepairError(message, ExitCode::Validation) {}
    };

    // The manifest was produced with a different chunk size than this run uses.
    class ChunkSizeMismatchError : public ValidationError
    {
    public:
        ChunkSizeMismatchError(uint64_t manifest_mib, uint64_t requested_mib)
            : ValidationError("Manifest was generated with CHUNK_MiB " + std::to_string(manifest_mib) +
                              " but this run uses " + std::to_string(requested_mib) +
                              "; re-run with -c " + std::to_string(manifest_mib)),
              required_mib(manifest_mib) {}

        uint64_t requiredChunkMiB() const { return required_mib; }

    private:
        uint64_t required_mib;
    };

    // Unreadable/unwritable files, short reads.
    class IoError : public RepairError
    {
    public:
        explicit IoError(const std::string &message) : RepairError(message, ExitCode::Io) {}
    };

    // An artifact requested for injection is not present.
    class MissingArtifactError : public IoError
    {
    public:
        MissingArtifactError(uint64_t chunk_offset, const std::string &path)
            : IoError("Chunk artifact for offset " + std::to_string(chunk_offset) + " not found: " + path),
              offset(chunk_offset) {}

        uint64_t chunkOffset() const { return offset; }

    private:
        uint64_t offset;
    };

    // An artifact is present but its content does not match the repair report.
    class ArtifactMismatchError : public IoError
    {
    public:
        ArtifactMismatchError(uint64_t chunk_offset, const std::string &path)
            : IoError("Chunk artifact for offset " + std::to_string(chunk_offset) +
                      " does not match the repair report (damaged in transfer?): " + path),
              offset(chunk_offset) {}

        uint64_t chunkOffset() const { return offset; }

    private:
        uint64_t offset;
    };

    // The host's crypto library cannot provide the requested digest.
    class DigestUnavailableError : public RepairError
    {
    public:
        explicit DigestUnavailableError(const std::string &message) : RepairError(message, ExitCode::Unsupported) {}
    };

} // namespace ChunkFix
