// include/repair_report.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp> // For JSON handling

#include "chunk.hpp"
#include "chunk_config.hpp"
#include "diff_engine.hpp"
#include "patch_applier.hpp"

namespace ChunkFix {
namespace Report {

struct ArtifactRecord {
    uint64_t offset = 0;
    uint64_t size = 0;
    std::string digest;
};

// Everything the damaged side needs to finish a repair, produced by a diff run.
class RepairReport {
public:
    std::string file;                  // reference file name, used in the repair command
    uint64_t chunk_mib = 0;
    Digest::Algorithm algorithm = Digest::Algorithm::MD5;
    uint64_t reference_size = 0;
    uint64_t manifest_size = 0;
    std::optional<uint64_t> truncate_to;
    bool whole_file_mismatch = false;
    std::vector<uint64_t> mismatched;
    std::vector<uint64_t> appended;
    std::vector<ArtifactRecord> artifacts;
    std::string command;               // empty when nothing needs doing
    std::string created_at;            // ISO 8601 format (e.g., "YYYY-MM-DDTHH:MM:SSZ")

    RepairReport() = default;

    // Assemble the report for a finished diff and the artifacts it produced
    static RepairReport fromDiff(const Diff::DiffResult &diff, const std::vector<Chunks::ChunkArtifact> &artifacts,
                                 const Manifest::DigestManifest &manifest, const std::string &file_name);

    // Offsets, truncation and artifact digests for the patch applier
    Chunks::RepairPlan toPlan() const;

    nlohmann::json toJson() const;
    static RepairReport fromJson(const nlohmann::json &j);

    // Save report to a JSON file, overwriting it
    void save(const std::filesystem::path &path) const;

    // Load report from a JSON file
    static RepairReport load(const std::filesystem::path &path);
};

// Command line that applies a repair on the damaged side, e.g.
//   chunkfix -c 100 -t 209715200 -i 1,4 bigfile.iso
// Returns an empty string when there is nothing to inject or truncate.
std::string buildRepairCommand(uint64_t chunk_mib, const std::optional<uint64_t> &truncate_to,
                               const std::vector<uint64_t> &offsets, const std::string &file_name);

// Quote a file name for a POSIX shell when it needs it
std::string shellQuote(const std::string &text);

} // namespace Report
} // namespace ChunkFix
