// src/repair_report.cpp
#include "repair_report.hpp"
#include "repair_errors.hpp"

#include <chrono>
#include <ctime>
#include <fstream>

namespace fs = std::filesystem;

namespace ChunkFix {
namespace Report {

void to_json(nlohmann::json &j, const ArtifactRecord &a) {
    j = nlohmann::json{{"offset", a.offset}, {"size", a.size}, {"digest", a.digest}};
}

void from_json(const nlohmann::json &j, ArtifactRecord &a) {
    j.at("offset").get_to(a.offset);
    j.at("size").get_to(a.size);
    j.at("digest").get_to(a.digest);
}

void to_json(nlohmann::json &j, const RepairReport &r) {
    j = nlohmann::json{
        {"file", r.file},
        {"chunk_mib", r.chunk_mib},
        {"algorithm", Digest::algorithmName(r.algorithm)},
        {"reference_size", r.reference_size},
        {"manifest_size", r.manifest_size},
        {"truncate_to", nullptr},
        {"whole_file_mismatch", r.whole_file_mismatch},
        {"mismatched", r.mismatched},
        {"appended", r.appended},
        {"artifacts", r.artifacts},
        {"command", r.command},
        {"created_at", r.created_at}
    };
    if (r.truncate_to) {
        j["truncate_to"] = *r.truncate_to;
    }
}

void from_json(const nlohmann::json &j, RepairReport &r) {
    j.at("file").get_to(r.file);
    j.at("chunk_mib").get_to(r.chunk_mib);
    const auto algorithm = j.at("algorithm").get<std::string>();
    if (!Digest::parseAlgorithm(algorithm, r.algorithm)) {
        throw ValidationError("Repair report names an unsupported digest algorithm '" + algorithm + "'");
    }
    j.at("reference_size").get_to(r.reference_size);
    j.at("manifest_size").get_to(r.manifest_size);
    const auto &truncate = j.at("truncate_to");
    if (truncate.is_null()) {
        r.truncate_to.reset();
    } else {
        r.truncate_to = truncate.get<uint64_t>();
    }
    j.at("whole_file_mismatch").get_to(r.whole_file_mismatch);
    j.at("mismatched").get_to(r.mismatched);
    j.at("appended").get_to(r.appended);
    j.at("artifacts").get_to(r.artifacts);
    j.at("command").get_to(r.command);
    j.at("created_at").get_to(r.created_at);
}

RepairReport RepairReport::fromDiff(const Diff::DiffResult &diff, const std::vector<Chunks::ChunkArtifact> &artifacts,
                                    const Manifest::DigestManifest &manifest, const std::string &file_name) {
    RepairReport report;
    report.file = file_name;
    report.chunk_mib = manifest.chunk_mib;
    report.algorithm = manifest.algorithm;
    report.reference_size = diff.reference_size;
    report.manifest_size = diff.manifest_size;
    report.truncate_to = diff.truncate_to;
    report.whole_file_mismatch = diff.whole_file_mismatch;
    report.mismatched = diff.mismatched;
    report.appended = diff.appended;
    for (const auto &artifact : artifacts) {
        report.artifacts.push_back({artifact.offset, artifact.size, artifact.digest});
    }
    if (!diff.whole_file_mismatch) {
        report.command = buildRepairCommand(manifest.chunk_mib, diff.truncate_to, diff.offsetsToExtract(), file_name);
    }

    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    char buf[64];
    // Format as YYYY-MM-DDTHH:MM:SSZ
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&now_c));
    report.created_at = buf;
    return report;
}

Chunks::RepairPlan RepairReport::toPlan() const {
    if (whole_file_mismatch) {
        throw ValidationError("Repair report for " + file +
                              " records a whole-file mismatch; the file has to be transferred again");
    }
    Chunks::RepairPlan plan;
    plan.truncate_to = truncate_to;
    plan.digest_algorithm = algorithm;
    for (const auto &artifact : artifacts) {
        plan.offsets.push_back(artifact.offset);
        plan.expected_digests[artifact.offset] = artifact.digest;
    }
    return plan;
}

nlohmann::json RepairReport::toJson() const {
    return *this; // Uses the to_json helper function
}

RepairReport RepairReport::fromJson(const nlohmann::json &j) {
    RepairReport report;
    j.get_to(report); // Uses the from_json helper function
    return report;
}

void RepairReport::save(const fs::path &path) const {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs.is_open()) {
        throw IoError("Failed to open file for writing repair report: " + path.string());
    }
    ofs << toJson().dump(4) << '\n'; // Pretty print with 4 spaces
    if (!ofs.good()) {
        throw IoError("Failed to write all data to repair report: " + path.string());
    }
}

RepairReport RepairReport::load(const fs::path &path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IoError("Repair report not found: " + path.string());
    }

    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw IoError("Failed to open repair report for reading: " + path.string());
    }

    nlohmann::json j;
    try {
        ifs >> j;
        return fromJson(j);
    } catch (const nlohmann::json::exception &e) {
        throw ValidationError("Error parsing repair report " + path.string() + ": " + e.what());
    }
}

std::string shellQuote(const std::string &text) {
    bool plain = !text.empty();
    for (char c : text) {
        const bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                          c == '.' || c == '_' || c == '-' || c == '/' || c == '+' || c == ',' || c == ':';
        if (!safe) {
            plain = false;
            break;
        }
    }
    if (plain) {
        return text;
    }
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string buildRepairCommand(uint64_t chunk_mib, const std::optional<uint64_t> &truncate_to,
                               const std::vector<uint64_t> &offsets, const std::string &file_name) {
    if (offsets.empty() && !truncate_to) {
        return "";
    }
    std::string command = Config::ChunkConfig::PROGRAM_NAME + " -c " + std::to_string(chunk_mib);
    if (truncate_to) {
        command += " -t " + std::to_string(*truncate_to);
    }
    if (!offsets.empty()) {
        command += " -i " + Layout::joinOffsets(offsets);
    }
    // A name like "-big.iso" would otherwise be read as an option
    if (!file_name.empty() && file_name[0] == '-') {
        command += " --";
    }
    command += " " + shellQuote(file_name);
    return command;
}

} // namespace Report
} // namespace ChunkFix
