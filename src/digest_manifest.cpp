// src/digest_manifest.cpp
#include "digest_manifest.hpp"
#include "file_io.hpp"
#include "repair_errors.hpp"

#include <fstream>
#include <istream>
#include <ostream>

namespace fs = std::filesystem;

namespace ChunkFix {
namespace Manifest {

namespace {

const char *const CHUNK_KEY = "CHUNK_MiB";
const char *const TOTAL_KEY = "TOTAL";
const char *const SUM_KEY = "SUM";

[[noreturn]] void fail(const std::string &source, size_t line_no, const std::string &what) {
    throw ValidationError(source + " is not a valid manifest (line " + std::to_string(line_no) + "): " + what);
}

// Splits "KEY VALUE" on the single space; anything else is rejected.
bool splitPair(const std::string &line, std::string &first, std::string &second) {
    const auto space = line.find(' ');
    if (space == std::string::npos || space == 0 || space + 1 == line.size()) {
        return false;
    }
    if (line.find(' ', space + 1) != std::string::npos) {
        return false;
    }
    first = line.substr(0, space);
    second = line.substr(space + 1);
    return true;
}

bool isLowerHex(const std::string &text) {
    for (char c : text) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

// Reads one line, dropping a Windows line ending. Returns false at end of stream.
bool nextLine(std::istream &in, std::string &line) {
    if (!std::getline(in, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

uint64_t headerNumber(std::istream &in, const std::string &source, size_t line_no, const char *key) {
    std::string line;
    std::string name;
    std::string value;
    if (!nextLine(in, line)) {
        fail(source, line_no, std::string("missing ") + key + " header");
    }
    if (!splitPair(line, name, value) || name != key) {
        fail(source, line_no, std::string("expected '") + key + " <number>', got '" + line + "'");
    }
    uint64_t number = 0;
    if (!Layout::parseU64(value, number)) {
        fail(source, line_no, std::string("bad ") + key + " value '" + value + "'");
    }
    return number;
}

} // namespace

DigestManifest::DigestManifest(uint64_t chunk_mib, uint64_t total_size, Digest::Algorithm algorithm,
                               const std::vector<std::string> &digests)
    : chunk_mib(chunk_mib), total_size(total_size), algorithm(algorithm) {
    entries.reserve(digests.size());
    for (size_t i = 0; i < digests.size(); ++i) {
        entries.push_back({digests[i], static_cast<uint64_t>(i)});
    }
}

DigestManifest DigestManifest::generate(IO::ByteRangeReader &reader, uint64_t chunk_mib,
                                        Digest::Algorithm algorithm) {
    Layout::ChunkLayout chunks(reader.size(), Layout::chunkBytesFromMiB(chunk_mib));
    return DigestManifest(chunk_mib, reader.size(), algorithm,
                          Digest::DigestUtility::chunkDigests(reader, chunks, algorithm));
}

Layout::ChunkLayout DigestManifest::layout() const {
    return Layout::ChunkLayout(total_size, Layout::chunkBytesFromMiB(chunk_mib));
}

void DigestManifest::validate() const {
    const uint64_t expected = layout().count();
    if (entries.size() != expected) {
        throw ValidationError("Manifest lists " + std::to_string(entries.size()) + " chunks but TOTAL " +
                              std::to_string(total_size) + " with CHUNK_MiB " + std::to_string(chunk_mib) +
                              " requires " + std::to_string(expected));
    }
    const size_t hex_len = Digest::hexLength(algorithm);
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].offset != i) {
            throw ValidationError("Manifest entry " + std::to_string(i) + " has offset " +
                                  std::to_string(entries[i].offset));
        }
        if (entries[i].digest.size() != hex_len || !isLowerHex(entries[i].digest)) {
            throw ValidationError("Manifest entry " + std::to_string(i) + " is not a " +
                                  Digest::algorithmName(algorithm) + " digest: '" + entries[i].digest + "'");
        }
    }
}

void DigestManifest::write(std::ostream &out) const {
    out << CHUNK_KEY << ' ' << chunk_mib << '\n';
    out << TOTAL_KEY << ' ' << total_size << '\n';
    out << SUM_KEY << ' ' << Digest::algorithmName(algorithm) << '\n';
    for (const auto &entry : entries) {
        out << entry.digest << ' ' << entry.offset << '\n';
    }
}

void DigestManifest::save(const fs::path &path) const {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs.is_open()) {
        throw IoError("Failed to open file for writing manifest: " + path.string());
    }
    write(ofs);
    ofs.flush();
    if (!ofs.good()) {
        throw IoError("Failed to write all data to manifest file: " + path.string());
    }
}

DigestManifest DigestManifest::parse(std::istream &in, const std::string &source_name) {
    DigestManifest manifest;
    size_t line_no = 1;

    manifest.chunk_mib = headerNumber(in, source_name, line_no++, CHUNK_KEY);
    if (manifest.chunk_mib == 0) {
        fail(source_name, 1, "CHUNK_MiB must be positive");
    }
    manifest.total_size = headerNumber(in, source_name, line_no++, TOTAL_KEY);

    std::string line;
    std::string name;
    std::string value;
    if (!nextLine(in, line)) {
        fail(source_name, line_no, "missing SUM header");
    }
    if (!splitPair(line, name, value) || name != SUM_KEY) {
        fail(source_name, line_no, "expected 'SUM <algorithm>', got '" + line + "'");
    }
    if (!Digest::parseAlgorithm(value, manifest.algorithm)) {
        fail(source_name, line_no, "unsupported digest algorithm '" + value + "'");
    }
    ++line_no;

    uint64_t expected_count = 0;
    try {
        expected_count = manifest.layout().count();
    } catch (const ValidationError &e) {
        fail(source_name, 1, e.what());
    }

    const size_t hex_len = Digest::hexLength(manifest.algorithm);
    while (nextLine(in, line)) {
        std::string digest;
        std::string offset_text;
        uint64_t offset = 0;
        if (!splitPair(line, digest, offset_text) || !Layout::parseU64(offset_text, offset)) {
            fail(source_name, line_no, "expected '<digest> <offset>', got '" + line + "'");
        }
        if (digest.size() != hex_len || !isLowerHex(digest)) {
            fail(source_name, line_no, "'" + digest + "' is not a " + Digest::algorithmName(manifest.algorithm) +
                                           " digest");
        }
        if (offset != manifest.entries.size()) {
            fail(source_name, line_no, "expected offset " + std::to_string(manifest.entries.size()) + ", got " +
                                           offset_text);
        }
        if (offset >= expected_count) {
            fail(source_name, line_no, "more entries than TOTAL " + std::to_string(manifest.total_size) +
                                           " allows (" + std::to_string(expected_count) + ")");
        }
        manifest.entries.push_back({digest, offset});
        ++line_no;
    }
    if (in.bad()) {
        throw IoError("Failed to read manifest " + source_name);
    }
    if (manifest.entries.size() != expected_count) {
        fail(source_name, line_no, "found " + std::to_string(manifest.entries.size()) + " entries, TOTAL " +
                                       std::to_string(manifest.total_size) + " requires " +
                                       std::to_string(expected_count));
    }
    return manifest;
}

DigestManifest DigestManifest::load(const fs::path &path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IoError("Manifest file not found: " + path.string());
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw IoError("Failed to open manifest file for reading: " + path.string());
    }
    return parse(ifs, path.string());
}

} // namespace Manifest
} // namespace ChunkFix
