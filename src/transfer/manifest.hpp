#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using Digest256 = std::array<uint8_t, 32>;

// One scanned file. Immutable once produced by the scanner.
struct ManifestEntry {
    std::string relative_path;   // '/'-separated, unique within a manifest
    uint64_t size = 0;           // st_size observed at scan time
    uint64_t modified_at = 0;    // st_mtime, seconds since epoch
    Digest256 fingerprint{};     // sampled SHA-256, see FingerprintScanner
    bool compressible = false;   // extension policy, not a measurement
    fs::path source_root;        // directory relative_path is relative to

    fs::path source_path() const { return source_root / relative_path; }
};

// A file that could not be scanned. Non-fatal.
struct ScanWarning {
    std::string path;
    std::string reason;
};

struct Manifest {
    std::vector<ManifestEntry> entries;   // discovery order
    std::vector<ScanWarning> warnings;

    uint64_t total_bytes() const {
        uint64_t total = 0;
        for (const auto& e : entries) total += e.size;
        return total;
    }
};

// One unit of work for a backend. Owned by the worker executing it.
struct TransferTask {
    ManifestEntry entry;
    fs::path source_root;
    std::string destination_root;   // local directory or remote path
};
