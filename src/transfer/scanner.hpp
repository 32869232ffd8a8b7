#pragma once

#include <filesystem>
#include <istream>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "manifest.hpp"

namespace fs = std::filesystem;

// Walks source roots and produces a Manifest.
//
// Traversal rules:
//   - a root may be a directory (walked recursively) or a regular file
//   - relative paths are taken against the root's parent, so scanning
//     /data/photos yields "photos/..." entries
//   - children of a directory are visited in name order
//   - symlinks and special files are never followed; each one is recorded
//     as a scan warning
//   - files that vanish or cannot be read are skipped with a warning
//
// The fingerprint is a sampled SHA-256: the first 4096 bytes, then the last
// 4096 bytes when the file is larger than that. Two files that differ only
// in their interior bytes can share a fingerprint; it is an identifier, not
// an integrity check (the frame footer carries full-content checksums).
class FingerprintScanner {
public:
    explicit FingerprintScanner(StatusCallback on_warning = nullptr);

    Manifest scan(const std::vector<fs::path>& roots) const;

    // Sampled fingerprint of a stream whose length is `size`.
    // Throws std::runtime_error if the stream ends early.
    static Digest256 fingerprint(std::istream& in, uint64_t size);

    static Result<Digest256> fingerprint_file(const fs::path& path, uint64_t size);

    // Extension allow-list for text-like formats
    static bool is_compressible(const std::string& path);

private:
    StatusCallback on_warning_;

    void scan_root(const fs::path& root, Manifest& manifest,
                   std::set<std::string>& seen) const;
    void scan_directory(const fs::path& dir, const fs::path& base,
                        Manifest& manifest, std::set<std::string>& seen) const;
    void scan_file(const fs::path& path, const fs::path& base,
                   Manifest& manifest, std::set<std::string>& seen) const;
    void warn(Manifest& manifest, const fs::path& path, const std::string& reason) const;
};
