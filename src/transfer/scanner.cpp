#include "scanner.hpp"
#include "checksum.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

namespace fs = std::filesystem;

static const std::set<std::string> COMPRESSIBLE_EXTENSIONS{
    "txt", "log", "csv", "json", "xml", "html",
    "css", "js", "yaml", "yml", "md", "toml",
};

FingerprintScanner::FingerprintScanner(StatusCallback on_warning)
    : on_warning_(std::move(on_warning)) {
}

bool FingerprintScanner::is_compressible(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    if (ext.empty()) return false;
    ext.erase(0, 1);  // leading '.'
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return COMPRESSIBLE_EXTENSIONS.count(ext) > 0;
}

// ── Fingerprint ────────────────────────────────────────────

static void read_exact(std::istream& in, char* buf, size_t len) {
    in.read(buf, static_cast<std::streamsize>(len));
    if (static_cast<size_t>(in.gcount()) != len) {
        throw std::runtime_error(fmt::format(
            "short read while fingerprinting ({} of {} bytes)", in.gcount(), len));
    }
}

Digest256 FingerprintScanner::fingerprint(std::istream& in, uint64_t size) {
    Sha256Accumulator sha;
    char buf[FINGERPRINT_WINDOW];

    size_t head = static_cast<size_t>(std::min<uint64_t>(size, FINGERPRINT_WINDOW));
    read_exact(in, buf, head);
    sha.update(buf, head);

    if (size > FINGERPRINT_WINDOW) {
        in.seekg(-static_cast<std::streamoff>(FINGERPRINT_WINDOW), std::ios::end);
        if (!in) {
            throw std::runtime_error("seek to tail window failed");
        }
        read_exact(in, buf, FINGERPRINT_WINDOW);
        sha.update(buf, FINGERPRINT_WINDOW);
    }

    return sha.finish();
}

Result<Digest256> FingerprintScanner::fingerprint_file(const fs::path& path, uint64_t size) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<Digest256>::Err("cannot open for reading: " + std::string(strerror(errno)));
    }
    try {
        return Result<Digest256>::Ok(fingerprint(in, size));
    } catch (const std::exception& e) {
        return Result<Digest256>::Err(e.what());
    }
}

// ── Traversal ──────────────────────────────────────────────

Manifest FingerprintScanner::scan(const std::vector<fs::path>& roots) const {
    Manifest manifest;
    std::set<std::string> seen;

    for (const auto& root : roots) {
        scan_root(root, manifest, seen);
    }

    parcp_log(fmt::format("scan: {} files, {} warnings, {} bytes",
                          manifest.entries.size(), manifest.warnings.size(),
                          manifest.total_bytes()));
    return manifest;
}

void FingerprintScanner::warn(Manifest& manifest, const fs::path& path,
                              const std::string& reason) const {
    manifest.warnings.push_back({path.string(), reason});
    parcp_log(fmt::format("scan warning: {}: {}", path.string(), reason));
    if (on_warning_) on_warning_(path.string() + ": " + reason);
}

void FingerprintScanner::scan_root(const fs::path& root, Manifest& manifest,
                                   std::set<std::string>& seen) const {
    std::error_code ec;
    fs::path normalized = fs::absolute(root, ec);
    if (ec) {
        warn(manifest, root, ec.message());
        return;
    }
    normalized = normalized.lexically_normal();
    if (normalized.filename().empty() && normalized.has_parent_path() &&
        normalized != normalized.root_path()) {
        normalized = normalized.parent_path();   // strip trailing separator
    }

    fs::path base = normalized.parent_path();

    auto status = fs::symlink_status(normalized, ec);
    if (ec || !fs::exists(status)) {
        warn(manifest, root, "source does not exist");
        return;
    }

    if (fs::is_directory(status)) {
        scan_directory(normalized, base, manifest, seen);
    } else if (fs::is_regular_file(status)) {
        scan_file(normalized, base, manifest, seen);
    } else if (fs::is_symlink(status)) {
        warn(manifest, root, "symlink skipped");
    } else {
        warn(manifest, root, "not a regular file or directory");
    }
}

void FingerprintScanner::scan_directory(const fs::path& dir, const fs::path& base,
                                        Manifest& manifest, std::set<std::string>& seen) const {
    std::error_code ec;
    std::vector<fs::directory_entry> children;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        warn(manifest, dir, "cannot list directory: " + ec.message());
        return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) {
        warn(manifest, dir, "directory listing interrupted: " + ec.message());
    }

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& child : children) {
        auto status = child.symlink_status(ec);
        if (ec) {
            warn(manifest, child.path(), ec.message());
            continue;
        }
        if (fs::is_symlink(status)) {
            warn(manifest, child.path(), "symlink skipped");
        } else if (fs::is_directory(status)) {
            scan_directory(child.path(), base, manifest, seen);
        } else if (fs::is_regular_file(status)) {
            scan_file(child.path(), base, manifest, seen);
        } else {
            warn(manifest, child.path(), "special file skipped");
        }
    }
}

void FingerprintScanner::scan_file(const fs::path& path, const fs::path& base,
                                   Manifest& manifest, std::set<std::string>& seen) const {
    std::string rel = path.lexically_relative(base).generic_string();
    if (rel.empty() || rel == ".") {
        rel = path.filename().generic_string();
    }

    if (!seen.insert(rel).second) {
        warn(manifest, path, "duplicate relative path " + rel + " skipped");
        return;
    }

    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        seen.erase(rel);
        warn(manifest, path, "stat failed: " + std::string(strerror(errno)));
        return;
    }

    uint64_t size = static_cast<uint64_t>(st.st_size);
    auto fp = fingerprint_file(path, size);
    if (fp.is_err()) {
        seen.erase(rel);
        warn(manifest, path, fp.error);
        return;
    }

    ManifestEntry entry;
    entry.relative_path = rel;
    entry.size = size;
    entry.modified_at = static_cast<uint64_t>(st.st_mtime);
    entry.fingerprint = fp.value;
    entry.compressible = is_compressible(rel);
    entry.source_root = base;
    manifest.entries.push_back(std::move(entry));
}
