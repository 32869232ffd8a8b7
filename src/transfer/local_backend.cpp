#include "local_backend.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

LocalBackend::LocalBackend(const EncodeOptions& options, bool compress)
    : options_(options), compress_(compress) {
}

Result<uint64_t> LocalBackend::transfer(const TransferTask& task, ProgressSink& progress) {
    const ManifestEntry& entry = task.entry;
    fs::path src_path = task.source_root / entry.relative_path;
    fs::path dest_path = fs::path(task.destination_root) / entry.relative_path;

    std::error_code ec;
    if (!fs::is_regular_file(src_path, ec)) {
        return Result<uint64_t>::Err(fmt::format(
            "source {} is no longer a regular file", src_path.string()));
    }

    fs::create_directories(dest_path.parent_path(), ec);
    if (ec) {
        return Result<uint64_t>::Err(fmt::format(
            "cannot create {}: {}", dest_path.parent_path().string(), ec.message()));
    }

    // Streams close on scope exit, on every path
    std::ifstream input(src_path, std::ios::binary);
    if (!input) {
        return Result<uint64_t>::Err(fmt::format(
            "cannot open source {}: {}", src_path.string(), strerror(errno)));
    }

    EncodeStats stats;
    {
        std::ofstream output(dest_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Result<uint64_t>::Err(fmt::format(
                "cannot open destination {}: {}", dest_path.string(), strerror(errno)));
        }

        try {
            stats = encode_frame(input, output, header_for_entry(entry, compress_), options_,
                                 [&](uint64_t written) {
                                     progress.on_file_progress(entry, written);
                                 });
        } catch (const std::exception& e) {
            output.close();
            fs::remove(dest_path, ec);
            parcp_log(fmt::format("local: {} failed: {}", entry.relative_path, e.what()));
            return Result<uint64_t>::Err(e.what());
        }
    }

    parcp_log(fmt::format("local: {} -> {} ({} source bytes, {} frame bytes)",
                          entry.relative_path, dest_path.string(),
                          stats.source_bytes, stats.frame_bytes));
    return Result<uint64_t>::Ok(stats.frame_bytes);
}
