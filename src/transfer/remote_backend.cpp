#include "remote_backend.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <fstream>

RemoteShellBackend::RemoteShellBackend(std::shared_ptr<RemoteTransport> transport)
    : transport_(std::move(transport)) {
}

std::string RemoteShellBackend::remote_path_for(const std::string& root,
                                                const std::string& relative_path) {
    if (root.empty()) return relative_path;
    if (root.back() == '/') return root + relative_path;
    return root + "/" + relative_path;
}

static std::string remote_parent(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

Result<uint64_t> RemoteShellBackend::transfer(const TransferTask& task, ProgressSink& progress) {
    const ManifestEntry& entry = task.entry;
    std::string remote_path = remote_path_for(task.destination_root, entry.relative_path);

    auto mkdir = transport_->create_remote_directory(remote_parent(remote_path));
    if (mkdir.failed()) {
        return Result<uint64_t>::Err(fmt::format(
            "cannot create remote directory for {}: {}", remote_path, mkdir.get_output()));
    }

    fs::path src_path = task.source_root / entry.relative_path;
    std::ifstream input(src_path, std::ios::binary);
    if (!input) {
        return Result<uint64_t>::Err(fmt::format(
            "cannot open source {}: {}", src_path.string(), strerror(errno)));
    }

    auto sent = transport_->send_file(input, remote_path, entry.size,
                                      [&](uint64_t bytes) {
                                          progress.on_file_progress(entry, bytes);
                                      });
    if (sent.failed()) {
        parcp_log(fmt::format("ssh: {} failed: {}", entry.relative_path, sent.get_output()));
        return Result<uint64_t>::Err(sent.get_output());
    }

    return Result<uint64_t>::Ok(entry.size);
}
