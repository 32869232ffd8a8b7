#pragma once

#include <memory>
#include <ssh/remote_transport.hpp>
#include "backend.hpp"

// Sends each file's raw bytes to <destination_root>/<relative_path> over a
// session shared by all workers. No framing or compression on this path.
class RemoteShellBackend : public TransferBackend {
public:
    explicit RemoteShellBackend(std::shared_ptr<RemoteTransport> transport);

    Result<uint64_t> transfer(const TransferTask& task, ProgressSink& progress) override;
    std::string name() const override { return "ssh"; }

    // POSIX join; the remote side is always '/'-separated.
    static std::string remote_path_for(const std::string& root, const std::string& relative_path);

private:
    std::shared_ptr<RemoteTransport> transport_;
};
