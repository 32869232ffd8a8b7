#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <core/types.hpp>

// File-level primitives a remote backend needs from an SSH session.
// Implementations must accept concurrent calls from several workers.
class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    // `mkdir -p` semantics: succeeds when the directory already exists.
    virtual SSHResult create_remote_directory(const std::string& path) = 0;

    // Copy exactly `size` bytes from `input` to `remote_path`, blocking until
    // the remote side has acknowledged the file. `progress` gets bytes sent.
    virtual SSHResult send_file(std::istream& input, const std::string& remote_path,
                                uint64_t size, const ByteProgress& progress = nullptr) = 0;
};
