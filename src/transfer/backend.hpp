#pragma once

#include <cstdint>
#include <string>
#include <core/types.hpp>
#include "manifest.hpp"
#include "progress.hpp"

// Destination-writing strategy. One instance serves a whole run and is
// called concurrently from scheduler workers, one task per call.
//
// Implementations:
//   LocalBackend       : writes a frame per file under a local directory
//   RemoteShellBackend : sends raw bytes over a shared SSH session (SCP)
class TransferBackend {
public:
    virtual ~TransferBackend() = default;

    // Materialize one file. Creates missing parent directories first.
    // Returns bytes written to the destination, or the reason it failed.
    // A failure affects this task only.
    virtual Result<uint64_t> transfer(const TransferTask& task, ProgressSink& progress) = 0;

    // Short label for logs and the run summary ("local", "ssh").
    virtual std::string name() const = 0;
};
