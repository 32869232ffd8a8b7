#pragma once

#include "backend.hpp"
#include "frame_codec.hpp"

// Writes each file as a frame at <destination_root>/<relative_path>.
// Compression applies to entries marked compressible when enabled.
class LocalBackend : public TransferBackend {
public:
    LocalBackend(const EncodeOptions& options, bool compress);

    Result<uint64_t> transfer(const TransferTask& task, ProgressSink& progress) override;
    std::string name() const override { return "local"; }

private:
    EncodeOptions options_;
    bool compress_;
};
