#pragma once

#include <cstdint>
#include <string>
#include "manifest.hpp"

struct TaskOutcome;

// Receives transfer events from worker threads. Implementations must be
// thread-safe: calls for different files arrive concurrently.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void on_file_started(const ManifestEntry& entry) = 0;

    // Bytes written to the destination so far for this file; at least once per chunk.
    virtual void on_file_progress(const ManifestEntry& entry, uint64_t bytes_written) = 0;

    virtual void on_file_finished(const ManifestEntry& entry, const TaskOutcome& outcome) = 0;
};

// Discards every event.
class NullProgressSink : public ProgressSink {
public:
    void on_file_started(const ManifestEntry&) override {}
    void on_file_progress(const ManifestEntry&, uint64_t) override {}
    void on_file_finished(const ManifestEntry&, const TaskOutcome&) override {}
};
