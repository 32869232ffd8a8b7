#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include "backend.hpp"
#include "manifest.hpp"
#include "progress.hpp"

// Result of one task.
struct TaskOutcome {
    std::string path;           // relative path
    bool success = false;
    uint64_t bytes_written = 0;
    std::string error;          // empty on success
};

struct RunReport {
    std::vector<TaskOutcome> outcomes;   // manifest order
    std::vector<ScanWarning> warnings;
    std::chrono::milliseconds elapsed{0};

    size_t succeeded() const;
    size_t failed() const;
    uint64_t bytes_written() const;
    bool all_succeeded() const { return failed() == 0; }
};

// Counting gate: at most `limit` holders at a time.
class AdmissionGate {
public:
    explicit AdmissionGate(int limit);

    void acquire();
    void release();

    int in_use() const;

    // Releases on scope exit
    class Slot {
    public:
        explicit Slot(AdmissionGate& gate) : gate_(&gate) {}
        ~Slot() { if (gate_) gate_->release(); }
        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        Slot& operator=(Slot&&) = delete;

    private:
        AdmissionGate* gate_;
    };

private:
    const int limit_;
    int in_use_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

// Runs one task per manifest entry on `backend` from a pool of at most
// `concurrency` worker threads. Entries are admitted in manifest order.
// Waits for every task; never retries.
class Scheduler {
public:
    explicit Scheduler(int concurrency = DEFAULT_CONCURRENCY);

    RunReport run(const Manifest& manifest, TransferBackend& backend,
                  const std::string& destination_root, ProgressSink& progress);

    int concurrency() const { return concurrency_; }

private:
    int concurrency_;

    static TaskOutcome execute(const TransferTask& task, TransferBackend& backend,
                               ProgressSink& progress);
};
