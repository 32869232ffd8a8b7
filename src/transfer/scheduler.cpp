#include "scheduler.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <queue>
#include <stdexcept>
#include <system_error>
#include <thread>

size_t RunReport::succeeded() const {
    size_t n = 0;
    for (const auto& o : outcomes) if (o.success) n++;
    return n;
}

size_t RunReport::failed() const {
    return outcomes.size() - succeeded();
}

uint64_t RunReport::bytes_written() const {
    uint64_t total = 0;
    for (const auto& o : outcomes) total += o.bytes_written;
    return total;
}

// ── AdmissionGate ──────────────────────────────────────────

AdmissionGate::AdmissionGate(int limit) : limit_(limit), in_use_(0) {
    if (limit < 1) {
        throw std::invalid_argument("admission gate limit must be at least 1");
    }
}

void AdmissionGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return in_use_ < limit_; });
    in_use_++;
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_use_--;
    }
    cv_.notify_one();
}

int AdmissionGate::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

// ── Scheduler ──────────────────────────────────────────────

Scheduler::Scheduler(int concurrency) : concurrency_(concurrency) {
    if (concurrency < 1) {
        throw std::invalid_argument("concurrency must be at least 1");
    }
}

TaskOutcome Scheduler::execute(const TransferTask& task, TransferBackend& backend,
                               ProgressSink& progress) {
    TaskOutcome outcome;
    outcome.path = task.entry.relative_path;

    progress.on_file_started(task.entry);
    try {
        auto result = backend.transfer(task, progress);
        if (result.is_ok()) {
            outcome.success = true;
            outcome.bytes_written = result.value;
        } else {
            outcome.error = result.error;
        }
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }

    if (!outcome.success) {
        parcp_log(fmt::format("task failed: {}: {}", outcome.path, outcome.error));
    }
    progress.on_file_finished(task.entry, outcome);
    return outcome;
}

namespace {

// Manifest indices handed from the dispatcher to the worker pool.
class IndexQueue {
public:
    void push(size_t index) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.push(index);
        }
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // False once closed and drained.
    bool pop(size_t& index) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !pending_.empty(); });
        if (pending_.empty()) return false;
        index = pending_.front();
        pending_.pop();
        return true;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<size_t> pending_;
    bool closed_ = false;
};

} // namespace

RunReport Scheduler::run(const Manifest& manifest, TransferBackend& backend,
                         const std::string& destination_root, ProgressSink& progress) {
    auto start = std::chrono::steady_clock::now();

    RunReport report;
    report.warnings = manifest.warnings;
    report.outcomes.resize(manifest.entries.size());

    size_t pool_size = std::min(static_cast<size_t>(concurrency_), manifest.entries.size());
    parcp_log(fmt::format("run: {} files via {} backend, {} workers",
                          manifest.entries.size(), backend.name(), pool_size));

    AdmissionGate gate(concurrency_);
    IndexQueue queue;
    std::vector<std::thread> workers;
    workers.reserve(pool_size);

    auto worker_loop = [&] {
        size_t i = 0;
        while (queue.pop(i)) {
            // The dispatcher acquired this slot; it is released here
            AdmissionGate::Slot slot(gate);

            TransferTask task;
            task.entry = manifest.entries[i];
            task.source_root = manifest.entries[i].source_root;
            task.destination_root = destination_root;

            // Each index is claimed by exactly one worker
            report.outcomes[i] = execute(task, backend, progress);
        }
    };

    auto stop_pool = [&] {
        queue.close();
        for (auto& worker : workers) {
            if (worker.joinable()) worker.join();
        }
    };

    try {
        for (size_t w = 0; w < pool_size; w++) {
            workers.emplace_back(worker_loop);
        }
    } catch (const std::system_error& e) {
        stop_pool();
        throw std::runtime_error(std::string("cannot start transfer worker: ") + e.what());
    }

    try {
        for (size_t i = 0; i < manifest.entries.size(); i++) {
            gate.acquire();
            queue.push(i);
        }
    } catch (...) {
        stop_pool();
        throw;
    }

    stop_pool();

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    parcp_log(fmt::format("run: {} ok, {} failed in {} ms",
                          report.succeeded(), report.failed(), report.elapsed.count()));
    return report;
}
