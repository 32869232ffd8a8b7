#pragma once

#include <iostream>
#include <mutex>
#include <transfer/progress.hpp>

// Prints one line per finished file. Byte progress goes to the debug log
// only at file boundaries; there is no progress bar.
class ConsoleProgress : public ProgressSink {
public:
    explicit ConsoleProgress(std::ostream& out = std::cout, bool quiet = false);

    void on_file_started(const ManifestEntry& entry) override;
    void on_file_progress(const ManifestEntry& entry, uint64_t bytes_written) override;
    void on_file_finished(const ManifestEntry& entry, const TaskOutcome& outcome) override;

    size_t finished() const;

private:
    std::ostream& out_;
    bool quiet_;
    size_t finished_;
    mutable std::mutex mutex_;
};
