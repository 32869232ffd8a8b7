#include "console_progress.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <transfer/scheduler.hpp>
#include <fmt/format.h>

ConsoleProgress::ConsoleProgress(std::ostream& out, bool quiet)
    : out_(out), quiet_(quiet), finished_(0) {
}

void ConsoleProgress::on_file_started(const ManifestEntry& entry) {
    parcp_log(fmt::format("start {} ({} bytes)", entry.relative_path, entry.size));
}

void ConsoleProgress::on_file_progress(const ManifestEntry&, uint64_t) {
}

void ConsoleProgress::on_file_finished(const ManifestEntry& entry, const TaskOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_++;
    if (outcome.success) {
        if (!quiet_) {
            out_ << theme::ok(fmt::format("{}  {}", entry.relative_path,
                                          theme::dim(format_bytes(outcome.bytes_written))));
        }
    } else {
        // Failures are shown even when quiet
        out_ << theme::fail(fmt::format("{}  {}", entry.relative_path, outcome.error));
    }
    out_.flush();
}

size_t ConsoleProgress::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}
