#pragma once

namespace platform {

// True when stdin is attached to a terminal.
bool stdin_is_tty();

// RAII guard for no-echo terminal mode (password input).
// Constructor saves the current mode and disables echo/canonical input.
// Destructor restores the saved mode.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

} // namespace platform
