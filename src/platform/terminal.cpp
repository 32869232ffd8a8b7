#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>
#include <poll.h>

namespace platform {

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

// ── NoEchoGuard ──────────────────────────────────────────────

struct NoEchoGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

NoEchoGuard::NoEchoGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) {
        return;  // not a terminal; nothing to restore
    }
    impl_->saved = true;
    struct termios raw = impl_->old_term;
    // Disable canonical mode, echo, and signals
    raw.c_lflag &= ~(ICANON | ECHO | ISIG);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        if (impl_->saved) {
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        }
        delete impl_;
    }
}

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
}

} // namespace platform
