#pragma once

// Helpers shared by the libssh2-facing sources. Not for public headers.

#include <libssh2.h>
#include <mutex>
#include <string>
#include <core/constants.hpp>
#include <platform/platform.hpp>

// Repeat a non-blocking libssh2 call until it stops returning EAGAIN.
template <typename Fn>
auto ssh_retry(Fn&& fn) -> decltype(fn()) {
    auto rc = fn();
    while (rc == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        rc = fn();
    }
    return rc;
}

// Drive a session-level open (channel_open_session, scp_send64) to completion.
// libssh2 keeps a pending open on the session, so `open_mutex` is held for the
// whole loop and no other caller can resume it. `io_mutex` is taken per call.
// `open` returns a handle or nullptr; `pending`, called under `io_mutex`,
// says whether that nullptr meant EAGAIN.
template <typename Open, typename Pending>
auto ssh_open_serialized(std::mutex& open_mutex, std::mutex& io_mutex,
                         Open&& open, Pending&& pending) -> decltype(open()) {
    std::lock_guard<std::mutex> open_lock(open_mutex);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            auto handle = open();
            if (handle || !pending()) return handle;
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
}

// Last libssh2 error message for a session, for diagnostics.
inline std::string ssh_last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : std::string("unknown error");
}
