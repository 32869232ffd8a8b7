#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "auth.hpp"
#include "destination.hpp"
#include "remote_transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// One authenticated SSH connection shared by every transfer worker.
//
// The session runs in non-blocking mode. libssh2 keeps the state of a pending
// channel open on the session itself, so open_mutex_ is held across the whole
// EAGAIN loop of every open. Calls on an already open channel take io_mutex_
// per call only, so workers interleave their reads and writes. Every
// primitive opens its own channel.
class RemoteSession : public RemoteTransport {
public:
    RemoteSession(RemoteTarget target, int port);
    ~RemoteSession() override;

    RemoteSession(const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;

    // TCP connect, handshake, authenticate.
    // Throws ConnectError or AuthError; the session is closed on failure.
    void establish(const AuthChain& auth, StatusCallback callback = nullptr);
    void close();

    // Run a command on an exec channel and collect its output.
    SSHResult run(const std::string& command);

    SSHResult create_remote_directory(const std::string& path) override;
    SSHResult send_file(std::istream& input, const std::string& remote_path,
                        uint64_t size, const ByteProgress& progress = nullptr) override;

    const RemoteTarget& target() const { return target_; }
    const std::string& auth_method() const { return auth_method_; }

private:
    RemoteTarget target_;
    int port_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    std::atomic<bool> active_;
    std::string auth_method_;
    std::mutex io_mutex_;      // every libssh2 call
    std::mutex open_mutex_;    // one channel open in flight, taken before io_mutex_

    // Lock, call, unlock; repeat while the call reports EAGAIN.
    template <typename Fn>
    auto locked_retry(Fn&& fn) -> decltype(fn());

    LIBSSH2_CHANNEL* open_channel(std::string& error);
    LIBSSH2_CHANNEL* open_scp_channel(const std::string& remote_path, uint64_t size,
                                      std::string& error);
    void finish_channel(LIBSSH2_CHANNEL* channel);
};

// Connect and authenticate a session for `target`.
// Throws ConnectError or AuthError.
std::shared_ptr<RemoteSession> connect_session(const RemoteTarget& target, int port,
                                               const AuthChain& auth,
                                               StatusCallback callback = nullptr);
