#include "session.hpp"
#include "ssh_util.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <algorithm>
#include <cstring>
#include <vector>

// libssh2_init / libssh2_exit once per process
namespace {
struct Libssh2Library {
    int rc;
    Libssh2Library() : rc(libssh2_init(0)) {}
    ~Libssh2Library() { if (rc == 0) libssh2_exit(); }
};

bool libssh2_ready() {
    static Libssh2Library library;
    return library.rc == 0;
}
} // namespace

RemoteSession::RemoteSession(RemoteTarget target, int port)
    : target_(std::move(target)), port_(port), session_(nullptr),
      sock_(PARCP_INVALID_SOCKET), active_(false) {
}

RemoteSession::~RemoteSession() {
    close();
}

template <typename Fn>
auto RemoteSession::locked_retry(Fn&& fn) -> decltype(fn()) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            auto rc = fn();
            if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
}

void RemoteSession::establish(const AuthChain& auth, StatusCallback callback) {
    if (!libssh2_ready()) {
        throw ConnectError("failed to initialize libssh2");
    }

    if (callback) callback("Connecting to " + target_.host + "...");

    std::string error;
    sock_ = platform::connect_tcp(target_.host, port_, SSH_CONNECT_TIMEOUT_SECS * 1000, error);
    if (sock_ == PARCP_INVALID_SOCKET) {
        throw ConnectError(target_.host + ": " + error);
    }

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        close();
        throw ConnectError("failed to create SSH session");
    }

    libssh2_session_set_blocking(session_, 0);

    int ret = ssh_retry([&] { return libssh2_session_handshake(session_, sock_); });
    if (ret != 0) {
        std::string reason = ssh_last_error(session_);
        close();
        throw ConnectError("SSH handshake with " + target_.host + " failed: " + reason);
    }

    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    AuthContext ctx;
    ctx.user = target_.user;
    ctx.host = target_.host;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned int>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (auth_list) ctx.methods = auth_list;
    parcp_log("ssh: " + target_.host + " offers [" + ctx.methods + "]");

    try {
        auth_method_ = auth.authenticate(session_, ctx, callback);
    } catch (const AuthError&) {
        close();
        throw;
    }

    active_ = true;
    parcp_log("ssh: connected to " + target_.user + "@" + target_.host + " via " + auth_method_);
    if (callback) callback("Connected to " + target_.host);
}

void RemoteSession::close() {
    active_ = false;

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != PARCP_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = PARCP_INVALID_SOCKET;
    }
}

LIBSSH2_CHANNEL* RemoteSession::open_channel(std::string& error) {
    return ssh_open_serialized(open_mutex_, io_mutex_,
        [&] { return libssh2_channel_open_session(session_); },
        [&] {
            if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_EAGAIN) return true;
            error = "failed to open channel: " + ssh_last_error(session_);
            return false;
        });
}

// scp_send64 opens its channel through the same session-level state
LIBSSH2_CHANNEL* RemoteSession::open_scp_channel(const std::string& remote_path, uint64_t size,
                                                 std::string& error) {
    return ssh_open_serialized(open_mutex_, io_mutex_,
        [&] {
            return libssh2_scp_send64(session_, remote_path.c_str(), SCP_FILE_MODE,
                                      static_cast<libssh2_int64_t>(size), 0, 0);
        },
        [&] {
            if (libssh2_session_last_errno(session_) == LIBSSH2_ERROR_EAGAIN) return true;
            error = "scp to " + remote_path + " refused: " + ssh_last_error(session_);
            return false;
        });
}

void RemoteSession::finish_channel(LIBSSH2_CHANNEL* channel) {
    locked_retry([&] { return libssh2_channel_close(channel); });
    locked_retry([&] { return libssh2_channel_free(channel); });
}

SSHResult RemoteSession::run(const std::string& command) {
    if (!active_) return SSHResult{-1, "", "session is not connected"};

    std::string error;
    LIBSSH2_CHANNEL* channel = open_channel(error);
    if (!channel) return SSHResult{-1, "", error};

    int rc = locked_retry([&] { return libssh2_channel_exec(channel, command.c_str()); });
    if (rc != 0) {
        finish_channel(channel);
        return SSHResult{-1, "", "exec failed: " + command};
    }

    SSHResult result{0, "", ""};
    std::vector<char> buf(SSH_READ_BUF_SIZE);
    while (true) {
        bool eof = false;
        ssize_t n_out = 0;
        ssize_t n_err = 0;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            n_out = libssh2_channel_read(channel, buf.data(), buf.size());
            if (n_out > 0) result.stdout_data.append(buf.data(), static_cast<size_t>(n_out));
        }
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            n_err = libssh2_channel_read_stderr(channel, buf.data(), buf.size());
            if (n_err > 0) result.stderr_data.append(buf.data(), static_cast<size_t>(n_err));
        }
        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            finish_channel(channel);
            return SSHResult{-1, result.stdout_data, "read failed on exec channel"};
        }
        bool progressed = n_out > 0 || n_err > 0;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            eof = libssh2_channel_eof(channel) != 0;
        }
        if (eof && !progressed) break;
        if (!progressed) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    locked_retry([&] { return libssh2_channel_close(channel); });
    locked_retry([&] { return libssh2_channel_wait_closed(channel); });
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        result.exit_code = libssh2_channel_get_exit_status(channel);
    }
    locked_retry([&] { return libssh2_channel_free(channel); });
    return result;
}

SSHResult RemoteSession::create_remote_directory(const std::string& path) {
    auto result = run("mkdir -p " + shell_quote(path));
    if (result.failed()) {
        trim(result.stderr_data);
        parcp_log("ssh: mkdir -p " + path + " failed: " + result.stderr_data);
        if (result.stderr_data.empty()) {
            result.stderr_data = "mkdir -p " + path + " exited with " + std::to_string(result.exit_code);
        }
    }
    return result;
}

SSHResult RemoteSession::send_file(std::istream& input, const std::string& remote_path,
                                   uint64_t size, const ByteProgress& progress) {
    if (!active_) return SSHResult{-1, "", "session is not connected"};

    std::string error;
    LIBSSH2_CHANNEL* channel = open_scp_channel(remote_path, size, error);
    if (!channel) return SSHResult{-1, "", error};

    std::vector<char> buf(DEFAULT_CHUNK_SIZE);
    uint64_t sent = 0;
    while (sent < size) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), size - sent));
        input.read(buf.data(), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(input.gcount());
        if (got == 0) {
            finish_channel(channel);
            return SSHResult{-1, "", "source ended after " + std::to_string(sent) + " of " +
                                     std::to_string(size) + " bytes"};
        }

        size_t offset = 0;
        while (offset < got) {
            ssize_t n = locked_retry([&] {
                return libssh2_channel_write(channel, buf.data() + offset, got - offset);
            });
            if (n < 0) {
                finish_channel(channel);
                return SSHResult{-1, "", "write to " + remote_path + " failed (" +
                                         std::to_string(n) + ")"};
            }
            offset += static_cast<size_t>(n);
        }

        sent += got;
        if (progress) progress(sent);
    }

    // Remote scp acknowledges the file by closing its side
    int rc = locked_retry([&] { return libssh2_channel_send_eof(channel); });
    if (rc == 0) rc = locked_retry([&] { return libssh2_channel_wait_eof(channel); });
    if (rc != 0) {
        finish_channel(channel);
        return SSHResult{-1, "", "remote did not acknowledge " + remote_path + " (" +
                                 std::to_string(rc) + ")"};
    }
    locked_retry([&] { return libssh2_channel_close(channel); });
    locked_retry([&] { return libssh2_channel_wait_closed(channel); });
    locked_retry([&] { return libssh2_channel_free(channel); });

    parcp_log("scp: " + remote_path + " " + std::to_string(sent) + " bytes");
    return SSHResult{0, "", ""};
}

std::shared_ptr<RemoteSession> connect_session(const RemoteTarget& target, int port,
                                               const AuthChain& auth,
                                               StatusCallback callback) {
    auto session = std::make_shared<RemoteSession>(target, port);
    session->establish(auth, callback);
    return session;
}
