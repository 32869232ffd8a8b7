#pragma once

// Socket helpers for the SSH transport.

#include <poll.h>
#include <string>

using socket_t = int;
#define PARCP_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host and open a TCP connection to host:port within timeout_ms.
// Returns the connected (non-blocking) socket, or PARCP_INVALID_SOCKET with
// error filled in.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
