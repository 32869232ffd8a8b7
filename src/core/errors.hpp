#pragma once

#include <stdexcept>
#include <string>

// Fatal, run-level failures. Thrown before any transfer starts.

// TCP connect or SSH handshake failed
class ConnectError : public std::runtime_error {
public:
    explicit ConnectError(const std::string& what) : std::runtime_error(what) {}
};

// Every authentication strategy was tried and rejected
class AuthError : public std::runtime_error {
public:
    explicit AuthError(const std::string& what) : std::runtime_error(what) {}
};

// Per-file failures raised while decoding a frame.

// Frame structure is unreadable (truncated, bad length, unparsable record)
class FrameError : public std::runtime_error {
public:
    explicit FrameError(const std::string& what) : std::runtime_error(what) {}
};

// Payload does not match the checksums stored in the footer
class IntegrityError : public std::runtime_error {
public:
    explicit IntegrityError(const std::string& what) : std::runtime_error(what) {}
};
