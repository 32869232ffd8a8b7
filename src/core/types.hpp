#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures
struct TransferSettings {
    int concurrency = 8;
    int chunk_size = 8192;
    bool compress = true;
    int compression_level = 6;          // zlib level, 0..9
};

struct SshSettings {
    int port = 22;
    std::optional<std::string> identity;  // private key; public key is identity + ".pub"
    std::string password_env = "SSH_PASSWORD";
    bool use_agent = true;
};

struct LogSettings {
    std::string file;                     // empty = <tmp>/parcp_debug.log
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Byte-level progress callback (bytes done so far)
using ByteProgress = std::function<void(uint64_t)>;
