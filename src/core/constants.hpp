#pragma once

#include <cstddef>
#include <cstdint>

// ── Scanner ─────────────────────────────────────────────────
constexpr size_t FINGERPRINT_WINDOW      = 4096;   // Bytes hashed from each end of a file

// ── Transfer ────────────────────────────────────────────────
constexpr int DEFAULT_CONCURRENCY        = 8;
constexpr int DEFAULT_CHUNK_SIZE         = 8192;
constexpr int MIN_CHUNK_SIZE             = 512;
constexpr int DEFAULT_COMPRESSION_LEVEL  = 6;

// ── Frame format ────────────────────────────────────────────
constexpr uint32_t MAX_FRAME_RECORD_SIZE = 1024 * 1024;  // Header/footer length sanity cap
constexpr size_t SHA256_DIGEST_BYTES     = 32;

// ── SSH ─────────────────────────────────────────────────────
constexpr int SSH_DEFAULT_PORT           = 22;
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;
constexpr int SSH_EAGAIN_SLEEP_MS        = 10;
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SCP_FILE_MODE              = 0644;
constexpr const char* DEFAULT_PASSWORD_ENV = "SSH_PASSWORD";
constexpr const char* DEFAULT_IDENTITY     = ".ssh/id_rsa";   // Relative to $HOME

// ── CLI ─────────────────────────────────────────────────────
constexpr const char* PARCP_VERSION      = "0.4.0";
constexpr int EXIT_ALL_TRANSFERRED       = 0;
constexpr int EXIT_NOT_STARTED           = 1;   // also unpack/inspect failure
constexpr int EXIT_SOME_FAILED           = 2;
constexpr int PASSWORD_PROMPT_TIMEOUT_MS = 60000;
