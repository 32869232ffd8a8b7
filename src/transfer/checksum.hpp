#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "manifest.hpp"

// Running CRC-32 (zlib polynomial) over a byte stream.
class Crc32Accumulator {
public:
    Crc32Accumulator();

    void update(const char* data, size_t size);
    uint32_t value() const { return static_cast<uint32_t>(crc_); }

private:
    unsigned long crc_;
};

// Running SHA-256 over a byte stream (OpenSSL EVP).
class Sha256Accumulator {
public:
    Sha256Accumulator();
    ~Sha256Accumulator();

    Sha256Accumulator(const Sha256Accumulator&) = delete;
    Sha256Accumulator& operator=(const Sha256Accumulator&) = delete;

    void update(const char* data, size_t size);

    // Finish the digest. The accumulator cannot be updated afterwards.
    Digest256 finish();

private:
    struct Impl;
    Impl* impl_;
    bool finished_ = false;
};

std::string digest_to_hex(const Digest256& digest);

// Parse 64 hex characters. Returns false on malformed input.
bool digest_from_hex(const std::string& hex, Digest256& out);
