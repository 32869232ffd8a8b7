#include "checksum.hpp"
#include <core/utils.hpp>
#include <openssl/evp.h>
#include <zlib.h>
#include <stdexcept>

// ── CRC-32 ───────────────────────────────────────────────────

Crc32Accumulator::Crc32Accumulator() : crc_(crc32(0L, Z_NULL, 0)) {
}

void Crc32Accumulator::update(const char* data, size_t size) {
    // zlib takes uInt lengths; feed large buffers in slices
    const auto* bytes = reinterpret_cast<const Bytef*>(data);
    while (size > 0) {
        uInt n = size > 0x40000000u ? 0x40000000u : static_cast<uInt>(size);
        crc_ = crc32(crc_, bytes, n);
        bytes += n;
        size -= n;
    }
}

// ── SHA-256 ──────────────────────────────────────────────────

struct Sha256Accumulator::Impl {
    EVP_MD_CTX* ctx = nullptr;
};

Sha256Accumulator::Sha256Accumulator() : impl_(new Impl) {
    impl_->ctx = EVP_MD_CTX_new();
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(impl_->ctx);
        delete impl_;
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
}

Sha256Accumulator::~Sha256Accumulator() {
    EVP_MD_CTX_free(impl_->ctx);
    delete impl_;
}

void Sha256Accumulator::update(const char* data, size_t size) {
    if (finished_) {
        throw std::logic_error("SHA-256 accumulator updated after finish()");
    }
    if (size == 0) return;
    if (EVP_DigestUpdate(impl_->ctx, data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

Digest256 Sha256Accumulator::finish() {
    if (finished_) {
        throw std::logic_error("SHA-256 accumulator finished twice");
    }
    finished_ = true;

    Digest256 digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, digest.data(), &length) != 1 || length != digest.size()) {
        throw std::runtime_error("SHA-256 finalize failed");
    }
    return digest;
}

// ── Hex helpers ──────────────────────────────────────────────

std::string digest_to_hex(const Digest256& digest) {
    return to_hex(digest.data(), digest.size());
}

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool digest_from_hex(const std::string& hex, Digest256& out) {
    if (hex.size() != out.size() * 2) return false;
    for (size_t i = 0; i < out.size(); i++) {
        int hi = hex_val(hex[2 * i]);
        int lo = hex_val(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}
