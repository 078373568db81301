// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha512.h"

#include "core/logging.h"

#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace crypto {

namespace {

core::uint256 make_uint256(const uint8_t (&buf)[SHA512_256_SIZE]) {
    return core::uint256::from_bytes(
        std::span<const uint8_t, SHA512_256_SIZE>(buf, SHA512_256_SIZE));
}

/// Initialise (or re-initialise) @p ctx for SHA-512/256.
void init_digest(EVP_MD_CTX* ctx, const char* who) {
    if (EVP_DigestInit_ex(ctx, EVP_sha512_256(), nullptr) != 1) {
        // Typically a provider without SHA-512/256 loaded.
        LOG_ERROR(core::LogCategory::CRYPTO,
                  std::string(who) + ": SHA-512/256 unavailable");
        throw std::runtime_error(
            std::string(who) + ": EVP_DigestInit_ex() failed");
    }
}

/// Pull the digest out of @p ctx, checking the reported length.
void final_digest(EVP_MD_CTX* ctx, uint8_t* out, const char* who) {
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx, out, &digest_len) != 1) {
        throw std::runtime_error(
            std::string(who) + ": EVP_DigestFinal_ex() failed");
    }
    if (digest_len != SHA512_256_SIZE) {
        throw std::runtime_error(
            std::string(who) + ": unexpected digest length " +
            std::to_string(digest_len));
    }
}

}  // namespace

// ===================================================================
// One-shot functions
// ===================================================================

core::uint256 sha512_256(std::span<const uint8_t> data) {
    Sha512_256Hasher hasher;
    hasher.write(data);
    return hasher.finalize();
}

core::uint256 sha512_256(const void* data, size_t len) {
    return sha512_256(std::span<const uint8_t>(
        static_cast<const uint8_t*>(data), len));
}

// ===================================================================
// Sha512_256Hasher
// ===================================================================

void Sha512_256Hasher::CtxDeleter::operator()(EVP_MD_CTX* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

Sha512_256Hasher::Sha512_256Hasher() {
    reset();
}

Sha512_256Hasher::~Sha512_256Hasher() = default;

Sha512_256Hasher::Sha512_256Hasher(Sha512_256Hasher&& other) noexcept
    : ctx_(std::move(other.ctx_)), finalized_(other.finalized_) {
    other.finalized_ = true;
}

Sha512_256Hasher& Sha512_256Hasher::operator=(
    Sha512_256Hasher&& other) noexcept {
    if (this != &other) {
        ctx_ = std::move(other.ctx_);
        finalized_ = other.finalized_;
        other.finalized_ = true;
    }
    return *this;
}

Sha512_256Hasher& Sha512_256Hasher::write(std::span<const uint8_t> data) {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha512_256Hasher::write(): context not initialised "
            "or already finalised");
    }
    if (!data.empty()) {
        if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
            throw std::runtime_error(
                "Sha512_256Hasher::write(): EVP_DigestUpdate() failed");
        }
    }
    return *this;
}

core::uint256 Sha512_256Hasher::finalize() {
    if (!ctx_ || finalized_) {
        throw std::runtime_error(
            "Sha512_256Hasher::finalize(): context not initialised "
            "or already finalised");
    }

    uint8_t buf[SHA512_256_SIZE];
    final_digest(ctx_.get(), buf, "Sha512_256Hasher::finalize()");
    finalized_ = true;
    return make_uint256(buf);
}

void Sha512_256Hasher::reset() {
    if (!ctx_) {
        ctx_.reset(EVP_MD_CTX_new());
        if (!ctx_) {
            throw std::runtime_error(
                "Sha512_256Hasher: EVP_MD_CTX_new() allocation failed");
        }
    }
    init_digest(ctx_.get(), "Sha512_256Hasher::reset()");
    finalized_ = false;
}

}  // namespace crypto
