#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA-512/256 wrapper around the OpenSSL 3.0+ EVP API.
//
// SHA-512/256 (FIPS 180-4 section 6.7) runs the SHA-512 compression function
// from its own initial values and truncates the output to 256 bits.  It is
// the leaf commitment hash of the accumulator; it is not interchangeable
// with SHA-256 or a truncated plain SHA-512.
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

// Forward-declare the OpenSSL context type so callers do not need the
// OpenSSL headers just to include this header.
struct evp_md_ctx_st;
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace crypto {

/// Digest length in bytes.
inline constexpr std::size_t SHA512_256_SIZE = 32;

// ===================================================================
// One-shot hash functions
// ===================================================================

/// SHA-512/256 of a byte span.  The digest bytes are stored unchanged
/// (digest byte 0 at index 0 of the returned uint256).
[[nodiscard]] core::uint256 sha512_256(std::span<const uint8_t> data);

[[nodiscard]] core::uint256 sha512_256(const void* data, size_t len);

// ===================================================================
// Incremental hasher
// ===================================================================

/// Move-only incremental SHA-512/256 hasher backed by an OpenSSL
/// EVP_MD_CTX.  Feed data with write(), obtain the digest with
/// finalize().  Call reset() to reuse the object for another hash.
class Sha512_256Hasher {
public:
    Sha512_256Hasher();
    ~Sha512_256Hasher();

    Sha512_256Hasher(const Sha512_256Hasher&) = delete;
    Sha512_256Hasher& operator=(const Sha512_256Hasher&) = delete;

    Sha512_256Hasher(Sha512_256Hasher&& other) noexcept;
    Sha512_256Hasher& operator=(Sha512_256Hasher&& other) noexcept;

    Sha512_256Hasher& write(std::span<const uint8_t> data);

    /// Produce the final digest.  The context is consumed; call reset()
    /// before hashing again.
    [[nodiscard]] core::uint256 finalize();

    void reset();

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const noexcept;
    };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    bool finalized_ = false;
};

}  // namespace crypto
