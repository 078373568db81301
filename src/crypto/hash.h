#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// HashWriter -- stream adapter that digests everything written to it.
//
// Satisfies the write side of the stream model, so any serializer can hash
// an object without materialising its encoding first:
//
//     crypto::HashWriter hw;
//     if (auto r = leaf.serialize(hw); !r.ok()) {
//         return r.error();
//     }
//     core::uint256 digest = hw.finalize();
// ---------------------------------------------------------------------------

#include "core/types.h"
#include "crypto/sha512.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace crypto {

class HashWriter {
public:
    HashWriter() = default;

    void write(std::span<const uint8_t> data) {
        hasher_.write(data);
        size_ += data.size();
    }

    /// SHA-512/256 of all bytes written so far.  Consumes the writer.
    [[nodiscard]] core::uint256 finalize() { return hasher_.finalize(); }

    /// Number of bytes fed into the digest.
    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    Sha512_256Hasher hasher_;
    size_t           size_ = 0;
};

}  // namespace crypto
