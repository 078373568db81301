#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <string>

#include "core/types.h"

namespace primitives {

/// Identifies a particular output of a previous transaction by its hash and
/// index within that transaction's output list.
struct OutPoint {
    /// Index value marking an outpoint that refers to no output.
    static constexpr uint32_t NULL_INDEX = 0xFFFFFFFF;

    /// Hash of the referenced transaction.
    core::uint256 txid;

    /// Zero-based index into the referenced transaction's outputs.
    uint32_t n = NULL_INDEX;

    OutPoint() = default;
    OutPoint(const core::uint256& txid_in, uint32_t n_in)
        : txid(txid_in), n(n_in) {}

    /// True when this outpoint refers to no real output (zero hash,
    /// maximum index).
    [[nodiscard]] bool is_null() const {
        return txid.is_zero() && n == NULL_INDEX;
    }

    bool operator==(const OutPoint&) const = default;

    /// Human-readable representation: "<txid_hex>:<index>".
    [[nodiscard]] std::string to_string() const;
};

} // namespace primitives
