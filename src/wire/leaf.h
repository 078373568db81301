#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// LeafData -- the record committed to one accumulator leaf (one spent output)
// ---------------------------------------------------------------------------
// Full (canonical) encoding, the input of leaf_hash():
//
//   Field              Type        Size
//   tx hash            [32]byte    32
//   vout               VarInt      1-9
//   header code        VarInt      1-9
//   amount             VarInt      1-9
//   pkscript length    VarInt      1-3
//   pkscript           bytes       variable
//
// Compact encoding drops the locator, which the receiver already knows from
// the transaction input being processed:
//
//   header code | amount | pkscript length | pkscript
//
// Header code:
//   bit 0      - the creating transaction is a coinbase
//   bits 1-31  - height of the block that contains the output
//
// The block hash is carried in memory but not yet written by the full
// encoder.  serialize_size() still reserves HASH_SIZE bytes for it, so it
// reports exactly HASH_SIZE more than serialize() writes.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "core/serialize.h"
#include "core/types.h"
#include "primitives/outpoint.h"
#include "wire/common.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace wire {

/// Maximum length of an output script accepted on encode and decode.
inline constexpr uint32_t MAX_SCRIPT_SIZE = 10000;

struct LeafData {
    core::uint256          block_hash;
    primitives::OutPoint   outpoint{core::uint256{}, 0};
    int32_t                height      = 0;
    bool                   is_coinbase = false;
    int64_t                amount      = 0;
    std::vector<uint8_t>   pk_script;

    bool operator==(const LeafData&) const = default;

    // ----------------------------------------------------------------
    // Header code
    // ----------------------------------------------------------------

    /// Height and coinbase flag packed as a 32-bit signed code, widened to
    /// 64 bits with sign extension.
    [[nodiscard]] uint64_t header_code() const noexcept {
        const auto code = static_cast<int32_t>(
            (static_cast<uint32_t>(height) << 1) | (is_coinbase ? 1u : 0u));
        return static_cast<uint64_t>(static_cast<int64_t>(code));
    }

    /// Inverse of header_code(); only the low 32 bits of @p code are used.
    void set_header_code(uint64_t code) noexcept {
        const auto c = static_cast<int32_t>(static_cast<uint32_t>(code));
        is_coinbase = (c & 1) != 0;
        height      = c >> 1;
    }

    // ----------------------------------------------------------------
    // Full encoding
    // ----------------------------------------------------------------

    /// Byte count reserved for the full encoding, including the block hash
    /// width that serialize() does not emit.
    [[nodiscard]] size_t serialize_size() const noexcept;

    /// Write the full encoding.  A zero txid is a contract violation and
    /// raises the invariant signal before any byte is written.
    template <core::ByteSink Stream>
    [[nodiscard]] core::Result<void> serialize(Stream& s) const {
        LW_INVARIANT(!outpoint.txid.is_zero(),
                     "LeafData::serialize: outpoint txid is zero");

        LW_TRY_VOID(write_hash(s, outpoint.txid));
        LW_TRY_VOID(write_var_int(s, outpoint.n));
        LW_TRY_VOID(write_var_int(s, header_code()));
        LW_TRY_VOID(write_var_int(s, static_cast<uint64_t>(amount)));

        if (pk_script.size() > MAX_SCRIPT_SIZE) {
            return message_error("LeafData::serialize", "pkScript too long");
        }
        return write_var_bytes(s, pk_script);
    }

    template <core::ByteSource Stream>
    [[nodiscard]] static core::Result<LeafData> deserialize(Stream& s) {
        LeafData leaf;

        LW_TRY_ASSIGN(txid, read_hash(s));
        LW_TRY_ASSIGN(index, read_var_int(s));
        leaf.outpoint = primitives::OutPoint(txid,
                                             static_cast<uint32_t>(index));

        LW_TRY_ASSIGN(code, read_var_int(s));
        leaf.set_header_code(code);

        LW_TRY_ASSIGN(amt, read_var_int(s));
        leaf.amount = static_cast<int64_t>(amt);

        LW_TRY_ASSIGN(script,
                      read_var_bytes(s, MAX_SCRIPT_SIZE, "pkscript size"));
        leaf.pk_script = std::move(script);

        return leaf;
    }

    [[nodiscard]] core::Result<std::vector<uint8_t>> to_bytes() const;

    /// Decode a full record from the front of @p data.  Trailing bytes are
    /// not an error.
    [[nodiscard]] static core::Result<LeafData> from_bytes(
        std::span<const uint8_t> data);

    // ----------------------------------------------------------------
    // Compact encoding
    // ----------------------------------------------------------------

    [[nodiscard]] size_t serialize_size_compact() const noexcept;

    template <core::ByteSink Stream>
    [[nodiscard]] core::Result<void> serialize_compact(Stream& s) const {
        LW_TRY_VOID(write_var_int(s, header_code()));
        LW_TRY_VOID(write_var_int(s, static_cast<uint64_t>(amount)));

        if (pk_script.size() > MAX_SCRIPT_SIZE) {
            return message_error("LeafData::serialize_compact",
                                 "pkScript too long");
        }
        return write_var_bytes(s, pk_script);
    }

    /// The returned record has a zero locator and block hash.
    template <core::ByteSource Stream>
    [[nodiscard]] static core::Result<LeafData> deserialize_compact(
        Stream& s) {
        LeafData leaf;

        LW_TRY_ASSIGN(code, read_var_int(s));
        leaf.set_header_code(code);

        LW_TRY_ASSIGN(amt, read_var_int(s));
        leaf.amount = static_cast<int64_t>(amt);

        LW_TRY_ASSIGN(script,
                      read_var_bytes(s, MAX_SCRIPT_SIZE, "pkScript size"));
        leaf.pk_script = std::move(script);

        return leaf;
    }

    [[nodiscard]] core::Result<std::vector<uint8_t>> to_compact_bytes() const;

    [[nodiscard]] static core::Result<LeafData> from_compact_bytes(
        std::span<const uint8_t> data);

    /// Fill in the locator and block hash a compact record leaves out.
    [[nodiscard]] static LeafData reconstruct(
        const LeafData& compact,
        const primitives::OutPoint& outpoint,
        const core::uint256& block_hash);

    // ----------------------------------------------------------------
    // Commitment and display
    // ----------------------------------------------------------------

    /// SHA-512/256 of the full encoding.
    [[nodiscard]] core::uint256 leaf_hash() const;

    /// One-line rendering of every field plus the leaf hash, for logs.
    [[nodiscard]] std::string to_string() const;
};

/// A zero-valued record: zero hashes, index 0, height 0, empty script.
[[nodiscard]] LeafData new_leaf_data();

}  // namespace wire
