// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wire/leaf.h"

#include "core/hex.h"
#include "core/logging.h"
#include "core/stream.h"
#include "crypto/hash.h"

namespace wire {

// ===================================================================
// Full encoding
// ===================================================================

size_t LeafData::serialize_size() const noexcept {
    size_t size = 0;
    size += var_int_serialize_size(outpoint.n);
    size += var_int_serialize_size(header_code());
    size += var_int_serialize_size(static_cast<uint64_t>(amount));
    size += var_int_serialize_size(pk_script.size());

    // block hash + tx hash + script + varints
    return core::HASH_SIZE + core::HASH_SIZE + pk_script.size() + size;
}

core::Result<std::vector<uint8_t>> LeafData::to_bytes() const {
    std::vector<uint8_t> out;
    out.reserve(serialize_size());
    core::VectorWriter writer(out);
    LW_TRY_VOID(serialize(writer));
    return out;
}

core::Result<LeafData> LeafData::from_bytes(std::span<const uint8_t> data) {
    core::SpanReader reader(data);
    auto result = deserialize(reader);
    if (!result.ok()) {
        LOG_DEBUG(core::LogCategory::WIRE,
                  "Failed to decode leaf record (" +
                      std::to_string(data.size()) + " bytes): " +
                      result.error().format());
    }
    return result;
}

// ===================================================================
// Compact encoding
// ===================================================================

size_t LeafData::serialize_size_compact() const noexcept {
    size_t size = 0;
    size += var_int_serialize_size(header_code());
    size += var_int_serialize_size(static_cast<uint64_t>(amount));
    size += var_int_serialize_size(pk_script.size());
    return size + pk_script.size();
}

core::Result<std::vector<uint8_t>> LeafData::to_compact_bytes() const {
    std::vector<uint8_t> out;
    out.reserve(serialize_size_compact());
    core::VectorWriter writer(out);
    LW_TRY_VOID(serialize_compact(writer));
    return out;
}

core::Result<LeafData> LeafData::from_compact_bytes(
    std::span<const uint8_t> data) {
    core::SpanReader reader(data);
    auto result = deserialize_compact(reader);
    if (!result.ok()) {
        LOG_DEBUG(core::LogCategory::WIRE,
                  "Failed to decode compact leaf record (" +
                      std::to_string(data.size()) + " bytes): " +
                      result.error().format());
    }
    return result;
}

LeafData LeafData::reconstruct(const LeafData& compact,
                               const primitives::OutPoint& outpoint,
                               const core::uint256& block_hash) {
    LeafData leaf = compact;
    leaf.outpoint   = outpoint;
    leaf.block_hash = block_hash;
    return leaf;
}

// ===================================================================
// Commitment and display
// ===================================================================

core::uint256 LeafData::leaf_hash() const {
    crypto::HashWriter hw;
    auto result = serialize(hw);
    if (!result.ok()) {
        // The digest still covers the prefix written before the failure.
        LOG_WARN(core::LogCategory::WIRE,
                 "leaf hash of " + outpoint.to_string() + " covers " +
                     std::to_string(hw.size()) + " bytes only: " +
                     result.error().format());
    }
    return hw.finalize();
}

std::string LeafData::to_string() const {
    const core::uint256 hash = leaf_hash();

    std::string s;
    s += "BlockHash:" + block_hash.to_hex() + ",";
    s += "OutPoint:" + outpoint.to_string() + ",";
    s += "Amount:" + std::to_string(amount) + ",";
    s += "PkScript:" + core::to_hex(pk_script) + ",";
    s += "BlockHeight:" + std::to_string(height) + ",";
    s += "IsCoinBase:" + std::string(is_coinbase ? "true" : "false") + ",";
    s += "LeafHash:" + core::to_hex(hash.bytes()) + ",";
    s += "Size:" + std::to_string(serialize_size());
    return s;
}

LeafData new_leaf_data() {
    return LeafData{};
}

}  // namespace wire
