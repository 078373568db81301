#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Wire-level building blocks shared by every message codec:
//
//   - VarInt:   Bitcoin CompactSize integers (full 64-bit range, canonical
//               encodings only on read).
//   - VarBytes: CompactSize length prefix followed by raw bytes, with a
//               caller-supplied upper bound checked before allocation.
//   - Hashes:   32 raw bytes.
//
// Stream failures are translated into core::Error here so that codecs
// above this layer deal only in core::Result:
//   source exhausted  -> PARSE_UNDERFLOW
//   sink rejected     -> IO_ERROR
//   malformed message -> MESSAGE_ERROR (see message_error())
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "core/serialize.h"
#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wire {

/// The generic "invalid message" error: MESSAGE_ERROR with the message
/// "<func>: <desc>".
[[nodiscard]] core::Error message_error(
    std::string_view func,
    std::string_view desc,
    std::source_location loc = std::source_location::current());

/// Source ran dry (or failed) while @p func was reading.
[[nodiscard]] core::Error read_error(
    std::string_view func,
    const std::exception& cause,
    std::source_location loc = std::source_location::current());

/// Sink rejected a write issued by @p func.
[[nodiscard]] core::Error write_error(
    std::string_view func,
    const std::exception& cause,
    std::source_location loc = std::source_location::current());

/// MESSAGE_ERROR for a CompactSize that a shorter form could have encoded.
[[nodiscard]] core::Error non_canonical_var_int(
    uint64_t value, uint8_t discriminant, uint64_t min);

// ===================================================================
// VarInt
// ===================================================================

/// Bytes write_var_int() emits for @p value.
[[nodiscard]] inline size_t var_int_serialize_size(uint64_t value) noexcept {
    return core::compact_size_len(value);
}

template <core::ByteSink Stream>
[[nodiscard]] core::Result<void> write_var_int(Stream& s, uint64_t value) {
    try {
        core::ser_write_compact_size(s, value);
    } catch (const std::exception& e) {
        return write_error("WriteVarInt", e);
    }
    return core::make_ok();
}

template <core::ByteSource Stream>
[[nodiscard]] core::Result<uint64_t> read_var_int(Stream& s) {
    uint8_t  discriminant = 0;
    uint64_t rv  = 0;
    uint64_t min = 0;
    try {
        discriminant = core::ser_read_u8(s);
        switch (discriminant) {
            case core::COMPACT_SIZE_U64:
                rv  = core::ser_read_u64(s);
                min = 0x100000000ULL;
                break;
            case core::COMPACT_SIZE_U32:
                rv  = core::ser_read_u32(s);
                min = 0x10000;
                break;
            case core::COMPACT_SIZE_U16:
                rv  = core::ser_read_u16(s);
                min = core::COMPACT_SIZE_U16;
                break;
            default:
                return uint64_t{discriminant};
        }
    } catch (const std::exception& e) {
        return read_error("ReadVarInt", e);
    }

    if (rv < min) {
        return non_canonical_var_int(rv, discriminant, min);
    }
    return rv;
}

// ===================================================================
// VarBytes
// ===================================================================

template <core::ByteSink Stream>
[[nodiscard]] core::Result<void> write_var_bytes(
    Stream& s, std::span<const uint8_t> bytes) {
    LW_TRY_VOID(write_var_int(s, bytes.size()));
    try {
        core::ser_write_bytes(s, bytes);
    } catch (const std::exception& e) {
        return write_error("WriteVarBytes", e);
    }
    return core::make_ok();
}

/// Read a length-prefixed byte string of at most @p max_allowed bytes.
/// @p field_name labels the length in the error message.
template <core::ByteSource Stream>
[[nodiscard]] core::Result<std::vector<uint8_t>> read_var_bytes(
    Stream& s, uint32_t max_allowed, std::string_view field_name) {
    LW_TRY_ASSIGN(count, read_var_int(s));

    // Reject oversized counts before allocating for them.
    if (count > max_allowed) {
        return message_error(
            "ReadVarBytes",
            std::string(field_name) +
                " is larger than the max allowed size [count " +
                std::to_string(count) + ", max " +
                std::to_string(max_allowed) + "]");
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(count));
    try {
        core::ser_read_bytes(s, std::span<uint8_t>(bytes));
    } catch (const std::exception& e) {
        return read_error("ReadVarBytes", e);
    }
    return bytes;
}

// ===================================================================
// Hashes
// ===================================================================

template <core::ByteSink Stream>
[[nodiscard]] core::Result<void> write_hash(
    Stream& s, const core::uint256& hash) {
    try {
        core::ser_write_uint256(s, hash);
    } catch (const std::exception& e) {
        return write_error("WriteHash", e);
    }
    return core::make_ok();
}

template <core::ByteSource Stream>
[[nodiscard]] core::Result<core::uint256> read_hash(Stream& s) {
    try {
        return core::ser_read_uint256(s);
    } catch (const std::exception& e) {
        return read_error("ReadHash", e);
    }
}

}  // namespace wire
