#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/stream.h"
#include "core/types.h"

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

namespace core {

// ===================================================================
// Stream concepts
// ===================================================================

/// Anything bytes can be written to (DataStream, VectorWriter,
/// SpanWriter, crypto::HashWriter, ...).
template <typename S>
concept ByteSink = requires(S& s, std::span<const uint8_t> data) {
    s.write(data);
};

/// Anything bytes can be read from (DataStream, SpanReader, ...).
template <typename S>
concept ByteSource = requires(S& s, std::span<uint8_t> buf) {
    s.read(buf);
};

// ===================================================================
// CompactSize encoding (Bitcoin-compatible)
// ===================================================================
//
// Encoding scheme:
//   0   .. 252              -> 1 byte   (value itself)
//   253 .. 0xFFFF           -> 0xFD + 2 bytes LE
//   0x10000 .. 0xFFFF'FFFF  -> 0xFE + 4 bytes LE
//   0x1'0000'0000 ..        -> 0xFF + 8 bytes LE
// ===================================================================

inline constexpr uint8_t COMPACT_SIZE_U16 = 0xFD;
inline constexpr uint8_t COMPACT_SIZE_U32 = 0xFE;
inline constexpr uint8_t COMPACT_SIZE_U64 = 0xFF;

/// Number of bytes ser_write_compact_size() emits for @p n.
inline constexpr size_t compact_size_len(uint64_t n) noexcept {
    if (n < COMPACT_SIZE_U16)  return 1;
    if (n <= 0xFFFF)           return 3;
    if (n <= 0xFFFFFFFFULL)    return 5;
    return 9;
}

// ===================================================================
// Primitive serializers -- little-endian wire format
// ===================================================================

template <ByteSink Stream>
inline void ser_write_u8(Stream& s, uint8_t v) {
    s.write(std::span<const uint8_t>(&v, 1));
}

template <ByteSink Stream>
inline void ser_write_u16(Stream& s, uint16_t v) {
    uint8_t buf[2];
    buf[0] = static_cast<uint8_t>(v & 0xFF);
    buf[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    s.write(std::span<const uint8_t>(buf, 2));
}

template <ByteSink Stream>
inline void ser_write_u32(Stream& s, uint32_t v) {
    uint8_t buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 4));
}

template <ByteSink Stream>
inline void ser_write_u64(Stream& s, uint64_t v) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    s.write(std::span<const uint8_t>(buf, 8));
}

template <ByteSink Stream>
inline void ser_write_bytes(Stream& s, std::span<const uint8_t> data) {
    if (!data.empty()) {
        s.write(data);
    }
}

/// Write a CompactSize-encoded unsigned integer.
template <ByteSink Stream>
void ser_write_compact_size(Stream& s, uint64_t n) {
    if (n < COMPACT_SIZE_U16) {
        ser_write_u8(s, static_cast<uint8_t>(n));
    } else if (n <= 0xFFFF) {
        ser_write_u8(s, COMPACT_SIZE_U16);
        ser_write_u16(s, static_cast<uint16_t>(n));
    } else if (n <= 0xFFFFFFFFULL) {
        ser_write_u8(s, COMPACT_SIZE_U32);
        ser_write_u32(s, static_cast<uint32_t>(n));
    } else {
        ser_write_u8(s, COMPACT_SIZE_U64);
        ser_write_u64(s, n);
    }
}

// ===================================================================
// Primitive deserializers -- little-endian wire format
// ===================================================================

template <ByteSource Stream>
inline uint8_t ser_read_u8(Stream& s) {
    uint8_t v{};
    s.read(std::span<uint8_t>(&v, 1));
    return v;
}

template <ByteSource Stream>
inline uint16_t ser_read_u16(Stream& s) {
    uint8_t buf[2];
    s.read(std::span<uint8_t>(buf, 2));
    return static_cast<uint16_t>(buf[0] | (buf[1] << 8));
}

template <ByteSource Stream>
inline uint32_t ser_read_u32(Stream& s) {
    uint8_t buf[4];
    s.read(std::span<uint8_t>(buf, 4));
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        v |= static_cast<uint32_t>(buf[i]) << (8 * i);
    }
    return v;
}

template <ByteSource Stream>
inline uint64_t ser_read_u64(Stream& s) {
    uint8_t buf[8];
    s.read(std::span<uint8_t>(buf, 8));
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(buf[i]) << (8 * i);
    }
    return v;
}

template <ByteSource Stream>
inline void ser_read_bytes(Stream& s, std::span<uint8_t> buf) {
    if (!buf.empty()) {
        s.read(buf);
    }
}

// ===================================================================
// uint256 serialization (32 raw bytes, no length prefix)
// ===================================================================

template <ByteSink Stream>
inline void ser_write_uint256(Stream& s, const core::uint256& v) {
    s.write(std::span<const uint8_t>(v.data(), HASH_SIZE));
}

template <ByteSource Stream>
inline core::uint256 ser_read_uint256(Stream& s) {
    std::array<uint8_t, HASH_SIZE> bytes{};
    s.read(std::span<uint8_t>(bytes));
    return core::uint256::from_bytes(
        std::span<const uint8_t, HASH_SIZE>(bytes));
}

}  // namespace core
