#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace core {

/// Width in bytes of every hash identifier (txid, block hash, leaf hash).
inline constexpr std::size_t HASH_SIZE = 32;

// ---------------------------------------------------------------------------
// uint256 -- 32-byte hash identifier
// ---------------------------------------------------------------------------
// Bytes are held in wire order (index 0 is serialized first).  The hex form
// is reversed, the way txids and block hashes are conventionally displayed.
// ---------------------------------------------------------------------------
class uint256 {
public:
    constexpr uint256() noexcept : bytes_{} {}

    static uint256 from_bytes(std::span<const uint8_t, HASH_SIZE> bytes) noexcept;

    /// Display-order hex, optionally "0x"-prefixed.  Fewer than 64 digits
    /// are zero-extended on the left.  Throws std::invalid_argument on
    /// non-hex input or more than 64 digits.
    static uint256 from_hex(std::string_view hex);

    /// 64 lower-case hex digits in display order.
    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, HASH_SIZE>& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] bool is_zero() const noexcept;

    bool operator==(const uint256& other) const noexcept = default;

private:
    std::array<uint8_t, HASH_SIZE> bytes_;
};

}  // namespace core
