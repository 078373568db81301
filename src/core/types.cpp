// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"
#include "core/hex.h"

#include <algorithm>
#include <stdexcept>

namespace core {

uint256 uint256::from_bytes(std::span<const uint8_t, HASH_SIZE> bytes) noexcept {
    uint256 out;
    std::copy(bytes.begin(), bytes.end(), out.bytes_.begin());
    return out;
}

uint256 uint256::from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() > HASH_SIZE * 2) {
        throw std::invalid_argument(
            "uint256::from_hex: more than 64 hex digits");
    }

    // An odd digit count gets one leading zero so the high nibble parses.
    std::string digits;
    if (hex.size() % 2 != 0) digits.push_back('0');
    digits.append(hex);

    auto display = core::from_hex(digits);
    if (!display) {
        throw std::invalid_argument(
            "uint256::from_hex: invalid hex character");
    }

    // The last display byte is wire byte 0; unnamed high bytes stay zero.
    uint256 out;
    std::reverse_copy(display->begin(), display->end(), out.bytes_.begin());
    return out;
}

std::string uint256::to_hex() const {
    std::array<uint8_t, HASH_SIZE> display{};
    std::reverse_copy(bytes_.begin(), bytes_.end(), display.begin());
    return core::to_hex(display);
}

bool uint256::is_zero() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(),
                       [](uint8_t b) { return b == 0; });
}

}  // namespace core
