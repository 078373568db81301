// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wire/common.h"

#include <sstream>
#include <string>

namespace wire {

core::Error message_error(std::string_view func, std::string_view desc,
                          std::source_location loc) {
    std::string msg;
    msg.reserve(func.size() + 2 + desc.size());
    msg.append(func);
    msg.append(": ");
    msg.append(desc);
    return core::Error(core::ErrorCode::MESSAGE_ERROR, std::move(msg), loc);
}

core::Error read_error(std::string_view func, const std::exception& cause,
                       std::source_location loc) {
    return core::Error(core::ErrorCode::PARSE_UNDERFLOW,
                       std::string(func) + ": " + cause.what(), loc);
}

core::Error write_error(std::string_view func, const std::exception& cause,
                        std::source_location loc) {
    return core::Error(core::ErrorCode::IO_ERROR,
                       std::string(func) + ": " + cause.what(), loc);
}

core::Error non_canonical_var_int(uint64_t value, uint8_t discriminant,
                                  uint64_t min) {
    std::ostringstream oss;
    oss << std::hex << "non-canonical varint " << value
        << " - discriminant " << static_cast<unsigned>(discriminant)
        << " must encode a value greater than " << min;
    return message_error("ReadVarInt", oss.str());
}

}  // namespace wire
