// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/logging.h"

#include <atomic>
#include <cstdlib>
#include <sstream>

namespace core {

namespace {

void append_location(std::ostringstream& oss,
                     const std::source_location& loc) {
    const char* file = loc.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << loc.line()
            << ':' << loc.column() << ']';
    }
}

[[noreturn]] void default_invariant_handler(const InvariantViolation&) {
    Logger::instance().flush();
    std::abort();
}

std::atomic<InvariantHandler> g_invariant_handler{&default_invariant_handler};

}  // namespace

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::PARSE_UNDERFLOW: return "PARSE_UNDERFLOW";
        case ErrorCode::MESSAGE_ERROR:   return "MESSAGE_ERROR";
        case ErrorCode::IO_ERROR:        return "IO_ERROR";
        case ErrorCode::CONFIG_ERROR:    return "CONFIG_ERROR";
    }
    return "UNKNOWN";
}

std::string Error::format() const {
    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    append_location(oss, location_);
    return oss.str();
}

// ---------------------------------------------------------------------------
// Invariant violations
// ---------------------------------------------------------------------------
std::string InvariantViolation::format() const {
    std::ostringstream oss;
    oss << "invariant violated: " << message_;
    append_location(oss, location_);
    return oss.str();
}

InvariantHandler set_invariant_handler(InvariantHandler handler) noexcept {
    if (!handler) {
        handler = &default_invariant_handler;
    }
    return g_invariant_handler.exchange(handler);
}

void invariant_failure(std::string message, std::source_location loc) {
    InvariantViolation violation(std::move(message), loc);
    LOG_FATAL(LogCategory::NONE, violation.format());

    g_invariant_handler.load()(violation);

    // A handler that returns would let the caller continue past a broken
    // contract.
    Logger::instance().flush();
    std::abort();
}

} // namespace core
