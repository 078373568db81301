#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace core {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------
// Numbered by range: parsing 100s, I/O 300s, configuration 800s.
enum class ErrorCode : uint16_t {
    PARSE_UNDERFLOW = 102,  // source ran out before the record ended
    MESSAGE_ERROR   = 104,  // malformed or out-of-bounds record field
    IO_ERROR        = 300,  // sink refused a write, or a file is unreadable
    CONFIG_ERROR    = 800,  // bad option or configuration file
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// Error -- code, message and the place it was raised
// ---------------------------------------------------------------------------
class Error {
public:
    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }

    /// "NAME(code): message [file:line:col]"
    [[nodiscard]] std::string format() const;

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// ---------------------------------------------------------------------------
// Result<T> -- a value or an Error
// ---------------------------------------------------------------------------
// value() and error() throw std::runtime_error when asked for the
// alternative that is not held.
template <typename T>
class Result {
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const Error& err) : storage_(err) {}         // NOLINT implicit
    Result(Error&& err) : storage_(std::move(err)) {}   // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept {
        return std::holds_alternative<T>(storage_);
    }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        require_value();
        return std::get<T>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        require_value();
        return std::get<T>(storage_);
    }
    [[nodiscard]] T&& value() && {
        require_value();
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] const Error& error() const& {
        require_error();
        return std::get<Error>(storage_);
    }
    [[nodiscard]] Error&& error() && {
        require_error();
        return std::get<Error>(std::move(storage_));
    }

private:
    void require_value() const {
        if (!ok()) throw std::runtime_error("Result::value() on error");
    }
    void require_error() const {
        if (ok()) throw std::runtime_error("Result::error() on value");
    }

    std::variant<T, Error> storage_;
};

template <>
class Result<void> {
public:
    Result() noexcept = default;
    Result(const Error& err) : error_(err) {}           // NOLINT implicit
    Result(Error&& err) : error_(std::move(err)) {}     // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const Error& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return *error_;
    }
    [[nodiscard]] Error&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::move(*error_);
    }

private:
    std::optional<Error> error_;
};

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// ---------------------------------------------------------------------------
// Invariant violations
// ---------------------------------------------------------------------------
// A broken programming contract is not an Error: it must never be returned,
// retried or logged-and-ignored.  InvariantViolation is intentionally not a
// std::exception so `catch (const std::exception&)` recovery paths do not
// intercept it.
class InvariantViolation {
public:
    explicit InvariantViolation(
        std::string message,
        std::source_location loc = std::source_location::current())
        : message_(std::move(message)), location_(loc) {}

    [[nodiscard]] const std::string& message() const noexcept {
        return message_;
    }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] std::string format() const;

private:
    std::string          message_;
    std::source_location location_;
};

// Called with the violation; must not return normally.  The default
// handler flushes the logger and aborts the process.
using InvariantHandler = void (*)(const InvariantViolation&);

/// Install @p handler and return the previous one.  Passing nullptr
/// restores the default (abort) handler.
InvariantHandler set_invariant_handler(InvariantHandler handler) noexcept;

/// Log the violation at FATAL, hand it to the installed handler and abort
/// if the handler returns.
[[noreturn]] void invariant_failure(
    std::string message,
    std::source_location loc = std::source_location::current());

#define LW_INVARIANT(cond, msg)                                           \
    do {                                                                  \
        if (!(cond)) ::core::invariant_failure((msg));                    \
    } while (false)

// LW_TRY_ASSIGN: declare `var` from a Result, or return its error.
// Usage:  LW_TRY_ASSIGN(count, read_var_int(s));
#define LW_TRY_ASSIGN(var, expr)                                          \
    auto _lw_tmp_##var = (expr);                                          \
    if (!_lw_tmp_##var.ok())                                              \
        return std::move(_lw_tmp_##var).error();                          \
    auto var = std::move(_lw_tmp_##var).value()

// LW_TRY_VOID: return the error of a failed Result<void>.
#define LW_TRY_VOID(expr)                                                 \
    do {                                                                  \
        auto _lw_tmp = (expr);                                            \
        if (!_lw_tmp.ok()) return std::move(_lw_tmp).error();             \
    } while (false)

} // namespace core
