#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LW_CORE_LOGGING_H
#define LW_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: subsystem tag printed on every line
// ---------------------------------------------------------------------------
enum class LogCategory : uint8_t {
    NONE,
    WIRE,
    CRYPTO,
    CONFIG,
    TOOL,
};

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Parses a level name ("trace", "debug", "info", "warn", "error",
/// "fatal", "off"; case-insensitive).  Returns nullopt for anything else.
[[nodiscard]] std::optional<LogLevel> log_level_from_string(
    std::string_view name) noexcept;

[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    /// Returns the process-wide singleton instance.
    static Logger& instance();

    // -- configuration (all thread-safe) ------------------------------------

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const noexcept;

    /// Lockless check: true if a message at @p level would reach a sink.
    [[nodiscard]] bool will_log(LogLevel level) const noexcept;

    void set_print_to_console(bool enable);

    /// Opens (or replaces) the output log file in append mode and enables
    /// the file sink.  An empty path closes the current file.
    void set_log_file(const std::filesystem::path& path);

    /// Flushes all buffered output to console and file sinks.
    void flush();

    // -- logging entry point ------------------------------------------------

    /// Writes a fully formatted log line. The caller is responsible for
    /// performing the will_log() check beforehand.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    /// Must be called with write_mutex_ held.
    void write_line_locked(std::string_view line);
    void flush_file_locked();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    std::string           buffer_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// The message expression is only evaluated when will_log() passes.
//
// Usage:
//   LOG_DEBUG(core::LogCategory::WIRE, "decode failed: " + err.format());
// ---------------------------------------------------------------------------

#define LW_LOG_AT(lvl, cat, msg)                                          \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl))) {                   \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) LW_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) LW_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  LW_LOG_AT(core::LogLevel::INFO,  cat, msg)
#define LOG_WARN(cat, msg)  LW_LOG_AT(core::LogLevel::WARN,  cat, msg)
#define LOG_ERROR(cat, msg) LW_LOG_AT(core::LogLevel::ERR,   cat, msg)
#define LOG_FATAL(cat, msg) LW_LOG_AT(core::LogLevel::FATAL, cat, msg)

#endif // LW_CORE_LOGGING_H
