// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace core {

// ---------------------------------------------------------------------------
// Level / category names
// ---------------------------------------------------------------------------
std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace")                      return LogLevel::TRACE;
    if (lower == "debug")                      return LogLevel::DEBUG;
    if (lower == "info")                       return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error")                      return LogLevel::ERR;
    if (lower == "fatal")                      return LogLevel::FATAL;
    if (lower == "off" || lower == "none")     return LogLevel::OFF;
    return std::nullopt;
}

std::string_view log_category_string(LogCategory cat) noexcept {
    switch (cat) {
        case LogCategory::NONE:   return "NONE";
        case LogCategory::WIRE:   return "WIRE";
        case LogCategory::CRYPTO: return "CRYPTO";
        case LogCategory::CONFIG: return "CONFIG";
        case LogCategory::TOOL:   return "TOOL";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Logger -- singleton access / lifetime
// ---------------------------------------------------------------------------
Logger& Logger::instance() {
    static Logger the_logger;
    return the_logger;
}

Logger::Logger() {
    buffer_.reserve(BUFFER_FLUSH_THRESHOLD * 2);
}

Logger::~Logger() {
    flush();
}

// ---------------------------------------------------------------------------
// Logger -- configuration
// ---------------------------------------------------------------------------
void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_release);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(level_.load(std::memory_order_acquire));
}

bool Logger::will_log(LogLevel lvl) const noexcept {
    if (lvl == LogLevel::OFF) return false;
    if (static_cast<int>(lvl) < level_.load(std::memory_order_acquire)) {
        return false;
    }
    return print_to_console_.load(std::memory_order_acquire) ||
           print_to_file_.load(std::memory_order_acquire);
}

void Logger::set_print_to_console(bool enable) {
    print_to_console_.store(enable, std::memory_order_release);
}

void Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (file_stream_.is_open()) {
        flush_file_locked();
        file_stream_.close();
    }
    buffer_.clear();

    if (path.empty()) {
        print_to_file_.store(false, std::memory_order_release);
        return;
    }

    file_stream_.open(path, std::ios::out | std::ios::app);
    if (!file_stream_.is_open()) {
        print_to_file_.store(false, std::memory_order_release);
        std::cerr << "Logger: failed to open log file: " << path << "\n";
        return;
    }
    print_to_file_.store(true, std::memory_order_release);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    flush_file_locked();
    std::cerr.flush();
}

void Logger::flush_file_locked() {
    if (!file_stream_.is_open()) {
        buffer_.clear();
        return;
    }
    if (!buffer_.empty()) {
        file_stream_.write(buffer_.data(),
                           static_cast<std::streamsize>(buffer_.size()));
        buffer_.clear();
    }
    file_stream_.flush();
}

// ---------------------------------------------------------------------------
// Logger -- writing
// ---------------------------------------------------------------------------
void Logger::write(LogLevel lvl, LogCategory cat, std::string_view message) {
    // [2026-02-03 12:00:00.123] [INFO] [WIRE] message here\n
    std::string line;
    line.reserve(64 + message.size());

    line += '[';
    line += format_timestamp();
    line += "] [";
    line += log_level_string(lvl);
    line += "] [";
    line += log_category_string(cat);
    line += "] ";
    line += message;
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    write_line_locked(line);

    // Auto-flush on WARN and above so important messages are not lost.
    if (static_cast<int>(lvl) >= static_cast<int>(LogLevel::WARN)) {
        flush_file_locked();
        std::cerr.flush();
    }
}

void Logger::write_line_locked(std::string_view line) {
    if (print_to_console_.load(std::memory_order_relaxed)) {
        std::cerr.write(line.data(),
                        static_cast<std::streamsize>(line.size()));
    }

    if (print_to_file_.load(std::memory_order_relaxed) &&
        file_stream_.is_open()) {
        buffer_ += line;
        if (buffer_.size() >= BUFFER_FLUSH_THRESHOLD) {
            flush_file_locked();
        }
    }
}

std::string Logger::format_timestamp() {
    using Clock = std::chrono::system_clock;

    auto now = Clock::now();
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    int millis = static_cast<int>(epoch_ms % 1000);

    std::time_t time_val = Clock::to_time_t(now);
    std::tm tm_buf{};

#if defined(_WIN32) || defined(_WIN64)
    gmtime_s(&tm_buf, &time_val);
#else
    gmtime_r(&time_val, &tm_buf);
#endif

    char buf[32];
    int n = std::snprintf(
        buf, sizeof(buf),
        "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, millis);

    return std::string(buf, static_cast<std::size_t>(n));
}

} // namespace core
