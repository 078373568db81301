#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace core {

// ---------------------------------------------------------------------------
// Common configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_CONF     = "conf";
inline constexpr const char* CONF_HEX      = "hex";
inline constexpr const char* CONF_FILE     = "file";
inline constexpr const char* CONF_COMPACT  = "compact";
inline constexpr const char* CONF_LOGLEVEL = "loglevel";
inline constexpr const char* CONF_LOGFILE  = "logfile";
inline constexpr const char* CONF_HELP     = "help";

// ---------------------------------------------------------------------------
// Config  --  key/value options from the command line and a config file
//
// A key given on the command line always wins over the same key read from
// a file.  Within one source the last assignment wins.
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// Parse command-line arguments (argv[0] is skipped).
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    /// Anything not starting with a dash is rejected with CONFIG_ERROR.
    [[nodiscard]] Result<void> parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style configuration file.
    /// Format per line:  key=value  or a bare flag name.
    /// Lines starting with '#' and blank lines are ignored.
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

private:
    using ValueMap = std::unordered_map<std::string, std::string>;

    ValueMap cli_values_;
    ValueMap file_values_;
};

} // namespace core
