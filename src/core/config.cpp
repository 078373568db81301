// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/config.h"
#include "core/logging.h"

#include <cctype>
#include <fstream>
#include <string>

namespace core {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

/// Strip leading dashes from an argument key (one or two).
std::string_view strip_dashes(std::string_view sv) {
    if (sv.starts_with("--")) return sv.substr(2);
    if (sv.starts_with("-"))  return sv.substr(1);
    return sv;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool parse_bool(std::string_view sv, bool default_val) {
    if (sv.empty()) return default_val;
    if (iequals(sv, "1") || iequals(sv, "true") ||
        iequals(sv, "yes") || iequals(sv, "on")) {
        return true;
    }
    if (iequals(sv, "0") || iequals(sv, "false") ||
        iequals(sv, "no") || iequals(sv, "off")) {
        return false;
    }
    return default_val;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Config -- source loading
// ---------------------------------------------------------------------------

Result<void> Config::parse_args(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg.empty()) continue;

        if (!arg.starts_with("-") || arg == "-") {
            return Error(ErrorCode::CONFIG_ERROR,
                         "unexpected argument '" + std::string{arg} + "'");
        }

        std::string_view stripped = strip_dashes(arg);
        auto eq_pos = stripped.find('=');
        if (eq_pos == std::string_view::npos) {
            cli_values_[std::string{trim(stripped)}] = "1";
            continue;
        }
        std::string_view key = trim(stripped.substr(0, eq_pos));
        if (key.empty()) {
            return Error(ErrorCode::CONFIG_ERROR,
                         "empty option name in '" + std::string{arg} + "'");
        }
        cli_values_[std::string{key}] =
            std::string{trim(stripped.substr(eq_pos + 1))};
    }
    return make_ok();
}

Result<void> Config::parse_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return Error(ErrorCode::CONFIG_ERROR,
                     "unable to open config file '" + path.string() + "'");
    }

    LOG_DEBUG(LogCategory::CONFIG,
              "Config: loading configuration from '" + path.string() + "'");

    std::string line;
    int line_num = 0;
    while (std::getline(ifs, line)) {
        ++line_num;
        std::string_view sv = trim(std::string_view{line});
        if (sv.empty() || sv.front() == '#') continue;

        auto eq_pos = sv.find('=');
        if (eq_pos == std::string_view::npos) {
            // Bare words are boolean flags, same as on the command line.
            file_values_[std::string{sv}] = "1";
            continue;
        }

        std::string_view key = trim(sv.substr(0, eq_pos));
        if (key.empty()) {
            return Error(ErrorCode::CONFIG_ERROR,
                         "empty key on line " + std::to_string(line_num) +
                         " of '" + path.string() + "'");
        }
        file_values_[std::string{key}] =
            std::string{trim(sv.substr(eq_pos + 1))};
    }
    return make_ok();
}

// ---------------------------------------------------------------------------
// Config -- getters
// ---------------------------------------------------------------------------

std::optional<std::string> Config::get(std::string_view key) const {
    std::string k{key};
    if (auto it = cli_values_.find(k); it != cli_values_.end()) {
        return it->second;
    }
    if (auto it = file_values_.find(k); it != file_values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string Config::get_or(std::string_view key,
                           std::string_view default_val) const {
    auto val = get(key);
    return val.has_value() ? *val : std::string{default_val};
}

bool Config::get_bool(std::string_view key, bool default_val) const {
    auto val = get(key);
    if (!val.has_value()) return default_val;
    return parse_bool(*val, default_val);
}

} // namespace core
