// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// leafwire-inspect -- decode and describe a serialized leaf record
//
// Usage:
//   leafwire-inspect [options]
//
// Options:
//   --hex=HEX           Record to decode, hex encoded
//   --file=PATH         Read the hex record from the first line of PATH
//   --compact           Input uses the compact encoding
//   --conf=PATH         Read any of these options from a key=value file
//   --loglevel=LEVEL    trace|debug|info|warn|error|fatal|off (default: warn)
//   --logfile=PATH      Also append log output to PATH
//   --help              Show this text
// ---------------------------------------------------------------------------

#include "core/config.h"
#include "core/error.h"
#include "core/hex.h"
#include "core/logging.h"
#include "wire/leaf.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cout << "Leafwire leaf record inspector\n\n"
              << "Usage: leafwire-inspect [options]\n\n"
              << "Options:\n"
              << "  --hex=HEX           Record to decode, hex encoded\n"
              << "  --file=PATH         Read the hex record from the first "
                 "line of PATH\n"
              << "  --compact           Input uses the compact encoding\n"
              << "  --conf=PATH         Read options from a key=value file\n"
              << "  --loglevel=LEVEL    trace|debug|info|warn|error|fatal|off "
                 "(default: warn)\n"
              << "  --logfile=PATH      Also append log output to PATH\n"
              << "  --help              Show this text\n\n"
              << "Examples:\n"
              << "  leafwire-inspect --hex=<full record hex>\n"
              << "  leafwire-inspect --compact --file=leaf.hex\n";
}

int fail(const std::string& msg) {
    LOG_ERROR(core::LogCategory::TOOL, msg);
    core::Logger::instance().flush();
    std::cerr << "Error: " << msg << std::endl;
    return 1;
}

/// Apply --loglevel / --logfile.  Returns an error for an unknown level.
core::Result<void> setup_logging(const core::Config& cfg) {
    auto& logger = core::Logger::instance();
    logger.set_print_to_console(true);

    const std::string level_name = cfg.get_or(core::CONF_LOGLEVEL, "warn");
    auto level = core::log_level_from_string(level_name);
    if (!level) {
        return core::Error(core::ErrorCode::CONFIG_ERROR,
                           "unknown log level '" + level_name + "'");
    }
    logger.set_level(*level);

    if (auto path = cfg.get(core::CONF_LOGFILE)) {
        logger.set_log_file(*path);
    }
    return core::make_ok();
}

/// The record text: --hex wins over --file.
core::Result<std::string> load_input(const core::Config& cfg) {
    if (auto hex = cfg.get(core::CONF_HEX)) {
        return *hex;
    }
    if (auto path = cfg.get(core::CONF_FILE)) {
        std::ifstream in(*path);
        if (!in) {
            return core::Error(core::ErrorCode::IO_ERROR,
                               "cannot open input file " + *path);
        }
        std::string line;
        std::getline(in, line);
        while (!line.empty() &&
               (line.back() == '\r' || line.back() == ' ' ||
                line.back() == '\t')) {
            line.pop_back();
        }
        return line;
    }
    return core::Error(core::ErrorCode::CONFIG_ERROR,
                       "no input given (use --hex or --file)");
}

void print_compact(const wire::LeafData& leaf) {
    std::cout << "Format:        compact\n"
              << "Amount:        " << leaf.amount << "\n"
              << "PkScript:      " << core::to_hex(leaf.pk_script) << "\n"
              << "BlockHeight:   " << leaf.height << "\n"
              << "IsCoinBase:    " << (leaf.is_coinbase ? "true" : "false")
              << "\n"
              << "CompactSize:   " << leaf.serialize_size_compact() << "\n";
}

void print_full(const wire::LeafData& leaf) {
    std::cout << "Format:        full\n"
              << "OutPoint:      " << leaf.outpoint.to_string() << "\n"
              << "Amount:        " << leaf.amount << "\n"
              << "PkScript:      " << core::to_hex(leaf.pk_script) << "\n"
              << "BlockHeight:   " << leaf.height << "\n"
              << "IsCoinBase:    " << (leaf.is_coinbase ? "true" : "false")
              << "\n"
              << "LeafHash:      " << core::to_hex(leaf.leaf_hash().bytes())
              << "\n"
              << "SerializeSize: " << leaf.serialize_size() << "\n"
              << "CompactSize:   " << leaf.serialize_size_compact() << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    core::Config cfg;
    if (auto parsed = cfg.parse_args(argc, argv); !parsed.ok()) {
        return fail(parsed.error().message());
    }

    if (argc < 2 || cfg.get_bool(core::CONF_HELP)) {
        print_usage();
        return 0;
    }

    if (auto conf = cfg.get(core::CONF_CONF)) {
        auto loaded = cfg.parse_file(*conf);
        if (!loaded.ok()) {
            return fail(loaded.error().format());
        }
    }

    auto logging = setup_logging(cfg);
    if (!logging.ok()) {
        return fail(logging.error().format());
    }

    auto input = load_input(cfg);
    if (!input.ok()) {
        return fail(input.error().format());
    }

    auto bytes = core::from_hex(input.value());
    if (!bytes) {
        return fail("input is not valid hex");
    }
    LOG_DEBUG(core::LogCategory::TOOL,
              "decoding " + std::to_string(bytes->size()) + " bytes");

    const bool compact = cfg.get_bool(core::CONF_COMPACT);
    auto leaf = compact ? wire::LeafData::from_compact_bytes(*bytes)
                        : wire::LeafData::from_bytes(*bytes);
    if (!leaf.ok()) {
        return fail(leaf.error().format());
    }

    if (compact) {
        print_compact(leaf.value());
    } else if (leaf.value().outpoint.txid.is_zero()) {
        // A zero txid cannot be re-encoded, so it has no leaf hash.
        return fail("decoded record has a zero txid");
    } else {
        print_full(leaf.value());
    }

    core::Logger::instance().flush();
    return 0;
}
