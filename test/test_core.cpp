// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the core module.

#include "test_framework.h"
#include "child_process.h"

#include "core/config.h"
#include "core/error.h"
#include "core/hex.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "core/types.h"

#include <array>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void throwing_handler(const core::InvariantViolation& v) {
    throw v;
}

void returning_handler(const core::InvariantViolation&) {}

} // anonymous namespace

// ============================================================================
// Types -- uint256
// ============================================================================

TEST_CASE(Types, uint256_default_is_zero) {
    core::uint256 z;
    CHECK(z.is_zero());
    CHECK_EQ(z.to_hex(),
             "0000000000000000000000000000000000000000000000000000000000000000");
}

TEST_CASE(Types, uint256_from_hex_roundtrip) {
    std::string hex =
        "00000000000000000007a4e02e4a058662db0e67e8d2074b592603ed0db7ae53";
    auto val = core::uint256::from_hex(hex);
    CHECK(!val.is_zero());
    CHECK_EQ(val.to_hex(), hex);
}

TEST_CASE(Types, uint256_from_hex_with_prefix) {
    auto val = core::uint256::from_hex(
        "0x00000000000000000007a4e02e4a058662db0e67e8d2074b592603ed0db7ae53");
    CHECK_EQ(val.to_hex(),
             "00000000000000000007a4e02e4a058662db0e67e8d2074b592603ed0db7ae53");
}

TEST_CASE(Types, uint256_short_hex_is_left_padded) {
    auto val = core::uint256::from_hex("ff");
    CHECK_EQ(val.bytes()[0], 0xff);
    CHECK_EQ(val.bytes()[31], 0x00);
}

TEST_CASE(Types, uint256_bad_hex_throws) {
    CHECK_THROWS_AS(core::uint256::from_hex("zz"), std::invalid_argument);
    CHECK_THROWS_AS(core::uint256::from_hex(std::string(66, 'a')),
                    std::invalid_argument);
}

TEST_CASE(Types, uint256_from_bytes_keeps_wire_order) {
    std::array<uint8_t, 32> bytes{};
    bytes[0] = 0x01;
    auto val = core::uint256::from_bytes(std::span<const uint8_t, 32>(bytes));
    CHECK(!val.is_zero());
    CHECK_EQ(val.bytes()[0], 0x01);
    // Display order is reversed: wire byte 0 is printed last.
    CHECK_EQ(val.to_hex(),
             "0000000000000000000000000000000000000000000000000000000000000001");
}

TEST_CASE(Types, uint256_equality) {
    auto a = core::uint256::from_hex("01");
    auto b = core::uint256::from_hex("02");
    CHECK(a == core::uint256::from_hex("0x1"));
    CHECK(a != b);
}

// ============================================================================
// Hex
// ============================================================================

TEST_CASE(Hex, encode) {
    std::vector<uint8_t> data = {0x00, 0x01, 0xab, 0xff};
    CHECK_EQ(core::to_hex(data), "0001abff");
    CHECK_EQ(core::to_hex(std::vector<uint8_t>{}), "");
}

TEST_CASE(Hex, decode) {
    auto bytes = core::from_hex("0001ABff");
    CHECK(bytes.has_value());
    CHECK_EQ(bytes->size(), 4u);
    CHECK_EQ((*bytes)[2], 0xab);
    CHECK_EQ((*bytes)[3], 0xff);

    auto prefixed = core::from_hex("0x76a9");
    CHECK(prefixed.has_value());
    CHECK_EQ(prefixed->size(), 2u);
}

TEST_CASE(Hex, decode_rejects_malformed) {
    CHECK(!core::from_hex("abc").has_value());
    CHECK(!core::from_hex("zz").has_value());
    CHECK(!core::from_hex("0x0g").has_value());
}

// ============================================================================
// Streams
// ============================================================================

TEST_CASE(Stream, data_stream_read_write) {
    core::DataStream ds;
    std::vector<uint8_t> in = {1, 2, 3};
    ds.write(in);
    CHECK_EQ(ds.size(), 3u);

    std::array<uint8_t, 2> out{};
    ds.read(out);
    CHECK_EQ(out[1], 2);
    CHECK_EQ(ds.remaining(), 1u);
    CHECK_EQ(ds.tell(), 2u);

    std::array<uint8_t, 2> more{};
    CHECK_THROWS_AS(ds.read(more), std::runtime_error);
}

TEST_CASE(Stream, span_writer_rejects_overflow) {
    std::array<uint8_t, 4> buf{};
    core::SpanWriter w(buf);
    std::vector<uint8_t> three = {9, 8, 7};
    w.write(three);
    CHECK_EQ(w.written(), 3u);
    CHECK_THROWS_AS(w.write(three), std::runtime_error);
    // A rejected write leaves the cursor alone.
    CHECK_EQ(w.written(), 3u);
    CHECK_EQ(buf[0], 9);
}

TEST_CASE(Stream, span_reader) {
    std::vector<uint8_t> data = {5, 6, 7};
    core::SpanReader r(data);
    CHECK_EQ(core::ser_read_u8(r), 5);
    CHECK_EQ(r.remaining(), 2u);
    CHECK_EQ(core::ser_read_u16(r), 0x0706);
    CHECK(r.eof());
}

// ============================================================================
// Serialize
// ============================================================================

TEST_CASE(Serialize, compact_size_boundaries) {
    struct Case { uint64_t value; size_t len; uint8_t first; };
    const Case cases[] = {
        {0,                     1, 0x00},
        {0xfc,                  1, 0xfc},
        {0xfd,                  3, 0xfd},
        {0xffff,                3, 0xfd},
        {0x10000,               5, 0xfe},
        {0xffffffffULL,         5, 0xfe},
        {0x100000000ULL,        9, 0xff},
        {0xffffffffffffffffULL, 9, 0xff},
    };
    for (const auto& c : cases) {
        core::DataStream ds;
        core::ser_write_compact_size(ds, c.value);
        CHECK_EQ(ds.size(), c.len);
        CHECK_EQ(core::compact_size_len(c.value), c.len);
        CHECK_EQ(ds.view()[0], c.first);
    }
}

TEST_CASE(Serialize, little_endian_integers) {
    core::DataStream ds;
    core::ser_write_u32(ds, 0x01020304);
    CHECK_EQ(ds.view()[0], 0x04);
    CHECK_EQ(ds.view()[3], 0x01);
    CHECK_EQ(core::ser_read_u32(ds), 0x01020304u);
}

TEST_CASE(Serialize, uint256_is_raw_32_bytes) {
    auto h = core::uint256::from_hex(
        "00000000000000000007a4e02e4a058662db0e67e8d2074b592603ed0db7ae53");
    core::DataStream ds;
    core::ser_write_uint256(ds, h);
    CHECK_EQ(ds.size(), core::HASH_SIZE);
    CHECK_EQ(ds.view()[0], 0x53);
    CHECK(core::ser_read_uint256(ds) == h);
}

// ============================================================================
// Error / Result
// ============================================================================

TEST_CASE(Error, result_value_and_error) {
    core::Result<int> ok_val(42);
    CHECK(ok_val.ok());
    CHECK_EQ(ok_val.value(), 42);

    core::Result<int> err_val(
        core::Error(core::ErrorCode::MESSAGE_ERROR, "bad"));
    CHECK(!err_val.ok());
    CHECK_EQ(err_val.error().code(), core::ErrorCode::MESSAGE_ERROR);
    CHECK_EQ(err_val.error().message(), "bad");
    CHECK_THROWS_AS(err_val.value(), std::runtime_error);
}

TEST_CASE(Error, format_names_code) {
    core::Error e(core::ErrorCode::PARSE_UNDERFLOW, "short read");
    auto text = e.format();
    CHECK(text.find("PARSE_UNDERFLOW") != std::string::npos);
    CHECK(text.find("short read") != std::string::npos);
    CHECK_EQ(core::error_code_name(core::ErrorCode::IO_ERROR), "IO_ERROR");
}

TEST_CASE(Error, result_void) {
    auto ok = core::make_ok();
    CHECK(ok.ok());
    CHECK_THROWS_AS(ok.error(), std::runtime_error);
    core::Result<void> bad = core::Error(core::ErrorCode::IO_ERROR);
    CHECK_ERR_CODE(bad, core::ErrorCode::IO_ERROR);
}

TEST_CASE(Error, invariant_goes_to_handler) {
    auto previous = core::set_invariant_handler(&throwing_handler);
    bool caught = false;
    try {
        LW_INVARIANT(1 + 1 == 3, "arithmetic is broken");
    } catch (const core::InvariantViolation& v) {
        caught = true;
        CHECK_EQ(v.message(), "arithmetic is broken");
        CHECK(v.format().find("invariant violated") != std::string::npos);
    }
    CHECK(caught);
    core::set_invariant_handler(previous);
}

TEST_CASE(Error, invariant_holds_is_silent) {
    auto previous = core::set_invariant_handler(&throwing_handler);
    bool reached = false;
    try {
        LW_INVARIANT(2 > 1, "never raised");
        reached = true;
    } catch (const core::InvariantViolation&) {
    }
    CHECK(reached);
    core::set_invariant_handler(previous);
}

TEST_CASE(Error, returning_handler_still_aborts) {
    auto outcome = test::run_in_child([] {
        core::Logger::instance().set_level(core::LogLevel::FATAL);
        core::set_invariant_handler(&returning_handler);
        LW_INVARIANT(false, "handler must not resume");
        std::cerr << "resumed after invariant" << std::endl;
    });

    CHECK(outcome.forked);
    CHECK(outcome.signaled);
    CHECK_EQ(outcome.signal, SIGABRT);
    CHECK(outcome.stderr_text.find("handler must not resume") !=
          std::string::npos);
    CHECK(outcome.stderr_text.find("resumed") == std::string::npos);
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE(Config, parse_args) {
    const char* argv[] = {"prog", "--hex=00ff", "-compact",
                          "--loglevel = debug"};
    core::Config cfg;
    CHECK_OK(cfg.parse_args(4, argv));
    CHECK_EQ(cfg.get_or(core::CONF_HEX, ""), "00ff");
    CHECK(cfg.get_bool(core::CONF_COMPACT));
    CHECK_EQ(cfg.get_or(core::CONF_LOGLEVEL, ""), "debug");
    CHECK(!cfg.get(core::CONF_FILE).has_value());
    CHECK_EQ(cfg.get_or(core::CONF_FILE, "none"), "none");
}

TEST_CASE(Config, last_assignment_wins) {
    const char* argv[] = {"prog", "--hex=aa", "--hex=bb", "--compact=no"};
    core::Config cfg;
    CHECK_OK(cfg.parse_args(4, argv));
    CHECK_EQ(cfg.get_or(core::CONF_HEX, ""), "bb");
    CHECK(!cfg.get_bool(core::CONF_COMPACT, true));
}

TEST_CASE(Config, stray_argument_is_error) {
    const char* argv[] = {"prog", "--compact", "00ff"};
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_args(3, argv), core::ErrorCode::CONFIG_ERROR);

    const char* empty_key[] = {"prog", "--=00ff"};
    core::Config cfg2;
    CHECK_ERR_CODE(cfg2.parse_args(2, empty_key),
                   core::ErrorCode::CONFIG_ERROR);
}

TEST_CASE(Config, cli_overrides_file) {
    auto path = std::filesystem::temp_directory_path() /
                "leafwire_test_config.conf";
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "hex=aa\n"
            << "loglevel=info\n"
            << "compact\n";
    }

    const char* argv[] = {"prog", "--hex=bb"};
    core::Config cfg;
    CHECK_OK(cfg.parse_args(2, argv));
    CHECK_OK(cfg.parse_file(path));

    CHECK_EQ(cfg.get_or(core::CONF_HEX, ""), "bb");
    CHECK_EQ(cfg.get_or(core::CONF_LOGLEVEL, ""), "info");
    CHECK(cfg.get_bool(core::CONF_COMPACT));

    std::filesystem::remove(path);
}

TEST_CASE(Config, empty_key_in_file_is_error) {
    auto path = std::filesystem::temp_directory_path() /
                "leafwire_test_bad.conf";
    {
        std::ofstream out(path);
        out << "hex=aa\n"
            << " = 1\n";
    }

    core::Config cfg;
    auto r = cfg.parse_file(path);
    CHECK_ERR_CODE(r, core::ErrorCode::CONFIG_ERROR);
    if (!r.ok()) {
        CHECK(r.error().message().find("line 2") != std::string::npos);
    }

    std::filesystem::remove(path);
}

TEST_CASE(Config, missing_file_is_error) {
    core::Config cfg;
    CHECK_ERR_CODE(cfg.parse_file("/nonexistent/leafwire.conf"),
                   core::ErrorCode::CONFIG_ERROR);
}

// ============================================================================
// Logging
// ============================================================================

TEST_CASE(Logging, level_names) {
    CHECK(core::log_level_from_string("DEBUG") == core::LogLevel::DEBUG);
    CHECK(core::log_level_from_string("warning") == core::LogLevel::WARN);
    CHECK(core::log_level_from_string("error") == core::LogLevel::ERR);
    CHECK(!core::log_level_from_string("loud").has_value());
    CHECK_EQ(core::log_level_string(core::LogLevel::ERR), "ERROR");
    CHECK_EQ(core::log_category_string(core::LogCategory::WIRE), "WIRE");
}

TEST_CASE(Logging, will_log_respects_level) {
    auto& logger = core::Logger::instance();
    const auto saved = logger.level();

    logger.set_level(core::LogLevel::WARN);
    CHECK(!logger.will_log(core::LogLevel::DEBUG));
    CHECK(logger.will_log(core::LogLevel::WARN));
    CHECK(logger.will_log(core::LogLevel::ERR));
    CHECK(!logger.will_log(core::LogLevel::OFF));

    logger.set_level(core::LogLevel::OFF);
    CHECK(!logger.will_log(core::LogLevel::FATAL));

    logger.set_level(saved);
}
