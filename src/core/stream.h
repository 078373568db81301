#pragma once
// Copyright (c) 2024-2026 The Leafwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Stream model
// ---------------------------------------------------------------------------
// A sink is any type with `void write(std::span<const uint8_t>)`, a source
// any type with `void read(std::span<uint8_t>)`.  Both report failure by
// throwing (std::runtime_error); the wire layer turns that into core::Error.
// ---------------------------------------------------------------------------

// ---------------------------------------------------------------------------
// DataStream -- owning buffer with append and sequential read
// ---------------------------------------------------------------------------
class DataStream {
public:
    DataStream() = default;

    explicit DataStream(std::vector<uint8_t> data)
        : buf_(std::move(data)) {}

    explicit DataStream(std::span<const uint8_t> data)
        : buf_(data.begin(), data.end()) {}

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    void read(std::span<uint8_t> buf) {
        if (buf.size() > remaining()) {
            throw std::runtime_error(
                "DataStream::read(): attempted read past end of stream");
        }
        if (!buf.empty()) {
            std::memcpy(buf.data(), buf_.data() + read_pos_, buf.size());
        }
        read_pos_ += buf.size();
    }

    /// Total number of bytes in the underlying buffer.
    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }

    /// Number of bytes remaining from the current read position to the end.
    [[nodiscard]] size_t remaining() const noexcept {
        return buf_.size() - read_pos_;
    }

    [[nodiscard]] bool eof() const noexcept {
        return read_pos_ >= buf_.size();
    }

    [[nodiscard]] size_t tell() const noexcept { return read_pos_; }

    /// Return a view of the data from the current read position onward.
    [[nodiscard]] std::span<const uint8_t> view() const noexcept {
        return std::span<const uint8_t>(
            buf_.data() + read_pos_, buf_.size() - read_pos_);
    }

private:
    std::vector<uint8_t> buf_;
    size_t               read_pos_ = 0;
};

// ---------------------------------------------------------------------------
// VectorWriter -- write-only stream that appends to an external vector
// ---------------------------------------------------------------------------
// Does not own the vector; the caller must ensure the referenced vector
// outlives the writer.
// ---------------------------------------------------------------------------
class VectorWriter {
public:
    explicit VectorWriter(std::vector<uint8_t>& vec) : vec_(vec) {}

    void write(std::span<const uint8_t> data) {
        vec_.insert(vec_.end(), data.begin(), data.end());
    }

private:
    std::vector<uint8_t>& vec_;
};

// ---------------------------------------------------------------------------
// SpanWriter -- write-only stream into a fixed caller-owned buffer
// ---------------------------------------------------------------------------
// A write that does not fit is rejected as a whole and leaves the cursor
// unchanged.
// ---------------------------------------------------------------------------
class SpanWriter {
public:
    explicit SpanWriter(std::span<uint8_t> out) : out_(out) {}

    void write(std::span<const uint8_t> data) {
        if (data.size() > out_.size() - pos_) {
            throw std::runtime_error(
                "SpanWriter::write(): buffer capacity exceeded");
        }
        if (!data.empty()) {
            std::memcpy(out_.data() + pos_, data.data(), data.size());
        }
        pos_ += data.size();
    }

    /// Number of bytes written so far.
    [[nodiscard]] size_t written() const noexcept { return pos_; }

private:
    std::span<uint8_t> out_;
    size_t             pos_ = 0;
};

// ---------------------------------------------------------------------------
// SpanReader -- read-only stream over an existing byte span (zero-copy)
// ---------------------------------------------------------------------------
class SpanReader {
public:
    explicit SpanReader(std::span<const uint8_t> data)
        : data_(data) {}

    void read(std::span<uint8_t> buf) {
        if (buf.size() > remaining()) {
            throw std::runtime_error(
                "SpanReader::read(): attempted read past end of span");
        }
        if (!buf.empty()) {
            std::memcpy(buf.data(), data_.data() + pos_, buf.size());
        }
        pos_ += buf.size();
    }

    [[nodiscard]] size_t remaining() const noexcept {
        return data_.size() - pos_;
    }

    [[nodiscard]] size_t tell() const noexcept { return pos_; }

    [[nodiscard]] bool eof() const noexcept {
        return pos_ >= data_.size();
    }

private:
    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

}  // namespace core
