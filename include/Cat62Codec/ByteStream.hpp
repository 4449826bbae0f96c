#pragma once
// ByteStream.hpp – Big-endian, byte-aligned I/O for CAT62 buffers.
//
// ASTERIX wire format rules:
//   • Bytes are transmitted in network byte order (big-endian).
//   • Data Items are always byte-aligned relative to the Data Record start,
//     and every item this profile decodes is a whole number of bytes wide.
//   • The datablock LEN field is the only read boundary; bytes past it are
//     never touched even if the caller's buffer is longer.

#include "Errors.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace cat62 {

// ─────────────────────────────────────────────────────────────────────────────
//  ByteReader
// ─────────────────────────────────────────────────────────────────────────────
// Reads whole bytes sequentially from a read-only span, bounded by a limit
// offset (normally the datablock's declared length).  Offsets are absolute
// positions in the span so that faults report where in the datablock they
// happened.
class ByteReader {
public:
    ByteReader(std::span<const uint8_t> buf, size_t pos, size_t limit) noexcept
        : buf_(buf), pos_(pos), limit_(limit < buf.size() ? limit : buf.size()) {}

    // ── Position queries ─────────────────────────────────────────────────────

    [[nodiscard]] size_t position()  const noexcept { return pos_; }
    [[nodiscard]] size_t limit()     const noexcept { return limit_; }
    [[nodiscard]] size_t available() const noexcept {
        return pos_ < limit_ ? limit_ - pos_ : 0;
    }
    [[nodiscard]] bool canRead(size_t n) const noexcept { return available() >= n; }
    [[nodiscard]] bool atEnd() const noexcept { return pos_ >= limit_; }

    // ── Read operations ──────────────────────────────────────────────────────
    // `item` names the data item being read; it is reported by TruncatedField.

    // Throws TruncatedField unless n more bytes are readable.
    void require(size_t n, const std::string& item) const {
        if (!canRead(n)) throw TruncatedField(item, pos_, n, limit_);
    }

    // Read n bytes (1–8) as a big-endian unsigned integer.
    [[nodiscard]] uint64_t readU(size_t n, const std::string& item) {
        require(n, item);
        uint64_t result = 0;
        for (size_t i = 0; i < n; ++i)
            result = (result << 8) | buf_[pos_ + i];
        pos_ += n;
        return result;
    }

    // Read n bytes as a two's-complement signed integer.
    [[nodiscard]] int64_t readS(size_t n, const std::string& item) {
        const uint64_t raw  = readU(n, item);
        const size_t   bits = n * 8;
        if (bits < 64 && ((raw >> (bits - 1)) & 1u))
            return static_cast<int64_t>(raw | (~uint64_t{0} << bits));
        return static_cast<int64_t>(raw);
    }

    [[nodiscard]] uint8_t readByte(const std::string& item) {
        return static_cast<uint8_t>(readU(1, item));
    }

    // Return the next n bytes as a view and advance past them.
    [[nodiscard]] std::span<const uint8_t> take(size_t n, const std::string& item) {
        require(n, item);
        auto view = buf_.subspan(pos_, n);
        pos_ += n;
        return view;
    }

    void skip(size_t n, const std::string& item) {
        require(n, item);
        pos_ += n;
    }

    // View of [from, position()) – used to capture the FSPEC bytes.
    [[nodiscard]] std::span<const uint8_t> consumedSince(size_t from) const {
        return buf_.subspan(from, pos_ - from);
    }

private:
    std::span<const uint8_t> buf_;
    size_t pos_{0};
    size_t limit_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
//  ByteWriter
// ─────────────────────────────────────────────────────────────────────────────
// Appends big-endian integers into an internal byte buffer.
class ByteWriter {
public:
    ByteWriter() = default;

    // Write the low n bytes (1–8) of value, most significant first.
    void writeU(uint64_t value, size_t n) {
        for (size_t i = n; i > 0; --i)
            buf_.push_back(static_cast<uint8_t>(value >> ((i - 1) * 8)));
    }

    // Write n bytes of a two's-complement signed integer.
    void writeS(int64_t value, size_t n) {
        writeU(static_cast<uint64_t>(value), n);
    }

    void writeByte(uint8_t b) { buf_.push_back(b); }

    void writeBytes(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    [[nodiscard]] const std::vector<uint8_t>& buffer() const noexcept { return buf_; }
    [[nodiscard]] std::vector<uint8_t>        take()         noexcept { return std::move(buf_); }
    [[nodiscard]] size_t                      size()   const noexcept { return buf_.size(); }

private:
    std::vector<uint8_t> buf_;
};

} // namespace cat62
