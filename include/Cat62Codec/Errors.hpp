#pragma once
// Errors.hpp – Structural faults raised by the CAT62 codec.
//
// Every fault carries the byte offset (from the start of the datablock
// buffer) at which it was detected, and the item id where one applies, so
// the caller can point at the offending input.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace cat62 {

class CodecError : public std::runtime_error {
public:
    CodecError(const std::string& what, size_t offset, std::string item = {})
        : std::runtime_error(what), offset_(offset), item_(std::move(item)) {}

    [[nodiscard]] size_t             offset() const noexcept { return offset_; }
    [[nodiscard]] const std::string& item()   const noexcept { return item_; }

private:
    size_t      offset_;
    std::string item_;
};

// First byte of the datablock is not 62.
class WrongCategory : public CodecError {
public:
    explicit WrongCategory(unsigned found)
        : CodecError("Expected CAT62 (0x3E), got category " + std::to_string(found), 0),
          found_(found) {}

    [[nodiscard]] unsigned found() const noexcept { return found_; }

private:
    unsigned found_;
};

// Buffer shorter than the header, or declared length inconsistent with it.
class TruncatedDatablock : public CodecError {
public:
    TruncatedDatablock(size_t declared, size_t available)
        : CodecError("Datablock declared length " + std::to_string(declared) +
                     " does not fit available data " + std::to_string(available), 0),
          declared_(declared), available_(available) {}

    [[nodiscard]] size_t declared()  const noexcept { return declared_; }
    [[nodiscard]] size_t available() const noexcept { return available_; }

private:
    size_t declared_;
    size_t available_;
};

// An item (or the FSPEC itself) would read past the declared length.
class TruncatedField : public CodecError {
public:
    TruncatedField(const std::string& item, size_t offset, size_t needed, size_t limit)
        : CodecError("Truncated item " + item + " at offset " + std::to_string(offset) +
                     ": needs " + std::to_string(needed) + " byte(s), block ends at " +
                     std::to_string(limit), offset, item) {}
};

// Encoded payload does not fit the 16-bit length field.
class DatablockTooLarge : public CodecError {
public:
    explicit DatablockTooLarge(size_t total)
        : CodecError("Datablock length " + std::to_string(total) +
                     " exceeds 65535 bytes", total) {}
};

} // namespace cat62
