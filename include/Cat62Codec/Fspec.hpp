#pragma once
// Fspec.hpp – Field Specification (presence bitmap) build / parse.
//
//   FSPEC byte  = [FRN 7k+1 … FRN 7k+7 | FX]
//                  MSB = first FRN of the octet; LSB = continuation flag

#include "ByteStream.hpp"
#include "Uap.hpp"

#include <cstdint>
#include <set>
#include <span>
#include <string>
#include <vector>

namespace cat62 {

// Build the FSPEC octets for a set of FRNs: ceil(max/7) octets, FX set on
// all but the last.  An empty set yields the single octet 0x00.
[[nodiscard]] std::vector<uint8_t> buildFspec(const std::set<unsigned>& frns);

// Same, from item ids; ids the table does not know are ignored.
[[nodiscard]] std::vector<uint8_t> buildFspec(const UapTable& uap,
                                              const std::vector<std::string>& item_ids);

struct ParsedFspec {
    std::vector<unsigned> frns;   // ascending
    size_t next_offset{0};        // first byte after the FSPEC
};

// Parse an FSPEC starting at `offset`, never reading at or beyond `limit`.
// Throws TruncatedField("FSPEC", …) if the last FX bit points past the limit.
[[nodiscard]] ParsedFspec parseFspec(std::span<const uint8_t> buf, size_t offset, size_t limit);

// Reader-based variant used by the record decoder.
[[nodiscard]] std::vector<unsigned> parseFspec(ByteReader& br);

// Upper-case hex rendering, e.g. "F50A".
[[nodiscard]] std::string toHex(std::span<const uint8_t> bytes);

} // namespace cat62
