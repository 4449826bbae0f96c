// Fspec.cpp – FSPEC encoding and decoding.
//
// FRN k (1-based) lives in FSPEC octet (k-1)/7, bit weight 1 << (7 - (k-1)%7):
//   FRN 1 → 0x80, FRN 2 → 0x40, … FRN 7 → 0x02, FRN 8 → next octet 0x80.
// Bit weight 0x01 is never an item; it is the FX extension flag.

#include "Cat62Codec/Fspec.hpp"

#include <stdexcept>

namespace cat62 {

static const std::string kFspecItem = "FSPEC";

std::vector<uint8_t> buildFspec(const std::set<unsigned>& frns) {
    if (frns.empty()) return {0x00};
    if (*frns.begin() == 0)
        throw std::invalid_argument("buildFspec: FRN 0 is not a valid field reference");

    const unsigned max_frn = *frns.rbegin();
    std::vector<uint8_t> octets((max_frn + 6) / 7, 0);

    for (unsigned frn : frns)
        octets[fspecOctet(frn)] |= fspecBit(frn);

    // FX = 1 on every octet that is followed by another
    for (size_t i = 0; i + 1 < octets.size(); ++i)
        octets[i] |= 0x01u;

    return octets;
}

std::vector<uint8_t> buildFspec(const UapTable& uap, const std::vector<std::string>& item_ids) {
    std::set<unsigned> frns;
    for (const auto& id : item_ids) {
        if (auto frn = uap.frnOf(id)) frns.insert(*frn);
    }
    return buildFspec(frns);
}

std::vector<unsigned> parseFspec(ByteReader& br) {
    std::vector<unsigned> frns;
    for (unsigned octet_idx = 0; ; ++octet_idx) {
        const uint8_t b = br.readByte(kFspecItem);
        for (unsigned p = 7; p >= 1; --p) {       // bit weights 0x80 … 0x02
            if (b & (1u << p))
                frns.push_back(octet_idx * 7 + (8 - p));
        }
        if ((b & 0x01u) == 0) break;              // FX=0 → last FSPEC octet
    }
    return frns;
}

ParsedFspec parseFspec(std::span<const uint8_t> buf, size_t offset, size_t limit) {
    ByteReader br{buf, offset, limit};
    ParsedFspec out;
    out.frns        = parseFspec(br);
    out.next_offset = br.position();
    return out;
}

std::string toHex(std::span<const uint8_t> bytes) {
    static constexpr char kDigits[] = "0123456789ABCDEF";
    std::string s;
    s.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        s.push_back(kDigits[b >> 4]);
        s.push_back(kDigits[b & 0x0F]);
    }
    return s;
}

} // namespace cat62
