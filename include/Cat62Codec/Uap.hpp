#pragma once
// Uap.hpp – CAT62 User Application Profile: FRN ↔ item definition table.
//
// The table is immutable once constructed.  The built-in profile is
// available through UapTable::cat62(); alternate tables can be built from a
// list of DataItemDef or loaded from XML (see SpecLoader.hpp) and handed to
// a Codec by reference.

#include "Types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cat62 {

// Item ids of the built-in profile.
inline const std::string kItemDataSource   = "I062/010";
inline const std::string kItemTrackNumber  = "I062/040";
inline const std::string kItemTimeOfTrack  = "I062/070";
inline const std::string kItemWgs84        = "I062/105";
inline const std::string kItemVelocity     = "I062/185";
inline const std::string kItemFlightLevel  = "I062/136";
inline const std::string kItemRocd         = "I062/220";
inline const std::string kItemAircraftData = "I062/380";

class UapTable {
public:
    // Validates the definitions: FRNs ≥ 1 and unique, ids unique, element
    // widths summing to fixed_bytes.  Throws std::invalid_argument.
    explicit UapTable(std::vector<DataItemDef> items);

    // Process-wide built-in CAT62 profile, constructed on first use.
    [[nodiscard]] static const UapTable& cat62();

    [[nodiscard]] const DataItemDef* byFrn(unsigned frn) const noexcept;
    [[nodiscard]] const DataItemDef* byId(const std::string& id) const noexcept;
    [[nodiscard]] std::optional<unsigned> frnOf(const std::string& id) const noexcept;

    // Every definition, in ascending FRN order.
    [[nodiscard]] std::vector<const DataItemDef*> items() const;

    [[nodiscard]] size_t   size()   const noexcept { return by_frn_.size(); }
    [[nodiscard]] unsigned maxFrn() const noexcept;

    bool operator==(const UapTable& other) const { return by_frn_ == other.by_frn_; }

private:
    std::map<unsigned, DataItemDef>  by_frn_;
    std::map<std::string, unsigned>  frn_by_id_;
};

// FSPEC placement of an FRN: 0-based octet index and bit weight (0x80…0x02).
[[nodiscard]] constexpr size_t fspecOctet(unsigned frn) noexcept {
    return (frn - 1) / 7;
}
[[nodiscard]] constexpr uint8_t fspecBit(unsigned frn) noexcept {
    return static_cast<uint8_t>(1u << (7 - (frn - 1) % 7));
}

} // namespace cat62
