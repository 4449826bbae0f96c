// Uap.cpp – Built-in CAT62 UAP and table validation.
//
// CAT62 UAP (Edition 1.19, subset):
//   Octet 1: FRN1=010  FRN2=040  FRN3=070  FRN4=105  FRN5=100  FRN6=185  FRN7=210  FX
//   Octet 2: FRN8=060  FRN9=245  FRN10=380 FRN11=spare FRN12=136 FRN13=130 FRN14=220 FX

#include "Cat62Codec/Uap.hpp"
#include "Cat62Codec/FixedPoint.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace cat62 {

// ─── Builders for the built-in table ──────────────────────────────────────────

static ElementDef raw(std::string name, uint8_t bytes, uint64_t mask = 0) {
    ElementDef e;
    e.name     = std::move(name);
    e.bytes    = bytes;
    e.encoding = Encoding::Raw;
    e.mask     = mask;
    return e;
}

static ElementDef quantity(std::string name, uint8_t bytes, bool is_signed, double lsb) {
    ElementDef e;
    e.name     = std::move(name);
    e.bytes    = bytes;
    e.encoding = is_signed ? Encoding::SignedQuantity : Encoding::UnsignedQuantity;
    e.scale    = lsb;
    return e;
}

static DataItemDef fixed(std::string id, std::string title, unsigned frn, uint16_t bytes,
                         std::vector<ElementDef> elements = {}) {
    DataItemDef d;
    d.id          = std::move(id);
    d.name        = std::move(title);
    d.frn         = frn;
    d.type        = ItemType::Fixed;
    d.fixed_bytes = bytes;
    d.elements    = std::move(elements);
    return d;
}

static std::vector<DataItemDef> builtinItems() {
    std::vector<DataItemDef> v;
    v.push_back(fixed(kItemDataSource, "Data Source Identifier", 1, 2,
                      {raw("sac", 1), raw("sic", 1)}));
    v.push_back(fixed(kItemTrackNumber, "Track Number", 2, 2,
                      {raw("track_number", 2, 0x0FFF)}));
    v.push_back(fixed(kItemTimeOfTrack, "Time Of Track Information", 3, 3,
                      {quantity("time_of_track_seconds", 3, false, kTimeLsb)}));
    v.push_back(fixed(kItemWgs84, "Calculated Track Position (WGS-84)", 4, 8,
                      {quantity("lat", 4, true, kWgs84Lsb),
                       quantity("lon", 4, true, kWgs84Lsb)}));
    v.push_back(fixed("I062/100", "Calculated Track Position (Cartesian)", 5, 6));
    v.push_back(fixed(kItemVelocity, "Calculated Track Velocity (Cartesian)", 6, 4,
                      {quantity("vx", 2, true, kVelocityLsb),
                       quantity("vy", 2, true, kVelocityLsb)}));
    v.push_back(fixed("I062/210", "Calculated Acceleration (Cartesian)", 7, 4));
    v.push_back(fixed("I062/060", "Track Mode 3/A Code", 8, 2));
    v.push_back(fixed("I062/245", "Target Identification", 9, 7));

    DataItemDef adsb;
    adsb.id          = kItemAircraftData;
    adsb.name        = "Aircraft Derived Data";
    adsb.frn         = 10;
    adsb.type        = ItemType::Compound;
    adsb.fixed_bytes = 2;
    v.push_back(std::move(adsb));

    DataItemDef spare;
    spare.id   = "spare";
    spare.name = "Spare";
    spare.frn  = 11;
    spare.type = ItemType::Spare;
    v.push_back(std::move(spare));

    v.push_back(fixed(kItemFlightLevel, "Measured Flight Level", 12, 2,
                      {quantity("measured_flight_level", 2, true, kFlightLevelLsb)}));
    v.push_back(fixed("I062/130", "Calculated Track Geometric Altitude", 13, 2));
    v.push_back(fixed(kItemRocd, "Calculated Rate Of Climb/Descent", 14, 2,
                      {quantity("rocd", 2, true, kRocdLsb)}));
    return v;
}

// ─── UapTable ─────────────────────────────────────────────────────────────────

UapTable::UapTable(std::vector<DataItemDef> items) {
    for (auto& item : items) {
        if (item.frn == 0)
            throw std::invalid_argument("UAP item '" + item.id + "' has FRN 0");
        if (item.id.empty())
            throw std::invalid_argument("UAP item at FRN " + std::to_string(item.frn) +
                                        " has no id");
        if (by_frn_.count(item.frn))
            throw std::invalid_argument("UAP FRN " + std::to_string(item.frn) +
                                        " defined twice");
        if (frn_by_id_.count(item.id))
            throw std::invalid_argument("UAP item '" + item.id + "' defined twice");

        switch (item.type) {
        case ItemType::Fixed: {
            uint32_t total = 0;
            for (const auto& e : item.elements) {
                if (e.bytes < 1 || e.bytes > 4)
                    throw std::invalid_argument("UAP item '" + item.id + "' element '" +
                                                e.name + "' must be 1–4 bytes");
                total += e.bytes;
            }
            if (!item.elements.empty() && total != item.fixed_bytes)
                throw std::invalid_argument("UAP item '" + item.id + "' elements span " +
                                            std::to_string(total) + " byte(s), item is " +
                                            std::to_string(item.fixed_bytes));
            break;
        }
        case ItemType::Compound:
            if (item.fixed_bytes == 0)
                throw std::invalid_argument("UAP compound item '" + item.id +
                                            "' needs a primary subfield width");
            break;
        case ItemType::Spare:
            item.fixed_bytes = 0;
            break;
        }

        frn_by_id_[item.id] = item.frn;
        by_frn_[item.frn]   = std::move(item);
    }
}

const UapTable& UapTable::cat62() {
    static const UapTable table{builtinItems()};
    return table;
}

const DataItemDef* UapTable::byFrn(unsigned frn) const noexcept {
    auto it = by_frn_.find(frn);
    return it == by_frn_.end() ? nullptr : &it->second;
}

const DataItemDef* UapTable::byId(const std::string& id) const noexcept {
    auto it = frn_by_id_.find(id);
    return it == frn_by_id_.end() ? nullptr : byFrn(it->second);
}

std::optional<unsigned> UapTable::frnOf(const std::string& id) const noexcept {
    auto it = frn_by_id_.find(id);
    if (it == frn_by_id_.end()) return std::nullopt;
    return it->second;
}

std::vector<const DataItemDef*> UapTable::items() const {
    std::vector<const DataItemDef*> out;
    out.reserve(by_frn_.size());
    for (const auto& [frn, def] : by_frn_) out.push_back(&def);
    return out;
}

unsigned UapTable::maxFrn() const noexcept {
    return by_frn_.empty() ? 0 : by_frn_.rbegin()->first;
}

} // namespace cat62
