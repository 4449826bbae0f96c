#pragma once
// Codec.hpp – Public CAT62 encode / decode API.
//
// Usage example:
//   Codec codec;                              // built-in CAT62 UAP
//
//   // Encode two track reports into one datablock:
//   auto block = codec.encode({track_a, track_b});
//
//   // Decode a raw datablock:
//   DecodedBlock decoded = codec.decode(block);
//   double fl = decoded.records[0].fields.at("measured_flight_level");
//
// Structural faults (WrongCategory, TruncatedDatablock, TruncatedField) are
// thrown; see Errors.hpp.  An FRN absent from the UAP is not a fault: the
// record stops at that FRN and reports it in DecodedRecord::unknown_frn.

#include "ByteStream.hpp"
#include "Types.hpp"
#include "Uap.hpp"

#include <functional>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace cat62 {

// What the record decoder does after an item has been handled.
enum class ItemAction {
    Continue,   // go on with the next FRN of the record
    StopRecord, // abandon the remaining FRNs of this record
};

// Per-FRN decode hook.  `def` is null when the FRN is not in the UAP.
// The handler must advance `in` past the item's bytes; reads past the
// datablock limit throw TruncatedField as for the built-in dispatch.
using ItemHandler = std::function<ItemAction(unsigned frn, const DataItemDef* def,
                                             ByteReader& in, DecodedRecord& out)>;

class Codec {
public:
    // The table must outlive the codec.
    explicit Codec(const UapTable& uap = UapTable::cat62()) noexcept : uap_(uap) {}
    Codec(UapTable&&)       = delete;
    Codec(const UapTable&&) = delete;

    [[nodiscard]] const UapTable& uap() const noexcept { return uap_; }

    // Install a handler that replaces the built-in dispatch for one FRN.
    // Passing an empty handler restores the built-in behaviour.
    void setItemHandler(unsigned frn, ItemHandler handler);

    // ── Encode ───────────────────────────────────────────────────────────────
    // One record: FSPEC + I062/010, 040, 070, 105, 185, 136, 220 in FRN order.
    [[nodiscard]] std::vector<uint8_t> encodeRecord(const TrackReport& track) const;

    // [CAT=62][LEN 2B][records…].  Throws DatablockTooLarge past 65535 bytes.
    [[nodiscard]] std::vector<uint8_t>
    encodeDatablock(const std::vector<std::vector<uint8_t>>& records) const;

    // encodeRecord for each track, then encodeDatablock.
    [[nodiscard]] std::vector<uint8_t> encode(const std::vector<TrackReport>& tracks) const;

    // ── Decode ───────────────────────────────────────────────────────────────
    // Decode the record starting at `offset`; `limit` is the end of the
    // enclosing datablock (its declared length).  `next_offset` receives the
    // offset where decoding of this record stopped.
    [[nodiscard]] DecodedRecord decodeRecord(std::span<const uint8_t> buf,
                                             size_t offset, size_t limit,
                                             size_t& next_offset) const;

    // Decode a whole datablock.  The buffer must start at the CAT byte; bytes
    // beyond the declared length are ignored.
    [[nodiscard]] DecodedBlock decode(std::span<const uint8_t> buf) const;

private:
    const UapTable& uap_;
    std::map<unsigned, ItemHandler> handlers_;

    [[nodiscard]] ItemAction decodeItem(unsigned frn, ByteReader& in, DecodedRecord& out) const;

    void encodeItem(const DataItemDef& def,
                    const std::map<std::string, double>& values,
                    ByteWriter& out) const;
};

} // namespace cat62
