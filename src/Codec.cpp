// Codec.cpp – CAT62 record and datablock encode/decode engine.
//
// Wire-format reminder:
//   Data Block  = [CAT 1B][LEN 2B][Record…]          LEN counts the header
//   Data Record = [FSPEC bytes][Item bytes…]         items in ascending FRN
//   FSPEC byte  = [FRN 7k+1 … FRN 7k+7 | FX]
//
// All multi-byte integers on the wire are big-endian.

#include "Cat62Codec/Codec.hpp"
#include "Cat62Codec/FixedPoint.hpp"
#include "Cat62Codec/Fspec.hpp"
#include "Cat62Codec/Log.hpp"

#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace cat62 {

// Items written by encodeRecord.
static const std::vector<std::string>& encodedItems() {
    static const std::vector<std::string> ids = {
        kItemDataSource, kItemTrackNumber, kItemTimeOfTrack, kItemWgs84,
        kItemVelocity,   kItemFlightLevel, kItemRocd,
    };
    return ids;
}

void Codec::setItemHandler(unsigned frn, ItemHandler handler) {
    if (handler) handlers_[frn] = std::move(handler);
    else         handlers_.erase(frn);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Item-level encode
// ─────────────────────────────────────────────────────────────────────────────

// Non-negative integer part of a raw-encoded value; negatives and NaN give 0.
static uint64_t rawValue(double v) {
    if (!(v > 0.0)) return 0;
    if (v >= static_cast<double>(std::numeric_limits<uint64_t>::max()))
        return std::numeric_limits<uint64_t>::max();
    return static_cast<uint64_t>(v);
}

void Codec::encodeItem(const DataItemDef& def,
                       const std::map<std::string, double>& values,
                       ByteWriter& out) const {
    if (def.type != ItemType::Fixed || !def.hasDecoder())
        throw std::invalid_argument("encodeItem: item " + def.id + " has no element layout");

    for (const auto& e : def.elements) {
        if (e.isSpare()) {
            out.writeU(0, e.bytes);
            continue;
        }
        double v = 0.0;
        auto it = values.find(e.name);
        if (it != values.end()) v = it->second;

        switch (e.encoding) {
        case Encoding::Raw: {
            // Narrowing, not clamping: only the masked bits are transmitted.
            const uint64_t width_mask = (uint64_t{1} << (e.bytes * 8)) - 1u;
            const uint64_t mask       = e.mask ? (e.mask & width_mask) : width_mask;
            out.writeU(rawValue(v) & mask, e.bytes);
            break;
        }
        case Encoding::UnsignedQuantity:
            encodeScalar(out, v, ScalarFormat{e.bytes, false, e.scale});
            break;
        case Encoding::SignedQuantity:
            encodeScalar(out, v, ScalarFormat{e.bytes, true, e.scale});
            break;
        case Encoding::Spare:
            break;
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Record-level encode
// ─────────────────────────────────────────────────────────────────────────────

std::vector<uint8_t> Codec::encodeRecord(const TrackReport& track) const {
    const std::map<std::string, double> values = {
        {"sac",                   static_cast<double>(track.sac)},
        {"sic",                   static_cast<double>(track.sic)},
        {"track_number",          static_cast<double>(track.track_number)},
        {"time_of_track_seconds", track.time_of_track_s},
        {"lat",                   track.lat},
        {"lon",                   track.lon},
        {"vx",                    track.vx},
        {"vy",                    track.vy},
        {"measured_flight_level", track.flight_level},
        {"rocd",                  track.rocd},
    };

    // Collect definitions keyed by FRN so items come out in UAP order.
    std::map<unsigned, const DataItemDef*> defs;
    for (const auto& id : encodedItems()) {
        const DataItemDef* def = uap_.byId(id);
        if (!def)
            throw std::invalid_argument("encodeRecord: UAP has no definition for " + id);
        defs[def->frn] = def;
    }

    std::set<unsigned> frns;
    for (const auto& [frn, def] : defs) frns.insert(frn);

    ByteWriter bw;
    const auto fspec = buildFspec(frns);
    bw.writeBytes(fspec);
    for (const auto& [frn, def] : defs)
        encodeItem(*def, values, bw);

    CAT62_LOG_DEBUG("Codec::encodeRecord", "TN=%u FSPEC=%s (%zu bytes)",
                    track.track_number & 0x0FFFu, toHex(fspec).c_str(), bw.size());
    return bw.take();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Datablock encode
// ─────────────────────────────────────────────────────────────────────────────

std::vector<uint8_t> Codec::encodeDatablock(const std::vector<std::vector<uint8_t>>& records) const {
    size_t payload = 0;
    for (const auto& r : records) payload += r.size();

    const size_t total = kHeaderBytes + payload;
    if (total > kMaxBlockLength) throw DatablockTooLarge(total);

    ByteWriter bw;
    bw.writeByte(kCategory);
    bw.writeU(total, 2);
    for (const auto& r : records) bw.writeBytes(r);
    return bw.take();
}

std::vector<uint8_t> Codec::encode(const std::vector<TrackReport>& tracks) const {
    std::vector<std::vector<uint8_t>> records;
    records.reserve(tracks.size());
    for (const auto& t : tracks) records.push_back(encodeRecord(t));

    auto block = encodeDatablock(records);
    CAT62_LOG_INFO("Codec::encode", "Assembled CAT62 datablock: %zu record(s), %zu bytes",
                   records.size(), block.size());
    return block;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Item-level decode
// ─────────────────────────────────────────────────────────────────────────────

static void decodeFixedElements(const DataItemDef& def, ByteReader& br, DecodedRecord& out) {
    // Check the whole item up front so the fault reports the item's first byte.
    br.require(def.fixed_bytes, def.id);

    for (const auto& e : def.elements) {
        switch (e.encoding) {
        case Encoding::Spare:
            br.skip(e.bytes, def.id);
            break;
        case Encoding::Raw: {
            uint64_t raw = br.readU(e.bytes, def.id);
            if (e.mask) raw &= e.mask;
            out.fields[e.name] = static_cast<double>(raw);
            break;
        }
        case Encoding::UnsignedQuantity:
            out.fields[e.name] = decodeScalar(br, ScalarFormat{e.bytes, false, e.scale}, def.id);
            break;
        case Encoding::SignedQuantity:
            out.fields[e.name] = decodeScalar(br, ScalarFormat{e.bytes, true, e.scale}, def.id);
            break;
        }
    }
}

ItemAction Codec::decodeItem(unsigned frn, ByteReader& br, DecodedRecord& out) const {
    const DataItemDef* def = uap_.byFrn(frn);

    if (auto h = handlers_.find(frn); h != handlers_.end())
        return h->second(frn, def, br, out);

    if (!def) {
        CAT62_LOG_WARNING("Codec::decodeItem",
                          "Unknown FRN %u at offset %zu; abandoning rest of record",
                          frn, br.position());
        out.unknown_frn = frn;
        return ItemAction::StopRecord;
    }

    switch (def->type) {

    // ── Spare slot: flagged in the FSPEC, no data bytes ─────────────────────
    case ItemType::Spare:
        break;

    // ── Compound: only the primary subfield is consumed ─────────────────────
    case ItemType::Compound: {
        const uint64_t psf = br.readU(def->fixed_bytes, def->id);
        out.undecoded_items.push_back(def->id);
        CAT62_LOG_WARNING("Codec::decodeItem", "%s present (PSF=0x%llX); sub-items not decoded",
                          def->id.c_str(), static_cast<unsigned long long>(psf));
        break;
    }

    // ── Fixed ────────────────────────────────────────────────────────────────
    case ItemType::Fixed:
        if (def->hasDecoder()) {
            decodeFixedElements(*def, br, out);
        } else {
            br.skip(def->fixed_bytes, def->id);
            CAT62_LOG_DEBUG("Codec::decodeItem", "%s skipped (%u bytes)",
                            def->id.c_str(), static_cast<unsigned>(def->fixed_bytes));
        }
        break;
    }
    return ItemAction::Continue;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Record-level decode
// ─────────────────────────────────────────────────────────────────────────────

DecodedRecord Codec::decodeRecord(std::span<const uint8_t> buf,
                                  size_t offset, size_t limit,
                                  size_t& next_offset) const {
    DecodedRecord rec;
    ByteReader br{buf, offset, limit};

    // ── Step 1: FSPEC ────────────────────────────────────────────────────────
    rec.frns      = parseFspec(br);
    rec.fspec_hex = toHex(br.consumedSince(offset));
    CAT62_LOG_DEBUG("Codec::decodeRecord", "Record at byte %zu | FSPEC=%s | %zu FRN(s)",
                    offset, rec.fspec_hex.c_str(), rec.frns.size());

    // ── Step 2: items in ascending FRN order ─────────────────────────────────
    for (unsigned frn : rec.frns) {
        if (decodeItem(frn, br, rec) == ItemAction::StopRecord) break;
    }

    next_offset = br.position();
    return rec;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Datablock decode
// ─────────────────────────────────────────────────────────────────────────────

DecodedBlock Codec::decode(std::span<const uint8_t> buf) const {
    if (buf.size() < kHeaderBytes)
        throw TruncatedDatablock(kHeaderBytes, buf.size());

    DecodedBlock block;
    block.cat = buf[0];
    if (block.cat != kCategory) throw WrongCategory(block.cat);

    block.length = static_cast<uint16_t>((buf[1] << 8) | buf[2]);
    if (block.length < kHeaderBytes || block.length > buf.size())
        throw TruncatedDatablock(block.length, buf.size());

    size_t pos = kHeaderBytes;
    while (pos < block.length) {
        size_t next = pos;
        block.records.push_back(decodeRecord(buf, pos, block.length, next));
        pos = next;
    }

    CAT62_LOG_INFO("Codec::decode", "Parsed %zu record(s) from %u-byte datablock",
                   block.records.size(), static_cast<unsigned>(block.length));
    return block;
}

} // namespace cat62
