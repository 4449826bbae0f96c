#pragma once
// Types.hpp – Item metadata and decoded-value types for the CAT62 codec.
// All CAT62 data flows through these structures.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cat62 {

inline constexpr uint8_t  kCategory        = 62;
inline constexpr size_t   kHeaderBytes     = 3;
inline constexpr size_t   kMaxBlockLength  = 0xFFFF;

// ─── Encoding describes how raw bytes are interpreted ─────────────────────────
enum class Encoding {
    Raw,              // Unsigned integer, narrowed by the element mask
    UnsignedQuantity, // Physical value = scale × raw  [unit]
    SignedQuantity,   // Physical value = scale × twos_complement(raw)  [unit]
    Spare,            // Bytes to skip; no decoded output
};

// ─── Item structural type ─────────────────────────────────────────────────────
enum class ItemType {
    Fixed,    // Fixed byte-length; zero or more elements
    Compound, // PSF-driven optional sub-items (only the PSF is consumed)
    Spare,    // UAP slot without data bytes
};

// ─── A single leaf field inside a Data Item ───────────────────────────────────
struct ElementDef {
    std::string name;          // Decoded field name, e.g. "sac". Empty for spare.
    uint8_t     bytes{0};      // Byte width on the wire (1–4)
    Encoding    encoding{Encoding::Raw};
    double      scale{1.0};    // LSB value for quantity encodings
    uint64_t    mask{0};       // Raw encoding: significant bits (0 = whole width)

    [[nodiscard]] bool isSpare() const noexcept { return encoding == Encoding::Spare; }

    bool operator==(const ElementDef&) const = default;
};

// ─── Full definition of one Data Item ─────────────────────────────────────────
struct DataItemDef {
    std::string id;       // "I062/010"
    std::string name;     // Human-readable title
    unsigned    frn{0};   // 1-based Field Reference Number
    ItemType    type{ItemType::Fixed};

    // Fixed: element layout. Empty → the item has no decoder and is skipped.
    std::vector<ElementDef> elements;

    // Fixed: total byte length. Compound: primary subfield width.
    uint16_t fixed_bytes{0};

    [[nodiscard]] bool hasDecoder() const noexcept {
        for (const auto& e : elements)
            if (!e.isSpare()) return true;
        return false;
    }

    bool operator==(const DataItemDef&) const = default;
};

// ─── One aircraft snapshot, the input of a single encoded record ──────────────
struct TrackReport {
    uint8_t  sac{0};
    uint8_t  sic{0};
    uint32_t track_number{0};          // low 12 bits are transmitted
    double   time_of_track_s{0.0};     // seconds since midnight UTC
    double   lat{0.0};                 // WGS-84 degrees
    double   lon{0.0};
    double   vx{0.0};                  // m/s, positive East
    double   vy{0.0};                  // m/s, positive North
    double   flight_level{0.0};        // FL (hundreds of feet)
    double   rocd{0.0};                // ft/min, positive = climb
};

// ─── A fully decoded Data Record ──────────────────────────────────────────────
struct DecodedRecord {
    // Decoded field name → physical value ("lat", "vx", "track_number", …)
    std::map<std::string, double> fields;

    // Item ids present in the FSPEC whose content was not decoded (I062/380).
    std::vector<std::string> undecoded_items;

    std::vector<unsigned> frns;  // active FRNs as declared by the FSPEC
    std::string fspec_hex;       // upper-case hex of this record's FSPEC

    // FRN that stopped decoding of this record (absent from the UAP).
    std::optional<unsigned> unknown_frn;

    [[nodiscard]] bool complete() const noexcept { return !unknown_frn.has_value(); }

    [[nodiscard]] bool has(const std::string& field) const {
        return fields.count(field) != 0;
    }
    [[nodiscard]] std::optional<double> get(const std::string& field) const {
        auto it = fields.find(field);
        if (it == fields.end()) return std::nullopt;
        return it->second;
    }
};

// ─── A fully decoded Data Block ───────────────────────────────────────────────
struct DecodedBlock {
    uint8_t  cat{0};
    uint16_t length{0};                   // as read from the wire
    std::vector<DecodedRecord> records;
};

} // namespace cat62
