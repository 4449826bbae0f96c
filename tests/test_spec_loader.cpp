// test_spec_loader.cpp – Tests for the CAT62 UAP table and its XML loader.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_spec_loader [path/to/CAT62.xml]

#include "Cat62Codec/Codec.hpp"
#include "Cat62Codec/FixedPoint.hpp"
#include "Cat62Codec/SpecLoader.hpp"
#include "Cat62Codec/Uap.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace cat62;

// ─── Utility ─────────────────────────────────────────────────────────────────

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

static bool rejects(const std::string& xml) {
    try {
        (void)loadSpecFromString(xml);
    } catch (const SpecLoadError& ex) {
        std::cout << "  rejected: " << ex.what() << '\n';
        return true;
    }
    return false;
}

static std::string wrap(const std::string& items) {
    return "<Category cat=\"62\"><DataItems>" + items + "</DataItems></Category>";
}

// A codec refers to its table: it can be built from a named table only,
// never from a temporary such as the result of loadSpecFromString().
static_assert(std::is_constructible_v<Codec, const UapTable&>);
static_assert(std::is_constructible_v<Codec, UapTable&>);
static_assert(!std::is_constructible_v<Codec, UapTable&&>);
static_assert(!std::is_constructible_v<Codec, const UapTable&&>);
static_assert(!std::is_constructible_v<Codec, UapTable>);

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: built-in table
// ─────────────────────────────────────────────────────────────────────────────
static void testBuiltinUap() {
    std::cout << "\n=== Test: built-in UAP ===\n";
    const UapTable& uap = UapTable::cat62();

    CHECK(uap.size() == 14,  "14 FRNs");
    CHECK(uap.maxFrn() == 14, "highest FRN is 14");
    CHECK(&uap == &UapTable::cat62(), "single shared instance");

    const std::vector<std::string> ids = {
        "I062/010", "I062/040", "I062/070", "I062/105", "I062/100", "I062/185", "I062/210",
        "I062/060", "I062/245", "I062/380", "spare",    "I062/136", "I062/130", "I062/220",
    };
    bool order_ok = true;
    const auto items = uap.items();
    for (size_t i = 0; i < items.size() && i < ids.size(); ++i)
        if (items[i]->frn != i + 1 || items[i]->id != ids[i]) order_ok = false;
    CHECK(order_ok && items.size() == ids.size(), "FRN 1–14 in UAP order");

    CHECK(uap.byFrn(15) == nullptr && uap.byFrn(0) == nullptr, "FRN 0 and 15 undefined");
    CHECK(uap.frnOf(kItemRocd) == 14u,                       "I062/220 at FRN 14");
    CHECK(!uap.frnOf("I062/999").has_value(),                "unknown id has no FRN");

    const DataItemDef* i100 = uap.byId("I062/100");
    CHECK(i100 && i100->fixed_bytes == 6 && !i100->hasDecoder(), "I062/100 skip-only, 6 bytes");
    const DataItemDef* i245 = uap.byId("I062/245");
    CHECK(i245 && i245->fixed_bytes == 7,                      "I062/245 7 bytes");
    const DataItemDef* i380 = uap.byId(kItemAircraftData);
    CHECK(i380 && i380->type == ItemType::Compound && i380->fixed_bytes == 2,
          "I062/380 compound, 2-byte PSF");
    const DataItemDef* spare = uap.byFrn(11);
    CHECK(spare && spare->type == ItemType::Spare && spare->fixed_bytes == 0,
          "FRN 11 spare, no bytes");

    const DataItemDef* i040 = uap.byId(kItemTrackNumber);
    CHECK(i040 && i040->elements.size() == 1 && i040->elements[0].mask == 0x0FFF,
          "track number masked to 12 bits");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: table validation
// ─────────────────────────────────────────────────────────────────────────────
static void testValidation() {
    std::cout << "\n=== Test: UAP validation ===\n";

    auto item = [](std::string id, unsigned frn, uint16_t bytes) {
        DataItemDef d;
        d.id          = std::move(id);
        d.frn         = frn;
        d.fixed_bytes = bytes;
        return d;
    };
    auto invalid = [](std::vector<DataItemDef> v) {
        try { UapTable t{std::move(v)}; }
        catch (const std::invalid_argument&) { return true; }
        return false;
    };

    CHECK(invalid({item("A", 0, 1)}),                   "FRN 0 rejected");
    CHECK(invalid({item("A", 1, 1), item("B", 1, 1)}),  "duplicate FRN rejected");
    CHECK(invalid({item("A", 1, 1), item("A", 2, 1)}),  "duplicate id rejected");

    DataItemDef wide = item("W", 1, 3);
    wide.elements.push_back(ElementDef{"x", 2, Encoding::Raw});
    CHECK(invalid({wide}),                              "element widths must sum to item");

    DataItemDef psf = item("C", 1, 0);
    psf.type = ItemType::Compound;
    CHECK(invalid({psf}),                               "compound needs a PSF width");

    CHECK(!invalid({item("A", 1, 2), item("B", 20, 4)}), "sparse FRNs accepted");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: the shipped XML matches the built-in table
// ─────────────────────────────────────────────────────────────────────────────
static void testShippedSpec(const fs::path& spec_path) {
    std::cout << "\n=== Test: shipped CAT62.xml ===\n";
    try {
        const UapTable loaded = loadSpec(spec_path);
        CHECK(loaded.size() == 14, "14 items loaded");
        CHECK(loaded.byId(kItemWgs84) &&
              loaded.byId(kItemWgs84)->elements[0].scale == kWgs84Lsb,
              "ratio scale 180/33554432 parsed exactly");
        CHECK(loaded == UapTable::cat62(), "loaded table equals built-in table");

        // A codec over the loaded table produces the same bytes
        TrackReport t;
        t.sic             = 7;
        t.track_number    = 42;
        t.time_of_track_s = 1234.5;
        t.lat             = -33.8688;
        t.lon             = 151.2093;
        t.flight_level    = 320.0;
        t.vx              = -12.25;
        t.vy              = 230.0;
        t.rocd            = -1000.0;
        CHECK(Codec{loaded}.encodeRecord(t) == Codec{}.encodeRecord(t),
              "loaded and built-in codecs agree");
    } catch (const std::exception& ex) {
        std::cerr << "  " << ex.what() << '\n';
        CHECK(false, "shipped spec loads");
    }

    bool threw = false;
    try { (void)loadSpec(spec_path.parent_path() / "does_not_exist.xml"); }
    catch (const SpecLoadError&) { threw = true; }
    CHECK(threw, "missing file → SpecLoadError");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: custom tables from XML
// ─────────────────────────────────────────────────────────────────────────────
static void testCustomSpec() {
    std::cout << "\n=== Test: custom UAP from XML ===\n";

    // Extends the profile with a decoded Mode 3/A code at FRN 8
    const std::string xml = wrap(
        "<DataItem id=\"I062/010\" frn=\"1\"><Fixed>"
        "  <Element name=\"sac\" bytes=\"1\"/><Element name=\"sic\" bytes=\"1\"/>"
        "</Fixed></DataItem>"
        "<DataItem id=\"I062/060\" frn=\"8\"><Fixed>"
        "  <Element name=\"mode3a\" bytes=\"2\" encoding=\"raw\" mask=\"0x0FFF\"/>"
        "</Fixed></DataItem>");

    const UapTable uap = loadSpecFromString(xml);
    CHECK(uap.size() == 2, "two items");

    const Codec codec{uap};
    const std::vector<uint8_t> rec = {0x81, 0x80, 0x00, 0x01, 0xF7, 0xFF};
    size_t next = 0;
    const DecodedRecord d = codec.decodeRecord(rec, 0, rec.size(), next);
    CHECK(d.get("mode3a") == 0x7FF, "Mode 3/A decoded and masked");
    CHECK(next == rec.size(),       "record consumed");

    // Element with an inner spare
    const UapTable padded = loadSpecFromString(wrap(
        "<DataItem id=\"X\" frn=\"1\"><Fixed>"
        "  <Spare bytes=\"1\"/>"
        "  <Element name=\"v\" bytes=\"2\" encoding=\"unsigned_quantity\" scale=\"1/4\"/>"
        "</Fixed></DataItem>"));
    CHECK(padded.byFrn(1)->fixed_bytes == 3, "inner spare counted in width");

    CHECK(rejects("<Category cat=\"48\"><DataItems/></Category>"), "other category");
    CHECK(rejects("<NotACategory/>"),                              "wrong root");
    CHECK(rejects("<Category cat=\"62\"><DataItems>"),             "malformed XML");
    CHECK(rejects(wrap("")),                                       "no items");
    CHECK(rejects(wrap("<DataItem id=\"A\" frn=\"1\"><Fixed>"
                       "<Element name=\"x\" bytes=\"5\"/></Fixed></DataItem>")),
          "5-byte element");
    CHECK(rejects(wrap("<DataItem id=\"A\" frn=\"1\"><Fixed>"
                       "<Element name=\"x\" bytes=\"2\" encoding=\"float\"/></Fixed></DataItem>")),
          "unknown encoding");
    CHECK(rejects(wrap("<DataItem id=\"A\" frn=\"1\"><Fixed bytes=\"3\">"
                       "<Element name=\"x\" bytes=\"2\"/></Fixed></DataItem>")),
          "declared width disagrees with elements");
    CHECK(rejects(wrap("<DataItem id=\"A\" frn=\"1\"><Fixed bytes=\"2\"/></DataItem>"
                       "<DataItem id=\"B\" frn=\"1\"><Fixed bytes=\"2\"/></DataItem>")),
          "duplicate FRN");
    CHECK(rejects(wrap("<DataItem id=\"A\"><Fixed bytes=\"2\"/></DataItem>")), "missing frn");
    CHECK(rejects(wrap("<DataItem id=\"A\" frn=\"1\"><Fixed>"
                       "<Element name=\"x\" bytes=\"2\" encoding=\"signed_quantity\""
                       " scale=\"1/0\"/></Fixed></DataItem>")),
          "zero denominator");
    CHECK(rejects(wrap("<DataItem id=\"A\" frn=\"1\"><Repetitive/></DataItem>")),
          "unsupported item type");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    fs::path spec_path = (argc > 1)
        ? fs::path(argv[1])
        : fs::path(__FILE__).parent_path().parent_path() / "specs" / "CAT62.xml";

    std::cout << "Using spec: " << spec_path << '\n';

    testBuiltinUap();
    testValidation();
    testShippedSpec(spec_path);
    testCustomSpec();

    std::cout << "\n=== Summary: " << failures << " failure(s) ===\n";
    return failures == 0 ? 0 : 1;
}
