// test_datablock.cpp – Tests for CAT62 datablock framing and multi-record decode.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_datablock

#include "Cat62Codec/Codec.hpp"
#include "Cat62Codec/Errors.hpp"
#include "Cat62Codec/FixedPoint.hpp"
#include "Cat62Codec/Log.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

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

static bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

using Bytes = std::vector<uint8_t>;

static TrackReport makeTrack(uint32_t tn, double t, double lat, double lon, double fl,
                             double vx, double vy, double rocd) {
    TrackReport r;
    r.sac             = 0;
    r.sic             = 1;
    r.track_number    = tn;
    r.time_of_track_s = t;
    r.lat             = lat;
    r.lon             = lon;
    r.flight_level    = fl;
    r.vx              = vx;
    r.vy              = vy;
    r.rocd            = rocd;
    return r;
}

static const std::vector<TrackReport>& sampleTracks() {
    static const std::vector<TrackReport> tracks = {
        makeTrack(1, 35280.0, 28.6139, 77.2090, 100.0,  50.0,  100.0,   500.0),
        makeTrack(2, 51735.5, 19.0760, 72.8777, 350.0, -75.5,  200.25, -312.5),
    };
    return tracks;
}

// Expects `fn` to throw E; returns the caught exception through `out`.
template <typename E, typename Fn>
static bool throwsAs(Fn&& fn, E* out = nullptr) {
    try {
        fn();
    } catch (const E& ex) {
        if (out) *out = ex;
        return true;
    } catch (const std::exception& ex) {
        std::cerr << "  unexpected exception: " << ex.what() << '\n';
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: header layout
// ─────────────────────────────────────────────────────────────────────────────
static void testHeader() {
    std::cout << "\n=== Test: datablock header ===\n";
    Codec codec;

    const Bytes one = codec.encode({sampleTracks()[0]});
    CHECK(one.size() == 28,                              "one record → 28 bytes");
    CHECK(one[0] == 0x3E,                                "CAT = 0x3E");
    CHECK(one[1] == 0x00 && one[2] == 0x1C,              "LEN = 0x001C, header included");
    CHECK(one[3] == 0xF5 && one[4] == 0x0A,              "record starts after header");

    const Bytes two = codec.encode(sampleTracks());
    CHECK(two.size() == 53,                              "two records → 53 bytes");
    CHECK(((two[1] << 8) | two[2]) == 53,                "LEN equals byte count");

    const Bytes empty = codec.encodeDatablock({});
    CHECK(empty == Bytes({0x3E, 0x00, 0x03}),            "no records → 3E 00 03");
    CHECK(codec.decode(empty).records.empty(),           "empty block decodes to nothing");

    const Bytes manual = codec.encodeDatablock({codec.encodeRecord(sampleTracks()[0]),
                                                codec.encodeRecord(sampleTracks()[1])});
    CHECK(manual == two, "encode == encodeDatablock(encodeRecord…)");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: multi-record round-trip
// ─────────────────────────────────────────────────────────────────────────────
static void testRoundTrip() {
    std::cout << "\n=== Test: two-track round-trip ===\n";
    Codec codec;
    const Bytes block = codec.encode(sampleTracks());
    const DecodedBlock d = codec.decode(block);

    CHECK(d.cat == 62 && d.length == 53, "header decoded");
    CHECK(d.records.size() == 2,         "two records");
    if (d.records.size() != 2) return;

    for (size_t i = 0; i < 2; ++i) {
        const auto& in  = sampleTracks()[i];
        const auto& out = d.records[i];
        const std::string tag = "track " + std::to_string(i + 1) + ": ";
        CHECK(out.get("track_number") == static_cast<double>(in.track_number), tag + "TN");
        CHECK(out.get("time_of_track_seconds") == in.time_of_track_s,       tag + "ToT");
        CHECK(near(*out.get("lat"), in.lat, kWgs84Lsb / 2) &&
              near(*out.get("lon"), in.lon, kWgs84Lsb / 2),                 tag + "position");
        CHECK(out.get("measured_flight_level") == in.flight_level,          tag + "FL");
        CHECK(out.get("vx") == in.vx && out.get("vy") == in.vy,             tag + "velocity");
        CHECK(out.get("rocd") == in.rocd,                                   tag + "rocd");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: header faults
// ─────────────────────────────────────────────────────────────────────────────
static void testHeaderFaults() {
    std::cout << "\n=== Test: header faults ===\n";
    Codec codec;

    WrongCategory wc{0};
    CHECK(throwsAs<WrongCategory>([&] { (void)codec.decode(Bytes{0x30, 0x00, 0x03}); }, &wc) &&
          wc.found() == 48, "CAT48 rejected with found() == 48");

    CHECK(throwsAs<TruncatedDatablock>([&] { (void)codec.decode(Bytes{0x3E, 0x00}); }),
          "2-byte buffer rejected");
    CHECK(throwsAs<TruncatedDatablock>([&] { (void)codec.decode(Bytes{}); }),
          "empty buffer rejected");

    TruncatedDatablock td{0, 0};
    CHECK(throwsAs<TruncatedDatablock>(
              [&] { (void)codec.decode(Bytes{0x3E, 0x00, 0x20, 0x80, 0x00, 0x01}); }, &td) &&
          td.declared() == 32 && td.available() == 6,
          "LEN beyond buffer rejected");
    CHECK(throwsAs<TruncatedDatablock>([&] { (void)codec.decode(Bytes{0x3E, 0x00, 0x02}); }),
          "LEN below header size rejected");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: the declared length bounds every read
// ─────────────────────────────────────────────────────────────────────────────
static void testLengthBoundary() {
    std::cout << "\n=== Test: declared length boundary ===\n";
    Codec codec;

    // Trailing bytes after LEN are not part of the block
    Bytes padded = codec.encode({sampleTracks()[0]});
    padded.insert(padded.end(), {0xF5, 0x0A, 0xDE, 0xAD});
    const DecodedBlock d = codec.decode(padded);
    CHECK(d.records.size() == 1, "bytes after LEN ignored");

    // LEN shortened into the middle of I062/136: the item is truncated even
    // though the buffer still holds its bytes
    Bytes shortened = codec.encode({sampleTracks()[0]});
    shortened[2] = 0x19;                           // 25: ends inside I062/136 (offsets 24-25)
    TruncatedField tf{"", 0, 0, 0};
    CHECK(throwsAs<TruncatedField>([&] { (void)codec.decode(shortened); }, &tf) &&
          tf.item() == kItemFlightLevel && tf.offset() == 24,
          "item crossing LEN → TruncatedField(I062/136, 24)");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: an unknown FRN only stops its own record
// ─────────────────────────────────────────────────────────────────────────────
static void testUnknownFrnThenValid() {
    std::cout << "\n=== Test: unknown FRN followed by a valid record ===\n";
    Codec codec;

    const Bytes bad  = {0x81, 0x01, 0x80, 0x00, 0x01};   // FRN 1 + FRN 15
    const Bytes good = codec.encodeRecord(sampleTracks()[1]);
    const Bytes block = codec.encodeDatablock({bad, good});

    const DecodedBlock d = codec.decode(block);
    CHECK(d.records.size() == 2,                       "both records returned");
    if (d.records.size() != 2) return;
    CHECK(d.records[0].unknown_frn == 15u,             "first record stopped at FRN 15");
    CHECK(d.records[0].get("sic") == 1.0,              "first record kept I062/010");
    CHECK(d.records[1].complete(),                     "second record complete");
    CHECK(d.records[1].get("track_number") == 2.0,     "second record decoded");
    CHECK(d.records[1].get("rocd") == -312.5,          "second record rocd");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 6: 16-bit length overflow
// ─────────────────────────────────────────────────────────────────────────────
static void testTooLarge() {
    std::cout << "\n=== Test: datablock too large ===\n";
    Codec codec;

    const Bytes at_limit = codec.encodeDatablock({Bytes(65532, 0x00)});
    CHECK(at_limit.size() == 65535 && at_limit[1] == 0xFF && at_limit[2] == 0xFF,
          "65535-byte block accepted");

    DatablockTooLarge big{0};
    CHECK(throwsAs<DatablockTooLarge>(
              [&] { (void)codec.encodeDatablock({Bytes(65533, 0x00)}); }, &big) &&
          big.offset() == 65536,
          "65536-byte block rejected");

    // 2622 records × 25 bytes + 3 = 65553
    const std::vector<TrackReport> many(2622, sampleTracks()[0]);
    CHECK(throwsAs<DatablockTooLarge>([&] { (void)codec.encode(many); }),
          "too many tracks rejected");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    log::setLevel(log::Level::Error);

    testHeader();
    testRoundTrip();
    testHeaderFaults();
    testLengthBoundary();
    testUnknownFrnThenValid();
    testTooLarge();

    std::cout << "\n=== Summary: " << failures << " failure(s) ===\n";
    return failures == 0 ? 0 : 1;
}
