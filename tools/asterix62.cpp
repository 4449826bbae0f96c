// asterix62.cpp – Command-line CAT62 encoder / decoder.
//
// Usage:
//   asterix62 encode <plots.xml> <out.bin> [--verbose]
//   asterix62 decode <in.bin> [--date YYYY-MM-DD] [--uap <spec.xml>] [--verbose]
//
// encode reads a <Plots> document and writes one CAT62 datablock.
// decode prints every record of a datablock, with ground speed and heading
// derived from the velocity and an ISO time rebuilt from the reference date.

#include "Cat62Codec/Codec.hpp"
#include "Cat62Codec/Errors.hpp"
#include "Cat62Codec/Kinematics.hpp"
#include "Cat62Codec/Log.hpp"
#include "Cat62Codec/PlotLoader.hpp"
#include "Cat62Codec/SpecLoader.hpp"
#include "Cat62Codec/TimeOfDay.hpp"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

using namespace cat62;

static void usage() {
    std::cerr << "usage:\n"
                 "  asterix62 encode <plots.xml> <out.bin> [--verbose]\n"
                 "  asterix62 decode <in.bin> [--date YYYY-MM-DD] [--uap <spec.xml>] [--verbose]\n";
}

static std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open '" + path + "' for reading");
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

static void writeFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("cannot open '" + path + "' for writing");
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) throw std::runtime_error("failed writing '" + path + "'");
}

// ─── encode ───────────────────────────────────────────────────────────────────

static int runEncode(const std::string& in_path, const std::string& out_path) {
    const auto tracks = loadPlots(in_path);
    Codec codec;
    const auto block = codec.encode(tracks);
    writeFile(out_path, block);
    std::printf("Encoded %zu plot(s) into %zu bytes -> %s\n",
                tracks.size(), block.size(), out_path.c_str());
    return 0;
}

// ─── decode ───────────────────────────────────────────────────────────────────

static void printRecord(size_t index, const DecodedRecord& rec,
                        const std::optional<std::string>& date) {
    std::printf("Record %zu  FSPEC=%s\n", index, rec.fspec_hex.c_str());

    if (auto sac = rec.get("sac"), sic = rec.get("sic"); sac && sic)
        std::printf("  source        SAC=%.0f SIC=%.0f\n", *sac, *sic);
    if (auto tn = rec.get("track_number"))
        std::printf("  track number  %.0f\n", *tn);
    if (auto lat = rec.get("lat"), lon = rec.get("lon"); lat && lon)
        std::printf("  position      %.8f, %.8f deg\n", *lat, *lon);
    if (auto fl = rec.get("measured_flight_level"))
        std::printf("  flight level  FL%.2f\n", *fl);
    if (auto vx = rec.get("vx"), vy = rec.get("vy"); vx && vy) {
        std::printf("  velocity      vx=%.2f vy=%.2f m/s\n", *vx, *vy);
        std::printf("  ground speed  %.4f m/s  heading %.4f deg\n",
                    groundSpeed(*vx, *vy), headingDegrees(*vx, *vy));
    }
    if (auto rocd = rec.get("rocd"))
        std::printf("  climb/descent %.2f ft/min\n", *rocd);
    if (auto t = rec.get("time_of_track_seconds")) {
        std::printf("  time of track %.4f s  (%s)\n", *t,
                    secondsSinceMidnightToIso(*t, date).c_str());
    }
    for (const auto& id : rec.undecoded_items)
        std::printf("  %s present, not decoded\n", id.c_str());
    if (rec.unknown_frn)
        std::printf("  decoding stopped at unknown FRN %u\n", *rec.unknown_frn);
}

static int runDecode(const std::string& in_path, const std::optional<std::string>& date,
                     const std::optional<std::string>& uap_path) {
    // Reject a malformed reference date before any output is produced.
    if (date) (void)secondsSinceMidnightToIso(0.0, date);

    const auto raw = readFile(in_path);

    std::optional<UapTable> custom;
    if (uap_path) custom.emplace(loadSpec(*uap_path));
    Codec codec{custom ? *custom : UapTable::cat62()};

    const DecodedBlock block = codec.decode(raw);
    std::printf("CAT%u datablock, %u bytes, %zu record(s)\n",
                static_cast<unsigned>(block.cat), static_cast<unsigned>(block.length),
                block.records.size());
    for (size_t i = 0; i < block.records.size(); ++i)
        printRecord(i + 1, block.records[i], date);
    return 0;
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage();
        return 1;
    }

    const std::string command = argv[1];
    std::vector<std::string> positional;
    std::optional<std::string> date;
    std::optional<std::string> uap_path;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose") {
            log::setLevel(log::Level::Debug);
        } else if (arg == "--date" && i + 1 < argc) {
            date = argv[++i];
        } else if (arg == "--uap" && i + 1 < argc) {
            uap_path = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "unknown option: " << arg << '\n';
            usage();
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    try {
        if (command == "encode" && positional.size() == 2)
            return runEncode(positional[0], positional[1]);
        if (command == "decode" && positional.size() == 1)
            return runDecode(positional[0], date, uap_path);
    } catch (const CodecError& ex) {
        std::cerr << "error: " << ex.what() << " (offset " << ex.offset();
        if (!ex.item().empty()) std::cerr << ", item " << ex.item();
        std::cerr << ")\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "error: " << ex.what() << '\n';
        return 1;
    }

    usage();
    return 1;
}
