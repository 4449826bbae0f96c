// PlotLoader.cpp – Plots XML → TrackReport list (pugixml).

#include "Cat62Codec/PlotLoader.hpp"
#include "Cat62Codec/Log.hpp"
#include "Cat62Codec/TimeOfDay.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace cat62 {

// ─── Field extraction ─────────────────────────────────────────────────────────

static double requireNumber(pugi::xml_node plot, size_t index,
                            const char* child, const char* attr) {
    const std::string where = "Plot " + std::to_string(index) + ": ";
    pugi::xml_node node = plot.child(child);
    if (!node)
        throw PlotLoadError(where + "missing required element <" + child + ">");
    pugi::xml_attribute a = node.attribute(attr);
    if (!a)
        throw PlotLoadError(where + "<" + child + "> is missing required attribute '" +
                            attr + "'");

    const char* s = a.as_string();
    char* end     = nullptr;
    const double v = std::strtod(s, &end);
    if (end == s || *end != '\0' || !std::isfinite(v))
        throw PlotLoadError(where + "<" + child + " " + attr + "> must be numeric, got '" +
                            s + "'");
    return v;
}

static uint8_t parseSiteCode(pugi::xml_node root, const char* attr, uint8_t fallback) {
    pugi::xml_attribute a = root.attribute(attr);
    if (!a) return fallback;

    const char* s   = a.as_string();
    const char* end = s + std::strlen(s);
    unsigned v = 0;
    auto [ptr, ec] = std::from_chars(s, end, v);
    if (ec != std::errc{} || ptr != end || s == end || v > 255)
        throw PlotLoadError(std::string("<Plots ") + attr + "> must be an integer 0–255, got '" +
                            s + "'");
    return static_cast<uint8_t>(v);
}

// ─── Document → track reports ─────────────────────────────────────────────────

static std::vector<TrackReport> extractPlots(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("Plots");
    if (!root)
        throw PlotLoadError("Input document does not contain a <Plots> element");

    const uint8_t sac = parseSiteCode(root, "sac", kDefaultSac);
    const uint8_t sic = parseSiteCode(root, "sic", kDefaultSic);

    std::vector<TrackReport> out;
    size_t index = 0;
    for (auto plot : root.children("Plot")) {
        ++index;
        TrackReport t;
        t.sac          = sac;
        t.sic          = sic;
        t.track_number = static_cast<uint32_t>(index);
        t.lat          = requireNumber(plot, index, "Position", "lat");
        t.lon          = requireNumber(plot, index, "Position", "lon");
        t.flight_level = requireNumber(plot, index, "FlightLevel", "value");
        t.vx           = requireNumber(plot, index, "Velocity", "vx");
        t.vy           = requireNumber(plot, index, "Velocity", "vy");
        t.rocd         = requireNumber(plot, index, "Rocd", "value");

        pugi::xml_attribute tot = plot.attribute("time_of_track");
        if (!tot)
            throw PlotLoadError("Plot " + std::to_string(index) +
                                ": missing required attribute 'time_of_track'");
        try {
            t.time_of_track_s = isoToSecondsSinceMidnight(tot.as_string());
        } catch (const TimeFormatError& ex) {
            throw PlotLoadError("Plot " + std::to_string(index) + ": " + ex.what());
        }

        CAT62_LOG_DEBUG("PlotLoader", "Plot TN=%zu lat=%.6f lon=%.6f FL=%.1f vx=%.2f vy=%.2f "
                        "rocd=%.1f time_s=%.3f", index, t.lat, t.lon, t.flight_level,
                        t.vx, t.vy, t.rocd, t.time_of_track_s);
        out.push_back(t);
    }

    if (out.empty())
        throw PlotLoadError("<Plots> must contain at least one <Plot>");
    return out;
}

std::vector<TrackReport> loadPlots(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw PlotLoadError("Failed to parse XML '" + xml_path.string() +
                            "': " + result.description());
    return extractPlots(doc);
}

std::vector<TrackReport> loadPlotsFromString(const std::string& xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_string(xml.c_str());
    if (!result)
        throw PlotLoadError(std::string("Failed to parse XML: ") + result.description());
    return extractPlots(doc);
}

} // namespace cat62
