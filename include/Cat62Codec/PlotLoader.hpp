#pragma once
// PlotLoader.hpp – Reads a plots XML document into track reports.
//
//   <Plots sac="0" sic="1">
//     <Plot time_of_track="2026-02-21T09:48:00Z">
//       <Position lat="28.6139" lon="77.2090"/>
//       <FlightLevel value="100.0"/>
//       <Velocity vx="50.0" vy="100.0"/>
//       <Rocd value="500.0"/>
//     </Plot>
//   </Plots>
//
// Track numbers are assigned 1, 2, … in document order.

#include "Types.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace cat62 {

class PlotLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline constexpr uint8_t kDefaultSac = 0;
inline constexpr uint8_t kDefaultSic = 1;

// Throws PlotLoadError on parse failure, an empty plot list, or a plot with a
// missing / non-numeric value.
std::vector<TrackReport> loadPlots(const std::filesystem::path& xml_path);
std::vector<TrackReport> loadPlotsFromString(const std::string& xml);

} // namespace cat62
