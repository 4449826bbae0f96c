#pragma once
// TimeOfDay.hpp – ISO-8601 ↔ seconds-since-midnight (UTC) conversion.
//
// I062/070 carries only the time of day; the calendar date has to come from
// elsewhere (a reference date, or today's UTC date).

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cat62 {

class TimeFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// "2026-02-21T09:48:00Z" → 35280.0.  Accepts 'T' or ' ' as separator,
// optional seconds and fractional seconds, and a 'Z' or ±HH:MM / ±HHMM
// offset; a timestamp without offset is taken as UTC.  The result is the
// UTC time of day in [0, 86400).
[[nodiscard]] double isoToSecondsSinceMidnight(std::string_view iso);

// 35280.0, "2026-02-21" → "2026-02-21T09:48:00Z".  Fractional seconds are
// printed as six digits when non-zero; values ≥ 86400 roll into the next
// day.  Without a reference date, today's UTC date is used.
[[nodiscard]] std::string secondsSinceMidnightToIso(
    double seconds, const std::optional<std::string>& reference_date = std::nullopt);

} // namespace cat62
