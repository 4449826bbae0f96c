#pragma once
// FixedPoint.hpp – Physical value ↔ scaled integer conversion.
//
// Every numeric CAT62 field is one of a small closed set of formats:
// an unsigned or two's-complement integer, 1–4 bytes wide, whose one-step
// increment (the LSB) has a fixed physical value.  Encoding rounds to the
// nearest step and saturates at the limits of the format; it never wraps.

#include "ByteStream.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace cat62 {

struct ScalarFormat {
    uint8_t width{2};      // bytes on the wire, 1–4
    bool    is_signed{true};
    double  lsb{1.0};      // physical value of one raw step

    bool operator==(const ScalarFormat&) const = default;
};

// Common LSB values used by the CAT62 profile.
inline constexpr double kTimeLsb     = 1.0 / 128.0;                 // s
inline constexpr double kWgs84Lsb    = 180.0 / 33554432.0;          // deg, 180/2^25
inline constexpr double kVelocityLsb = 0.25;                        // m/s
inline constexpr double kFlightLevelLsb = 0.25;                     // FL
inline constexpr double kRocdLsb     = 6.25;                        // ft/min

// Smallest and largest raw value representable by the format.
// All functions below throw std::invalid_argument unless 1 <= width <= 4.
[[nodiscard]] int64_t rawMin(const ScalarFormat& fmt);
[[nodiscard]] int64_t rawMax(const ScalarFormat& fmt);

// round(value / lsb), saturated into [rawMin, rawMax].  NaN maps to 0.
[[nodiscard]] int64_t quantize(double value, const ScalarFormat& fmt);

// Encode one value, appending fmt.width bytes.
void encodeScalar(ByteWriter& out, double value, const ScalarFormat& fmt);
[[nodiscard]] std::vector<uint8_t> encodeScalar(double value, const ScalarFormat& fmt);

// raw × lsb, sign-extending for signed formats.  Requires bytes.size() == fmt.width.
[[nodiscard]] double decodeScalar(std::span<const uint8_t> bytes, const ScalarFormat& fmt);

// Read fmt.width bytes from the reader and scale them.
[[nodiscard]] double decodeScalar(ByteReader& in, const ScalarFormat& fmt,
                                  const std::string& item);

} // namespace cat62
