#pragma once
// Kinematics.hpp – Display quantities derived from I062/185 (Vx, Vy).
//
// Convention: vx = East component, vy = North component, both in m/s.

#include <cmath>

namespace cat62 {

// Ground speed in m/s.
[[nodiscard]] inline double groundSpeed(double vx, double vy) noexcept {
    return std::hypot(vx, vy);
}

// Track angle in degrees clockwise from true North, in [0, 360).
[[nodiscard]] inline double headingDegrees(double vx, double vy) noexcept {
    constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;
    double deg = std::atan2(vx, vy) * kRadToDeg;
    if (deg < 0.0) deg += 360.0;
    return deg >= 360.0 ? deg - 360.0 : deg;
}

} // namespace cat62
