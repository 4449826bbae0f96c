// FixedPoint.cpp – Saturating fixed-point scalar codec.

#include "Cat62Codec/FixedPoint.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace cat62 {

static void checkWidth(const ScalarFormat& fmt) {
    if (fmt.width < 1 || fmt.width > 4)
        throw std::invalid_argument("ScalarFormat: width must be 1–4 bytes, got " +
                                    std::to_string(fmt.width));
}

int64_t rawMin(const ScalarFormat& fmt) {
    checkWidth(fmt);
    if (!fmt.is_signed) return 0;
    return -(int64_t{1} << (fmt.width * 8 - 1));
}

int64_t rawMax(const ScalarFormat& fmt) {
    checkWidth(fmt);
    if (!fmt.is_signed) return (int64_t{1} << (fmt.width * 8)) - 1;
    return (int64_t{1} << (fmt.width * 8 - 1)) - 1;
}

int64_t quantize(double value, const ScalarFormat& fmt) {
    checkWidth(fmt);
    const double scaled = std::round(value / fmt.lsb);
    if (std::isnan(scaled)) return 0;

    // Compare in floating point first so huge inputs never hit an
    // out-of-range double → integer conversion.
    const auto lo = rawMin(fmt);
    const auto hi = rawMax(fmt);
    if (scaled <= static_cast<double>(lo)) return lo;
    if (scaled >= static_cast<double>(hi)) return hi;
    return static_cast<int64_t>(scaled);
}

void encodeScalar(ByteWriter& out, double value, const ScalarFormat& fmt) {
    checkWidth(fmt);
    const int64_t raw = quantize(value, fmt);
    if (fmt.is_signed) out.writeS(raw, fmt.width);
    else               out.writeU(static_cast<uint64_t>(raw), fmt.width);
}

std::vector<uint8_t> encodeScalar(double value, const ScalarFormat& fmt) {
    ByteWriter bw;
    encodeScalar(bw, value, fmt);
    return bw.take();
}

double decodeScalar(std::span<const uint8_t> bytes, const ScalarFormat& fmt) {
    checkWidth(fmt);
    if (bytes.size() != fmt.width)
        throw std::invalid_argument("decodeScalar: expected " + std::to_string(fmt.width) +
                                    " byte(s), got " + std::to_string(bytes.size()));
    ByteReader br{bytes, 0, bytes.size()};
    return decodeScalar(br, fmt, "scalar");
}

double decodeScalar(ByteReader& in, const ScalarFormat& fmt, const std::string& item) {
    checkWidth(fmt);
    if (fmt.is_signed)
        return static_cast<double>(in.readS(fmt.width, item)) * fmt.lsb;
    return static_cast<double>(in.readU(fmt.width, item)) * fmt.lsb;
}

} // namespace cat62
