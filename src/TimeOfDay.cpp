// TimeOfDay.cpp – ISO-8601 timestamp helpers for I062/070.

#include "Cat62Codec/TimeOfDay.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdio>

namespace cat62 {

namespace chr = std::chrono;

namespace {

constexpr double  kSecondsPerDay = 86400.0;
constexpr int64_t kMicrosPerDay  = int64_t{86400} * 1000000;

// Cursor over the input with fixed-width digit reads.
struct Cursor {
    std::string_view s;
    std::string_view whole;
    size_t pos{0};

    [[noreturn]] void fail(const char* what) const {
        throw TimeFormatError("Invalid ISO-8601 timestamp '" + std::string(whole) +
                              "': " + what);
    }

    bool atEnd() const { return pos >= s.size(); }
    char peek() const { return atEnd() ? '\0' : s[pos]; }

    int digits(size_t n, const char* what) {
        if (pos + n > s.size()) fail(what);
        int v = 0;
        auto [ptr, ec] = std::from_chars(s.data() + pos, s.data() + pos + n, v);
        if (ec != std::errc{} || ptr != s.data() + pos + n) fail(what);
        pos += n;
        return v;
    }

    void expect(char c, const char* what) {
        if (peek() != c) fail(what);
        ++pos;
    }
};

chr::year_month_day parseDate(Cursor& c) {
    const int      y = c.digits(4, "expected YYYY");
    c.expect('-', "expected '-' after year");
    const unsigned m = static_cast<unsigned>(c.digits(2, "expected MM"));
    c.expect('-', "expected '-' after month");
    const unsigned d = static_cast<unsigned>(c.digits(2, "expected DD"));

    const chr::year_month_day ymd{chr::year{y}, chr::month{m}, chr::day{d}};
    if (!ymd.ok()) c.fail("date out of range");
    return ymd;
}

} // namespace

double isoToSecondsSinceMidnight(std::string_view iso) {
    Cursor c{iso, iso};
    (void)parseDate(c);

    if (c.peek() != 'T' && c.peek() != 't' && c.peek() != ' ')
        c.fail("expected 'T' between date and time");
    ++c.pos;

    const int hh = c.digits(2, "expected hh");
    c.expect(':', "expected ':' after hour");
    const int mm = c.digits(2, "expected mm");

    double ss = 0.0;
    if (c.peek() == ':') {
        ++c.pos;
        ss = c.digits(2, "expected ss");
        if (c.peek() == '.' || c.peek() == ',') {
            ++c.pos;
            const size_t start = c.pos;
            double scale = 0.1;
            while (!c.atEnd() && c.peek() >= '0' && c.peek() <= '9') {
                ss += (c.peek() - '0') * scale;
                scale /= 10.0;
                ++c.pos;
            }
            if (c.pos == start) c.fail("empty fractional seconds");
        }
    }
    if (hh > 23 || mm > 59 || ss >= 61.0) c.fail("time of day out of range");

    int offset_s = 0;
    if (c.peek() == 'Z' || c.peek() == 'z') {
        ++c.pos;
    } else if (c.peek() == '+' || c.peek() == '-') {
        const int sign = c.peek() == '-' ? -1 : 1;
        ++c.pos;
        const int oh = c.digits(2, "expected offset hours");
        if (c.peek() == ':') ++c.pos;
        const int om = c.digits(2, "expected offset minutes");
        if (oh > 23 || om > 59) c.fail("UTC offset out of range");
        offset_s = sign * (oh * 3600 + om * 60);
    }
    if (!c.atEnd()) c.fail("trailing characters");

    double t = hh * 3600.0 + mm * 60.0 + ss - offset_s;
    t = std::fmod(t, kSecondsPerDay);
    if (t < 0.0) t += kSecondsPerDay;
    return t;
}

std::string secondsSinceMidnightToIso(double seconds,
                                      const std::optional<std::string>& reference_date) {
    if (!std::isfinite(seconds))
        throw TimeFormatError("Time of day is not a finite number");

    chr::sys_days base;
    if (reference_date) {
        Cursor c{*reference_date, *reference_date};
        const auto ymd = parseDate(c);
        if (!c.atEnd()) c.fail("reference date must be YYYY-MM-DD");
        base = chr::sys_days{ymd};
    } else {
        base = chr::floor<chr::days>(chr::system_clock::now());
    }

    // Work in whole microseconds; floor division keeps negatives on the
    // previous day.
    const int64_t total = std::llround(seconds * 1e6);
    int64_t day_shift   = total / kMicrosPerDay;
    int64_t in_day      = total % kMicrosPerDay;
    if (in_day < 0) {
        in_day += kMicrosPerDay;
        --day_shift;
    }

    const chr::year_month_day ymd{base + chr::days{day_shift}};
    const int64_t secs   = in_day / 1000000;
    const int64_t micros = in_day % 1000000;

    char buf[48];
    int n = std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d",
                          static_cast<int>(ymd.year()),
                          static_cast<unsigned>(ymd.month()),
                          static_cast<unsigned>(ymd.day()),
                          static_cast<int>(secs / 3600),
                          static_cast<int>((secs / 60) % 60),
                          static_cast<int>(secs % 60));
    std::string out(buf, static_cast<size_t>(n));
    if (micros != 0) {
        n = std::snprintf(buf, sizeof(buf), ".%06d", static_cast<int>(micros));
        out.append(buf, static_cast<size_t>(n));
    }
    out.push_back('Z');
    return out;
}

} // namespace cat62
