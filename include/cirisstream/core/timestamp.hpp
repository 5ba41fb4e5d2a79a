#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <cstdio>
#include <cctype>

namespace cirisstream::core {

// ============================================================================
// Timestamp type (always UTC)
// ============================================================================
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

[[nodiscard]]
inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
}

namespace detail {

// Fixed-width unsigned decimal field. No sign, no whitespace.
[[nodiscard]]
inline bool parse_digits(std::string_view sv, int& out) noexcept {
    if (sv.empty()) return false;
    int v = 0;
    for (char c : sv) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

} // namespace detail


// ============================================================================
// ISO-8601 / RFC3339 parser
//
// Supports:
//   YYYY-MM-DDTHH:MM:SS[.fraction]Z
//   YYYY-MM-DDTHH:MM:SS[.fraction]+HH:MM    (also +HHMM)
//   YYYY-MM-DDTHH:MM:SS[.fraction]-HH:MM    (also -HHMM)
//   YYYY-MM-DDTHH:MM:SS[.fraction]          (no designator, taken as UTC)
//
// Offsets are applied so the result is normalized to UTC.
// Fractions beyond nanosecond precision are truncated.
// ============================================================================
[[nodiscard]] inline bool parse_iso8601(std::string_view sv, Timestamp& out) noexcept {
    using namespace std::chrono;

    // Minimum length: "YYYY-MM-DDTHH:MM:SS"
    if (sv.size() < 19) return false;

    int year = 0, mon = 0, day = 0;
    if (!detail::parse_digits(sv.substr(0, 4), year)) return false;
    if (sv[4] != '-') return false;
    if (!detail::parse_digits(sv.substr(5, 2), mon)) return false;
    if (sv[7] != '-') return false;
    if (!detail::parse_digits(sv.substr(8, 2), day)) return false;

    if (sv[10] != 'T' && sv[10] != 't' && sv[10] != ' ') return false;

    int hour = 0, minute = 0, sec = 0;
    if (!detail::parse_digits(sv.substr(11, 2), hour)) return false;
    if (sv[13] != ':') return false;
    if (!detail::parse_digits(sv.substr(14, 2), minute)) return false;
    if (sv[16] != ':') return false;
    if (!detail::parse_digits(sv.substr(17, 2), sec)) return false;
    if (hour > 23 || minute > 59 || sec > 60) return false;

    // ---- Fractional seconds (optional) ----
    nanoseconds extra_ns{0};
    std::size_t pos = 19;
    if (pos < sv.size() && sv[pos] == '.') {
        const std::size_t start = ++pos;
        long long frac = 0;
        std::size_t digits = 0;
        while (pos < sv.size() && std::isdigit(static_cast<unsigned char>(sv[pos]))) {
            if (digits < 9) {
                frac = frac * 10 + (sv[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == start) return false;
        for (; digits < 9; ++digits) frac *= 10;
        extra_ns = nanoseconds(frac);
    }

    // ---- Time-zone designator (optional) ----
    minutes offset{0};
    if (pos == sv.size()) {
        // Naive timestamp
    }
    else if (sv[pos] == 'Z' || sv[pos] == 'z') {
        ++pos;
    }
    else if (sv[pos] == '+' || sv[pos] == '-') {
        const std::size_t len = sv.size() - pos;
        int oh = 0, om = 0;
        if (len == 6 && sv[pos + 3] == ':') {
            if (!detail::parse_digits(sv.substr(pos + 4, 2), om)) return false;
        }
        else if (len == 5) {
            if (!detail::parse_digits(sv.substr(pos + 3, 2), om)) return false;
        }
        else {
            return false;
        }
        if (!detail::parse_digits(sv.substr(pos + 1, 2), oh)) return false;
        if (oh > 23 || om > 59) return false;
        offset = hours(oh) + minutes(om);
        if (sv[pos] == '-') offset = -offset;
        pos += len;
    }
    else {
        return false;
    }
    if (pos != sv.size()) return false;

    const year_month_day ymd =
        std::chrono::year{year} /
        std::chrono::month{static_cast<unsigned>(mon)} /
        std::chrono::day{static_cast<unsigned>(day)};
    if (!ymd.ok()) return false;

    // Local time minus offset yields UTC
    out = sys_days{ymd} + hours(hour) + minutes(minute) + seconds(sec) + extra_ns - offset;
    return true;
}


// ============================================================================
// RFC3339 Formatter (always UTC)
//
// Produces:
//   YYYY-MM-DDTHH:MM:SS.ssssssZ   (microsecond precision)
// ============================================================================
[[nodiscard]] inline std::string to_string(const Timestamp& ts) {
    using namespace std::chrono;

    const sys_days d = floor<days>(ts);
    const year_month_day ymd{d};

    const auto tod = ts - d;
    const auto h = floor<hours>(tod);
    const auto m = floor<minutes>(tod - h);
    const auto s = floor<seconds>(tod - h - m);
    const auto us = duration_cast<microseconds>(tod - h - m - s).count();

    char buf[64];
    std::snprintf(buf, sizeof(buf),
                  "%04d-%02u-%02uT%02d:%02d:%02d.%06lldZ",
                  int(ymd.year()), unsigned(ymd.month()), unsigned(ymd.day()),
                  int(h.count()), int(m.count()), int(s.count()),
                  static_cast<long long>(us));
    return std::string(buf);
}

} // namespace cirisstream::core
