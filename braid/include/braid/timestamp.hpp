#pragma once
// Timestamps: RFC 3339 in, UTC "YYYY-MM-DDTHH:MM:SSZ" out
//
// Second precision. Offsets are accepted on input and normalized to UTC.

#include "error.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>

namespace braid {

using Timestamp = std::chrono::sys_seconds;

inline Timestamp now() {
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

inline std::string format_timestamp(Timestamp t) {
    using namespace std::chrono;
    auto dp = floor<days>(t);
    year_month_day ymd{dp};
    long secs = static_cast<long>((t - dp).count());

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02ld:%02ld:%02ldZ",
             static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
             static_cast<unsigned>(ymd.day()), secs / 3600, (secs / 60) % 60, secs % 60);
    return buf;
}

namespace detail {

inline bool read_digits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

inline bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

inline std::optional<std::chrono::sys_days> make_date(int y, int m, int d) {
    using namespace std::chrono;
    year_month_day ymd{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;
    return sys_days{ymd};
}

} // namespace detail

// YYYY-MM-DD only, midnight UTC
inline std::optional<Timestamp> parse_date(const std::string& s) {
    size_t pos = 0;
    int y, mo, d;
    if (!detail::read_digits(s, pos, 4, y) || !detail::expect(s, pos, '-') ||
        !detail::read_digits(s, pos, 2, mo) || !detail::expect(s, pos, '-') ||
        !detail::read_digits(s, pos, 2, d) || pos != s.size()) {
        return std::nullopt;
    }
    auto date = detail::make_date(y, mo, d);
    if (!date) return std::nullopt;
    return Timestamp{*date};
}

// Full RFC 3339 date-time with Z or +HH:MM / -HH:MM offset
inline std::optional<Timestamp> parse_timestamp(const std::string& s) {
    using namespace std::chrono;
    size_t pos = 0;
    int y, mo, d, h, mi, se;
    if (!detail::read_digits(s, pos, 4, y) || !detail::expect(s, pos, '-') ||
        !detail::read_digits(s, pos, 2, mo) || !detail::expect(s, pos, '-') ||
        !detail::read_digits(s, pos, 2, d)) {
        return std::nullopt;
    }
    if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')) return std::nullopt;
    ++pos;
    if (!detail::read_digits(s, pos, 2, h) || !detail::expect(s, pos, ':') ||
        !detail::read_digits(s, pos, 2, mi) || !detail::expect(s, pos, ':') ||
        !detail::read_digits(s, pos, 2, se)) {
        return std::nullopt;
    }
    if (h > 23 || mi > 59 || se > 60) return std::nullopt;

    // Fractional seconds are accepted and truncated
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        size_t start = pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
        if (pos == start) return std::nullopt;
    }

    if (pos >= s.size()) return std::nullopt;
    int offset_minutes = 0;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        ++pos;
    } else if (s[pos] == '+' || s[pos] == '-') {
        int sign = s[pos] == '-' ? -1 : 1;
        ++pos;
        int oh, om;
        if (!detail::read_digits(s, pos, 2, oh) || !detail::expect(s, pos, ':') ||
            !detail::read_digits(s, pos, 2, om)) {
            return std::nullopt;
        }
        offset_minutes = sign * (oh * 60 + om);
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    auto date = detail::make_date(y, mo, d);
    if (!date) return std::nullopt;

    Timestamp t = Timestamp{*date} + hours{h} + minutes{mi} + seconds{std::min(se, 59)};
    return t - minutes{offset_minutes};
}

// Scheduled-for expressions: YYYY-MM-DD, +Nd, +Nw, +Nmo, tomorrow, or RFC 3339
inline Result<Timestamp> parse_scheduled(const std::string& raw, Timestamp reference) {
    using namespace std::chrono;

    std::string input;
    for (char c : raw) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            input += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    if (input == "tomorrow") {
        return Timestamp{floor<days>(reference) + days{1}};
    }

    if (!input.empty() && input[0] == '+') {
        std::string rest = input.substr(1);
        auto amount = [&](size_t suffix_len, const char* what) -> Result<long> {
            std::string digits = rest.substr(0, rest.size() - suffix_len);
            if (digits.empty() || digits.size() > 6 ||
                !std::all_of(digits.begin(), digits.end(),
                             [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
                return Error::parse("date", std::string("invalid ") + what + ": " + rest);
            }
            return std::stol(digits);
        };

        if (rest.size() > 2 && rest.compare(rest.size() - 2, 2, "mo") == 0) {
            auto n = amount(2, "months");
            if (!n) return n.error();
            return reference + days{*n * 30};
        }
        if (!rest.empty() && rest.back() == 'd') {
            auto n = amount(1, "days");
            if (!n) return n.error();
            return reference + days{*n};
        }
        if (!rest.empty() && rest.back() == 'w') {
            auto n = amount(1, "weeks");
            if (!n) return n.error();
            return reference + weeks{*n};
        }
        return Error::parse("date", "invalid relative format '" + input +
                                    "'. use +Nd, +Nw, or +Nmo (e.g., +7d, +2w, +1mo)");
    }

    if (auto date = parse_date(input)) return *date;
    if (auto ts = parse_timestamp(raw)) return *ts;

    return Error::parse("date", "invalid date format '" + raw +
                                "'. use YYYY-MM-DD, +Nd, +Nw, +Nmo, or 'tomorrow'");
}

// "in 3h", "in 2d", "in 1w", "in 2mo"; "now" once passed
inline std::string format_relative(Timestamp target, Timestamp reference) {
    using namespace std::chrono;
    auto delta = duration_cast<seconds>(target - reference).count();
    if (delta <= 0) return "now";
    long hours_left = static_cast<long>(delta / 3600);
    if (hours_left < 24) return "in " + std::to_string(std::max(1L, hours_left)) + "h";
    long days_left = hours_left / 24;
    if (days_left < 7) return "in " + std::to_string(days_left) + "d";
    if (days_left < 30) return "in " + std::to_string(days_left / 7) + "w";
    return "in " + std::to_string(days_left / 30) + "mo";
}

} // namespace braid
