/**
 * bankstmt parser - version 1.00
 * --------------------------------------------------------
 * Tabular bank statement import (CSV / XLSX / XLS)
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "bankstmt_text.hpp"
#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bankstmt {

struct CivilDate {
    int year{0};
    int month{0};   // 1..12
    int day{0};     // 1..31
};

// Days since 1970-01-01 (proleptic Gregorian)
inline std::int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153u * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline CivilDate civil_from_days(std::int64_t z) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    CivilDate c;
    c.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    c.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    c.year = static_cast<int>(yoe + era * 400 + (c.month <= 2));
    return c;
}

inline bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

inline bool is_valid_date(int y, int m, int d) {
    static constexpr int kDays[] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (y < 1 || y > 9999 || m < 1 || m > 12 || d < 1) return false;
    const int dim = (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
    return d <= dim;
}

inline std::string format_iso(const CivilDate& c) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.year, c.month, c.day);
    return buf;
}

// Current UTC calendar date
inline std::string today_utc_iso() {
    using namespace std::chrono;
    const auto secs = duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    std::int64_t days = secs / 86400;
    if (secs % 86400 < 0) --days;
    return format_iso(civil_from_days(days));
}

// Spreadsheet serial day number -> YYYY-MM-DD (time of day dropped).
// 1900 system keeps the historic 1900-02-29 slot (serial 60).
inline std::optional<std::string> serial_to_iso(double serial, bool date1904) {
    if (!std::isfinite(serial) || serial < 0 || serial > 2958465.0) return std::nullopt;
    const std::int64_t whole = static_cast<std::int64_t>(std::floor(serial));
    std::int64_t days;
    if (date1904) {
        days = days_from_civil(1904, 1, 1) + whole;
    } else {
        if (whole == 0) return std::nullopt;
        if (whole == 60) return std::string("1900-02-29");
        days = days_from_civil(1899, 12, 31) + whole - (whole > 60 ? 1 : 0);
    }
    return format_iso(civil_from_days(days));
}

// ----------------------------- parsing -----------------------------

// Leading integer like JS parseInt: optional spaces and sign, then digits
inline std::optional<int> leading_int(std::string_view s) {
    size_t i = 0;
    while (i < s.size() && ascii_space((unsigned char)s[i])) ++i;
    bool neg = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) { neg = s[i] == '-'; ++i; }
    const size_t b = i;
    while (i < s.size() && ascii_digit((unsigned char)s[i]) && i - b < 9) ++i;
    if (i == b) return std::nullopt;
    int v = 0;
    std::from_chars(s.data() + b, s.data() + i, v);
    return neg ? -v : v;
}

inline bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (unsigned char c : s) if (!ascii_digit(c)) return false;
    return true;
}

// two-digit years: 00-49 -> 20xx, 50-99 -> 19xx
inline int expand_year(int y, size_t digits) {
    if (digits <= 2) return y < 50 ? 2000 + y : 1900 + y;
    return y;
}

// English month name or its three-letter (or longer) prefix, 0 if none
inline int month_from_name(std::string_view w) {
    static const std::array<const char*, 12> kMonths = {
        "january","february","march","april","may","june",
        "july","august","september","october","november","december"
    };
    if (w.size() < 3) return 0;
    const std::string lw = ascii_lower_preserve_utf8(w);
    std::string_view v(lw);
    if (!v.empty() && v.back() == '.') v.remove_suffix(1);
    if (v == "sept") return 9;
    for (size_t i = 0; i < kMonths.size(); ++i) {
        std::string_view full(kMonths[i]);
        if (v.size() >= 3 && v.size() <= full.size() && full.compare(0, v.size(), v) == 0)
            return static_cast<int>(i) + 1;
    }
    return 0;
}

inline bool is_weekday_name(std::string_view w) {
    static const std::array<const char*, 7> kDays = {
        "monday","tuesday","wednesday","thursday","friday","saturday","sunday"
    };
    if (w.size() < 3) return false;
    std::string lw = ascii_lower_preserve_utf8(w);
    if (!lw.empty() && lw.back() == '.') lw.pop_back();
    for (const char* d : kDays) {
        std::string_view full(d);
        if (lw.size() >= 3 && lw.size() <= full.size() && full.compare(0, lw.size(), lw) == 0)
            return true;
    }
    return false;
}

// Time-of-day and zone tokens that may trail a date
inline bool is_time_token(std::string_view w) {
    if (w.find(':') != std::string_view::npos) return true;
    const std::string lw = ascii_lower_preserve_utf8(w);
    return lw == "am" || lw == "pm" || lw == "gmt" || lw == "utc" || lw == "z";
}

namespace detail {

struct DateToken {
    std::string text;
    bool numeric{false};
};

// Split on spaces, commas and the date separators / - .
// A token containing ':' (a time) is kept whole.
inline std::vector<DateToken> date_tokens(std::string_view s) {
    std::vector<DateToken> out;
    for (const auto& word : split_ws(s)) {
        std::string_view w(word);
        while (!w.empty() && w.back() == ',') w.remove_suffix(1);
        if (w.empty()) continue;
        if (w.find(':') != std::string_view::npos) {
            out.push_back({std::string(w), false});
            continue;
        }
        size_t i = 0;
        while (i < w.size()) {
            while (i < w.size() && (w[i] == '/' || w[i] == '-' || w[i] == '.' || w[i] == ',')) ++i;
            size_t j = i;
            while (j < w.size() && w[j] != '/' && w[j] != '-' && w[j] != '.' && w[j] != ',') ++j;
            if (j > i) {
                std::string t(w.substr(i, j - i));
                const bool num = all_digits(t);
                out.push_back({std::move(t), num});
            }
            i = j;
        }
    }
    return out;
}

inline std::optional<CivilDate> make_date(int y, int m, int d) {
    if (!is_valid_date(y, m, d)) return std::nullopt;
    return CivilDate{y, m, d};
}

// "YYYY-MM-DD", "YYYY/M/D", "YYYY.MM.DD", optional "T..." or " hh:mm" tail
inline std::optional<CivilDate> parse_year_first(std::string_view s) {
    if (s.size() < 8 || !all_digits(s.substr(0, 4))) return std::nullopt;
    const char sep = s[4];
    if (sep != '-' && sep != '/' && sep != '.') return std::nullopt;
    size_t p = 5;
    size_t q = p;
    while (q < s.size() && ascii_digit((unsigned char)s[q])) ++q;
    if (q == p || q - p > 2 || q >= s.size() || s[q] != sep) return std::nullopt;
    const int m = *leading_int(s.substr(p, q - p));
    p = q + 1;
    q = p;
    while (q < s.size() && ascii_digit((unsigned char)s[q])) ++q;
    if (q == p || q - p > 2) return std::nullopt;
    const int d = *leading_int(s.substr(p, q - p));
    if (q < s.size()) {
        const char t = s[q];
        if (t != 'T' && t != 't' && !ascii_space((unsigned char)t)) return std::nullopt;
        // tail must be a time-ish remainder
        for (size_t k = q + 1; k < s.size(); ++k) {
            const unsigned char c = (unsigned char)s[k];
            if (!(ascii_digit(c) || c == ':' || c == '.' || c == '+' || c == '-' ||
                  c == 'Z' || c == 'z' || ascii_space(c)))
                return std::nullopt;
        }
    }
    const int y = *leading_int(s.substr(0, 4));
    return make_date(y, m, d);
}

} // namespace detail

// Generic calendar-date parse. Accepted shapes:
//   2024-03-14, 2024-03-14T10:00:00Z, 2024/3/14, 2024.03.14
//   03/14/2024, 3-14-24, 03.14.2024 (month first), optional trailing time
//   Mar 14, 2024 / March 14 2024 / 14 Mar 2024 / 14-Mar-24 / Thu, 14 Mar 2024 10:00 GMT
inline std::optional<CivilDate> parse_calendar_date(std::string_view in) {
    const std::string trimmed = unicode_trim(in);
    std::string_view s(trimmed);
    if (s.empty()) return std::nullopt;

    if (auto iso = detail::parse_year_first(s)) return iso;

    const auto tokens = detail::date_tokens(s);
    std::vector<const detail::DateToken*> nums;
    int month = 0;
    int numsBeforeMonth = 0;
    for (const auto& t : tokens) {
        if (t.numeric) {
            if (t.text.size() > 4) return std::nullopt;
            nums.push_back(&t);
            continue;
        }
        if (is_time_token(t.text)) continue;
        if (const int mm = month_from_name(t.text)) {
            if (month) return std::nullopt;
            month = mm;
            numsBeforeMonth = static_cast<int>(nums.size());
            continue;
        }
        if (is_weekday_name(t.text)) continue;
        return std::nullopt;
    }

    if (month) {
        // "<month> <day> <year>" or "<day> <month> <year>"
        if (nums.size() != 2 || numsBeforeMonth > 1) return std::nullopt;
        const int day = *leading_int(nums[0]->text);
        const int year = expand_year(*leading_int(nums[1]->text), nums[1]->text.size());
        if (nums[0]->text.size() > 2) return std::nullopt;
        return detail::make_date(year, month, day);
    }

    // numeric month-first triplet, separators / - .
    if (nums.size() != 3) return std::nullopt;
    if (nums[0]->text.size() > 2 || nums[1]->text.size() > 2) return std::nullopt;
    const size_t yd = nums[2]->text.size();
    if (yd != 2 && yd != 4) return std::nullopt;
    {
        // the three numbers must sit in the leading word, joined by one separator kind
        const std::string lead = split_ws(s).front();
        size_t seps = 0;
        char sep = 0;
        for (char c : lead) {
            if (c == '/' || c == '-' || c == '.') {
                if (sep && c != sep) return std::nullopt;
                sep = c;
                ++seps;
            } else if (!ascii_digit((unsigned char)c) && c != ',') {
                return std::nullopt;
            }
        }
        if (seps != 2) return std::nullopt;
    }
    const int m = *leading_int(nums[0]->text);
    const int d = *leading_int(nums[1]->text);
    const int y = expand_year(*leading_int(nums[2]->text), yd);
    return detail::make_date(y, m, d);
}

// Explicit month/day/year slash triplet, each part read like parseInt
inline std::optional<CivilDate> parse_mdy_slash(std::string_view s) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const size_t pos = s.find('/', start);
        if (pos == std::string_view::npos) { parts.push_back(s.substr(start)); break; }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    if (parts.size() != 3) return std::nullopt;
    const auto m = leading_int(parts[0]);
    const auto d = leading_int(parts[1]);
    const auto y = leading_int(parts[2]);
    if (!m || !d || !y) return std::nullopt;

    std::string_view ys = parts[2];
    while (!ys.empty() && ascii_space((unsigned char)ys.front())) ys.remove_prefix(1);
    size_t digits = 0;
    while (digits < ys.size() && ascii_digit((unsigned char)ys[digits])) ++digits;
    return detail::make_date(expand_year(*y, digits), *m, *d);
}

// Date cell -> YYYY-MM-DD.
// Generic parse, then M/D/Y slash triplet, then the processing date.
inline std::string normalize_date(std::string_view raw, const std::string& fallback_iso) {
    const std::string s = unicode_trim(raw);
    if (auto c = parse_calendar_date(s)) return format_iso(*c);
    if (auto c = parse_mdy_slash(s)) return format_iso(*c);
    return fallback_iso;
}

} // namespace bankstmt
