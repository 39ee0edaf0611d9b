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
#include "bankstmt_date.hpp"
#include <charconv>
#include <cmath>
#include <string>
#include <string_view>

namespace bankstmt {

// Built-in spreadsheet number formats that display dates or times
inline bool is_builtin_date_format(int id) {
    return (id >= 14 && id <= 22) || (id >= 27 && id <= 36) ||
           (id >= 45 && id <= 47) || (id >= 50 && id <= 58);
}

// Custom format code: a date/time token (d m y h s) outside quoted text,
// escapes and [..] sections marks a date format
inline bool is_date_format_code(std::string_view code) {
    if (code.empty() || ascii_iequals(code, "General")) return false;
    for (size_t i = 0; i < code.size(); ++i) {
        const char c = code[i];
        if (c == '"') {
            const size_t close = code.find('"', i + 1);
            if (close == std::string_view::npos) return false;
            i = close;
            continue;
        }
        if (c == '\\' || c == '_' || c == '*') { ++i; continue; }
        if (c == '[') {
            const size_t close = code.find(']', i + 1);
            if (close == std::string_view::npos) return false;
            i = close;
            continue;
        }
        switch (c) {
        case 'd': case 'D': case 'm': case 'M': case 'y': case 'Y':
        case 'h': case 'H': case 's': case 'S':
            return true;
        default:
            break;
        }
    }
    return false;
}

// Shortest round-trip text of a numeric cell ("45.2", "-12", "1e+21")
inline std::string format_number(double v) {
    if (std::isnan(v)) return "NaN";
    if (v == 0) return "0";
    char buf[64];
    auto [p, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc()) return std::string();
    return std::string(buf, p);
}

// Numeric cell text, dates rendered as YYYY-MM-DD when the format says so
inline std::string render_numeric_cell(double v, bool dateFormatted, bool date1904) {
    if (dateFormatted) {
        if (auto iso = serial_to_iso(v, date1904)) return *iso;
    }
    return format_number(v);
}

} // namespace bankstmt
