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
#include "bankstmt_model.hpp"
#include "bankstmt_text.hpp"
#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bankstmt {

// ----------------------------- Cell predicates -----------------------------
// All three expect a trimmed value.

inline bool looks_like_date(std::string_view v) {
    if (v.empty() || codepoint_count(v) < 6) return false;
    bool sep = false, digit = false;
    for (unsigned char c : v) {
        if (c == '/' || c == '-' || c == '.') sep = true;
        else if (ascii_digit(c)) digit = true;
    }
    // the numeric d/m/y triplet shapes always satisfy sep && digit
    if (sep && digit) return true;
    return parse_calendar_date(v).has_value();
}

inline bool is_currency_symbol(utf8proc_int32_t cp) {
    switch (cp) {
    case 0x0024: // $
    case 0x20AC: // euro
    case 0x00A3: // pound
    case 0x00A5: // yen
    case 0x20B9: // rupee
    case 0x20BD: // ruble
    case 0x20A9: // won
        return true;
    default:
        return false;
    }
}

// ^-?\d+\.?\d*$
inline bool is_plain_decimal(std::string_view s) {
    size_t i = 0;
    if (i < s.size() && s[i] == '-') ++i;
    const size_t b = i;
    while (i < s.size() && ascii_digit((unsigned char)s[i])) ++i;
    if (i == b) return false;
    if (i < s.size() && s[i] == '.') ++i;
    while (i < s.size() && ascii_digit((unsigned char)s[i])) ++i;
    return i == s.size();
}

// \d+[.,]\d{2}$
inline bool ends_with_cents(std::string_view s) {
    const size_t n = s.size();
    if (n < 4) return false;
    return ascii_digit((unsigned char)s[n-1]) && ascii_digit((unsigned char)s[n-2]) &&
           (s[n-3] == '.' || s[n-3] == ',') && ascii_digit((unsigned char)s[n-4]);
}

inline bool looks_like_amount(std::string_view v) {
    if (v.empty()) return false;
    std::string cleaned;
    cleaned.reserve(v.size());
    for_each_codepoint(v, [&](utf8proc_int32_t cp, std::size_t off, std::size_t len) {
        if (cp == ',' || is_currency_symbol(cp)) return;
        if (cp >= 0 && isUnicodeSpaceOrControlWS(cp)) return;
        cleaned.append(v.substr(off, len));
    });
    return is_plain_decimal(cleaned) || ends_with_cents(v);
}

inline bool is_letter_cp(utf8proc_int32_t cp) {
    return (cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z') ||
           (cp >= 0x00C0 && cp <= 0x024F) ||   // Latin-1 supplement .. Latin Extended-B
           (cp >= 0x0400 && cp <= 0x04FF) ||   // Cyrillic
           (cp >= 0x0600 && cp <= 0x06FF) ||   // Arabic
           (cp >= 0x4E00 && cp <= 0x9FFF);     // CJK unified ideographs
}

inline bool looks_like_text(std::string_view v) {
    if (v.empty()) return false;
    bool letter = false;
    std::size_t n = 0;
    for_each_codepoint(v, [&](utf8proc_int32_t cp, std::size_t, std::size_t) {
        ++n;
        if (is_letter_cp(cp)) letter = true;
    });
    return letter && n > 3;
}

// ----------------------------- Scoring -----------------------------

using ColumnScores = std::vector<std::pair<std::string, ColumnScore>>;

// Scores every header over the first min(sampleRows, rowCount) rows
inline ColumnScores score_columns(const Sheet& sheet, std::size_t sampleRows) {
    ColumnScores scores;
    const std::size_t n = std::min(sampleRows, sheet.rows.size());
    for (const auto& h : sheet.headers) {
        ColumnScore sc;
        for (std::size_t i = 0; i < n; ++i) {
            const std::string* cell = find_cell(sheet.rows[i], h);
            if (!cell) continue;
            const std::string v = unicode_trim(*cell);
            if (v.empty()) continue;
            if (looks_like_date(v))   ++sc.dateHits;
            if (looks_like_amount(v)) ++sc.amountHits;
            if (looks_like_text(v))   ++sc.textHits;
        }
        scores.emplace_back(h, sc);
    }
    return scores;
}

// ----------------------------- Role assignment -----------------------------

inline ColumnMap assign_roles(const ColumnScores& scores, std::size_t sampleSize) {
    ColumnMap map;

    int best = 0;
    for (const auto& [h, sc] : scores) {
        if (sc.dateHits > best) { best = sc.dateHits; map.date = h; }
    }

    best = 0;
    for (const auto& [h, sc] : scores) {
        if (map.date && *map.date == h) continue;
        if (sc.textHits > best) { best = sc.textHits; map.description = h; }
    }

    // amount candidates by descending hits; equal hits stay in header order
    std::vector<std::pair<std::string, int>> cand;
    for (const auto& [h, sc] : scores) {
        if (map.role_of(h) != ColumnRole::Unknown) continue;
        if (2 * std::size_t(sc.amountHits) <= sampleSize) continue;
        auto pos = cand.begin();
        while (pos != cand.end() && pos->second >= sc.amountHits) ++pos;
        cand.insert(pos, {h, sc.amountHits});
    }

    if (cand.size() >= 2) {
        map.debit = cand[0].first;
        map.credit = cand[1].first;
        if (cand.size() >= 3) map.balance = cand[2].first;
    } else if (cand.size() == 1) {
        map.amount = cand[0].first;
    }
    return map;
}

inline ColumnMap classify_columns(const Sheet& sheet, std::size_t sampleRows = 10) {
    if (sheet.rows.empty()) return ColumnMap();
    const std::size_t sampleSize = std::min(sampleRows, sheet.rows.size());
    return assign_roles(score_columns(sheet, sampleRows), sampleSize);
}

} // namespace bankstmt
