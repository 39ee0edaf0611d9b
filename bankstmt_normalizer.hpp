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
#include "bankstmt_classifier.hpp"
#include "bankstmt_date.hpp"
#include "bankstmt_model.hpp"
#include "bankstmt_text.hpp"
#include <array>
#include <charconv>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bankstmt {

// ---------- Numbers ----------

// Keep only [0-9.-]
inline std::string clean_numeric(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        if (ascii_digit((unsigned char)c) || c == '.' || c == '-') out.push_back(c);
    return out;
}

// Longest leading decimal literal; nullopt when there is none ("", "-", ".")
inline std::optional<double> parse_decimal_prefix(std::string_view s) {
    if (s.empty()) return std::nullopt;
    double v = 0.0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v, std::chars_format::fixed);
    if (ec != std::errc() || p == s.data()) return std::nullopt;
    return v;
}

// Cell text -> number, currency decoration and separators dropped
inline std::optional<double> parse_cell_number(std::string_view cell) {
    return parse_decimal_prefix(clean_numeric(cell));
}

// ---------- Merchant ----------

namespace detail {

struct CodePoint {
    utf8proc_int32_t cp;
    std::size_t off;
    std::size_t len;
};

inline std::vector<CodePoint> codepoints_of(std::string_view s) {
    std::vector<CodePoint> out;
    for_each_codepoint(s, [&](utf8proc_int32_t cp, std::size_t off, std::size_t len) {
        out.push_back(CodePoint{cp, off, len});
    });
    return out;
}

inline bool is_ws(const CodePoint& c) { return c.cp >= 0 && isUnicodeSpaceOrControlWS(c.cp); }
inline bool is_digit(const CodePoint& c) { return c.cp >= '0' && c.cp <= '9'; }

} // namespace detail

// Payment prefix, trailing card digits and reference number removed;
// at most the first three words. Whitespace is any Unicode space.
inline std::string extract_merchant(const std::string& description) {
    static const std::array<std::string_view, 4> kPrefixes = {
        "DEBIT CARD PURCHASE", "CREDIT CARD PURCHASE", "POS", "ATM"
    };

    std::string_view m = description;
    for (std::string_view p : kPrefixes) {
        if (ascii_istarts_with(m, p)) {
            m.remove_prefix(p.size());
            break;
        }
    }

    const std::vector<detail::CodePoint> cps = detail::codepoints_of(m);
    size_t first = 0, last = cps.size();
    while (first < last && detail::is_ws(cps[first])) ++first;

    // trailing card digits: whitespace + exactly four digits
    {
        size_t b = last;
        while (b > first && detail::is_digit(cps[b-1])) --b;
        if (last - b == 4 && b > first && detail::is_ws(cps[b-1])) {
            while (b > first && detail::is_ws(cps[b-1])) --b;
            last = b;
        }
    }
    // trailing reference: whitespace + #digits
    {
        size_t b = last;
        while (b > first && detail::is_digit(cps[b-1])) --b;
        if (b < last && b >= first + 2 && cps[b-1].cp == '#' && detail::is_ws(cps[b-2])) {
            b -= 1;
            while (b > first && detail::is_ws(cps[b-1])) --b;
            last = b;
        }
    }

    if (first == last) return description;
    const size_t from = cps[first].off;
    const std::string merchant = unicode_trim(m.substr(from, cps[last-1].off + cps[last-1].len - from));
    if (merchant.empty()) return description;

    const std::vector<std::string> words = split_unicode_ws(merchant);
    if (words.size() <= 3) return merchant;
    return words[0] + ' ' + words[1] + ' ' + words[2];
}

// ---------- Rows ----------

// Assigned cell, trimmed; empty when the column is unassigned or blank
inline std::string assigned_cell(const Row& row, const std::optional<std::string>& header) {
    if (!header) return std::string();
    const std::string* c = find_cell(row, *header);
    return c ? unicode_trim(*c) : std::string();
}

// Canonical transaction from one row, nullopt when the row carries no
// usable date or a zero / non-numeric amount
inline std::optional<Transaction> normalize_row(const Row& row, const ColumnMap& map,
                                                const std::string& fallbackDate)
{
    // date
    std::string dateStr = assigned_cell(row, map.date);
    const std::string* dateSource = map.date ? &*map.date : nullptr;
    if (dateStr.empty()) {
        dateSource = nullptr;
        for (const auto& [h, v] : row) {
            std::string t = unicode_trim(v);
            if (looks_like_date(t)) { dateStr = std::move(t); dateSource = &h; break; }
        }
    }
    if (dateStr.empty()) return std::nullopt;

    auto is_date_col = [&](const std::string& h) { return dateSource && *dateSource == h; };

    // description
    std::string description = assigned_cell(row, map.description);
    const std::string* descSource = map.description ? &*map.description : nullptr;
    if (description.empty()) {
        descSource = nullptr;
        for (const auto& [h, v] : row) {
            if (is_date_col(h)) continue;
            std::string t = unicode_trim(v);
            if (looks_like_text(t)) { description = std::move(t); descSource = &h; break; }
        }
    }
    if (description.empty()) description = "Transaction";

    // amount and direction
    std::optional<double> value;
    TxType type = TxType::Debit;
    if (map.debit && map.credit) {
        // a filled debit cell decides the row, even when it is not a number
        const std::string debitCell = assigned_cell(row, map.debit);
        const std::optional<double> d = parse_cell_number(debitCell);
        if (!debitCell.empty() && !d) return std::nullopt;
        const std::optional<double> c = parse_cell_number(assigned_cell(row, map.credit));
        if (d && *d != 0.0) { value = std::fabs(*d); type = TxType::Debit; }
        else if (c && *c != 0.0) { value = std::fabs(*c); type = TxType::Credit; }
    } else if (map.amount) {
        value = parse_cell_number(assigned_cell(row, map.amount));
        if (value) { type = *value < 0 ? TxType::Debit : TxType::Credit; value = std::fabs(*value); }
    } else {
        for (const auto& [h, v] : row) {
            if (is_date_col(h) || (descSource && *descSource == h)) continue;
            const std::string t = unicode_trim(v);
            if (!looks_like_amount(t)) continue;
            value = parse_cell_number(t);
            if (value) { type = *value < 0 ? TxType::Debit : TxType::Credit; value = std::fabs(*value); }
            break;
        }
    }
    if (!value || *value == 0.0 || std::isnan(*value)) return std::nullopt;

    Transaction tx;
    tx.date = normalize_date(dateStr, fallbackDate);
    tx.description = description;
    tx.amount = *value;
    tx.type = type;
    if (map.balance) {
        const std::string b = assigned_cell(row, map.balance);
        if (!b.empty()) tx.balance = parse_cell_number(b);
    }
    tx.merchant = extract_merchant(tx.description);
    return tx;
}

inline std::vector<Transaction> normalize_sheet(const Sheet& sheet, const ColumnMap& map,
                                                const std::string& fallbackDate)
{
    std::vector<Transaction> out;
    for (const Row& row : sheet.rows) {
        if (auto tx = normalize_row(row, map, fallbackDate)) out.push_back(std::move(*tx));
    }
    return out;
}

} // namespace bankstmt
