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
#include "bankstmt_model.hpp"
#include "bankstmt_text.hpp"
#include <algorithm>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace bankstmt {

// ----------------------------- Embedded table -----------------------------
// Format:
// Bank;Keywords ('|' separated, lower case)
// Checked top to bottom, first hit wins.
inline constexpr const char* kBankTableEmbedded =
    "Bank;Keywords\n"
    "Chase;chase|jpmorgan\n"
    "Bank of America;bank of america|bofa\n"
    "Wells Fargo;wells fargo|wellsfargo\n"
    "Citibank;citibank|citi\n"
    "U.S. Bank;us bank|usbank\n"
    "Capital One;capital one|capitalone\n"
    "PNC Bank;pnc bank|pnc\n"
    "TD Bank;td bank|tdbank\n"
    "Truist;truist\n"
    "Citizens Bank;citizens bank\n"
    "Fifth Third Bank;fifth third|5/3\n"
    "Ally Bank;ally bank|ally\n"
    "Discover;discover\n"
    "American Express;american express|amex\n"
    "Navy Federal Credit Union;navy federal\n";

struct BankPattern {
    std::string name;
    std::vector<std::string> keywords;
};

using BankTable = std::vector<BankPattern>;

inline std::vector<std::string> split_on(std::string_view line, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= line.size()) {
        size_t pos = line.find(sep, start);
        if (pos == std::string_view::npos) {
            out.emplace_back(ascii_trim(line.substr(start)));
            break;
        }
        out.emplace_back(ascii_trim(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return out;
}

inline BankTable build_bank_table_from_embedded() {
    BankTable table;
    std::istringstream iss{std::string(kBankTableEmbedded)};
    std::string line;
    while (std::getline(iss, line)) {
        auto cols = split_on(line, ';');
        if (cols.size() < 2 || cols[0].empty()) continue;
        if (cols[0] == "Bank") continue; // header

        BankPattern p;
        p.name = cols[0];
        for (auto& kw : split_on(cols[1], '|'))
            if (!kw.empty()) p.keywords.push_back(std::move(kw));
        if (!p.keywords.empty()) table.push_back(std::move(p));
    }
    return table;
}

// Singleton access (build once, then reuse)
inline const BankTable& get_bank_table() {
    static const BankTable T = build_bank_table_from_embedded();
    return T;
}

struct BankInfo {
    std::string bank;                       // "Unknown Bank" without a hit
    std::optional<std::string> accountNumber;
};

// First run of 4+ ASCII digits following a case-insensitive "account" on
// the same line of the text, empty if there is none
inline std::string find_account_digits(std::string_view text) {
    static constexpr std::string_view kWord = "account";
    size_t i = 0;
    while (i + kWord.size() <= text.size()) {
        if (!ascii_istarts_with(text.substr(i), kWord)) { ++i; continue; }
        size_t j = i + kWord.size();
        while (j < text.size() && text[j] != '\n' && text[j] != '\r') {
            if (!ascii_digit((unsigned char)text[j])) { ++j; continue; }
            const size_t b = j;
            while (j < text.size() && ascii_digit((unsigned char)text[j])) ++j;
            if (j - b >= 4) return std::string(text.substr(b, j - b));
        }
        // nothing after this "account" on its line; later ones share the line
        i = j;
    }
    return std::string();
}

// "account ... 12345678" in one of the first rows -> "****5678"
inline std::optional<std::string> extract_account_number(const Sheet& sheet, std::size_t scanRows = 5) {
    const std::size_t n = std::min(scanRows, sheet.rows.size());
    for (std::size_t i = 0; i < n; ++i) {
        for (const auto& kv : sheet.rows[i]) {
            const std::string digits = find_account_digits(kv.second);
            if (!digits.empty()) return "****" + digits.substr(digits.size() - 4);
        }
    }
    return std::nullopt;
}

// Lower-cased headers and cell values of the sheet, one per line
inline std::string sheet_text_blob(const Sheet& sheet) {
    std::string blob;
    for (const auto& h : sheet.headers) { blob += h; blob.push_back('\n'); }
    for (const auto& row : sheet.rows)
        for (const auto& kv : row) { blob += kv.second; blob.push_back('\n'); }
    return unicode_lower(blob);
}

inline BankInfo detect_bank(const Sheet& sheet, std::string_view filename, std::size_t scanRows = 5) {
    const std::string blob = sheet_text_blob(sheet);
    const std::string file = unicode_lower(filename);

    for (const auto& p : get_bank_table()) {
        for (const auto& kw : p.keywords) {
            if (blob.find(kw) != std::string::npos || file.find(kw) != std::string::npos)
                return BankInfo{p.name, extract_account_number(sheet, scanRows)};
        }
    }
    return BankInfo{"Unknown Bank", std::nullopt};
}

} // namespace bankstmt
