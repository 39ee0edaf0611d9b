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
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>

namespace bankstmt {

// Raw cell grid as decoded by a reader, before headers are applied
using Grid = std::vector<std::vector<std::string>>;

// Worksheet limits of current Excel versions
constexpr std::size_t kMaxSheetRows = 1048576;
constexpr std::size_t kMaxSheetColumns = 16384;

inline bool grid_row_empty(const std::vector<std::string>& r) {
    for (const auto& c : r)
        if (!ascii_trim(c).empty()) return false;
    return true;
}

// Header names for one sheet:
//  - NFC-composed and trimmed
//  - empty names become "__EMPTY", "__EMPTY_1", ...
//  - repeated names get "_1", "_2", ... so every column stays addressable
inline std::vector<std::string> make_headers(const std::vector<std::string>& raw) {
    std::vector<std::string> out;
    out.reserve(raw.size());
    std::unordered_set<std::string> used;
    std::unordered_map<std::string, int> suffix;
    int empties = 0;

    for (const auto& r : raw) {
        std::string h = unicode_trim(nfc(r));
        if (h.empty()) {
            h = empties == 0 ? std::string("__EMPTY") : "__EMPTY_" + std::to_string(empties);
            ++empties;
        }
        std::string candidate = h;
        if (used.count(candidate)) {
            int& n = suffix[h];
            do {
                candidate = h + "_" + std::to_string(++n);
            } while (used.count(candidate));
        }
        used.insert(candidate);
        out.push_back(std::move(candidate));
    }
    return out;
}

// First non-empty grid row becomes the header row; fully empty data rows
// are skipped; short rows are padded with "".
// widthFromHeader: the header record fixes the column count and cells
// past it are dropped (delimited text). Otherwise every column holding a
// value gets a header (workbooks).
inline Sheet sheet_from_grid(std::string name, const Grid& grid, bool widthFromHeader = false) {
    Sheet s;
    s.name = std::move(name);

    size_t i = 0;
    while (i < grid.size() && grid_row_empty(grid[i])) ++i;
    if (i == grid.size()) return s;

    size_t width = widthFromHeader ? grid[i].size() : 0;
    for (size_t r = i; r < grid.size() && !widthFromHeader; ++r)
        for (size_t c = grid[r].size(); c > width; --c)
            if (!ascii_trim(grid[r][c - 1]).empty()) { width = c; break; }

    std::vector<std::string> rawHeaders = grid[i];
    rawHeaders.resize(width);
    s.headers = make_headers(rawHeaders);
    ++i;

    for (; i < grid.size(); ++i) {
        const auto& g = grid[i];
        if (grid_row_empty(g)) continue;
        Row row;
        row.reserve(s.headers.size());
        for (size_t c = 0; c < s.headers.size(); ++c)
            row.emplace_back(s.headers[c], c < g.size() ? g[c] : std::string());
        s.rows.push_back(std::move(row));
    }
    return s;
}

} // namespace bankstmt
