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
#include "bankstmt_table.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace bankstmt {

// RFC 4180 record splitter.
// Quoted fields may hold the delimiter, doubled quotes and line breaks.
// LF, CRLF and lone CR end a record. Stops after max_records (0 = all).
// Returns false on an unterminated quoted field.
inline bool split_csv_records(std::string_view text, char delim, Grid& out,
                              size_t max_records = 0, std::string* error = nullptr)
{
    std::vector<std::string> rec;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;

    auto end_field = [&]() {
        rec.push_back(std::move(field));
        field.clear();
        fieldQuoted = false;
    };
    auto end_record = [&]() {
        end_field();
        out.push_back(std::move(rec));
        rec.clear();
    };

    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        if (max_records && out.size() >= max_records) return true;
        const char c = text[i];

        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < n && text[i+1] == '"') { field.push_back('"'); i += 2; continue; }
                inQuotes = false;
                ++i;
                continue;
            }
            field.push_back(c);
            ++i;
            continue;
        }

        if (c == '"' && field.empty() && !fieldQuoted) {
            inQuotes = true;
            fieldQuoted = true;
            ++i;
            continue;
        }
        if (c == delim) { end_field(); ++i; continue; }
        if (c == '\r') {
            end_record();
            i += (i + 1 < n && text[i+1] == '\n') ? 2 : 1;
            continue;
        }
        if (c == '\n') { end_record(); ++i; continue; }

        field.push_back(c);
        ++i;
    }

    if (inQuotes) {
        if (error) *error = "CSV parse error: unterminated quoted field";
        return false;
    }
    // last record without trailing newline
    if (!field.empty() || fieldQuoted || !rec.empty()) end_record();
    return true;
}

// Delimiter heuristic over the first records: the candidate whose first
// record has more than one field and which keeps that field count in the
// most records wins; then more fields; then candidate order.
inline char guess_delimiter(std::string_view text) {
    static constexpr char kCandidates[] = { ',', ';', '\t', '|' };
    constexpr size_t kSample = 10;

    char best = ',';
    size_t bestConsistent = 0, bestFields = 0;

    for (char d : kCandidates) {
        Grid sample;
        std::string err;
        // an unterminated quote in the sample window is not decisive here
        split_csv_records(text, d, sample, kSample * 2, &err);

        Grid nonEmpty;
        for (auto& r : sample) {
            if (!grid_row_empty(r)) nonEmpty.push_back(std::move(r));
            if (nonEmpty.size() == kSample) break;
        }
        if (nonEmpty.empty()) continue;

        const size_t fields = nonEmpty.front().size();
        if (fields < 2) continue;

        size_t consistent = 0;
        for (const auto& r : nonEmpty)
            if (r.size() == fields) ++consistent;

        if (consistent > bestConsistent ||
            (consistent == bestConsistent && fields > bestFields)) {
            best = d;
            bestConsistent = consistent;
            bestFields = fields;
        }
    }
    return best;
}

// CSV bytes -> exactly one Sheet (first non-empty record is the header row)
inline bool read_csv(std::string_view bytes, Sheet& out, std::string* error = nullptr) {
    if (bytes.size() >= 3 &&
        (unsigned char)bytes[0] == 0xEF && (unsigned char)bytes[1] == 0xBB && (unsigned char)bytes[2] == 0xBF) {
        bytes.remove_prefix(3);
    }
    if (bytes.find('\0') != std::string_view::npos) {
        if (error) *error = "CSV parse error: binary content";
        return false;
    }

    const char delim = guess_delimiter(bytes);
    Grid grid;
    if (!split_csv_records(bytes, delim, grid, 0, error)) return false;

    out = sheet_from_grid(std::string(), grid, true);
    return true;
}

} // namespace bankstmt
