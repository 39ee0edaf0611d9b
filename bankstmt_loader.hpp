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
#include "bankstmt_csv_reader.hpp"
#include "bankstmt_model.hpp"
#include "bankstmt_xls_reader.hpp"
#include "bankstmt_xlsx_reader.hpp"
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <vector>

namespace bankstmt {

// Bytes of a declared kind -> sheets. Only table kinds are handled here;
// pdf and unsupported kinds are rejected by the caller. maxPartBytes
// bounds every decompressed workbook part.
inline bool load_tables(std::string_view bytes, FileKind kind, std::vector<Sheet>& out,
                        std::string* error = nullptr,
                        std::uint64_t maxPartBytes = ZipArchive::kDefaultMaxEntrySize)
{
    out.clear();
    try {
        switch (kind) {
        case FileKind::Csv: {
            Sheet s;
            if (!read_csv(bytes, s, error)) return false;
            out.push_back(std::move(s));
            return true;
        }
        case FileKind::Xlsx:
            return read_xlsx(bytes, out, error, maxPartBytes);
        case FileKind::Xls:
            return read_xls(bytes, out, error, maxPartBytes);
        default:
            if (error) *error = std::string("No table reader for ") + to_string(kind);
            return false;
        }
    } catch (const std::exception& ex) {
        out.clear();
        if (error) *error = std::string("Table decoding failed: ") + ex.what();
        return false;
    }
}

} // namespace bankstmt
