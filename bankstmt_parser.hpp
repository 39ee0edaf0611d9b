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
#include "bankstmt_bank.hpp"
#include "bankstmt_date.hpp"
#include "bankstmt_loader.hpp"
#include "bankstmt_model.hpp"
#include "bankstmt_selector.hpp"
#include "bankstmt_stats.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace bankstmt {

struct ParseOptions {
    std::size_t sample_rows = 10;            // rows scored per column
    std::size_t account_scan_rows = 5;       // rows searched for an account number
    std::size_t max_input_bytes = 10u * 1024u * 1024u;   // 0 = unlimited

    // A decompressed workbook part may be this many times max_input_bytes
    std::size_t max_expansion = 32;

    // Fixed YYYY-MM-DD used when a date cell cannot be read.
    // Unset: the current UTC date.
    std::optional<std::string> processing_date;
};

// Suffix after the last '.', case-insensitive
inline FileKind file_kind_from_name(std::string_view name) {
    const size_t dot = name.find_last_of('.');
    if (dot == std::string_view::npos) return FileKind::Unsupported;
    const std::string_view ext = name.substr(dot + 1);
    if (ascii_iequals(ext, "csv"))  return FileKind::Csv;
    if (ascii_iequals(ext, "xlsx")) return FileKind::Xlsx;
    if (ascii_iequals(ext, "xls"))  return FileKind::Xls;
    if (ascii_iequals(ext, "pdf"))  return FileKind::Pdf;
    return FileKind::Unsupported;
}

inline std::string extension_of(std::string_view name) {
    const size_t dot = name.find_last_of('.');
    return ascii_lower_preserve_utf8(dot == std::string_view::npos ? name : name.substr(dot + 1));
}

// Status code for an HTTP boundary
inline int http_status_for(const ParseResult& r) {
    if (r.success) return 200;
    switch (r.errorKind) {
    case ErrorKind::UnsupportedExtension:
    case ErrorKind::NotImplemented:
    case ErrorKind::InputTooLarge:
    case ErrorKind::NoTransactionsExtracted:
        return 400;
    default:
        return 500;
    }
}

// ---------- Parser-Class ----------
class Parser {
public:
    Parser() = default;
    explicit Parser(ParseOptions opt) : opt_(std::move(opt)) {}

    const ParseOptions& options() const { return opt_; }

    bool parse_file(const std::string& path, ParseResult& out) const {
        out = ParseResult();
        std::ifstream in(std::filesystem::u8path(path), std::ios::in | std::ios::binary);
        if (!in) return fail(out, ErrorKind::Io, "Cannot open file: " + path);
        return parse_file(in, std::filesystem::u8path(path).filename().u8string(), out);
    }

    bool parse_file(std::istream& is, const std::string& filename, ParseResult& out) const {
        out = ParseResult();
        const FileKind kind = file_kind_from_name(filename);
        // reject by name before reading anything
        if (kind == FileKind::Unsupported || kind == FileKind::Pdf)
            return parse_buffer(std::string_view(), filename, kind, out);

        std::string bytes;
        if (opt_.max_input_bytes > 0) {
            bytes.resize(opt_.max_input_bytes + 1);
            is.read(&bytes[0], static_cast<std::streamsize>(bytes.size()));
            bytes.resize(static_cast<size_t>(is.gcount()));
        } else {
            bytes.assign(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
        }
        if (is.bad()) return fail(out, ErrorKind::Io, "Cannot read file: " + filename);
        return parse_buffer(bytes, filename, kind, out);
    }

    bool parse_buffer(std::string_view bytes, const std::string& filename, ParseResult& out) const {
        return parse_buffer(bytes, filename, file_kind_from_name(filename), out);
    }

    bool parse_buffer(std::string_view bytes, const std::string& filename, FileKind kind,
                      ParseResult& out) const
    {
        out = ParseResult();
        if (kind == FileKind::Unsupported)
            return fail(out, ErrorKind::UnsupportedExtension, "Unsupported file type: " + extension_of(filename));
        if (kind == FileKind::Pdf)
            return fail(out, ErrorKind::NotImplemented,
                        "PDF parsing is not supported; export the statement as CSV or Excel");
        if (opt_.max_input_bytes > 0 && bytes.size() > opt_.max_input_bytes)
            return fail(out, ErrorKind::InputTooLarge,
                        "File size exceeds " + std::to_string(opt_.max_input_bytes) + " byte limit");

        std::vector<Sheet> sheets;
        std::string err;
        if (!load_tables(bytes, kind, sheets, &err, max_part_bytes()))
            return fail(out, ErrorKind::MalformedTable, err);

        const std::string fallback = opt_.processing_date ? *opt_.processing_date : today_utc_iso();
        SheetSelection sel = select_sheet(sheets, opt_.sample_rows, fallback);
        out.sheets = std::move(sel.reports);
        if (!sel.index)
            return fail(out, ErrorKind::NoTransactionsExtracted, "No transaction data found in any sheet");

        const Sheet& winner = sheets[*sel.index];
        const StatementStats st = compute_stats(sel.transactions);
        const BankInfo bank = detect_bank(winner, filename, opt_.account_scan_rows);

        out.success = true;
        out.transactions = std::move(sel.transactions);
        out.periodStart = st.periodStart;
        out.periodEnd = st.periodEnd;
        out.totalCredits = st.totalCredits;
        out.totalDebits = st.totalDebits;
        out.detectedBank = bank.bank;
        out.accountNumber = bank.accountNumber;
        out.sheetName = winner.name;
        return true;
    }

private:
    ParseOptions opt_;

    std::uint64_t max_part_bytes() const {
        if (opt_.max_input_bytes == 0) return ZipArchive::kDefaultMaxEntrySize;
        return std::min<std::uint64_t>(ZipArchive::kDefaultMaxEntrySize,
                                       std::uint64_t(opt_.max_input_bytes) * opt_.max_expansion);
    }

    // keeps the sheet report, drops everything else
    static bool fail(ParseResult& out, ErrorKind kind, std::string msg) {
        std::vector<SheetReport> reports = std::move(out.sheets);
        out = ParseResult();
        out.sheets = std::move(reports);
        out.errorKind = kind;
        out.error = std::move(msg);
        return false;
    }
};

} // namespace bankstmt
