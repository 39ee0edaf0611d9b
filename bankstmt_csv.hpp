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
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace bankstmt {

struct ExportOptions {
    char delimiter = ';';
    bool include_header = true;
    bool write_utf8_bom = false;   // Excel-compatible

    // true  => debits written negative
    // false => amount always positive, direction only in "Type"
    bool signed_amount = false;

    bool decimal_comma = false;    // "45,20" instead of "45.20"
};

// Each exported field is a pair:
// first  = display value (formatted as configured)
// second = canonical value (dot decimal, signed, unaffected by options)
using ExportRow = std::vector<std::pair<std::string, std::string>>;
using ExportData = std::vector<ExportRow>;

enum class ExportField {
    Date,
    Description,
    Merchant,
    Amount,
    Type,
    Balance
};

constexpr std::size_t to_index(ExportField f) noexcept {
    return static_cast<std::size_t>(f);
}

inline std::string csv_escape(const std::string& s, char delimiter) {
    bool needQuotes = s.find(delimiter) != std::string::npos ||
                      s.find('"')       != std::string::npos ||
                      s.find('\n')      != std::string::npos ||
                      s.find('\r')      != std::string::npos;
    std::string out = s;
    // double quotes
    for (size_t pos = 0; (pos = out.find('"', pos)) != std::string::npos; pos += 2)
        out.insert(pos, "\"");
    if (needQuotes) {
        out.insert(out.begin(), '"');
        out.push_back('"');
    }
    return out;
}

// 45.2 -> "45.20" / "45,20"; rounded to cents
inline std::string fmt_amount(double v, bool use_decimal_comma = false) {
    std::int64_t cents = static_cast<std::int64_t>(std::llround(v * 100.0));
    const bool neg = cents < 0;
    if (neg) cents = -cents;

    std::ostringstream oss;
    if (neg) oss << '-';
    oss << cents / 100
        << (use_decimal_comma ? ',' : '.')
        << std::setw(2) << std::setfill('0') << cents % 100;
    return oss.str();
}

inline ExportRow export_header_row() {
    return {
        {"Date", "Date"},
        {"Description", "Description"},
        {"Merchant", "Merchant"},
        {"Amount", "Amount"},
        {"Type", "Type"},
        {"Balance", "Balance"}
    };
}

inline ExportRow export_row(const Transaction& t, const ExportOptions& opt) {
    const double signedAmount = t.type == TxType::Debit ? -t.amount : t.amount;
    const double shown = opt.signed_amount ? signedAmount : t.amount;
    return {
        {t.date, t.date},
        {t.description, t.description},
        {t.merchant, t.merchant},
        {fmt_amount(shown, opt.decimal_comma), fmt_amount(signedAmount)},
        {to_string(t.type), to_string(t.type)},
        {t.balance ? fmt_amount(*t.balance, opt.decimal_comma) : std::string(),
         t.balance ? fmt_amount(*t.balance) : std::string()}
    };
}

inline void write_csv_row(std::ostream& os, const ExportRow& row, char D) {
    for (size_t i = 0; i < row.size(); ++i) {
        if (i) os << D;
        os << csv_escape(row[i].first, D);
    }
    os << "\n";
}

// === Export of the transaction list ===================================
inline void export_transactions_csv(const std::vector<Transaction>& txs, std::ostream* osPtr = nullptr,
                                    ExportData* vPtr = nullptr, const ExportOptions& opt = {})
{
    if (osPtr && opt.write_utf8_bom) {
        const unsigned char bom[3] = {0xEF,0xBB,0xBF};
        osPtr->write(reinterpret_cast<const char*>(bom), 3);
    }
    const char D = opt.delimiter;

    if (opt.include_header) {
        ExportRow header = export_header_row();
        if (osPtr) write_csv_row(*osPtr, header, D);
        if (vPtr) vPtr->push_back(std::move(header));
    }
    for (const auto& t : txs) {
        ExportRow row = export_row(t, opt);
        if (osPtr) write_csv_row(*osPtr, row, D);
        if (vPtr) vPtr->push_back(std::move(row));
    }
}

inline void export_transactions_csv(const ParseResult& r, std::ostream* osPtr = nullptr,
                                    ExportData* vPtr = nullptr, const ExportOptions& opt = {})
{
    export_transactions_csv(r.transactions, osPtr, vPtr, opt);
}

} // namespace bankstmt
