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
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <utility>

namespace bankstmt {

// --- Tables ---

// One keyed record; header order is the source column order
using Row = std::vector<std::pair<std::string, std::string>>;

struct Sheet {
    std::string name;             // worksheet name ("" for CSV)
    std::vector<std::string> headers;
    std::vector<Row> rows;
};

// Lookup by header name, nullptr if the row has no such column
inline const std::string* find_cell(const Row& row, const std::string& header) {
    for (const auto& kv : row)
        if (kv.first == header) return &kv.second;
    return nullptr;
}

// --- Column inference ---
enum class ColumnRole { Date, Description, Amount, Debit, Credit, Balance, Unknown };

struct ColumnScore {
    int dateHits{0};
    int amountHits{0};
    int textHits{0};
};

// Role -> header. Unassigned roles stay empty.
struct ColumnMap {
    std::optional<std::string> date;
    std::optional<std::string> description;
    std::optional<std::string> amount;
    std::optional<std::string> debit;
    std::optional<std::string> credit;
    std::optional<std::string> balance;

    ColumnRole role_of(const std::string& header) const {
        if (date && *date == header)               return ColumnRole::Date;
        if (description && *description == header) return ColumnRole::Description;
        if (amount && *amount == header)           return ColumnRole::Amount;
        if (debit && *debit == header)             return ColumnRole::Debit;
        if (credit && *credit == header)           return ColumnRole::Credit;
        if (balance && *balance == header)         return ColumnRole::Balance;
        return ColumnRole::Unknown;
    }
};

// --- Canonical transaction ---
enum class TxType { Debit, Credit };

struct Transaction {
    std::string date;            // YYYY-MM-DD
    std::string description;     // trimmed
    double amount{0.0};          // always >= 0, sign lives in type
    TxType type{TxType::Debit};
    std::optional<double> balance;
    std::string merchant;
};

// --- Result ---
enum class FileKind { Csv, Xlsx, Xls, Pdf, Unsupported };

enum class ErrorKind {
    None,
    UnsupportedExtension,
    NotImplemented,          // pdf
    MalformedTable,
    InputTooLarge,
    NoTransactionsExtracted,
    Io
};

// Per-sheet diagnostics, in workbook order
struct SheetReport {
    std::string name;
    std::size_t rowCount{0};
    ColumnMap columns;
    std::size_t transactionCount{0};
};

struct ParseResult {
    bool success{false};
    std::vector<Transaction> transactions;   // source row order
    std::optional<std::string> periodStart;
    std::optional<std::string> periodEnd;
    double totalCredits{0.0};
    double totalDebits{0.0};
    std::optional<std::string> detectedBank;
    std::optional<std::string> accountNumber;   // "****1234"
    std::optional<std::string> error;
    ErrorKind errorKind{ErrorKind::None};
    std::string sheetName;                    // winning sheet
    std::vector<SheetReport> sheets;
};

inline const char* to_string(TxType t) {
    return t == TxType::Credit ? "credit" : "debit";
}

inline const char* to_string(FileKind k) {
    switch (k) {
    case FileKind::Csv:  return "csv";
    case FileKind::Xlsx: return "xlsx";
    case FileKind::Xls:  return "xls";
    case FileKind::Pdf:  return "pdf";
    default:             return "unsupported";
    }
}

inline const char* to_string(ErrorKind e) {
    switch (e) {
    case ErrorKind::None:                    return "None";
    case ErrorKind::UnsupportedExtension:    return "UnsupportedExtension";
    case ErrorKind::NotImplemented:          return "NotImplemented";
    case ErrorKind::MalformedTable:          return "MalformedTable";
    case ErrorKind::InputTooLarge:           return "InputTooLarge";
    case ErrorKind::NoTransactionsExtracted: return "NoTransactionsExtracted";
    case ErrorKind::Io:                      return "Io";
    }
    return "Unknown";
}

} // namespace bankstmt
