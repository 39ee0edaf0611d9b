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
#include "bankstmt_model.hpp"
#include "bankstmt_normalizer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bankstmt {

struct SheetSelection {
    std::optional<std::size_t> index;        // winning sheet, unset if none yields a transaction
    std::vector<Transaction> transactions;
    std::vector<SheetReport> reports;        // one per input sheet
};

// Every sheet is classified and normalized; the highest transaction count
// wins, the earliest sheet on equal counts
inline SheetSelection select_sheet(const std::vector<Sheet>& sheets, std::size_t sampleRows,
                                   const std::string& fallbackDate)
{
    SheetSelection sel;
    for (std::size_t i = 0; i < sheets.size(); ++i) {
        const Sheet& s = sheets[i];
        SheetReport rep;
        rep.name = s.name;
        rep.rowCount = s.rows.size();
        rep.columns = classify_columns(s, sampleRows);
        std::vector<Transaction> txs = normalize_sheet(s, rep.columns, fallbackDate);
        rep.transactionCount = txs.size();
        sel.reports.push_back(std::move(rep));

        if (!txs.empty() && (!sel.index || txs.size() > sel.transactions.size())) {
            sel.index = i;
            sel.transactions = std::move(txs);
        }
    }
    return sel;
}

} // namespace bankstmt
