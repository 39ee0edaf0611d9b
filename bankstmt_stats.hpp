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
#include <optional>
#include <string>
#include <vector>

namespace bankstmt {

struct StatementStats {
    double totalCredits{0.0};
    double totalDebits{0.0};
    std::optional<std::string> periodStart;
    std::optional<std::string> periodEnd;
};

// cents, half away from zero
inline double round_cents(double v) { return std::round(v * 100.0) / 100.0; }

inline StatementStats compute_stats(const std::vector<Transaction>& txs) {
    StatementStats st;
    for (const auto& t : txs) {
        if (t.type == TxType::Credit) st.totalCredits += t.amount;
        else st.totalDebits += t.amount;

        if (!st.periodStart || t.date < *st.periodStart) st.periodStart = t.date;
        if (!st.periodEnd || t.date > *st.periodEnd) st.periodEnd = t.date;
    }
    st.totalCredits = round_cents(st.totalCredits);
    st.totalDebits = round_cents(st.totalDebits);
    return st;
}

} // namespace bankstmt
