#include "bankstmt_stats.hpp"

#include "test_support.hpp"
#include <iostream>
#include <vector>

using bankstmt_test::approx;

static bankstmt::Transaction tx(const char* date, double amount, bankstmt::TxType type) {
    bankstmt::Transaction t;
    t.date = date;
    t.description = "x";
    t.amount = amount;
    t.type = type;
    t.merchant = "x";
    return t;
}

int main() {
    using namespace bankstmt;

    // 1) rounding at the cent, half away from zero
    assert(approx(round_cents(10.125), 10.13));
    assert(approx(round_cents(2.5), 2.5));
    assert(approx(round_cents(-1.125), -1.13));

    // 2) totals by type and the covered period
    {
        const std::vector<Transaction> txs{
            tx("2024-03-10", 0.1, TxType::Debit),
            tx("2024-01-31", 2500, TxType::Credit),
            tx("2024-03-02", 0.2, TxType::Debit),
            tx("2024-02-15", 10.125, TxType::Credit),
        };
        const StatementStats st = compute_stats(txs);
        assert(approx(st.totalDebits, 0.3));
        assert(approx(st.totalCredits, 2510.13));
        assert(st.periodStart && *st.periodStart == "2024-01-31");
        assert(st.periodEnd && *st.periodEnd == "2024-03-10");
        assert(*st.periodStart <= *st.periodEnd);
    }

    // 3) single transaction: start == end
    {
        const StatementStats st = compute_stats({tx("2024-05-05", 1, TxType::Debit)});
        assert(*st.periodStart == "2024-05-05" && *st.periodEnd == "2024-05-05");
        assert(approx(st.totalCredits, 0.0));
    }

    // 4) empty input
    {
        const StatementStats st = compute_stats({});
        assert(!st.periodStart && !st.periodEnd);
        assert(st.totalCredits == 0.0 && st.totalDebits == 0.0);
    }

    std::cout << "test_stats passed\n";
    return 0;
}
