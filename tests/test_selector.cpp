#include "bankstmt_selector.hpp"
#include "bankstmt_table.hpp"

#include "test_support.hpp"
#include <iostream>
#include <string>

using bankstmt::Grid;

static Grid ledger(int n, const std::string& prefix) {
    Grid g{{"Date", "Description", "Amount"}};
    for (int i = 0; i < n; ++i)
        g.push_back({"2024-02-" + std::string(i < 9 ? "0" : "") + std::to_string(i + 1),
                     prefix + " payment " + std::to_string(i), std::to_string(-(i + 1)) + ".25"});
    return g;
}

int main() {
    using namespace bankstmt;
    const std::string today = "2030-01-01";

    // 1) most transactions wins: counts [0, 7, 4] -> sheet 1
    {
        std::vector<Sheet> sheets{
            sheet_from_grid("Summary", Grid{{"Statement of account"}, {"Prepared for John Doe"}}),
            sheet_from_grid("Checking", ledger(7, "Checking")),
            sheet_from_grid("Savings", ledger(4, "Savings")),
        };
        const SheetSelection sel = select_sheet(sheets, 10, today);
        assert(sel.index && *sel.index == 1);
        assert(sel.transactions.size() == 7);
        assert(sel.transactions[0].description == "Checking payment 0");
        assert(sel.reports.size() == 3);
        assert(sel.reports[0].name == "Summary");
        assert(sel.reports[0].transactionCount == 0);
        assert(sel.reports[1].rowCount == 7);
        assert(sel.reports[1].transactionCount == 7);
        assert(sel.reports[1].columns.amount && *sel.reports[1].columns.amount == "Amount");
        assert(sel.reports[2].transactionCount == 4);
    }

    // 2) equal counts keep the earlier sheet
    {
        std::vector<Sheet> sheets{
            sheet_from_grid("A", ledger(3, "First")),
            sheet_from_grid("B", ledger(3, "Second")),
        };
        const SheetSelection sel = select_sheet(sheets, 10, today);
        assert(sel.index && *sel.index == 0);
        assert(sel.transactions[0].description == "First payment 0");
    }

    // 3) nothing usable anywhere
    {
        std::vector<Sheet> sheets{
            sheet_from_grid("Empty", Grid()),
            sheet_from_grid("Notes", Grid{{"Note"}, {"Nothing to see"}}),
        };
        const SheetSelection sel = select_sheet(sheets, 10, today);
        assert(!sel.index);
        assert(sel.transactions.empty());
        assert(sel.reports.size() == 2);
        assert(sel.reports[0].rowCount == 0);
    }

    // 4) no sheets at all
    {
        const SheetSelection sel = select_sheet({}, 10, today);
        assert(!sel.index && sel.reports.empty());
    }

    std::cout << "test_selector passed\n";
    return 0;
}
