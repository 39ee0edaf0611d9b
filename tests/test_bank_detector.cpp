#include "bankstmt_bank.hpp"
#include "bankstmt_table.hpp"

#include "test_support.hpp"
#include <iostream>
#include <string>

using bankstmt::Grid;

static bankstmt::Sheet neutral_sheet() {
    return bankstmt::sheet_from_grid("", Grid{
        {"Date", "Description", "Amount"},
        {"2024-03-01", "Grocery store", "-20.00"},
        {"2024-03-02", "Rent payment", "-900.00"},
    });
}

int main() {
    using namespace bankstmt;

    // 1) embedded table
    const BankTable& t = get_bank_table();
    assert(t.size() == 15);
    assert(t.front().name == "Chase");
    assert(t.front().keywords.size() == 2 && t.front().keywords[1] == "jpmorgan");
    assert(t.back().name == "Navy Federal Credit Union");
    assert(&t == &get_bank_table());

    // 2) filename hit
    {
        const BankInfo b = detect_bank(neutral_sheet(), "chase_statement.csv");
        assert(b.bank == "Chase");
        assert(!b.accountNumber);
    }

    // 3) cell text hit, account masked to the last four digits
    {
        const Sheet s = sheet_from_grid("", Grid{
            {"Date", "Description", "Amount"},
            {"", "WELLS FARGO EVERYDAY CHECKING", ""},
            {"", "Account Number: 1234567890", ""},
            {"2024-03-01", "Grocery store", "-20.00"},
        });
        const BankInfo b = detect_bank(s, "export.csv");
        assert(b.bank == "Wells Fargo");
        assert(b.accountNumber && *b.accountNumber == "****7890");
    }

    // 4) header text counts, account only within the scanned rows
    {
        Grid g{{"Date", "Capital One Description", "Amount"}};
        for (int i = 0; i < 5; ++i) g.push_back({"2024-01-0" + std::to_string(i + 1), "Coffee", "-1"});
        g.push_back({"", "account 99998888", ""});
        const Sheet s = sheet_from_grid("", g);
        BankInfo b = detect_bank(s, "x.csv");
        assert(b.bank == "Capital One");
        assert(!b.accountNumber);
        b = detect_bank(s, "x.csv", 6);
        assert(b.accountNumber && *b.accountNumber == "****8888");
    }

    // 5) table order decides: "citi" is checked before "citizens bank"
    {
        const Sheet s = sheet_from_grid("", Grid{{"Citizens Bank statement"}, {"x"}});
        assert(detect_bank(s, "").bank == "Citibank");
    }

    // 6) no hit
    {
        const Sheet s = sheet_from_grid("", Grid{
            {"Date", "Description", "Amount"},
            {"2024-03-01", "Account 12345678", "-20.00"},
        });
        const BankInfo b = detect_bank(s, "statement.csv");
        assert(b.bank == "Unknown Bank");
        assert(!b.accountNumber);
        assert(extract_account_number(s) && *extract_account_number(s) == "****5678");
    }

    // 7) account digits: same line only, long memo cells scan linearly
    {
        assert(find_account_digits("ACCOUNT no. 12-3456789") == "3456789");
        assert(find_account_digits("account 123 then 98765") == "98765");
        assert(find_account_digits("account\n12345678").empty());
        assert(find_account_digits("Account\nAccount #55554444") == "55554444");
        assert(find_account_digits("acc 12345678").empty());

        const std::string memo = "Account holder note: " + std::string(100000, 'x');
        assert(find_account_digits(memo).empty());
        const Sheet s = sheet_from_grid("", Grid{
            {"Date", "Description", "Amount"},
            {"", memo, ""},
            {"", memo + " 44443333", ""},
            {"2024-03-01", "Chase card payment", "-20.00"},
        });
        const BankInfo b = detect_bank(s, "statement.csv");
        assert(b.bank == "Chase");
        assert(b.accountNumber && *b.accountNumber == "****3333");
    }

    std::cout << "test_bank_detector passed\n";
    return 0;
}
