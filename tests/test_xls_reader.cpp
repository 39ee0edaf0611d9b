#include "bankstmt_xls_reader.hpp"

#include "test_fixtures.hpp"
#include "test_support.hpp"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using namespace fixtures;

static BiffBuilder statement_book() {
    BiffBuilder b;
    const size_t s = b.add_sheet("Statement");
    b.label(s, 0, 0, "Date");
    b.label(s, 0, 1, "Description");
    b.label(s, 0, 2, "Amount");
    b.label(s, 0, 3, "Balance");

    b.number(s, 1, 0, 45366, BiffBuilder::kXfDate);
    b.label(s, 1, 1, "Coffee shop");
    b.number(s, 1, 2, -4.5);
    b.rk_int(s, 1, 3, 10050, true);

    b.rk_int(s, 2, 0, 45367, false, BiffBuilder::kXfCustomDate);
    b.formula_string(s, 2, 1, "Salary ACME");
    b.rk_int(s, 2, 2, 2500);
    b.inline_label(s, 2, 3, "n/a");

    b.add_sheet("Chart1", 2);

    const size_t n = b.add_sheet("Notes");
    b.inline_label(n, 0, 0, "Note");
    b.inline_label(n, 0, 1, "Flag");
    b.label(n, 1, 0, "Description");       // shared string reused
    b.boolean(n, 1, 1, true);
    return b;
}

static void check_statement(const std::vector<bankstmt::Sheet>& sheets) {
    using bankstmt::find_cell;
    assert(sheets.size() == 3);
    assert(sheets[0].name == "Statement");
    assert(sheets[1].name == "Chart1");
    assert(sheets[2].name == "Notes");

    const auto& s = sheets[0];
    assert(s.headers.size() == 4);
    assert(s.headers[3] == "Balance");
    assert(s.rows.size() == 2);
    assert(*find_cell(s.rows[0], "Date") == "2024-03-15");
    assert(*find_cell(s.rows[0], "Description") == "Coffee shop");
    assert(*find_cell(s.rows[0], "Amount") == "-4.5");
    assert(*find_cell(s.rows[0], "Balance") == "100.5");
    assert(*find_cell(s.rows[1], "Date") == "2024-03-16");
    assert(*find_cell(s.rows[1], "Description") == "Salary ACME");
    assert(*find_cell(s.rows[1], "Amount") == "2500");
    assert(*find_cell(s.rows[1], "Balance") == "n/a");

    assert(sheets[1].headers.empty() && sheets[1].rows.empty());

    assert(sheets[2].rows.size() == 1);
    assert(*find_cell(sheets[2].rows[0], "Note") == "Description");
    assert(*find_cell(sheets[2].rows[0], "Flag") == "TRUE");
}

int main() {
    using namespace bankstmt;

    // 1) RK values
    assert(decode_rk((7u << 2) | 0x02u) == 7.0);
    assert(decode_rk((static_cast<std::uint32_t>(-3) << 2) | 0x02u) == -3.0);
    assert(decode_rk(0x3FF80000u) == 1.5);
    assert(bankstmt_test::approx(decode_rk(0x3FF80001u), 0.015));

    // 2) BIFF8 workbook stored in regular sectors
    {
        const std::string stream = statement_book().stream();
        assert(stream.size() >= 4096);
        const std::string file = build_cfb({{"Workbook", stream}});
        std::vector<Sheet> sheets;
        std::string err;
        assert(read_xls(file, sheets, &err));
        check_statement(sheets);
    }

    // 3) small workbook in the mini stream, "Book" stream name, split SST
    {
        const std::string stream = statement_book().stream(16, 0);
        assert(stream.size() < 4096);
        const std::string file = build_cfb({{"\x05SummaryInformation", std::string(48, '\0')}, {"Book", stream}});
        std::vector<Sheet> sheets;
        std::string err;
        assert(read_xls(file, sheets, &err));
        check_statement(sheets);
    }

    // 4) long shared strings crossing CONTINUE boundaries
    {
        BiffBuilder b;
        const size_t s = b.add_sheet("Sheet1");
        const std::string longText(300, 'x');
        b.label(s, 0, 0, "Text");
        b.label(s, 1, 0, longText);
        b.label(s, 2, 0, "DEBIT CARD PURCHASE STARBUCKS 4821");
        const std::string file = build_cfb({{"Workbook", b.stream(40)}});
        std::vector<Sheet> sheets;
        assert(read_xls(file, sheets));
        assert(sheets[0].rows.size() == 2);
        assert(*find_cell(sheets[0].rows[0], "Text") == longText);
        assert(*find_cell(sheets[0].rows[1], "Text") == "DEBIT CARD PURCHASE STARBUCKS 4821");
    }

    // 5) 1904 date system
    {
        BiffBuilder b;
        b.set_date1904(true);
        const size_t s = b.add_sheet("S");
        b.label(s, 0, 0, "Date");
        b.number(s, 1, 0, 43830, BiffBuilder::kXfDate);
        std::vector<Sheet> sheets;
        assert(read_xls(build_cfb({{"Workbook", b.stream()}}), sheets));
        assert(*find_cell(sheets[0].rows[0], "Date") == "2024-01-01");
    }

    // 6) XML Spreadsheet 2003
    {
        const std::string xml =
            "\xEF\xBB\xBF\n"
            "<Workbook xmlns=\"urn:schemas-microsoft-com:office:spreadsheet\" "
            "xmlns:ss=\"urn:schemas-microsoft-com:office:spreadsheet\">"
            "<Worksheet ss:Name=\"Konto\"><Table>"
            "<Row><Cell><Data ss:Type=\"String\">Date</Data></Cell>"
            "<Cell><Data ss:Type=\"String\">Text</Data></Cell>"
            "<Cell ss:Index=\"4\"><Data ss:Type=\"String\">Amount</Data></Cell></Row>"
            "<Row><Cell><Data ss:Type=\"DateTime\">2024-03-14T00:00:00.000</Data></Cell>"
            "<Cell ss:MergeAcross=\"1\"><Data ss:Type=\"String\">Grocery <B>store</B></Data></Cell>"
            "<Cell><Data ss:Type=\"Number\">-23.1</Data></Cell></Row>"
            "<Row ss:Index=\"4\"><Cell><Data ss:Type=\"String\">2024-03-15</Data></Cell>"
            "<Cell><Data ss:Type=\"String\">Refund</Data></Cell>"
            "<Cell ss:Index=\"4\"><Data ss:Type=\"Number\">5</Data></Cell></Row>"
            "</Table></Worksheet>"
            "<Worksheet ss:Name=\"Empty\"/>"
            "</Workbook>";
        std::vector<Sheet> sheets;
        std::string err;
        assert(read_xls(xml, sheets, &err));
        assert(sheets.size() == 2);
        const Sheet& s = sheets[0];
        assert(s.name == "Konto");
        assert(s.headers.size() == 4);
        assert(s.headers[2] == "__EMPTY");
        assert(s.rows.size() == 2);
        assert(*find_cell(s.rows[0], "Date") == "2024-03-14");
        assert(*find_cell(s.rows[0], "Text") == "Grocery store");
        assert(*find_cell(s.rows[0], "Amount") == "-23.1");
        assert(*find_cell(s.rows[1], "Amount") == "5");
        assert(sheets[1].name == "Empty" && sheets[1].rows.empty());
    }

    // 7) xlsx package uploaded as .xls
    {
        const std::string bytes = build_xlsx({{"Data", worksheet_xml({{"Date", "Amount"}, {"2024-01-01", "1"}})}});
        std::vector<Sheet> sheets;
        assert(read_xls(bytes, sheets));
        assert(sheets.size() == 1 && sheets[0].rows.size() == 1);
    }

    // 8) rejected inputs
    {
        std::vector<Sheet> sheets;
        std::string err;
        assert(!read_xls("Date,Amount\n2024-01-01,1\n", sheets, &err));
        assert(err.find("unrecognized Excel file format") != std::string::npos);

        // BIFF5 workbook
        std::string biff5;
        std::string bof;
        put16(bof, 0x0500); put16(bof, 0x0005); put16(bof, 0); put16(bof, 0);
        record(biff5, 0x0809, bof);
        record(biff5, 0x000A, std::string());
        err.clear();
        assert(!read_xls(build_cfb({{"Book", biff5}}), sheets, &err));
        assert(err.find("BIFF8") != std::string::npos);

        // compound file without a workbook stream
        err.clear();
        assert(!read_xls(build_cfb({{"WordDocument", std::string(100, 'w')}}), sheets, &err));
        assert(err.find("no workbook stream") != std::string::npos);

        // truncated compound file
        err.clear();
        const std::string file = build_cfb({{"Workbook", statement_book().stream()}});
        assert(!read_xls(file.substr(0, 1024), sheets, &err));
        assert(!err.empty());

        // last cell record cut short (EOF dropped, one payload byte missing)
        std::string cut = statement_book().stream(8224, 0);
        cut.resize(cut.size() - 5);
        err.clear();
        assert(!read_xls(build_cfb({{"Workbook", cut}}), sheets, &err));
        assert(err.find("truncated record") != std::string::npos);
    }

    // 9) sizes declared by the container are checked against the file
    {
        std::vector<Sheet> sheets;
        std::string err;
        const std::string valid = build_cfb({{"Workbook", statement_book().stream()}});

        std::string hugeFat = valid;
        set32(hugeFat, 0x2C, 0xFFFFFFFFu);
        assert(!read_xls(hugeFat, sheets, &err));
        assert(err.find("FAT larger than file") != std::string::npos);

        // DIFAT sector whose next pointer is itself
        std::string loop = valid;
        const std::uint32_t self = static_cast<std::uint32_t>(loop.size() / 512 - 1);
        loop.append(320 * 512, '\0');
        set32(loop, (self + 1) * 512 + 508, self);
        set32(loop, 0x2C, 300);
        set32(loop, 0x44, self);
        set32(loop, 0x48, 0xFFFFFFFFu);
        err.clear();
        assert(!read_xls(loop, sheets, &err));
        assert(err.find("bad DIFAT chain") != std::string::npos);
    }

    // 10) XML Spreadsheet indexes past the worksheet limits
    {
        auto book = [](const std::string& rows) {
            return "<Workbook xmlns=\"urn:schemas-microsoft-com:office:spreadsheet\" "
                   "xmlns:ss=\"urn:schemas-microsoft-com:office:spreadsheet\">"
                   "<Worksheet ss:Name=\"S\"><Table>" + rows + "</Table></Worksheet></Workbook>";
        };
        std::vector<Sheet> sheets;
        std::string err;
        assert(!read_xls(book("<Row ss:Index=\"100000000\"><Cell><Data ss:Type=\"String\">x</Data></Cell></Row>"),
                         sheets, &err));
        assert(err.find("row index out of range") != std::string::npos);

        err.clear();
        assert(!read_xls(book("<Row><Cell ss:Index=\"2000000\"><Data ss:Type=\"String\">x</Data></Cell></Row>"),
                         sheets, &err));
        assert(err.find("column index out of range") != std::string::npos);

        err.clear();
        assert(!read_xls(book("<Row><Cell ss:MergeAcross=\"2000000000\"><Data ss:Type=\"String\">a</Data></Cell>"
                              "<Cell><Data ss:Type=\"String\">b</Data></Cell></Row>"),
                         sheets, &err));
        assert(err.find("column index out of range") != std::string::npos);

        // the last row and column Excel can address are fine
        assert(read_xls(book("<Row><Cell><Data ss:Type=\"String\">H</Data></Cell></Row>"
                             "<Row ss:Index=\"1048576\"><Cell ss:Index=\"16384\"><Data ss:Type=\"String\">x</Data></Cell></Row>"),
                        sheets, &err));
        assert(sheets.size() == 1 && sheets[0].rows.size() == 1);
    }

    std::cout << "test_xls_reader passed\n";
    return 0;
}
