#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QString>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <bankstmt.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("qt-statement-import-demo");

    QCommandLineParser cli;
    cli.setApplicationDescription("Imports a bank statement export (CSV / XLSX / XLS) and prints it as JSON.");
    cli.addHelpOption();
    cli.addPositionalArgument("file", "Statement file to import.");
    QCommandLineOption csvOpt("csv", "Also write the transactions as CSV to <out>.", "out");
    cli.addOption(csvOpt);
    cli.process(app);

    const QStringList args = cli.positionalArguments();
    if (args.size() != 1) {
        qCritical("Expected exactly one statement file");
        return 1;
    }
    const QString path = args.first();

    auto L = [](const char* label, int w = 20){
        return QString(label).leftJustified(w, QLatin1Char(' '));
    };
    auto S = [](const std::string& s){ return QString::fromUtf8(s.c_str()); };

    bankstmt::Parser parser;
    bankstmt::ParseResult result;
    const bool ok = parser.parse_file(path.toUtf8().constData(), result);

    // per-sheet diagnostics
    for (const auto& sh : result.sheets)
    {
        auto col = [&](const std::optional<std::string>& c){ return c ? S(*c) : QString("-"); };
        qDebug().noquote() << L("Sheet:")        << S(sh.name)
                           << " rows=" << sh.rowCount
                           << " transactions=" << sh.transactionCount;
        qDebug().noquote() << L("  date/desc:")  << col(sh.columns.date) << "/" << col(sh.columns.description);
        qDebug().noquote() << L("  amount:")     << col(sh.columns.amount)
                           << " debit=" << col(sh.columns.debit)
                           << " credit=" << col(sh.columns.credit)
                           << " balance=" << col(sh.columns.balance);
    }

    bankstmt::JsonOptions jopt;
    jopt.pretty = true;
    bankstmt::write_json(result, std::cout, jopt);

    if (!ok)
    {
        qCritical("Import failed (%s, HTTP %d): %s",
                  bankstmt::to_string(result.errorKind),
                  bankstmt::http_status_for(result),
                  result.error ? result.error->c_str() : "");
        return 1;
    }

    qInfo().noquote() << L("Sheet used:")    << S(result.sheetName);
    qInfo().noquote() << L("Bank:")          << S(result.detectedBank.value_or(""));
    qInfo().noquote() << L("Period:")        << S(result.periodStart.value_or("")) << ".." << S(result.periodEnd.value_or(""));
    qInfo().noquote() << L("Transactions:")  << result.transactions.size();
    qInfo().noquote() << L("Credits:")       << result.totalCredits;
    qInfo().noquote() << L("Debits:")        << result.totalDebits;

    if (cli.isSet(csvOpt))
    {
        const QString out = cli.value(csvOpt);
        std::ofstream os(std::filesystem::u8path(out.toUtf8().constData()), std::ios::binary);
        if (!os)
        {
            qCritical("Cannot create %s", qUtf8Printable(out));
            return 1;
        }
        bankstmt::ExportOptions opt;
        opt.write_utf8_bom = true;
        opt.signed_amount = true;

        bankstmt::ExportData rows;
        bankstmt::export_transactions_csv(result, &os, &rows, opt);
        if (!os)
        {
            qCritical("Write error on %s", qUtf8Printable(out));
            return 1;
        }

        // skip the header line
        for (size_t i = opt.include_header ? 1 : 0; i < rows.size(); ++i)
        {
            auto v = [&](bankstmt::ExportField f){ return rows[i][bankstmt::to_index(f)]; };
            qDebug().noquote()
                << L("Date:")     << S(v(bankstmt::ExportField::Date).first)
                << "   "
                << L("Amount (signed):", 18) << S(v(bankstmt::ExportField::Amount).second)
                << "   "
                << S(v(bankstmt::ExportField::Merchant).first);
        }
        qInfo("[INFO] CSV written to %s", qUtf8Printable(out));
    }

    qInfo("Done.");
    return 0;
}
