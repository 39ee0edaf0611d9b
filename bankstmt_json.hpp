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
#include "bankstmt_numfmt.hpp"
#include "bankstmt_text.hpp"
#include <cmath>
#include <cstdio>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace bankstmt {

struct JsonOptions {
    bool pretty = false;                 // two-space indentation
    bool include_sheet_report = false;   // adds "sheetName" and "sheets"
};

// Quoted JSON string. Bytes that are not valid UTF-8 (Latin-1 or
// Windows-1252 exports) become U+FFFD so the document stays valid.
inline std::string json_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for_each_codepoint(s, [&](utf8proc_int32_t cp, std::size_t off, std::size_t len) {
        switch (cp) {
        case -1:   append_utf8(out, 0xFFFD); break;
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (cp < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(cp));
                out += buf;
            } else {
                out.append(s.substr(off, len));
            }
        }
    });
    out.push_back('"');
    return out;
}

// Shortest round-trip form; non-finite values have no JSON number
inline std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    return format_number(v);
}

namespace detail {

// Small writer keeping separators and indentation in one place
class JsonWriter {
public:
    JsonWriter(std::ostream& os, bool pretty) : os_(os), pretty_(pretty) {}

    void begin_object() { value_prefix(); os_ << '{'; push(); }
    void end_object()   { pop(); os_ << '}'; }
    void begin_array()  { value_prefix(); os_ << '['; push(); }
    void end_array()    { pop(); os_ << ']'; }

    void key(std::string_view k) {
        item_prefix();
        os_ << json_escape(k) << (pretty_ ? ": " : ":");
        afterKey_ = true;
    }
    void value(std::string_view s) { value_prefix(); os_ << json_escape(s); }
    void value(const char* s)      { value(std::string_view(s)); }
    void value(double v)           { value_prefix(); os_ << json_number(v); }
    void value(bool b)             { value_prefix(); os_ << (b ? "true" : "false"); }
    void value(std::size_t n)      { value_prefix(); os_ << n; }

    template <class T>
    void field(std::string_view k, const T& v) { key(k); value(v); }

private:
    std::ostream& os_;
    bool pretty_;
    bool afterKey_{false};
    std::vector<int> counts_;   // items written per open container

    void push() { counts_.push_back(0); }
    void pop() {
        const int n = counts_.back();
        counts_.pop_back();
        if (pretty_ && n > 0) newline();
    }
    void newline() {
        os_ << '\n';
        for (size_t i = 0; i < counts_.size(); ++i) os_ << "  ";
    }
    void item_prefix() {
        if (counts_.empty()) return;
        if (counts_.back()++ > 0) os_ << ',';
        if (pretty_) newline();
    }
    void value_prefix() {
        if (afterKey_) { afterKey_ = false; return; }
        item_prefix();
    }
};

inline void write_column_map(JsonWriter& w, const ColumnMap& m) {
    w.begin_object();
    auto opt = [&](const char* k, const std::optional<std::string>& v) { if (v) w.field(k, *v); };
    opt("date", m.date);
    opt("description", m.description);
    opt("amount", m.amount);
    opt("debit", m.debit);
    opt("credit", m.credit);
    opt("balance", m.balance);
    w.end_object();
}

} // namespace detail

// ParseResult as a JSON object; unset optionals are omitted
inline void write_json(const ParseResult& r, std::ostream& os, const JsonOptions& opt = {}) {
    detail::JsonWriter w(os, opt.pretty);
    w.begin_object();
    w.field("success", r.success);

    w.key("transactions");
    w.begin_array();
    for (const auto& t : r.transactions) {
        w.begin_object();
        w.field("date", t.date);
        w.field("description", t.description);
        w.field("amount", t.amount);
        w.field("type", to_string(t.type));
        if (t.balance) w.field("balance", *t.balance);
        w.field("merchant", t.merchant);
        w.end_object();
    }
    w.end_array();

    if (r.periodStart) w.field("periodStart", *r.periodStart);
    if (r.periodEnd) w.field("periodEnd", *r.periodEnd);
    w.field("totalCredits", r.totalCredits);
    w.field("totalDebits", r.totalDebits);
    if (r.detectedBank) w.field("detectedBank", *r.detectedBank);
    if (r.accountNumber) w.field("accountNumber", *r.accountNumber);
    if (r.error) w.field("error", *r.error);

    if (opt.include_sheet_report) {
        if (r.errorKind != ErrorKind::None) w.field("errorKind", to_string(r.errorKind));
        if (r.success) w.field("sheetName", r.sheetName);
        w.key("sheets");
        w.begin_array();
        for (const auto& s : r.sheets) {
            w.begin_object();
            w.field("name", s.name);
            w.field("rowCount", s.rowCount);
            w.key("columns");
            detail::write_column_map(w, s.columns);
            w.field("transactionCount", s.transactionCount);
            w.end_object();
        }
        w.end_array();
    }
    w.end_object();
    if (opt.pretty) os << '\n';
}

inline std::string to_json(const ParseResult& r, const JsonOptions& opt = {}) {
    std::ostringstream oss;
    write_json(r, oss, opt);
    return oss.str();
}

} // namespace bankstmt
