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
#include "bankstmt_table.hpp"
#include "bankstmt_numfmt.hpp"
#include "bankstmt_xml.hpp"
#include "bankstmt_zip.hpp"
#include <pugixml.hpp>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bankstmt {

// ---------- Part paths ----------

// Resolve a relationship target against the directory of its source part
inline std::string resolve_part(const std::string& baseDir, const std::string& target) {
    if (!target.empty() && target[0] == '/') return target.substr(1);
    std::string path = baseDir + target;

    // collapse "dir/../"
    std::vector<std::string> segs;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        if (pos == std::string::npos) pos = path.size();
        std::string seg = path.substr(start, pos - start);
        if (seg == "..") { if (!segs.empty()) segs.pop_back(); }
        else if (!seg.empty() && seg != ".") segs.push_back(std::move(seg));
        start = pos + 1;
    }
    std::string out;
    for (size_t i = 0; i < segs.size(); ++i) {
        if (i) out.push_back('/');
        out += segs[i];
    }
    return out;
}

inline std::string dir_of(const std::string& part) {
    const size_t p = part.find_last_of('/');
    return p == std::string::npos ? std::string() : part.substr(0, p + 1);
}

inline std::string rels_of(const std::string& part) {
    const size_t p = part.find_last_of('/');
    if (p == std::string::npos) return "_rels/" + part + ".rels";
    return part.substr(0, p + 1) + "_rels/" + part.substr(p + 1) + ".rels";
}

// "AB12" -> 27 (zero-based column), -1 if no letters
inline int column_from_ref(std::string_view ref) {
    int col = 0;
    size_t i = 0;
    while (i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i]))) {
        col = col * 26 + (std::toupper(static_cast<unsigned char>(ref[i])) - 'A' + 1);
        ++i;
        if (col > int(kMaxSheetColumns)) return -1;
    }
    return i == 0 ? -1 : col - 1;
}

// ---------- Workbook parts ----------

// Concatenated text runs of a shared/inline string, phonetic runs skipped
inline void collect_string_item(const pugi::xml_node& si, std::string& out) {
    for (pugi::xml_node c = si.first_child(); c; c = c.next_sibling()) {
        if (c.type() != pugi::node_element) continue;
        if (isln(c, "t")) out += raw_txt(c);
        else if (isln(c, "r")) collect_string_item(c, out);
    }
}

inline bool read_shared_strings(const pugi::xml_document& doc, std::vector<std::string>& out) {
    pugi::xml_node sst = doc.document_element();
    for (pugi::xml_node si = sst.first_child(); si; si = si.next_sibling()) {
        if (!isln(si, "si")) continue;
        std::string s;
        collect_string_item(si, s);
        out.push_back(std::move(s));
    }
    return true;
}

// cellXfs index -> "is a date format"
inline std::vector<bool> read_date_styles(const pugi::xml_document& doc) {
    std::unordered_map<int, std::string> custom;
    pugi::xml_node root = doc.document_element();
    if (pugi::xml_node fmts = child_any(root, "numFmts")) {
        for (pugi::xml_node f = fmts.first_child(); f; f = f.next_sibling()) {
            if (!isln(f, "numFmt")) continue;
            custom[attr_any(f, "numFmtId").as_int(-1)] = attr_text(f, "formatCode");
        }
    }
    std::vector<bool> out;
    if (pugi::xml_node xfs = child_any(root, "cellXfs")) {
        for (pugi::xml_node xf = xfs.first_child(); xf; xf = xf.next_sibling()) {
            if (!isln(xf, "xf")) continue;
            const int id = attr_any(xf, "numFmtId").as_int(0);
            auto it = custom.find(id);
            out.push_back(it != custom.end() ? is_date_format_code(it->second) : is_builtin_date_format(id));
        }
    }
    return out;
}

struct XlsxContext {
    std::vector<std::string> sharedStrings;
    std::vector<bool> dateStyles;
    bool date1904{false};
};

inline std::string xlsx_cell_text(const pugi::xml_node& c, const XlsxContext& ctx) {
    const std::string t = attr_text(c, "t");
    if (t == "inlineStr") {
        std::string s;
        if (pugi::xml_node is = child_any(c, "is")) collect_string_item(is, s);
        return s;
    }
    pugi::xml_node v = child_any(c, "v");
    if (!v) return std::string();
    const std::string val = raw_txt(v);

    if (t == "s") {
        char* end = nullptr;
        const long idx = std::strtol(val.c_str(), &end, 10);
        if (end == val.c_str() || idx < 0 || (size_t)idx >= ctx.sharedStrings.size()) return std::string();
        return ctx.sharedStrings[(size_t)idx];
    }
    if (t == "b") return val == "1" ? "TRUE" : "FALSE";
    if (t == "str" || t == "e") return val;
    if (t == "d") return val.size() >= 10 ? val.substr(0, 10) : val;

    // numeric
    const int s = attr_any(c, "s").as_int(0);
    const bool isDate = s >= 0 && (size_t)s < ctx.dateStyles.size() && ctx.dateStyles[(size_t)s];
    if (!isDate) return val;
    double d = 0.0;
    auto [p, ec] = std::from_chars(val.data(), val.data() + val.size(), d);
    if (ec != std::errc() || p != val.data() + val.size()) return val;
    return render_numeric_cell(d, true, ctx.date1904);
}

inline Grid read_worksheet_grid(const pugi::xml_document& doc, const XlsxContext& ctx) {
    Grid grid;
    pugi::xml_node data = child_any(doc.document_element(), "sheetData");
    if (!data) return grid;

    for (pugi::xml_node row = data.first_child(); row; row = row.next_sibling()) {
        if (!isln(row, "row")) continue;
        std::vector<std::string> cells;
        int next = 0;
        for (pugi::xml_node c = row.first_child(); c; c = c.next_sibling()) {
            if (!isln(c, "c")) continue;
            int col = column_from_ref(attr_text(c, "r"));
            if (col < 0) col = next;
            next = col + 1;
            if ((size_t)col >= cells.size()) cells.resize((size_t)col + 1);
            cells[(size_t)col] = xlsx_cell_text(c, ctx);
        }
        grid.push_back(std::move(cells));
    }
    return grid;
}

// ---------- Reader ----------

// Office Open XML workbook -> one Sheet per workbook sheet, workbook order.
// maxPartBytes bounds the uncompressed size of every package part.
inline bool read_xlsx(std::string_view bytes, std::vector<Sheet>& out, std::string* error = nullptr,
                      std::uint64_t maxPartBytes = ZipArchive::kDefaultMaxEntrySize)
{
    ZipArchive zip(maxPartBytes);
    if (!zip.open(bytes, error)) return false;

    // package root -> workbook part
    std::string workbookPart = "xl/workbook.xml";
    {
        std::string relsXml;
        if (zip.find("_rels/.rels")) {
            if (!zip.extract("_rels/.rels", relsXml, error)) return false;
            pugi::xml_document rels;
            if (!load_xml(rels, relsXml, "_rels/.rels", error)) return false;
            for (pugi::xml_node r = rels.document_element().first_child(); r; r = r.next_sibling()) {
                if (ends_with(attr_text(r, "Type"), "/officeDocument")) {
                    workbookPart = resolve_part(std::string(), attr_text(r, "Target"));
                    break;
                }
            }
        }
    }

    std::string xml;
    pugi::xml_document wb;
    if (!zip.extract(workbookPart, xml, error)) return false;
    if (!load_xml(wb, xml, "workbook", error)) return false;

    XlsxContext ctx;
    if (pugi::xml_node pr = child_any(wb.document_element(), "workbookPr")) {
        const std::string d = attr_text(pr, "date1904");
        ctx.date1904 = (d == "1" || d == "true");
    }

    // relationship id -> part path
    std::unordered_map<std::string, std::string> targets;
    std::string sharedPart, stylesPart;
    {
        const std::string relsPart = rels_of(workbookPart);
        pugi::xml_document rels;
        if (!zip.extract(relsPart, xml, error)) return false;
        if (!load_xml(rels, xml, "workbook relationships", error)) return false;
        const std::string base = dir_of(workbookPart);
        for (pugi::xml_node r = rels.document_element().first_child(); r; r = r.next_sibling()) {
            if (!isln(r, "Relationship")) continue;
            const std::string type = attr_text(r, "Type");
            const std::string path = resolve_part(base, attr_text(r, "Target"));
            targets[attr_text(r, "Id")] = path;
            if (ends_with(type, "/sharedStrings")) sharedPart = path;
            else if (ends_with(type, "/styles")) stylesPart = path;
        }
    }

    if (!sharedPart.empty() && zip.find(sharedPart)) {
        pugi::xml_document doc;
        if (!zip.extract(sharedPart, xml, error)) return false;
        if (!load_xml(doc, xml, "shared strings", error)) return false;
        read_shared_strings(doc, ctx.sharedStrings);
    }
    if (!stylesPart.empty() && zip.find(stylesPart)) {
        pugi::xml_document doc;
        if (!zip.extract(stylesPart, xml, error)) return false;
        if (!load_xml(doc, xml, "styles", error)) return false;
        ctx.dateStyles = read_date_styles(doc);
    }

    pugi::xml_node sheets = child_any(wb.document_element(), "sheets");
    if (!sheets) {
        if (error) *error = "Workbook has no sheets";
        return false;
    }

    std::vector<Sheet> result;
    for (pugi::xml_node s = sheets.first_child(); s; s = s.next_sibling()) {
        if (!isln(s, "sheet")) continue;
        const std::string name = attr_text(s, "name");
        auto it = targets.find(attr_text(s, "id"));
        if (it == targets.end() || !zip.find(it->second)) {
            // chart sheets and dangling entries carry no cells
            result.push_back(sheet_from_grid(name, Grid()));
            continue;
        }
        pugi::xml_document ws;
        if (!zip.extract(it->second, xml, error)) return false;
        if (!load_xml(ws, xml, "worksheet", error)) return false;
        result.push_back(sheet_from_grid(name, read_worksheet_grid(ws, ctx)));
    }

    out = std::move(result);
    return true;
}

} // namespace bankstmt
