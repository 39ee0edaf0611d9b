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
#include "bankstmt_cfb.hpp"
#include "bankstmt_numfmt.hpp"
#include "bankstmt_table.hpp"
#include "bankstmt_xlsx_reader.hpp"
#include "bankstmt_xml.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bankstmt {

// ---------- BIFF8 record ids ----------
namespace biff {
constexpr std::uint16_t kFormula    = 0x0006;
constexpr std::uint16_t kEof        = 0x000A;
constexpr std::uint16_t kDateMode   = 0x0022;
constexpr std::uint16_t kContinue   = 0x003C;
constexpr std::uint16_t kBoundSheet = 0x0085;
constexpr std::uint16_t kMulRk      = 0x00BD;
constexpr std::uint16_t kRString    = 0x00D6;
constexpr std::uint16_t kXf         = 0x00E0;
constexpr std::uint16_t kSst        = 0x00FC;
constexpr std::uint16_t kLabelSst   = 0x00FD;
constexpr std::uint16_t kNumber     = 0x0203;
constexpr std::uint16_t kLabel      = 0x0204;
constexpr std::uint16_t kBoolErr    = 0x0205;
constexpr std::uint16_t kString     = 0x0207;
constexpr std::uint16_t kRk         = 0x027E;
constexpr std::uint16_t kFormat     = 0x041E;
constexpr std::uint16_t kBof        = 0x0809;
} // namespace biff

struct BiffRecord {
    std::uint16_t type{0};
    std::string_view data;
    size_t offset{0};   // stream offset of the record header
};

inline std::uint16_t biff_u16(std::string_view s, size_t p) {
    return (std::uint16_t)((unsigned char)s[p] | ((unsigned char)s[p+1] << 8));
}
inline std::uint32_t biff_u32(std::string_view s, size_t p) {
    return (std::uint32_t)biff_u16(s, p) | ((std::uint32_t)biff_u16(s, p + 2) << 16);
}
inline double biff_f64(std::string_view s, size_t p) {
    std::uint64_t bits = (std::uint64_t)biff_u32(s, p) | ((std::uint64_t)biff_u32(s, p + 4) << 32);
    double d;
    std::memcpy(&d, &bits, sizeof(d));
    return d;
}

// RK: 30-bit integer or truncated double, optionally scaled by 1/100
inline double decode_rk(std::uint32_t rk) {
    double v;
    if (rk & 0x02) {
        v = static_cast<double>(static_cast<std::int32_t>(rk) >> 2);
    } else {
        const std::uint64_t bits = (std::uint64_t)(rk & 0xFFFFFFFCu) << 32;
        std::memcpy(&v, &bits, sizeof(v));
    }
    return (rk & 0x01) ? v / 100.0 : v;
}

// Splits a BIFF stream into records; false if a record runs past the end
inline bool split_biff_records(std::string_view stream, size_t from, std::vector<BiffRecord>& out,
                               bool stopAtEof, std::string* error)
{
    size_t p = from;
    while (p + 4 <= stream.size()) {
        BiffRecord r;
        r.offset = p;
        r.type = biff_u16(stream, p);
        const std::uint16_t len = biff_u16(stream, p + 2);
        if (p + 4 + len > stream.size()) {
            if (error) *error = "XLS error: truncated record";
            return false;
        }
        r.data = stream.substr(p + 4, len);
        out.push_back(r);
        p += 4 + len;
        if (stopAtEof && r.type == biff::kEof) break;
    }
    return true;
}

// Byte reader over a record plus its CONTINUE records. Character data that
// crosses into a CONTINUE record restarts with a fresh option byte.
class BiffCursor {
public:
    explicit BiffCursor(std::vector<std::string_view> segs) : segs_(std::move(segs)) {}

    bool u8(std::uint8_t& v) {
        if (!ensure()) return false;
        v = (std::uint8_t)segs_[idx_][pos_++];
        return true;
    }
    bool u16(std::uint16_t& v) {
        std::uint8_t a, b;
        if (!u8(a) || !u8(b)) return false;
        v = (std::uint16_t)(a | (b << 8));
        return true;
    }
    bool u32(std::uint32_t& v) {
        std::uint16_t a, b;
        if (!u16(a) || !u16(b)) return false;
        v = (std::uint32_t)a | ((std::uint32_t)b << 16);
        return true;
    }
    bool skip(size_t n) {
        std::uint8_t dummy;
        while (n--) if (!u8(dummy)) return false;
        return true;
    }

    // cch characters, 8-bit (Latin-1) or UTF-16LE depending on highByte
    bool chars(size_t cch, bool highByte, std::string& out) {
        std::uint16_t pendingHigh = 0;
        while (cch > 0) {
            if (idx_ < segs_.size() && pos_ >= segs_[idx_].size()) {
                // continuation: new option byte decides the width
                if (idx_ + 1 >= segs_.size()) return false;
                ++idx_;
                pos_ = 0;
                std::uint8_t flags;
                if (!u8(flags)) return false;
                highByte = (flags & 0x01) != 0;
            }
            std::uint16_t ch;
            if (highByte) {
                if (!u16(ch)) return false;
            } else {
                std::uint8_t c;
                if (!u8(c)) return false;
                ch = c;
            }
            if (ch >= 0xD800 && ch <= 0xDBFF) {
                pendingHigh = ch;
            } else if (ch >= 0xDC00 && ch <= 0xDFFF && pendingHigh) {
                append_utf8(out, 0x10000 + ((pendingHigh - 0xD800) << 10) + (ch - 0xDC00));
                pendingHigh = 0;
            } else {
                append_utf8(out, ch);
                pendingHigh = 0;
            }
            --cch;
        }
        return true;
    }

private:
    std::vector<std::string_view> segs_;
    size_t idx_{0};
    size_t pos_{0};

    bool ensure() {
        while (idx_ < segs_.size() && pos_ >= segs_[idx_].size()) { ++idx_; pos_ = 0; }
        return idx_ < segs_.size();
    }
};

// XLUnicodeRichExtendedString (SST items) or XLUnicodeString when cch16
inline bool read_biff_string(BiffCursor& cur, bool cch16, std::string& out) {
    std::uint16_t cch = 0;
    if (cch16) {
        if (!cur.u16(cch)) return false;
    } else {
        std::uint8_t c8;
        if (!cur.u8(c8)) return false;
        cch = c8;
    }
    std::uint8_t flags;
    if (!cur.u8(flags)) return false;
    std::uint16_t runs = 0;
    std::uint32_t ext = 0;
    if ((flags & 0x08) && !cur.u16(runs)) return false;
    if ((flags & 0x04) && !cur.u32(ext)) return false;
    if (!cur.chars(cch, (flags & 0x01) != 0, out)) return false;
    return cur.skip(size_t(runs) * 4) && cur.skip(ext);
}

struct BiffWorkbook {
    struct SheetRef { std::string name; std::uint32_t pos{0}; std::uint8_t kind{0}; };
    std::vector<SheetRef> sheets;
    std::vector<std::string> sst;
    std::vector<bool> xfIsDate;
    bool date1904{false};
};

inline bool read_biff_globals(const std::vector<BiffRecord>& recs, BiffWorkbook& wb, std::string* error) {
    if (recs.empty() || recs[0].type != biff::kBof || recs[0].data.size() < 2) {
        if (error) *error = "XLS error: workbook stream does not start with BOF";
        return false;
    }
    if (biff_u16(recs[0].data, 0) != 0x0600) {
        if (error) *error = "XLS error: only BIFF8 (Excel 97-2003) workbooks are supported";
        return false;
    }

    std::unordered_map<std::uint16_t, std::string> formats;
    std::vector<std::uint16_t> xfFormats;

    for (size_t i = 1; i < recs.size(); ++i) {
        const BiffRecord& r = recs[i];
        if (r.type == biff::kEof) break;
        switch (r.type) {
        case biff::kBoundSheet: {
            if (r.data.size() < 8) break;
            BiffWorkbook::SheetRef s;
            s.pos = biff_u32(r.data, 0);
            s.kind = (std::uint8_t)r.data[5];
            BiffCursor cur({r.data.substr(6)});
            if (!read_biff_string(cur, false, s.name)) {
                if (error) *error = "XLS error: bad sheet name";
                return false;
            }
            wb.sheets.push_back(std::move(s));
            break;
        }
        case biff::kSst: {
            std::vector<std::string_view> segs{r.data.substr(std::min<size_t>(8, r.data.size()))};
            while (i + 1 < recs.size() && recs[i + 1].type == biff::kContinue) segs.push_back(recs[++i].data);
            const std::uint32_t unique = r.data.size() >= 8 ? biff_u32(r.data, 4) : 0;
            BiffCursor cur(std::move(segs));
            for (std::uint32_t k = 0; k < unique; ++k) {
                std::string s;
                if (!read_biff_string(cur, true, s)) {
                    if (error) *error = "XLS error: bad shared string table";
                    return false;
                }
                wb.sst.push_back(std::move(s));
            }
            break;
        }
        case biff::kFormat: {
            if (r.data.size() < 5) break;
            const std::uint16_t id = biff_u16(r.data, 0);
            BiffCursor cur({r.data.substr(2)});
            std::string code;
            if (read_biff_string(cur, true, code)) formats[id] = code;
            break;
        }
        case biff::kXf:
            if (r.data.size() >= 4) xfFormats.push_back(biff_u16(r.data, 2));
            break;
        case biff::kDateMode:
            if (r.data.size() >= 2) wb.date1904 = biff_u16(r.data, 0) == 1;
            break;
        default:
            break;
        }
    }

    for (std::uint16_t id : xfFormats) {
        auto it = formats.find(id);
        wb.xfIsDate.push_back(it != formats.end() ? is_date_format_code(it->second) : is_builtin_date_format(id));
    }
    return true;
}

inline Grid read_biff_sheet_grid(const std::vector<BiffRecord>& recs, const BiffWorkbook& wb) {
    std::map<std::uint16_t, std::vector<std::string>> rows;
    auto put = [&](std::uint16_t row, std::uint16_t col, std::string v) {
        auto& cells = rows[row];
        if (cells.size() <= col) cells.resize(size_t(col) + 1);
        cells[col] = std::move(v);
    };
    auto numeric = [&](std::uint16_t xf, double v) {
        const bool isDate = xf < wb.xfIsDate.size() && wb.xfIsDate[xf];
        return render_numeric_cell(v, isDate, wb.date1904);
    };

    // FORMULA with a string result is followed by a STRING record
    bool pendingString = false;
    std::uint16_t pendRow = 0, pendCol = 0;

    for (size_t i = 1; i < recs.size(); ++i) {
        const BiffRecord& r = recs[i];
        const std::string_view d = r.data;
        if (r.type == biff::kEof) break;

        switch (r.type) {
        case biff::kLabelSst:
            if (d.size() >= 10) {
                const std::uint32_t idx = biff_u32(d, 6);
                put(biff_u16(d, 0), biff_u16(d, 2), idx < wb.sst.size() ? wb.sst[idx] : std::string());
            }
            break;
        case biff::kLabel:
        case biff::kRString:
            if (d.size() >= 9) {
                BiffCursor cur({d.substr(6)});
                std::string s;
                if (read_biff_string(cur, true, s)) put(biff_u16(d, 0), biff_u16(d, 2), std::move(s));
            }
            break;
        case biff::kNumber:
            if (d.size() >= 14) put(biff_u16(d, 0), biff_u16(d, 2), numeric(biff_u16(d, 4), biff_f64(d, 6)));
            break;
        case biff::kRk:
            if (d.size() >= 10) put(biff_u16(d, 0), biff_u16(d, 2), numeric(biff_u16(d, 4), decode_rk(biff_u32(d, 6))));
            break;
        case biff::kMulRk:
            if (d.size() >= 6) {
                const std::uint16_t row = biff_u16(d, 0);
                std::uint16_t col = biff_u16(d, 2);
                for (size_t p = 4; p + 6 <= d.size() - 2; p += 6, ++col)
                    put(row, col, numeric(biff_u16(d, p), decode_rk(biff_u32(d, p + 2))));
            }
            break;
        case biff::kBoolErr:
            if (d.size() >= 8) {
                const std::uint8_t v = (std::uint8_t)d[6];
                const bool isErr = d[7] != 0;
                put(biff_u16(d, 0), biff_u16(d, 2), isErr ? std::string("#ERR") : (v ? "TRUE" : "FALSE"));
            }
            break;
        case biff::kFormula:
            if (d.size() >= 14) {
                const std::uint16_t row = biff_u16(d, 0), col = biff_u16(d, 2);
                if ((std::uint8_t)d[12] == 0xFF && (std::uint8_t)d[13] == 0xFF) {
                    const std::uint8_t kind = (std::uint8_t)d[6];
                    if (kind == 0) { pendingString = true; pendRow = row; pendCol = col; }
                    else if (kind == 1) put(row, col, d[8] ? "TRUE" : "FALSE");
                } else {
                    put(row, col, numeric(biff_u16(d, 4), biff_f64(d, 6)));
                }
            }
            break;
        case biff::kString:
            if (pendingString) {
                BiffCursor cur({d});
                std::string s;
                if (read_biff_string(cur, true, s)) put(pendRow, pendCol, std::move(s));
                pendingString = false;
            }
            break;
        default:
            break;
        }
    }

    Grid grid;
    grid.reserve(rows.size());
    for (auto& kv : rows) grid.push_back(std::move(kv.second));
    return grid;
}

// Excel 97-2003 workbook inside a compound file
inline bool read_biff8(std::string_view bytes, std::vector<Sheet>& out, std::string* error) {
    CompoundFile cfb;
    if (!cfb.open(bytes, error)) return false;
    const CompoundFile::DirEntry* e = cfb.find_stream("Workbook");
    if (!e) e = cfb.find_stream("Book");
    if (!e) {
        if (error) *error = "XLS error: no workbook stream";
        return false;
    }
    std::string stream;
    if (!cfb.read_stream(*e, stream, error)) return false;

    std::vector<BiffRecord> globals;
    if (!split_biff_records(stream, 0, globals, true, error)) return false;
    BiffWorkbook wb;
    if (!read_biff_globals(globals, wb, error)) return false;

    std::vector<Sheet> result;
    for (const auto& s : wb.sheets) {
        // only worksheets (kind 0) hold cells; chart and macro sheets come out empty
        if (s.kind != 0 || s.pos >= stream.size()) {
            result.push_back(sheet_from_grid(s.name, Grid()));
            continue;
        }
        std::vector<BiffRecord> recs;
        if (!split_biff_records(stream, s.pos, recs, true, error)) return false;
        if (recs.empty() || recs[0].type != biff::kBof) {
            if (error) *error = "XLS error: sheet '" + s.name + "' does not start with BOF";
            return false;
        }
        result.push_back(sheet_from_grid(s.name, read_biff_sheet_grid(recs, wb)));
    }
    out = std::move(result);
    return true;
}

// ---------- XML Spreadsheet 2003 ----------

inline void all_text(const pugi::xml_node& n, std::string& out) {
    for (pugi::xml_node c = n.first_child(); c; c = c.next_sibling()) {
        if (c.type() == pugi::node_pcdata || c.type() == pugi::node_cdata) out += c.value();
        else if (c.type() == pugi::node_element) all_text(c, out);
    }
}

inline bool read_spreadsheet_ml(std::string_view bytes, std::vector<Sheet>& out, std::string* error) {
    pugi::xml_document doc;
    if (!load_xml(doc, bytes, "XML spreadsheet", error)) return false;
    pugi::xml_node root = doc.document_element();
    if (!isln(root, "Workbook")) {
        if (error) *error = "XLS error: unrecognized XML document";
        return false;
    }

    std::vector<Sheet> result;
    for (pugi::xml_node ws = root.first_child(); ws; ws = ws.next_sibling()) {
        if (!isln(ws, "Worksheet")) continue;
        Grid grid;
        if (pugi::xml_node table = child_any(ws, "Table")) {
            size_t rowIdx = 0;
            for (pugi::xml_node row = table.first_child(); row; row = row.next_sibling()) {
                if (!isln(row, "Row")) continue;
                const int ri = attr_any(row, "Index").as_int(0);
                if (ri > 0 && size_t(ri - 1) > rowIdx) rowIdx = size_t(ri - 1);
                if (rowIdx >= kMaxSheetRows) {
                    if (error) *error = "XLS error: row index out of range";
                    return false;
                }
                if (grid.size() <= rowIdx) grid.resize(rowIdx + 1);
                auto& cells = grid[rowIdx];

                size_t col = 0;
                for (pugi::xml_node cell = row.first_child(); cell; cell = cell.next_sibling()) {
                    if (!isln(cell, "Cell")) continue;
                    const int ci = attr_any(cell, "Index").as_int(0);
                    if (ci > 0) col = size_t(ci - 1);
                    if (col >= kMaxSheetColumns) {
                        if (error) *error = "XLS error: column index out of range";
                        return false;
                    }
                    std::string v;
                    if (pugi::xml_node data = child_any(cell, "Data")) {
                        all_text(data, v);
                        if (attr_text(data, "Type") == "DateTime" && v.size() >= 10) v = v.substr(0, 10);
                    }
                    if (cells.size() <= col) cells.resize(col + 1);
                    cells[col] = std::move(v);
                    col += 1 + std::min(kMaxSheetColumns, size_t(std::max(0, attr_any(cell, "MergeAcross").as_int(0))));
                }
                ++rowIdx;
            }
        }
        result.push_back(sheet_from_grid(attr_text(ws, "Name"), grid));
    }
    out = std::move(result);
    return true;
}

// ---------- Reader ----------

// Legacy ".xls" upload, sniffed by content: BIFF8 compound file, an xlsx
// package with the wrong suffix, or an XML Spreadsheet 2003 document
inline bool read_xls(std::string_view bytes, std::vector<Sheet>& out, std::string* error = nullptr,
                     std::uint64_t maxPartBytes = ZipArchive::kDefaultMaxEntrySize)
{
    if (CompoundFile::looks_like_cfb(bytes)) return read_biff8(bytes, out, error);
    if (ZipArchive::looks_like_zip(bytes)) return read_xlsx(bytes, out, error, maxPartBytes);

    size_t p = 0;
    if (bytes.size() >= 3 && (unsigned char)bytes[0] == 0xEF && (unsigned char)bytes[1] == 0xBB && (unsigned char)bytes[2] == 0xBF)
        p = 3;
    while (p < bytes.size() && ascii_space((unsigned char)bytes[p])) ++p;
    if (p < bytes.size() && bytes[p] == '<') return read_spreadsheet_ml(bytes, out, error);

    if (error) *error = "XLS error: unrecognized Excel file format";
    return false;
}

} // namespace bankstmt
