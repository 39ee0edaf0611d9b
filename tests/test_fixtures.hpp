/**
 * bankstmt parser - version 1.00
 * --------------------------------------------------------
 * Tabular bank statement import (CSV / XLSX / XLS)
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

// In-memory spreadsheet fixtures: zip packages (xlsx) and BIFF8 workbooks
// inside compound files (xls).

#pragma once
#include <zlib.h>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fixtures {

inline void put16(std::string& s, std::uint16_t v) {
    s.push_back(static_cast<char>(v & 0xFF));
    s.push_back(static_cast<char>(v >> 8));
}
inline void put32(std::string& s, std::uint32_t v) {
    put16(s, static_cast<std::uint16_t>(v & 0xFFFF));
    put16(s, static_cast<std::uint16_t>(v >> 16));
}
inline void put_f64(std::string& s, double d) {
    std::uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    put32(s, static_cast<std::uint32_t>(bits & 0xFFFFFFFFu));
    put32(s, static_cast<std::uint32_t>(bits >> 32));
}
inline void set32(std::string& s, size_t at, std::uint32_t v) {
    std::string tmp;
    put32(tmp, v);
    s.replace(at, 4, tmp);
}

// ---------------------------------------------------------------- zip

inline std::uint32_t crc_of(const std::string& data) {
    return static_cast<std::uint32_t>(crc32(crc32(0L, Z_NULL, 0),
        reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size())));
}

inline std::string deflate_raw(const std::string& in) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::runtime_error("deflateInit2 failed");
    std::string out(deflateBound(&zs, static_cast<uLong>(in.size())), '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(out.size());
    const int rc = deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) throw std::runtime_error("deflate failed");
    return out;
}

using ZipEntries = std::vector<std::pair<std::string, std::string>>;

inline std::string build_zip(const ZipEntries& files, bool compress = false) {
    std::string out, central;
    for (const auto& [name, data] : files) {
        const std::string packed = compress ? deflate_raw(data) : data;
        const std::uint16_t method = compress ? 8 : 0;
        const std::uint32_t crc = crc_of(data);
        const std::uint32_t offset = static_cast<std::uint32_t>(out.size());

        put32(out, 0x04034b50u);
        put16(out, 20); put16(out, 0); put16(out, method);
        put16(out, 0); put16(out, 0x21);
        put32(out, crc);
        put32(out, static_cast<std::uint32_t>(packed.size()));
        put32(out, static_cast<std::uint32_t>(data.size()));
        put16(out, static_cast<std::uint16_t>(name.size())); put16(out, 0);
        out += name;
        out += packed;

        put32(central, 0x02014b50u);
        put16(central, 20); put16(central, 20); put16(central, 0); put16(central, method);
        put16(central, 0); put16(central, 0x21);
        put32(central, crc);
        put32(central, static_cast<std::uint32_t>(packed.size()));
        put32(central, static_cast<std::uint32_t>(data.size()));
        put16(central, static_cast<std::uint16_t>(name.size()));
        put16(central, 0); put16(central, 0); put16(central, 0); put16(central, 0);
        put32(central, 0);
        put32(central, offset);
        central += name;
    }
    const std::uint32_t cdOffset = static_cast<std::uint32_t>(out.size());
    out += central;
    put32(out, 0x06054b50u);
    put16(out, 0); put16(out, 0);
    put16(out, static_cast<std::uint16_t>(files.size()));
    put16(out, static_cast<std::uint16_t>(files.size()));
    put32(out, static_cast<std::uint32_t>(central.size()));
    put32(out, cdOffset);
    put16(out, 0);
    return out;
}

// ---------------------------------------------------------------- xlsx

inline std::string xml_escape(const std::string& s) {
    std::string o;
    for (char c : s) {
        switch (c) {
        case '&': o += "&amp;"; break;
        case '<': o += "&lt;"; break;
        case '>': o += "&gt;"; break;
        case '"': o += "&quot;"; break;
        default: o.push_back(c);
        }
    }
    return o;
}

inline std::string col_name(size_t c) {
    std::string s;
    ++c;
    while (c > 0) {
        s.insert(s.begin(), static_cast<char>('A' + (c - 1) % 26));
        c = (c - 1) / 26;
    }
    return s;
}

// A worksheet given as rows of cell texts: numbers (a cell that parses
// completely as a number) become numeric cells, everything else inline
// strings. Empty strings leave the cell out.
inline std::string worksheet_xml(const std::vector<std::vector<std::string>>& rows) {
    std::string x = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\"><sheetData>";
    for (size_t r = 0; r < rows.size(); ++r) {
        x += "<row r=\"" + std::to_string(r + 1) + "\">";
        for (size_t c = 0; c < rows[r].size(); ++c) {
            const std::string& v = rows[r][c];
            if (v.empty()) continue;
            const std::string ref = col_name(c) + std::to_string(r + 1);
            char* end = nullptr;
            std::strtod(v.c_str(), &end);
            const bool numeric = end && *end == '\0' && v.find_first_not_of("0123456789.-") == std::string::npos;
            if (numeric)
                x += "<c r=\"" + ref + "\"><v>" + v + "</v></c>";
            else
                x += "<c r=\"" + ref + "\" t=\"inlineStr\"><is><t>" + xml_escape(v) + "</t></is></c>";
        }
        x += "</row>";
    }
    x += "</sheetData></worksheet>";
    return x;
}

struct XlsxSheet {
    std::string name;
    std::string xml;   // worksheet part, empty = dangling relationship
};

// Minimal package: content types, root rels, workbook, workbook rels,
// optional sharedStrings and styles parts
inline std::string build_xlsx(const std::vector<XlsxSheet>& sheets,
                              const std::string& sharedStringsXml = std::string(),
                              const std::string& stylesXml = std::string(),
                              bool date1904 = false,
                              bool compress = true)
{
    ZipEntries files;
    files.emplace_back("[Content_Types].xml",
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\"/>");
    files.emplace_back("_rels/.rels",
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" Target=\"xl/workbook.xml\"/>"
        "</Relationships>");

    std::string wb = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
        "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">";
    if (date1904) wb += "<workbookPr date1904=\"1\"/>";
    wb += "<sheets>";
    std::string rels = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">";
    for (size_t i = 0; i < sheets.size(); ++i) {
        const std::string id = "rId" + std::to_string(i + 1);
        wb += "<sheet name=\"" + xml_escape(sheets[i].name) + "\" sheetId=\"" + std::to_string(i + 1) +
              "\" r:id=\"" + id + "\"/>";
        rels += "<Relationship Id=\"" + id + "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" "
                "Target=\"worksheets/sheet" + std::to_string(i + 1) + ".xml\"/>";
    }
    wb += "</sheets></workbook>";
    if (!sharedStringsXml.empty())
        rels += "<Relationship Id=\"rIdS\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/sharedStrings\" Target=\"sharedStrings.xml\"/>";
    if (!stylesXml.empty())
        rels += "<Relationship Id=\"rIdT\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>";
    rels += "</Relationships>";

    files.emplace_back("xl/workbook.xml", wb);
    files.emplace_back("xl/_rels/workbook.xml.rels", rels);
    for (size_t i = 0; i < sheets.size(); ++i) {
        if (!sheets[i].xml.empty())
            files.emplace_back("xl/worksheets/sheet" + std::to_string(i + 1) + ".xml", sheets[i].xml);
    }
    if (!sharedStringsXml.empty()) files.emplace_back("xl/sharedStrings.xml", sharedStringsXml);
    if (!stylesXml.empty()) files.emplace_back("xl/styles.xml", stylesXml);
    return build_zip(files, compress);
}

// ---------------------------------------------------------------- compound file

struct CfbStream {
    std::string name;   // ASCII
    std::string data;
};

// Version 3 compound file (512-byte sectors). Streams under 4096 bytes go
// to the mini stream, larger ones to regular sectors.
inline std::string build_cfb(const std::vector<CfbStream>& streams) {
    constexpr std::uint32_t kEnd = 0xFFFFFFFEu, kFree = 0xFFFFFFFFu, kFatSect = 0xFFFFFFFDu;
    constexpr size_t kSec = 512, kMini = 64, kCutoff = 4096;
    auto sectors_for = [](size_t bytes, size_t unit) { return (bytes + unit - 1) / unit; };

    // mini stream layout
    std::string mini;
    std::vector<std::uint32_t> miniFat;
    std::vector<std::uint32_t> start(streams.size(), kEnd);
    for (size_t i = 0; i < streams.size(); ++i) {
        const auto& s = streams[i];
        if (s.data.empty() || s.data.size() >= kCutoff) continue;
        const size_t n = sectors_for(s.data.size(), kMini);
        start[i] = static_cast<std::uint32_t>(miniFat.size());
        for (size_t k = 0; k < n; ++k)
            miniFat.push_back(k + 1 < n ? static_cast<std::uint32_t>(miniFat.size() + 1) : kEnd);
        mini += s.data;
        mini.resize(miniFat.size() * kMini, '\0');
    }

    const size_t dirSecs = sectors_for((streams.size() + 1) * 128, kSec);
    const size_t miniFatSecs = sectors_for(miniFat.size() * 4, kSec);
    const size_t miniSecs = sectors_for(mini.size(), kSec);
    size_t bigSecs = 0;
    for (const auto& s : streams)
        if (s.data.size() >= kCutoff) bigSecs += sectors_for(s.data.size(), kSec);
    const size_t payload = dirSecs + miniFatSecs + miniSecs + bigSecs;
    size_t fatSecs = 1;
    while (fatSecs * (kSec / 4) < payload + fatSecs) ++fatSecs;
    if (fatSecs > 109) throw std::runtime_error("fixture too large");

    std::vector<std::uint32_t> fat(fatSecs * (kSec / 4), kFree);
    std::uint32_t next = 0;
    for (size_t i = 0; i < fatSecs; ++i) fat[next++] = kFatSect;
    auto chain = [&](size_t n) -> std::uint32_t {
        if (n == 0) return kEnd;
        const std::uint32_t first = next;
        for (size_t k = 0; k < n; ++k, ++next) fat[next] = k + 1 < n ? next + 1 : kEnd;
        return first;
    };
    const std::uint32_t dirStart = chain(dirSecs);
    const std::uint32_t miniFatStart = chain(miniFatSecs);
    const std::uint32_t miniStart = chain(miniSecs);
    for (size_t i = 0; i < streams.size(); ++i)
        if (streams[i].data.size() >= kCutoff) start[i] = chain(sectors_for(streams[i].data.size(), kSec));

    // header
    std::string out;
    const unsigned char sig[8] = {0xD0,0xCF,0x11,0xE0,0xA1,0xB1,0x1A,0xE1};
    out.append(reinterpret_cast<const char*>(sig), 8);
    out.append(16, '\0');                       // CLSID
    put16(out, 0x003E); put16(out, 0x0003);     // minor, major version
    put16(out, 0xFFFE);                         // byte order
    put16(out, 9); put16(out, 6);               // sector shifts
    out.append(6, '\0');
    put32(out, 0);                              // directory sectors (v3: 0)
    put32(out, static_cast<std::uint32_t>(fatSecs));
    put32(out, dirStart);
    put32(out, 0);                              // transaction signature
    put32(out, static_cast<std::uint32_t>(kCutoff));
    put32(out, miniFatSecs ? miniFatStart : kEnd);
    put32(out, static_cast<std::uint32_t>(miniFatSecs));
    put32(out, kEnd);                           // first DIFAT sector
    put32(out, 0);
    for (size_t i = 0; i < 109; ++i) put32(out, i < fatSecs ? static_cast<std::uint32_t>(i) : kFree);

    // FAT
    for (std::uint32_t v : fat) put32(out, v);

    // directory
    std::string dir;
    auto entry = [&](const std::string& name, std::uint8_t type, std::uint32_t right,
                     std::uint32_t child, std::uint32_t first, std::uint32_t size) {
        std::string e;
        for (char c : name) put16(e, static_cast<unsigned char>(c));
        put16(e, 0);
        e.resize(64, '\0');
        put16(e, static_cast<std::uint16_t>((name.size() + 1) * 2));
        e.push_back(static_cast<char>(type));
        e.push_back(1);                          // black
        put32(e, kFree); put32(e, right); put32(e, child);
        e.append(16, '\0');                      // CLSID
        put32(e, 0);                             // state bits
        e.append(16, '\0');                      // times
        put32(e, first); put32(e, size); put32(e, 0);
        dir += e;
    };
    entry("Root Entry", 5, kFree, streams.empty() ? kFree : 1,
          miniSecs ? miniStart : kEnd, static_cast<std::uint32_t>(mini.size()));
    for (size_t i = 0; i < streams.size(); ++i) {
        const std::uint32_t right = i + 1 < streams.size() ? static_cast<std::uint32_t>(i + 2) : kFree;
        entry(streams[i].name, 2, right, kFree, start[i], static_cast<std::uint32_t>(streams[i].data.size()));
    }
    dir.resize(dirSecs * kSec, '\0');
    out += dir;

    std::string mf;
    for (std::uint32_t v : miniFat) put32(mf, v);
    mf.resize(miniFatSecs * kSec, '\xFF');
    out += mf;

    std::string ms = mini;
    ms.resize(miniSecs * kSec, '\0');
    out += ms;

    for (const auto& s : streams) {
        if (s.data.size() < kCutoff) continue;
        std::string d = s.data;
        d.resize(sectors_for(d.size(), kSec) * kSec, '\0');
        out += d;
    }
    return out;
}

// ---------------------------------------------------------------- BIFF8

inline void record(std::string& s, std::uint16_t type, const std::string& data) {
    put16(s, type);
    put16(s, static_cast<std::uint16_t>(data.size()));
    s += data;
}

// XLUnicodeString with 16-bit length, compressed (Latin-1) characters
inline std::string xl_string16(const std::string& s) {
    std::string d;
    put16(d, static_cast<std::uint16_t>(s.size()));
    d.push_back('\0');
    d += s;
    return d;
}

// Builds a BIFF8 workbook stream. XF 0 is "General", XF 1 the built-in
// date format 14, XF 2 the custom format "dd/mm/yyyy" (id 164).
class BiffBuilder {
public:
    static constexpr std::uint16_t kXfGeneral = 0, kXfDate = 1, kXfCustomDate = 2;

    void set_date1904(bool v) { date1904_ = v; }

    size_t add_sheet(const std::string& name, std::uint8_t kind = 0) {
        sheets_.push_back(SheetData{name, kind, std::string()});
        return sheets_.size() - 1;
    }

    // shared string cell
    void label(size_t sh, std::uint16_t r, std::uint16_t c, const std::string& s) {
        std::uint32_t idx = static_cast<std::uint32_t>(sst_.size());
        for (size_t i = 0; i < sst_.size(); ++i) if (sst_[i] == s) { idx = static_cast<std::uint32_t>(i); break; }
        if (idx == sst_.size()) sst_.push_back(s);
        std::string d = cell_head(r, c, kXfGeneral);
        put32(d, idx);
        record(sheets_[sh].cells, 0x00FD, d);
        ++sstTotal_;
    }
    // inline LABEL record
    void inline_label(size_t sh, std::uint16_t r, std::uint16_t c, const std::string& s) {
        record(sheets_[sh].cells, 0x0204, cell_head(r, c, kXfGeneral) + xl_string16(s));
    }
    void number(size_t sh, std::uint16_t r, std::uint16_t c, double v, std::uint16_t xf = kXfGeneral) {
        std::string d = cell_head(r, c, xf);
        put_f64(d, v);
        record(sheets_[sh].cells, 0x0203, d);
    }
    // RK cell holding an integer (optionally stored x100)
    void rk_int(size_t sh, std::uint16_t r, std::uint16_t c, std::int32_t v, bool div100 = false,
                std::uint16_t xf = kXfGeneral) {
        std::string d = cell_head(r, c, xf);
        put32(d, (static_cast<std::uint32_t>(v) << 2) | 0x02u | (div100 ? 0x01u : 0u));
        record(sheets_[sh].cells, 0x027E, d);
    }
    void boolean(size_t sh, std::uint16_t r, std::uint16_t c, bool v) {
        std::string d = cell_head(r, c, kXfGeneral);
        d.push_back(v ? 1 : 0);
        d.push_back(0);
        record(sheets_[sh].cells, 0x0205, d);
    }
    // FORMULA with a cached string result, followed by its STRING record
    void formula_string(size_t sh, std::uint16_t r, std::uint16_t c, const std::string& s) {
        std::string d = cell_head(r, c, kXfGeneral);
        d.push_back(0);                 // string result
        d.append(5, '\0');
        d.push_back('\xFF'); d.push_back('\xFF');
        put16(d, 0);                    // flags
        put32(d, 0);                    // chn
        put16(d, 0);                    // empty rgce
        record(sheets_[sh].cells, 0x0006, d);
        record(sheets_[sh].cells, 0x0207, xl_string16(s));
    }

    // maxRecord bounds the SST record payload so continuation can be tested
    std::string stream(size_t maxRecord = 8224, size_t minSize = 4096) const {
        std::string s;
        std::string bof;
        put16(bof, 0x0600); put16(bof, 0x0005); put16(bof, 0); put16(bof, 0); put32(bof, 0); put32(bof, 0);
        record(s, 0x0809, bof);

        std::string dm; put16(dm, date1904_ ? 1 : 0);
        record(s, 0x0022, dm);

        std::string fmt; put16(fmt, 164); fmt += xl_string16("dd/mm/yyyy");
        record(s, 0x041E, fmt);

        for (std::uint16_t ifmt : {std::uint16_t(0), std::uint16_t(14), std::uint16_t(164)}) {
            std::string xf;
            put16(xf, 0); put16(xf, ifmt);
            xf.append(16, '\0');
            record(s, 0x00E0, xf);
        }

        std::vector<size_t> posFields;
        for (const auto& sh : sheets_) {
            std::string b;
            put32(b, 0);
            b.push_back(0);
            b.push_back(static_cast<char>(sh.kind));
            b.push_back(static_cast<char>(sh.name.size()));
            b.push_back(0);
            b += sh.name;
            posFields.push_back(s.size() + 4);
            record(s, 0x0085, b);
        }

        write_sst(s, maxRecord);
        record(s, 0x000A, std::string());

        for (size_t i = 0; i < sheets_.size(); ++i) {
            set32(s, posFields[i], static_cast<std::uint32_t>(s.size()));
            std::string sbof;
            put16(sbof, 0x0600); put16(sbof, 0x0010); put16(sbof, 0); put16(sbof, 0); put32(sbof, 0); put32(sbof, 0);
            record(s, 0x0809, sbof);
            s += sheets_[i].cells;
            record(s, 0x000A, std::string());
        }
        if (s.size() < minSize) s.resize(minSize, '\0');
        return s;
    }

private:
    struct SheetData {
        std::string name;
        std::uint8_t kind;
        std::string cells;
    };
    std::vector<SheetData> sheets_;
    std::vector<std::string> sst_;
    std::uint32_t sstTotal_{0};
    bool date1904_{false};

    static std::string cell_head(std::uint16_t r, std::uint16_t c, std::uint16_t xf) {
        std::string d;
        put16(d, r); put16(d, c); put16(d, xf);
        return d;
    }

    // SST, split into CONTINUE records; characters crossing a boundary get
    // a fresh option byte, string headers never straddle one
    void write_sst(std::string& s, size_t maxRecord) const {
        std::vector<std::string> recs(1);
        put32(recs[0], sstTotal_);
        put32(recs[0], static_cast<std::uint32_t>(sst_.size()));
        for (const auto& str : sst_) {
            if (recs.back().size() + 3 > maxRecord) recs.emplace_back();
            put16(recs.back(), static_cast<std::uint16_t>(str.size()));
            recs.back().push_back('\0');
            size_t done = 0;
            while (done < str.size()) {
                if (recs.back().size() >= maxRecord) {
                    recs.emplace_back();
                    recs.back().push_back('\0');     // option byte: compressed
                }
                const size_t room = maxRecord - recs.back().size();
                const size_t take = std::min(room, str.size() - done);
                recs.back().append(str, done, take);
                done += take;
            }
        }
        record(s, 0x00FC, recs[0]);
        for (size_t i = 1; i < recs.size(); ++i) record(s, 0x003C, recs[i]);
    }
};

} // namespace fixtures
