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
#include <pugixml.hpp>
#include <algorithm>
#include <string>
#include <string_view>
#include <cstring>

namespace bankstmt {

// ---------- Helpers (namespace-agnostic, only classic loops) ----------
inline const char* ln(const pugi::xml_node& n) {
    if (!n) return "";
    const char* full = n.name();
    const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_node& n, const char* wanted) { return std::strcmp(ln(n), wanted) == 0; }

inline const char* ln(const pugi::xml_attribute& a) {
    if (!a) return "";
    const char* full = a.name(); const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_attribute& a, const char* wanted) { return std::strcmp(ln(a), wanted) == 0; }

// direct child with local name
inline pugi::xml_node child_any(const pugi::xml_node& p, const char* name) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling())
        if (isln(c, name)) return c;
    return pugi::xml_node();
}

// attribute by local name ("r:id" and "id" both match "id")
inline pugi::xml_attribute attr_any(const pugi::xml_node& n, const char* name) {
    for (pugi::xml_attribute a = n.first_attribute(); a; a = a.next_attribute())
        if (isln(a, name)) return a;
    return pugi::xml_attribute();
}

inline std::string attr_text(const pugi::xml_node& n, const char* name) {
    pugi::xml_attribute a = attr_any(n, name);
    return a ? std::string(a.value()) : std::string();
}

// element text, untouched (cell content keeps its spaces)
inline std::string raw_txt(const pugi::xml_node& n) {
    return n ? std::string(n.text().as_string()) : std::string();
}

inline bool load_xml(pugi::xml_document& doc, std::string_view bytes, const char* what, std::string* error) {
    pugi::xml_parse_result ok = doc.load_buffer(bytes.data(), bytes.size(), pugi::parse_default);
    if (!ok) {
        if (error) *error = std::string("XML parse error in ") + what + ": " + ok.description();
        return false;
    }
    if (!doc.document_element()) {
        if (error) *error = std::string("Empty document: ") + what;
        return false;
    }
    return true;
}

} // namespace bankstmt
