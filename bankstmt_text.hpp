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
#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <utf8proc.h>

namespace bankstmt {

// RAII deleter for buffers allocated by utf8proc_map (uses malloc internally)
struct Utf8ProcDeleter {
    void operator()(utf8proc_uint8_t* p) const noexcept { if (p) free(p); }
};

// Check if codepoint is considered whitespace (Unicode separators + ASCII controls + BOM)
inline bool isUnicodeSpaceOrControlWS(utf8proc_int32_t cp) {
    const int cat = utf8proc_category(cp);
    if (cat == UTF8PROC_CATEGORY_ZS ||
        cat == UTF8PROC_CATEGORY_ZL ||
        cat == UTF8PROC_CATEGORY_ZP) {
        return true;
    }
    switch (cp) {
    case 0x09: // \t
    case 0x0A: // \n
    case 0x0B: // \v
    case 0x0C: // \f
    case 0x0D: // \r
    case 0xFEFF: // BOM / ZERO WIDTH NO-BREAK SPACE
        return true;
    default:
        return false;
    }
}

// Calls fn(codepoint, byte_offset, byte_length) for every code point.
// An invalid byte is reported as codepoint -1 with length 1.
template <class Fn>
inline void for_each_codepoint(std::string_view s, Fn&& fn) {
    const auto* begin = reinterpret_cast<const utf8proc_uint8_t*>(s.data());
    const auto* p   = begin;
    const auto* end = begin + s.size();
    while (p < end) {
        utf8proc_int32_t cp = -1;
        utf8proc_ssize_t adv = utf8proc_iterate(p, (utf8proc_ssize_t)(end - p), &cp);
        if (adv <= 0) {
            cp = -1;
            adv = 1;
        }
        fn(cp, static_cast<std::size_t>(p - begin), static_cast<std::size_t>(adv));
        p += adv;
    }
}

inline std::size_t codepoint_count(std::string_view s) {
    std::size_t n = 0;
    for_each_codepoint(s, [&](utf8proc_int32_t, std::size_t, std::size_t) { ++n; });
    return n;
}

inline void append_utf8(std::string& out, utf8proc_int32_t cp) {
    utf8proc_uint8_t buf[4];
    const utf8proc_ssize_t w = utf8proc_encode_char(cp, buf);
    if (w > 0) out.append(reinterpret_cast<char*>(buf), (size_t)w);
}

// Trim Unicode whitespace on both ends, inner text untouched
inline std::string unicode_trim(std::string_view s) {
    std::size_t b = s.size(), e = 0;
    for_each_codepoint(s, [&](utf8proc_int32_t cp, std::size_t off, std::size_t len) {
        if (cp >= 0 && isUnicodeSpaceOrControlWS(cp)) return;
        if (b == s.size()) b = off;
        e = off + len;
    });
    if (b >= e) return std::string();
    return std::string(s.substr(b, e - b));
}

// Full Unicode lower-casing; invalid bytes are copied through
inline std::string unicode_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for_each_codepoint(s, [&](utf8proc_int32_t cp, std::size_t off, std::size_t len) {
        if (cp < 0) { out.append(s.substr(off, len)); return; }
        append_utf8(out, utf8proc_tolower(cp));
    });
    return out;
}

// NFC composition; returns the input unchanged if utf8proc rejects it
inline std::string nfc(std::string_view in) {
    utf8proc_uint8_t* raw = nullptr;
    const utf8proc_ssize_t nlen = utf8proc_map(
        reinterpret_cast<const utf8proc_uint8_t*>(in.data()),
        static_cast<utf8proc_ssize_t>(in.size()),
        &raw, UTF8PROC_COMPOSE);
    if (nlen < 0 || !raw) {
        return std::string(in);
    }
    std::unique_ptr<utf8proc_uint8_t, Utf8ProcDeleter> norm(raw);
    return std::string(reinterpret_cast<const char*>(norm.get()), static_cast<size_t>(nlen));
}

// ----------------------- minimal ASCII utilities (UTF-8 safe) ------------------
inline bool ascii_space(unsigned char c) {
    return c==' '||c=='\t'||c=='\n'||c=='\r'||c=='\f'||c=='\v';
}
inline bool ascii_digit(unsigned char c) { return c >= '0' && c <= '9'; }

inline std::string ascii_trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && ascii_space(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && ascii_space(static_cast<unsigned char>(s[e-1]))) --e;
    return std::string(s.substr(b, e-b));
}
inline std::string ascii_lower_preserve_utf8(std::string_view s) {
    std::string out; out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(c < 0x80 ? std::tolower(c) : c));
    }
    return out;
}
inline bool ascii_iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}
inline bool ascii_istarts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && ascii_iequals(s.substr(0, prefix.size()), prefix);
}
inline bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// Split on runs of ASCII whitespace, empty tokens dropped
inline std::vector<std::string> split_ws(std::string_view s) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && ascii_space(static_cast<unsigned char>(s[i]))) ++i;
        size_t j = i;
        while (j < s.size() && !ascii_space(static_cast<unsigned char>(s[j]))) ++j;
        if (j > i) out.emplace_back(s.substr(i, j - i));
        i = j;
    }
    return out;
}

// Split on runs of Unicode whitespace, empty tokens dropped
inline std::vector<std::string> split_unicode_ws(std::string_view s) {
    std::vector<std::string> out;
    size_t start = std::string_view::npos;
    for_each_codepoint(s, [&](utf8proc_int32_t cp, std::size_t off, std::size_t) {
        const bool ws = cp >= 0 && isUnicodeSpaceOrControlWS(cp);
        if (ws && start != std::string_view::npos) {
            out.emplace_back(s.substr(start, off - start));
            start = std::string_view::npos;
        } else if (!ws && start == std::string_view::npos) {
            start = off;
        }
    });
    if (start != std::string_view::npos) out.emplace_back(s.substr(start));
    return out;
}

} // namespace bankstmt
