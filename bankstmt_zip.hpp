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
#include "bankstmt_text.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace bankstmt {

// Read-only view of a zip archive held in memory (stored + deflate entries).
// The archive bytes must outlive the ZipArchive.
class ZipArchive {
public:
    struct EntryInfo {
        std::string name;
        std::uint16_t method{0};
        std::uint32_t crc{0};
        std::uint32_t compressedSize{0};
        std::uint32_t size{0};
        std::uint32_t localHeaderOffset{0};
    };

    static constexpr std::uint64_t kDefaultMaxEntrySize = 0xFFFFFFFFu;

    // Entries declaring more than maxEntrySize uncompressed bytes are refused
    explicit ZipArchive(std::uint64_t maxEntrySize = kDefaultMaxEntrySize) : maxEntrySize_(maxEntrySize) {}

    static bool looks_like_zip(std::string_view bytes) {
        return bytes.size() >= 4 && bytes.compare(0, 4, std::string_view("PK\x03\x04", 4)) == 0;
    }

    bool open(std::string_view bytes, std::string* error = nullptr) {
        data_ = bytes;
        entries_.clear();

        // End of central directory: 22 bytes + comment (<= 65535)
        if (bytes.size() < 22) return fail(error, "Zip error: archive too small");
        size_t eocd = std::string_view::npos;
        const size_t lowest = bytes.size() > 22 + 0xFFFF ? bytes.size() - 22 - 0xFFFF : 0;
        for (size_t p = bytes.size() - 22 + 1; p-- > lowest; ) {
            if (u32(p) == 0x06054b50u) { eocd = p; break; }
        }
        if (eocd == std::string_view::npos) return fail(error, "Zip error: end of central directory not found");

        const std::uint16_t count = u16(eocd + 10);
        const std::uint32_t cdSize = u32(eocd + 12);
        const std::uint32_t cdOffset = u32(eocd + 16);
        if (cdOffset == 0xFFFFFFFFu || count == 0xFFFF) return fail(error, "Zip error: zip64 archives are not supported");
        if ((std::uint64_t)cdOffset + cdSize > bytes.size()) return fail(error, "Zip error: central directory out of range");

        size_t p = cdOffset;
        for (std::uint16_t i = 0; i < count; ++i) {
            if (p + 46 > bytes.size() || u32(p) != 0x02014b50u)
                return fail(error, "Zip error: bad central directory entry");
            EntryInfo e;
            e.method            = u16(p + 10);
            e.crc               = u32(p + 16);
            e.compressedSize    = u32(p + 20);
            e.size              = u32(p + 24);
            const std::uint16_t nameLen = u16(p + 28);
            const std::uint16_t extraLen = u16(p + 30);
            const std::uint16_t commentLen = u16(p + 32);
            e.localHeaderOffset = u32(p + 42);
            if (p + 46 + nameLen > bytes.size())
                return fail(error, "Zip error: bad central directory entry");
            e.name.assign(bytes.substr(p + 46, nameLen));
            entries_.push_back(std::move(e));
            p += 46 + (size_t)nameLen + extraLen + commentLen;
        }
        return true;
    }

    const std::vector<EntryInfo>& entries() const { return entries_; }

    // Exact match first, then ASCII case-insensitive (some writers vary case)
    const EntryInfo* find(std::string_view name) const {
        for (const auto& e : entries_) if (e.name == name) return &e;
        for (const auto& e : entries_) if (ascii_iequals(e.name, name)) return &e;
        return nullptr;
    }

    bool extract(std::string_view name, std::string& out, std::string* error = nullptr) const {
        const EntryInfo* e = find(name);
        if (!e) return fail(error, "Zip error: missing entry " + std::string(name));
        if (e->size > maxEntrySize_)
            return fail(error, "Zip error: entry too large: " + e->name);

        const size_t lh = e->localHeaderOffset;
        if (lh + 30 > data_.size() || u32(lh) != 0x04034b50u)
            return fail(error, "Zip error: bad local header for " + e->name);
        const size_t start = lh + 30 + (size_t)u16(lh + 26) + u16(lh + 28);
        if ((std::uint64_t)start + e->compressedSize > data_.size())
            return fail(error, "Zip error: entry out of range: " + e->name);
        const std::string_view packed = data_.substr(start, e->compressedSize);

        out.clear();
        if (e->method == 0) {
            out.assign(packed);
        } else if (e->method == 8) {
            if (!inflate_raw(packed, e->size, out))
                return fail(error, "Zip error: inflate failed for " + e->name);
        } else {
            return fail(error, "Zip error: unsupported compression method " + std::to_string(e->method));
        }

        const uLong crc = crc32(crc32(0L, Z_NULL, 0),
                                reinterpret_cast<const Bytef*>(out.data()), static_cast<uInt>(out.size()));
        if (out.size() != e->size || crc != e->crc)
            return fail(error, "Zip error: checksum mismatch for " + e->name);
        return true;
    }

private:
    std::string_view data_;
    std::vector<EntryInfo> entries_;
    std::uint64_t maxEntrySize_{kDefaultMaxEntrySize};

    static bool fail(std::string* error, const std::string& msg) {
        if (error) *error = msg;
        return false;
    }

    std::uint16_t u16(size_t p) const {
        return (std::uint16_t)((unsigned char)data_[p] | ((unsigned char)data_[p+1] << 8));
    }
    std::uint32_t u32(size_t p) const {
        return (std::uint32_t)u16(p) | ((std::uint32_t)u16(p + 2) << 16);
    }

    // deflate cannot expand data by more than this factor
    static constexpr std::uint64_t kMaxDeflateRatio = 1032;

    // Raw deflate stream (no zlib header), as stored in zip entries.
    // Output past the declared size fails; the buffer grows with the data.
    static bool inflate_raw(std::string_view in, std::uint32_t expected, std::string& out) {
        z_stream zs;
        std::memset(&zs, 0, sizeof(zs));
        if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) return false;

        const std::uint64_t cap = std::uint64_t(expected) + 1;
        out.resize(static_cast<size_t>(std::min<std::uint64_t>(cap, in.size() * kMaxDeflateRatio + 64)));
        zs.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
        zs.avail_in = static_cast<uInt>(in.size());

        int rc = Z_OK;
        while (rc == Z_OK) {
            if (zs.total_out > expected) break;
            if (zs.total_out >= out.size())
                out.resize(static_cast<size_t>(std::min<std::uint64_t>(cap, std::uint64_t(out.size()) * 2 + 64)));
            zs.next_out  = reinterpret_cast<Bytef*>(&out[zs.total_out]);
            zs.avail_out = static_cast<uInt>(out.size() - zs.total_out);
            rc = inflate(&zs, Z_NO_FLUSH);
            if (rc == Z_BUF_ERROR && zs.avail_out != 0) break; // truncated input
            if (rc == Z_BUF_ERROR) rc = Z_OK;
        }
        const bool ok = (rc == Z_STREAM_END);
        out.resize(zs.total_out);
        inflateEnd(&zs);
        return ok;
    }
};

} // namespace bankstmt
