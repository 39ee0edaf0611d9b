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
#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace bankstmt {

// Compound File Binary (OLE2) container, read-only, held in memory.
// Only what a legacy workbook needs: FAT/DIFAT, mini stream, directory.
class CompoundFile {
public:
    struct DirEntry {
        std::string name;          // UTF-8
        std::uint8_t type{0};      // 1 storage, 2 stream, 5 root
        std::uint32_t start{0};
        std::uint64_t size{0};
    };

    static constexpr std::uint32_t kEndOfChain = 0xFFFFFFFEu;

    static bool looks_like_cfb(std::string_view bytes) {
        static const unsigned char kSig[8] = {0xD0,0xCF,0x11,0xE0,0xA1,0xB1,0x1A,0xE1};
        if (bytes.size() < 8) return false;
        for (int i = 0; i < 8; ++i)
            if ((unsigned char)bytes[i] != kSig[i]) return false;
        return true;
    }

    bool open(std::string_view bytes, std::string* error = nullptr) {
        data_ = bytes;
        fat_.clear(); miniFat_.clear(); dir_.clear(); miniStream_.clear();

        if (!looks_like_cfb(bytes) || bytes.size() < 512)
            return fail(error, "Compound file error: bad header");

        const std::uint16_t sectorShift = u16(0x1E);
        const std::uint16_t miniShift = u16(0x20);
        if (sectorShift != 9 && sectorShift != 12)
            return fail(error, "Compound file error: unsupported sector size");
        if (miniShift != 6)
            return fail(error, "Compound file error: unsupported mini sector size");
        sectorSize_ = size_t(1) << sectorShift;
        miniSectorSize_ = size_t(1) << miniShift;

        const std::uint32_t numFat = u32(0x2C);
        const std::uint32_t firstDir = u32(0x30);
        miniCutoff_ = u32(0x38);
        const std::uint32_t firstMiniFat = u32(0x3C);
        const std::uint32_t numMiniFat = u32(0x40);
        std::uint32_t difatSect = u32(0x44);
        const std::uint32_t numDifat = u32(0x48);

        // every FAT sector lives in the file
        const size_t sectorCount = bytes.size() / sectorSize_;
        if (numFat > sectorCount) return fail(error, "Compound file error: FAT larger than file");

        // FAT sector list: 109 in the header, the rest in the DIFAT chain
        std::vector<std::uint32_t> fatSectors;
        std::unordered_set<std::uint32_t> seenDifat;
        for (std::uint32_t i = 0; i < 109 && fatSectors.size() < numFat; ++i)
            fatSectors.push_back(u32(0x4C + 4 * i));
        const size_t perDifat = sectorSize_ / 4 - 1;
        for (std::uint32_t k = 0; k < numDifat && fatSectors.size() < numFat; ++k) {
            if (!sector_in_range(difatSect) || !seenDifat.insert(difatSect).second)
                return fail(error, "Compound file error: bad DIFAT chain");
            const size_t off = sector_offset(difatSect);
            for (size_t i = 0; i < perDifat && fatSectors.size() < numFat; ++i)
                fatSectors.push_back(u32(off + 4 * i));
            difatSect = u32(off + 4 * perDifat);
        }
        if (fatSectors.size() != numFat) return fail(error, "Compound file error: truncated FAT");

        for (std::uint32_t s : fatSectors) {
            if (!sector_in_range(s)) return fail(error, "Compound file error: FAT sector out of range");
            const size_t off = sector_offset(s);
            for (size_t i = 0; i < sectorSize_ / 4; ++i) fat_.push_back(u32(off + 4 * i));
        }

        // directory
        std::string dirBytes;
        if (!read_chain(fat_, firstDir, sectorSize_, std::string_view(), UINT64_MAX, dirBytes, error)) return false;
        for (size_t off = 0; off + 128 <= dirBytes.size(); off += 128) {
            std::string_view e(dirBytes.data() + off, 128);
            DirEntry d;
            const std::uint16_t nameLen = le16(e, 0x40);
            d.type = static_cast<std::uint8_t>(e[0x42]);
            d.start = le32(e, 0x74);
            d.size = le32(e, 0x78);
            if (sectorShift == 12) d.size |= (std::uint64_t)le32(e, 0x7C) << 32;
            for (size_t i = 0; i + 1 < nameLen && i + 1 < 64; i += 2) {
                const std::uint16_t ch = le16(e, i);
                if (ch == 0) break;
                append_utf8(d.name, ch);
            }
            dir_.push_back(std::move(d));
        }
        if (dir_.empty() || dir_[0].type != 5) return fail(error, "Compound file error: missing root entry");

        // mini FAT + mini stream (held by the root entry)
        if (numMiniFat > 0 && firstMiniFat != kEndOfChain) {
            std::string mf;
            if (!read_chain(fat_, firstMiniFat, sectorSize_, std::string_view(), UINT64_MAX, mf, error)) return false;
            for (size_t i = 0; i + 4 <= mf.size(); i += 4) miniFat_.push_back(le32(mf, i));
        }
        if (dir_[0].start != kEndOfChain && dir_[0].size > 0) {
            if (!read_chain(fat_, dir_[0].start, sectorSize_, std::string_view(), dir_[0].size, miniStream_, error))
                return false;
        }
        return true;
    }

    const std::vector<DirEntry>& entries() const { return dir_; }

    // First stream entry whose name matches (ASCII case-insensitive)
    const DirEntry* find_stream(std::string_view name) const {
        for (const auto& d : dir_)
            if (d.type == 2 && ascii_iequals(d.name, name)) return &d;
        return nullptr;
    }

    bool read_stream(const DirEntry& d, std::string& out, std::string* error = nullptr) const {
        out.clear();
        if (d.size == 0) return true;
        if (d.size < miniCutoff_) {
            if (miniStream_.empty()) return fail(error, "Compound file error: missing mini stream");
            return read_chain(miniFat_, d.start, miniSectorSize_, miniStream_, d.size, out, error);
        }
        return read_chain(fat_, d.start, sectorSize_, std::string_view(), d.size, out, error);
    }

private:
    std::string_view data_;
    size_t sectorSize_{512};
    size_t miniSectorSize_{64};
    std::uint32_t miniCutoff_{4096};
    std::vector<std::uint32_t> fat_;
    std::vector<std::uint32_t> miniFat_;
    std::vector<DirEntry> dir_;
    std::string miniStream_;

    static bool fail(std::string* error, const char* msg) {
        if (error) *error = msg;
        return false;
    }

    static std::uint16_t le16(std::string_view s, size_t p) {
        return (std::uint16_t)((unsigned char)s[p] | ((unsigned char)s[p+1] << 8));
    }
    static std::uint32_t le32(std::string_view s, size_t p) {
        return (std::uint32_t)le16(s, p) | ((std::uint32_t)le16(s, p + 2) << 16);
    }
    std::uint16_t u16(size_t p) const { return le16(data_, p); }
    std::uint32_t u32(size_t p) const { return le32(data_, p); }

    size_t sector_offset(std::uint32_t s) const { return (size_t(s) + 1) * sectorSize_; }
    bool sector_in_range(std::uint32_t s) const {
        return s < kEndOfChain - 5 && sector_offset(s) + sectorSize_ <= data_.size();
    }

    // Follow a sector chain through `table`. `pool` empty = regular sectors
    // of the file, otherwise mini sectors inside the mini stream.
    bool read_chain(const std::vector<std::uint32_t>& table, std::uint32_t start, size_t unit,
                    std::string_view pool, std::uint64_t limit, std::string& out, std::string* error) const
    {
        out.clear();
        std::uint32_t s = start;
        size_t steps = 0;
        // a chain visits each unit at most once
        const size_t maxSteps = std::min(table.size(), (pool.empty() ? data_.size() : pool.size()) / unit);
        while (s != kEndOfChain) {
            if (s >= table.size() || ++steps > maxSteps)
                return fail(error, "Compound file error: broken sector chain");
            if (pool.empty()) {
                if (!sector_in_range(s)) return fail(error, "Compound file error: sector out of range");
                out.append(data_.substr(sector_offset(s), unit));
            } else {
                const size_t off = size_t(s) * unit;
                if (off + unit > pool.size()) return fail(error, "Compound file error: mini sector out of range");
                out.append(pool.substr(off, unit));
            }
            if (out.size() >= limit) break;
            s = table[s];
        }
        if (limit != UINT64_MAX) {
            if (out.size() < limit) return fail(error, "Compound file error: stream shorter than declared");
            out.resize(static_cast<size_t>(limit));
        }
        return true;
    }
};

} // namespace bankstmt
