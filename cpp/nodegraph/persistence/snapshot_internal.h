#pragma once

#include "nodegraph/core/util.h"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace nodegraph::snapshot::detail {

constexpr std::uint32_t fourCC(char a, char b, char c, char d) {
    return static_cast<std::uint32_t>(a)
        | (static_cast<std::uint32_t>(b) << 8)
        | (static_cast<std::uint32_t>(c) << 16)
        | (static_cast<std::uint32_t>(d) << 24);
}

constexpr std::uint32_t TAG_NODE = fourCC('N', 'O', 'D', 'E');
constexpr std::uint32_t TAG_CONN = fourCC('C', 'O', 'N', 'N');
constexpr std::uint32_t TAG_COMP = fourCC('C', 'O', 'M', 'P');
constexpr std::uint32_t TAG_NIDX = fourCC('N', 'I', 'D', 'X');

constexpr std::size_t snapshotHeaderBytes = 12;
constexpr std::size_t snapshotSectionEntryBytes = 16;

constexpr std::uint32_t kNodeHasWidth = 1u << 0;
constexpr std::uint32_t kNodeHasHeight = 1u << 1;
constexpr std::uint32_t kConnDashed = 1u << 0;
constexpr std::uint32_t kConnGhost = 1u << 1;

inline std::uint32_t crc32(const std::uint8_t* bytes, std::size_t len) {
    static std::uint32_t table[256];
    static bool tableReady = false;
    if (!tableReady) {
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        tableReady = true;
    }

    std::uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return (crc ^ 0xFFFFFFFFu);
}

inline bool tryAdd(std::size_t a, std::size_t b, std::size_t& out) {
    if (a > (std::numeric_limits<std::size_t>::max() - b)) return false;
    out = a + b;
    return true;
}

inline bool requireBytes(std::size_t offset, std::size_t size, std::size_t total) {
    if (offset > total) return false;
    return size <= (total - offset);
}

// Sequential little-endian reader; the first short read latches `ok` false.
struct SectionReader {
    const std::uint8_t* data{nullptr};
    std::size_t size{0};
    std::size_t offset{0};
    bool ok{true};

    std::uint32_t u32() {
        if (!ok || !requireBytes(offset, 4, size)) {
            ok = false;
            return 0;
        }
        const std::uint32_t v = readU32(data, offset);
        offset += 4;
        return v;
    }

    float f32() {
        if (!ok || !requireBytes(offset, 4, size)) {
            ok = false;
            return 0.0f;
        }
        const float v = readF32(data, offset);
        offset += 4;
        return v;
    }

    std::string str() {
        const std::uint32_t len = u32();
        if (!ok || !requireBytes(offset, len, size)) {
            ok = false;
            return {};
        }
        std::string s(reinterpret_cast<const char*>(data + offset), len);
        offset += len;
        return s;
    }

    // Element count, rejected if even minimal elements could not fit.
    std::uint32_t count(std::size_t minElementBytes) {
        const std::uint32_t n = u32();
        if (!ok) return 0;
        if (minElementBytes > 0 && n > (size - offset) / minElementBytes) {
            ok = false;
            return 0;
        }
        return n;
    }
};

struct SectionWriter {
    std::vector<std::uint8_t>& out;

    void u32(std::uint32_t v) {
        const std::size_t o = out.size();
        out.resize(o + 4);
        writeU32LE(out.data(), o, v);
    }

    void f32(float v) {
        const std::size_t o = out.size();
        out.resize(o + 4);
        writeF32LE(out.data(), o, v);
    }

    void str(const std::string& s) {
        u32(static_cast<std::uint32_t>(s.size()));
        out.insert(out.end(), s.begin(), s.end());
    }
};

} // namespace nodegraph::snapshot::detail
