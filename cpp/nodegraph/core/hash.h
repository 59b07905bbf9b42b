#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace nodegraph {

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint32_t canonicalizeF32(float v) {
    if (std::isnan(v)) return 0x7fc00000u;
    if (v == 0.0f) return 0u;
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF32(std::uint64_t h, float v) {
    return hashU32(h, canonicalizeF32(v));
}

// Length-prefixed so that ("ab","c") and ("a","bc") hash differently.
inline std::uint64_t hashString(std::uint64_t h, const std::string& s) {
    h = hashU32(h, static_cast<std::uint32_t>(s.size()));
    if (!s.empty()) {
        h = hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
    }
    return h;
}

} // namespace nodegraph
