#ifndef NODEGRAPH_CORE_UTIL_H
#define NODEGRAPH_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>

namespace nodegraph {

inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

inline float readF32(const std::uint8_t* src, std::size_t offset) noexcept {
    float v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

inline void writeF32LE(std::uint8_t* dst, std::size_t offset, float v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

} // namespace nodegraph

#endif // NODEGRAPH_CORE_UTIL_H
