#ifndef NODEGRAPH_CORE_TYPES_H
#define NODEGRAPH_CORE_TYPES_H

#include <cstdint>

namespace nodegraph {

struct Point2 {
    float x{0.0f};
    float y{0.0f};
};

inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

inline Point2 operator+(const Point2& a, const Point2& b) { return Point2{a.x + b.x, a.y + b.y}; }
inline Point2 operator-(const Point2& a, const Point2& b) { return Point2{a.x - b.x, a.y - b.y}; }

struct Rect2 {
    float minX{0.0f};
    float minY{0.0f};
    float maxX{0.0f};
    float maxY{0.0f};

    float width() const noexcept { return maxX - minX; }
    float height() const noexcept { return maxY - minY; }
};

enum class GraphError : std::uint32_t {
    Ok = 0,
    NotFound = 1,
    InvalidOperation = 2,
    DuplicateId = 3,
    RoleMismatch = 4,
    DuplicateConnection = 5,
    UnknownPort = 6,
    UnresolvedDefinition = 7,
    RecursiveStructure = 8,
    InvalidMagic = 9,
    UnsupportedVersion = 10,
    BufferTruncated = 11,
    InvalidPayloadSize = 12,
};

const char* graphErrorName(GraphError err) noexcept;

} // namespace nodegraph

#endif // NODEGRAPH_CORE_TYPES_H
