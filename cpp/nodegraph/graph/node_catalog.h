#pragma once

#include "nodegraph/graph/graph_types.h"
#include <string>
#include <vector>

namespace nodegraph {

namespace layout_constants {
constexpr float kDefaultNodeWidth = 280.0f;
constexpr float kDefaultNodeHeight = 180.0f;
constexpr float kPortStickout = 24.0f;
constexpr float kMinNodeSize = 100.0f;
// A stored width/height only overrides the type fallback above this size.
constexpr float kMeasuredSizeThreshold = 50.0f;
constexpr float kPortRowHeight = 28.0f;

// Group created from a selection.
constexpr float kGroupPadding = 20.0f;
constexpr float kGroupPaddingBottom = 30.0f;
constexpr float kGroupHeaderHeight = 45.0f;

// Group synthesized around an expanded component.
constexpr float kExpandPadding = 25.0f;
constexpr float kExpandPaddingBottom = 25.0f;
constexpr float kExpandHeaderHeight = 45.0f;

constexpr float kDuplicateOffset = 50.0f;
} // namespace layout_constants

// How a node type participates in a component boundary.
enum class BoundaryRole : std::uint8_t {
    None = 0,
    Source = 1, // output sockets become component inputs
    Sink = 2,   // input sockets become component outputs
};

BoundaryRole boundaryRoleForType(const std::string& type);
inline bool isSourceLike(const Node& node) { return boundaryRoleForType(node.type) == BoundaryRole::Source; }
inline bool isSinkLike(const Node& node) { return boundaryRoleForType(node.type) == BoundaryRole::Sink; }

// Types whose input list grows as connections land.
bool isElasticArity(const std::string& type);

// Fresh node of `type` with the catalog's default ports, name and params.
Node makeDefaultNode(const std::string& type, const std::string& id, Point2 position);

std::string nextElasticInputId(const Node& node);

// Estimated on-canvas footprint including port stick-out.
Rect2 estimateNodeBounds(const Node& node);

// Union of estimateNodeBounds over nodes; nodes must be non-empty.
Rect2 unionBounds(const std::vector<const Node*>& nodes);

struct GroupFrame {
    Point2 position{};
    float width{0.0f};
    float height{0.0f};
};

GroupFrame frameAround(const Rect2& content, float padding, float paddingBottom, float header);

// Node center (stored size or the default size) inside the group's frame.
bool isNodeOverlappingGroup(const Node& node, const Node& group);

} // namespace nodegraph
