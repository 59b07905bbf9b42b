#include "nodegraph/graph/node_catalog.h"
#include <algorithm>
#include <cstddef>

namespace nodegraph {

using namespace layout_constants;

namespace {

struct NodeSize {
    float width;
    float height;
    float extraLeft;  // 0 = use the port stick-out rule
    float extraRight;
};

std::size_t maxPortCount(const Node& node) {
    return std::max(node.data.inputs.size(), node.data.outputs.size());
}

float portRowsHeight(const Node& node, float base, float empty) {
    const std::size_t ports = maxPortCount(node);
    return ports > 0 ? base + static_cast<float>(ports) * kPortRowHeight : empty;
}

bool isPrimitive(const std::string& type) {
    return type == node_types::kSphere || type == node_types::kBox || type == node_types::kVectorXyz;
}

NodeSize fallbackSize(const Node& node) {
    const std::string& type = node.type;
    if (type == node_types::kPanel) return NodeSize{340.0f, 300.0f, 0.0f, 0.0f};
    if (type == node_types::kSeries) return NodeSize{260.0f, portRowsHeight(node, 182.0f, 160.0f), 57.0f, 32.0f};
    if (type == node_types::kNumberSlider) return NodeSize{300.0f, 160.0f, 0.0f, 0.0f};
    if (isPrimitive(type)) return NodeSize{300.0f, portRowsHeight(node, 110.0f, 200.0f), 0.0f, 0.0f};
    if (type == node_types::kCustom || type == node_types::kInput || type == node_types::kOutput
        || type == node_types::kComponent || type == "antivirus") {
        const std::string& name = node.data.customName.empty() ? std::string("Custom Node") : node.data.customName;
        const float byName = static_cast<float>(name.size()) * 8.0f + 180.0f;
        return NodeSize{std::min(620.0f, std::max(320.0f, byName)), portRowsHeight(node, 182.0f, 200.0f), 0.0f, 0.0f};
    }
    return NodeSize{kDefaultNodeWidth, kDefaultNodeHeight, 0.0f, 0.0f};
}

PortSpec makePort(const std::string& id, const std::string& label) {
    return PortSpec{id, label};
}

} // namespace

BoundaryRole boundaryRoleForType(const std::string& type) {
    if (type == node_types::kInput || type == node_types::kNumberSlider || type == node_types::kSeries) {
        return BoundaryRole::Source;
    }
    if (type == node_types::kOutput) return BoundaryRole::Sink;
    return BoundaryRole::None;
}

bool isElasticArity(const std::string& type) {
    return type == node_types::kOutput;
}

Node makeDefaultNode(const std::string& type, const std::string& id, Point2 position) {
    Node node{};
    node.id = id;
    node.type = type;
    node.position = position;
    NodeData& d = node.data;

    if (type == node_types::kInput) {
        d.customName = "Input Node";
        d.outputs.push_back(makePort("output-1", "Output 1"));
    } else if (type == node_types::kOutput) {
        d.customName = "Output Node";
        d.inputs.push_back(makePort("input-1", "Input 1"));
    } else if (type == node_types::kNumberSlider) {
        d.customName = "Number Slider";
        d.width = 260.0f;
        d.height = 150.0f;
        d.params["min"] = 0.0f;
        d.params["max"] = 100.0f;
        d.params["step"] = 1.0f;
        d.params["value"] = 50.0f;
        d.outputs.push_back(makePort("output-main", "Value"));
    } else if (type == node_types::kPanel) {
        d.customName = "Panel";
        d.width = 340.0f;
        d.height = 300.0f;
        d.inputs.push_back(makePort("input-main", "Inspector Input"));
        d.outputs.push_back(makePort("output-main", "Panel Output"));
    } else if (type == node_types::kCustom) {
        d.customName = "Custom Node";
    } else if (type == node_types::kGroup) {
        d.customName = "Group";
    } else if (type == node_types::kComponent) {
        d.customName = "Component";
    }
    return node;
}

std::string nextElasticInputId(const Node& node) {
    std::size_t n = node.data.inputs.size() + 1;
    for (;;) {
        std::string id = "input-" + std::to_string(n);
        if (!node.declaredRole(id)) return id;
        ++n;
    }
}

Rect2 estimateNodeBounds(const Node& node) {
    float extraLeft = 0.0f;
    float extraRight = 0.0f;
    const bool series = node.type == node_types::kSeries;
    if (!series) {
        if (!node.data.inputs.empty()) extraLeft = kPortStickout;
        if (!node.data.outputs.empty()) extraRight = kPortStickout;
    }

    const NodeSize fallback = fallbackSize(node);
    if (fallback.extraLeft > 0.0f) extraLeft = fallback.extraLeft;
    if (fallback.extraRight > 0.0f) extraRight = fallback.extraRight;

    float width = fallback.width;
    float height = fallback.height;
    if (node.data.width && *node.data.width > kMeasuredSizeThreshold) width = *node.data.width;
    if (!isPrimitive(node.type) && node.data.height && *node.data.height > kMeasuredSizeThreshold) {
        height = *node.data.height;
    }
    width = std::max(kMinNodeSize, width);
    height = std::max(kMinNodeSize, height);

    Rect2 r{};
    r.minX = node.position.x - extraLeft;
    r.minY = node.position.y;
    r.maxX = r.minX + width + extraLeft + extraRight;
    r.maxY = r.minY + height;
    return r;
}

Rect2 unionBounds(const std::vector<const Node*>& nodes) {
    Rect2 out = estimateNodeBounds(*nodes.front());
    for (std::size_t i = 1; i < nodes.size(); ++i) {
        const Rect2 r = estimateNodeBounds(*nodes[i]);
        out.minX = std::min(out.minX, r.minX);
        out.minY = std::min(out.minY, r.minY);
        out.maxX = std::max(out.maxX, r.maxX);
        out.maxY = std::max(out.maxY, r.maxY);
    }
    return out;
}

GroupFrame frameAround(const Rect2& content, float padding, float paddingBottom, float header) {
    GroupFrame frame{};
    frame.position = Point2{content.minX - padding, content.minY - padding - header};
    frame.width = content.width() + padding * 2.0f;
    frame.height = content.height() + padding + paddingBottom + header;
    return frame;
}

bool isNodeOverlappingGroup(const Node& node, const Node& group) {
    const float nodeW = node.data.width.value_or(kDefaultNodeWidth);
    const float nodeH = node.data.height.value_or(kDefaultNodeHeight);
    const float cx = node.position.x + nodeW / 2.0f;
    const float cy = node.position.y + nodeH / 2.0f;
    const float groupW = group.data.width.value_or(300.0f);
    const float groupH = group.data.height.value_or(300.0f);
    return cx >= group.position.x && cx <= group.position.x + groupW
        && cy >= group.position.y && cy <= group.position.y + groupH;
}

} // namespace nodegraph
