#ifndef NODEGRAPH_GRAPH_TYPES_H
#define NODEGRAPH_GRAPH_TYPES_H

#include "nodegraph/core/types.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nodegraph {

namespace node_types {
constexpr const char* kInput = "input";
constexpr const char* kOutput = "output";
constexpr const char* kNumberSlider = "number-slider";
constexpr const char* kSeries = "series";
constexpr const char* kPanel = "panel";
constexpr const char* kCustom = "custom";
constexpr const char* kGroup = "group";
constexpr const char* kComponent = "component";
constexpr const char* kBox = "box";
constexpr const char* kSphere = "sphere";
constexpr const char* kVectorXyz = "vector-xyz";
} // namespace node_types

enum class PortRole : std::uint8_t {
    Input = 0,
    Output = 1,
};

inline PortRole oppositeRole(PortRole role) noexcept {
    return role == PortRole::Input ? PortRole::Output : PortRole::Input;
}

struct PortSpec {
    std::string id;
    std::string label;
};

struct NodeData {
    std::vector<PortSpec> inputs;
    std::vector<PortSpec> outputs;
    std::optional<float> width;
    std::optional<float> height;
    std::string customName;
    // Group nodes only.
    std::vector<std::string> childNodeIds;
    // Component instances only.
    std::string componentId;
    // Numeric type parameters (slider min/max/step/value, ...).
    std::map<std::string, float> params;
};

struct Node {
    std::string id;
    std::string type;
    Point2 position{};
    NodeData data{};

    const PortSpec* findInput(const std::string& portId) const;
    const PortSpec* findOutput(const std::string& portId) const;

    // Role by declared membership; nullopt when the port is on neither list.
    std::optional<PortRole> declaredRole(const std::string& portId) const;

    const std::vector<PortSpec>& ports(PortRole role) const {
        return role == PortRole::Input ? data.inputs : data.outputs;
    }

    bool isGroup() const { return type == node_types::kGroup; }
    bool isComponent() const { return type == node_types::kComponent; }
};

struct Connection {
    std::string id;
    std::string sourceNodeId;
    std::string sourcePort;
    std::string targetNodeId;
    std::string targetPort;
    bool isDashed = false;
    bool isGhost = false;

    bool touches(const std::string& nodeId) const {
        return sourceNodeId == nodeId || targetNodeId == nodeId;
    }

    bool sameEndpoints(const Connection& other) const {
        return sourceNodeId == other.sourceNodeId
            && sourcePort == other.sourcePort
            && targetNodeId == other.targetNodeId
            && targetPort == other.targetPort;
    }
};

bool operator==(const PortSpec& a, const PortSpec& b);
bool operator==(const NodeData& a, const NodeData& b);
bool operator==(const Node& a, const Node& b);
bool operator==(const Connection& a, const Connection& b);
inline bool operator!=(const Node& a, const Node& b) { return !(a == b); }
inline bool operator!=(const Connection& a, const Connection& b) { return !(a == b); }

} // namespace nodegraph

#endif // NODEGRAPH_GRAPH_TYPES_H
