#include "nodegraph/graph/graph_types.h"

namespace nodegraph {

namespace {
const PortSpec* findPort(const std::vector<PortSpec>& ports, const std::string& portId) {
    for (const auto& port : ports) {
        if (port.id == portId) return &port;
    }
    return nullptr;
}
} // namespace

const PortSpec* Node::findInput(const std::string& portId) const {
    return findPort(data.inputs, portId);
}

const PortSpec* Node::findOutput(const std::string& portId) const {
    return findPort(data.outputs, portId);
}

std::optional<PortRole> Node::declaredRole(const std::string& portId) const {
    if (findInput(portId)) return PortRole::Input;
    if (findOutput(portId)) return PortRole::Output;
    return std::nullopt;
}

bool operator==(const PortSpec& a, const PortSpec& b) {
    return a.id == b.id && a.label == b.label;
}

bool operator==(const NodeData& a, const NodeData& b) {
    return a.inputs == b.inputs
        && a.outputs == b.outputs
        && a.width == b.width
        && a.height == b.height
        && a.customName == b.customName
        && a.childNodeIds == b.childNodeIds
        && a.componentId == b.componentId
        && a.params == b.params;
}

bool operator==(const Node& a, const Node& b) {
    return a.id == b.id && a.type == b.type && a.position == b.position && a.data == b.data;
}

bool operator==(const Connection& a, const Connection& b) {
    return a.id == b.id && a.sameEndpoints(b) && a.isDashed == b.isDashed && a.isGhost == b.isGhost;
}

} // namespace nodegraph
