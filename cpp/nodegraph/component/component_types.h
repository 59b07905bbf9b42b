#pragma once

#include "nodegraph/graph/graph_types.h"
#include <string>
#include <vector>

namespace nodegraph {

// Maps a component port to the internal endpoint it stands for.
struct PortBinding {
    std::string componentPortId;
    std::string nodeId;
    std::string portId;
};

inline bool operator==(const PortBinding& a, const PortBinding& b) {
    return a.componentPortId == b.componentPortId && a.nodeId == b.nodeId && a.portId == b.portId;
}

struct ComponentDefinition {
    std::string id;
    std::string name;
    std::vector<PortSpec> inputPorts;
    std::vector<PortSpec> outputPorts;
    std::vector<Node> internalNodes;
    std::vector<Connection> internalConnections;
    std::vector<PortBinding> inputBindings;
    std::vector<PortBinding> outputBindings;
    // Group position at extraction time; expansion offsets nodes relative to it.
    Point2 origin{};

    const PortBinding* findBinding(PortRole role, const std::string& componentPortId) const {
        const auto& bindings = role == PortRole::Input ? inputBindings : outputBindings;
        for (const auto& b : bindings) {
            if (b.componentPortId == componentPortId) return &b;
        }
        return nullptr;
    }
};

bool operator==(const ComponentDefinition& a, const ComponentDefinition& b);

} // namespace nodegraph
