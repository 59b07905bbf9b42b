#pragma once

#include "nodegraph/component/component_types.h"
#include "nodegraph/core/types.h"
#include <map>
#include <string>
#include <vector>

namespace nodegraph {

class GraphEngine;
class GraphStore;
class ComponentRegistry;

// Inverse of ComponentCompiler: restores an instance into a group of fresh
// copies of the definition's nodes and rebinds the instance's wires.
class ComponentExpander {
public:
    ComponentExpander(GraphEngine& engine, GraphStore& store, const ComponentRegistry& registry);

    // Returns the id of the enclosing group, or empty with the engine error set.
    // Nothing is committed on failure.
    std::string expand(const std::string& instanceId);

private:
    struct Endpoint {
        std::string nodeId;
        std::string portId;
    };

    // Resolves an instance port to the restored endpoint that now carries it.
    bool resolveEndpoint(
        const ComponentDefinition& def,
        PortRole role,
        const std::string& componentPortId,
        const std::map<std::string, std::string>& idMap,
        const std::map<std::string, const Node*>& restored,
        Endpoint& out) const;

    GraphEngine& engine_;
    GraphStore& store_;
    const ComponentRegistry& registry_;
};

} // namespace nodegraph
