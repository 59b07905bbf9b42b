#pragma once

#include "nodegraph/component/component_types.h"
#include "nodegraph/core/types.h"
#include <string>
#include <vector>

namespace nodegraph {

class GraphEngine;
class GraphStore;
class ComponentRegistry;

struct ExternalRewrite {
    std::string connectionId;
    // True when the wire enters the group (instance is the target).
    bool inbound = false;
    std::string componentPortId;
};

// Interface synthesized for a group, before anything is mutated.
struct CompilePlan {
    ComponentDefinition definition;
    std::vector<std::string> memberIds;
    std::vector<std::string> internalConnectionIds;
    // Wires on the group frame's own ports; removed with the frame.
    std::vector<std::string> frameConnectionIds;
    std::vector<ExternalRewrite> rewrites;
};

// Folds a group and its members into one opaque component instance.
class ComponentCompiler {
public:
    ComponentCompiler(GraphEngine& engine, GraphStore& store, ComponentRegistry& registry);

    // Returns the instance id, or empty with the engine error set.
    std::string compile(const std::string& groupId);

    // Pure: computes ports, bindings and rewrites for the group.
    GraphError plan(const std::string& groupId, CompilePlan& out) const;

private:
    GraphEngine& engine_;
    GraphStore& store_;
    ComponentRegistry& registry_;
};

} // namespace nodegraph
