#include "nodegraph/component/component_compiler.h"
#include "nodegraph/component/component_registry.h"
#include "nodegraph/core/logging.h"
#include "nodegraph/engine.h"
#include "nodegraph/graph/graph_store.h"
#include "nodegraph/graph/node_catalog.h"
#include <map>
#include <set>
#include <utility>

namespace nodegraph {

namespace {

using EndpointKey = std::pair<std::string, std::string>;

std::string portLabel(const PortSpec& socket, const Node& node, const char* fallbackPrefix, std::size_t ordinal) {
    if (!socket.label.empty()) return socket.label;
    if (!node.data.customName.empty()) return node.data.customName;
    return std::string(fallbackPrefix) + " " + std::to_string(ordinal);
}

// Sockets a boundary node exposes; a node without any gets one default socket.
std::vector<PortSpec> boundarySockets(const Node& node, PortRole role, std::size_t memberIndex) {
    const auto& declared = node.ports(role);
    if (!declared.empty()) return declared;
    const char* prefix = role == PortRole::Output ? "output-" : "input-";
    return {PortSpec{prefix + std::to_string(memberIndex + 1), {}}};
}

struct InterfaceBuilder {
    ComponentDefinition& def;
    std::size_t nextIn = 1;
    std::size_t nextOut = 1;
    std::map<EndpointKey, std::string> inputKeys;
    std::map<EndpointKey, std::string> outputKeys;

    std::string addInput(const std::string& nodeId, const std::string& portId, std::string label) {
        auto it = inputKeys.find(EndpointKey{nodeId, portId});
        if (it != inputKeys.end()) return it->second;
        std::string id = "in-" + std::to_string(nextIn++);
        def.inputPorts.push_back(PortSpec{id, std::move(label)});
        def.inputBindings.push_back(PortBinding{id, nodeId, portId});
        inputKeys.emplace(EndpointKey{nodeId, portId}, id);
        return id;
    }

    std::string addOutput(const std::string& nodeId, const std::string& portId, std::string label) {
        auto it = outputKeys.find(EndpointKey{nodeId, portId});
        if (it != outputKeys.end()) return it->second;
        std::string id = "out-" + std::to_string(nextOut++);
        def.outputPorts.push_back(PortSpec{id, std::move(label)});
        def.outputBindings.push_back(PortBinding{id, nodeId, portId});
        outputKeys.emplace(EndpointKey{nodeId, portId}, id);
        return id;
    }
};

} // namespace

ComponentCompiler::ComponentCompiler(GraphEngine& engine, GraphStore& store, ComponentRegistry& registry)
    : engine_(engine), store_(store), registry_(registry) {}

GraphError ComponentCompiler::plan(const std::string& groupId, CompilePlan& out) const {
    const Node* group = store_.findNode(groupId);
    if (!group) return GraphError::NotFound;
    if (!group->isGroup()) return GraphError::InvalidOperation;

    const std::set<std::string> childIds(group->data.childNodeIds.begin(), group->data.childNodeIds.end());
    std::vector<const Node*> members;
    for (const auto& node : store_.nodes()) {
        if (childIds.count(node.id) == 0) continue;
        if (node.isGroup()) return GraphError::RecursiveStructure;
        members.push_back(&node);
    }
    if (members.empty()) return GraphError::InvalidOperation;

    out = CompilePlan{};
    ComponentDefinition& def = out.definition;
    def.name = group->data.customName.empty() ? std::string("Component") : group->data.customName;
    def.origin = group->position;

    std::set<std::string> memberSet;
    for (const Node* m : members) {
        memberSet.insert(m->id);
        out.memberIds.push_back(m->id);
        def.internalNodes.push_back(*m);
    }

    std::vector<const Connection*> external;
    for (const auto& conn : store_.connections()) {
        if (conn.touches(groupId)) {
            out.frameConnectionIds.push_back(conn.id);
            continue;
        }
        const bool srcIn = memberSet.count(conn.sourceNodeId) != 0;
        const bool tgtIn = memberSet.count(conn.targetNodeId) != 0;
        if (srcIn && tgtIn) {
            def.internalConnections.push_back(conn);
            out.internalConnectionIds.push_back(conn.id);
        } else if (srcIn || tgtIn) {
            external.push_back(&conn);
        }
    }

    InterfaceBuilder builder{def};
    // First boundary port of each source-like / sink-like member.
    std::map<std::string, std::string> boundaryPort;

    for (std::size_t i = 0; i < members.size(); ++i) {
        const Node& m = *members[i];
        const BoundaryRole role = boundaryRoleForType(m.type);
        if (role == BoundaryRole::Source) {
            const auto sockets = boundarySockets(m, PortRole::Output, i);
            for (const auto& socket : sockets) {
                const std::string label = portLabel(socket, m, "Input", builder.nextIn);
                const std::string id = builder.addInput(m.id, socket.id, label);
                boundaryPort.emplace(m.id, id);
            }
        } else if (role == BoundaryRole::Sink) {
            const auto sockets = boundarySockets(m, PortRole::Input, i);
            for (const auto& socket : sockets) {
                const std::string label = portLabel(socket, m, "Output", builder.nextOut);
                const std::string id = builder.addOutput(m.id, socket.id, label);
                boundaryPort.emplace(m.id, id);
            }
        }
    }

    for (const Connection* conn : external) {
        const bool inbound = memberSet.count(conn->targetNodeId) != 0;
        const std::string& insideId = inbound ? conn->targetNodeId : conn->sourceNodeId;
        const std::string& insidePort = inbound ? conn->targetPort : conn->sourcePort;
        const Node* inside = store_.findNode(insideId);

        ExternalRewrite rewrite{};
        rewrite.connectionId = conn->id;
        rewrite.inbound = inbound;

        const BoundaryRole role = boundaryRoleForType(inside->type);
        const bool covered = inbound ? role == BoundaryRole::Source : role == BoundaryRole::Sink;
        if (covered) {
            rewrite.componentPortId = boundaryPort.at(insideId);
        } else if (inbound) {
            const PortSpec* declared = inside->findInput(insidePort);
            const std::string label = declared && !declared->label.empty() ? declared->label : insidePort;
            rewrite.componentPortId = builder.addInput(insideId, insidePort, label);
        } else {
            const PortSpec* declared = inside->findOutput(insidePort);
            const std::string label = declared && !declared->label.empty() ? declared->label : insidePort;
            rewrite.componentPortId = builder.addOutput(insideId, insidePort, label);
        }
        out.rewrites.push_back(std::move(rewrite));
    }
    return GraphError::Ok;
}

std::string ComponentCompiler::compile(const std::string& groupId) {
    CompilePlan p{};
    const GraphError err = plan(groupId, p);
    if (err != GraphError::Ok) {
        engine_.reportFailure(DiagnosticOp::Compile, err, groupId);
        return {};
    }

    const Node group = *store_.findNode(groupId);
    const std::string definitionId = registry_.publish(p.definition);
    engine_.recordDefinitionPublished(definitionId);
    const ComponentDefinition& def = p.definition;

    const bool historyStarted = engine_.beginHistoryEntry();

    Node instance{};
    instance.id = engine_.allocateNodeId("node");
    instance.type = node_types::kComponent;
    instance.position = group.position;
    instance.data.customName = def.name;
    instance.data.inputs = def.inputPorts;
    instance.data.outputs = def.outputPorts;
    instance.data.componentId = definitionId;
    instance.data.width = group.data.width;
    instance.data.height = group.data.height;

    for (const auto& id : p.internalConnectionIds) {
        engine_.eraseConnectionTracked(id);
    }
    for (const auto& id : p.frameConnectionIds) {
        engine_.eraseConnectionTracked(id);
    }

    for (const auto& id : p.memberIds) {
        engine_.eraseNodeTracked(id);
        engine_.replaceChildReference(id, {});
    }
    // The instance takes the group's slot in node order.
    const std::size_t slot = store_.nodeIndexOf(groupId);
    engine_.eraseNodeTracked(groupId);
    const std::string instanceId = instance.id;
    engine_.insertNodeTracked(std::move(instance), slot);
    engine_.replaceChildReference(groupId, instanceId);

    std::size_t dropped = 0;
    for (const auto& rewrite : p.rewrites) {
        const Connection* existing = store_.findConnection(rewrite.connectionId);
        if (!existing) continue;
        Connection conn = *existing;
        if (rewrite.inbound) {
            conn.targetNodeId = instanceId;
            conn.targetPort = rewrite.componentPortId;
        } else {
            conn.sourceNodeId = instanceId;
            conn.sourcePort = rewrite.componentPortId;
        }
        if (engine_.replaceConnectionTracked(conn) == GraphError::DuplicateConnection) {
            engine_.eraseConnectionTracked(conn.id);
            engine_.reportFailure(DiagnosticOp::Compile, GraphError::DuplicateConnection, conn.id,
                "rewritten wire duplicates an existing one");
            ++dropped;
        }
    }

    if (historyStarted) engine_.commitHistoryEntry();
    NODEGRAPH_LOG_DEBUG("compiled %s -> %s (%s): %zu in, %zu out, %zu dropped, %zu frame wires removed",
        groupId.c_str(), instanceId.c_str(), definitionId.c_str(),
        def.inputPorts.size(), def.outputPorts.size(), dropped, p.frameConnectionIds.size());
    engine_.setError(GraphError::Ok);
    return instanceId;
}

} // namespace nodegraph
