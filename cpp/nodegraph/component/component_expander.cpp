#include "nodegraph/component/component_expander.h"
#include "nodegraph/component/component_registry.h"
#include "nodegraph/core/logging.h"
#include "nodegraph/engine.h"
#include "nodegraph/graph/graph_store.h"
#include "nodegraph/graph/node_catalog.h"
#include <set>
#include <utility>

namespace nodegraph {

using namespace layout_constants;

ComponentExpander::ComponentExpander(GraphEngine& engine, GraphStore& store, const ComponentRegistry& registry)
    : engine_(engine), store_(store), registry_(registry) {}

bool ComponentExpander::resolveEndpoint(
    const ComponentDefinition& def,
    PortRole role,
    const std::string& componentPortId,
    const std::map<std::string, std::string>& idMap,
    const std::map<std::string, const Node*>& restored,
    Endpoint& out) const {
    const PortBinding* binding = def.findBinding(role, componentPortId);
    if (!binding) return false;
    const auto mapped = idMap.find(binding->nodeId);
    if (mapped == idMap.end()) return false;
    const auto node = restored.find(mapped->second);
    if (node == restored.end()) return false;

    // A component input carries an inbound wire, which lands on an input port
    // of the bound node; a component output leaves through an output port.
    out.nodeId = mapped->second;
    if (node->second->declaredRole(binding->portId) == role) {
        out.portId = binding->portId;
        return true;
    }
    // Boundary nodes bind their own sockets; the wire takes the node's first
    // port of the role it needs.
    const auto& candidates = node->second->ports(role);
    if (candidates.empty()) return false;
    out.portId = candidates.front().id;
    return true;
}

std::string ComponentExpander::expand(const std::string& instanceId) {
    const Node* found = store_.findNode(instanceId);
    if (!found) {
        engine_.reportFailure(DiagnosticOp::Expand, GraphError::NotFound, instanceId);
        return {};
    }
    if (!found->isComponent()) {
        engine_.reportFailure(DiagnosticOp::Expand, GraphError::InvalidOperation, instanceId, "not a component instance");
        return {};
    }
    const Node instance = *found;
    const auto resolved = registry_.resolve(instance.data.componentId);
    if (!resolved) {
        engine_.reportFailure(DiagnosticOp::Expand, GraphError::UnresolvedDefinition, instanceId, instance.data.componentId);
        return {};
    }
    const ComponentDefinition& def = *resolved;
    if (def.internalNodes.empty()) {
        engine_.reportFailure(DiagnosticOp::Expand, GraphError::InvalidOperation, instanceId, "empty definition");
        return {};
    }

    const bool historyStarted = engine_.beginHistoryEntry();

    // Collision-free ids for the restored nodes; live only for this call.
    std::map<std::string, std::string> idMap;
    std::set<std::string> claimed;
    for (const auto& node : def.internalNodes) {
        std::string id = node.id;
        if (store_.hasNode(id) || claimed.count(id) != 0) {
            id = engine_.allocateNodeId("node");
            while (claimed.count(id) != 0) id = engine_.allocateNodeId("node");
        }
        claimed.insert(id);
        idMap.emplace(node.id, id);
    }

    const Point2 delta = instance.position - def.origin;
    std::vector<Node> restoredNodes;
    restoredNodes.reserve(def.internalNodes.size());
    for (const auto& original : def.internalNodes) {
        Node node = original;
        node.id = idMap.at(original.id);
        node.position = original.position + delta;
        restoredNodes.push_back(std::move(node));
    }
    std::map<std::string, const Node*> restoredById;
    std::vector<const Node*> restoredPtrs;
    for (const auto& node : restoredNodes) {
        restoredById.emplace(node.id, &node);
        restoredPtrs.push_back(&node);
    }

    // Rebinding plan for the instance's wires, resolved before any mutation.
    struct Rebind {
        Connection conn;
        bool ok = true;
    };
    std::vector<Rebind> rebinds;
    for (const auto& connId : store_.connectionsTouching(instanceId)) {
        Rebind rb{*store_.findConnection(connId), true};
        if (rb.conn.targetNodeId == instanceId) {
            Endpoint ep{};
            rb.ok = resolveEndpoint(def, PortRole::Input, rb.conn.targetPort, idMap, restoredById, ep);
            rb.conn.targetNodeId = ep.nodeId;
            rb.conn.targetPort = ep.portId;
        }
        if (rb.ok && rb.conn.sourceNodeId == instanceId) {
            Endpoint ep{};
            rb.ok = resolveEndpoint(def, PortRole::Output, rb.conn.sourcePort, idMap, restoredById, ep);
            rb.conn.sourceNodeId = ep.nodeId;
            rb.conn.sourcePort = ep.portId;
        }
        rebinds.push_back(std::move(rb));
    }

    const Rect2 content = unionBounds(restoredPtrs);
    const GroupFrame frame = frameAround(content, kExpandPadding, kExpandPaddingBottom, kExpandHeaderHeight);

    Node group{};
    group.id = engine_.allocateNodeId("group");
    while (claimed.count(group.id) != 0 || store_.hasNode(group.id)) group.id = engine_.allocateNodeId("group");
    group.type = node_types::kGroup;
    group.position = frame.position;
    group.data.width = frame.width;
    group.data.height = frame.height;
    group.data.customName = def.name;
    for (const auto& node : restoredNodes) group.data.childNodeIds.push_back(node.id);
    const std::string groupId = group.id;

    std::size_t slot = store_.nodeIndexOf(instanceId);
    engine_.eraseNodeTracked(instanceId);
    engine_.insertNodeTracked(std::move(group), slot++);
    for (auto& node : restoredNodes) {
        const GraphError inserted = engine_.insertNodeTracked(node, slot++);
        if (inserted != GraphError::Ok) {
            engine_.reportFailure(DiagnosticOp::Expand, inserted, node.id, "restored node not inserted");
        }
    }
    engine_.replaceChildReference(instanceId, groupId);

    for (const auto& original : def.internalConnections) {
        const auto src = idMap.find(original.sourceNodeId);
        const auto tgt = idMap.find(original.targetNodeId);
        if (src == idMap.end() || tgt == idMap.end()) continue;
        Connection conn = original;
        conn.id = engine_.allocateConnectionId();
        conn.sourceNodeId = src->second;
        conn.targetNodeId = tgt->second;
        engine_.insertConnectionTracked(std::move(conn));
    }

    std::size_t dropped = 0;
    for (const auto& rb : rebinds) {
        if (!rb.ok) {
            engine_.eraseConnectionTracked(rb.conn.id);
            engine_.reportFailure(DiagnosticOp::Expand, GraphError::UnknownPort, rb.conn.id, "no binding for instance port");
            ++dropped;
            continue;
        }
        if (engine_.replaceConnectionTracked(rb.conn) == GraphError::DuplicateConnection) {
            engine_.eraseConnectionTracked(rb.conn.id);
            engine_.reportFailure(DiagnosticOp::Expand, GraphError::DuplicateConnection, rb.conn.id,
                "rebound wire duplicates an existing one");
            ++dropped;
        }
    }

    if (historyStarted) engine_.commitHistoryEntry();
    NODEGRAPH_LOG_DEBUG("expanded %s (%s) -> %s: %zu nodes, %zu dropped",
        instanceId.c_str(), def.id.c_str(), groupId.c_str(), restoredNodes.size(), dropped);
    engine_.setError(GraphError::Ok);
    return groupId;
}

} // namespace nodegraph
