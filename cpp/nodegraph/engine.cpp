#include "nodegraph/engine.h"
#include "nodegraph/core/logging.h"
#include "nodegraph/graph/node_catalog.h"
#include <algorithm>
#include <set>
#include <utility>

namespace nodegraph {

GraphEngine::GraphEngine(EngineConfig config)
    : config_(config),
      history_(store_, config_.maxHistoryEntries),
      diagnostics_(config_.diagnosticCapacity),
      router_(*this, store_, config_.router),
      compiler_(*this, store_, registry_),
      expander_(*this, store_, registry_) {}

void GraphEngine::clear() {
    router_.reset();
    store_.clear();
    registry_.clear();
    history_.clear();
    ids_.reset();
    diagnostics_.clear();
    clearEventState();
    lastError_ = GraphError::Ok;
    pendingReload_ = true;
}

// ==============================================================================
// History plumbing
// ==============================================================================

bool GraphEngine::beginHistoryEntry() {
    return history_.beginEntry(ids_.getNext());
}

void GraphEngine::commitHistoryEntry() {
    if (history_.commitEntry(ids_.getNext())) {
        recordHistoryChanged();
    }
}

void GraphEngine::markNodeChange(const std::string& id) {
    history_.markNodeChange(id);
}

void GraphEngine::markConnectionChange(const std::string& id) {
    history_.markConnectionChange(id);
}

std::string GraphEngine::allocateNodeId(const std::string& prefix) {
    return ids_.allocate(prefix, [this](const std::string& id) { return store_.hasNode(id); });
}

std::string GraphEngine::allocateConnectionId() {
    return ids_.allocate("conn", [this](const std::string& id) { return store_.hasConnection(id); });
}

void GraphEngine::reportFailure(DiagnosticOp op, GraphError err, const std::string& subjectId, const std::string& detail) {
    setError(err);
    diagnostics_.record(op, err, subjectId, detail);
}

// ==============================================================================
// Tracked mutations
// ==============================================================================

GraphError GraphEngine::insertNodeTracked(Node node, std::size_t position) {
    if (store_.hasNode(node.id)) return GraphError::DuplicateId;
    const std::string id = node.id;
    markNodeChange(id);
    const GraphError err = store_.insertNode(std::move(node), position);
    if (err == GraphError::Ok) {
        recordNodeCreated(id);
        recordOrderChanged();
    }
    return err;
}

bool GraphEngine::replaceNodeTracked(const Node& node) {
    if (!store_.hasNode(node.id)) return false;
    markNodeChange(node.id);
    store_.replaceNode(node);
    recordNodeChanged(node.id);
    return true;
}

bool GraphEngine::eraseNodeTracked(const std::string& id) {
    if (!store_.hasNode(id)) return false;
    markNodeChange(id);
    store_.eraseNode(id);
    recordNodeDeleted(id);
    recordOrderChanged();
    return true;
}

GraphError GraphEngine::insertConnectionTracked(Connection conn) {
    if (store_.hasConnection(conn.id)) return GraphError::DuplicateId;
    if (store_.hasConnectionTuple(conn.sourceNodeId, conn.sourcePort, conn.targetNodeId, conn.targetPort)) {
        return GraphError::DuplicateConnection;
    }
    const std::string id = conn.id;
    markConnectionChange(id);
    const GraphError err = store_.insertConnection(std::move(conn));
    if (err == GraphError::Ok) recordConnectionCreated(id);
    return err;
}

GraphError GraphEngine::replaceConnectionTracked(const Connection& conn) {
    if (!store_.hasConnection(conn.id)) return GraphError::NotFound;
    if (store_.hasConnectionTuple(conn.sourceNodeId, conn.sourcePort, conn.targetNodeId, conn.targetPort, conn.id)) {
        return GraphError::DuplicateConnection;
    }
    markConnectionChange(conn.id);
    const GraphError err = store_.replaceConnection(conn);
    if (err == GraphError::Ok) recordConnectionChanged(conn.id);
    return err;
}

bool GraphEngine::eraseConnectionTracked(const std::string& id) {
    if (!store_.hasConnection(id)) return false;
    markConnectionChange(id);
    store_.eraseConnection(id);
    recordConnectionDeleted(id);
    return true;
}

void GraphEngine::replaceChildReference(const std::string& oldId, const std::string& replacement) {
    for (const auto& groupId : store_.groupsContaining(oldId)) {
        Node group = *store_.findNode(groupId);
        auto& children = group.data.childNodeIds;
        const bool hasReplacement = !replacement.empty()
            && std::find(children.begin(), children.end(), replacement) != children.end();
        for (auto it = children.begin(); it != children.end();) {
            if (*it != oldId) {
                ++it;
            } else if (replacement.empty() || hasReplacement || replacement == groupId) {
                it = children.erase(it);
            } else {
                *it = replacement;
                ++it;
            }
        }
        replaceNodeTracked(group);
    }
}

// ==============================================================================
// Nodes
// ==============================================================================

std::string GraphEngine::addNode(const std::string& type, Point2 position) {
    if (type.empty()) {
        setError(GraphError::InvalidOperation);
        return {};
    }
    const bool historyStarted = beginHistoryEntry();
    const std::string id = allocateNodeId(type == node_types::kGroup ? "group" : "node");
    insertNodeTracked(makeDefaultNode(type, id, position));
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return id;
}

std::string GraphEngine::addNode(Node node) {
    if (node.type.empty()) {
        reportFailure(DiagnosticOp::NodeEdit, GraphError::InvalidOperation, node.id, "node without type");
        return {};
    }
    if (!node.id.empty() && store_.hasNode(node.id)) {
        reportFailure(DiagnosticOp::NodeEdit, GraphError::DuplicateId, node.id);
        return {};
    }
    const bool historyStarted = beginHistoryEntry();
    if (node.id.empty()) node.id = allocateNodeId(node.isGroup() ? "group" : "node");
    const std::string id = node.id;
    insertNodeTracked(std::move(node));
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return id;
}

std::string GraphEngine::duplicateNode(const std::string& id) {
    const Node* source = store_.findNode(id);
    if (!source) {
        setError(GraphError::NotFound);
        return {};
    }
    Node copy = *source;
    copy.position.x += layout_constants::kDuplicateOffset;
    copy.position.y += layout_constants::kDuplicateOffset;
    copy.data.childNodeIds.clear();

    const bool historyStarted = beginHistoryEntry();
    copy.id = allocateNodeId(copy.isGroup() ? "group" : "node");
    const std::string newId = copy.id;
    insertNodeTracked(std::move(copy));
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return newId;
}

bool GraphEngine::deleteNode(const std::string& id, bool deleteChildren) {
    const Node* node = store_.findNode(id);
    if (!node) {
        setError(GraphError::NotFound);
        return false;
    }
    std::vector<std::string> ids{id};
    if (deleteChildren && node->isGroup()) {
        ids.insert(ids.end(), node->data.childNodeIds.begin(), node->data.childNodeIds.end());
    }
    return deleteNodes(ids);
}

bool GraphEngine::deleteNodes(const std::vector<std::string>& ids) {
    std::set<std::string> doomed;
    for (const auto& id : ids) {
        if (store_.hasNode(id)) doomed.insert(id);
    }
    if (doomed.empty()) {
        setError(GraphError::NotFound);
        return false;
    }

    const bool historyStarted = beginHistoryEntry();
    std::vector<std::string> wires;
    for (const auto& conn : store_.connections()) {
        if (doomed.count(conn.sourceNodeId) != 0 || doomed.count(conn.targetNodeId) != 0) {
            wires.push_back(conn.id);
        }
    }
    for (const auto& connId : wires) eraseConnectionTracked(connId);
    for (const auto& id : doomed) {
        eraseNodeTracked(id);
        replaceChildReference(id, {});
    }
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return true;
}

bool GraphEngine::moveNode(const std::string& id, Point2 position) {
    const Node* node = store_.findNode(id);
    if (!node) {
        setError(GraphError::NotFound);
        return false;
    }
    Node moved = *node;
    moved.position = position;
    const bool historyStarted = beginHistoryEntry();
    replaceNodeTracked(moved);
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return true;
}

bool GraphEngine::updateNodeData(const std::string& id, const NodeData& data) {
    const Node* node = store_.findNode(id);
    if (!node) {
        setError(GraphError::NotFound);
        return false;
    }
    Node updated = *node;
    updated.data = data;

    // Wires on ports this update removes, or moves to the other role, would
    // dangle. Undeclared legacy ports are left alone.
    std::vector<std::string> orphaned;
    for (const auto& conn : store_.connections()) {
        if (conn.sourceNodeId == id && node->declaredRole(conn.sourcePort) && !updated.findOutput(conn.sourcePort)) {
            orphaned.push_back(conn.id);
        } else if (conn.targetNodeId == id && node->declaredRole(conn.targetPort) && !updated.findInput(conn.targetPort)) {
            orphaned.push_back(conn.id);
        }
    }

    const bool historyStarted = beginHistoryEntry();
    for (const auto& connId : orphaned) eraseConnectionTracked(connId);
    replaceNodeTracked(updated);
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return true;
}

bool GraphEngine::renameNode(const std::string& id, const std::string& name) {
    const Node* node = store_.findNode(id);
    if (!node) {
        setError(GraphError::NotFound);
        return false;
    }
    NodeData data = node->data;
    data.customName = name;
    return updateNodeData(id, data);
}

std::string GraphEngine::addPort(const std::string& nodeId, PortRole role, const std::string& label) {
    const Node* node = store_.findNode(nodeId);
    if (!node) {
        setError(GraphError::NotFound);
        return {};
    }
    Node updated = *node;
    auto& ports = role == PortRole::Input ? updated.data.inputs : updated.data.outputs;
    const char* prefix = role == PortRole::Input ? "input-" : "output-";
    std::size_t n = ports.size() + 1;
    std::string portId = prefix + std::to_string(n);
    while (updated.declaredRole(portId)) portId = prefix + std::to_string(++n);
    const std::string fallback = std::string(role == PortRole::Input ? "Input " : "Output ") + std::to_string(ports.size() + 1);
    ports.push_back(PortSpec{portId, label.empty() ? fallback : label});

    const bool historyStarted = beginHistoryEntry();
    replaceNodeTracked(updated);
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return portId;
}

bool GraphEngine::syncNode(const Node& node) {
    if (history_.isRestoring()) {
        reportFailure(DiagnosticOp::Sync, GraphError::InvalidOperation, node.id, "write during undo/redo");
        return false;
    }
    if (!store_.replaceNode(node)) {
        setError(GraphError::NotFound);
        return false;
    }
    recordNodeChanged(node.id);
    setError(GraphError::Ok);
    return true;
}

// ==============================================================================
// Connections
// ==============================================================================

bool GraphEngine::startConnection(const std::string& nodeId, const std::string& portId, Point2 pointer, Point2 canvasOrigin) {
    return router_.startConnection(nodeId, portId, pointer, canvasOrigin);
}

void GraphEngine::updateConnectionDrag(Point2 pointer) {
    router_.updateConnectionDrag(pointer);
}

std::string GraphEngine::completeConnection(const std::string& targetNodeId, const std::string& targetPort) {
    return router_.completeConnection(targetNodeId, targetPort);
}

void GraphEngine::releaseConnection() {
    router_.releaseConnection();
}

void GraphEngine::cancelConnection() {
    router_.cancelConnection();
}

std::string GraphEngine::connect(
    const std::string& nodeA, const std::string& portA,
    const std::string& nodeB, const std::string& portB) {
    return router_.connect(nodeA, portA, nodeB, portB);
}

bool GraphEngine::deleteConnection(const std::string& id) {
    return router_.deleteConnection(id);
}

bool GraphEngine::deleteConnections(const std::vector<std::string>& ids) {
    std::vector<std::string> existing;
    for (const auto& id : ids) {
        if (store_.hasConnection(id)) existing.push_back(id);
    }
    if (existing.empty()) {
        setError(GraphError::NotFound);
        return false;
    }
    const bool historyStarted = beginHistoryEntry();
    for (const auto& id : existing) eraseConnectionTracked(id);
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return true;
}

bool GraphEngine::setConnectionStyle(const std::string& id, bool isDashed, bool isGhost) {
    const Connection* conn = store_.findConnection(id);
    if (!conn) {
        setError(GraphError::NotFound);
        return false;
    }
    Connection styled = *conn;
    styled.isDashed = isDashed;
    styled.isGhost = isGhost;
    const bool historyStarted = beginHistoryEntry();
    replaceConnectionTracked(styled);
    if (historyStarted) commitHistoryEntry();
    setError(GraphError::Ok);
    return true;
}

// ==============================================================================
// Components
// ==============================================================================

std::string GraphEngine::compileGroup(const std::string& groupId) {
    return compiler_.compile(groupId);
}

std::string GraphEngine::expandComponent(const std::string& instanceId) {
    return expander_.expand(instanceId);
}

// ==============================================================================
// History
// ==============================================================================

bool GraphEngine::undo() {
    if (history_.isActionOpen()) {
        reportFailure(DiagnosticOp::Undo, GraphError::InvalidOperation, {}, "action open");
        return false;
    }
    router_.cancelConnection();
    if (!history_.undo(*this)) return false;
    recordHistoryChanged();
    return true;
}

bool GraphEngine::redo() {
    if (history_.isActionOpen()) {
        reportFailure(DiagnosticOp::Redo, GraphError::InvalidOperation, {}, "action open");
        return false;
    }
    router_.cancelConnection();
    if (!history_.redo(*this)) return false;
    recordHistoryChanged();
    return true;
}

void GraphEngine::startAction() {
    history_.startAction(ids_.getNext());
}

bool GraphEngine::endAction() {
    if (!history_.endAction(ids_.getNext())) return false;
    recordHistoryChanged();
    return true;
}

void GraphEngine::onNodeRestored(const std::string& id, bool existed, bool exists) {
    if (existed && exists) {
        recordNodeChanged(id);
    } else if (exists) {
        recordNodeCreated(id);
    } else if (existed) {
        recordNodeDeleted(id);
    }
}

void GraphEngine::onConnectionRestored(const std::string& id, bool existed, bool exists) {
    if (existed && exists) {
        recordConnectionChanged(id);
    } else if (exists) {
        recordConnectionCreated(id);
    } else if (existed) {
        recordConnectionDeleted(id);
    }
}

void GraphEngine::onOrderRestored() {
    recordOrderChanged();
}

void GraphEngine::onNextIdRestored(std::uint32_t nextId) {
    ids_.setNext(nextId);
}

} // namespace nodegraph
