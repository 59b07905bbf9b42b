#include "nodegraph/interaction/connection_router.h"
#include "nodegraph/core/logging.h"
#include "nodegraph/engine.h"
#include "nodegraph/graph/graph_store.h"
#include "nodegraph/graph/node_catalog.h"
#include <algorithm>

namespace nodegraph {

namespace {
Point2 toCanvasLocal(Point2 pointer, Point2 canvasOrigin) {
    return pointer - canvasOrigin;
}

bool looksLikeInput(const std::string& portId) {
    return portId.find("input") != std::string::npos || portId.rfind("in-", 0) == 0;
}
} // namespace

ConnectionRouter::ConnectionRouter(GraphEngine& engine, GraphStore& store, const RouterOptions& options)
    : engine_(engine), store_(store), options_(options) {}

std::optional<PortRole> ConnectionRouter::classifyPort(const Node& node, const std::string& portId) const {
    if (const auto declared = node.declaredRole(portId)) return declared;
    if (!options_.legacyRoleFallback || portId.empty()) return std::nullopt;
    return looksLikeInput(portId) ? PortRole::Input : PortRole::Output;
}

bool ConnectionRouter::startConnection(const std::string& nodeId, const std::string& portId, Point2 pointer, Point2 canvasOrigin) {
    if (drag_.active) {
        NODEGRAPH_LOG_DEBUG("startConnection ignored: drag from %s already active", drag_.sourceNodeId.c_str());
        engine_.setError(GraphError::InvalidOperation);
        return false;
    }
    const Node* node = store_.findNode(nodeId);
    if (!node) {
        engine_.setError(GraphError::NotFound);
        return false;
    }
    const auto role = classifyPort(*node, portId);
    if (!role) {
        engine_.setError(GraphError::UnknownPort);
        return false;
    }

    drag_.active = true;
    drag_.sourceNodeId = nodeId;
    drag_.sourcePort = portId;
    drag_.sourceRole = *role;
    drag_.canvasOrigin = canvasOrigin;
    drag_.current = toCanvasLocal(pointer, canvasOrigin);
    engine_.setError(GraphError::Ok);
    return true;
}

void ConnectionRouter::updateConnectionDrag(Point2 pointer) {
    if (!drag_.active) return;
    drag_.current = toCanvasLocal(pointer, drag_.canvasOrigin);
}

std::string ConnectionRouter::completeConnection(const std::string& targetNodeId, const std::string& targetPort) {
    if (!drag_.active) {
        engine_.setError(GraphError::InvalidOperation);
        return {};
    }
    const DragState drag = drag_;
    drag_ = DragState{};
    return connect(drag.sourceNodeId, drag.sourcePort, targetNodeId, targetPort);
}

void ConnectionRouter::releaseConnection() {
    cancelConnection();
}

void ConnectionRouter::cancelConnection() {
    drag_ = DragState{};
}

std::string ConnectionRouter::connect(
    const std::string& nodeA, const std::string& portA,
    const std::string& nodeB, const std::string& portB) {
    const Node* a = store_.findNode(nodeA);
    const Node* b = store_.findNode(nodeB);
    if (!a || !b) {
        engine_.setError(GraphError::NotFound);
        return {};
    }
    const auto roleA = classifyPort(*a, portA);
    const auto roleB = classifyPort(*b, portB);
    if (!roleA || !roleB) {
        engine_.setError(GraphError::UnknownPort);
        return {};
    }
    if (*roleA == *roleB) {
        NODEGRAPH_LOG_DEBUG("connect %s.%s -> %s.%s: same role", nodeA.c_str(), portA.c_str(), nodeB.c_str(), portB.c_str());
        engine_.setError(GraphError::RoleMismatch);
        return {};
    }

    Connection conn{};
    const bool aIsSource = *roleA == PortRole::Output;
    conn.sourceNodeId = aIsSource ? nodeA : nodeB;
    conn.sourcePort = aIsSource ? portA : portB;
    conn.targetNodeId = aIsSource ? nodeB : nodeA;
    conn.targetPort = aIsSource ? portB : portA;

    if (store_.hasConnectionTuple(conn.sourceNodeId, conn.sourcePort, conn.targetNodeId, conn.targetPort)) {
        engine_.setError(GraphError::DuplicateConnection);
        return {};
    }

    const bool historyStarted = engine_.beginHistoryEntry();
    conn.id = engine_.allocateConnectionId();
    const std::string id = conn.id;
    const std::string targetNodeId = conn.targetNodeId;
    const GraphError err = engine_.insertConnectionTracked(std::move(conn));
    if (err != GraphError::Ok) {
        if (historyStarted) engine_.commitHistoryEntry();
        engine_.setError(err);
        return {};
    }
    growElasticInputs(targetNodeId);
    if (historyStarted) engine_.commitHistoryEntry();
    engine_.setError(GraphError::Ok);
    return id;
}

void ConnectionRouter::growElasticInputs(const std::string& nodeId) {
    const Node* node = store_.findNode(nodeId);
    if (!node || !isElasticArity(node->type)) return;

    for (const auto& input : node->data.inputs) {
        const bool used = std::any_of(store_.connections().begin(), store_.connections().end(), [&](const Connection& c) {
            return c.targetNodeId == nodeId && c.targetPort == input.id;
        });
        if (!used) return;
    }

    Node grown = *node;
    const std::string portId = nextElasticInputId(grown);
    grown.data.inputs.push_back(PortSpec{portId, "Input " + std::to_string(grown.data.inputs.size() + 1)});
    engine_.replaceNodeTracked(grown);
}

bool ConnectionRouter::deleteConnection(const std::string& id) {
    if (!store_.hasConnection(id)) {
        engine_.setError(GraphError::NotFound);
        return false;
    }
    const bool historyStarted = engine_.beginHistoryEntry();
    engine_.eraseConnectionTracked(id);
    if (historyStarted) engine_.commitHistoryEntry();
    engine_.setError(GraphError::Ok);
    return true;
}

} // namespace nodegraph
