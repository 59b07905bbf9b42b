#include "nodegraph/graph/graph_store.h"
#include <algorithm>
#include <unordered_map>
#include <utility>

namespace nodegraph {

const Node* GraphStore::findNode(const std::string& id) const {
    const auto it = nodeIndex_.find(id);
    if (it == nodeIndex_.end()) return nullptr;
    return &nodes_[it->second];
}

Node* GraphStore::findNodeMutable(const std::string& id) {
    const auto it = nodeIndex_.find(id);
    if (it == nodeIndex_.end()) return nullptr;
    return &nodes_[it->second];
}

const Connection* GraphStore::findConnection(const std::string& id) const {
    const auto it = connectionIndex_.find(id);
    if (it == connectionIndex_.end()) return nullptr;
    return &connections_[it->second];
}

Connection* GraphStore::findConnectionMutable(const std::string& id) {
    const auto it = connectionIndex_.find(id);
    if (it == connectionIndex_.end()) return nullptr;
    return &connections_[it->second];
}

std::size_t GraphStore::nodeIndexOf(const std::string& id) const {
    const auto it = nodeIndex_.find(id);
    return it == nodeIndex_.end() ? npos : it->second;
}

bool GraphStore::hasConnectionTuple(
    const std::string& sourceNodeId,
    const std::string& sourcePort,
    const std::string& targetNodeId,
    const std::string& targetPort,
    const std::string& excludeId) const {
    for (const auto& conn : connections_) {
        if (!excludeId.empty() && conn.id == excludeId) continue;
        if (conn.sourceNodeId == sourceNodeId
            && conn.sourcePort == sourcePort
            && conn.targetNodeId == targetNodeId
            && conn.targetPort == targetPort) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> GraphStore::connectionsTouching(const std::string& nodeId) const {
    std::vector<std::string> out;
    for (const auto& conn : connections_) {
        if (conn.touches(nodeId)) out.push_back(conn.id);
    }
    return out;
}

std::vector<std::string> GraphStore::groupsContaining(const std::string& nodeId) const {
    std::vector<std::string> out;
    for (const auto& node : nodes_) {
        if (!node.isGroup()) continue;
        const auto& children = node.data.childNodeIds;
        if (std::find(children.begin(), children.end(), nodeId) != children.end()) {
            out.push_back(node.id);
        }
    }
    return out;
}

GraphError GraphStore::insertNode(Node node, std::size_t position) {
    if (node.id.empty()) return GraphError::InvalidOperation;
    if (hasNode(node.id)) return GraphError::DuplicateId;
    if (position >= nodes_.size()) {
        nodeIndex_.emplace(node.id, nodes_.size());
        nodes_.push_back(std::move(node));
        return GraphError::Ok;
    }
    nodes_.insert(nodes_.begin() + static_cast<std::ptrdiff_t>(position), std::move(node));
    rebuildNodeIndex();
    return GraphError::Ok;
}

GraphError GraphStore::insertConnection(Connection conn) {
    if (conn.id.empty()) return GraphError::InvalidOperation;
    if (hasConnection(conn.id)) return GraphError::DuplicateId;
    if (hasConnectionTuple(conn.sourceNodeId, conn.sourcePort, conn.targetNodeId, conn.targetPort)) {
        return GraphError::DuplicateConnection;
    }
    connectionIndex_.emplace(conn.id, connections_.size());
    connections_.push_back(std::move(conn));
    return GraphError::Ok;
}

bool GraphStore::replaceNode(const Node& node) {
    Node* existing = findNodeMutable(node.id);
    if (!existing) return false;
    *existing = node;
    return true;
}

GraphError GraphStore::replaceConnection(const Connection& conn) {
    Connection* existing = findConnectionMutable(conn.id);
    if (!existing) return GraphError::NotFound;
    if (hasConnectionTuple(conn.sourceNodeId, conn.sourcePort, conn.targetNodeId, conn.targetPort, conn.id)) {
        return GraphError::DuplicateConnection;
    }
    *existing = conn;
    return GraphError::Ok;
}

bool GraphStore::eraseNode(const std::string& id) {
    const auto it = nodeIndex_.find(id);
    if (it == nodeIndex_.end()) return false;
    nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuildNodeIndex();
    return true;
}

bool GraphStore::eraseConnection(const std::string& id) {
    const auto it = connectionIndex_.find(id);
    if (it == connectionIndex_.end()) return false;
    connections_.erase(connections_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuildConnectionIndex();
    return true;
}

void GraphStore::upsertNode(const Node& node) {
    if (Node* existing = findNodeMutable(node.id)) {
        *existing = node;
        return;
    }
    nodeIndex_.emplace(node.id, nodes_.size());
    nodes_.push_back(node);
}

void GraphStore::upsertConnection(const Connection& conn) {
    if (Connection* existing = findConnectionMutable(conn.id)) {
        *existing = conn;
        return;
    }
    connectionIndex_.emplace(conn.id, connections_.size());
    connections_.push_back(conn);
}

std::vector<std::string> GraphStore::nodeOrder() const {
    std::vector<std::string> order;
    order.reserve(nodes_.size());
    for (const auto& node : nodes_) order.push_back(node.id);
    return order;
}

std::vector<std::string> GraphStore::connectionOrder() const {
    std::vector<std::string> order;
    order.reserve(connections_.size());
    for (const auto& conn : connections_) order.push_back(conn.id);
    return order;
}

namespace {
// Reorders items to follow `order`; items not named keep their relative order at the end.
template <typename T>
std::vector<T> reorderById(std::vector<T>& items, const std::vector<std::string>& order) {
    std::unordered_map<std::string, std::size_t> position;
    position.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) position.emplace(items[i].id, i);

    std::vector<T> out;
    out.reserve(items.size());
    std::vector<bool> taken(items.size(), false);
    for (const auto& id : order) {
        const auto it = position.find(id);
        if (it == position.end() || taken[it->second]) continue;
        taken[it->second] = true;
        out.push_back(std::move(items[it->second]));
    }
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (!taken[i]) out.push_back(std::move(items[i]));
    }
    return out;
}
} // namespace

void GraphStore::applyNodeOrder(const std::vector<std::string>& order) {
    nodes_ = reorderById(nodes_, order);
    rebuildNodeIndex();
}

void GraphStore::applyConnectionOrder(const std::vector<std::string>& order) {
    connections_ = reorderById(connections_, order);
    rebuildConnectionIndex();
}

void GraphStore::clear() {
    nodes_.clear();
    connections_.clear();
    nodeIndex_.clear();
    connectionIndex_.clear();
}

void GraphStore::rebuildNodeIndex() {
    nodeIndex_.clear();
    nodeIndex_.reserve(nodes_.size());
    for (std::size_t i = 0; i < nodes_.size(); ++i) nodeIndex_.emplace(nodes_[i].id, i);
}

void GraphStore::rebuildConnectionIndex() {
    connectionIndex_.clear();
    connectionIndex_.reserve(connections_.size());
    for (std::size_t i = 0; i < connections_.size(); ++i) connectionIndex_.emplace(connections_[i].id, i);
}

} // namespace nodegraph
