#ifndef NODEGRAPH_GRAPH_STORE_H
#define NODEGRAPH_GRAPH_STORE_H

#include "nodegraph/graph/graph_types.h"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace nodegraph {

// Ordered node and connection collections with id lookup. Node order is the
// render order (first = behind). Id and endpoint-tuple uniqueness is enforced
// at insert; the upsert path is reserved for trusted restores (history,
// snapshot) that re-establish a consistent state as a whole.
class GraphStore {
public:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    const std::vector<Node>& nodes() const noexcept { return nodes_; }
    const std::vector<Connection>& connections() const noexcept { return connections_; }

    std::size_t nodeCount() const noexcept { return nodes_.size(); }
    std::size_t connectionCount() const noexcept { return connections_.size(); }

    const Node* findNode(const std::string& id) const;
    Node* findNodeMutable(const std::string& id);
    const Connection* findConnection(const std::string& id) const;
    Connection* findConnectionMutable(const std::string& id);

    bool hasNode(const std::string& id) const { return nodeIndex_.count(id) != 0; }
    bool hasConnection(const std::string& id) const { return connectionIndex_.count(id) != 0; }
    std::size_t nodeIndexOf(const std::string& id) const;

    // True if a connection other than excludeId already uses this tuple.
    bool hasConnectionTuple(
        const std::string& sourceNodeId,
        const std::string& sourcePort,
        const std::string& targetNodeId,
        const std::string& targetPort,
        const std::string& excludeId = {}) const;

    std::vector<std::string> connectionsTouching(const std::string& nodeId) const;
    // Group ids whose childNodeIds contain nodeId.
    std::vector<std::string> groupsContaining(const std::string& nodeId) const;

    GraphError insertNode(Node node, std::size_t position = npos);
    GraphError insertConnection(Connection conn);
    bool replaceNode(const Node& node);
    // Rewrites endpoints/style; refuses a rewrite that duplicates another tuple.
    GraphError replaceConnection(const Connection& conn);
    bool eraseNode(const std::string& id);
    bool eraseConnection(const std::string& id);

    void upsertNode(const Node& node);
    void upsertConnection(const Connection& conn);

    std::vector<std::string> nodeOrder() const;
    std::vector<std::string> connectionOrder() const;
    void applyNodeOrder(const std::vector<std::string>& order);
    void applyConnectionOrder(const std::vector<std::string>& order);

    void clear();

private:
    void rebuildNodeIndex();
    void rebuildConnectionIndex();

    std::vector<Node> nodes_;
    std::vector<Connection> connections_;
    std::unordered_map<std::string, std::size_t> nodeIndex_;
    std::unordered_map<std::string, std::size_t> connectionIndex_;
};

} // namespace nodegraph

#endif // NODEGRAPH_GRAPH_STORE_H
