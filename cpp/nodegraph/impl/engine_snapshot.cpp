// GraphEngine save/load through the sectioned snapshot codec.

#include "nodegraph/core/logging.h"
#include "nodegraph/engine.h"
#include "nodegraph/persistence/snapshot.h"
#include <utility>

namespace nodegraph {

std::vector<std::uint8_t> GraphEngine::saveSnapshot() const {
    SnapshotData data{};
    data.nodes = store_.nodes();
    data.connections = store_.connections();
    data.definitions.reserve(registry_.size());
    for (const auto& kv : registry_.definitions()) data.definitions.push_back(kv.second);
    data.nextId = ids_.getNext();
    data.nextDefinitionId = registry_.getNextId();
    return buildSnapshotBytes(data);
}

bool GraphEngine::loadSnapshot(const std::uint8_t* bytes, std::size_t byteCount) {
    SnapshotData data{};
    GraphError err = parseSnapshot(bytes, byteCount, data);
    if (err != GraphError::Ok) {
        reportFailure(DiagnosticOp::Snapshot, err, {}, "parse");
        return false;
    }

    // Rebuild through the insertion boundary so every uniqueness rule applies.
    GraphStore loaded;
    for (auto& node : data.nodes) {
        const std::string id = node.id;
        err = loaded.insertNode(std::move(node));
        if (err != GraphError::Ok) {
            reportFailure(DiagnosticOp::Snapshot, err, id, "node");
            return false;
        }
    }
    for (auto& conn : data.connections) {
        const std::string id = conn.id;
        if (!loaded.hasNode(conn.sourceNodeId) || !loaded.hasNode(conn.targetNodeId)) {
            reportFailure(DiagnosticOp::Snapshot, GraphError::NotFound, id, "dangling connection");
            return false;
        }
        err = loaded.insertConnection(std::move(conn));
        if (err != GraphError::Ok) {
            reportFailure(DiagnosticOp::Snapshot, err, id, "connection");
            return false;
        }
    }

    ComponentRegistry definitions;
    err = definitions.restore(std::move(data.definitions), data.nextDefinitionId);
    if (err != GraphError::Ok) {
        reportFailure(DiagnosticOp::Snapshot, err, {}, "definitions");
        return false;
    }

    router_.reset();
    store_ = std::move(loaded);
    registry_ = std::move(definitions);
    history_.clear();
    ids_.setNext(data.nextId == 0 ? 1 : data.nextId);
    clearEventState();
    pendingReload_ = true;
    NODEGRAPH_LOG_DEBUG("snapshot loaded: %zu nodes, %zu connections, %zu definitions",
        store_.nodeCount(), store_.connectionCount(), registry_.size());
    setError(GraphError::Ok);
    return true;
}

} // namespace nodegraph
