#pragma once

#include "nodegraph/component/component_compiler.h"
#include "nodegraph/component/component_expander.h"
#include "nodegraph/component/component_registry.h"
#include "nodegraph/core/config.h"
#include "nodegraph/core/diagnostics.h"
#include "nodegraph/core/id_allocator.h"
#include "nodegraph/core/types.h"
#include "nodegraph/engine_events.h"
#include "nodegraph/graph/graph_store.h"
#include "nodegraph/history/history_manager.h"
#include "nodegraph/interaction/connection_router.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace nodegraph {

// Application context of one editor document. Owns the store, the component
// registry and the history log; every mutation goes through here so that it
// is recorded, evented and undoable.
class GraphEngine final : private HistoryObserver {
public:
    explicit GraphEngine(EngineConfig config = {});

    void clear();

    // ==============================================================================
    // Read access
    // ==============================================================================
    const GraphStore& store() const noexcept { return store_; }
    const ComponentRegistry& registry() const noexcept { return registry_; }
    const HistoryManager& history() const noexcept { return history_; }
    const DiagnosticLog& diagnostics() const noexcept { return diagnostics_; }
    const ConnectionRouter& router() const noexcept { return router_; }
    const EngineConfig& config() const noexcept { return config_; }

    const Node* findNode(const std::string& id) const { return store_.findNode(id); }
    const Connection* findConnection(const std::string& id) const { return store_.findConnection(id); }

    GraphError getLastError() const noexcept { return lastError_; }
    void clearError() const noexcept { lastError_ = GraphError::Ok; }
    void clearDiagnostics() { diagnostics_.clear(); }

    std::uint32_t getNextId() const noexcept { return ids_.getNext(); }

    // ==============================================================================
    // Nodes
    // ==============================================================================
    std::string addNode(const std::string& type, Point2 position);
    // Inserts a fully specified node; an empty id is allocated, a colliding id is rejected.
    std::string addNode(Node node);
    std::string duplicateNode(const std::string& id);
    bool deleteNode(const std::string& id, bool deleteChildren = false);
    bool deleteNodes(const std::vector<std::string>& ids);
    bool moveNode(const std::string& id, Point2 position);
    bool updateNodeData(const std::string& id, const NodeData& data);
    bool renameNode(const std::string& id, const std::string& name);
    // Appends a port and returns its id.
    std::string addPort(const std::string& nodeId, PortRole role, const std::string& label = {});

    // Synchronization write from the scene layer. Bypasses history and is
    // refused while an undo/redo is being applied.
    bool syncNode(const Node& node);
    bool isRestoring() const noexcept { return history_.isRestoring(); }

    // ==============================================================================
    // Connections
    // ==============================================================================
    bool startConnection(const std::string& nodeId, const std::string& portId, Point2 pointer, Point2 canvasOrigin = {});
    void updateConnectionDrag(Point2 pointer);
    std::string completeConnection(const std::string& targetNodeId, const std::string& targetPort);
    void releaseConnection();
    void cancelConnection();
    bool isConnectionDragActive() const noexcept { return router_.isDragging(); }

    // Same validation as a completed drag, without the gesture.
    std::string connect(
        const std::string& nodeA, const std::string& portA,
        const std::string& nodeB, const std::string& portB);
    bool deleteConnection(const std::string& id);
    bool deleteConnections(const std::vector<std::string>& ids);
    bool setConnectionStyle(const std::string& id, bool isDashed, bool isGhost);

    // ==============================================================================
    // Groups and components
    // ==============================================================================
    std::string createGroup(const std::vector<std::string>& nodeIds);
    bool joinGroup(const std::string& nodeId, const std::string& groupId);
    bool leaveGroup(const std::string& nodeId);
    bool fitGroupToChildren(const std::string& groupId);
    bool isNodeOverlappingGroup(const std::string& nodeId, const std::string& groupId) const;

    // Returns the component instance id, or empty on failure.
    std::string compileGroup(const std::string& groupId);
    // Returns the enclosing group id, or empty on failure.
    std::string expandComponent(const std::string& instanceId);

    // ==============================================================================
    // History
    // ==============================================================================
    bool undo();
    bool redo();
    bool canUndo() const noexcept { return history_.canUndo(); }
    bool canRedo() const noexcept { return history_.canRedo(); }
    void startAction();
    bool endAction();

    // ==============================================================================
    // Events, digest, persistence
    // ==============================================================================
    std::vector<GraphEvent> pollEvents();
    bool hasPendingEvents() const noexcept;

    std::uint64_t getDocumentDigest() const noexcept;

    std::vector<std::uint8_t> saveSnapshot() const;
    bool loadSnapshot(const std::uint8_t* data, std::size_t byteCount);

private:
    friend class ConnectionRouter;
    friend class ComponentCompiler;
    friend class ComponentExpander;

    // History plumbing
    bool beginHistoryEntry();
    void commitHistoryEntry();
    void markNodeChange(const std::string& id);
    void markConnectionChange(const std::string& id);

    // Tracked mutations: mark, mutate, record event.
    GraphError insertNodeTracked(Node node, std::size_t position = GraphStore::npos);
    bool replaceNodeTracked(const Node& node);
    bool eraseNodeTracked(const std::string& id);
    GraphError insertConnectionTracked(Connection conn);
    GraphError replaceConnectionTracked(const Connection& conn);
    bool eraseConnectionTracked(const std::string& id);
    // Substitutes `replacement` (or removes, if empty) for oldId in every group's child list.
    void replaceChildReference(const std::string& oldId, const std::string& replacement);

    std::string allocateNodeId(const std::string& prefix);
    std::string allocateConnectionId();

    void setError(GraphError err) const noexcept { lastError_ = err; }
    void reportFailure(DiagnosticOp op, GraphError err, const std::string& subjectId, const std::string& detail = {});

    // HistoryObserver
    void onNodeRestored(const std::string& id, bool existed, bool exists) override;
    void onConnectionRestored(const std::string& id, bool existed, bool exists) override;
    void onOrderRestored() override;
    void onNextIdRestored(std::uint32_t nextId) override;

    // Events
    void clearEventState();
    void recordNodeCreated(const std::string& id);
    void recordNodeChanged(const std::string& id);
    void recordNodeDeleted(const std::string& id);
    void recordConnectionCreated(const std::string& id);
    void recordConnectionChanged(const std::string& id);
    void recordConnectionDeleted(const std::string& id);
    void recordOrderChanged();
    void recordHistoryChanged();
    void recordDefinitionPublished(const std::string& id);
    void flushPendingEvents();
    void pushEvent(GraphEventType type, const std::string& id);

    EngineConfig config_;
    GraphStore store_;
    ComponentRegistry registry_;
    HistoryManager history_;
    IdAllocator ids_;
    DiagnosticLog diagnostics_;
    ConnectionRouter router_;
    ComponentCompiler compiler_;
    ComponentExpander expander_;

    mutable GraphError lastError_ = GraphError::Ok;

    enum class Pending : std::uint8_t { Created, Changed, Deleted };
    std::map<std::string, Pending> pendingNodes_;
    std::map<std::string, Pending> pendingConnections_;
    std::vector<std::string> pendingDefinitions_;
    bool pendingOrderChanged_ = false;
    bool pendingHistoryChanged_ = false;
    bool pendingReload_ = false;
    std::deque<GraphEvent> events_;
    bool eventOverflowed_ = false;
};

} // namespace nodegraph
