#pragma once

#include "nodegraph/core/config.h"
#include "nodegraph/core/types.h"
#include "nodegraph/graph/graph_types.h"
#include <optional>
#include <string>

namespace nodegraph {

class GraphEngine;
class GraphStore;

// Drag-to-connect gesture plus the validation every new connection passes.
// Idle -> Dragging on startConnection; back to Idle on complete, release or cancel.
class ConnectionRouter {
public:
    struct DragState {
        bool active = false;
        std::string sourceNodeId;
        std::string sourcePort;
        PortRole sourceRole = PortRole::Output;
        // Pointer in canvas-local space.
        Point2 current{};
        Point2 canvasOrigin{};
    };

    ConnectionRouter(GraphEngine& engine, GraphStore& store, const RouterOptions& options);

    bool isDragging() const noexcept { return drag_.active; }
    const DragState& dragState() const noexcept { return drag_; }

    bool startConnection(const std::string& nodeId, const std::string& portId, Point2 pointer, Point2 canvasOrigin);
    void updateConnectionDrag(Point2 pointer);
    std::string completeConnection(const std::string& targetNodeId, const std::string& targetPort);
    // Pointer released over empty canvas.
    void releaseConnection();
    void cancelConnection();

    // Validates, normalizes and commits one connection; returns its id or empty.
    std::string connect(
        const std::string& nodeA, const std::string& portA,
        const std::string& nodeB, const std::string& portB);
    bool deleteConnection(const std::string& id);

    std::optional<PortRole> classifyPort(const Node& node, const std::string& portId) const;

    void reset() { drag_ = DragState{}; }

private:
    void growElasticInputs(const std::string& nodeId);

    GraphEngine& engine_;
    GraphStore& store_;
    const RouterOptions& options_;
    DragState drag_;
};

} // namespace nodegraph
