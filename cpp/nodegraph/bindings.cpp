#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "nodegraph/engine.h"
#include <cstdio>
#include <map>

#ifdef EMSCRIPTEN
namespace {
using nodegraph::GraphEngine;
using nodegraph::Point2;

// Flat node view for the front end; optional sizes become -1.
struct NodeView {
    std::string id;
    std::string type;
    float x;
    float y;
    float width;
    float height;
    std::string customName;
    std::string componentId;
    std::vector<nodegraph::PortSpec> inputs;
    std::vector<nodegraph::PortSpec> outputs;
    std::vector<std::string> childNodeIds;
    std::map<std::string, float> params;
};

struct DiagnosticView {
    nodegraph::DiagnosticOp op;
    nodegraph::GraphError error;
    std::string subjectId;
    std::string detail;
};

NodeView makeView(const nodegraph::Node& node) {
    return NodeView{
        node.id,
        node.type,
        node.position.x,
        node.position.y,
        node.data.width.value_or(-1.0f),
        node.data.height.value_or(-1.0f),
        node.data.customName,
        node.data.componentId,
        node.data.inputs,
        node.data.outputs,
        node.data.childNodeIds,
        node.data.params,
    };
}

nodegraph::NodeData dataFromView(const NodeView& view) {
    nodegraph::NodeData data{};
    data.inputs = view.inputs;
    data.outputs = view.outputs;
    if (view.width >= 0.0f) data.width = view.width;
    if (view.height >= 0.0f) data.height = view.height;
    data.customName = view.customName;
    data.childNodeIds = view.childNodeIds;
    data.componentId = view.componentId;
    data.params = view.params;
    return data;
}

nodegraph::Node nodeFromView(const NodeView& view) {
    nodegraph::Node node{};
    node.id = view.id;
    node.type = view.type;
    node.position = Point2{view.x, view.y};
    node.data = dataFromView(view);
    return node;
}
} // namespace

EMSCRIPTEN_BINDINGS(nodegraph_module) {
    emscripten::enum_<nodegraph::GraphError>("GraphError")
        .value("Ok", nodegraph::GraphError::Ok)
        .value("NotFound", nodegraph::GraphError::NotFound)
        .value("InvalidOperation", nodegraph::GraphError::InvalidOperation)
        .value("DuplicateId", nodegraph::GraphError::DuplicateId)
        .value("RoleMismatch", nodegraph::GraphError::RoleMismatch)
        .value("DuplicateConnection", nodegraph::GraphError::DuplicateConnection)
        .value("UnknownPort", nodegraph::GraphError::UnknownPort)
        .value("UnresolvedDefinition", nodegraph::GraphError::UnresolvedDefinition)
        .value("RecursiveStructure", nodegraph::GraphError::RecursiveStructure)
        .value("InvalidMagic", nodegraph::GraphError::InvalidMagic)
        .value("UnsupportedVersion", nodegraph::GraphError::UnsupportedVersion)
        .value("BufferTruncated", nodegraph::GraphError::BufferTruncated)
        .value("InvalidPayloadSize", nodegraph::GraphError::InvalidPayloadSize);

    emscripten::enum_<nodegraph::GraphEventType>("GraphEventType")
        .value("NodeCreated", nodegraph::GraphEventType::NodeCreated)
        .value("NodeChanged", nodegraph::GraphEventType::NodeChanged)
        .value("NodeDeleted", nodegraph::GraphEventType::NodeDeleted)
        .value("ConnectionCreated", nodegraph::GraphEventType::ConnectionCreated)
        .value("ConnectionChanged", nodegraph::GraphEventType::ConnectionChanged)
        .value("ConnectionDeleted", nodegraph::GraphEventType::ConnectionDeleted)
        .value("OrderChanged", nodegraph::GraphEventType::OrderChanged)
        .value("HistoryChanged", nodegraph::GraphEventType::HistoryChanged)
        .value("DefinitionPublished", nodegraph::GraphEventType::DefinitionPublished)
        .value("DocumentReloaded", nodegraph::GraphEventType::DocumentReloaded)
        .value("Overflow", nodegraph::GraphEventType::Overflow);

    emscripten::enum_<nodegraph::DiagnosticOp>("DiagnosticOp")
        .value("Connect", nodegraph::DiagnosticOp::Connect)
        .value("DeleteConnection", nodegraph::DiagnosticOp::DeleteConnection)
        .value("Compile", nodegraph::DiagnosticOp::Compile)
        .value("Expand", nodegraph::DiagnosticOp::Expand)
        .value("Undo", nodegraph::DiagnosticOp::Undo)
        .value("Redo", nodegraph::DiagnosticOp::Redo)
        .value("NodeEdit", nodegraph::DiagnosticOp::NodeEdit)
        .value("Group", nodegraph::DiagnosticOp::Group)
        .value("Snapshot", nodegraph::DiagnosticOp::Snapshot)
        .value("Sync", nodegraph::DiagnosticOp::Sync);

    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<nodegraph::PortSpec>("PortSpec")
        .field("id", &nodegraph::PortSpec::id)
        .field("label", &nodegraph::PortSpec::label);

    emscripten::value_object<nodegraph::Connection>("Connection")
        .field("id", &nodegraph::Connection::id)
        .field("sourceNodeId", &nodegraph::Connection::sourceNodeId)
        .field("sourcePort", &nodegraph::Connection::sourcePort)
        .field("targetNodeId", &nodegraph::Connection::targetNodeId)
        .field("targetPort", &nodegraph::Connection::targetPort)
        .field("isDashed", &nodegraph::Connection::isDashed)
        .field("isGhost", &nodegraph::Connection::isGhost);

    emscripten::value_object<nodegraph::GraphEvent>("GraphEvent")
        .field("type", &nodegraph::GraphEvent::type)
        .field("id", &nodegraph::GraphEvent::id);

    emscripten::value_object<NodeView>("NodeView")
        .field("id", &NodeView::id)
        .field("type", &NodeView::type)
        .field("x", &NodeView::x)
        .field("y", &NodeView::y)
        .field("width", &NodeView::width)
        .field("height", &NodeView::height)
        .field("customName", &NodeView::customName)
        .field("componentId", &NodeView::componentId)
        .field("inputs", &NodeView::inputs)
        .field("outputs", &NodeView::outputs)
        .field("childNodeIds", &NodeView::childNodeIds)
        .field("params", &NodeView::params);

    emscripten::value_object<DiagnosticView>("DiagnosticView")
        .field("op", &DiagnosticView::op)
        .field("error", &DiagnosticView::error)
        .field("subjectId", &DiagnosticView::subjectId)
        .field("detail", &DiagnosticView::detail);

    emscripten::register_vector<std::string>("VectorString");
    emscripten::register_vector<std::uint8_t>("VectorUInt8");
    emscripten::register_vector<nodegraph::PortSpec>("VectorPortSpec");
    emscripten::register_vector<nodegraph::Connection>("VectorConnection");
    emscripten::register_vector<nodegraph::GraphEvent>("VectorGraphEvent");
    emscripten::register_vector<NodeView>("VectorNodeView");
    emscripten::register_vector<DiagnosticView>("VectorDiagnosticView");
    emscripten::register_map<std::string, float>("MapStringFloat");

    emscripten::class_<GraphEngine>("GraphEngine")
        .constructor<>()
        .function("clear", &GraphEngine::clear)
        .function("getLastError", &GraphEngine::getLastError)
        .function("getDiagnostics", emscripten::optional_override([](const GraphEngine& self) {
            std::vector<DiagnosticView> out;
            for (const auto& entry : self.diagnostics().entries()) {
                out.push_back(DiagnosticView{entry.op, entry.error, entry.subjectId, entry.detail});
            }
            return out;
        }))
        .function("clearDiagnostics", &GraphEngine::clearDiagnostics)
        .function("getNodes", emscripten::optional_override([](const GraphEngine& self) {
            std::vector<NodeView> out;
            out.reserve(self.store().nodeCount());
            for (const auto& node : self.store().nodes()) out.push_back(makeView(node));
            return out;
        }))
        .function("getConnections", emscripten::optional_override([](const GraphEngine& self) {
            return self.store().connections();
        }))
        // Nodes
        .function("addNode", emscripten::optional_override([](GraphEngine& self, const std::string& type, float x, float y) {
            return self.addNode(type, Point2{x, y});
        }))
        .function("duplicateNode", &GraphEngine::duplicateNode)
        .function("deleteNode", &GraphEngine::deleteNode)
        .function("deleteNodes", &GraphEngine::deleteNodes)
        .function("moveNode", emscripten::optional_override([](GraphEngine& self, const std::string& id, float x, float y) {
            return self.moveNode(id, Point2{x, y});
        }))
        .function("renameNode", &GraphEngine::renameNode)
        .function("updateNodeData", emscripten::optional_override([](GraphEngine& self, const std::string& id, const NodeView& view) {
            return self.updateNodeData(id, dataFromView(view));
        }))
        .function("syncNode", emscripten::optional_override([](GraphEngine& self, const NodeView& view) {
            return self.syncNode(nodeFromView(view));
        }))
        .function("isRestoring", &GraphEngine::isRestoring)
        .function("addInputPort", emscripten::optional_override([](GraphEngine& self, const std::string& nodeId, const std::string& label) {
            return self.addPort(nodeId, nodegraph::PortRole::Input, label);
        }))
        .function("addOutputPort", emscripten::optional_override([](GraphEngine& self, const std::string& nodeId, const std::string& label) {
            return self.addPort(nodeId, nodegraph::PortRole::Output, label);
        }))
        .function("isRestoring", &GraphEngine::isRestoring)
        // Connection gesture
        .function("startConnection", emscripten::optional_override([](GraphEngine& self, const std::string& nodeId, const std::string& portId, float px, float py, float originX, float originY) {
            return self.startConnection(nodeId, portId, Point2{px, py}, Point2{originX, originY});
        }))
        .function("updateConnectionDrag", emscripten::optional_override([](GraphEngine& self, float px, float py) {
            self.updateConnectionDrag(Point2{px, py});
        }))
        .function("completeConnection", &GraphEngine::completeConnection)
        .function("releaseConnection", &GraphEngine::releaseConnection)
        .function("cancelConnection", &GraphEngine::cancelConnection)
        .function("isConnectionDragActive", &GraphEngine::isConnectionDragActive)
        .function("getDragPosition", emscripten::optional_override([](const GraphEngine& self) {
            return self.router().dragState().current;
        }))
        .function("connect", &GraphEngine::connect)
        .function("deleteConnection", &GraphEngine::deleteConnection)
        .function("deleteConnections", &GraphEngine::deleteConnections)
        .function("setConnectionStyle", &GraphEngine::setConnectionStyle)
        // Groups and components
        .function("createGroup", &GraphEngine::createGroup)
        .function("joinGroup", &GraphEngine::joinGroup)
        .function("leaveGroup", &GraphEngine::leaveGroup)
        .function("fitGroupToChildren", &GraphEngine::fitGroupToChildren)
        .function("isNodeOverlappingGroup", &GraphEngine::isNodeOverlappingGroup)
        .function("compileGroup", &GraphEngine::compileGroup)
        .function("expandComponent", &GraphEngine::expandComponent)
        // History
        .function("undo", &GraphEngine::undo)
        .function("redo", &GraphEngine::redo)
        .function("canUndo", &GraphEngine::canUndo)
        .function("canRedo", &GraphEngine::canRedo)
        .function("startAction", &GraphEngine::startAction)
        .function("endAction", &GraphEngine::endAction)
        // Events and persistence
        .function("pollEvents", &GraphEngine::pollEvents)
        .function("getDocumentDigest", emscripten::optional_override([](const GraphEngine& self) {
            // JS numbers cannot hold 64 bits exactly; expose as hex.
            char buf[17];
            std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(self.getDocumentDigest()));
            return std::string(buf);
        }))
        .function("saveSnapshot", &GraphEngine::saveSnapshot)
        .function("loadSnapshot", emscripten::optional_override([](GraphEngine& self, const std::vector<std::uint8_t>& bytes) {
            return self.loadSnapshot(bytes.data(), bytes.size());
        }));
}
#endif
