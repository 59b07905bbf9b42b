#include <gtest/gtest.h>
#include "nodegraph/engine.h"
#include "tests/graph_test_common.h"

using namespace nodegraph;
using nodegraph_test::loadGraph;
using nodegraph_test::makeConnection;
using nodegraph_test::makeNode;
using nodegraph_test::portIds;

namespace {
std::vector<GraphEventType> typesOf(const std::vector<GraphEvent>& events) {
    std::vector<GraphEventType> types;
    for (const auto& e : events) types.push_back(e.type);
    return types;
}

void loadChain(GraphEngine& engine) {
    loadGraph(engine,
        {
            makeNode("a", node_types::kCustom, Point2{}, {}, {{"out", "Out"}}),
            makeNode("b", node_types::kCustom, Point2{400, 0}, {{"in", "In"}}, {{"out", "Out"}}),
            makeNode("c", node_types::kCustom, Point2{800, 0}, {{"in", "In"}}, {}),
        },
        {
            makeConnection("ab", "a", "out", "b", "in"),
            makeConnection("bc", "b", "out", "c", "in"),
        });
}
} // namespace

TEST(EngineTest, AddNodeUsesCatalogDefaults) {
    GraphEngine engine;
    const std::string id = engine.addNode(node_types::kNumberSlider, Point2{10, 20});
    ASSERT_FALSE(id.empty());
    EXPECT_EQ(id.rfind("node-", 0), 0u);
    const Node* node = engine.findNode(id);
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->data.customName, "Number Slider");
    EXPECT_EQ(portIds(node->data.outputs), (std::vector<std::string>{"output-main"}));
    EXPECT_FLOAT_EQ(node->data.params.at("value"), 50.0f);

    EXPECT_TRUE(engine.addNode("", Point2{}).empty());
    EXPECT_EQ(engine.getLastError(), GraphError::InvalidOperation);
}

TEST(EngineTest, IdsAreNeverReused) {
    GraphEngine engine;
    const std::string a = engine.addNode(node_types::kCustom, Point2{});
    const std::string b = engine.addNode(node_types::kCustom, Point2{});
    ASSERT_TRUE(engine.deleteNode(a));
    const std::string c = engine.addNode(node_types::kCustom, Point2{});
    EXPECT_NE(a, b);
    EXPECT_NE(c, a);
    EXPECT_NE(c, b);
}

TEST(EngineTest, CollidingIdIsRejectedAtInsertion) {
    GraphEngine engine;
    ASSERT_EQ(engine.addNode(makeNode("x", node_types::kCustom, Point2{})), "x");
    const auto depth = engine.history().getHistorySize();

    EXPECT_TRUE(engine.addNode(makeNode("x", node_types::kPanel, Point2{5, 5})).empty());
    EXPECT_EQ(engine.getLastError(), GraphError::DuplicateId);
    EXPECT_EQ(engine.findNode("x")->type, node_types::kCustom);
    EXPECT_EQ(engine.history().getHistorySize(), depth);
    ASSERT_FALSE(engine.diagnostics().entries().empty());
    EXPECT_EQ(engine.diagnostics().entries().back().error, GraphError::DuplicateId);

    // An empty id is allocated.
    const std::string fresh = engine.addNode(makeNode("", node_types::kCustom, Point2{}));
    EXPECT_FALSE(fresh.empty());
    EXPECT_NE(fresh, "x");
}

TEST(EngineTest, DuplicateNodeOffsetsCopy) {
    GraphEngine engine;
    const std::string id = engine.addNode(node_types::kPanel, Point2{100, 100});
    const std::string copy = engine.duplicateNode(id);
    ASSERT_FALSE(copy.empty());
    EXPECT_NE(copy, id);
    EXPECT_EQ(engine.findNode(copy)->position, (Point2{150, 150}));
    EXPECT_EQ(engine.findNode(copy)->data.inputs, engine.findNode(id)->data.inputs);

    EXPECT_TRUE(engine.duplicateNode("missing").empty());
    EXPECT_EQ(engine.getLastError(), GraphError::NotFound);
}

TEST(EngineTest, DeleteNodeCascadesInOneStep) {
    GraphEngine engine;
    loadChain(engine);
    const auto before = engine.getDocumentDigest();

    ASSERT_TRUE(engine.deleteNode("b"));
    EXPECT_EQ(engine.findNode("b"), nullptr);
    EXPECT_EQ(engine.store().connectionCount(), 0u);
    EXPECT_EQ(engine.history().getHistorySize(), 1u);

    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getDocumentDigest(), before);
    EXPECT_EQ(engine.store().connectionOrder(), (std::vector<std::string>{"ab", "bc"}));
}

TEST(EngineTest, DeleteNodesSkipsUnknownIds) {
    GraphEngine engine;
    loadChain(engine);
    ASSERT_TRUE(engine.deleteNodes({"a", "missing", "c"}));
    EXPECT_EQ(engine.store().nodeOrder(), (std::vector<std::string>{"b"}));
    EXPECT_FALSE(engine.deleteNodes({"missing"}));
    EXPECT_EQ(engine.getLastError(), GraphError::NotFound);
}

TEST(EngineTest, UpdateNodeDataDropsWiresOnRemovedPorts) {
    GraphEngine engine;
    loadChain(engine);

    NodeData data = engine.findNode("b")->data;
    data.inputs = {{"in2", "In 2"}};
    ASSERT_TRUE(engine.updateNodeData("b", data));
    EXPECT_EQ(engine.findConnection("ab"), nullptr);
    EXPECT_NE(engine.findConnection("bc"), nullptr);

    ASSERT_TRUE(engine.undo());
    EXPECT_NE(engine.findConnection("ab"), nullptr);
    EXPECT_EQ(portIds(engine.findNode("b")->data.inputs), (std::vector<std::string>{"in"}));
}

TEST(EngineTest, UpdateNodeDataDropsWiresOnPortsThatChangeRole) {
    GraphEngine engine;
    loadChain(engine);

    // "out" moves from the output list to the input list.
    NodeData data = engine.findNode("a")->data;
    data.inputs = {{"out", "Out"}};
    data.outputs.clear();
    ASSERT_TRUE(engine.updateNodeData("a", data));
    EXPECT_EQ(engine.findConnection("ab"), nullptr);
    for (const auto& conn : engine.store().connections()) {
        EXPECT_NE(engine.findNode(conn.sourceNodeId)->findOutput(conn.sourcePort), nullptr) << conn.id;
        EXPECT_NE(engine.findNode(conn.targetNodeId)->findInput(conn.targetPort), nullptr) << conn.id;
    }

    // Same on the target side.
    data = engine.findNode("c")->data;
    data.outputs = {{"in", "In"}};
    data.inputs.clear();
    ASSERT_TRUE(engine.updateNodeData("c", data));
    EXPECT_EQ(engine.findConnection("bc"), nullptr);
    EXPECT_EQ(engine.store().connectionCount(), 0u);

    ASSERT_TRUE(engine.undo());
    EXPECT_NE(engine.findConnection("bc"), nullptr);
}

TEST(EngineTest, SliderValueEditIsUndoable) {
    GraphEngine engine;
    const std::string id = engine.addNode(node_types::kNumberSlider, Point2{});
    NodeData data = engine.findNode(id)->data;
    data.params["value"] = 75.0f;
    ASSERT_TRUE(engine.updateNodeData(id, data));
    EXPECT_FLOAT_EQ(engine.findNode(id)->data.params.at("value"), 75.0f);
    EXPECT_EQ(portIds(engine.findNode(id)->data.outputs), (std::vector<std::string>{"output-main"}));

    ASSERT_TRUE(engine.undo());
    EXPECT_FLOAT_EQ(engine.findNode(id)->data.params.at("value"), 50.0f);
}

TEST(EngineTest, AddPortAppendsUniqueId) {
    GraphEngine engine;
    const std::string id = engine.addNode(node_types::kCustom, Point2{});
    EXPECT_EQ(engine.addPort(id, PortRole::Input), "input-1");
    EXPECT_EQ(engine.addPort(id, PortRole::Input, "Gain"), "input-2");
    EXPECT_EQ(engine.addPort(id, PortRole::Output), "output-1");

    const Node* node = engine.findNode(id);
    EXPECT_EQ(node->data.inputs[0].label, "Input 1");
    EXPECT_EQ(node->data.inputs[1].label, "Gain");
    EXPECT_TRUE(engine.addPort("missing", PortRole::Input).empty());
}

TEST(EngineTest, ConnectionStyleIsUndoable) {
    GraphEngine engine;
    loadChain(engine);
    ASSERT_TRUE(engine.setConnectionStyle("ab", true, false));
    EXPECT_TRUE(engine.findConnection("ab")->isDashed);
    EXPECT_FALSE(engine.findConnection("ab")->isGhost);
    ASSERT_TRUE(engine.undo());
    EXPECT_FALSE(engine.findConnection("ab")->isDashed);
    EXPECT_FALSE(engine.setConnectionStyle("missing", true, true));
}

TEST(EngineTest, DeleteConnectionsBatch) {
    GraphEngine engine;
    loadChain(engine);
    ASSERT_TRUE(engine.deleteConnections({"ab", "bc", "zz"}));
    EXPECT_EQ(engine.store().connectionCount(), 0u);
    EXPECT_EQ(engine.store().nodeCount(), 3u);
    EXPECT_EQ(engine.history().getHistorySize(), 1u);
}

TEST(EngineTest, EventsCoalesceUntilPolled) {
    GraphEngine engine;
    engine.pollEvents();

    const std::string id = engine.addNode(node_types::kCustom, Point2{});
    ASSERT_TRUE(engine.moveNode(id, Point2{1, 1}));
    EXPECT_TRUE(engine.hasPendingEvents());

    const auto events = engine.pollEvents();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].type, GraphEventType::NodeCreated);
    EXPECT_EQ(events[0].id, id);
    EXPECT_EQ(events[1].type, GraphEventType::OrderChanged);
    EXPECT_EQ(events[2].type, GraphEventType::HistoryChanged);
    EXPECT_FALSE(engine.hasPendingEvents());

    ASSERT_TRUE(engine.moveNode(id, Point2{2, 2}));
    EXPECT_EQ(typesOf(engine.pollEvents()),
        (std::vector<GraphEventType>{GraphEventType::NodeChanged, GraphEventType::HistoryChanged}));
}

TEST(EngineTest, CreateThenDeleteCancelsOut) {
    GraphEngine engine;
    engine.pollEvents();
    const std::string id = engine.addNode(node_types::kCustom, Point2{});
    ASSERT_TRUE(engine.deleteNode(id));
    EXPECT_EQ(typesOf(engine.pollEvents()),
        (std::vector<GraphEventType>{GraphEventType::OrderChanged, GraphEventType::HistoryChanged}));
}

TEST(EngineTest, UndoEmitsInverseEvents) {
    GraphEngine engine;
    loadChain(engine);
    ASSERT_TRUE(engine.deleteConnection("ab"));
    engine.pollEvents();

    ASSERT_TRUE(engine.undo());
    const auto events = engine.pollEvents();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].type, GraphEventType::ConnectionCreated);
    EXPECT_EQ(events[0].id, "ab");
    EXPECT_EQ(events[1].type, GraphEventType::OrderChanged);
    EXPECT_EQ(events[2].type, GraphEventType::HistoryChanged);
}

TEST(EngineTest, CompileEmitsDefinitionFirst) {
    GraphEngine engine;
    nodegraph_test::loadBoundaryScenario(engine);
    ASSERT_FALSE(engine.compileGroup("G").empty());
    const auto events = engine.pollEvents();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events[0].type, GraphEventType::DefinitionPublished);
    EXPECT_EQ(events[0].id, "component-1");
}

TEST(EngineTest, EventQueueOverflowCollapses) {
    EngineConfig config{};
    config.maxEvents = 3;
    GraphEngine engine(config);
    engine.pollEvents();
    for (int i = 0; i < 5; ++i) engine.addNode(node_types::kCustom, Point2{});

    const auto events = engine.pollEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, GraphEventType::Overflow);

    engine.addNode(node_types::kCustom, Point2{});
    EXPECT_EQ(engine.pollEvents().front().type, GraphEventType::NodeCreated);
}

TEST(EngineTest, ClearResetsDocument) {
    GraphEngine engine;
    loadChain(engine);
    ASSERT_TRUE(engine.deleteNode("a"));
    engine.clear();
    EXPECT_EQ(engine.store().nodeCount(), 0u);
    EXPECT_FALSE(engine.canUndo());
    EXPECT_EQ(engine.getNextId(), 1u);
    EXPECT_EQ(typesOf(engine.pollEvents()), (std::vector<GraphEventType>{GraphEventType::DocumentReloaded}));
}

TEST(EngineTest, DiagnosticsAreBounded) {
    EngineConfig config{};
    config.diagnosticCapacity = 2;
    GraphEngine engine(config);
    for (int i = 0; i < 4; ++i) engine.expandComponent("missing");
    EXPECT_EQ(engine.diagnostics().entries().size(), 2u);
    EXPECT_TRUE(engine.diagnostics().overflowed());
    engine.clearDiagnostics();
    EXPECT_FALSE(engine.diagnostics().overflowed());
}
