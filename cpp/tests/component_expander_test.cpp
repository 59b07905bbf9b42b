#include <gtest/gtest.h>
#include "nodegraph/engine.h"
#include "tests/graph_test_common.h"

using namespace nodegraph;
using nodegraph_test::findByEndpoints;
using nodegraph_test::loadBoundaryScenario;
using nodegraph_test::makeNode;

namespace {
std::string compileScenario(GraphEngine& engine) {
    loadBoundaryScenario(engine);
    return engine.compileGroup("G");
}
} // namespace

TEST(ComponentExpanderTest, RestoresMembersAndRebindsWires) {
    GraphEngine engine;
    const std::string instanceId = compileScenario(engine);
    ASSERT_FALSE(instanceId.empty());

    const std::string groupId = engine.expandComponent(instanceId);
    ASSERT_FALSE(groupId.empty());
    EXPECT_EQ(engine.getLastError(), GraphError::Ok);
    EXPECT_EQ(engine.findNode(instanceId), nullptr);

    const Node* b = engine.findNode("B");
    const Node* c = engine.findNode("C");
    ASSERT_NE(b, nullptr);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(b->type, node_types::kInput);
    EXPECT_EQ(c->type, node_types::kOutput);
    EXPECT_EQ(b->position, (Point2{400.0f, 0.0f}));
    EXPECT_EQ(c->position, (Point2{800.0f, 0.0f}));

    const Connection* in = findByEndpoints(engine, "A", "o1", "B", "value");
    const Connection* out = findByEndpoints(engine, "C", "result", "D", "i1");
    ASSERT_NE(in, nullptr);
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(in->id, "w1");
    EXPECT_EQ(out->id, "w3");

    const Connection* internal = findByEndpoints(engine, "B", "o1", "C", "i1");
    ASSERT_NE(internal, nullptr);
    EXPECT_NE(internal->id, "w2");
    EXPECT_EQ(engine.store().connectionCount(), 3u);
}

TEST(ComponentExpanderTest, SynthesizesEnclosingGroup) {
    GraphEngine engine;
    const std::string instanceId = compileScenario(engine);
    const std::string groupId = engine.expandComponent(instanceId);
    ASSERT_FALSE(groupId.empty());

    const Node* group = engine.findNode(groupId);
    ASSERT_NE(group, nullptr);
    EXPECT_TRUE(group->isGroup());
    EXPECT_EQ(group->data.customName, "Filter");
    EXPECT_EQ(group->data.childNodeIds, (std::vector<std::string>{"B", "C"}));
    EXPECT_FLOAT_EQ(group->position.x, 351.0f);
    EXPECT_FLOAT_EQ(group->position.y, -70.0f);
    ASSERT_TRUE(group->data.width.has_value());
    ASSERT_TRUE(group->data.height.has_value());
    EXPECT_FLOAT_EQ(*group->data.width, 818.0f);
    EXPECT_FLOAT_EQ(*group->data.height, 305.0f);

    EXPECT_EQ(engine.store().nodeOrder(), (std::vector<std::string>{groupId, "B", "C", "A", "D"}));
}

TEST(ComponentExpanderTest, TranslatesByInstanceOffset) {
    GraphEngine engine;
    const std::string instanceId = compileScenario(engine);
    ASSERT_TRUE(engine.moveNode(instanceId, Point2{450.0f, 40.0f}));

    ASSERT_FALSE(engine.expandComponent(instanceId).empty());
    EXPECT_EQ(engine.findNode("B")->position, (Point2{500.0f, 100.0f}));
    EXPECT_EQ(engine.findNode("C")->position, (Point2{900.0f, 100.0f}));
}

TEST(ComponentExpanderTest, SecondInstanceGetsFreshIds) {
    GraphEngine engine;
    const std::string first = compileScenario(engine);
    const std::string second = engine.duplicateNode(first);
    ASSERT_FALSE(second.empty());

    const std::string g1 = engine.expandComponent(first);
    const std::string g2 = engine.expandComponent(second);
    ASSERT_FALSE(g1.empty());
    ASSERT_FALSE(g2.empty());

    const auto& children = engine.findNode(g2)->data.childNodeIds;
    ASSERT_EQ(children.size(), 2u);
    EXPECT_NE(children[0], "B");
    EXPECT_NE(children[1], "C");
    EXPECT_NE(children[0], children[1]);
    EXPECT_EQ(engine.findNode(children[0])->type, node_types::kInput);
    EXPECT_EQ(engine.findNode(children[1])->type, node_types::kOutput);
    EXPECT_NE(findByEndpoints(engine, children[0], "o1", children[1], "i1"), nullptr);

    // The duplicate sits +50,+50 from the original.
    EXPECT_EQ(engine.findNode(children[0])->position, (Point2{450.0f, 50.0f}));
    EXPECT_EQ(engine.findNode(g1)->data.childNodeIds, (std::vector<std::string>{"B", "C"}));
}

TEST(ComponentExpanderTest, UnresolvedDefinitionCommitsNothing) {
    GraphEngine engine;
    Node orphan = makeNode("orphan", node_types::kComponent, Point2{});
    orphan.data.componentId = "component-99";
    ASSERT_FALSE(engine.addNode(orphan).empty());
    const auto before = engine.getDocumentDigest();
    const auto depth = engine.history().getHistorySize();

    EXPECT_TRUE(engine.expandComponent("orphan").empty());
    EXPECT_EQ(engine.getLastError(), GraphError::UnresolvedDefinition);
    EXPECT_EQ(engine.getDocumentDigest(), before);
    EXPECT_EQ(engine.history().getHistorySize(), depth);

    ASSERT_EQ(engine.diagnostics().entries().size(), 1u);
    const auto& entry = engine.diagnostics().entries()[0];
    EXPECT_EQ(entry.op, DiagnosticOp::Expand);
    EXPECT_EQ(entry.error, GraphError::UnresolvedDefinition);
    EXPECT_EQ(entry.subjectId, "orphan");
}

TEST(ComponentExpanderTest, RejectsPlainNodes) {
    GraphEngine engine;
    const std::string id = engine.addNode(node_types::kCustom, Point2{});
    EXPECT_TRUE(engine.expandComponent(id).empty());
    EXPECT_EQ(engine.getLastError(), GraphError::InvalidOperation);
    EXPECT_TRUE(engine.expandComponent("missing").empty());
    EXPECT_EQ(engine.getLastError(), GraphError::NotFound);
}

TEST(ComponentExpanderTest, UnboundPortWireIsDropped) {
    GraphEngine engine;
    const std::string instanceId = compileScenario(engine);
    const std::string extra = engine.addPort(instanceId, PortRole::Input, "Extra");
    ASSERT_EQ(extra, "input-2");
    const std::string stray = engine.connect("A", "o1", instanceId, extra);
    ASSERT_FALSE(stray.empty());
    engine.clearDiagnostics();

    ASSERT_FALSE(engine.expandComponent(instanceId).empty());
    EXPECT_EQ(engine.findConnection(stray), nullptr);
    EXPECT_NE(findByEndpoints(engine, "A", "o1", "B", "value"), nullptr);

    ASSERT_EQ(engine.diagnostics().entries().size(), 1u);
    EXPECT_EQ(engine.diagnostics().entries()[0].error, GraphError::UnknownPort);
    EXPECT_EQ(engine.diagnostics().entries()[0].subjectId, stray);
}

TEST(ComponentExpanderTest, ExpandIsOneUndoStep) {
    GraphEngine engine;
    const std::string instanceId = compileScenario(engine);
    const auto compiled = engine.getDocumentDigest();

    ASSERT_FALSE(engine.expandComponent(instanceId).empty());
    const auto expanded = engine.getDocumentDigest();

    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getDocumentDigest(), compiled);
    ASSERT_NE(engine.findNode(instanceId), nullptr);
    ASSERT_TRUE(engine.redo());
    EXPECT_EQ(engine.getDocumentDigest(), expanded);
}

TEST(ComponentExpanderTest, EditsDoNotReachTheDefinition) {
    GraphEngine engine;
    const std::string instanceId = compileScenario(engine);
    const std::string defId = engine.findNode(instanceId)->data.componentId;
    ASSERT_FALSE(engine.expandComponent(instanceId).empty());

    ASSERT_TRUE(engine.renameNode("B", "Edited"));
    ASSERT_TRUE(engine.moveNode("C", Point2{0.0f, 0.0f}));

    const auto def = engine.registry().resolve(defId);
    ASSERT_TRUE(def.has_value());
    EXPECT_TRUE(def->internalNodes[0].data.customName.empty());
    EXPECT_EQ(def->internalNodes[1].position, (Point2{800.0f, 0.0f}));
}

TEST(ComponentExpanderTest, GroupIdSkipsRestoredIds) {
    GraphEngine engine;
    Node group = makeNode("G", node_types::kGroup, Point2{});
    group.data.childNodeIds = {"group-2", "y"};
    nodegraph_test::loadGraph(engine,
        {
            group,
            makeNode("group-2", node_types::kCustom, Point2{}),
            makeNode("y", node_types::kCustom, Point2{400, 0}),
        },
        {});
    ASSERT_EQ(engine.getNextId(), 1u);
    const std::string instanceId = engine.compileGroup("G");
    ASSERT_EQ(instanceId, "node-1");

    // The cursor now points at group-2, which the expansion restores.
    const std::string groupId = engine.expandComponent(instanceId);
    ASSERT_FALSE(groupId.empty());
    EXPECT_NE(groupId, "group-2");
    EXPECT_EQ(engine.store().nodeCount(), 3u);
    ASSERT_NE(engine.findNode("group-2"), nullptr);
    EXPECT_EQ(engine.findNode("group-2")->type, node_types::kCustom);
    EXPECT_EQ(engine.findNode(groupId)->data.childNodeIds, (std::vector<std::string>{"group-2", "y"}));
}
