#include <gtest/gtest.h>
#include "nodegraph/engine.h"
#include "nodegraph/history/history_manager.h"
#include "tests/graph_test_common.h"

using namespace nodegraph;
using nodegraph_test::makeConnection;
using nodegraph_test::makeNode;

namespace {
class RecordingObserver : public HistoryObserver {
public:
    explicit RecordingObserver(const HistoryManager& history) : history_(history) {}

    void onNodeRestored(const std::string& id, bool, bool exists) override {
        restoringSeen = restoringSeen && history_.isRestoring();
        nodes.push_back(id + (exists ? "+" : "-"));
    }
    void onConnectionRestored(const std::string& id, bool, bool exists) override {
        restoringSeen = restoringSeen && history_.isRestoring();
        connections.push_back(id + (exists ? "+" : "-"));
    }
    void onOrderRestored() override { ++orderRestores; }
    void onNextIdRestored(std::uint32_t id) override { nextId = id; }

    std::vector<std::string> nodes;
    std::vector<std::string> connections;
    int orderRestores = 0;
    std::uint32_t nextId = 0;
    bool restoringSeen = true;

private:
    const HistoryManager& history_;
};
} // namespace

TEST(HistoryManagerTest, CommitsOneEntryAcrossBothCollections) {
    GraphStore store;
    HistoryManager history(store);

    ASSERT_TRUE(history.beginEntry(1));
    history.markNodeChange("a");
    ASSERT_EQ(store.insertNode(makeNode("a", "custom", Point2{})), GraphError::Ok);
    history.markNodeChange("b");
    ASSERT_EQ(store.insertNode(makeNode("b", "custom", Point2{})), GraphError::Ok);
    history.markConnectionChange("c");
    ASSERT_EQ(store.insertConnection(makeConnection("c", "a", "o", "b", "i")), GraphError::Ok);
    ASSERT_TRUE(history.commitEntry(4));

    EXPECT_EQ(history.getHistorySize(), 1u);
    RecordingObserver observer(history);
    ASSERT_TRUE(history.undo(observer));
    EXPECT_EQ(store.nodeCount(), 0u);
    EXPECT_EQ(store.connectionCount(), 0u);
    EXPECT_EQ(observer.nextId, 1u);
    EXPECT_TRUE(observer.restoringSeen);
    EXPECT_FALSE(history.isRestoring());
    EXPECT_EQ(observer.connections, (std::vector<std::string>{"c-"}));
    EXPECT_EQ(observer.nodes, (std::vector<std::string>{"a-", "b-"}));

    ASSERT_TRUE(history.redo(observer));
    EXPECT_EQ(store.nodeOrder(), (std::vector<std::string>{"a", "b"}));
    EXPECT_NE(store.findConnection("c"), nullptr);
    EXPECT_EQ(observer.nextId, 4u);
}

TEST(HistoryManagerTest, NoOpEntryIsDropped) {
    GraphStore store;
    ASSERT_EQ(store.insertNode(makeNode("a", "custom", Point2{1, 1})), GraphError::Ok);
    HistoryManager history(store);

    ASSERT_TRUE(history.beginEntry(1));
    history.markNodeChange("a");
    Node same = *store.findNode("a");
    store.replaceNode(same);
    EXPECT_FALSE(history.commitEntry(1));
    EXPECT_FALSE(history.canUndo());
}

TEST(HistoryManagerTest, EmptyStacksReturnFalse) {
    GraphStore store;
    HistoryManager history(store);
    RecordingObserver observer(history);
    EXPECT_FALSE(history.undo(observer));
    EXPECT_FALSE(history.redo(observer));
    EXPECT_TRUE(observer.nodes.empty());
}

TEST(HistoryManagerTest, OldestEntryIsEvictedAtCapacity) {
    GraphStore store;
    HistoryManager history(store, 3);
    for (int i = 0; i < 5; ++i) {
        const std::string id = "n" + std::to_string(i);
        ASSERT_TRUE(history.beginEntry(1));
        history.markNodeChange(id);
        ASSERT_EQ(store.insertNode(makeNode(id, "custom", Point2{})), GraphError::Ok);
        ASSERT_TRUE(history.commitEntry(1));
    }
    EXPECT_EQ(history.getHistorySize(), 3u);

    RecordingObserver observer(history);
    int undone = 0;
    while (history.undo(observer)) ++undone;
    EXPECT_EQ(undone, 3);
    EXPECT_EQ(store.nodeOrder(), (std::vector<std::string>{"n0", "n1"}));
}

TEST(HistoryManagerTest, NestedActionsCommitOnce) {
    GraphStore store;
    HistoryManager history(store);

    history.startAction(1);
    history.startAction(1);
    EXPECT_FALSE(history.beginEntry(1));
    history.markNodeChange("a");
    ASSERT_EQ(store.insertNode(makeNode("a", "custom", Point2{})), GraphError::Ok);
    EXPECT_FALSE(history.endAction(1));
    EXPECT_TRUE(history.isActionOpen());

    RecordingObserver observer(history);
    EXPECT_FALSE(history.undo(observer));

    history.markNodeChange("b");
    ASSERT_EQ(store.insertNode(makeNode("b", "custom", Point2{})), GraphError::Ok);
    EXPECT_TRUE(history.endAction(1));
    EXPECT_FALSE(history.isActionOpen());
    EXPECT_EQ(history.getHistorySize(), 1u);
    EXPECT_FALSE(history.endAction(1));
}

TEST(HistoryTest, UndoRedoSequence) {
    GraphEngine engine;
    const std::string id = engine.addNode("custom", Point2{0, 0});
    const auto digestAfterCreate = engine.getDocumentDigest();

    ASSERT_TRUE(engine.moveNode(id, Point2{5, 0}));
    EXPECT_FLOAT_EQ(engine.findNode(id)->position.x, 5.0f);

    ASSERT_TRUE(engine.deleteNode(id));
    EXPECT_EQ(engine.findNode(id), nullptr);

    ASSERT_TRUE(engine.undo());
    ASSERT_NE(engine.findNode(id), nullptr);
    EXPECT_FLOAT_EQ(engine.findNode(id)->position.x, 5.0f);

    ASSERT_TRUE(engine.undo());
    EXPECT_FLOAT_EQ(engine.findNode(id)->position.x, 0.0f);
    EXPECT_EQ(engine.getDocumentDigest(), digestAfterCreate);

    ASSERT_TRUE(engine.redo());
    EXPECT_FLOAT_EQ(engine.findNode(id)->position.x, 5.0f);
    ASSERT_TRUE(engine.redo());
    EXPECT_EQ(engine.findNode(id), nullptr);
    EXPECT_FALSE(engine.redo());
}

TEST(HistoryTest, UndoOnEmptyStackIsSilent) {
    GraphEngine engine;
    EXPECT_FALSE(engine.undo());
    EXPECT_FALSE(engine.redo());
    EXPECT_EQ(engine.getLastError(), GraphError::Ok);
    EXPECT_TRUE(engine.diagnostics().entries().empty());
}

TEST(HistoryTest, NewMutationClearsRedo) {
    GraphEngine engine;
    const std::string id = engine.addNode("custom", Point2{0, 0});
    ASSERT_TRUE(engine.moveNode(id, Point2{10, 10}));
    ASSERT_TRUE(engine.undo());
    EXPECT_TRUE(engine.canRedo());
    ASSERT_TRUE(engine.moveNode(id, Point2{20, 20}));
    EXPECT_FALSE(engine.canRedo());
}

TEST(HistoryTest, NoOpMutationRecordsNothing) {
    GraphEngine engine;
    const std::string id = engine.addNode("custom", Point2{3, 4});
    const auto depth = engine.history().getHistorySize();
    ASSERT_TRUE(engine.moveNode(id, Point2{3, 4}));
    EXPECT_EQ(engine.history().getHistorySize(), depth);
}

TEST(HistoryTest, BatchedActionUndoesAsOneStep) {
    GraphEngine engine;
    const auto before = engine.getDocumentDigest();

    engine.startAction();
    const std::string a = engine.addNode("custom", Point2{0, 0});
    const std::string b = engine.addNode("custom", Point2{400, 0});
    ASSERT_TRUE(engine.moveNode(a, Point2{10, 10}));
    ASSERT_TRUE(engine.renameNode(b, "Second"));
    ASSERT_TRUE(engine.endAction());

    EXPECT_EQ(engine.history().getHistorySize(), 1u);
    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.store().nodeCount(), 0u);
    EXPECT_EQ(engine.getDocumentDigest(), before);
    EXPECT_FALSE(engine.canUndo());

    ASSERT_TRUE(engine.redo());
    EXPECT_EQ(engine.findNode(b)->data.customName, "Second");
    EXPECT_FLOAT_EQ(engine.findNode(a)->position.x, 10.0f);
}

TEST(HistoryTest, UndoIsRefusedWhileActionOpen) {
    GraphEngine engine;
    engine.addNode("custom", Point2{0, 0});
    engine.startAction();
    engine.addNode("custom", Point2{10, 0});
    EXPECT_FALSE(engine.undo());
    EXPECT_EQ(engine.getLastError(), GraphError::InvalidOperation);
    EXPECT_EQ(engine.store().nodeCount(), 2u);
    EXPECT_TRUE(engine.endAction());
    EXPECT_EQ(engine.history().getHistorySize(), 2u);
}

TEST(HistoryTest, UndoRestoresIdCursor) {
    GraphEngine engine;
    const std::string first = engine.addNode("custom", Point2{0, 0});
    const auto next = engine.getNextId();
    engine.addNode("custom", Point2{0, 0});
    ASSERT_TRUE(engine.undo());
    EXPECT_EQ(engine.getNextId(), next);
    const std::string again = engine.addNode("custom", Point2{0, 0});
    EXPECT_NE(again, first);
}

TEST(HistoryTest, CapacityComesFromConfig) {
    EngineConfig config{};
    config.maxHistoryEntries = 2;
    GraphEngine engine(config);
    for (int i = 0; i < 4; ++i) engine.addNode("custom", Point2{0, 0});
    EXPECT_EQ(engine.history().getHistorySize(), 2u);
    ASSERT_TRUE(engine.undo());
    ASSERT_TRUE(engine.undo());
    EXPECT_FALSE(engine.undo());
    EXPECT_EQ(engine.store().nodeCount(), 2u);
}

TEST(HistoryTest, SyncNodeBypassesHistory) {
    GraphEngine engine;
    const std::string id = engine.addNode("custom", Point2{0, 0});
    const auto depth = engine.history().getHistorySize();

    Node synced = *engine.findNode(id);
    synced.position = Point2{42, 42};
    ASSERT_TRUE(engine.syncNode(synced));
    EXPECT_FLOAT_EQ(engine.findNode(id)->position.x, 42.0f);
    EXPECT_EQ(engine.history().getHistorySize(), depth);
    EXPECT_FALSE(engine.isRestoring());

    Node missing = synced;
    missing.id = "nope";
    EXPECT_FALSE(engine.syncNode(missing));
    EXPECT_EQ(engine.getLastError(), GraphError::NotFound);
}
