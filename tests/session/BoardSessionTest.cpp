#include <gtest/gtest.h>
#include <mindgraph/session/BoardSession.h>
#include <mindgraph/io/GraphSerializer.h>
#include <mindgraph/common/Logger.h>

#include <map>
#include <stdexcept>

using namespace mindgraph;
using namespace std::chrono_literals;

namespace {

class MemoryPersistence : public IGraphPersistence {
public:
    void save(const std::string& boardId, const std::string& json) override {
        if (failSaves) {
            throw std::runtime_error("disk full");
        }
        ++saveCount;
        boards[boardId] = json;
    }

    std::optional<std::string> load(const std::string& boardId) override {
        auto it = boards.find(boardId);
        if (it == boards.end()) return std::nullopt;
        return it->second;
    }

    std::map<std::string, std::string> boards;
    int saveCount = 0;
    bool failSaves = false;
};

IdGenerator fixedIds() {
    return IdGenerator([] { return int64_t{1700000000000}; }, 11);
}

}  // namespace

class BoardSessionTest : public ::testing::Test {
protected:
    BoardSessionTest()
        : persistence_(std::make_shared<MemoryPersistence>())
        , session_("board-1", EngineConfig::defaults(), persistence_,
                   TemplateCatalog::builtin(), fixedIds()) {}

    NodeId addNode(Point position, const std::string& label = "Node") {
        session_.dispatch(intent::AddNode{position, label}, t0_);
        return *session_.selection().nodeIds().begin();
    }

    NodeId addChild() {
        session_.dispatch(intent::AddChild{}, t0_);
        return *session_.selection().nodeIds().begin();
    }

    BoardSession::TimePoint t0_ = BoardSession::Clock::now();
    std::shared_ptr<MemoryPersistence> persistence_;
    BoardSession session_;
};

// ============================================================================
// Commit pipeline
// ============================================================================

TEST_F(BoardSessionTest, StartsEmptyWithOneSnapshot) {
    EXPECT_TRUE(session_.graph().empty());
    EXPECT_EQ(session_.history().size(), 1u);
    EXPECT_EQ(session_.view().nodeCount(), 0u);
    EXPECT_TRUE(session_.scheduler().empty());
}

TEST_F(BoardSessionTest, MutationRecordsHistoryAndRefreshesView) {
    EXPECT_TRUE(session_.dispatch(intent::AddNode{{10, 20}, std::string("Idea")}, t0_));

    EXPECT_EQ(session_.graph().nodeCount(), 1u);
    EXPECT_EQ(session_.history().size(), 2u);
    EXPECT_EQ(session_.view().nodeCount(), 1u);
    EXPECT_TRUE(session_.scheduler().isPending(BoardSession::PERSIST_TASK));
}

TEST_F(BoardSessionTest, SelectionDoesNotRecordOrPersist) {
    NodeId a = addNode({0, 0});
    session_.tick(t0_ + 1s);
    size_t snapshots = session_.history().size();

    EXPECT_FALSE(session_.dispatch(intent::DeselectAll{}, t0_ + 2s));
    EXPECT_FALSE(session_.dispatch(intent::SelectNode{a}, t0_ + 2s));

    EXPECT_TRUE(session_.selection().isNodeSelected(a));
    EXPECT_EQ(session_.history().size(), snapshots);
    EXPECT_FALSE(session_.scheduler().isPending(BoardSession::PERSIST_TASK));
}

TEST_F(BoardSessionTest, ViewListenerIsNotified) {
    size_t lastCount = 0;
    int calls = 0;
    session_.setViewListener([&](const VisibleView& view) {
        lastCount = view.nodeCount();
        ++calls;
    });

    addNode({0, 0});
    addNode({100, 0});

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(lastCount, 2u);
}

TEST_F(BoardSessionTest, NoOpEditsAreNotCommitted) {
    NodeId a = addNode({5, 5}, "Same");
    size_t snapshots = session_.history().size();

    EXPECT_FALSE(session_.dispatch(intent::MoveNode{a, {5, 5}}, t0_));
    EXPECT_FALSE(session_.dispatch(intent::RenameNode{a, "Same"}, t0_));
    EXPECT_FALSE(session_.dispatch(intent::ToggleCollapse{"ghost"}, t0_));
    EXPECT_EQ(session_.history().size(), snapshots);
}

TEST_F(BoardSessionTest, ConnectCreatesEditableLabeledEdge) {
    NodeId a = addNode({0, 0});
    NodeId b = addNode({200, 0});

    ASSERT_TRUE(session_.dispatch(intent::Connect{a, b}, t0_));
    ASSERT_EQ(session_.graph().edgeCount(), 1u);
    const Edge& edge = session_.graph().edges().front();
    EXPECT_EQ(edge.type, EdgeType::Labeled);
    EXPECT_EQ(edge.label, std::optional<std::string>(""));

    size_t snapshots = session_.history().size();
    EXPECT_TRUE(session_.dispatch(intent::RenameEdge{edge.id, "depends on"}, t0_));
    EXPECT_EQ(session_.graph().edges().front().label, std::optional<std::string>("depends on"));
    EXPECT_EQ(session_.history().size(), snapshots + 1);

    // Same text or unknown edge: nothing to commit
    EXPECT_FALSE(session_.dispatch(intent::RenameEdge{edge.id, "depends on"}, t0_));
    EXPECT_FALSE(session_.dispatch(intent::RenameEdge{"ghost", "x"}, t0_));
    EXPECT_EQ(session_.history().size(), snapshots + 1);

    session_.dispatch(intent::Undo{}, t0_);
    EXPECT_EQ(session_.graph().edges().front().label, std::optional<std::string>(""));
}

// ============================================================================
// History
// ============================================================================

TEST_F(BoardSessionTest, UndoRedoRestoresWithoutRecording) {
    addNode({0, 0});
    addNode({100, 0});
    addNode({200, 0});
    ASSERT_EQ(session_.history().size(), 4u);

    EXPECT_TRUE(session_.dispatch(intent::Undo{}, t0_));
    EXPECT_EQ(session_.graph().nodeCount(), 2u);
    EXPECT_EQ(session_.history().size(), 4u);

    EXPECT_TRUE(session_.dispatch(intent::Redo{}, t0_));
    EXPECT_EQ(session_.graph().nodeCount(), 3u);
    EXPECT_EQ(session_.history().size(), 4u);
}

TEST_F(BoardSessionTest, UndoPastStartIsIgnored) {
    addNode({0, 0});
    addNode({100, 0});

    int applied = 0;
    for (int i = 0; i < 7; ++i) {
        if (session_.dispatch(intent::Undo{}, t0_)) ++applied;
    }

    EXPECT_EQ(applied, 2);
    EXPECT_TRUE(session_.graph().empty());
    EXPECT_EQ(session_.history().cursor(), 0);
}

TEST_F(BoardSessionTest, UndoRestoresSelection) {
    NodeId a = addNode({0, 0});
    NodeId b = addNode({100, 0});
    ASSERT_TRUE(session_.selection().isNodeSelected(b));

    session_.dispatch(intent::Undo{}, t0_);

    EXPECT_TRUE(session_.selection().isNodeSelected(a));
    EXPECT_FALSE(session_.graph().hasNode(b));
}

TEST_F(BoardSessionTest, EditAfterUndoDropsRedo) {
    addNode({0, 0});
    addNode({100, 0});
    session_.dispatch(intent::Undo{}, t0_);

    addNode({300, 0});

    EXPECT_FALSE(session_.history().canRedo());
    EXPECT_FALSE(session_.dispatch(intent::Redo{}, t0_));
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(BoardSessionTest, BurstOfChangesSavesOnce) {
    session_.dispatch(intent::AddNode{{0, 0}, std::nullopt}, t0_);
    session_.dispatch(intent::AddNode{{100, 0}, std::nullopt}, t0_ + 100ms);
    session_.dispatch(intent::AddNode{{200, 0}, std::nullopt}, t0_ + 200ms);

    session_.tick(t0_ + 600ms);
    EXPECT_EQ(persistence_->saveCount, 0);

    session_.tick(t0_ + 700ms);
    EXPECT_EQ(persistence_->saveCount, 1);

    GraphDocument saved;
    ASSERT_TRUE(GraphSerializer::fromJson(persistence_->boards.at("board-1"), saved));
    EXPECT_EQ(saved.graph, session_.graph());
}

TEST_F(BoardSessionTest, FlushSavesImmediately) {
    addNode({0, 0});

    session_.flush();

    EXPECT_EQ(persistence_->saveCount, 1);
    EXPECT_FALSE(session_.scheduler().isPending(BoardSession::PERSIST_TASK));
}

TEST(BoardSessionTeardownTest, DestroyingSessionWritesPendingSave) {
    auto persistence = std::make_shared<MemoryPersistence>();
    auto t0 = BoardSession::Clock::now();
    {
        BoardSession session("board-1", EngineConfig::defaults(), persistence,
                             TemplateCatalog::builtin(), fixedIds());
        session.dispatch(intent::AddNode{{0, 0}, std::string("Root")}, t0);
        session.dispatch(intent::AddChild{}, t0 + 100ms);
        EXPECT_EQ(persistence->saveCount, 0);
    }

    EXPECT_EQ(persistence->saveCount, 1);
    GraphDocument saved;
    ASSERT_TRUE(GraphSerializer::fromJson(persistence->boards.at("board-1"), saved));
    EXPECT_EQ(saved.graph.nodeCount(), 2u);
    EXPECT_EQ(saved.graph.edgeCount(), 1u);
}

TEST(BoardSessionTeardownTest, DestroyingIdleSessionDoesNotSave) {
    auto persistence = std::make_shared<MemoryPersistence>();
    {
        BoardSession session("board-1", EngineConfig::defaults(), persistence,
                             TemplateCatalog::builtin(), fixedIds());
        session.dispatch(intent::AddNode{{0, 0}, std::nullopt});
        session.flush();
    }
    EXPECT_EQ(persistence->saveCount, 1);
}

TEST_F(BoardSessionTest, SaveFailureIsLoggedAndSessionContinues) {
    ScopedLogCapture capture;
    persistence_->failSaves = true;

    addNode({0, 0});
    EXPECT_NO_THROW(session_.tick(t0_ + 1s));
    EXPECT_TRUE(capture.contains("disk full"));

    persistence_->failSaves = false;
    addNode({100, 0});
    session_.tick(t0_ + 2s);
    EXPECT_EQ(persistence_->saveCount, 1);
}

TEST_F(BoardSessionTest, LoadFromPersistence) {
    Graph graph;
    Node node;
    node.id = "stored";
    node.data.label = "Stored";
    graph.addNode(node);
    persistence_->boards["board-1"] = GraphSerializer::toJson(graph);

    ASSERT_TRUE(session_.loadFromPersistence());

    EXPECT_TRUE(session_.graph().hasNode("stored"));
    EXPECT_EQ(session_.history().size(), 1u);
    EXPECT_TRUE(session_.scheduler().empty());
}

TEST_F(BoardSessionTest, LoadFromPersistenceWithNothingStored) {
    EXPECT_FALSE(session_.loadFromPersistence());
    EXPECT_TRUE(session_.graph().empty());
}

TEST_F(BoardSessionTest, MalformedLoadGivesEmptyBoard) {
    addNode({0, 0});

    session_.load(R"({"nodes": "oops"})");

    EXPECT_TRUE(session_.graph().empty());
    EXPECT_EQ(session_.history().size(), 1u);
    EXPECT_FALSE(session_.dispatch(intent::Undo{}, t0_));
}

// ============================================================================
// Visibility
// ============================================================================

TEST_F(BoardSessionTest, CollapseHidesDescendants) {
    NodeId root = addNode({0, 0});
    addChild();
    addChild();

    EXPECT_TRUE(session_.dispatch(intent::ToggleCollapse{root}, t0_));
    EXPECT_EQ(session_.view().nodeCount(), 1u);
    EXPECT_EQ(session_.view().edgeCount(), 0u);

    EXPECT_TRUE(session_.dispatch(intent::Undo{}, t0_));
    EXPECT_EQ(session_.view().nodeCount(), 3u);
}

TEST_F(BoardSessionTest, FocusRestrictsViewWithoutRecording) {
    addNode({0, 0});
    NodeId child = addChild();
    NodeId grandchild = addChild();
    size_t snapshots = session_.history().size();

    EXPECT_FALSE(session_.dispatch(intent::SetFocusRoot{child}, t0_));
    EXPECT_EQ(session_.focusRoot(), child);
    EXPECT_EQ(session_.view().nodeCount(), 2u);
    EXPECT_TRUE(session_.view().isNodeVisible(grandchild));
    EXPECT_EQ(session_.history().size(), snapshots);

    session_.dispatch(intent::ClearFocus{}, t0_);
    EXPECT_EQ(session_.view().nodeCount(), 3u);
}

TEST_F(BoardSessionTest, FocusOnUnknownNodeIsIgnored) {
    addNode({0, 0});

    session_.dispatch(intent::SetFocusRoot{"ghost"}, t0_);

    EXPECT_FALSE(session_.focusRoot().has_value());
    EXPECT_EQ(session_.view().nodeCount(), 1u);
}

TEST_F(BoardSessionTest, DeletingFocusRootClearsFocus) {
    addNode({0, 0});
    NodeId child = addChild();
    session_.dispatch(intent::SetFocusRoot{child}, t0_);

    // The child is still the selected node
    EXPECT_TRUE(session_.dispatch(intent::DeleteSelection{}, t0_));

    EXPECT_FALSE(session_.focusRoot().has_value());
    EXPECT_EQ(session_.view().nodeCount(), 1u);
}

// ============================================================================
// Layout
// ============================================================================

TEST_F(BoardSessionTest, LayoutStartsAtFocusRoot) {
    NodeId root = addNode({500, 500});
    NodeId child = addChild();
    NodeId grandchild = addChild();
    session_.dispatch(intent::SetFocusRoot{child}, t0_);

    EXPECT_TRUE(session_.dispatch(intent::ApplyLayout{LayoutKind::Radial}, t0_));

    EXPECT_EQ(session_.graph().getNode(root).position, Point(500, 500));
    EXPECT_EQ(session_.graph().getNode(child).position, Point(0, 0));
    EXPECT_NEAR(session_.graph().getNode(grandchild).position.x, 280.0, 1e-9);
    EXPECT_NEAR(session_.graph().getNode(grandchild).position.y, 0.0, 1e-9);
}

TEST_F(BoardSessionTest, RepeatedLayoutIsNotRecorded) {
    addNode({500, 500});
    addChild();

    EXPECT_TRUE(session_.dispatch(intent::ApplyLayout{}, t0_));
    size_t snapshots = session_.history().size();

    EXPECT_FALSE(session_.dispatch(intent::ApplyLayout{}, t0_));
    EXPECT_EQ(session_.history().size(), snapshots);
}

TEST_F(BoardSessionTest, LayoutOnEmptyBoard) {
    EXPECT_FALSE(session_.dispatch(intent::ApplyLayout{}, t0_));
}

// ============================================================================
// Templates
// ============================================================================

TEST_F(BoardSessionTest, TemplateIsLaidOutAfterDelay) {
    ASSERT_TRUE(session_.dispatch(intent::ApplyTemplate{"swot-analysis"}, t0_));
    EXPECT_EQ(session_.graph().nodeCount(), 21u);
    EXPECT_EQ(session_.history().size(), 2u);
    EXPECT_EQ(session_.selection().nodeIds().size(), 21u);

    EXPECT_EQ(session_.tick(t0_ + 149ms), 0u);
    EXPECT_EQ(session_.tick(t0_ + 150ms), 1u);
    EXPECT_EQ(session_.history().size(), 3u);

    const auto& nodes = session_.graph().nodes();
    EXPECT_EQ(nodes[0].position, Point(0, 0));
    EXPECT_EQ(nodes[1].data.label, "Strengths");
    EXPECT_EQ(nodes[1].position, Point(280, -210));

    // Running the same layout again changes nothing
    EXPECT_FALSE(session_.dispatch(intent::ApplyLayout{LayoutKind::Hierarchical}, t0_ + 200ms));
    EXPECT_EQ(session_.history().size(), 3u);
}

TEST_F(BoardSessionTest, TemplateLayoutsCoalesce) {
    session_.dispatch(intent::ApplyTemplate{"swot-analysis"}, t0_);
    session_.dispatch(intent::ApplyTemplate{"swot-analysis"}, t0_ + 100ms);

    EXPECT_EQ(session_.graph().nodeCount(), 42u);

    EXPECT_EQ(session_.tick(t0_ + 200ms), 0u);
    EXPECT_EQ(session_.tick(t0_ + 250ms), 1u);
    EXPECT_FALSE(session_.scheduler().isPending(BoardSession::TEMPLATE_LAYOUT_TASK));
}

TEST_F(BoardSessionTest, UndoCancelsPendingTemplateLayout) {
    session_.dispatch(intent::ApplyTemplate{"timeline"}, t0_);
    ASSERT_TRUE(session_.scheduler().isPending(BoardSession::TEMPLATE_LAYOUT_TASK));

    session_.dispatch(intent::Undo{}, t0_ + 10ms);

    EXPECT_FALSE(session_.scheduler().isPending(BoardSession::TEMPLATE_LAYOUT_TASK));
    EXPECT_TRUE(session_.graph().empty());
}

TEST_F(BoardSessionTest, UnknownTemplateChangesNothing) {
    EXPECT_FALSE(session_.dispatch(intent::ApplyTemplate{"no-such"}, t0_));
    EXPECT_TRUE(session_.graph().empty());
    EXPECT_TRUE(session_.scheduler().empty());
}

TEST_F(BoardSessionTest, SaveAndApplyTemplateDocument) {
    addNode({0, 0}, "Kept");
    auto saved = session_.saveAsTemplate("My board");
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->name, "My board");

    addNode({100, 0}, "Extra");
    ASSERT_TRUE(session_.applyTemplateDocument(saved->document, t0_));

    EXPECT_EQ(session_.graph().nodeCount(), 1u);
    EXPECT_EQ(session_.graph().nodes()[0].data.label, "Kept");

    EXPECT_TRUE(session_.dispatch(intent::Undo{}, t0_));
    EXPECT_EQ(session_.graph().nodeCount(), 2u);
}

TEST_F(BoardSessionTest, InvalidTemplateDocumentLeavesBoard) {
    addNode({0, 0});
    size_t snapshots = session_.history().size();

    EXPECT_FALSE(session_.applyTemplateDocument("{}", t0_));
    EXPECT_EQ(session_.graph().nodeCount(), 1u);
    EXPECT_EQ(session_.history().size(), snapshots);
    EXPECT_FALSE(session_.saveAsTemplate("   ").has_value());
}

// ============================================================================
// Keys and export
// ============================================================================

TEST_F(BoardSessionTest, KeyboardShortcuts) {
    addNode({0, 0});

    EXPECT_TRUE(session_.dispatch(KeyEvent{"Tab"}, t0_));
    EXPECT_EQ(session_.graph().nodeCount(), 2u);
    EXPECT_EQ(session_.graph().edgeCount(), 1u);

    EXPECT_TRUE(session_.dispatch(KeyEvent{"z", true}, t0_));
    EXPECT_EQ(session_.graph().nodeCount(), 1u);

    KeyEvent typing{"Tab"};
    typing.editingText = true;
    EXPECT_FALSE(session_.dispatch(typing, t0_));
}

TEST_F(BoardSessionTest, AddChildWithoutSelectionIsIgnored) {
    EXPECT_FALSE(session_.dispatch(intent::AddChild{}, t0_));
    EXPECT_EQ(session_.history().size(), 1u);
}

TEST_F(BoardSessionTest, CreateTaskListFromSelection) {
    EXPECT_FALSE(session_.createTaskList().has_value());

    NodeId root = addNode({0, 0}, "Launch");
    session_.dispatch(intent::AddLinkedNode{"Write copy"}, t0_);
    session_.dispatch(intent::SelectNode{root}, t0_);
    session_.dispatch(intent::AddLinkedNode{"Ship"}, t0_);
    session_.dispatch(intent::SelectNode{root}, t0_);

    auto request = session_.createTaskList();
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->listTitle, "Launch");
    EXPECT_EQ(request->taskTitles, (std::vector<std::string>{"Write copy", "Ship"}));
}
