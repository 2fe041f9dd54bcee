#include <gtest/gtest.h>
#include <mindgraph/core/GraphStore.h>

using namespace mindgraph;

class GraphStoreTest : public ::testing::Test {
protected:
    GraphStoreTest() : store_(IdGenerator([] { return int64_t{1700000000000}; }, 7)) {}

    Node addAt(double x, double y, const std::string& label = "") {
        NodeDraft draft;
        draft.position = {x, y};
        if (!label.empty()) draft.label = label;
        return store_.addNode(draft);
    }

    GraphStore store_;
};

// ============================================================================
// Core primitives
// ============================================================================

TEST_F(GraphStoreTest, AddNodeDefaultsAndSelection) {
    Node first = addAt(0, 0);
    Node second = addAt(10, 10);

    EXPECT_EQ(first.data.label, "New Node");
    EXPECT_TRUE(first.data.editing);
    EXPECT_EQ(first.type(), NodeType::Generic);
    EXPECT_EQ(first.id.rfind("n1700000000000_", 0), 0u);
    EXPECT_NE(first.id, second.id);

    // The new node is the only selected one
    EXPECT_FALSE(store_.selection().isNodeSelected(first.id));
    EXPECT_TRUE(store_.selection().isNodeSelected(second.id));
}

TEST_F(GraphStoreTest, AddEdgeGeneratesUniqueIds) {
    Node a = addAt(0, 0);
    Node b = addAt(1, 1);

    Edge e1 = store_.addEdge(a.id, b.id);
    Edge e2 = store_.addEdge(a.id, b.id, EdgeType::SmoothStep);

    EXPECT_NE(e1.id, e2.id);
    EXPECT_EQ(e1.id.rfind("e", 0), 0u);
    EXPECT_EQ(e2.type, EdgeType::SmoothStep);
    EXPECT_EQ(store_.graph().edgeCount(), 2u);
}

TEST_F(GraphStoreTest, DeleteSelectedRemovesNodesAndTouchingEdges) {
    Node a = addAt(0, 0, "A");
    Node b = addAt(0, 0, "B");
    Node c = addAt(0, 0, "C");
    Edge ab = store_.addEdge(a.id, b.id);
    Edge bc = store_.addEdge(b.id, c.id);
    Edge ac = store_.addEdge(a.id, c.id);

    store_.selectNode(b.id);
    store_.selectEdge(ac.id, true);

    EXPECT_TRUE(store_.deleteSelected());

    const Graph& g = store_.graph();
    EXPECT_FALSE(g.hasNode(b.id));
    EXPECT_FALSE(g.hasEdge(ab.id));
    EXPECT_FALSE(g.hasEdge(bc.id));
    EXPECT_FALSE(g.hasEdge(ac.id));
    EXPECT_TRUE(g.hasNode(a.id));
    EXPECT_TRUE(g.hasNode(c.id));
    EXPECT_TRUE(store_.selection().empty());
}

TEST_F(GraphStoreTest, DeleteWithEmptySelectionIsNoOp) {
    addAt(0, 0);
    store_.deselectAll();

    EXPECT_FALSE(store_.deleteSelected());
    EXPECT_EQ(store_.graph().nodeCount(), 1u);
}

TEST_F(GraphStoreTest, ReplaceAllDropsStaleSelection) {
    Node a = addAt(0, 0);
    SelectionState selection;
    selection.selectNode(a.id);
    selection.selectNode("gone", true);

    Graph replacement;
    replacement.addNode(store_.graph().getNode(a.id));
    store_.replaceAll(replacement, selection);

    EXPECT_TRUE(store_.selection().isNodeSelected(a.id));
    EXPECT_FALSE(store_.selection().isNodeSelected("gone"));
}

TEST_F(GraphStoreTest, InsertSubgraphSelectsInsertedNodes) {
    Node existing = addAt(0, 0);

    Node x;
    x.id = "x";
    Node y;
    y.id = "y";
    Edge xy;
    xy.id = "xy";
    xy.source = "x";
    xy.target = "y";

    store_.insertSubgraph({x, y}, {xy});

    EXPECT_EQ(store_.graph().nodeCount(), 3u);
    EXPECT_FALSE(store_.selection().isNodeSelected(existing.id));
    EXPECT_TRUE(store_.selection().isNodeSelected("x"));
    EXPECT_TRUE(store_.selection().isNodeSelected("y"));
}

TEST_F(GraphStoreTest, InsertSubgraphCollisionLeavesStoreUnchanged) {
    Node existing = addAt(0, 0);
    Node clash;
    clash.id = existing.id;

    EXPECT_THROW(store_.insertSubgraph({clash}, {}), std::invalid_argument);
    EXPECT_EQ(store_.graph().nodeCount(), 1u);
    EXPECT_TRUE(store_.selection().isNodeSelected(existing.id));
}

// ============================================================================
// Editing
// ============================================================================

TEST_F(GraphStoreTest, AddChildOffsetsAndLinks) {
    Node parent = addAt(100, 50);

    auto child = store_.addChild();
    ASSERT_TRUE(child.has_value());

    EXPECT_EQ(child->position, Point(300, 170));
    EXPECT_EQ(store_.graph().children(parent.id), (std::vector<NodeId>{child->id}));
    EXPECT_EQ(store_.graph().edges().back().type, EdgeType::SmoothStep);
    EXPECT_TRUE(store_.selection().isNodeSelected(child->id));
}

TEST_F(GraphStoreTest, AddChildWithoutSelectionDoesNothing) {
    addAt(0, 0);
    store_.deselectAll();

    EXPECT_FALSE(store_.addChild().has_value());
    EXPECT_EQ(store_.graph().nodeCount(), 1u);
}

TEST_F(GraphStoreTest, AddSiblingLinksFromFirstParent) {
    Node root = addAt(0, 0);
    auto child = store_.addChild();
    ASSERT_TRUE(child.has_value());

    auto sibling = store_.addSibling();
    ASSERT_TRUE(sibling.has_value());

    EXPECT_EQ(sibling->position, child->position + Point(220, 0));
    EXPECT_EQ(store_.graph().parents(sibling->id), (std::vector<NodeId>{root.id}));
}

TEST_F(GraphStoreTest, AddSiblingOfRootIsUnlinked) {
    addAt(0, 0);
    auto sibling = store_.addSibling();
    ASSERT_TRUE(sibling.has_value());

    EXPECT_EQ(sibling->position, Point(220, 0));
    EXPECT_TRUE(store_.graph().parents(sibling->id).empty());
    EXPECT_EQ(store_.graph().edgeCount(), 0u);
}

TEST_F(GraphStoreTest, AddLinkedNodeUsesLabelAndIsNotEditing) {
    Node parent = addAt(0, 0);
    auto linked = store_.addLinkedNode("Reference");
    ASSERT_TRUE(linked.has_value());

    EXPECT_EQ(linked->data.label, "Reference");
    EXPECT_FALSE(linked->data.editing);
    EXPECT_EQ(store_.graph().parents(linked->id), (std::vector<NodeId>{parent.id}));
}

TEST_F(GraphStoreTest, AttachNodeCarriesPayload) {
    addAt(10, 10);
    auto note = store_.attachNode(NotePayload{"remember"}, "Note");
    ASSERT_TRUE(note.has_value());

    EXPECT_EQ(note->type(), NodeType::Note);
    EXPECT_EQ(note->position, Point(230, 50));
    EXPECT_EQ(std::get<NotePayload>(note->data.payload).text, "remember");
}

TEST_F(GraphStoreTest, DuplicateNodeIsOffsetAndUnselected) {
    Node original = addAt(5, 5, "Original");
    auto copy = store_.duplicateNode(original.id);
    ASSERT_TRUE(copy.has_value());

    EXPECT_EQ(copy->id.rfind(original.id + "-copy-", 0), 0u);
    EXPECT_EQ(copy->position, Point(45, 45));
    EXPECT_EQ(copy->data.label, "Original");
    EXPECT_FALSE(store_.selection().isNodeSelected(copy->id));
    EXPECT_FALSE(store_.duplicateNode("missing").has_value());
}

TEST_F(GraphStoreTest, ConnectSkipsExistingConnection) {
    Node a = addAt(0, 0);
    Node b = addAt(0, 0);

    EXPECT_TRUE(store_.connect(a.id, b.id).has_value());
    EXPECT_FALSE(store_.connect(a.id, b.id).has_value());
    EXPECT_TRUE(store_.connect(b.id, a.id).has_value());
    EXPECT_EQ(store_.graph().edgeCount(), 2u);
}

TEST_F(GraphStoreTest, ConnectedEdgeLabelCanBeEdited) {
    Node a = addAt(0, 0);
    Node b = addAt(100, 0);

    auto edge = store_.connect(a.id, b.id);
    ASSERT_TRUE(edge.has_value());
    EXPECT_EQ(edge->type, EdgeType::Labeled);
    EXPECT_EQ(edge->label, std::optional<std::string>(""));

    EXPECT_TRUE(store_.setEdgeLabel(edge->id, "leads to"));
    EXPECT_EQ(store_.graph().getEdge(edge->id).label, std::optional<std::string>("leads to"));
    EXPECT_FALSE(store_.setEdgeLabel("missing", "x"));
}

TEST_F(GraphStoreTest, ToggleCollapsed) {
    Node a = addAt(0, 0);

    EXPECT_EQ(store_.toggleCollapsed(a.id), std::optional<bool>(true));
    EXPECT_EQ(store_.toggleCollapsed(a.id), std::optional<bool>(false));
    EXPECT_FALSE(store_.toggleCollapsed("missing").has_value());
}

TEST_F(GraphStoreTest, FindNodeByLabelTrims) {
    Node a = addAt(0, 0, "  Project Plan ");

    const Node* found = store_.findNodeByLabel("Project Plan");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->id, a.id);
    EXPECT_EQ(store_.findNodeByLabel("Plan"), nullptr);
}

TEST_F(GraphStoreTest, ApplyPositionsOnlyMovesNodes) {
    Node a = addAt(0, 0, "A");
    Graph laidOut = store_.graph();
    laidOut.setNodePosition(a.id, {42, 24});
    laidOut.setNodeLabel(a.id, "ignored");

    store_.applyPositions(laidOut);

    EXPECT_EQ(store_.graph().getNode(a.id).position, Point(42, 24));
    EXPECT_EQ(store_.graph().getNode(a.id).data.label, "A");
}
