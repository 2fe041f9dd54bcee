#include <gtest/gtest.h>
#include <mindgraph/layout/LayoutRoot.h>

using namespace mindgraph;

namespace {

void addNodes(Graph& graph, const std::vector<NodeId>& ids) {
    for (const auto& id : ids) {
        Node node;
        node.id = id;
        graph.addNode(node);
    }
}

void link(Graph& graph, const EdgeId& id, const NodeId& source, const NodeId& target) {
    Edge edge;
    edge.id = id;
    edge.source = source;
    edge.target = target;
    graph.addEdge(edge);
}

}  // namespace

TEST(LayoutRootTest, EmptyGraphHasNoRoot) {
    Graph graph;
    EXPECT_FALSE(selectLayoutRoot(graph).has_value());
}

TEST(LayoutRootTest, FirstNodeWithoutIncomingEdge) {
    Graph graph;
    addNodes(graph, {"child", "root", "other"});
    link(graph, "e1", "root", "child");

    EXPECT_EQ(selectLayoutRoot(graph), std::optional<NodeId>("root"));
}

TEST(LayoutRootTest, DanglingIncomingEdgeDoesNotCount) {
    Graph graph;
    addNodes(graph, {"a", "b"});
    link(graph, "e1", "ghost", "a");
    link(graph, "e2", "a", "b");

    EXPECT_EQ(selectLayoutRoot(graph), std::optional<NodeId>("a"));
}

TEST(LayoutRootTest, PureCycleFallsBackToFirstNode) {
    Graph graph;
    addNodes(graph, {"a", "b", "c"});
    link(graph, "e1", "a", "b");
    link(graph, "e2", "b", "c");
    link(graph, "e3", "c", "a");

    EXPECT_EQ(selectLayoutRoot(graph), std::optional<NodeId>("a"));
}
