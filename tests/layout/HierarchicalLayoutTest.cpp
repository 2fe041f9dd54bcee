#include <gtest/gtest.h>
#include <mindgraph/layout/HierarchicalLayout.h>

using namespace mindgraph;

namespace {

Graph buildGraph(const std::vector<NodeId>& ids,
                 const std::vector<std::pair<NodeId, NodeId>>& links) {
    Graph graph;
    for (const auto& id : ids) {
        Node node;
        node.id = id;
        node.position = {7.0, 7.0};
        graph.addNode(node);
    }
    int n = 0;
    for (const auto& [source, target] : links) {
        Edge edge;
        edge.id = "e" + std::to_string(n++);
        edge.source = source;
        edge.target = target;
        graph.addEdge(edge);
    }
    return graph;
}

}  // namespace

// ============================================================================
// HierarchicalLayoutTest
// ============================================================================

TEST(HierarchicalLayoutTest, RootWithTwoChildren) {
    Graph graph = buildGraph({"R", "A", "B"}, {{"R", "A"}, {"R", "B"}});

    Graph out = hierarchicalLayout("R", graph);

    EXPECT_EQ(out.getNode("R").position, Point(0.0, 0.0));
    EXPECT_EQ(out.getNode("A").position, Point(280.0, -70.0));
    EXPECT_EQ(out.getNode("B").position, Point(280.0, 70.0));
}

TEST(HierarchicalLayoutTest, LayersAreCenteredOnZero) {
    Graph graph = buildGraph({"R", "A", "B", "C", "A1"},
                             {{"R", "A"}, {"R", "B"}, {"R", "C"}, {"A", "A1"}});

    Graph out = hierarchicalLayout("R", graph);

    EXPECT_EQ(out.getNode("A").position, Point(280.0, -140.0));
    EXPECT_EQ(out.getNode("B").position, Point(280.0, 0.0));
    EXPECT_EQ(out.getNode("C").position, Point(280.0, 140.0));
    EXPECT_EQ(out.getNode("A1").position, Point(560.0, 0.0));
}

TEST(HierarchicalLayoutTest, LayerOrderIsBreadthFirstDiscovery) {
    // A's children come before B1 although B -> B1 precedes A -> A2 in edge order
    Graph graph = buildGraph({"R", "A", "B", "A1", "B1", "A2"},
                             {{"R", "A"}, {"R", "B"}, {"A", "A1"}, {"B", "B1"}, {"A", "A2"}});

    auto layers = HierarchicalLayout::assignLayers(graph, "R");

    ASSERT_EQ(layers.size(), 3u);
    EXPECT_EQ(layers[1], (std::vector<NodeId>{"A", "B"}));
    EXPECT_EQ(layers[2], (std::vector<NodeId>{"A1", "A2", "B1"}));
}

TEST(HierarchicalLayoutTest, NodeGetsShallowestDepth) {
    Graph graph = buildGraph({"R", "A", "X"}, {{"R", "A"}, {"A", "X"}, {"R", "X"}});

    HierarchicalLayout layout;
    LayoutResult result = layout.layout(graph, "R");

    EXPECT_EQ(result.getPlacement("X")->depth, 1);
    EXPECT_EQ(result.layerCount(), 2);
}

TEST(HierarchicalLayoutTest, CycleTerminates) {
    Graph graph = buildGraph({"A", "B", "C"}, {{"A", "B"}, {"B", "C"}, {"C", "A"}});

    HierarchicalLayout layout;
    LayoutResult result = layout.layout(graph, "A");

    EXPECT_EQ(result.size(), 3u);
    EXPECT_EQ(result.getPlacement("C")->position, Point(560.0, 0.0));
}

TEST(HierarchicalLayoutTest, InvalidRootIsNoOp) {
    Graph graph = buildGraph({"R", "A"}, {{"R", "A"}});

    EXPECT_TRUE(HierarchicalLayout::assignLayers(graph, "missing").empty());
    EXPECT_EQ(hierarchicalLayout("missing", graph), graph);
}

TEST(HierarchicalLayoutTest, UnreachableAndDanglingAreLeftAlone) {
    Graph graph = buildGraph({"R", "A", "island"}, {{"R", "ghost"}, {"R", "A"}});

    Graph out = hierarchicalLayout("R", graph);

    EXPECT_EQ(out.getNode("A").position, Point(280.0, 0.0));
    EXPECT_EQ(out.getNode("island").position, Point(7.0, 7.0));
}

TEST(HierarchicalLayoutTest, CustomSpacing) {
    Graph graph = buildGraph({"R", "A", "B"}, {{"R", "A"}, {"R", "B"}});

    HierarchicalLayoutOptions options;
    options.columnSpacing = 100.0;
    options.rowSpacing = 50.0;

    Graph out = hierarchicalLayout("R", graph, options);

    EXPECT_EQ(out.getNode("A").position, Point(100.0, -25.0));
    EXPECT_EQ(out.getNode("B").position, Point(100.0, 25.0));
}

TEST(HierarchicalLayoutTest, DeterministicAcrossRuns) {
    Graph graph = buildGraph({"R", "A", "B", "C", "A1", "C1", "C2"},
                             {{"R", "A"}, {"R", "B"}, {"R", "C"},
                              {"A", "A1"}, {"C", "C1"}, {"C", "C2"}});

    EXPECT_EQ(hierarchicalLayout("R", graph), hierarchicalLayout("R", graph));
}
