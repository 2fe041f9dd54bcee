#include <gtest/gtest.h>
#include <mindgraph/session/TaskExport.h>

using namespace mindgraph;

namespace {

void addNode(Graph& graph, const NodeId& id, const std::string& label) {
    Node node;
    node.id = id;
    node.data.label = label;
    graph.addNode(node);
}

void addEdge(Graph& graph, const NodeId& source, const NodeId& target) {
    Edge edge;
    edge.id = source + "-" + target;
    edge.source = source;
    edge.target = target;
    graph.addEdge(edge);
}

}  // namespace

TEST(TaskExportTest, DescendantsInBreadthFirstOrder) {
    Graph graph;
    addNode(graph, "P", "Project");
    addNode(graph, "A", "Design");
    addNode(graph, "B", "Build");
    addNode(graph, "A1", "Sketch");
    addNode(graph, "B1", "");
    addEdge(graph, "P", "A");
    addEdge(graph, "P", "B");
    addEdge(graph, "A", "A1");
    addEdge(graph, "B", "B1");

    TaskListRequest request = buildTaskList(graph, "P");

    EXPECT_EQ(request.listTitle, "Project");
    EXPECT_EQ(request.taskTitles,
              (std::vector<std::string>{"Design", "Build", "Sketch", "New Task"}));
}

TEST(TaskExportTest, UnlabeledRootAndLeaf) {
    Graph graph;
    addNode(graph, "P", "");

    TaskListRequest request = buildTaskList(graph, "P");

    EXPECT_EQ(request.listTitle, "New List");
    EXPECT_TRUE(request.taskTitles.empty());
}

TEST(TaskExportTest, CycleListsEachNodeOnce) {
    Graph graph;
    addNode(graph, "A", "a");
    addNode(graph, "B", "b");
    addEdge(graph, "A", "B");
    addEdge(graph, "B", "A");

    EXPECT_EQ(subtreeTitles(graph, "A"), std::vector<std::string>{"b"});
}
