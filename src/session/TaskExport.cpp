#include "mindgraph/session/TaskExport.h"
#include "mindgraph/core/GraphTraversal.h"

namespace mindgraph {

namespace {
constexpr const char* DEFAULT_TASK_TITLE = "New Task";
constexpr const char* DEFAULT_LIST_TITLE = "New List";
}

std::vector<std::string> subtreeTitles(const Graph& graph, const NodeId& root) {
    std::vector<std::string> titles;
    for (const auto& id : descendants(graph, root)) {
        const std::string& label = graph.getNode(id).data.label;
        titles.push_back(label.empty() ? DEFAULT_TASK_TITLE : label);
    }
    return titles;
}

TaskListRequest buildTaskList(const Graph& graph, const NodeId& root) {
    TaskListRequest request;
    const Node* node = graph.findNode(root);
    request.listTitle = (node && !node->data.label.empty()) ? node->data.label : DEFAULT_LIST_TITLE;
    request.taskTitles = subtreeTitles(graph, root);
    return request;
}

}  // namespace mindgraph
