#pragma once

#include "../core/Graph.h"

#include <string>
#include <vector>

namespace mindgraph {

/// Request handed to the task-list collaborator
struct TaskListRequest {
    std::string listTitle;
    std::vector<std::string> taskTitles;

    bool operator==(const TaskListRequest&) const = default;
};

/// Labels of every descendant of `root` in breadth-first order.
/// Empty labels become "New Task".
std::vector<std::string> subtreeTitles(const Graph& graph, const NodeId& root);

/// Task list named after `root` ("New List" when unlabeled) with one task per
/// descendant
TaskListRequest buildTaskList(const Graph& graph, const NodeId& root);

}  // namespace mindgraph
