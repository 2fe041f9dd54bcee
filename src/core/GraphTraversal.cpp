#include "mindgraph/core/GraphTraversal.h"

#include <queue>
#include <unordered_set>

namespace mindgraph {

ChildrenMap buildChildrenMap(const Graph& graph) {
    ChildrenMap map;
    for (const auto& edge : graph.edges()) {
        if (graph.isDangling(edge)) continue;
        map[edge.source].push_back(edge.target);
    }
    return map;
}

std::vector<NodeId> subtree(const Graph& graph, const NodeId& root) {
    return subtree(graph, buildChildrenMap(graph), root);
}

std::vector<NodeId> subtree(const Graph& graph, const ChildrenMap& children, const NodeId& root) {
    std::vector<NodeId> result;
    if (!graph.hasNode(root)) return result;

    std::unordered_set<NodeId> visited{root};
    std::queue<NodeId> queue;
    queue.push(root);

    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop();
        result.push_back(current);

        auto it = children.find(current);
        if (it == children.end()) continue;

        for (const NodeId& child : it->second) {
            if (visited.insert(child).second) {
                queue.push(child);
            }
        }
    }
    return result;
}

std::vector<NodeId> descendants(const Graph& graph, const NodeId& root) {
    std::vector<NodeId> result = subtree(graph, root);
    if (!result.empty()) {
        result.erase(result.begin());
    }
    return result;
}

}  // namespace mindgraph
