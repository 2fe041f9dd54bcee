#include "mindgraph/view/VisibilityResolver.h"
#include "mindgraph/core/GraphTraversal.h"
#include "mindgraph/common/Logger.h"

namespace mindgraph {

void VisibleView::addNode(const NodeId& id) {
    if (nodeSet_.insert(id).second) {
        nodeIds_.push_back(id);
    }
}

void VisibleView::addEdge(const EdgeId& id) {
    if (edgeSet_.insert(id).second) {
        edgeIds_.push_back(id);
    }
}

VisibleView VisibilityResolver::resolve(const Graph& graph,
                                        const std::unordered_set<NodeId>& collapsed,
                                        const std::optional<NodeId>& focusRoot) {
    ChildrenMap children = buildChildrenMap(graph);

    // Hidden: descendants of every collapsed node, the node itself excluded.
    // Another collapsed node can still hide it.
    std::unordered_set<NodeId> hidden;
    for (const auto& id : collapsed) {
        if (!graph.hasNode(id)) continue;
        for (const auto& reached : subtree(graph, children, id)) {
            if (reached != id) {
                hidden.insert(reached);
            }
        }
    }

    std::optional<std::unordered_set<NodeId>> focusSet;
    if (focusRoot) {
        if (graph.hasNode(*focusRoot)) {
            auto ids = subtree(graph, children, *focusRoot);
            focusSet.emplace(ids.begin(), ids.end());
        } else {
            LOG_DEBUG("Focus root '{}' not in graph, ignored", *focusRoot);
        }
    }

    VisibleView view;
    for (const auto& node : graph.nodes()) {
        if (hidden.count(node.id) > 0) continue;
        if (focusSet && focusSet->count(node.id) == 0) continue;
        view.addNode(node.id);
    }

    for (const auto& edge : graph.edges()) {
        if (view.isNodeVisible(edge.source) && view.isNodeVisible(edge.target)) {
            view.addEdge(edge.id);
        }
    }

    return view;
}

VisibleView VisibilityResolver::resolve(const Graph& graph,
                                        const std::optional<NodeId>& focusRoot) {
    return resolve(graph, collapsedNodes(graph), focusRoot);
}

std::unordered_set<NodeId> VisibilityResolver::collapsedNodes(const Graph& graph) {
    std::unordered_set<NodeId> result;
    for (const auto& node : graph.nodes()) {
        if (node.data.collapsed) {
            result.insert(node.id);
        }
    }
    return result;
}

}  // namespace mindgraph
