#include "mindgraph/layout/HierarchicalLayout.h"
#include "mindgraph/core/GraphTraversal.h"
#include "mindgraph/common/Logger.h"

#include <queue>
#include <unordered_map>

namespace mindgraph {

std::vector<std::vector<NodeId>> HierarchicalLayout::assignLayers(const Graph& graph,
                                                                  const NodeId& rootId) {
    std::vector<std::vector<NodeId>> layers;
    if (!graph.hasNode(rootId)) {
        return layers;
    }

    ChildrenMap children = buildChildrenMap(graph);

    // BFS from root to assign layers
    std::unordered_map<NodeId, int> nodeLayer;
    std::queue<NodeId> queue;
    nodeLayer[rootId] = 0;
    queue.push(rootId);

    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop();

        int currentLayer = nodeLayer[current];
        if (static_cast<size_t>(currentLayer) >= layers.size()) {
            layers.resize(currentLayer + 1);
        }
        layers[currentLayer].push_back(current);

        auto it = children.find(current);
        if (it == children.end()) continue;

        for (const NodeId& successor : it->second) {
            if (nodeLayer.find(successor) == nodeLayer.end()) {
                nodeLayer[successor] = currentLayer + 1;
                queue.push(successor);
            }
        }
    }

    return layers;
}

LayoutResult HierarchicalLayout::layout(const Graph& graph, const NodeId& rootId) const {
    LayoutResult result;

    if (!graph.hasNode(rootId)) {
        LOG_WARN("Root '{}' is not in the graph, hierarchical layout skipped", rootId);
        return result;
    }

    auto layers = assignLayers(graph, rootId);

    for (size_t depth = 0; depth < layers.size(); ++depth) {
        const auto& ids = layers[depth];
        const double totalHeight = static_cast<double>(ids.size() - 1) * options_.rowSpacing;
        const double x = static_cast<double>(depth) * options_.columnSpacing;

        for (size_t i = 0; i < ids.size(); ++i) {
            const double y = -totalHeight / 2.0 + static_cast<double>(i) * options_.rowSpacing;
            result.setPlacement({ids[i], {x, y}, static_cast<int>(depth), static_cast<int>(i)});
        }
    }

    LOG_DEBUG("Hierarchical layout placed {} nodes in {} layers", result.size(), layers.size());
    return result;
}

Graph hierarchicalLayout(const NodeId& rootId, const Graph& graph,
                         const HierarchicalLayoutOptions& options) {
    return HierarchicalLayout(options).apply(graph, rootId);
}

}  // namespace mindgraph
