#include "mindgraph/layout/RadialLayout.h"
#include "mindgraph/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace mindgraph {

LayoutResult RadialLayout::layout(const Graph& graph, const NodeId& rootId) const {
    LayoutResult result;

    if (!graph.hasNode(rootId)) {
        LOG_WARN("Root '{}' is not in the graph, radial layout skipped", rootId);
        return result;
    }

    ChildrenMap children = buildChildrenMap(graph);

    result.setPlacement({rootId, options_.center, 0, 0});
    placeChildren(rootId, options_.center, options_.initialRadius, 1, children, result);

    LOG_DEBUG("Radial layout placed {} of {} nodes", result.size(), graph.nodeCount());
    return result;
}

void RadialLayout::placeChildren(const NodeId& parent,
                                 Point parentPosition,
                                 double radius,
                                 int depth,
                                 const ChildrenMap& children,
                                 LayoutResult& result) const {
    auto it = children.find(parent);
    if (it == children.end()) return;

    // Children not placed yet, duplicates removed, edge order kept
    std::vector<NodeId> kids;
    for (const NodeId& child : it->second) {
        if (!result.hasPlacement(child) &&
            std::find(kids.begin(), kids.end(), child) == kids.end()) {
            kids.push_back(child);
        }
    }

    const double angleStep = (2.0 * std::numbers::pi) / static_cast<double>(std::max<size_t>(kids.size(), 1));

    for (size_t i = 0; i < kids.size(); ++i) {
        // An earlier sibling's subtree may already have reached this node
        if (result.hasPlacement(kids[i])) continue;

        const double angle = static_cast<double>(i) * angleStep;
        Point position{parentPosition.x + std::cos(angle) * radius,
                       parentPosition.y + std::sin(angle) * radius};

        result.setPlacement({kids[i], position, depth, static_cast<int>(i)});
        placeChildren(kids[i], position, radius * options_.radiusGrowth, depth + 1, children, result);
    }
}

Graph radialLayout(const NodeId& rootId, const Graph& graph, const RadialLayoutOptions& options) {
    return RadialLayout(options).apply(graph, rootId);
}

}  // namespace mindgraph
