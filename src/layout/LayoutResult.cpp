#include "mindgraph/layout/LayoutResult.h"

#include <algorithm>

namespace mindgraph {

void LayoutResult::setPlacement(NodePlacement placement) {
    auto it = index_.find(placement.id);
    if (it != index_.end()) {
        placements_[it->second] = std::move(placement);
        return;
    }
    index_[placement.id] = placements_.size();
    placements_.push_back(std::move(placement));
}

const NodePlacement* LayoutResult::getPlacement(const NodeId& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &placements_[it->second] : nullptr;
}

int LayoutResult::layerCount() const {
    int maxDepth = -1;
    for (const auto& placement : placements_) {
        maxDepth = std::max(maxDepth, placement.depth);
    }
    return maxDepth + 1;
}

Graph LayoutResult::applyTo(const Graph& graph) const {
    Graph result = graph;
    for (const auto& placement : placements_) {
        result.setNodePosition(placement.id, placement.position);
    }
    return result;
}

}  // namespace mindgraph
