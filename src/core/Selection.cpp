#include "mindgraph/core/Selection.h"
#include "mindgraph/core/Graph.h"

namespace mindgraph {

void SelectionState::selectNode(const NodeId& id, bool additive) {
    if (!additive) {
        clear();
    }
    nodes_.insert(id);
}

void SelectionState::selectEdge(const EdgeId& id, bool additive) {
    if (!additive) {
        clear();
    }
    edges_.insert(id);
}

void SelectionState::clear() {
    nodes_.clear();
    edges_.clear();
}

void SelectionState::retainExisting(const Graph& graph) {
    std::erase_if(nodes_, [&graph](const NodeId& id) { return !graph.hasNode(id); });
    std::erase_if(edges_, [&graph](const EdgeId& id) { return !graph.hasEdge(id); });
}

}  // namespace mindgraph
