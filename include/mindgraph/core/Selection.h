#pragma once

#include "Types.h"

#include <set>

namespace mindgraph {

class Graph;

/// Selected nodes and edges, kept beside the graph rather than on its records.
/// Ordered sets so iteration and serialization are deterministic.
class SelectionState {
public:
    /// Select a node. Without `additive`, everything else is deselected first.
    void selectNode(const NodeId& id, bool additive = false);
    void selectEdge(const EdgeId& id, bool additive = false);

    void deselectNode(const NodeId& id) { nodes_.erase(id); }
    void deselectEdge(const EdgeId& id) { edges_.erase(id); }
    void clear();

    bool isNodeSelected(const NodeId& id) const { return nodes_.count(id) > 0; }
    bool isEdgeSelected(const EdgeId& id) const { return edges_.count(id) > 0; }

    const std::set<NodeId>& nodeIds() const { return nodes_; }
    const std::set<EdgeId>& edgeIds() const { return edges_; }

    bool empty() const { return nodes_.empty() && edges_.empty(); }

    /// Drop ids that no longer exist in the graph
    void retainExisting(const Graph& graph);

    bool operator==(const SelectionState&) const = default;

private:
    std::set<NodeId> nodes_;
    std::set<EdgeId> edges_;
};

}  // namespace mindgraph
