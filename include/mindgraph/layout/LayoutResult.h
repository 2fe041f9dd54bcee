#pragma once

#include "../core/Graph.h"
#include "../core/Types.h"

#include <unordered_map>
#include <vector>

namespace mindgraph {

/// Position computed for one node
struct NodePlacement {
    NodeId id;
    Point position;
    int depth = 0;   ///< Distance from the layout root in edges
    int order = 0;   ///< Index among siblings (radial) or within the layer (hierarchical)
};

/// Output of a layout algorithm. Only nodes reached from the root appear here;
/// every other node keeps its current position when the result is applied.
class LayoutResult {
public:
    /// Add or overwrite the placement of a node
    void setPlacement(NodePlacement placement);

    bool hasPlacement(const NodeId& id) const { return index_.count(id) > 0; }
    const NodePlacement* getPlacement(const NodeId& id) const;

    /// Placements in the order they were computed
    const std::vector<NodePlacement>& placements() const { return placements_; }

    size_t size() const { return placements_.size(); }
    bool empty() const { return placements_.empty(); }

    /// Highest depth + 1, 0 when empty
    int layerCount() const;

    /// Copy of `graph` with placed nodes moved. Ids, order and every other
    /// field are untouched.
    Graph applyTo(const Graph& graph) const;

private:
    std::vector<NodePlacement> placements_;
    std::unordered_map<NodeId, size_t> index_;
};

}  // namespace mindgraph
