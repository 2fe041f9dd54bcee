#pragma once

#include "../core/Graph.h"
#include "LayoutResult.h"

namespace mindgraph {

/// Abstract interface for layout algorithms
///
/// Implementations are stateless apart from their options: the graph comes in
/// as a parameter and a new result goes out, so the same input always gives
/// the same positions.
class ILayout {
public:
    virtual ~ILayout() = default;

    /// Algorithm name for logging
    virtual const char* algorithmName() const = 0;

    /// Compute positions for the nodes reachable from `rootId`.
    /// A root that is not in the graph yields an empty result.
    virtual LayoutResult layout(const Graph& graph, const NodeId& rootId) const = 0;

    /// Layout and write positions into a copy of the graph.
    /// Returns the graph unchanged when the root is unknown.
    Graph apply(const Graph& graph, const NodeId& rootId) const {
        return layout(graph, rootId).applyTo(graph);
    }
};

}  // namespace mindgraph
