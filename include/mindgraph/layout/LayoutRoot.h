#pragma once

#include "../core/Graph.h"

#include <optional>

namespace mindgraph {

/// Root used when no focus root is set.
///
/// The first node in sequence order with no incoming edge (dangling edges do
/// not count). A graph where every node has a parent, such as a pure cycle,
/// falls back to the first node. An empty graph has no root.
std::optional<NodeId> selectLayoutRoot(const Graph& graph);

}  // namespace mindgraph
