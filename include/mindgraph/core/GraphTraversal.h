#pragma once

#include "Graph.h"

#include <unordered_map>
#include <vector>

namespace mindgraph {

/// source -> targets, in edge order, dangling edges excluded
using ChildrenMap = std::unordered_map<NodeId, std::vector<NodeId>>;

ChildrenMap buildChildrenMap(const Graph& graph);

/// Breadth-first walk over outgoing edges, root first.
/// Each node appears once even when the graph has cycles.
/// A root that is not in the graph yields an empty result.
std::vector<NodeId> subtree(const Graph& graph, const NodeId& root);
std::vector<NodeId> subtree(const Graph& graph, const ChildrenMap& children, const NodeId& root);

/// subtree() without the root itself
std::vector<NodeId> descendants(const Graph& graph, const NodeId& root);

}  // namespace mindgraph
