#pragma once

#include "../core/Graph.h"

#include <optional>
#include <unordered_set>
#include <vector>

namespace mindgraph {

/// Nodes and edges currently shown on the canvas.
/// Ids are kept in graph order; membership checks are O(1).
class VisibleView {
public:
    void addNode(const NodeId& id);
    void addEdge(const EdgeId& id);

    const std::vector<NodeId>& nodeIds() const { return nodeIds_; }
    const std::vector<EdgeId>& edgeIds() const { return edgeIds_; }

    bool isNodeVisible(const NodeId& id) const { return nodeSet_.count(id) > 0; }
    bool isEdgeVisible(const EdgeId& id) const { return edgeSet_.count(id) > 0; }

    size_t nodeCount() const { return nodeIds_.size(); }
    size_t edgeCount() const { return edgeIds_.size(); }

    bool operator==(const VisibleView& other) const {
        return nodeIds_ == other.nodeIds_ && edgeIds_ == other.edgeIds_;
    }
    bool operator!=(const VisibleView& other) const { return !(*this == other); }

private:
    std::vector<NodeId> nodeIds_;
    std::vector<EdgeId> edgeIds_;
    std::unordered_set<NodeId> nodeSet_;
    std::unordered_set<EdgeId> edgeSet_;
};

/// Derives the visible view from collapsed flags and an optional focus root.
///
/// Rules, applied together:
/// - a collapsed node stays visible but hides everything reachable from it;
/// - with a focus root, only the focus root's subtree is visible;
/// - an edge is visible exactly when both its endpoints are.
///
/// The view is recomputed from scratch on every call and never cached, so
/// resolving the same inputs twice gives equal views.
class VisibilityResolver {
public:
    /// Resolve with an explicit collapsed set.
    /// A focus root that is not in the graph is ignored.
    static VisibleView resolve(const Graph& graph,
                               const std::unordered_set<NodeId>& collapsed,
                               const std::optional<NodeId>& focusRoot = std::nullopt);

    /// Resolve using the nodes' own `collapsed` flags
    static VisibleView resolve(const Graph& graph,
                               const std::optional<NodeId>& focusRoot = std::nullopt);

    /// Ids of nodes whose `collapsed` flag is set
    static std::unordered_set<NodeId> collapsedNodes(const Graph& graph);
};

}  // namespace mindgraph
