#pragma once

#include "NodeData.h"
#include "Types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mindgraph {

/// Ordered node/edge storage backing one board.
///
/// Nodes and edges keep their insertion order; layouts rely on edge order for
/// child ordering. Edges are not required to reference existing nodes:
/// a dangling edge is stored but skipped by every traversal (children(),
/// parents(), incomingCount()).
///
/// Graph has value semantics. Copying a graph deep-copies all nodes and edges,
/// which is what history snapshots rely on.
class Graph {
public:
    Graph() = default;

    /// Build from sequences. Throws std::invalid_argument on duplicate ids.
    Graph(std::vector<Node> nodes, std::vector<Edge> edges);

    // Node operations

    /// Append a node. Throws std::invalid_argument if the id is empty or taken.
    const Node& addNode(Node node);

    /// Remove a node and every edge that references it.
    /// @return false if the node did not exist
    bool removeNode(const NodeId& id);

    bool hasNode(const NodeId& id) const;

    // Node access API:
    // - getNode(): throws std::out_of_range for unknown ids.
    //   The reference is invalidated by any structural modification.
    // - findNode(): nullptr for unknown ids, same invalidation rule.
    // - tryGetNode(): copy, safe across modifications.
    const Node& getNode(const NodeId& id) const;
    const Node* findNode(const NodeId& id) const;
    std::optional<Node> tryGetNode(const NodeId& id) const;

    bool setNodePosition(const NodeId& id, Point position);
    bool setNodeLabel(const NodeId& id, const std::string& label);
    bool setNodeCollapsed(const NodeId& id, bool collapsed);
    bool setNodeData(const NodeId& id, NodeData data);

    // Edge operations

    /// Append an edge. Endpoints are not validated.
    /// Throws std::invalid_argument if the id is empty or taken.
    const Edge& addEdge(Edge edge);

    bool removeEdge(const EdgeId& id);
    bool hasEdge(const EdgeId& id) const;

    const Edge& getEdge(const EdgeId& id) const;
    const Edge* findEdge(const EdgeId& id) const;
    std::optional<Edge> tryGetEdge(const EdgeId& id) const;

    bool setEdgeLabel(const EdgeId& id, const std::string& label);

    /// First edge from source to target, if any
    const Edge* findEdgeBetween(const NodeId& source, const NodeId& target) const;

    // Queries
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }

    /// True if either endpoint is missing from the graph
    bool isDangling(const Edge& edge) const;

    /// Targets of outgoing edges in edge order (dangling edges skipped)
    std::vector<NodeId> children(const NodeId& id) const;

    /// Sources of incoming edges in edge order (dangling edges skipped)
    std::vector<NodeId> parents(const NodeId& id) const;

    size_t incomingCount(const NodeId& id) const;

    /// Ids of every edge whose source or target is the node (dangling included)
    std::vector<EdgeId> connectedEdges(const NodeId& id) const;

    /// Swap in new contents. Throws std::invalid_argument on duplicate ids,
    /// leaving the graph unchanged.
    void replaceAll(std::vector<Node> nodes, std::vector<Edge> edges);

    void clear();

    // Dirty tracking for recomputation
    bool isDirty() const { return dirty_; }
    void markDirty() { dirty_ = true; ++version_; }
    void markClean() { dirty_ = false; }
    uint64_t version() const { return version_; }

    /// Content equality (nodes and edges in order). Version is ignored.
    bool operator==(const Graph& other) const {
        return nodes_ == other.nodes_ && edges_ == other.edges_;
    }
    bool operator!=(const Graph& other) const { return !(*this == other); }

private:
    void onGraphModified() { markDirty(); }
    void rebuildIndex();
    Node* mutableNode(const NodeId& id);
    Edge* mutableEdge(const EdgeId& id);

    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<NodeId, size_t> nodeIndex_;
    std::unordered_map<EdgeId, size_t> edgeIndex_;

    // Dirty tracking
    bool dirty_ = false;
    uint64_t version_ = 0;
};

}  // namespace mindgraph
