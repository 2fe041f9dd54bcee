#include "mindgraph/core/Graph.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace mindgraph {

namespace {

void checkUniqueIds(const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
    std::unordered_set<NodeId> nodeIds;
    for (const auto& node : nodes) {
        if (node.id.empty() || !nodeIds.insert(node.id).second) {
            throw std::invalid_argument("Duplicate or empty node ID: '" + node.id + "'");
        }
    }
    std::unordered_set<EdgeId> edgeIds;
    for (const auto& edge : edges) {
        if (edge.id.empty() || !edgeIds.insert(edge.id).second) {
            throw std::invalid_argument("Duplicate or empty edge ID: '" + edge.id + "'");
        }
    }
}

}  // namespace

Graph::Graph(std::vector<Node> nodes, std::vector<Edge> edges) {
    replaceAll(std::move(nodes), std::move(edges));
}

const Node& Graph::addNode(Node node) {
    if (node.id.empty() || hasNode(node.id)) {
        throw std::invalid_argument("Duplicate or empty node ID: '" + node.id + "'");
    }

    nodeIndex_[node.id] = nodes_.size();
    nodes_.push_back(std::move(node));

    onGraphModified();
    return nodes_.back();
}

bool Graph::removeNode(const NodeId& id) {
    if (!hasNode(id)) return false;

    // Remove all edges connected to this node
    edges_.erase(std::remove_if(edges_.begin(), edges_.end(),
                                [&id](const Edge& e) { return e.source == id || e.target == id; }),
                 edges_.end());
    nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(nodeIndex_.at(id)));

    rebuildIndex();
    onGraphModified();
    return true;
}

bool Graph::hasNode(const NodeId& id) const {
    return nodeIndex_.count(id) > 0;
}

const Node& Graph::getNode(const NodeId& id) const {
    const Node* node = findNode(id);
    if (!node) {
        throw std::out_of_range("Invalid node ID: " + id);
    }
    return *node;
}

const Node* Graph::findNode(const NodeId& id) const {
    auto it = nodeIndex_.find(id);
    return it != nodeIndex_.end() ? &nodes_[it->second] : nullptr;
}

std::optional<Node> Graph::tryGetNode(const NodeId& id) const {
    const Node* node = findNode(id);
    if (!node) {
        return std::nullopt;
    }
    return *node;
}

Node* Graph::mutableNode(const NodeId& id) {
    auto it = nodeIndex_.find(id);
    return it != nodeIndex_.end() ? &nodes_[it->second] : nullptr;
}

bool Graph::setNodePosition(const NodeId& id, Point position) {
    Node* node = mutableNode(id);
    if (!node) return false;
    node->position = position;
    onGraphModified();
    return true;
}

bool Graph::setNodeLabel(const NodeId& id, const std::string& label) {
    Node* node = mutableNode(id);
    if (!node) return false;
    node->data.label = label;
    onGraphModified();
    return true;
}

bool Graph::setNodeCollapsed(const NodeId& id, bool collapsed) {
    Node* node = mutableNode(id);
    if (!node) return false;
    node->data.collapsed = collapsed;
    onGraphModified();
    return true;
}

bool Graph::setNodeData(const NodeId& id, NodeData data) {
    Node* node = mutableNode(id);
    if (!node) return false;
    node->data = std::move(data);
    onGraphModified();
    return true;
}

const Edge& Graph::addEdge(Edge edge) {
    if (edge.id.empty() || hasEdge(edge.id)) {
        throw std::invalid_argument("Duplicate or empty edge ID: '" + edge.id + "'");
    }

    edgeIndex_[edge.id] = edges_.size();
    edges_.push_back(std::move(edge));

    onGraphModified();
    return edges_.back();
}

bool Graph::removeEdge(const EdgeId& id) {
    auto it = edgeIndex_.find(id);
    if (it == edgeIndex_.end()) return false;

    edges_.erase(edges_.begin() + static_cast<std::ptrdiff_t>(it->second));

    rebuildIndex();
    onGraphModified();
    return true;
}

bool Graph::hasEdge(const EdgeId& id) const {
    return edgeIndex_.count(id) > 0;
}

const Edge& Graph::getEdge(const EdgeId& id) const {
    const Edge* edge = findEdge(id);
    if (!edge) {
        throw std::out_of_range("Invalid edge ID: " + id);
    }
    return *edge;
}

const Edge* Graph::findEdge(const EdgeId& id) const {
    auto it = edgeIndex_.find(id);
    return it != edgeIndex_.end() ? &edges_[it->second] : nullptr;
}

Edge* Graph::mutableEdge(const EdgeId& id) {
    auto it = edgeIndex_.find(id);
    return it != edgeIndex_.end() ? &edges_[it->second] : nullptr;
}

bool Graph::setEdgeLabel(const EdgeId& id, const std::string& label) {
    Edge* edge = mutableEdge(id);
    if (!edge) return false;
    edge->label = label;
    edge->type = EdgeType::Labeled;
    onGraphModified();
    return true;
}

std::optional<Edge> Graph::tryGetEdge(const EdgeId& id) const {
    const Edge* edge = findEdge(id);
    if (!edge) {
        return std::nullopt;
    }
    return *edge;
}

const Edge* Graph::findEdgeBetween(const NodeId& source, const NodeId& target) const {
    for (const auto& edge : edges_) {
        if (edge.source == source && edge.target == target) {
            return &edge;
        }
    }
    return nullptr;
}

bool Graph::isDangling(const Edge& edge) const {
    return !hasNode(edge.source) || !hasNode(edge.target);
}

std::vector<NodeId> Graph::children(const NodeId& id) const {
    std::vector<NodeId> result;
    if (!hasNode(id)) return result;

    for (const auto& edge : edges_) {
        if (edge.source == id && hasNode(edge.target)) {
            result.push_back(edge.target);
        }
    }
    return result;
}

std::vector<NodeId> Graph::parents(const NodeId& id) const {
    std::vector<NodeId> result;
    if (!hasNode(id)) return result;

    for (const auto& edge : edges_) {
        if (edge.target == id && hasNode(edge.source)) {
            result.push_back(edge.source);
        }
    }
    return result;
}

size_t Graph::incomingCount(const NodeId& id) const {
    return parents(id).size();
}

std::vector<EdgeId> Graph::connectedEdges(const NodeId& id) const {
    std::vector<EdgeId> result;
    for (const auto& edge : edges_) {
        if (edge.source == id || edge.target == id) {
            result.push_back(edge.id);
        }
    }
    return result;
}

void Graph::replaceAll(std::vector<Node> nodes, std::vector<Edge> edges) {
    checkUniqueIds(nodes, edges);

    nodes_ = std::move(nodes);
    edges_ = std::move(edges);
    rebuildIndex();

    onGraphModified();
}

void Graph::clear() {
    nodes_.clear();
    edges_.clear();
    nodeIndex_.clear();
    edgeIndex_.clear();

    onGraphModified();
}

void Graph::rebuildIndex() {
    nodeIndex_.clear();
    nodeIndex_.reserve(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i) {
        nodeIndex_[nodes_[i].id] = i;
    }

    edgeIndex_.clear();
    edgeIndex_.reserve(edges_.size());
    for (size_t i = 0; i < edges_.size(); ++i) {
        edgeIndex_[edges_[i].id] = i;
    }
}

}  // namespace mindgraph
