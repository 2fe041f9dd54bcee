#include "mindgraph/core/GraphStore.h"
#include "mindgraph/common/Logger.h"

namespace mindgraph {

namespace {

constexpr int DUPLICATE_SUFFIX_MAX = 999999;

// Placement offsets relative to the selected node
constexpr Point CHILD_OFFSET{200.0, 120.0};
constexpr Point SIBLING_OFFSET{220.0, 0.0};
constexpr Point ATTACH_OFFSET{220.0, 40.0};
constexpr Point DUPLICATE_OFFSET{40.0, 40.0};

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

}  // namespace

// =============================================================================
// Core primitives
// =============================================================================

Node GraphStore::addNode(const NodeDraft& draft) {
    Node node;
    node.id = freshNodeId();
    node.position = draft.position;
    node.data.label = draft.label.value_or(DEFAULT_NODE_LABEL);
    node.data.editing = draft.editing;
    node.data.color = draft.color;
    node.data.shape = draft.shape;
    node.data.fontSize = draft.fontSize;
    node.data.payload = draft.payload;

    graph_.addNode(node);
    selection_.selectNode(node.id);

    LOG_DEBUG("Added node {} ({} nodes)", node.id, graph_.nodeCount());
    return node;
}

Edge GraphStore::addEdge(const NodeId& source, const NodeId& target, EdgeType type) {
    Edge edge;
    edge.id = freshEdgeId();
    edge.source = source;
    edge.target = target;
    edge.type = type;

    graph_.addEdge(edge);
    return edge;
}

bool GraphStore::deleteSelected() {
    if (selection_.empty()) {
        return false;
    }

    const auto& removedNodes = selection_.nodeIds();

    std::vector<Node> keptNodes;
    keptNodes.reserve(graph_.nodeCount());
    for (const auto& node : graph_.nodes()) {
        if (removedNodes.count(node.id) == 0) {
            keptNodes.push_back(node);
        }
    }

    std::vector<Edge> keptEdges;
    keptEdges.reserve(graph_.edgeCount());
    for (const auto& edge : graph_.edges()) {
        bool touchesRemoved = removedNodes.count(edge.source) > 0 ||
                              removedNodes.count(edge.target) > 0;
        if (!selection_.isEdgeSelected(edge.id) && !touchesRemoved) {
            keptEdges.push_back(edge);
        }
    }

    size_t nodesRemoved = graph_.nodeCount() - keptNodes.size();
    size_t edgesRemoved = graph_.edgeCount() - keptEdges.size();

    // Both sequences are swapped in together
    graph_.replaceAll(std::move(keptNodes), std::move(keptEdges));
    selection_.clear();

    LOG_DEBUG("Deleted {} nodes and {} edges", nodesRemoved, edgesRemoved);
    return true;
}

void GraphStore::replaceAll(Graph graph, SelectionState selection) {
    graph_ = std::move(graph);
    graph_.markDirty();
    selection_ = std::move(selection);
    selection_.retainExisting(graph_);
}

void GraphStore::replaceAll(std::vector<Node> nodes, std::vector<Edge> edges) {
    graph_.replaceAll(std::move(nodes), std::move(edges));
    selection_.retainExisting(graph_);
}

void GraphStore::insertSubgraph(std::vector<Node> nodes, std::vector<Edge> edges) {
    std::vector<Node> mergedNodes = graph_.nodes();
    std::vector<Edge> mergedEdges = graph_.edges();

    SelectionState inserted;
    for (auto& node : nodes) {
        inserted.selectNode(node.id, true);
        mergedNodes.push_back(std::move(node));
    }
    for (auto& edge : edges) {
        mergedEdges.push_back(std::move(edge));
    }

    graph_.replaceAll(std::move(mergedNodes), std::move(mergedEdges));
    selection_ = std::move(inserted);
}

// =============================================================================
// Editing
// =============================================================================

const Node* GraphStore::selectedNode() const {
    for (const auto& node : graph_.nodes()) {
        if (selection_.isNodeSelected(node.id)) {
            return &node;
        }
    }
    return nullptr;
}

std::optional<Node> GraphStore::addChild() {
    const Node* parent = selectedNode();
    if (!parent) return std::nullopt;

    NodeId parentId = parent->id;
    NodeDraft draft;
    draft.position = parent->position + CHILD_OFFSET;

    Node child = addNode(draft);
    addEdge(parentId, child.id, EdgeType::SmoothStep);
    return child;
}

std::optional<Node> GraphStore::addSibling() {
    const Node* current = selectedNode();
    if (!current) return std::nullopt;

    std::vector<NodeId> parents = graph_.parents(current->id);
    NodeDraft draft;
    draft.position = current->position + SIBLING_OFFSET;

    Node sibling = addNode(draft);
    if (!parents.empty()) {
        addEdge(parents.front(), sibling.id, EdgeType::SmoothStep);
    }
    return sibling;
}

std::optional<Node> GraphStore::addLinkedNode(const std::string& label) {
    const Node* parent = selectedNode();
    if (!parent) return std::nullopt;

    NodeId parentId = parent->id;
    NodeDraft draft;
    draft.position = parent->position + CHILD_OFFSET;
    draft.label = label;
    draft.editing = false;

    Node child = addNode(draft);
    addEdge(parentId, child.id, EdgeType::SmoothStep);
    return child;
}

std::optional<Node> GraphStore::attachNode(NodePayload payload, const std::string& label) {
    const Node* parent = selectedNode();
    if (!parent) return std::nullopt;

    NodeId parentId = parent->id;
    NodeDraft draft;
    draft.position = parent->position + ATTACH_OFFSET;
    draft.payload = std::move(payload);
    if (!label.empty()) {
        draft.label = label;
    }

    Node attached = addNode(draft);
    addEdge(parentId, attached.id, EdgeType::SmoothStep);
    return attached;
}

std::optional<Node> GraphStore::duplicateNode(const NodeId& id) {
    const Node* original = graph_.findNode(id);
    if (!original) return std::nullopt;

    Node copy = *original;
    do {
        copy.id = original->id + "-copy-" + std::to_string(ids_.randomInt(DUPLICATE_SUFFIX_MAX));
    } while (graph_.hasNode(copy.id));
    copy.position = original->position + DUPLICATE_OFFSET;

    graph_.addNode(copy);
    return copy;
}

std::optional<Edge> GraphStore::connect(const NodeId& source, const NodeId& target) {
    if (graph_.findEdgeBetween(source, target)) {
        LOG_DEBUG("Connection {} -> {} already exists", source, target);
        return std::nullopt;
    }
    Edge edge;
    edge.id = freshEdgeId();
    edge.source = source;
    edge.target = target;
    edge.type = EdgeType::Labeled;
    edge.label = "";
    return graph_.addEdge(std::move(edge));
}

bool GraphStore::moveNode(const NodeId& id, Point position) {
    return graph_.setNodePosition(id, position);
}

bool GraphStore::setLabel(const NodeId& id, const std::string& label) {
    return graph_.setNodeLabel(id, label);
}

bool GraphStore::setEdgeLabel(const EdgeId& id, const std::string& label) {
    return graph_.setEdgeLabel(id, label);
}

std::optional<bool> GraphStore::toggleCollapsed(const NodeId& id) {
    const Node* node = graph_.findNode(id);
    if (!node) return std::nullopt;

    bool collapsed = !node->data.collapsed;
    graph_.setNodeCollapsed(id, collapsed);
    return collapsed;
}

bool GraphStore::selectNode(const NodeId& id, bool additive) {
    if (!graph_.hasNode(id)) return false;
    selection_.selectNode(id, additive);
    return true;
}

bool GraphStore::selectEdge(const EdgeId& id, bool additive) {
    if (!graph_.hasEdge(id)) return false;
    selection_.selectEdge(id, additive);
    return true;
}

const Node* GraphStore::findNodeByLabel(const std::string& title) const {
    std::string wanted = trim(title);
    for (const auto& node : graph_.nodes()) {
        if (trim(node.data.label) == wanted) {
            return &node;
        }
    }
    return nullptr;
}

void GraphStore::applyPositions(const Graph& laidOut) {
    for (const auto& node : laidOut.nodes()) {
        const Node* current = graph_.findNode(node.id);
        if (current && current->position != node.position) {
            graph_.setNodePosition(node.id, node.position);
        }
    }
}

NodeId GraphStore::freshNodeId() {
    return ids_.next("n", [this](const std::string& id) { return graph_.hasNode(id); });
}

EdgeId GraphStore::freshEdgeId() {
    return ids_.next("e", [this](const std::string& id) { return graph_.hasEdge(id); });
}

}  // namespace mindgraph
