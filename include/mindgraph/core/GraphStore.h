#pragma once

#include "Graph.h"
#include "IdGenerator.h"
#include "Selection.h"

#include <optional>
#include <string>
#include <vector>

namespace mindgraph {

/// Fields a caller may set when creating a node; the store assigns the id
struct NodeDraft {
    Point position;
    std::optional<std::string> label;   ///< "New Node" when unset
    NodePayload payload;                ///< Generic by default
    std::optional<std::string> color;
    std::optional<std::string> shape;
    std::optional<double> fontSize;
    bool editing = true;
};

/// Canonical graph of one board plus its selection.
///
/// Every user-level mutation goes through here. The store never records
/// history or persists; BoardSession does that after each mutation.
class GraphStore {
public:
    GraphStore() = default;
    explicit GraphStore(IdGenerator ids) : ids_(std::move(ids)) {}

    const Graph& graph() const { return graph_; }
    const SelectionState& selection() const { return selection_; }
    IdGenerator& ids() { return ids_; }

    // === Core primitives ===

    /// Create a node with a fresh id. It becomes the only selected node.
    Node addNode(const NodeDraft& draft);

    /// Append an edge with a fresh id. Endpoints are not validated.
    Edge addEdge(const NodeId& source, const NodeId& target, EdgeType type = EdgeType::Plain);

    /// Remove every selected node, every selected edge and every edge that
    /// touches a removed node, in one step.
    /// @return false if nothing was selected
    bool deleteSelected();

    /// Replace the whole graph (import, template replace, undo/redo).
    /// Selection ids that do not exist in the new graph are dropped.
    void replaceAll(Graph graph, SelectionState selection = {});

    /// Throws std::invalid_argument on duplicate ids, store unchanged.
    void replaceAll(std::vector<Node> nodes, std::vector<Edge> edges);

    /// Append nodes and edges built elsewhere (template instantiation).
    /// The inserted nodes become the selection. Throws std::invalid_argument on id collisions,
    /// store unchanged.
    void insertSubgraph(std::vector<Node> nodes, std::vector<Edge> edges);

    // === Editing ===

    /// First selected node in graph order
    const Node* selectedNode() const;

    /// New node below-right of the selected node, linked from it
    std::optional<Node> addChild();

    /// New node beside the selected node, linked from the selected node's
    /// first parent when it has one
    std::optional<Node> addSibling();

    /// New child of the selected node carrying the given label
    std::optional<Node> addLinkedNode(const std::string& label);

    /// New child of the selected node with a typed payload (note, checklist...)
    std::optional<Node> attachNode(NodePayload payload, const std::string& label = "");

    /// Copy of a node offset by (40, 40); the copy is not selected
    std::optional<Node> duplicateNode(const NodeId& id);

    /// Labeled edge source -> target with an empty label, unless the same
    /// connection already exists
    std::optional<Edge> connect(const NodeId& source, const NodeId& target);

    bool moveNode(const NodeId& id, Point position);
    bool setLabel(const NodeId& id, const std::string& label);

    /// Set an edge's label; the edge becomes Labeled
    bool setEdgeLabel(const EdgeId& id, const std::string& label);

    /// Flip the collapsed flag. @return the new state, nullopt for unknown ids
    std::optional<bool> toggleCollapsed(const NodeId& id);

    bool selectNode(const NodeId& id, bool additive = false);
    bool selectEdge(const EdgeId& id, bool additive = false);
    void deselectAll() { selection_.clear(); }

    /// Node whose trimmed label equals the trimmed title
    const Node* findNodeByLabel(const std::string& title) const;

    /// Overwrite positions only (layout write-back)
    void applyPositions(const Graph& laidOut);

private:
    NodeId freshNodeId();
    EdgeId freshEdgeId();

    Graph graph_;
    SelectionState selection_;
    IdGenerator ids_;
};

}  // namespace mindgraph
