#pragma once

#include "../core/Graph.h"
#include "../core/Selection.h"

#include <optional>
#include <string>

namespace mindgraph {

/// Graph plus selection, the unit that is saved and loaded
struct GraphDocument {
    Graph graph;
    SelectionState selection;
};

/// JSON serialization and file I/O for board documents.
///
/// Format:
/// {
///   "version": 1,
///   "nodes": [{"id", "type", "position": {"x", "y"}, "data": {...}, "selected"}],
///   "edges": [{"id", "source", "target", "type", "data": {"label"}, "selected"}]
/// }
///
/// Node and edge order is preserved. Unrecognised keys inside a node's
/// "data" object survive a load/save cycle.
class GraphSerializer {
public:
    /// Serialize a graph and its selection to a JSON string
    static std::string toJson(const Graph& graph, const SelectionState& selection = {});

    static std::string toJson(const GraphDocument& document) {
        return toJson(document.graph, document.selection);
    }

    /// Parse a document.
    /// @param json JSON string to parse
    /// @param out Receives the document, untouched on failure
    /// @return true if parsing succeeded
    static bool fromJson(const std::string& json, GraphDocument& out);

    /// Parse a document, an empty one when the input is malformed
    static GraphDocument loadOrDefault(const std::string& json);

    /// Save a document to file
    /// @return true if save succeeded
    static bool saveToFile(const GraphDocument& document, const std::string& path);

    /// Load a document from file
    /// @return true if load succeeded
    static bool loadFromFile(GraphDocument& out, const std::string& path);

    // Enum <-> string helpers
    static std::string nodeTypeToString(NodeType type);
    static std::optional<NodeType> stringToNodeType(const std::string& str);
    static std::string edgeTypeToString(EdgeType type);
    static std::optional<EdgeType> stringToEdgeType(const std::string& str);
};

}  // namespace mindgraph
