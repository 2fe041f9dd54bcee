#pragma once

#include "ILayout.h"
#include "LayoutOptions.h"

#include <vector>

namespace mindgraph {

/// Layered layout by breadth-first depth from the root.
///
/// Depth d goes to x = d * columnSpacing. Within a depth, nodes are stacked
/// in BFS discovery order (which follows edge order) and centred on y = 0:
/// y = -(n - 1) * rowSpacing / 2 + i * rowSpacing.
class HierarchicalLayout : public ILayout {
public:
    HierarchicalLayout() = default;
    explicit HierarchicalLayout(const HierarchicalLayoutOptions& options) : options_(options) {}

    void setOptions(const HierarchicalLayoutOptions& options) { options_ = options; }
    const HierarchicalLayoutOptions& options() const { return options_; }

    const char* algorithmName() const override { return "Hierarchical"; }

    LayoutResult layout(const Graph& graph, const NodeId& rootId) const override;

    /// BFS layers from the root; layers[d] holds the nodes at depth d
    static std::vector<std::vector<NodeId>> assignLayers(const Graph& graph, const NodeId& rootId);

private:
    HierarchicalLayoutOptions options_;
};

/// Free-function form: new graph with hierarchical positions
Graph hierarchicalLayout(const NodeId& rootId, const Graph& graph,
                         const HierarchicalLayoutOptions& options = {});

}  // namespace mindgraph
