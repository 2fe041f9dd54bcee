#pragma once

#include "../core/GraphTraversal.h"
#include "ILayout.h"
#include "LayoutOptions.h"

namespace mindgraph {

/// Places the root at the centre and each node's children evenly on a circle
/// around that node.
///
/// Children follow edge order; child i sits at angle i * 2π / childCount.
/// The radius grows by `radiusGrowth` per depth level. Traversal is depth
/// first and places each node once, so cycles terminate and a node reachable
/// along several paths keeps its first placement.
class RadialLayout : public ILayout {
public:
    RadialLayout() = default;
    explicit RadialLayout(const RadialLayoutOptions& options) : options_(options) {}

    void setOptions(const RadialLayoutOptions& options) { options_ = options; }
    const RadialLayoutOptions& options() const { return options_; }

    const char* algorithmName() const override { return "Radial"; }

    LayoutResult layout(const Graph& graph, const NodeId& rootId) const override;

private:
    void placeChildren(const NodeId& parent,
                       Point parentPosition,
                       double radius,
                       int depth,
                       const ChildrenMap& children,
                       LayoutResult& result) const;

    RadialLayoutOptions options_;
};

/// Free-function form: new graph with radial positions
Graph radialLayout(const NodeId& rootId, const Graph& graph,
                   const RadialLayoutOptions& options = {});

}  // namespace mindgraph
