#pragma once

#include "../core/Types.h"

namespace mindgraph {

/// Available layout algorithms
enum class LayoutKind {
    Radial,        ///< Rings around the root, one ring per depth
    Hierarchical   ///< Columns by BFS depth, rows centred on y = 0
};

/// Configuration for RadialLayout
struct RadialLayoutOptions {
    /// Position of the root node
    Point center{0.0, 0.0};

    /// Distance from the root to its children
    double initialRadius = 280.0;

    /// Radius multiplier applied at each deeper level so rings do not overlap
    double radiusGrowth = 1.2;
};

/// Configuration for HierarchicalLayout
struct HierarchicalLayoutOptions {
    /// Horizontal distance between consecutive depths
    double columnSpacing = 280.0;

    /// Vertical distance between nodes of the same depth
    double rowSpacing = 140.0;
};

}  // namespace mindgraph
