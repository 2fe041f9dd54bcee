#include "mindgraph/layout/LayoutRoot.h"

namespace mindgraph {

std::optional<NodeId> selectLayoutRoot(const Graph& graph) {
    if (graph.empty()) {
        return std::nullopt;
    }

    for (const auto& node : graph.nodes()) {
        if (graph.incomingCount(node.id) == 0) {
            return node.id;
        }
    }

    return graph.nodes().front().id;
}

}  // namespace mindgraph
