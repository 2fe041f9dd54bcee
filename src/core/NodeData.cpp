#include "mindgraph/core/NodeData.h"

namespace mindgraph {

NodePayload makePayload(NodeType type) {
    switch (type) {
        case NodeType::Generic: return GenericPayload{};
        case NodeType::Note: return NotePayload{};
        case NodeType::Checklist: return ChecklistPayload{};
        case NodeType::Kanban: return KanbanPayload{};
        case NodeType::Timeline: return TimelinePayload{};
        case NodeType::Matrix: return MatrixPayload{};
    }
    return GenericPayload{};
}

}  // namespace mindgraph
