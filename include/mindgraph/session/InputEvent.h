#pragma once

#include "../core/NodeData.h"
#include "../core/Types.h"
#include "../layout/LayoutOptions.h"

#include <optional>
#include <string>
#include <variant>

namespace mindgraph {

/// User intents consumed by BoardSession::dispatch
namespace intent {

/// New unlinked node at a position
struct AddNode {
    Point position;
    std::optional<std::string> label;
};

/// Child of the selected node
struct AddChild {};

/// Sibling of the selected node
struct AddSibling {};

/// Child of the selected node with a given label, not in editing mode
struct AddLinkedNode {
    std::string label;
};

/// Typed node (note, checklist...) attached to the selected node
struct AttachNode {
    NodePayload payload;
    std::string label;
};

struct DeleteSelection {};

struct Connect {
    NodeId source;
    NodeId target;
};

struct ToggleCollapse {
    NodeId nodeId;
};

struct SetFocusRoot {
    NodeId nodeId;
};

struct ClearFocus {};

/// Lay out from the focus root, or from the automatic root without one
struct ApplyLayout {
    std::optional<LayoutKind> kind;   ///< Session default when unset
};

struct ApplyTemplate {
    std::string key;
};

struct Undo {};
struct Redo {};

struct SelectNode {
    NodeId nodeId;
    bool additive = false;
};

struct SelectEdge {
    EdgeId edgeId;
    bool additive = false;
};

struct DeselectAll {};

/// End of a drag
struct MoveNode {
    NodeId nodeId;
    Point position;
};

struct RenameNode {
    NodeId nodeId;
    std::string label;
};

/// Edit the text shown on an edge
struct RenameEdge {
    EdgeId edgeId;
    std::string label;
};

struct DuplicateNode {
    NodeId nodeId;
};

}  // namespace intent

using InputEvent = std::variant<
    intent::AddNode,
    intent::AddChild,
    intent::AddSibling,
    intent::AddLinkedNode,
    intent::AttachNode,
    intent::DeleteSelection,
    intent::Connect,
    intent::ToggleCollapse,
    intent::SetFocusRoot,
    intent::ClearFocus,
    intent::ApplyLayout,
    intent::ApplyTemplate,
    intent::Undo,
    intent::Redo,
    intent::SelectNode,
    intent::SelectEdge,
    intent::DeselectAll,
    intent::MoveNode,
    intent::RenameNode,
    intent::RenameEdge,
    intent::DuplicateNode>;

}  // namespace mindgraph
