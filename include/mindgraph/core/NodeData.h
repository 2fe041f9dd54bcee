#pragma once

#include "Types.h"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mindgraph {

enum class Priority {
    Low,
    Medium,
    High
};

// --- Checklist ---

struct ChecklistItem {
    std::string id;
    std::string text;
    bool done = false;

    bool operator==(const ChecklistItem&) const = default;
};

// --- Kanban ---

struct KanbanItem {
    std::string id;
    std::string title;
    std::optional<Priority> priority;
    std::optional<std::string> assignee;

    bool operator==(const KanbanItem&) const = default;
};

struct KanbanColumn {
    std::string id;
    std::string title;
    std::vector<KanbanItem> items;

    bool operator==(const KanbanColumn&) const = default;
};

// --- Timeline ---

enum class TimelineEventKind {
    Milestone,
    Task,
    Deadline
};

enum class TimelineStatus {
    Pending,
    InProgress,
    Completed
};

struct TimelineEvent {
    std::string id;
    std::string title;
    std::string date;
    std::optional<std::string> description;
    TimelineEventKind kind = TimelineEventKind::Task;
    std::optional<TimelineStatus> status;
    std::optional<std::string> assignee;

    bool operator==(const TimelineEvent&) const = default;
};

// --- Matrix ---

struct MatrixCell {
    std::string id;
    std::string content;
    std::optional<Priority> priority;
    std::optional<std::string> category;

    bool operator==(const MatrixCell&) const = default;
};

struct MatrixData {
    std::string title;
    std::vector<std::string> rows;
    std::vector<std::string> columns;
    std::vector<std::vector<MatrixCell>> cells;

    bool operator==(const MatrixData&) const = default;
};

// --- Per-type payloads ---

struct GenericPayload {
    bool operator==(const GenericPayload&) const = default;
};

struct NotePayload {
    std::string text;
    bool operator==(const NotePayload&) const = default;
};

struct ChecklistPayload {
    std::vector<ChecklistItem> items;
    bool operator==(const ChecklistPayload&) const = default;
};

struct KanbanPayload {
    std::vector<KanbanColumn> columns;
    bool operator==(const KanbanPayload&) const = default;
};

struct TimelinePayload {
    std::vector<TimelineEvent> events;
    bool operator==(const TimelinePayload&) const = default;
};

struct MatrixPayload {
    MatrixData matrix;
    bool operator==(const MatrixPayload&) const = default;
};

/// Type-specific node content. Alternative index == NodeType value.
using NodePayload = std::variant<
    GenericPayload,
    NotePayload,
    ChecklistPayload,
    KanbanPayload,
    TimelinePayload,
    MatrixPayload>;

inline NodeType payloadType(const NodePayload& payload) {
    return static_cast<NodeType>(payload.index());
}

/// Default payload for a node type
NodePayload makePayload(NodeType type);

/// Label given to nodes created or loaded without one
inline constexpr const char* DEFAULT_NODE_LABEL = "New Node";

/// Node content shared by every node type plus the typed payload.
///
/// The engine itself only reads `label` and `collapsed`. Keys found in a
/// persisted document that have no typed field are kept in `extra` as raw
/// JSON text so a load/save cycle does not drop them.
struct NodeData {
    std::string label;
    bool collapsed = false;
    bool editing = false;
    std::optional<std::string> color;
    std::optional<std::string> shape;
    std::optional<double> fontSize;
    NodePayload payload;
    std::map<std::string, std::string> extra;

    bool operator==(const NodeData&) const = default;
};

struct Node {
    NodeId id;
    Point position;
    NodeData data;

    NodeType type() const { return payloadType(data.payload); }

    bool operator==(const Node&) const = default;
};

struct Edge {
    EdgeId id;
    NodeId source;
    NodeId target;
    EdgeType type = EdgeType::Plain;
    std::optional<std::string> label;

    bool operator==(const Edge&) const = default;
};

}  // namespace mindgraph
