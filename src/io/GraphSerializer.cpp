#include "mindgraph/io/GraphSerializer.h"
#include "mindgraph/common/Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>

using json = nlohmann::json;

namespace mindgraph {

namespace {

constexpr int DOCUMENT_VERSION = 1;

// Data keys stored in typed NodeData fields rather than in `extra`
const char* const COMMON_KEYS[] = {"label", "collapsed", "editing", "color", "shape", "fontSize"};

const char* payloadKey(NodeType type) {
    switch (type) {
        case NodeType::Generic: return nullptr;
        case NodeType::Note: return "text";
        case NodeType::Checklist: return "items";
        case NodeType::Kanban: return "columns";
        case NodeType::Timeline: return "events";
        case NodeType::Matrix: return "matrixData";
    }
    return nullptr;
}

// Thrown for values that parse as JSON but are not a valid document
std::invalid_argument invalid(const std::string& what) {
    return std::invalid_argument(what);
}

// --- enums ---

std::string priorityToString(Priority p) {
    switch (p) {
        case Priority::Low: return "low";
        case Priority::Medium: return "medium";
        case Priority::High: return "high";
    }
    return "medium";
}

Priority stringToPriority(const std::string& str) {
    if (str == "low") return Priority::Low;
    if (str == "medium") return Priority::Medium;
    if (str == "high") return Priority::High;
    throw invalid("unknown priority '" + str + "'");
}

std::string eventKindToString(TimelineEventKind kind) {
    switch (kind) {
        case TimelineEventKind::Milestone: return "milestone";
        case TimelineEventKind::Task: return "task";
        case TimelineEventKind::Deadline: return "deadline";
    }
    return "task";
}

TimelineEventKind stringToEventKind(const std::string& str) {
    if (str == "milestone") return TimelineEventKind::Milestone;
    if (str == "task") return TimelineEventKind::Task;
    if (str == "deadline") return TimelineEventKind::Deadline;
    throw invalid("unknown timeline event type '" + str + "'");
}

std::string statusToString(TimelineStatus status) {
    switch (status) {
        case TimelineStatus::Pending: return "pending";
        case TimelineStatus::InProgress: return "in-progress";
        case TimelineStatus::Completed: return "completed";
    }
    return "pending";
}

TimelineStatus stringToStatus(const std::string& str) {
    if (str == "pending") return TimelineStatus::Pending;
    if (str == "in-progress") return TimelineStatus::InProgress;
    if (str == "completed") return TimelineStatus::Completed;
    throw invalid("unknown timeline status '" + str + "'");
}

// --- payload writers ---

json checklistToJson(const ChecklistPayload& payload) {
    json items = json::array();
    for (const auto& item : payload.items) {
        items.push_back({{"id", item.id}, {"text", item.text}, {"done", item.done}});
    }
    return items;
}

json kanbanToJson(const KanbanPayload& payload) {
    json columns = json::array();
    for (const auto& column : payload.columns) {
        json items = json::array();
        for (const auto& item : column.items) {
            json itemJson = {{"id", item.id}, {"title", item.title}};
            if (item.priority) itemJson["priority"] = priorityToString(*item.priority);
            if (item.assignee) itemJson["assignee"] = *item.assignee;
            items.push_back(itemJson);
        }
        columns.push_back({{"id", column.id}, {"title", column.title}, {"items", items}});
    }
    return columns;
}

json timelineToJson(const TimelinePayload& payload) {
    json events = json::array();
    for (const auto& event : payload.events) {
        json eventJson = {
            {"id", event.id},
            {"title", event.title},
            {"date", event.date},
            {"type", eventKindToString(event.kind)}
        };
        if (event.description) eventJson["description"] = *event.description;
        if (event.status) eventJson["status"] = statusToString(*event.status);
        if (event.assignee) eventJson["assignee"] = *event.assignee;
        events.push_back(eventJson);
    }
    return events;
}

json matrixToJson(const MatrixPayload& payload) {
    const auto& matrix = payload.matrix;
    json cells = json::array();
    for (const auto& row : matrix.cells) {
        json rowJson = json::array();
        for (const auto& cell : row) {
            json cellJson = {{"id", cell.id}, {"content", cell.content}};
            if (cell.priority) cellJson["priority"] = priorityToString(*cell.priority);
            if (cell.category) cellJson["category"] = *cell.category;
            rowJson.push_back(cellJson);
        }
        cells.push_back(rowJson);
    }
    return {
        {"title", matrix.title},
        {"rows", matrix.rows},
        {"columns", matrix.columns},
        {"cells", cells}
    };
}

json dataToJson(const NodeData& data) {
    json j = json::object();

    // Extra keys first so typed fields win on a clash
    for (const auto& [key, raw] : data.extra) {
        j[key] = json::parse(raw);
    }

    j["label"] = data.label;
    if (data.collapsed) j["collapsed"] = true;
    if (data.editing) j["editing"] = true;
    if (data.color) j["color"] = *data.color;
    if (data.shape) j["shape"] = *data.shape;
    if (data.fontSize) j["fontSize"] = *data.fontSize;

    std::visit([&j](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, NotePayload>) {
            j["text"] = payload.text;
        } else if constexpr (std::is_same_v<T, ChecklistPayload>) {
            j["items"] = checklistToJson(payload);
        } else if constexpr (std::is_same_v<T, KanbanPayload>) {
            j["columns"] = kanbanToJson(payload);
        } else if constexpr (std::is_same_v<T, TimelinePayload>) {
            j["events"] = timelineToJson(payload);
        } else if constexpr (std::is_same_v<T, MatrixPayload>) {
            j["matrixData"] = matrixToJson(payload);
        }
    }, data.payload);

    return j;
}

// --- payload readers ---
// nlohmann's get<> throws type_error on a shape mismatch, which fromJson
// reports as a malformed document.

template <typename T>
std::optional<T> optionalField(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

ChecklistPayload checklistFromJson(const json& j) {
    ChecklistPayload payload;
    for (const auto& itemJson : j) {
        ChecklistItem item;
        item.id = itemJson.at("id").get<std::string>();
        item.text = itemJson.value("text", "");
        item.done = itemJson.value("done", false);
        payload.items.push_back(std::move(item));
    }
    return payload;
}

KanbanPayload kanbanFromJson(const json& j) {
    KanbanPayload payload;
    for (const auto& columnJson : j) {
        KanbanColumn column;
        column.id = columnJson.at("id").get<std::string>();
        column.title = columnJson.value("title", "");
        if (columnJson.contains("items")) {
            for (const auto& itemJson : columnJson["items"]) {
                KanbanItem item;
                item.id = itemJson.at("id").get<std::string>();
                item.title = itemJson.value("title", "");
                if (auto p = optionalField<std::string>(itemJson, "priority")) {
                    item.priority = stringToPriority(*p);
                }
                item.assignee = optionalField<std::string>(itemJson, "assignee");
                column.items.push_back(std::move(item));
            }
        }
        payload.columns.push_back(std::move(column));
    }
    return payload;
}

TimelinePayload timelineFromJson(const json& j) {
    TimelinePayload payload;
    for (const auto& eventJson : j) {
        TimelineEvent event;
        event.id = eventJson.at("id").get<std::string>();
        event.title = eventJson.value("title", "");
        event.date = eventJson.value("date", "");
        event.description = optionalField<std::string>(eventJson, "description");
        event.kind = stringToEventKind(eventJson.value("type", "task"));
        if (auto s = optionalField<std::string>(eventJson, "status")) {
            event.status = stringToStatus(*s);
        }
        event.assignee = optionalField<std::string>(eventJson, "assignee");
        payload.events.push_back(std::move(event));
    }
    return payload;
}

MatrixPayload matrixFromJson(const json& j) {
    MatrixPayload payload;
    auto& matrix = payload.matrix;
    matrix.title = j.value("title", "");
    if (j.contains("rows")) matrix.rows = j["rows"].get<std::vector<std::string>>();
    if (j.contains("columns")) matrix.columns = j["columns"].get<std::vector<std::string>>();
    if (j.contains("cells")) {
        for (const auto& rowJson : j["cells"]) {
            std::vector<MatrixCell> row;
            for (const auto& cellJson : rowJson) {
                MatrixCell cell;
                cell.id = cellJson.at("id").get<std::string>();
                cell.content = cellJson.value("content", "");
                if (auto p = optionalField<std::string>(cellJson, "priority")) {
                    cell.priority = stringToPriority(*p);
                }
                cell.category = optionalField<std::string>(cellJson, "category");
                row.push_back(std::move(cell));
            }
            matrix.cells.push_back(std::move(row));
        }
    }
    return payload;
}

NodeData dataFromJson(const json& j, NodeType type) {
    NodeData data;
    data.payload = makePayload(type);

    data.label = DEFAULT_NODE_LABEL;

    if (j.is_null()) {
        return data;
    }
    if (!j.is_object()) {
        throw invalid("node data is not an object");
    }

    data.label = j.value("label", std::string(DEFAULT_NODE_LABEL));
    data.collapsed = j.value("collapsed", false);
    data.editing = j.value("editing", false);
    data.color = optionalField<std::string>(j, "color");
    data.shape = optionalField<std::string>(j, "shape");
    data.fontSize = optionalField<double>(j, "fontSize");

    const char* ownKey = payloadKey(type);
    if (ownKey && j.contains(ownKey)) {
        const json& value = j[ownKey];
        switch (type) {
            case NodeType::Note: data.payload = NotePayload{value.get<std::string>()}; break;
            case NodeType::Checklist: data.payload = checklistFromJson(value); break;
            case NodeType::Kanban: data.payload = kanbanFromJson(value); break;
            case NodeType::Timeline: data.payload = timelineFromJson(value); break;
            case NodeType::Matrix: data.payload = matrixFromJson(value); break;
            case NodeType::Generic: break;
        }
    }

    for (const auto& [key, value] : j.items()) {
        bool known = ownKey && key == ownKey;
        for (const char* common : COMMON_KEYS) {
            known = known || key == common;
        }
        if (!known) {
            data.extra[key] = value.dump();
        }
    }

    return data;
}

Point positionFromJson(const json& j) {
    if (!j.is_object() || !j.contains("x") || !j.contains("y") ||
        !j["x"].is_number() || !j["y"].is_number()) {
        throw invalid("position must have numeric x and y");
    }
    return {j["x"].get<double>(), j["y"].get<double>()};
}

}  // namespace

// =============================================================================
// Enum helpers
// =============================================================================

std::string GraphSerializer::nodeTypeToString(NodeType type) {
    switch (type) {
        case NodeType::Generic: return "generic";
        case NodeType::Note: return "note";
        case NodeType::Checklist: return "checklist";
        case NodeType::Kanban: return "kanban";
        case NodeType::Timeline: return "timeline";
        case NodeType::Matrix: return "matrix";
    }
    return "generic";
}

std::optional<NodeType> GraphSerializer::stringToNodeType(const std::string& str) {
    if (str == "generic" || str == "editable") return NodeType::Generic;
    if (str == "note") return NodeType::Note;
    if (str == "checklist") return NodeType::Checklist;
    if (str == "kanban") return NodeType::Kanban;
    if (str == "timeline") return NodeType::Timeline;
    if (str == "matrix") return NodeType::Matrix;
    return std::nullopt;
}

std::string GraphSerializer::edgeTypeToString(EdgeType type) {
    switch (type) {
        case EdgeType::Plain: return "plain";
        case EdgeType::SmoothStep: return "smoothstep";
        case EdgeType::Labeled: return "labeled";
    }
    return "plain";
}

std::optional<EdgeType> GraphSerializer::stringToEdgeType(const std::string& str) {
    if (str == "plain" || str == "default") return EdgeType::Plain;
    if (str == "smoothstep") return EdgeType::SmoothStep;
    if (str == "labeled") return EdgeType::Labeled;
    return std::nullopt;
}

// =============================================================================
// Document serialization
// =============================================================================

std::string GraphSerializer::toJson(const Graph& graph, const SelectionState& selection) {
    json j;
    j["version"] = DOCUMENT_VERSION;

    json nodes = json::array();
    for (const auto& node : graph.nodes()) {
        json nodeJson;
        nodeJson["id"] = node.id;
        nodeJson["type"] = nodeTypeToString(node.type());
        nodeJson["position"] = {{"x", node.position.x}, {"y", node.position.y}};
        nodeJson["data"] = dataToJson(node.data);
        nodeJson["selected"] = selection.isNodeSelected(node.id);
        nodes.push_back(nodeJson);
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& edge : graph.edges()) {
        json edgeJson;
        edgeJson["id"] = edge.id;
        edgeJson["source"] = edge.source;
        edgeJson["target"] = edge.target;
        edgeJson["type"] = edgeTypeToString(edge.type);
        if (edge.label) {
            edgeJson["data"] = {{"label", *edge.label}};
        }
        edgeJson["selected"] = selection.isEdgeSelected(edge.id);
        edges.push_back(edgeJson);
    }
    j["edges"] = edges;

    return j.dump(2);
}

bool GraphSerializer::fromJson(const std::string& jsonStr, GraphDocument& out) {
    try {
        json j = json::parse(jsonStr);

        if (!j.is_object() || !j.contains("nodes") || !j.contains("edges") ||
            !j["nodes"].is_array() || !j["edges"].is_array()) {
            LOG_WARN("Graph document must be an object with 'nodes' and 'edges' arrays");
            return false;
        }

        std::vector<Node> nodes;
        SelectionState selection;

        for (const auto& nodeJson : j["nodes"]) {
            Node node;
            node.id = nodeJson.at("id").get<std::string>();

            std::string typeName = nodeJson.value("type", "generic");
            auto type = stringToNodeType(typeName);
            if (!type) {
                throw invalid("unknown node type '" + typeName + "'");
            }

            node.position = positionFromJson(nodeJson.at("position"));
            node.data = dataFromJson(nodeJson.contains("data") ? nodeJson["data"] : json(), *type);

            if (nodeJson.value("selected", false)) {
                selection.selectNode(node.id, true);
            }
            nodes.push_back(std::move(node));
        }

        std::vector<Edge> edges;
        for (const auto& edgeJson : j["edges"]) {
            Edge edge;
            edge.id = edgeJson.at("id").get<std::string>();
            edge.source = edgeJson.at("source").get<std::string>();
            edge.target = edgeJson.at("target").get<std::string>();

            std::string typeName = edgeJson.value("type", "plain");
            auto type = stringToEdgeType(typeName);
            if (!type) {
                throw invalid("unknown edge type '" + typeName + "'");
            }
            edge.type = *type;

            if (edgeJson.contains("data") && edgeJson["data"].is_object()) {
                edge.label = optionalField<std::string>(edgeJson["data"], "label");
            }

            if (edgeJson.value("selected", false)) {
                selection.selectEdge(edge.id, true);
            }
            edges.push_back(std::move(edge));
        }

        // Throws std::invalid_argument on duplicate or empty ids
        GraphDocument parsed{Graph(std::move(nodes), std::move(edges)), std::move(selection)};
        out = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        LOG_WARN("Malformed graph document: {}", e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        LOG_WARN("Invalid graph document: {}", e.what());
        return false;
    }
}

GraphDocument GraphSerializer::loadOrDefault(const std::string& jsonStr) {
    GraphDocument document;
    if (!fromJson(jsonStr, document)) {
        LOG_INFO("Starting from an empty graph");
    }
    return document;
}

bool GraphSerializer::saveToFile(const GraphDocument& document, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open '{}' for writing", path);
        return false;
    }
    file << toJson(document);
    return file.good();
}

bool GraphSerializer::loadFromFile(GraphDocument& out, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str(), out);
}

}  // namespace mindgraph
