#include "mindgraph/session/BoardSession.h"
#include "mindgraph/io/GraphSerializer.h"
#include "mindgraph/layout/HierarchicalLayout.h"
#include "mindgraph/layout/LayoutFactory.h"
#include "mindgraph/layout/LayoutRoot.h"
#include "mindgraph/common/Logger.h"

#include <exception>

namespace mindgraph {

BoardSession::BoardSession(std::string boardId,
                           EngineConfig config,
                           std::shared_ptr<IGraphPersistence> persistence,
                           TemplateCatalog catalog,
                           IdGenerator ids)
    : boardId_(std::move(boardId))
    , config_(config)
    , persistence_(std::move(persistence))
    , catalog_(std::move(catalog))
    , instantiator_(config_.templateGrid)
    , store_(std::move(ids))
    , history_(config_.history)
    , now_(Clock::now()) {
    // Undo back to the initial state is always possible
    history_.record(store_.graph(), store_.selection());
    recomputeView();
}

BoardSession::~BoardSession() {
    flush();
}

// =============================================================================
// Loading
// =============================================================================

void BoardSession::load(const std::string& json) {
    GraphDocument document = GraphSerializer::loadOrDefault(json);
    store_.replaceAll(std::move(document.graph), std::move(document.selection));
    focusRoot_.reset();

    scheduler_.cancel(TEMPLATE_LAYOUT_TASK);
    scheduler_.cancel(PERSIST_TASK);

    history_.clear();
    history_.record(store_.graph(), store_.selection());

    LOG_INFO("Loaded board '{}': {} nodes, {} edges",
             boardId_, store_.graph().nodeCount(), store_.graph().edgeCount());
    recomputeView();
}

bool BoardSession::loadFromPersistence() {
    if (!persistence_) {
        return false;
    }

    std::optional<std::string> stored;
    try {
        stored = persistence_->load(boardId_);
    } catch (const std::exception& e) {
        LOG_ERROR("Loading board '{}' failed: {}", boardId_, e.what());
        return false;
    }

    if (!stored) {
        LOG_DEBUG("Nothing stored for board '{}'", boardId_);
        return false;
    }
    load(*stored);
    return true;
}

// =============================================================================
// Dispatch
// =============================================================================

bool BoardSession::dispatch(const InputEvent& event, TimePoint now) {
    now_ = now;

    std::optional<MutationOrigin> origin = std::visit(
        [this](const auto& e) { return handle(e); }, event);

    if (!origin) {
        return false;
    }
    commit(*origin);
    return true;
}

bool BoardSession::dispatch(const KeyEvent& key, TimePoint now) {
    auto event = translateKey(key);
    if (!event) {
        return false;
    }
    return dispatch(*event, now);
}

size_t BoardSession::tick(TimePoint now) {
    now_ = now;
    return scheduler_.runDue(now);
}

void BoardSession::flush() {
    if (scheduler_.cancel(PERSIST_TASK)) {
        persistNow();
    }
}

void BoardSession::commit(MutationOrigin origin) {
    if (focusRoot_ && !store_.graph().hasNode(*focusRoot_)) {
        LOG_DEBUG("Focus root {} removed, clearing focus", *focusRoot_);
        focusRoot_.reset();
    }

    schedulePersist();
    history_.record(store_.graph(), store_.selection(), origin);
    recomputeView();
}

void BoardSession::recomputeView() {
    view_ = VisibilityResolver::resolve(store_.graph(), focusRoot_);
    if (viewListener_) {
        viewListener_(view_);
    }
}

void BoardSession::schedulePersist() {
    if (!persistence_) {
        return;
    }
    scheduler_.schedule(PERSIST_TASK, config_.session.persistDebounce,
                        [this]() { persistNow(); }, now_);
}

void BoardSession::persistNow() {
    if (!persistence_) {
        return;
    }
    try {
        persistence_->save(boardId_, exportDocument());
    } catch (const std::exception& e) {
        LOG_ERROR("Saving board '{}' failed: {}", boardId_, e.what());
    }
}

// =============================================================================
// Intent handlers
// =============================================================================

std::optional<MutationOrigin> BoardSession::handle(const intent::AddNode& e) {
    NodeDraft draft;
    draft.position = e.position;
    draft.label = e.label;
    store_.addNode(draft);
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::AddChild&) {
    if (!store_.addChild()) {
        LOG_DEBUG("Add child ignored: no node selected");
        return std::nullopt;
    }
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::AddSibling&) {
    if (!store_.addSibling()) {
        LOG_DEBUG("Add sibling ignored: no node selected");
        return std::nullopt;
    }
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::AddLinkedNode& e) {
    if (!store_.addLinkedNode(e.label)) {
        return std::nullopt;
    }
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::AttachNode& e) {
    if (!store_.attachNode(e.payload, e.label)) {
        return std::nullopt;
    }
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::DeleteSelection&) {
    if (!store_.deleteSelected()) {
        return std::nullopt;
    }
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::Connect& e) {
    if (!store_.connect(e.source, e.target)) {
        return std::nullopt;
    }
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::ToggleCollapse& e) {
    if (!store_.toggleCollapsed(e.nodeId)) {
        LOG_WARN("Toggle collapse on unknown node {}", e.nodeId);
        return std::nullopt;
    }
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::SetFocusRoot& e) {
    if (!store_.graph().hasNode(e.nodeId)) {
        LOG_WARN("Focus on unknown node {} ignored", e.nodeId);
        return std::nullopt;
    }
    focusRoot_ = e.nodeId;
    recomputeView();
    return std::nullopt;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::ClearFocus&) {
    if (focusRoot_) {
        focusRoot_.reset();
        recomputeView();
    }
    return std::nullopt;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::ApplyLayout& e) {
    auto root = layoutRoot();
    if (!root) {
        LOG_DEBUG("Layout skipped: graph is empty");
        return std::nullopt;
    }
    if (!layoutFrom(*root, e.kind.value_or(config_.session.defaultLayout))) {
        return std::nullopt;
    }
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::ApplyTemplate& e) {
    auto instance = instantiator_.instantiate(e.key, catalog_, store_.ids(), store_.graph());
    if (!instance) {
        return std::nullopt;
    }

    NodeId templateRoot = instance->rootId;
    store_.insertSubgraph(std::move(instance->nodes), std::move(instance->edges));

    // Replaces a pending layout from an earlier insert
    scheduler_.schedule(TEMPLATE_LAYOUT_TASK, config_.session.templateLayoutDelay,
                        [this, templateRoot]() { runTemplateLayout(templateRoot); }, now_);

    LOG_INFO("Inserted template '{}'", e.key);
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::Undo&) {
    return restore(history_.undo());
}

std::optional<MutationOrigin> BoardSession::handle(const intent::Redo&) {
    return restore(history_.redo());
}

std::optional<MutationOrigin> BoardSession::handle(const intent::SelectNode& e) {
    store_.selectNode(e.nodeId, e.additive);
    return std::nullopt;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::SelectEdge& e) {
    store_.selectEdge(e.edgeId, e.additive);
    return std::nullopt;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::DeselectAll&) {
    store_.deselectAll();
    return std::nullopt;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::MoveNode& e) {
    const Node* node = store_.graph().findNode(e.nodeId);
    if (!node || node->position == e.position) {
        return std::nullopt;
    }
    store_.moveNode(e.nodeId, e.position);
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::RenameNode& e) {
    const Node* node = store_.graph().findNode(e.nodeId);
    if (!node || node->data.label == e.label) {
        return std::nullopt;
    }
    store_.setLabel(e.nodeId, e.label);
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::RenameEdge& e) {
    const Edge* edge = store_.graph().findEdge(e.edgeId);
    if (!edge || edge->label == e.label) {
        return std::nullopt;
    }
    store_.setEdgeLabel(e.edgeId, e.label);
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::handle(const intent::DuplicateNode& e) {
    if (!store_.duplicateNode(e.nodeId)) {
        return std::nullopt;
    }
    return MutationOrigin::UserEdit;
}

std::optional<MutationOrigin> BoardSession::restore(const std::optional<Snapshot>& snapshot) {
    if (!snapshot) {
        return std::nullopt;
    }
    // A pending template layout belongs to the state being left
    scheduler_.cancel(TEMPLATE_LAYOUT_TASK);
    store_.replaceAll(snapshot->graph, snapshot->selection);
    return MutationOrigin::HistoryReplay;
}

// =============================================================================
// Layout
// =============================================================================

std::optional<NodeId> BoardSession::layoutRoot() const {
    if (focusRoot_ && store_.graph().hasNode(*focusRoot_)) {
        return focusRoot_;
    }
    return selectLayoutRoot(store_.graph());
}

bool BoardSession::layoutFrom(const NodeId& root, LayoutKind kind) {
    auto layout = createLayout(kind, config_);
    Graph laidOut = layout->apply(store_.graph(), root);

    if (laidOut == store_.graph()) {
        LOG_DEBUG("{} layout from {} left every position unchanged", layout->algorithmName(), root);
        return false;
    }

    store_.applyPositions(laidOut);
    LOG_DEBUG("{} layout applied from {}", layout->algorithmName(), root);
    return true;
}

void BoardSession::runTemplateLayout(const NodeId& templateRoot) {
    if (!store_.graph().hasNode(templateRoot)) {
        LOG_DEBUG("Template root {} is gone, layout skipped", templateRoot);
        return;
    }
    if (layoutFrom(templateRoot, LayoutKind::Hierarchical)) {
        commit(MutationOrigin::UserEdit);
    }
}

// =============================================================================
// Export
// =============================================================================

std::optional<TaskListRequest> BoardSession::createTaskList() const {
    const Node* selected = store_.selectedNode();
    if (!selected) {
        return std::nullopt;
    }
    return buildTaskList(store_.graph(), selected->id);
}

std::string BoardSession::exportDocument() const {
    return GraphSerializer::toJson(store_.graph(), store_.selection());
}

std::optional<SavedTemplate> BoardSession::saveAsTemplate(const std::string& name) const {
    if (name.find_first_not_of(" \t\n\r") == std::string::npos) {
        return std::nullopt;
    }
    return SavedTemplate{name, GraphSerializer::toJson(store_.graph())};
}

bool BoardSession::applyTemplateDocument(const std::string& json, TimePoint now) {
    now_ = now;

    GraphDocument document;
    if (!GraphSerializer::fromJson(json, document)) {
        LOG_ERROR("Invalid template document, board unchanged");
        return false;
    }

    scheduler_.cancel(TEMPLATE_LAYOUT_TASK);
    store_.replaceAll(std::move(document.graph));
    commit(MutationOrigin::UserEdit);
    return true;
}

}  // namespace mindgraph
