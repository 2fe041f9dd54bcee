#pragma once

#include "../config/EngineConfig.h"
#include "../core/GraphStore.h"
#include "../history/HistoryManager.h"
#include "../templates/TemplateCatalog.h"
#include "../templates/TemplateInstantiator.h"
#include "../view/VisibilityResolver.h"
#include "DeferredScheduler.h"
#include "GraphPersistence.h"
#include "InputEvent.h"
#include "KeyBindings.h"
#include "TaskExport.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mindgraph {

/// Board exported as a reusable template
struct SavedTemplate {
    std::string name;
    std::string document;   ///< Graph document JSON
};

/// One open board: graph store, history, visible view and deferred work.
///
/// Every user intent enters through dispatch(). A graph mutation ends in a
/// commit, which schedules a debounced save, records a history snapshot
/// (unless the mutation is a history replay) and recomputes the visible view.
///
/// Single-threaded. Deferred work (saves, the layout that follows a template
/// insert) runs only when the host calls tick().
class BoardSession {
public:
    using Clock = DeferredScheduler::Clock;
    using TimePoint = DeferredScheduler::TimePoint;
    using ViewListener = std::function<void(const VisibleView&)>;

    explicit BoardSession(std::string boardId,
                          EngineConfig config = EngineConfig::defaults(),
                          std::shared_ptr<IGraphPersistence> persistence = nullptr,
                          TemplateCatalog catalog = TemplateCatalog::builtin(),
                          IdGenerator ids = IdGenerator());

    /// Writes a pending save
    ~BoardSession();

    // Non-copyable: scheduled tasks capture `this`
    BoardSession(const BoardSession&) = delete;
    BoardSession& operator=(const BoardSession&) = delete;

    // === Loading ===

    /// Replace the board with a stored document. A malformed document gives
    /// an empty board. History restarts with the loaded state as its only
    /// snapshot; nothing is saved.
    void load(const std::string& json);

    /// load() from the persistence collaborator.
    /// @return false if there is no collaborator or nothing stored
    bool loadFromPersistence();

    // === Intents ===

    /// Apply one intent. Never throws for user-level failures.
    /// @return true if the graph changed
    bool dispatch(const InputEvent& event, TimePoint now = Clock::now());

    /// Translate a key press and dispatch it
    bool dispatch(const KeyEvent& key, TimePoint now = Clock::now());

    /// Run deferred work that is due
    /// @return number of tasks run
    size_t tick(TimePoint now = Clock::now());

    /// Write a pending save immediately
    void flush();

    // === State ===

    const std::string& boardId() const { return boardId_; }
    const Graph& graph() const { return store_.graph(); }
    const SelectionState& selection() const { return store_.selection(); }
    const VisibleView& view() const { return view_; }
    const std::optional<NodeId>& focusRoot() const { return focusRoot_; }
    const HistoryManager& history() const { return history_; }
    const DeferredScheduler& scheduler() const { return scheduler_; }
    const EngineConfig& config() const { return config_; }

    TemplateCatalog& templates() { return catalog_; }
    const TemplateCatalog& templates() const { return catalog_; }

    /// Called after every view recomputation
    void setViewListener(ViewListener listener) { viewListener_ = std::move(listener); }

    // === Export ===

    /// Task list from the selected node's descendants, nullopt without a selection
    std::optional<TaskListRequest> createTaskList() const;

    /// Current graph and selection as a document
    std::string exportDocument() const;

    /// Current graph as a named template. nullopt for a blank name.
    std::optional<SavedTemplate> saveAsTemplate(const std::string& name) const;

    /// Replace the graph with a saved template document.
    /// An invalid document is logged and leaves the board unchanged.
    bool applyTemplateDocument(const std::string& json, TimePoint now = Clock::now());

    /// Scheduler keys
    static constexpr const char* PERSIST_TASK = "persist";
    static constexpr const char* TEMPLATE_LAYOUT_TASK = "template-layout";

private:
    // Each handler returns the origin to commit with, or nullopt when the
    // graph did not change
    std::optional<MutationOrigin> handle(const intent::AddNode& e);
    std::optional<MutationOrigin> handle(const intent::AddChild& e);
    std::optional<MutationOrigin> handle(const intent::AddSibling& e);
    std::optional<MutationOrigin> handle(const intent::AddLinkedNode& e);
    std::optional<MutationOrigin> handle(const intent::AttachNode& e);
    std::optional<MutationOrigin> handle(const intent::DeleteSelection& e);
    std::optional<MutationOrigin> handle(const intent::Connect& e);
    std::optional<MutationOrigin> handle(const intent::ToggleCollapse& e);
    std::optional<MutationOrigin> handle(const intent::SetFocusRoot& e);
    std::optional<MutationOrigin> handle(const intent::ClearFocus& e);
    std::optional<MutationOrigin> handle(const intent::ApplyLayout& e);
    std::optional<MutationOrigin> handle(const intent::ApplyTemplate& e);
    std::optional<MutationOrigin> handle(const intent::Undo& e);
    std::optional<MutationOrigin> handle(const intent::Redo& e);
    std::optional<MutationOrigin> handle(const intent::SelectNode& e);
    std::optional<MutationOrigin> handle(const intent::SelectEdge& e);
    std::optional<MutationOrigin> handle(const intent::DeselectAll& e);
    std::optional<MutationOrigin> handle(const intent::MoveNode& e);
    std::optional<MutationOrigin> handle(const intent::RenameNode& e);
    std::optional<MutationOrigin> handle(const intent::RenameEdge& e);
    std::optional<MutationOrigin> handle(const intent::DuplicateNode& e);

    void commit(MutationOrigin origin);
    void recomputeView();
    void schedulePersist();
    void persistNow();
    std::optional<MutationOrigin> restore(const std::optional<Snapshot>& snapshot);

    /// Root for ApplyLayout: the focus root, else the automatic root
    std::optional<NodeId> layoutRoot() const;

    /// Lay out from `root` and write the positions back.
    /// @return true if any position changed
    bool layoutFrom(const NodeId& root, LayoutKind kind);

    void runTemplateLayout(const NodeId& templateRoot);

    std::string boardId_;
    EngineConfig config_;
    std::shared_ptr<IGraphPersistence> persistence_;
    TemplateCatalog catalog_;
    TemplateInstantiator instantiator_;

    GraphStore store_;
    HistoryManager history_;
    DeferredScheduler scheduler_;
    VisibleView view_;
    std::optional<NodeId> focusRoot_;
    ViewListener viewListener_;

    // Time of the intent or tick being processed
    TimePoint now_;
};

}  // namespace mindgraph
