#pragma once

#include "../core/Graph.h"
#include "../core/Selection.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace mindgraph {

/// Where a mutation came from. Restoring a snapshot is tagged HistoryReplay
/// so the restore itself is never recorded.
enum class MutationOrigin {
    UserEdit,
    HistoryReplay
};

/// Immutable deep copy of the board state
struct Snapshot {
    Graph graph;
    SelectionState selection;
};

struct HistoryOptions {
    /// Oldest snapshots are dropped beyond this count. 0 means unbounded.
    size_t maxSnapshots = 0;
};

/// Linear snapshot history with a cursor.
///
/// Invariant: cursor() is -1 when empty, otherwise 0 <= cursor() < size().
/// Recording after an undo discards every snapshot after the cursor.
class HistoryManager {
public:
    HistoryManager() = default;
    explicit HistoryManager(const HistoryOptions& options) : options_(options) {}

    /// Push a copy of the state. Ignored for HistoryReplay.
    /// @return true if a snapshot was recorded
    bool record(const Graph& graph, const SelectionState& selection,
                MutationOrigin origin = MutationOrigin::UserEdit);

    bool record(const Graph& graph, MutationOrigin origin = MutationOrigin::UserEdit) {
        return record(graph, SelectionState{}, origin);
    }

    /// Step back. nullopt when already at the oldest snapshot.
    std::optional<Snapshot> undo();

    /// Step forward. nullopt when already at the newest snapshot.
    std::optional<Snapshot> redo();

    bool canUndo() const { return cursor_ > 0; }
    bool canRedo() const { return cursor_ >= 0 && static_cast<size_t>(cursor_) + 1 < snapshots_.size(); }

    int cursor() const { return cursor_; }
    size_t size() const { return snapshots_.size(); }
    bool empty() const { return snapshots_.empty(); }

    /// Snapshot at the cursor, nullptr when empty
    const Snapshot* current() const;

    void clear();

    const HistoryOptions& options() const { return options_; }

private:
    HistoryOptions options_;
    std::vector<std::shared_ptr<const Snapshot>> snapshots_;
    int cursor_ = -1;
};

}  // namespace mindgraph
