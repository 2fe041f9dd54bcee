#include "mindgraph/history/HistoryManager.h"
#include "mindgraph/common/Logger.h"

namespace mindgraph {

bool HistoryManager::record(const Graph& graph, const SelectionState& selection,
                            MutationOrigin origin) {
    if (origin == MutationOrigin::HistoryReplay) {
        return false;
    }

    // Drop the redo tail
    snapshots_.resize(static_cast<size_t>(cursor_ + 1));
    snapshots_.push_back(std::make_shared<const Snapshot>(Snapshot{graph, selection}));

    if (options_.maxSnapshots > 0 && snapshots_.size() > options_.maxSnapshots) {
        size_t excess = snapshots_.size() - options_.maxSnapshots;
        snapshots_.erase(snapshots_.begin(), snapshots_.begin() + static_cast<std::ptrdiff_t>(excess));
    }

    cursor_ = static_cast<int>(snapshots_.size()) - 1;
    LOG_TRACE("Recorded snapshot {} of {}", cursor_, snapshots_.size());
    return true;
}

std::optional<Snapshot> HistoryManager::undo() {
    if (!canUndo()) {
        return std::nullopt;
    }
    --cursor_;
    LOG_DEBUG("Undo to snapshot {}", cursor_);
    return *snapshots_[cursor_];
}

std::optional<Snapshot> HistoryManager::redo() {
    if (!canRedo()) {
        return std::nullopt;
    }
    ++cursor_;
    LOG_DEBUG("Redo to snapshot {}", cursor_);
    return *snapshots_[cursor_];
}

const Snapshot* HistoryManager::current() const {
    if (cursor_ < 0) {
        return nullptr;
    }
    return snapshots_[cursor_].get();
}

void HistoryManager::clear() {
    snapshots_.clear();
    cursor_ = -1;
}

}  // namespace mindgraph
