#include "mindgraph/session/DeferredScheduler.h"

#include <algorithm>
#include <vector>

namespace mindgraph {

void DeferredScheduler::schedule(const std::string& key, std::chrono::milliseconds delay, Task task,
                                 TimePoint now) {
    tasks_[key] = Pending{now + delay, nextSequence_++, std::move(task)};
}

bool DeferredScheduler::cancel(const std::string& key) {
    return tasks_.erase(key) > 0;
}

size_t DeferredScheduler::runDue(TimePoint now) {
    return runWhere([now](const Pending& p) { return p.deadline <= now; });
}

size_t DeferredScheduler::runAll() {
    return runWhere([](const Pending&) { return true; });
}

std::optional<DeferredScheduler::TimePoint> DeferredScheduler::nextDeadline() const {
    std::optional<TimePoint> earliest;
    for (const auto& [key, pending] : tasks_) {
        if (!earliest || pending.deadline < *earliest) {
            earliest = pending.deadline;
        }
    }
    return earliest;
}

size_t DeferredScheduler::runWhere(const std::function<bool(const Pending&)>& isDue) {
    std::vector<Pending> due;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (isDue(it->second)) {
            due.push_back(std::move(it->second));
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }

    std::sort(due.begin(), due.end(), [](const Pending& a, const Pending& b) {
        if (a.deadline != b.deadline) return a.deadline < b.deadline;
        return a.sequence < b.sequence;
    });

    for (auto& pending : due) {
        pending.task();
    }
    return due.size();
}

}  // namespace mindgraph
