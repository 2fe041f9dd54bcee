#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace mindgraph {

/// Single-threaded timer queue driven by the host loop.
///
/// Tasks are keyed: scheduling a key that is already pending replaces the
/// earlier task and its deadline, which is how bursts of changes coalesce
/// into one run. Nothing runs until the host calls runDue().
class DeferredScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Task = std::function<void()>;

    /// Run `task` once `delay` has passed since `now`
    void schedule(const std::string& key, std::chrono::milliseconds delay, Task task,
                  TimePoint now = Clock::now());

    /// @return false if nothing was pending under this key
    bool cancel(const std::string& key);

    bool isPending(const std::string& key) const { return tasks_.count(key) > 0; }
    bool empty() const { return tasks_.empty(); }
    size_t pendingCount() const { return tasks_.size(); }

    /// Run every task whose deadline is at or before `now`, earliest first.
    /// Tasks scheduled while running wait for the next call.
    /// @return number of tasks run
    size_t runDue(TimePoint now = Clock::now());

    /// Run everything regardless of deadline
    size_t runAll();

    /// Earliest pending deadline
    std::optional<TimePoint> nextDeadline() const;

private:
    struct Pending {
        TimePoint deadline;
        uint64_t sequence;
        Task task;
    };

    size_t runWhere(const std::function<bool(const Pending&)>& isDue);

    std::map<std::string, Pending> tasks_;
    uint64_t nextSequence_ = 0;
};

}  // namespace mindgraph
