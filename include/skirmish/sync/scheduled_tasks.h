#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace skirmish::sync {

using TaskId = std::uint64_t;
using TaskAction = std::function<void()>;

// One-shot delayed actions drained from the tick. Clear() drops pending
// actions without running them.
class ScheduledTaskList final {
public:
    TaskId Schedule(std::uint64_t due_ms, TaskAction action);
    bool Cancel(TaskId task_id);
    std::size_t RunDue(std::uint64_t now_ms);
    void Clear();

    std::size_t PendingCount() const;

private:
    struct Task final {
        TaskId id = 0;
        std::uint64_t due_ms = 0;
        TaskAction action;
        bool cancelled = false;
    };

    std::vector<Task> pending_;
    std::vector<Task> running_;
    TaskId next_task_id_ = 1;
};

}  // namespace skirmish::sync
