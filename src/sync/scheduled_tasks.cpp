#include "sync/scheduled_tasks.h"

#include <algorithm>
#include <utility>

namespace skirmish::sync {

TaskId ScheduledTaskList::Schedule(std::uint64_t due_ms, TaskAction action) {
    const TaskId task_id = next_task_id_++;
    pending_.push_back(Task{
        .id = task_id,
        .due_ms = due_ms,
        .action = std::move(action),
    });
    return task_id;
}

bool ScheduledTaskList::Cancel(TaskId task_id) {
    for (Task& task : running_) {
        if (task.id == task_id && !task.cancelled) {
            task.cancelled = true;
            return true;
        }
    }

    const auto iter = std::find_if(
        pending_.begin(),
        pending_.end(),
        [task_id](const Task& task) { return task.id == task_id; });
    if (iter == pending_.end()) {
        return false;
    }
    pending_.erase(iter);
    return true;
}

std::size_t ScheduledTaskList::RunDue(std::uint64_t now_ms) {
    if (!running_.empty()) {
        // Reentrant drain from inside an action; the outer drain owns the batch.
        return 0;
    }

    const auto split = std::stable_partition(
        pending_.begin(),
        pending_.end(),
        [now_ms](const Task& task) { return task.due_ms > now_ms; });
    running_.assign(std::make_move_iterator(split), std::make_move_iterator(pending_.end()));
    pending_.erase(split, pending_.end());
    std::stable_sort(
        running_.begin(),
        running_.end(),
        [](const Task& lhs, const Task& rhs) { return lhs.due_ms < rhs.due_ms; });

    std::size_t executed = 0;
    for (std::size_t index = 0; index < running_.size(); ++index) {
        if (running_[index].cancelled) {
            continue;
        }
        running_[index].cancelled = true;
        TaskAction action = std::move(running_[index].action);
        action();
        ++executed;
    }

    running_.clear();
    return executed;
}

void ScheduledTaskList::Clear() {
    pending_.clear();
    for (Task& task : running_) {
        task.cancelled = true;
    }
}

std::size_t ScheduledTaskList::PendingCount() const {
    return pending_.size();
}

}  // namespace skirmish::sync
