#pragma once

#include <rrsched/core/task.hpp>

#include <cstddef>
#include <memory>
#include <vector>

namespace rrsched::core {

/// @brief Ordered collection of tasks waiting for, or between, slices.
/// @ingroup core
///
/// Tasks are kept in descending priority order. Within one priority the
/// order is round-robin: the task that just received a slice is moved to
/// the back of its own priority group, not to the back of the queue.
///
/// Insertion appends and then stable-sorts by priority, so tasks of equal
/// priority keep their insertion order. A priority change is handled as a
/// fresh arrival at the new priority (remove, append, re-sort).
///
/// ReadyQueue does no locking of its own; the Engine guards it with its
/// state mutex. Priorities are read from the tasks, so they must not change
/// behind the queue's back without a call to reprioritize().
///
/// @see Engine
class ReadyQueue {
public:
    /// @brief Append a task and restore priority order.
    void push(std::shared_ptr<Task> task);

    /// @brief Remove this exact task object, if queued.
    ///
    /// Matches by identity, never touching a different task that happens
    /// to have been queued under the same id.
    ///
    /// @return True if the task was present.
    bool remove(const Task& task);

    /// @brief Re-insert a queued task after its priority changed.
    /// @return False if the task is not in the queue (nothing is done).
    bool reprioritize(const TaskId& id);

    /// @brief Select the next task to run and rotate it within its priority group.
    ///
    /// Returns the head of the queue. When at least one other queued task
    /// shares the head's priority, the head is moved to just after the last
    /// task of that priority; otherwise the queue is left unchanged.
    ///
    /// @return The selected task, or nullptr if the queue is empty.
    std::shared_ptr<Task> rotate_head();

    [[nodiscard]] bool empty() const noexcept { return tasks_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return tasks_.size(); }

    /// @brief Task ids in queue order.
    [[nodiscard]] std::vector<TaskId> ids() const;

private:
    void sort_by_priority();

    std::vector<std::shared_ptr<Task>> tasks_;
};

} // namespace rrsched::core
