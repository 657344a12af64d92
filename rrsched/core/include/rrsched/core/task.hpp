#pragma once

#include <rrsched/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace rrsched::core {

/// @brief Opaque task identifier, supplied by whoever creates the task.
using TaskId = std::string;

/// @brief Lifecycle state of a task.
///
/// Transitions are one-directional: Pending -> Running -> Completed.
/// Cancelled is reserved for clients and never set by the engine.
enum class TaskStatus { Pending, Running, Completed, Cancelled };

/// @brief Lowercase name of a status ("pending", "running", ...).
[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;

/// @brief Parse a lowercase status name.
/// @return The status, or std::nullopt for an unknown name.
[[nodiscard]] std::optional<TaskStatus> task_status_from_string(std::string_view name) noexcept;

/// @brief Creation parameters for a task.
///
/// Range checks (name length, priority bounds, positive burst time) are the
/// caller's job; the engine accepts whatever it is given.
struct TaskSpec {
    TaskId id;
    std::string name;
    std::string description;
    int priority{0};                   ///< Higher value is scheduled first.
    Duration burst_time;               ///< Total execution time required.
    std::optional<double> created_at;  ///< Unix seconds; defaults to now.
};

/// @brief Partial update applied by Engine::update_task().
///
/// Each engaged field is applied independently; disengaged fields are left
/// untouched.
struct TaskPatch {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<int> priority;
    std::optional<Duration> burst_time;

    /// @brief True when no field is engaged.
    [[nodiscard]] bool empty() const noexcept {
        return !name && !description && !priority && !burst_time;
    }
};

/// @brief Read-only copy of every task field at one instant.
///
/// Unset write-once metrics keep their defaults: completion_time stays at
/// the origin (reported as 0), turnaround and waiting time stay zero, and
/// response_time stays disengaged until the first slice starts.
struct TaskSnapshot {
    TaskId task_id;
    std::string name;
    std::string description;
    int priority{0};
    Duration burst_time;
    double created_at{0.0};
    TimePoint arrival_time;
    Duration remaining_time;
    Duration waiting_time;
    Duration turnaround_time;
    TimePoint completion_time;
    std::optional<Duration> response_time;
    TimePoint last_execution_time;
    TaskStatus status{TaskStatus::Pending};
    int progress{0};
};

/// @brief One unit of schedulable work.
/// @ingroup core
///
/// A Task carries its identity, its scheduling parameters and the metrics
/// accumulated while it runs. Only the Engine mutates a task, through the
/// private operations below; everything else sees it through getters or a
/// TaskSnapshot.
///
/// Metrics set on first execution or on completion (response, completion,
/// turnaround and waiting time) are write-once: later calls leave them
/// unchanged.
///
/// Tasks are non-copyable but movable.
///
/// @see Engine, TaskSnapshot
class Task {
public:
    /// @brief Construct a pending task with remaining time equal to its burst.
    /// @param spec Identity and scheduling parameters.
    explicit Task(TaskSpec spec);

    [[nodiscard]] const TaskId& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] int priority() const noexcept { return priority_; }
    [[nodiscard]] Duration burst_time() const noexcept { return burst_time_; }
    [[nodiscard]] Duration remaining_time() const noexcept { return remaining_time_; }
    [[nodiscard]] TaskStatus status() const noexcept { return status_; }
    [[nodiscard]] int progress() const noexcept { return progress_; }
    [[nodiscard]] double created_at() const noexcept { return created_at_; }
    [[nodiscard]] TimePoint arrival_time() const noexcept { return arrival_time_; }
    [[nodiscard]] TimePoint last_execution_time() const noexcept { return last_execution_time_; }
    [[nodiscard]] std::optional<Duration> response_time() const noexcept { return response_time_; }
    [[nodiscard]] std::optional<TimePoint> completion_time() const noexcept { return completion_time_; }
    [[nodiscard]] Duration turnaround_time() const noexcept { return turnaround_time_; }
    [[nodiscard]] Duration waiting_time() const noexcept { return waiting_time_; }

    /// @brief True when the task has reached the Completed state.
    [[nodiscard]] bool is_complete() const noexcept { return status_ == TaskStatus::Completed; }

    /// @brief Copy every field into a TaskSnapshot.
    [[nodiscard]] TaskSnapshot snapshot() const;

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;
    Task(Task&&) = default;
    Task& operator=(Task&&) = default;

private:
    friend class Engine;

    // Admission into an engine; arrival is set once.
    void admit(TimePoint arrival) noexcept;

    // Slice start: promotes Pending to Running and records the response
    // time the first time only.
    void begin_slice(TimePoint now) noexcept;

    // Subtract executed work and recompute progress.
    void consume(Duration executed) noexcept;

    // Transition to Completed and fix the completion metrics.
    void complete(TimePoint now) noexcept;

    void rename(std::string name) { name_ = std::move(name); }
    void describe(std::string description) { description_ = std::move(description); }
    void set_priority(int priority) noexcept { priority_ = priority; }

    // Keeps any deficit between burst and remaining time across the change.
    void change_burst_time(Duration burst_time) noexcept;

    void update_progress() noexcept;

    TaskId id_;
    std::string name_;
    std::string description_;
    int priority_;
    Duration burst_time_;
    Duration remaining_time_;
    TaskStatus status_{TaskStatus::Pending};
    int progress_{0};
    double created_at_;
    TimePoint arrival_time_;
    bool admitted_{false};
    TimePoint last_execution_time_;
    std::optional<Duration> response_time_;
    std::optional<TimePoint> completion_time_;
    Duration turnaround_time_;
    Duration waiting_time_;
};

} // namespace rrsched::core
