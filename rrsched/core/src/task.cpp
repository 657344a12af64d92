#include <rrsched/core/task.hpp>
#include <rrsched/core/clock.hpp>

#include <algorithm>
#include <utility>

namespace rrsched::core {

std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:   return "pending";
        case TaskStatus::Running:   return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<TaskStatus> task_status_from_string(std::string_view name) noexcept {
    if (name == "pending") {
        return TaskStatus::Pending;
    }
    if (name == "running") {
        return TaskStatus::Running;
    }
    if (name == "completed") {
        return TaskStatus::Completed;
    }
    if (name == "cancelled") {
        return TaskStatus::Cancelled;
    }
    return std::nullopt;
}

Task::Task(TaskSpec spec)
    : id_(std::move(spec.id))
    , name_(std::move(spec.name))
    , description_(std::move(spec.description))
    , priority_(spec.priority)
    , burst_time_(spec.burst_time)
    , remaining_time_(spec.burst_time)
    , created_at_(spec.created_at ? *spec.created_at : unix_time_seconds()) {}

TaskSnapshot Task::snapshot() const {
    TaskSnapshot snap;
    snap.task_id = id_;
    snap.name = name_;
    snap.description = description_;
    snap.priority = priority_;
    snap.burst_time = burst_time_;
    snap.created_at = created_at_;
    snap.arrival_time = arrival_time_;
    snap.remaining_time = remaining_time_;
    snap.waiting_time = waiting_time_;
    snap.turnaround_time = turnaround_time_;
    snap.completion_time = completion_time_.value_or(TimePoint::epoch());
    snap.response_time = response_time_;
    snap.last_execution_time = last_execution_time_;
    snap.status = status_;
    snap.progress = progress_;
    return snap;
}

void Task::admit(TimePoint arrival) noexcept {
    if (admitted_) {
        return;
    }
    arrival_time_ = arrival;
    admitted_ = true;
}

void Task::begin_slice(TimePoint now) noexcept {
    if (status_ == TaskStatus::Pending) {
        status_ = TaskStatus::Running;
    }
    if (!response_time_) {
        response_time_ = now - arrival_time_;
    }
    last_execution_time_ = now;
}

void Task::consume(Duration executed) noexcept {
    remaining_time_ -= executed;
    update_progress();
}

void Task::complete(TimePoint now) noexcept {
    if (completion_time_) {
        return;
    }
    status_ = TaskStatus::Completed;
    completion_time_ = now;
    turnaround_time_ = now - arrival_time_;
    // Busy time is burst minus whatever is left, so a negative remaining
    // time (see change_burst_time) is carried into the waiting time as is.
    waiting_time_ = turnaround_time_ - (burst_time_ - remaining_time_);
    progress_ = 100;
}

void Task::change_burst_time(Duration burst_time) noexcept {
    remaining_time_ = remaining_time_ - burst_time_ + burst_time;
    burst_time_ = burst_time;
    update_progress();
}

void Task::update_progress() noexcept {
    if (status_ == TaskStatus::Completed) {
        progress_ = 100;
        return;
    }
    int64_t burst_ns = duration_to_nanoseconds(burst_time_);
    if (burst_ns <= 0) {
        return;
    }
    int64_t consumed_ns = duration_to_nanoseconds(burst_time_ - remaining_time_);
    auto pct = static_cast<int>(100 * consumed_ns / burst_ns);
    progress_ = std::clamp(pct, 0, 100);
}

} // namespace rrsched::core
