#include <rrsched/core/stats.hpp>
#include <rrsched/core/task.hpp>

#include <cstdint>

namespace rrsched::core {

namespace {

Duration average(Duration sum, std::size_t count) noexcept {
    if (count == 0) {
        return Duration::zero();
    }
    return duration_from_nanoseconds(duration_to_nanoseconds(sum) / static_cast<int64_t>(count));
}

} // anonymous namespace

void StatsAggregator::add_task(const Task& task) noexcept {
    ++total_;
    switch (task.status()) {
        case TaskStatus::Pending:
            ++pending_;
            break;
        case TaskStatus::Running:
            ++running_;
            break;
        case TaskStatus::Completed:
        case TaskStatus::Cancelled:
            break;
    }
}

void StatsAggregator::add_completed(const Task& task) noexcept {
    ++completed_;
    waiting_sum_ += task.waiting_time();
    turnaround_sum_ += task.turnaround_time();
    if (auto response = task.response_time(); response && *response >= Duration::zero()) {
        response_sum_ += *response;
    }
}

EngineStats StatsAggregator::result(Duration uptime, bool idle) const noexcept {
    EngineStats stats;
    stats.total_tasks = total_;
    stats.pending_tasks = pending_;
    stats.running_tasks = running_;
    stats.completed_tasks = completed_;
    stats.avg_waiting_time = average(waiting_sum_, completed_);
    stats.avg_turnaround_time = average(turnaround_sum_, completed_);
    // Divided by every completed task, not only those with a response time.
    stats.avg_response_time = average(response_sum_, completed_);
    stats.uptime = uptime;
    stats.idle = idle;
    return stats;
}

} // namespace rrsched::core
