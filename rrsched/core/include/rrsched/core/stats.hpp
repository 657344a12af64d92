#pragma once

#include <rrsched/core/types.hpp>

#include <cstddef>

namespace rrsched::core {

class Task;

/// @brief Fleet-level scheduling metrics at one instant.
/// @ingroup core
///
/// Averages cover completed tasks only and are zero while none has
/// completed.
struct EngineStats {
    std::size_t total_tasks{0};
    std::size_t pending_tasks{0};
    std::size_t running_tasks{0};
    std::size_t completed_tasks{0};
    Duration avg_waiting_time;
    Duration avg_turnaround_time;
    Duration avg_response_time;
    Duration uptime;
    bool idle{true};
};

/// @brief Derives EngineStats from the engine's task table and completed list.
/// @ingroup core
///
/// Keeps no state beyond the running sums of one scan. The caller feeds
/// every task of the table to add_task() and every entry of the completed
/// list to add_completed(), then reads the result.
///
/// The average response time is divided by the number of completed tasks,
/// including any whose response time was never recorded, so such a task
/// pulls the average down instead of being excluded.
///
/// @see Engine::stats
class StatsAggregator {
public:
    /// @brief Count a task of the task table by status.
    void add_task(const Task& task) noexcept;

    /// @brief Accumulate the metrics of a task on the completed list.
    void add_completed(const Task& task) noexcept;

    /// @brief Produce the aggregate.
    /// @param uptime Time since the engine start.
    /// @param idle   Current idle flag of the engine.
    [[nodiscard]] EngineStats result(Duration uptime, bool idle) const noexcept;

private:
    std::size_t total_{0};
    std::size_t pending_{0};
    std::size_t running_{0};
    std::size_t completed_{0};
    Duration waiting_sum_;
    Duration turnaround_sum_;
    Duration response_sum_;
};

} // namespace rrsched::core
