#pragma once

#include <rrsched/core/clock.hpp>
#include <rrsched/core/ready_queue.hpp>
#include <rrsched/core/stats.hpp>
#include <rrsched/core/task.hpp>
#include <rrsched/core/trace_writer.hpp>
#include <rrsched/core/types.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rrsched::core {

/// @brief Construction-time configuration of an Engine.
/// @ingroup core_engine
struct EngineConfig {
    /// Maximum work granted to a task per slice.
    Duration time_quantum{duration_from_seconds(1.0)};
    /// Longest the idle loop waits before re-checking the ready queue.
    Duration idle_poll_interval{duration_from_seconds(0.1)};
    /// Bound on how long stop() waits for the execution loop to exit.
    Duration stop_timeout{duration_from_seconds(1.0)};
};

/// @brief One executed slice in the engine's audit log.
/// @ingroup core_engine
struct ExecutionRecord {
    TaskId task_id;
    TimePoint start;
    TimePoint end;  ///< Always start + the work granted for the slice.
};

/// @brief Priority-aware, time-sliced round-robin scheduling engine.
///
/// The Engine owns the task table, the ready queue, the completed list and
/// the execution audit log. An execution loop repeatedly takes the head of
/// the ready queue, grants it one slice of at most time_quantum() work,
/// and either leaves it queued at its rotated position or moves it to the
/// completed list.
///
/// The loop is driven either by a background thread (start() / stop()) or
/// synchronously by the caller (step() / run()), never both at once:
///
/// @code
/// core::VirtualClock clock;
/// core::Engine engine({.time_quantum = core::duration_from_seconds(2.0)}, clock);
/// engine.add_task({.id = "a", .name = "backup", .priority = 5,
///                  .burst_time = core::duration_from_seconds(3.0)});
/// engine.run();  // drains the ready queue, advancing the virtual clock
/// @endcode
///
/// All state is guarded by one mutex, held only for short critical
/// sections. It is never held while a slice's work is simulated, so a
/// caller may update or delete the task that is mid-slice; the loop
/// re-checks queue and table membership before touching them again.
///
/// The Engine is non-copyable and non-movable.
///
/// @see Clock, ReadyQueue, Task, TraceWriter
/// @ingroup core_engine
class Engine {
public:
    /// @brief Construct an engine.
    /// @param config Quantum and loop timing.
    /// @param clock  Time source; must outlive the engine.
    /// @throws ConfigError if any configured duration is not positive.
    explicit Engine(EngineConfig config = {}, Clock& clock = system_clock());

    /// @brief Stops the background loop, waiting for an in-flight slice.
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    /// @name Task management
    /// @{

    /// @brief Admit a task: set its arrival time and queue it.
    /// @param spec Identity and scheduling parameters.
    /// @return Snapshot of the stored task.
    /// @throws DuplicateTaskError if the id is already in the task table.
    TaskSnapshot add_task(TaskSpec spec);

    /// @brief Look up a task.
    /// @return Snapshot, or std::nullopt if the id is unknown.
    [[nodiscard]] std::optional<TaskSnapshot> get_task(const TaskId& id) const;

    /// @brief Apply a partial update to a task.
    ///
    /// Updates to a completed task are ignored as a whole. A priority change
    /// re-inserts the task into the ready queue as a fresh arrival at its
    /// new priority. A burst time change only applies while the task is
    /// pending and keeps any difference between burst and remaining time.
    ///
    /// @return Snapshot after the update, or std::nullopt if the id is unknown.
    std::optional<TaskSnapshot> update_task(const TaskId& id, const TaskPatch& patch);

    /// @brief Remove a task from the table and from the ready queue or completed list.
    ///
    /// Safe to call while the task is mid-slice.
    ///
    /// @return False if the id is unknown.
    bool delete_task(const TaskId& id);

    /// @brief Snapshot every task in insertion order.
    ///
    /// Tasks are copied one at a time; a task that fails to copy is logged
    /// as a `task_retrieval_error` event and skipped.
    [[nodiscard]] std::vector<TaskSnapshot> list_tasks() const;

    /// @}

    /// @name Observation
    /// @{

    /// @brief Counts and averages over the task table and completed list.
    [[nodiscard]] EngineStats stats() const;

    /// @brief Copy of the slice audit log, in execution order.
    [[nodiscard]] std::vector<ExecutionRecord> execution_sequence() const;

    /// @brief Ids in ready-queue order (head first).
    [[nodiscard]] std::vector<TaskId> ready_queue_order() const;

    /// @brief Ids on the completed list, in completion order.
    [[nodiscard]] std::vector<TaskId> completed_order() const;

    /// @brief Id of the task whose slice is in progress, if any.
    [[nodiscard]] std::optional<TaskId> current_task() const;

    /// @brief True iff the ready queue was empty at the loop's last check.
    [[nodiscard]] bool idle() const;

    /// @brief Time since the engine start.
    [[nodiscard]] Duration elapsed() const;

    [[nodiscard]] Duration time_quantum() const noexcept { return config_.time_quantum; }

    /// @}

    /// @name Synchronous drive
    /// Must not be used while the background loop is running.
    /// @{

    /// @brief Run exactly one select/execute/finalize iteration.
    /// @return False if the ready queue was empty (nothing ran).
    /// @throws InvalidStateError if the background loop is running.
    bool step();

    /// @brief Run iterations until the ready queue is empty.
    /// @throws InvalidStateError if the background loop is running.
    void run();

    /// @brief Run iterations until the queue is empty or the condition holds.
    /// @param stop_condition Evaluated before each iteration.
    /// @throws InvalidStateError if the background loop is running.
    void run(std::function<bool()> stop_condition);

    /// @}

    /// @name Background drive
    /// @{

    /// @brief Reset the start time and launch the execution loop thread.
    ///
    /// No-op if the loop is already running.
    void start();

    /// @brief Ask the execution loop to exit and wait for it, bounded by
    ///        EngineConfig::stop_timeout.
    ///
    /// On timeout a `shutdown_timeout` event is traced and the loop is left
    /// to finish its slice; the engine stays marked as running until a later
    /// stop() or the destructor joins it.
    ///
    /// @return True if the loop has terminated (or was not running).
    bool stop();

    /// @brief True while the background loop owns the engine.
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    /// @brief Block until the ready queue is empty and no slice is in flight.
    /// @param timeout Upper bound on the wait.
    /// @return False if the timeout expired first.
    bool wait_until_idle(Duration timeout);

    /// @}

    /// @brief Install the event sink used as the engine's log.
    ///
    /// The Engine does not own the writer. Pass nullptr to disable tracing.
    void set_trace_writer(TraceWriter* writer);

private:
    struct TaskEntry {
        std::shared_ptr<Task> task;
        uint64_t sequence;
    };

    struct Slice {
        std::shared_ptr<Task> task;
        TimePoint start;
        Duration length;
    };

    bool run_iteration();
    std::optional<Slice> begin_slice();
    void end_slice(const Slice& slice);
    void loop();
    bool wait_for_work();
    void note_idle_locked();
    void require_stopped(const char* operation) const;

    [[nodiscard]] TimePoint now_locked() const;

    template<typename F>
    void trace(TimePoint when, F&& func) const;

    EngineConfig config_;
    Clock& clock_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::condition_variable exit_cv_;

    std::unordered_map<TaskId, TaskEntry> tasks_;
    uint64_t next_sequence_{0};
    ReadyQueue ready_queue_;
    std::vector<std::shared_ptr<Task>> completed_;
    std::vector<ExecutionRecord> execution_sequence_;
    std::weak_ptr<Task> current_task_;
    TimePoint start_time_;
    bool idle_{true};
    bool stop_requested_{false};
    bool loop_exited_{true};

    std::mutex lifecycle_mutex_;
    std::thread worker_;
    std::atomic<bool> running_{false};

    mutable std::mutex trace_mutex_;
    TraceWriter* trace_writer_{nullptr};
};

template<typename F>
void Engine::trace(TimePoint when, F&& func) const {
    std::lock_guard<std::mutex> lock(trace_mutex_);
    if (trace_writer_) {
        trace_writer_->begin(when);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace rrsched::core
