#include <rrsched/core/engine.hpp>
#include <rrsched/core/error.hpp>

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

namespace rrsched::core {

namespace {

void require_positive(Duration value, const char* name) {
    if (value <= Duration::zero()) {
        throw ConfigError(std::string(name) + " must be positive");
    }
}

void write_task_fields(TraceWriter& w, const Task& task) {
    w.field("task_id", std::string_view{task.id()});
    w.field("name", std::string_view{task.name()});
    w.field("priority", static_cast<int64_t>(task.priority()));
    w.field("remaining_time", duration_to_seconds(task.remaining_time()));
    w.field("status", to_string(task.status()));
}

} // anonymous namespace

Engine::Engine(EngineConfig config, Clock& clock)
    : config_(config)
    , clock_(clock)
    , start_time_(clock.now()) {
    require_positive(config_.time_quantum, "time_quantum");
    require_positive(config_.idle_poll_interval, "idle_poll_interval");
    require_positive(config_.stop_timeout, "stop_timeout");
}

Engine::~Engine() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (worker_.joinable()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_requested_ = true;
        }
        work_cv_.notify_all();
        worker_.join();
    }
}

// =============================================================================
// Task management
// =============================================================================

TaskSnapshot Engine::add_task(TaskSpec spec) {
    auto task = std::make_shared<Task>(std::move(spec));
    TaskSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.contains(task->id())) {
            throw DuplicateTaskError(task->id());
        }

        TimePoint now = now_locked();
        task->admit(now);
        tasks_.emplace(task->id(), TaskEntry{task, next_sequence_++});
        ready_queue_.push(task);
        idle_ = false;
        snap = task->snapshot();

        trace(now, [&](TraceWriter& w) {
            w.type("task_added");
            write_task_fields(w, *task);
            w.field("burst_time", duration_to_seconds(task->burst_time()));
        });
    }
    work_cv_.notify_one();
    return snap;
}

std::optional<TaskSnapshot> Engine::get_task(const TaskId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.task->snapshot();
}

std::optional<TaskSnapshot> Engine::update_task(const TaskId& id, const TaskPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }

    Task& task = *it->second.task;
    if (task.is_complete()) {
        trace(now_locked(), [&](TraceWriter& w) {
            w.type("task_update_rejected");
            write_task_fields(w, task);
        });
        return task.snapshot();
    }

    if (patch.name) {
        task.rename(*patch.name);
    }
    if (patch.description) {
        task.describe(*patch.description);
    }
    if (patch.priority) {
        task.set_priority(*patch.priority);
        ready_queue_.reprioritize(task.id());
    }
    // Burst time is frozen once the first slice has started.
    if (patch.burst_time && task.status() == TaskStatus::Pending) {
        task.change_burst_time(*patch.burst_time);
    }

    trace(now_locked(), [&](TraceWriter& w) {
        w.type("task_updated");
        write_task_fields(w, task);
        w.field("burst_time", duration_to_seconds(task.burst_time()));
    });
    return task.snapshot();
}

bool Engine::delete_task(const TaskId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return false;
    }

    std::shared_ptr<Task> task = it->second.task;
    if (task->is_complete()) {
        std::erase(completed_, task);
    } else {
        ready_queue_.remove(*task);
    }
    tasks_.erase(it);

    trace(now_locked(), [&](TraceWriter& w) {
        w.type("task_deleted");
        w.field("task_id", std::string_view{id});
    });

    if (ready_queue_.empty() && current_task_.expired()) {
        idle_cv_.notify_all();
    }
    return true;
}

std::vector<TaskSnapshot> Engine::list_tasks() const {
    std::vector<std::pair<uint64_t, TaskId>> keys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        keys.reserve(tasks_.size());
        for (const auto& [id, entry] : tasks_) {
            keys.emplace_back(entry.sequence, id);
        }
    }
    std::sort(keys.begin(), keys.end());

    // The table may change between the two phases: tasks deleted in the
    // meantime are skipped, tasks added in the meantime are not listed.
    std::vector<TaskSnapshot> result;
    result.reserve(keys.size());
    for (const auto& [sequence, id] : keys) {
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tasks_.find(id);
            if (it != tasks_.end()) {
                result.push_back(it->second.task->snapshot());
            }
        } catch (const std::exception& e) {
            TimePoint now = time_from_epoch(elapsed());
            trace(now, [&](TraceWriter& w) {
                w.type("task_retrieval_error");
                w.field("task_id", std::string_view{id});
                w.field("error", std::string_view{e.what()});
            });
        }
    }
    return result;
}

// =============================================================================
// Observation
// =============================================================================

EngineStats Engine::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StatsAggregator aggregator;
    for (const auto& [id, entry] : tasks_) {
        aggregator.add_task(*entry.task);
    }
    for (const auto& task : completed_) {
        aggregator.add_completed(*task);
    }
    return aggregator.result(now_locked().time_since_epoch(), idle_);
}

std::vector<ExecutionRecord> Engine::execution_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return execution_sequence_;
}

std::vector<TaskId> Engine::ready_queue_order() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_queue_.ids();
}

std::vector<TaskId> Engine::completed_order() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskId> ids;
    ids.reserve(completed_.size());
    for (const auto& task : completed_) {
        ids.push_back(task->id());
    }
    return ids;
}

std::optional<TaskId> Engine::current_task() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto task = current_task_.lock()) {
        return task->id();
    }
    return std::nullopt;
}

bool Engine::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_;
}

Duration Engine::elapsed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_locked().time_since_epoch();
}

TimePoint Engine::now_locked() const {
    return time_from_epoch(clock_.now() - start_time_);
}

// =============================================================================
// Execution loop
// =============================================================================

bool Engine::step() {
    require_stopped("step");
    if (run_iteration()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    note_idle_locked();
    return false;
}

void Engine::run() {
    require_stopped("run");
    while (run_iteration()) {
    }
    std::lock_guard<std::mutex> lock(mutex_);
    note_idle_locked();
}

void Engine::run(std::function<bool()> stop_condition) {
    require_stopped("run");
    while (!stop_condition()) {
        if (!run_iteration()) {
            std::lock_guard<std::mutex> lock(mutex_);
            note_idle_locked();
            return;
        }
    }
}

bool Engine::run_iteration() {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    auto slice = begin_slice();
    if (!slice) {
        return false;
    }

    // The simulated work: no lock is held, so callers may update or delete
    // the task while its slice is in progress.
    clock_.sleep_for(slice->length);

    end_slice(*slice);
    return true;
}

std::optional<Engine::Slice> Engine::begin_slice() {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<Task> task = ready_queue_.rotate_head();
    if (!task) {
        return std::nullopt;
    }

    idle_ = false;
    current_task_ = task;

    TimePoint now = now_locked();
    task->begin_slice(now);

    // A remaining time driven negative by a burst update gets an empty
    // slice and completes in end_slice().
    Duration length = std::max(std::min(config_.time_quantum, task->remaining_time()),
                               Duration::zero());

    trace(now, [&](TraceWriter& w) {
        w.type("slice_start");
        write_task_fields(w, *task);
        w.field("slice", duration_to_seconds(length));
    });
    return Slice{std::move(task), now, length};
}

void Engine::end_slice(const Slice& slice) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    std::lock_guard<std::mutex> lock(mutex_);
    Task& task = *slice.task;

    task.consume(slice.length);
    execution_sequence_.push_back(ExecutionRecord{task.id(), slice.start, slice.start + slice.length});

    TimePoint now = now_locked();
    trace(now, [&](TraceWriter& w) {
        w.type("slice_end");
        write_task_fields(w, task);
        w.field("progress", static_cast<uint64_t>(task.progress()));
    });

    if (task.remaining_time() <= Duration::zero()) {
        task.complete(now);

        // A concurrent delete may already have dropped the task; only
        // bookkeep it if it is still the task stored under its id.
        ready_queue_.remove(task);
        auto it = tasks_.find(task.id());
        bool still_owned = it != tasks_.end() && it->second.task == slice.task;
        if (still_owned && std::find(completed_.begin(), completed_.end(), slice.task) == completed_.end()) {
            completed_.push_back(slice.task);
        }

        trace(now, [&](TraceWriter& w) {
            w.type("task_completed");
            w.field("task_id", std::string_view{task.id()});
            w.field("turnaround_time", duration_to_seconds(task.turnaround_time()));
            w.field("waiting_time", duration_to_seconds(task.waiting_time()));
            w.field("response_time", duration_to_seconds(task.response_time().value_or(Duration::zero())));
        });
    }

    current_task_.reset();
    if (ready_queue_.empty()) {
        idle_cv_.notify_all();
    }
}

void Engine::note_idle_locked() {
    if (idle_) {
        return;
    }
    idle_ = true;
    trace(now_locked(), [](TraceWriter& w) { w.type("scheduler_idle"); });
}

bool Engine::wait_for_work() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_ && ready_queue_.empty()) {
        note_idle_locked();
        work_cv_.wait_for(lock, to_chrono(config_.idle_poll_interval));
    }
    return !stop_requested_;
}

void Engine::loop() {
    while (wait_for_work()) {
        run_iteration();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_exited_ = true;
    }
    exit_cv_.notify_all();
}

void Engine::require_stopped(const char* operation) const {
    if (running_.load()) {
        throw InvalidStateError(std::string("cannot call ") + operation +
                                "() while the execution loop is running");
    }
}

// =============================================================================
// Background drive
// =============================================================================

void Engine::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) {
        return;
    }

    TimePoint now;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        loop_exited_ = false;
        start_time_ = clock_.now();
        now = now_locked();
    }
    trace(now, [this](TraceWriter& w) {
        w.type("scheduler_started");
        w.field("time_quantum", duration_to_seconds(config_.time_quantum));
    });

    worker_ = std::thread([this] { loop(); });
    running_.store(true);
}

bool Engine::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!worker_.joinable()) {
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    work_cv_.notify_all();

    bool exited = false;
    TimePoint now;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        exited = exit_cv_.wait_for(lock, to_chrono(config_.stop_timeout),
                                   [this] { return loop_exited_; });
        now = now_locked();
    }

    if (!exited) {
        trace(now, [this](TraceWriter& w) {
            w.type("shutdown_timeout");
            w.field("stop_timeout", duration_to_seconds(config_.stop_timeout));
        });
        return false;
    }

    worker_.join();
    running_.store(false);
    trace(now, [](TraceWriter& w) { w.type("scheduler_stopped"); });
    return true;
}

bool Engine::wait_until_idle(Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, to_chrono(timeout), [this] {
        return ready_queue_.empty() && current_task_.expired();
    });
}

void Engine::set_trace_writer(TraceWriter* writer) {
    std::lock_guard<std::mutex> lock(trace_mutex_);
    trace_writer_ = writer;
}

} // namespace rrsched::core
