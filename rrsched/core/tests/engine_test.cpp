#include <rrsched/core/engine.hpp>
#include <rrsched/core/error.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace rrsched::core;
using rrsched::core::testing::make_spec;
using rrsched::core::testing::MockTraceWriter;

class EngineTest : public ::testing::Test {
protected:
    Duration secs(double s) { return duration_from_seconds(s); }
    TimePoint time(double s) { return time_from_seconds(s); }

    EngineConfig config() {
        EngineConfig cfg;
        cfg.time_quantum = secs(2.0);
        return cfg;
    }

    VirtualClock clock;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(EngineTest, InitialState) {
    Engine engine(config(), clock);

    EXPECT_TRUE(engine.idle());
    EXPECT_FALSE(engine.is_running());
    EXPECT_EQ(engine.time_quantum(), secs(2.0));
    EXPECT_EQ(engine.elapsed(), Duration::zero());
    EXPECT_TRUE(engine.list_tasks().empty());
    EXPECT_TRUE(engine.execution_sequence().empty());
    EXPECT_FALSE(engine.current_task().has_value());
}

TEST_F(EngineTest, DefaultQuantumIsOneSecond) {
    Engine engine(EngineConfig{}, clock);
    EXPECT_EQ(engine.time_quantum(), secs(1.0));
}

TEST_F(EngineTest, RejectsNonPositiveQuantum) {
    EngineConfig cfg;
    cfg.time_quantum = Duration::zero();
    EXPECT_THROW({ Engine engine(cfg, clock); }, ConfigError);

    cfg.time_quantum = secs(-1.0);
    EXPECT_THROW({ Engine engine(cfg, clock); }, ConfigError);
}

TEST_F(EngineTest, RejectsNonPositiveTimeouts) {
    EngineConfig cfg;
    cfg.idle_poll_interval = Duration::zero();
    EXPECT_THROW({ Engine engine(cfg, clock); }, ConfigError);

    cfg = EngineConfig{};
    cfg.stop_timeout = secs(-0.1);
    EXPECT_THROW({ Engine engine(cfg, clock); }, ConfigError);
}

TEST_F(EngineTest, ConfigErrorIsSchedulerError) {
    EngineConfig cfg;
    cfg.time_quantum = Duration::zero();
    EXPECT_THROW({ Engine engine(cfg, clock); }, SchedulerError);
}

// ============================================================================
// add / get
// ============================================================================

TEST_F(EngineTest, AddTaskSetsArrivalFromElapsedTime) {
    Engine engine(config(), clock);
    clock.advance(secs(3.0));

    TaskSnapshot snap = engine.add_task(make_spec("t1", 5, 2.0));

    EXPECT_EQ(snap.task_id, "t1");
    EXPECT_EQ(snap.arrival_time, time(3.0));
    EXPECT_EQ(snap.status, TaskStatus::Pending);
    EXPECT_EQ(snap.remaining_time, secs(2.0));
    EXPECT_FALSE(engine.idle());
    EXPECT_EQ(engine.ready_queue_order(), (std::vector<TaskId>{"t1"}));
}

TEST_F(EngineTest, AddDuplicateIdThrows) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("t1", 5, 2.0));

    EXPECT_THROW(engine.add_task(make_spec("t1", 1, 1.0)), DuplicateTaskError);
    EXPECT_EQ(engine.list_tasks().size(), 1U);
    EXPECT_EQ(engine.get_task("t1")->priority, 5);
}

TEST_F(EngineTest, GetTask) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("t1", 5, 2.0, "build"));

    auto found = engine.get_task("t1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "build");

    EXPECT_FALSE(engine.get_task("missing").has_value());
}

TEST_F(EngineTest, ListTasksInInsertionOrder) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("zeta", 1, 1.0));
    engine.add_task(make_spec("alpha", 9, 1.0));
    engine.add_task(make_spec("mid", 5, 1.0));

    auto tasks = engine.list_tasks();
    ASSERT_EQ(tasks.size(), 3U);
    EXPECT_EQ(tasks[0].task_id, "zeta");
    EXPECT_EQ(tasks[1].task_id, "alpha");
    EXPECT_EQ(tasks[2].task_id, "mid");
}

// ============================================================================
// update
// ============================================================================

TEST_F(EngineTest, UpdateUnknownTask) {
    Engine engine(config(), clock);
    TaskPatch patch;
    patch.name = "renamed";
    EXPECT_FALSE(engine.update_task("missing", patch).has_value());
}

TEST_F(EngineTest, UpdateFieldsIndependently) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("t1", 5, 2.0, "before"));

    TaskPatch patch;
    patch.description = "now described";
    auto updated = engine.update_task("t1", patch);

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->name, "before");
    EXPECT_EQ(updated->description, "now described");
    EXPECT_EQ(updated->priority, 5);
    EXPECT_EQ(updated->burst_time, secs(2.0));
}

TEST_F(EngineTest, UpdatePriorityResortsQueue) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("a", 5, 1.0));
    engine.add_task(make_spec("b", 3, 1.0));
    engine.add_task(make_spec("c", 1, 1.0));

    TaskPatch patch;
    patch.priority = 10;
    engine.update_task("c", patch);
    EXPECT_EQ(engine.ready_queue_order(), (std::vector<TaskId>{"c", "a", "b"}));

    patch.priority = 3;
    engine.update_task("c", patch);
    // Fresh arrival at priority 3: behind "b".
    EXPECT_EQ(engine.ready_queue_order(), (std::vector<TaskId>{"a", "b", "c"}));
}

TEST_F(EngineTest, UpdateBurstTimeWhilePending) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("t1", 5, 2.0));

    TaskPatch patch;
    patch.burst_time = secs(5.0);
    auto updated = engine.update_task("t1", patch);

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->burst_time, secs(5.0));
    EXPECT_EQ(updated->remaining_time, secs(5.0));
}

TEST_F(EngineTest, UpdateBurstTimeIgnoredOnceRunning) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("t1", 5, 3.0));
    ASSERT_TRUE(engine.step());

    TaskPatch patch;
    patch.burst_time = secs(10.0);
    patch.name = "renamed";
    auto updated = engine.update_task("t1", patch);

    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->name, "renamed");
    EXPECT_EQ(updated->burst_time, secs(3.0));
    EXPECT_EQ(updated->remaining_time, secs(1.0));
    EXPECT_EQ(updated->status, TaskStatus::Running);
}

// ============================================================================
// delete
// ============================================================================

TEST_F(EngineTest, DeleteTwiceReturnsFoundThenNotFound) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("t1", 5, 2.0));

    EXPECT_TRUE(engine.delete_task("t1"));
    EXPECT_FALSE(engine.delete_task("t1"));
    EXPECT_FALSE(engine.get_task("t1").has_value());
    EXPECT_TRUE(engine.ready_queue_order().empty());
}

TEST_F(EngineTest, DeleteCompletedTask) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("t1", 5, 1.0));
    engine.run();
    ASSERT_EQ(engine.completed_order(), (std::vector<TaskId>{"t1"}));

    EXPECT_TRUE(engine.delete_task("t1"));
    EXPECT_TRUE(engine.completed_order().empty());
    EXPECT_TRUE(engine.list_tasks().empty());
}

TEST_F(EngineTest, IdCanBeReusedAfterDelete) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("t1", 5, 1.0, "first"));
    ASSERT_TRUE(engine.delete_task("t1"));

    engine.add_task(make_spec("t1", 5, 1.0, "second"));
    EXPECT_EQ(engine.get_task("t1")->name, "second");
}

// ============================================================================
// Trace events
// ============================================================================

TEST_F(EngineTest, NullWriterSafety) {
    Engine engine(config(), clock);
    engine.add_task(make_spec("t1", 5, 1.0));
    engine.run();
    EXPECT_EQ(engine.completed_order().size(), 1U);
}

TEST_F(EngineTest, TracesTaskLifecycle) {
    Engine engine(config(), clock);
    MockTraceWriter writer;
    engine.set_trace_writer(&writer);

    engine.add_task(make_spec("t1", 5, 3.0));
    engine.run();

    std::vector<std::string> types;
    for (const auto& record : writer.records()) {
        types.push_back(record.type_name);
    }
    EXPECT_EQ(types, (std::vector<std::string>{
                         "task_added", "slice_start", "slice_end", "slice_start",
                         "slice_end", "task_completed", "scheduler_idle"}));

    auto completed = writer.of_type("task_completed");
    ASSERT_EQ(completed.size(), 1U);
    EXPECT_EQ(completed[0].time, time(3.0));
    EXPECT_EQ(completed[0].get("task_id"), "t1");

    auto ends = writer.of_type("slice_end");
    ASSERT_EQ(ends.size(), 2U);
    EXPECT_EQ(ends[0].time, time(2.0));
    EXPECT_EQ(ends[0].get("progress"), "66");
    EXPECT_EQ(ends[0].get("status"), "running");
}

TEST_F(EngineTest, TracesUpdatesAndDeletes) {
    Engine engine(config(), clock);
    MockTraceWriter writer;
    engine.set_trace_writer(&writer);

    engine.add_task(make_spec("t1", 5, 1.0));
    TaskPatch patch;
    patch.priority = 7;
    engine.update_task("t1", patch);
    engine.run();
    engine.update_task("t1", patch);
    engine.delete_task("t1");

    auto updated = writer.of_type("task_updated");
    ASSERT_EQ(updated.size(), 1U);
    EXPECT_EQ(updated[0].get("priority"), "7");

    EXPECT_EQ(writer.of_type("task_update_rejected").size(), 1U);
    ASSERT_EQ(writer.of_type("task_deleted").size(), 1U);
    EXPECT_EQ(writer.of_type("task_deleted")[0].get("task_id"), "t1");
}

TEST_F(EngineTest, IdleTracedOncePerTransition) {
    Engine engine(config(), clock);
    MockTraceWriter writer;
    engine.set_trace_writer(&writer);

    EXPECT_FALSE(engine.step());
    EXPECT_FALSE(engine.step());
    EXPECT_TRUE(writer.of_type("scheduler_idle").empty());

    engine.add_task(make_spec("t1", 5, 1.0));
    engine.run();
    engine.run();
    EXPECT_EQ(writer.of_type("scheduler_idle").size(), 1U);
}

TEST_F(EngineTest, DetachWriter) {
    Engine engine(config(), clock);
    MockTraceWriter writer;
    engine.set_trace_writer(&writer);
    engine.add_task(make_spec("t1", 5, 1.0));

    engine.set_trace_writer(nullptr);
    engine.run();

    EXPECT_EQ(writer.records().size(), 1U);
}
