#include <rrsched/core/task.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace rrsched::core;
using rrsched::core::testing::make_spec;

class TaskTest : public ::testing::Test {
protected:
    Duration secs(double s) { return duration_from_seconds(s); }
};

TEST_F(TaskTest, ConstructionStartsPending) {
    Task task(make_spec("t1", 5, 3.0, "compile"));

    EXPECT_EQ(task.id(), "t1");
    EXPECT_EQ(task.name(), "compile");
    EXPECT_EQ(task.priority(), 5);
    EXPECT_EQ(task.burst_time(), secs(3.0));
    EXPECT_EQ(task.remaining_time(), secs(3.0));
    EXPECT_EQ(task.status(), TaskStatus::Pending);
    EXPECT_EQ(task.progress(), 0);
    EXPECT_FALSE(task.is_complete());
    EXPECT_FALSE(task.response_time().has_value());
    EXPECT_FALSE(task.completion_time().has_value());
    EXPECT_DOUBLE_EQ(task.created_at(), 1700000000.0);
}

TEST_F(TaskTest, CreatedAtDefaultsToNow) {
    TaskSpec spec = make_spec("t1", 1, 1.0);
    spec.created_at.reset();

    double before = unix_time_seconds();
    Task task(spec);
    double after = unix_time_seconds();

    EXPECT_GE(task.created_at(), before);
    EXPECT_LE(task.created_at(), after);
}

TEST_F(TaskTest, DescriptionDefaultsToEmpty) {
    Task task(make_spec("t1", 1, 1.0));
    EXPECT_TRUE(task.description().empty());
}

TEST_F(TaskTest, SnapshotReportsUnsetTimes) {
    Task task(make_spec("t1", 7, 2.0));
    TaskSnapshot snap = task.snapshot();

    EXPECT_EQ(snap.task_id, "t1");
    EXPECT_EQ(snap.priority, 7);
    EXPECT_EQ(snap.burst_time, secs(2.0));
    EXPECT_EQ(snap.remaining_time, secs(2.0));
    EXPECT_EQ(snap.completion_time, TimePoint::epoch());
    EXPECT_FALSE(snap.response_time.has_value());
    EXPECT_EQ(snap.waiting_time, Duration::zero());
    EXPECT_EQ(snap.turnaround_time, Duration::zero());
    EXPECT_EQ(snap.status, TaskStatus::Pending);
}

TEST_F(TaskTest, MovePreservesFields) {
    Task task(make_spec("t1", 3, 1.5, "moved"));
    Task other(std::move(task));

    EXPECT_EQ(other.id(), "t1");
    EXPECT_EQ(other.name(), "moved");
    EXPECT_EQ(other.burst_time(), secs(1.5));
}

// ============================================================================
// TaskStatus names
// ============================================================================

TEST(TaskStatusTest, ToString) {
    EXPECT_EQ(to_string(TaskStatus::Pending), "pending");
    EXPECT_EQ(to_string(TaskStatus::Running), "running");
    EXPECT_EQ(to_string(TaskStatus::Completed), "completed");
    EXPECT_EQ(to_string(TaskStatus::Cancelled), "cancelled");
}

TEST(TaskStatusTest, FromString) {
    EXPECT_EQ(task_status_from_string("running"), TaskStatus::Running);
    EXPECT_EQ(task_status_from_string("completed"), TaskStatus::Completed);
    EXPECT_FALSE(task_status_from_string("Running").has_value());
    EXPECT_FALSE(task_status_from_string("").has_value());
}

TEST(TaskPatchTest, Empty) {
    TaskPatch patch;
    EXPECT_TRUE(patch.empty());

    patch.priority = 3;
    EXPECT_FALSE(patch.empty());
}
