#include <rrsched/io/trace_writers.hpp>

#include <rrsched/core/clock.hpp>
#include <rrsched/core/engine.hpp>

#include <gtest/gtest.h>
#include <rapidjson/document.h>

#include <sstream>
#include <string>
#include <variant>

using namespace rrsched::io;
using namespace rrsched::core;

class TraceWritersTest : public ::testing::Test {
protected:
    TimePoint time(double s) { return time_from_seconds(s); }

    static TaskSpec spec(const std::string& id, int priority, double burst) {
        TaskSpec s;
        s.id = id;
        s.name = "job " + id;
        s.priority = priority;
        s.burst_time = duration_from_seconds(burst);
        s.created_at = 0.0;
        return s;
    }
};

// ============================================================================
// NullTraceWriter
// ============================================================================

TEST_F(TraceWritersTest, NullWriterAcceptsEverything) {
    NullTraceWriter writer;
    writer.begin(time(1.0));
    writer.type("anything");
    writer.field("d", 1.0);
    writer.field("u", uint64_t{2});
    writer.field("i", int64_t{-3});
    writer.field("s", std::string_view{"x"});
    writer.end();
    SUCCEED();
}

// ============================================================================
// JsonTraceWriter
// ============================================================================

TEST_F(TraceWritersTest, JsonEmptyArray) {
    std::ostringstream out;
    {
        JsonTraceWriter writer(out);
    }

    rapidjson::Document doc;
    doc.Parse(out.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    EXPECT_EQ(doc.Size(), 0U);
}

TEST_F(TraceWritersTest, JsonRecordFields) {
    std::ostringstream out;
    JsonTraceWriter writer(out);

    writer.begin(time(1.5));
    writer.type("slice_start");
    writer.field("task_id", std::string_view{"task-\"1\""});
    writer.field("priority", int64_t{-2});
    writer.field("progress", uint64_t{66});
    writer.field("slice", 0.25);
    writer.end();
    writer.finalize();

    rapidjson::Document doc;
    doc.Parse(out.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 1U);

    const auto& record = doc[0];
    EXPECT_DOUBLE_EQ(record["time"].GetDouble(), 1.5);
    EXPECT_STREQ(record["type"].GetString(), "slice_start");
    EXPECT_STREQ(record["task_id"].GetString(), "task-\"1\"");
    EXPECT_EQ(record["priority"].GetInt64(), -2);
    EXPECT_EQ(record["progress"].GetUint64(), 66U);
    EXPECT_DOUBLE_EQ(record["slice"].GetDouble(), 0.25);
}

TEST_F(TraceWritersTest, JsonFinalizeIsIdempotent) {
    std::ostringstream out;
    JsonTraceWriter writer(out);
    writer.begin(time(0.0));
    writer.type("task_added");
    writer.end();
    writer.finalize();
    writer.finalize();

    // Records after finalize are dropped.
    writer.begin(time(1.0));
    writer.type("late");
    writer.end();

    rapidjson::Document doc;
    doc.Parse(out.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc.Size(), 1U);
}

TEST_F(TraceWritersTest, JsonEngineRun) {
    std::ostringstream out;
    VirtualClock clock;
    JsonTraceWriter writer(out);
    {
        EngineConfig cfg;
        cfg.time_quantum = duration_from_seconds(2.0);
        Engine engine(cfg, clock);
        engine.set_trace_writer(&writer);
        engine.add_task(spec("a", 5, 3.0));
        engine.run();
    }
    writer.finalize();

    rapidjson::Document doc;
    doc.Parse(out.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 7U);
    EXPECT_STREQ(doc[0]["type"].GetString(), "task_added");
    EXPECT_STREQ(doc[5]["type"].GetString(), "task_completed");
    EXPECT_DOUBLE_EQ(doc[5]["time"].GetDouble(), 3.0);
    EXPECT_DOUBLE_EQ(doc[5]["turnaround_time"].GetDouble(), 3.0);
}

// ============================================================================
// MemoryTraceWriter
// ============================================================================

TEST_F(TraceWritersTest, MemoryStoresTypedFields) {
    MemoryTraceWriter writer;
    writer.begin(time(2.0));
    writer.type("slice_end");
    writer.field("remaining_time", 1.0);
    writer.field("progress", uint64_t{50});
    writer.field("priority", int64_t{4});
    writer.field("task_id", std::string_view{"a"});
    writer.end();

    ASSERT_EQ(writer.records().size(), 1U);
    const auto& record = writer.records()[0];
    EXPECT_DOUBLE_EQ(record.time, 2.0);
    EXPECT_EQ(record.type, "slice_end");
    EXPECT_DOUBLE_EQ(std::get<double>(record.fields.at("remaining_time")), 1.0);
    EXPECT_EQ(std::get<uint64_t>(record.fields.at("progress")), 50U);
    EXPECT_EQ(std::get<int64_t>(record.fields.at("priority")), 4);
    EXPECT_EQ(std::get<std::string>(record.fields.at("task_id")), "a");
}

TEST_F(TraceWritersTest, MemoryRecordsOfType) {
    VirtualClock clock;
    MemoryTraceWriter writer;
    Engine engine(EngineConfig{}, clock);
    engine.set_trace_writer(&writer);

    engine.add_task(spec("a", 5, 1.0));
    engine.add_task(spec("b", 5, 1.0));
    engine.run();

    auto completed = writer.records_of_type("task_completed");
    ASSERT_EQ(completed.size(), 2U);
    EXPECT_EQ(std::get<std::string>(completed[0].fields.at("task_id")), "a");
    EXPECT_EQ(std::get<std::string>(completed[1].fields.at("task_id")), "b");
    EXPECT_DOUBLE_EQ(std::get<double>(completed[1].fields.at("response_time")), 1.0);

    writer.clear();
    EXPECT_TRUE(writer.records().empty());
}

// ============================================================================
// TextualTraceWriter
// ============================================================================

TEST_F(TraceWritersTest, TextualLineFormat) {
    std::ostringstream out;
    TextualTraceWriter writer(out, false);

    writer.begin(time(1.0));
    writer.type("task_added");
    writer.field("task_id", std::string_view{"a"});
    writer.field("priority", int64_t{5});
    writer.end();

    writer.begin(time(3.0));
    writer.type("task_completed");
    writer.field("task_id", std::string_view{"a"});
    writer.end();

    std::string text = out.str();
    EXPECT_NE(text.find("[   1.00000]"), std::string::npos);
    EXPECT_NE(text.find("task_added: task_id = a, priority = 5"), std::string::npos);
    EXPECT_NE(text.find("(+   2.00000)"), std::string::npos);
    EXPECT_NE(text.find("task_completed: task_id = a"), std::string::npos);
    EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST_F(TraceWritersTest, TextualColorsCompletions) {
    std::ostringstream out;
    TextualTraceWriter writer(out, true);

    writer.begin(time(0.0));
    writer.type("task_completed");
    writer.end();

    EXPECT_NE(out.str().find("\033[32m"), std::string::npos);
    EXPECT_NE(out.str().find("\033[0m"), std::string::npos);
}
