#include <rrsched/io/task_json.hpp>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cstdint>
#include <iterator>

namespace rrsched::io {

namespace {

using core::duration_to_seconds;
using core::time_to_seconds;

rapidjson::Value string_value(std::string_view text, rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value value;
    value.SetString(text.data(), static_cast<rapidjson::SizeType>(text.size()), allocator);
    return value;
}

} // anonymous namespace

rapidjson::Value task_to_json(const core::TaskSnapshot& task,
                              rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("task_id", string_value(task.task_id, allocator), allocator);
    obj.AddMember("name", string_value(task.name, allocator), allocator);
    obj.AddMember("description", string_value(task.description, allocator), allocator);
    obj.AddMember("priority", task.priority, allocator);
    obj.AddMember("burst_time", duration_to_seconds(task.burst_time), allocator);
    obj.AddMember("created_at", task.created_at, allocator);
    obj.AddMember("arrival_time", time_to_seconds(task.arrival_time), allocator);
    obj.AddMember("remaining_time", duration_to_seconds(task.remaining_time), allocator);
    obj.AddMember("waiting_time", duration_to_seconds(task.waiting_time), allocator);
    obj.AddMember("turnaround_time", duration_to_seconds(task.turnaround_time), allocator);
    obj.AddMember("completion_time", time_to_seconds(task.completion_time), allocator);
    obj.AddMember("response_time",
                  task.response_time ? duration_to_seconds(*task.response_time) : -1.0,
                  allocator);
    obj.AddMember("last_execution_time", time_to_seconds(task.last_execution_time), allocator);
    obj.AddMember("status", string_value(core::to_string(task.status), allocator), allocator);
    obj.AddMember("progress", task.progress, allocator);
    return obj;
}

rapidjson::Value tasks_to_json(const std::vector<core::TaskSnapshot>& tasks,
                               rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value arr(rapidjson::kArrayType);
    arr.Reserve(static_cast<rapidjson::SizeType>(tasks.size()), allocator);
    for (const auto& task : tasks) {
        arr.PushBack(task_to_json(task, allocator), allocator);
    }
    return arr;
}

rapidjson::Value stats_to_json(const core::EngineStats& stats,
                               rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value obj(rapidjson::kObjectType);
    obj.AddMember("total_tasks", static_cast<uint64_t>(stats.total_tasks), allocator);
    obj.AddMember("pending_tasks", static_cast<uint64_t>(stats.pending_tasks), allocator);
    obj.AddMember("running_tasks", static_cast<uint64_t>(stats.running_tasks), allocator);
    obj.AddMember("completed_tasks", static_cast<uint64_t>(stats.completed_tasks), allocator);
    obj.AddMember("avg_waiting_time", duration_to_seconds(stats.avg_waiting_time), allocator);
    obj.AddMember("avg_turnaround_time", duration_to_seconds(stats.avg_turnaround_time), allocator);
    obj.AddMember("avg_response_time", duration_to_seconds(stats.avg_response_time), allocator);
    obj.AddMember("scheduler_uptime", duration_to_seconds(stats.uptime), allocator);
    obj.AddMember("idle", stats.idle, allocator);
    return obj;
}

rapidjson::Value execution_sequence_to_json(const std::vector<core::ExecutionRecord>& sequence,
                                            rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value arr(rapidjson::kArrayType);
    arr.Reserve(static_cast<rapidjson::SizeType>(sequence.size()), allocator);
    for (const auto& record : sequence) {
        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("task_id", string_value(record.task_id, allocator), allocator);
        obj.AddMember("start", time_to_seconds(record.start), allocator);
        obj.AddMember("end", time_to_seconds(record.end), allocator);
        arr.PushBack(obj, allocator);
    }
    return arr;
}

std::string to_json_string(const rapidjson::Value& value, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        value.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        value.Accept(writer);
    }
    return {buffer.GetString(), buffer.GetSize()};
}

void write_report(std::ostream& out,
                  const std::vector<core::TaskSnapshot>& tasks,
                  const core::EngineStats& stats,
                  const std::optional<std::vector<core::ExecutionRecord>>& sequence) {
    rapidjson::Document doc(rapidjson::kObjectType);
    auto& allocator = doc.GetAllocator();

    doc.AddMember("tasks", tasks_to_json(tasks, allocator), allocator);
    doc.AddMember("stats", stats_to_json(stats, allocator), allocator);
    if (sequence) {
        doc.AddMember("execution_sequence", execution_sequence_to_json(*sequence, allocator), allocator);
    }

    out << to_json_string(doc, true) << '\n';
}

std::vector<core::TaskSnapshot> filter_tasks(const std::vector<core::TaskSnapshot>& tasks,
                                             std::optional<core::TaskStatus> status,
                                             std::optional<int> priority) {
    std::vector<core::TaskSnapshot> result;
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(result),
                 [&](const core::TaskSnapshot& task) {
                     return (!status || task.status == *status) &&
                            (!priority || task.priority == *priority);
                 });
    return result;
}

} // namespace rrsched::io
