#include <rrsched/io/workload_loader.hpp>
#include <rrsched/io/error.hpp>
#include <rrsched/io/id_generator.hpp>
#include <rrsched/io/validation.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace rrsched::io {

namespace {

using namespace rrsched::core;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name, const char* context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

double get_double(const rapidjson::Value& val, const char* name, const char* context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

int get_int(const rapidjson::Value& val, const char* name, const char* context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsInt()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    return member.GetInt();
}

std::string get_string(const rapidjson::Value& val, const char* name, const char* context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

// Optional members must still have the right type when present.
std::string get_string_or(const rapidjson::Value& val, const char* name, const char* context,
                          std::string default_val) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    return get_string(val, name, context);
}

// A number of seconds, finite and within (lower, upper] or [lower, upper].
double get_seconds(const rapidjson::Value& val, const char* name, const char* context,
                   double lower, double upper, bool lower_inclusive) {
    double seconds = get_double(val, name, context);
    bool above_lower = lower_inclusive ? seconds >= lower : seconds > lower;
    if (!std::isfinite(seconds) || !above_lower || seconds > upper) {
        throw LoaderError(std::string("field '") + name + "' must be in " +
                              (lower_inclusive ? "[" : "(") + std::to_string(lower) + ", " +
                              std::to_string(upper) + "] seconds",
                          context);
    }
    return seconds;
}

void parse_workload_impl(WorkloadData& result, const rapidjson::Document& doc) {
    if (doc.HasMember("time_quantum")) {
        double quantum = get_seconds(doc, "time_quantum", "workload", 0.0,
                                     WorkloadLimits::max_time_quantum, false);
        result.time_quantum = duration_from_seconds(quantum);
    }

    if (!doc.HasMember("tasks")) {
        // Empty workload is valid
        return;
    }

    const auto& tasks = get_member(doc, "tasks", "workload");
    if (!tasks.IsArray()) {
        throw LoaderError("field 'tasks' must be an array", "workload");
    }

    IdGenerator ids;
    for (rapidjson::SizeType tidx = 0; tidx < tasks.Size(); ++tidx) {
        const auto& task_obj = tasks[tidx];
        std::string ctx = "tasks[" + std::to_string(tidx) + "]";
        if (!task_obj.IsObject()) {
            throw LoaderError("task entry must be an object", ctx);
        }

        WorkloadTask task;
        task.spec.id = ids.next();
        task.spec.name = get_string(task_obj, "name", ctx.c_str());
        task.spec.description = get_string_or(task_obj, "description", ctx.c_str(), "");
        task.spec.priority = get_int(task_obj, "priority", ctx.c_str());

        double burst = get_double(task_obj, "burst_time", ctx.c_str());
        if (!std::isfinite(burst) || burst <= 0 || burst > TaskLimits::max_burst_seconds) {
            throw ValidationError("burst_time must be in (0, 300] seconds", ctx);
        }
        task.spec.burst_time = duration_from_seconds(burst);

        double submit_at = 0.0;
        if (task_obj.HasMember("submit_at")) {
            submit_at = get_seconds(task_obj, "submit_at", ctx.c_str(), 0.0,
                                    WorkloadLimits::max_submit_at, true);
        }
        task.submit_at = duration_from_seconds(submit_at);

        validate_task_spec(task.spec, ctx);
        result.tasks.push_back(std::move(task));
    }

    std::stable_sort(result.tasks.begin(), result.tasks.end(),
                     [](const WorkloadTask& a, const WorkloadTask& b) { return a.submit_at < b.submit_at; });
}

} // anonymous namespace

WorkloadData load_workload(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_workload_from_string(oss.str());
}

WorkloadData load_workload_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "workload");
    }

    WorkloadData result;
    parse_workload_impl(result, doc);
    return result;
}

} // namespace rrsched::io
