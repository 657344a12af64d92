#pragma once

/// @file task_json.hpp
/// @brief JSON representation of tasks, statistics and the execution log.
///
/// Builders return rapidjson values allocated from the caller's document,
/// so they can be composed into larger reports. Every time is rendered in
/// seconds.
///
/// @ingroup io

#include <rrsched/core/engine.hpp>
#include <rrsched/core/stats.hpp>
#include <rrsched/core/task.hpp>

#include <rapidjson/document.h>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace rrsched::io {

/// @brief Render one task.
///
/// `completion_time` is 0 and `response_time` is -1 while unset; `status`
/// is the lowercase status name.
[[nodiscard]] rapidjson::Value task_to_json(const core::TaskSnapshot& task,
                                            rapidjson::Document::AllocatorType& allocator);

/// @brief Render a task list as a JSON array, preserving order.
[[nodiscard]] rapidjson::Value tasks_to_json(const std::vector<core::TaskSnapshot>& tasks,
                                             rapidjson::Document::AllocatorType& allocator);

[[nodiscard]] rapidjson::Value stats_to_json(const core::EngineStats& stats,
                                             rapidjson::Document::AllocatorType& allocator);

/// @brief Render the audit log as `[{"task_id", "start", "end"}, ...]`.
[[nodiscard]] rapidjson::Value execution_sequence_to_json(
    const std::vector<core::ExecutionRecord>& sequence,
    rapidjson::Document::AllocatorType& allocator);

/// @brief Serialize a value to a string.
/// @param pretty  Indent the output when true.
[[nodiscard]] std::string to_json_string(const rapidjson::Value& value, bool pretty = false);

/// @brief Write the end-of-run report `{"tasks": [...], "stats": {...}}`.
///
/// When @p sequence is engaged an `"execution_sequence"` member is added.
void write_report(std::ostream& out,
                  const std::vector<core::TaskSnapshot>& tasks,
                  const core::EngineStats& stats,
                  const std::optional<std::vector<core::ExecutionRecord>>& sequence = std::nullopt);

/// @brief Keep the tasks matching every engaged criterion, in order.
[[nodiscard]] std::vector<core::TaskSnapshot> filter_tasks(
    const std::vector<core::TaskSnapshot>& tasks,
    std::optional<core::TaskStatus> status = std::nullopt,
    std::optional<int> priority = std::nullopt);

} // namespace rrsched::io
