#pragma once

/// @file validation.hpp
/// @brief Range checks applied to task requests before they reach the engine.
/// @ingroup io

#include <rrsched/core/task.hpp>

#include <cstddef>
#include <string>

namespace rrsched::io {

/// @brief Accepted ranges for client-supplied task fields.
/// @ingroup io
struct TaskLimits {
    static constexpr std::size_t max_name_length = 100;
    static constexpr std::size_t max_description_length = 500;
    static constexpr int min_priority = 1;
    static constexpr int max_priority = 10;
    static constexpr double max_burst_seconds = 300.0;
};

/// @brief Check every field of a new task against @ref TaskLimits.
///
/// The id is not checked; it is assigned by the caller.
///
/// @param spec     Task to validate.
/// @param context  Prefix for the error message (e.g. `"tasks[3]"`).
/// @throws ValidationError naming the first offending field.
void validate_task_spec(const core::TaskSpec& spec, const std::string& context = "task");

/// @brief Check the engaged fields of an update against @ref TaskLimits.
///
/// @throws ValidationError if the patch is empty or a field is out of range.
void validate_task_patch(const core::TaskPatch& patch, const std::string& context = "update");

} // namespace rrsched::io
