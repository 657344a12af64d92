#pragma once

/// @file workload_loader.hpp
/// @brief Loading of JSON workload files for the command-line driver.
/// @ingroup io_loaders

#include <rrsched/core/task.hpp>
#include <rrsched/core/types.hpp>

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace rrsched::io {

/// @brief Bounds on the time values a workload or command line may carry.
///
/// Every value in seconds is checked against these before it is turned
/// into a core::Duration.
///
/// @ingroup io_loaders
struct WorkloadLimits {
    static constexpr double max_time_quantum = 300.0;   ///< Longest accepted quantum (s).
    static constexpr double max_submit_at = 86400.0;    ///< Latest accepted submission offset (s).
};

/// @brief A task together with the moment it is submitted to the engine.
///
/// @ingroup io_loaders
struct WorkloadTask {
    core::TaskSpec spec;     ///< Validated task, with an id assigned by the loader.
    core::Duration submit_at; ///< Offset from engine start at which to submit.
};

/// @brief Contents of a workload file.
///
/// @ingroup io_loaders
/// @see load_workload
struct WorkloadData {
    std::optional<core::Duration> time_quantum;  ///< Overrides the driver's default quantum.
    std::vector<WorkloadTask> tasks;             ///< Sorted by submit_at, file order on ties.
};

/// @brief Load a workload from a JSON file.
///
/// Expected format:
/// @code{.json}
/// {
///   "time_quantum": 2.0,
///   "tasks": [
///     {"name": "compile", "description": "build", "priority": 5, "burst_time": 3.0},
///     {"name": "late", "priority": 9, "burst_time": 1.0, "submit_at": 2.5}
///   ]
/// }
/// @endcode
///
/// Ids are assigned in file order as `"task-1"`, `"task-2"`, ... Every entry
/// is checked with @ref validate_task_spec.
///
/// @throws LoaderError      If the file cannot be read or is malformed.
/// @throws ValidationError  If a task field is out of range.
///
/// @see load_workload_from_string
WorkloadData load_workload(const std::filesystem::path& path);

/// @brief Load a workload from a JSON string.
/// @see load_workload
WorkloadData load_workload_from_string(std::string_view json);

} // namespace rrsched::io
