#pragma once

#include <stdexcept>
#include <string>

namespace rrsched::core {

/// @brief Base exception for all scheduler errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch scheduler-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// Unknown task ids and updates to completed tasks are not errors: they
/// are reported through empty optionals and `false` returns.
///
/// @see ConfigError, InvalidStateError, DuplicateTaskError
/// @ingroup core
class SchedulerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an EngineConfig value is unusable.
///
/// For example a zero or negative time quantum, which would make the
/// execution loop spin without ever consuming work.
///
/// @see EngineConfig, Engine::Engine
/// @ingroup core
class ConfigError : public SchedulerError {
public:
    using SchedulerError::SchedulerError;
};

/// @brief Thrown when an operation is invalid for the current engine state.
///
/// For example, driving the engine synchronously with Engine::step() while
/// the background execution loop owns it.
///
/// @see SchedulerError
/// @ingroup core
class InvalidStateError : public SchedulerError {
public:
    using SchedulerError::SchedulerError;
};

/// @brief Thrown when a task is added under an id already in the task table.
///
/// Ids are supplied by the caller; the engine only enforces uniqueness.
///
/// @see Engine::add_task
/// @ingroup core
class DuplicateTaskError : public SchedulerError {
public:
    explicit DuplicateTaskError(const std::string& task_id)
        : SchedulerError("task '" + task_id + "' already exists") {}
};

} // namespace rrsched::core
