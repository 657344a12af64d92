#pragma once

/// @file error.hpp
/// @brief IO-specific exception types for the rrsched I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace rrsched::io {

/// @brief Exception for workload loading errors (reading, parsing).
///
/// Thrown by loader functions when JSON input is unreadable, malformed,
/// or missing required fields.
///
/// @ingroup io
/// @see load_workload
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

/// @brief Exception for task fields outside their accepted range.
///
/// Raised before a request reaches the engine, which performs no range
/// checks of its own. Loader functions let it propagate unchanged so the
/// offending entry is named in the message.
///
/// @ingroup io
/// @see validate_task_spec, validate_task_patch
class ValidationError : public LoaderError {
public:
    using LoaderError::LoaderError;
};

} // namespace rrsched::io
