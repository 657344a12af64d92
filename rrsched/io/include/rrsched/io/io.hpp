#pragma once

/// @file io.hpp
/// @brief Convenience header that includes all public rrsched I/O headers.
///
/// @defgroup io I/O Library
/// @brief Trace writers, JSON rendering and workload loading.
///
/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief Concrete implementations of core::TraceWriter.
///
/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief JSON workload loading.

#include <rrsched/io/error.hpp>
#include <rrsched/io/id_generator.hpp>
#include <rrsched/io/task_json.hpp>
#include <rrsched/io/trace_writers.hpp>
#include <rrsched/io/validation.hpp>
#include <rrsched/io/workload_loader.hpp>
