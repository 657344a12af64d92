#pragma once

/// @defgroup core Core Library
/// @brief Scheduling engine, task model, clocks, and types.
///
/// The core library provides the scheduling engine: the task lifecycle
/// model, the priority round-robin ready queue, the time-sliced execution
/// loop and the derived metrics. It has no dependencies beyond the
/// standard library and the platform thread support.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for durations and engine-relative time.

/// @defgroup core_engine Engine
/// @ingroup core
/// @brief Task table, execution loop, and its configuration.

// Convenience header for the core library
#include <rrsched/core/types.hpp>
#include <rrsched/core/error.hpp>
#include <rrsched/core/clock.hpp>
#include <rrsched/core/trace_writer.hpp>

#include <rrsched/core/task.hpp>
#include <rrsched/core/ready_queue.hpp>
#include <rrsched/core/stats.hpp>

#include <rrsched/core/engine.hpp>
