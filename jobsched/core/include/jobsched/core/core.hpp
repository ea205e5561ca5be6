#pragma once

/// @defgroup core Core Library
/// @brief Entity model, dependency graph, schedules, and types.
///
/// The core library holds the input model of a scheduling request (jobs,
/// machines, dependencies), its validation, the derived dependency graph,
/// and the Schedule value returned by every solver. It has no dependencies
/// on scheduling algorithms or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong integer types for durations and time points.

// Convenience header for the core library
#include <jobsched/core/types.hpp>
#include <jobsched/core/error.hpp>
#include <jobsched/core/job.hpp>
#include <jobsched/core/problem.hpp>
#include <jobsched/core/dependency_graph.hpp>
#include <jobsched/core/schedule.hpp>
#include <jobsched/core/trace_writer.hpp>
