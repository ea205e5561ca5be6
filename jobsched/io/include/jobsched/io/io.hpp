#pragma once

/// @defgroup io I/O Library
/// @brief JSON loading, schedule and trace output, and schedule metrics.
///
/// The I/O library handles all external data formats: loading and writing
/// problem JSON files, writing schedules (JSON, per-machine table), writing
/// solver traces (JSON, textual) and computing schedule metrics.
/// Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Problem JSON loader and writer.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief Schedule writers and JSON and textual trace writers.

/// @defgroup io_metrics Metrics
/// @ingroup io
/// @brief Utilization and makespan lower bounds.

// Convenience header for Library 3 (I/O)

#include <jobsched/io/error.hpp>
#include <jobsched/io/problem_loader.hpp>
#include <jobsched/io/trace_writers.hpp>
#include <jobsched/io/schedule_writer.hpp>
#include <jobsched/io/metrics.hpp>
