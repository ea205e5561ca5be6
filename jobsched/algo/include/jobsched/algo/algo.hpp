#pragma once

/// @defgroup algo Algo Library
/// @brief Solvers, machine timelines, schedule evaluation and verification.
///
/// The algo library implements the scheduling algorithms on top of the core
/// model: the schedule evaluator, the greedy list scheduler, the genetic
/// optimizer and the backtracking solver, plus the JobScheduler facade that
/// exposes them to callers. Depends on core only.

/// @defgroup algo_solvers Solvers
/// @ingroup algo
/// @brief Solver interface and its implementations.

/// @defgroup algo_timelines Machine Timelines
/// @ingroup algo
/// @brief Per-solve machine occupancy state.

// Convenience header for the algo library
#include <jobsched/algo/backtracking_solver.hpp>
#include <jobsched/algo/error.hpp>
#include <jobsched/algo/genetic_optimizer.hpp>
#include <jobsched/algo/job_scheduler.hpp>
#include <jobsched/algo/list_scheduler.hpp>
#include <jobsched/algo/machine_timeline.hpp>
#include <jobsched/algo/schedule_evaluator.hpp>
#include <jobsched/algo/schedule_verifier.hpp>
#include <jobsched/algo/solver.hpp>
