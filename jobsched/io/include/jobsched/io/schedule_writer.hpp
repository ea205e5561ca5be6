#pragma once

/// @file schedule_writer.hpp
/// @brief Serialisation of finished schedules.
/// @ingroup io_writers

#include <jobsched/algo/error.hpp>

#include <jobsched/core/problem.hpp>
#include <jobsched/core/schedule.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace jobsched::io {

/// @brief Write a schedule as a JSON object.
///
/// Layout: `{"solver": name, "makespan": n, "assignments": [{"job", "start",
/// "end", "machines": [...]}]}` with assignments in placement order.
///
/// @param solver    Name of the solver that produced the schedule.
/// @param schedule  Schedule to write.
/// @param out       Output stream.
///
/// @ingroup io_writers
void write_schedule_json(std::string_view solver, const core::Schedule& schedule, std::ostream& out);

/// @brief Outcome of one solver in a multi-solver run.
/// @ingroup io_writers
struct SolverRun {
    std::string solver;        ///< Solver name.
    algo::SolveOutcome outcome; ///< Its schedule or failure.
};

/// @brief Write several solver outcomes as one JSON array.
///
/// Each schedule is written as by write_schedule_json(). A failure becomes
/// `{"solver": name, "failure": kind, "message": text}`.
///
/// @param runs Outcomes in run order.
/// @param out  Output stream.
///
/// @ingroup io_writers
void write_schedules_json(const std::vector<SolverRun>& runs, std::ostream& out);

/// @brief Write a per-machine timeline table.
///
/// One row per machine of @p problem, in problem order, listing the
/// intervals it is busy as `job@[start,end)` in start order. Idle machines
/// print `(idle)`.
///
/// @ingroup io_writers
void write_schedule_table(const core::Problem& problem, const core::Schedule& schedule, std::ostream& out);

} // namespace jobsched::io
