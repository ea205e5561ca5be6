#pragma once

/// @file metrics.hpp
/// @brief Quality metrics and lower bounds for a finished schedule.
///
/// Derives machine utilization and the two classic makespan lower bounds
/// (busiest machine load and longest precedence chain) so a schedule can be
/// judged against what any schedule could achieve.
///
/// @ingroup io_metrics

#include <jobsched/algo/solver.hpp>

#include <jobsched/core/problem.hpp>
#include <jobsched/core/schedule.hpp>
#include <jobsched/core/types.hpp>

#include <optional>
#include <ostream>
#include <vector>

namespace jobsched::io {

/// @brief Aggregated statistics computed from a schedule.
///
/// @ingroup io_metrics
/// @see compute_schedule_metrics
struct ScheduleMetrics {
    /// @brief Usage of a single machine.
    struct MachineUsage {
        core::MachineId machine;  ///< Machine name.
        core::Duration busy{0};   ///< Sum of the intervals it is occupied.
        double utilization{0.0};  ///< busy / makespan, 0 for an empty schedule.
        uint64_t jobs{0};         ///< Number of jobs that occupy it.
    };

    core::Duration makespan{0};          ///< Completion time of the last job.
    core::Duration total_processing{0};  ///< Sum of job processing times.
    std::vector<MachineUsage> machines;  ///< One entry per machine, in problem order.

    // -- Lower bounds --------------------------------------------------------

    core::Duration load_bound{0};                  ///< Busy time of the most demanded machine.
    /// Longest chain; nullopt when cyclic or when the schedule was built
    /// under PrecedenceRule::PlacedEarlier, which lets successors overlap it.
    std::optional<core::Duration> critical_path;
    core::Duration lower_bound{0};                 ///< max(load_bound, critical_path).

    /// @brief makespan / lower_bound, 1.0 meaning provably optimal.
    [[nodiscard]] double optimality_ratio() const;
};

/// @brief Compute metrics for @p schedule against @p problem.
///
/// The load bound counts every job of the problem, scheduled or not, so
/// it is a property of the input alone. The critical-path bound only holds
/// under PrecedenceRule::Completion and is left out otherwise.
///
/// @param problem  The problem.
/// @param schedule Schedule to measure.
/// @param rule     Precedence rule the schedule was built under.
/// @ingroup io_metrics
[[nodiscard]] ScheduleMetrics compute_schedule_metrics(
    const core::Problem& problem,
    const core::Schedule& schedule,
    algo::PrecedenceRule rule = algo::PrecedenceRule::Completion);

/// @brief Write a human-readable metrics summary.
///
/// The formatting state of @p out is restored before returning.
///
/// @ingroup io_metrics
void write_metrics(const ScheduleMetrics& metrics, std::ostream& out);

} // namespace jobsched::io
