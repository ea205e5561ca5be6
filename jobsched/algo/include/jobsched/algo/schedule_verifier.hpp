#pragma once

#include <jobsched/algo/solver.hpp>

#include <jobsched/core/problem.hpp>
#include <jobsched/core/schedule.hpp>

#include <string>
#include <vector>

namespace jobsched::algo {

/// @brief One broken invariant found in a schedule.
/// @ingroup algo
struct ScheduleViolation {
    /// @brief Category of the violation.
    enum class Kind {
        MissingJob,         ///< A problem job has no assignment.
        UnknownJob,         ///< An assignment names a job outside the problem.
        WrongDuration,      ///< end - start differs from the processing time.
        MachineMismatch,    ///< Assigned machines differ from the required ones.
        MachineOverlap,     ///< Two intervals on one machine intersect.
        PrecedenceViolated  ///< A successor starts before its predecessor completes.
    };

    Kind kind;           ///< Category.
    std::string message; ///< Description naming the jobs and machine involved.
};

/// @brief Check a schedule against the problem it claims to solve.
///
/// Verifies that every job is assigned exactly its own machines for exactly
/// its processing time, that no two intervals on a machine overlap, and,
/// under PrecedenceRule::Completion, that every successor starts no earlier
/// than the completion of each predecessor. PrecedenceRule::PlacedEarlier
/// leaves start times unconstrained by precedence, so that check is skipped.
///
/// @param problem  The problem.
/// @param schedule Candidate schedule.
/// @param rule     Precedence rule the schedule was built under.
/// @return Every violation found; empty for a valid schedule.
/// @ingroup algo
[[nodiscard]] std::vector<ScheduleViolation> verify_schedule(
    const core::Problem& problem,
    const core::Schedule& schedule,
    PrecedenceRule rule = PrecedenceRule::Completion);

} // namespace jobsched::algo
