#pragma once

#include <jobsched/core/schedule.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace jobsched::algo {

/// @brief Exception thrown when a solver is configured with unusable parameters.
/// @ingroup algo
///
/// Raised before any search starts: a population too small to yield two
/// parents, a mutation rate outside [0, 1], a non-positive time horizon, or
/// a job order that is not a permutation of the problem's job set.
class InvalidParameterError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// @brief Reason a solver returned no schedule.
/// @ingroup algo
///
/// @see SolveFailure
enum class FailureKind {
    NoValidOrder,           ///< List scheduler found no topological order.
    CycleDetected,          ///< Dependency graph is not a DAG; no solver may run.
    Infeasible,             ///< Backtracking exhausted the time horizon.
    AllCandidatesInfeasible ///< Every individual of the final GA population violates precedence.
};

/// @brief Human-readable name of a FailureKind.
/// @param kind Failure kind.
/// @return Stable identifier such as "cycle_detected".
[[nodiscard]] constexpr std::string_view to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::NoValidOrder: return "no_valid_order";
        case FailureKind::CycleDetected: return "cycle_detected";
        case FailureKind::Infeasible: return "infeasible";
        case FailureKind::AllCandidatesInfeasible: return "all_candidates_infeasible";
    }
    return "unknown";
}

/// @brief Typed failure returned in place of a schedule.
/// @ingroup algo
///
/// A failure is an ordinary result, not an exception: the caller may retry
/// with a larger horizon, a different solver, or corrected input.
struct SolveFailure {
    FailureKind kind;    ///< Category of the failure.
    std::string message; ///< Details for the user.
};

/// @brief A schedule or the reason there is none.
/// @ingroup algo
using SolveOutcome = std::variant<core::Schedule, SolveFailure>;

/// @brief Check whether an outcome holds a schedule.
[[nodiscard]] inline bool succeeded(const SolveOutcome& outcome) noexcept {
    return std::holds_alternative<core::Schedule>(outcome);
}

} // namespace jobsched::algo
