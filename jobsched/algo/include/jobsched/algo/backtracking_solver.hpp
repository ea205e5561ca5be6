#pragma once

#include <jobsched/algo/machine_timeline.hpp>
#include <jobsched/algo/solver.hpp>

#include <jobsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace jobsched::algo {

/// @brief Configuration of the backtracking search.
/// @ingroup algo_solvers
struct BacktrackingOptions {
    /// Exclusive bound on start times; every job must also end by this time.
    core::Duration time_horizon{100};
    /// Start each job's candidate scan at the completion of its placed predecessors.
    bool respect_precedence{true};
};

/// @brief Counters of one backtracking search.
/// @ingroup algo_solvers
struct SearchStats {
    uint64_t nodes{0};     ///< Candidate start times examined.
    uint64_t commits{0};   ///< Placements committed.
    uint64_t rollbacks{0}; ///< Placements undone after a failed subtree.
};

/// @brief Exact chronological backtracking over per-job start times.
/// @ingroup algo_solvers
///
/// Jobs are taken in a fixed order (the topological order for solve(), the
/// caller's order for solve_order()). For the job at position i the solver
/// tries every integer start time in increasing order; a candidate
/// [start, start + processing_time) is admissible when it ends within the
/// horizon and overlaps no committed interval on any of the job's machines.
/// An admissible candidate is committed on all machines at once and the
/// search recurses on position i + 1; if that fails the commit is rolled
/// back and the next candidate is tried.
///
/// The search is exhaustive: FailureKind::Infeasible is reported only once
/// every candidate of every job has been tried. Its cost is worst-case
/// exponential in the job count; there is no pruning beyond the interval
/// check and no memoization. Recursion depth equals the job count.
///
/// With BacktrackingOptions::respect_precedence unset, the solver does not
/// look at dependencies at all and relies on the caller's order.
///
/// @see MachineBookings, BacktrackingOptions
class BacktrackingSolver : public Solver {
public:
    /// @brief Construct a solver.
    /// @param options Horizon and precedence handling.
    /// @throws InvalidParameterError If the horizon is not positive.
    explicit BacktrackingSolver(BacktrackingOptions options = {});

    [[nodiscard]] std::string_view name() const noexcept override { return "backtracking"; }

    /// @brief Search in topological order.
    /// @return The schedule, FailureKind::CycleDetected, or FailureKind::Infeasible.
    SolveOutcome solve(const core::Problem& problem, const core::DependencyGraph& graph) override;

    /// @brief Search in a caller-supplied order of job indices.
    /// @param problem Validated input.
    /// @param graph   Dependency graph of @p problem (consulted only when
    ///                respect_precedence is set).
    /// @param order   Permutation of the job indices; should respect precedence.
    /// @return The schedule or FailureKind::Infeasible.
    /// @throws InvalidParameterError If @p order is not a permutation.
    SolveOutcome solve_order(const core::Problem& problem, const core::DependencyGraph& graph,
                             const std::vector<std::size_t>& order);

    /// @brief Counters of the most recent search.
    [[nodiscard]] const SearchStats& last_stats() const noexcept { return stats_; }

    [[nodiscard]] const BacktrackingOptions& options() const noexcept { return options_; }

private:
    class Search;

    BacktrackingOptions options_;
    SearchStats stats_;
};

} // namespace jobsched::algo
