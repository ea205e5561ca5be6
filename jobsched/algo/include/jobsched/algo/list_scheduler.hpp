#pragma once

#include <jobsched/algo/schedule_evaluator.hpp>
#include <jobsched/algo/solver.hpp>

#include <cstddef>
#include <vector>

namespace jobsched::algo {

/// @brief One-shot greedy list scheduler.
/// @ingroup algo_solvers
///
/// Takes the topological order of the dependency graph (ties broken by job
/// insertion order) as a fixed priority list and gives each job, in turn,
/// the earliest start its machines and precedence rule allow. Runs in
/// O(J * M) for J jobs and M machines per job.
///
/// The result respects precedence and machine exclusivity but is not
/// optimal: its makespan depends entirely on the topological tie-break.
/// Identical input always yields an identical schedule.
///
/// @see ScheduleEvaluator, DependencyGraph::topological_order
class ListScheduler : public Solver {
public:
    /// @brief Construct a list scheduler.
    /// @param rule Precedence rule used during placement.
    explicit ListScheduler(PrecedenceRule rule = PrecedenceRule::Completion)
        : rule_(rule) {}

    [[nodiscard]] std::string_view name() const noexcept override { return "list"; }

    /// @brief Schedule the jobs in topological order.
    /// @return The schedule, or FailureKind::NoValidOrder if the graph has a cycle.
    SolveOutcome solve(const core::Problem& problem, const core::DependencyGraph& graph) override;

    /// @brief Schedule the jobs in a caller-supplied order.
    /// @param order Permutation of the job indices.
    /// @return The schedule, or FailureKind::Infeasible if @p order puts a job
    ///         before one of its predecessors.
    /// @throws InvalidParameterError If @p order is not a permutation.
    SolveOutcome schedule_order(const core::Problem& problem, const core::DependencyGraph& graph,
                                const std::vector<std::size_t>& order);

    [[nodiscard]] PrecedenceRule rule() const noexcept { return rule_; }

private:
    void trace_placements(const core::Problem& problem, const EvaluatedOrder& evaluated);

    PrecedenceRule rule_;
};

} // namespace jobsched::algo
