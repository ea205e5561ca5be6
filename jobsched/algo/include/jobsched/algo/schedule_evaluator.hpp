#pragma once

#include <jobsched/algo/solver.hpp>

#include <jobsched/core/dependency_graph.hpp>
#include <jobsched/core/problem.hpp>
#include <jobsched/core/schedule.hpp>
#include <jobsched/core/types.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace jobsched::algo {

/// @brief Start times produced by replaying one job order.
/// @ingroup algo_solvers
struct EvaluatedOrder {
    std::vector<std::size_t> order;           ///< Job indices in placement order.
    std::vector<core::TimePoint> start_times; ///< Start time per job index.
    core::Duration makespan;                  ///< Latest machine free time after the pass.
};

/// @brief Replays a job order against machine availability.
/// @ingroup algo_solvers
///
/// Walks the order once with a fresh MachineAvailability. Each job starts at
/// the latest next-free time of its machines (and, under
/// PrecedenceRule::Completion, no earlier than the completion of each
/// predecessor); its machines then stay busy until start + processing time.
///
/// An order in which some job appears before one of its predecessors is
/// infeasible under either rule; evaluate() then returns std::nullopt, which
/// the genetic optimizer ranks below every feasible candidate.
///
/// All member functions are const and build their own state: one evaluator
/// may be called any number of times, from any number of threads.
///
/// The evaluator keeps references to @p problem and @p graph; both must
/// outlive it.
///
/// @see MachineAvailability, ListScheduler, GeneticOptimizer
class ScheduleEvaluator {
public:
    /// @brief Construct an evaluator.
    /// @param problem Validated input.
    /// @param graph   Dependency graph built from @p problem.
    /// @param rule    Precedence rule applied to each placement.
    ScheduleEvaluator(const core::Problem& problem, const core::DependencyGraph& graph,
                      PrecedenceRule rule = PrecedenceRule::Completion);

    /// @brief Replay an order of job indices.
    /// @param order Permutation of [0, job_count).
    /// @return Start times and makespan, or std::nullopt if the order violates precedence.
    /// @throws InvalidParameterError If @p order is not a permutation of the job indices.
    [[nodiscard]] std::optional<EvaluatedOrder> evaluate(const std::vector<std::size_t>& order) const;

    /// @brief Replay an order of job identifiers.
    /// @param order Permutation of the problem's job ids.
    /// @return Start times and makespan, or std::nullopt if the order violates precedence.
    /// @throws InvalidParameterError If @p order names an unknown job or is not a permutation.
    [[nodiscard]] std::optional<EvaluatedOrder> evaluate_ids(const std::vector<core::JobId>& order) const;

    /// @brief Makespan of an order (the genetic fitness).
    /// @param order Permutation of [0, job_count).
    /// @return Makespan, or std::nullopt if the order is infeasible.
    [[nodiscard]] std::optional<core::Duration> makespan(const std::vector<std::size_t>& order) const;

    /// @brief Convert an evaluated order to a Schedule.
    /// @param evaluated Result of evaluate().
    /// @return Schedule with one assignment per job, in placement order.
    [[nodiscard]] core::Schedule to_schedule(const EvaluatedOrder& evaluated) const;

    /// @brief Translate job identifiers to indices.
    /// @throws InvalidParameterError If an identifier is unknown.
    [[nodiscard]] std::vector<std::size_t> to_indices(const std::vector<core::JobId>& order) const;

    /// @brief Translate job indices to identifiers.
    [[nodiscard]] std::vector<core::JobId> to_ids(const std::vector<std::size_t>& order) const;

    [[nodiscard]] PrecedenceRule rule() const noexcept { return rule_; }
    [[nodiscard]] const core::Problem& problem() const noexcept { return problem_; }
    [[nodiscard]] const core::DependencyGraph& graph() const noexcept { return graph_; }

private:
    void check_permutation(const std::vector<std::size_t>& order) const;

    const core::Problem& problem_;        // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    const core::DependencyGraph& graph_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    PrecedenceRule rule_;
};

} // namespace jobsched::algo
