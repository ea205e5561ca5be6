#pragma once

#include <jobsched/algo/backtracking_solver.hpp>
#include <jobsched/algo/genetic_optimizer.hpp>
#include <jobsched/algo/solver.hpp>

#include <jobsched/core/dependency_graph.hpp>
#include <jobsched/core/job.hpp>
#include <jobsched/core/problem.hpp>
#include <jobsched/core/trace_writer.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace jobsched::algo {

/// @brief Entry point for callers: one problem, three interchangeable solvers.
/// @ingroup algo
///
/// Construction validates the input and derives the dependency graph; input
/// errors (unknown job or machine references, invalid entities) are thrown
/// from here. Each run_* call then checks that a topological order exists,
/// returning FailureKind::CycleDetected otherwise, and runs its solver with
/// freshly built state. The run_* methods are const and share no mutable
/// state, so several of them may execute concurrently on one instance.
/// Trace writers are passed per call and are not synchronised: concurrent
/// calls must not share one.
///
/// @see ListScheduler, GeneticOptimizer, BacktrackingSolver
class JobScheduler {
public:
    /// @brief Build and validate a scheduling request.
    /// @param jobs         Jobs in caller order.
    /// @param dependencies Precedence pairs.
    /// @param machines     Available machines.
    /// @throws core::SchedulingError (or a subclass) on invalid input.
    JobScheduler(std::vector<core::Job> jobs, std::vector<core::Dependency> dependencies,
                 std::vector<core::Machine> machines);

    /// @brief Greedy list schedule over the topological order.
    /// @param rule  Precedence rule applied during placement.
    /// @param trace Writer for this run only, or nullptr.
    SolveOutcome run_list_schedule(PrecedenceRule rule = PrecedenceRule::Completion,
                                   core::TraceWriter* trace = nullptr) const;

    /// @brief Genetic search over job orders.
    /// @param population_size Individuals per generation (>= 4).
    /// @param generations     Number of generations.
    /// @param mutation_rate   Per-child swap probability in [0, 1].
    /// @param rng_seed        Seed of the generator; equal seeds reproduce runs.
    /// @param trace           Writer for this run only, or nullptr.
    /// @throws InvalidParameterError If a parameter is out of range.
    GeneticOutcome run_genetic(std::size_t population_size, std::size_t generations,
                               double mutation_rate, std::uint32_t rng_seed,
                               core::TraceWriter* trace = nullptr) const;

    /// @brief Genetic search with explicit parameters and precedence rule.
    GeneticOutcome run_genetic(const GeneticParams& params, std::uint32_t rng_seed,
                               PrecedenceRule rule = PrecedenceRule::Completion,
                               core::TraceWriter* trace = nullptr) const;

    /// @brief Exhaustive backtracking within [0, time_horizon).
    /// @param time_horizon Exclusive bound on start and end times.
    /// @param trace        Writer for this run only, or nullptr.
    /// @throws InvalidParameterError If the horizon is not positive.
    SolveOutcome run_backtracking(core::Duration time_horizon,
                                  core::TraceWriter* trace = nullptr) const;

    /// @brief Backtracking with explicit options.
    SolveOutcome run_backtracking(const BacktrackingOptions& options,
                                  core::TraceWriter* trace = nullptr) const;

    /// @brief Run an arbitrary solver on this problem.
    /// @param solver Solver to run; its trace writer is replaced by @p trace.
    /// @param trace  Writer for this run only, or nullptr.
    SolveOutcome run(Solver& solver, core::TraceWriter* trace = nullptr) const;

    [[nodiscard]] const core::Problem& problem() const noexcept { return problem_; }
    [[nodiscard]] const core::DependencyGraph& graph() const noexcept { return graph_; }

    /// @brief Topological order of the job ids, or the cycle report.
    [[nodiscard]] core::TopologicalOrder topological_order() const { return graph_.topological_order(); }

private:
    [[nodiscard]] std::optional<SolveFailure> cycle_failure() const;

    core::Problem problem_;
    core::DependencyGraph graph_;
    std::optional<core::CycleDetected> cycle_;
};

} // namespace jobsched::algo
