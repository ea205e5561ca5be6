#pragma once

#include <jobsched/algo/error.hpp>

#include <jobsched/core/dependency_graph.hpp>
#include <jobsched/core/problem.hpp>
#include <jobsched/core/trace_writer.hpp>

#include <string_view>

namespace jobsched::algo {

/// @brief When a successor may start relative to its predecessors.
/// @ingroup algo
enum class PrecedenceRule {
    /// Successor starts no earlier than the completion of every predecessor.
    Completion,
    /// Successor only requires its predecessors to be placed earlier in the
    /// same pass; its start time follows machine availability alone.
    PlacedEarlier
};

/// @brief Abstract interface for scheduling algorithms.
/// @ingroup algo_solvers
///
/// A Solver turns a validated Problem and its DependencyGraph into a
/// Schedule. Every call to solve() builds its own machine-timeline state,
/// so one solver instance may be reused for many problems, and distinct
/// instances may run concurrently on the same problem.
///
/// @see ListScheduler, GeneticOptimizer, BacktrackingSolver
class Solver {
public:
    virtual ~Solver() = default;

    /// @brief Short identifier of the algorithm ("list", "genetic", ...).
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// @brief Compute a schedule.
    /// @param problem Validated input.
    /// @param graph   Dependency graph built from @p problem.
    /// @return The schedule, or the typed reason there is none.
    virtual SolveOutcome solve(const core::Problem& problem,
                               const core::DependencyGraph& graph) = 0;

    /// @brief Install a trace writer (nullptr disables tracing).
    /// @param writer Non-owning pointer; must outlive subsequent solve() calls.
    void set_trace_writer(core::TraceWriter* writer) noexcept { trace_ = writer; }

    /// @brief Installed trace writer, or nullptr.
    [[nodiscard]] core::TraceWriter* trace_writer() const noexcept { return trace_; }

protected:
    Solver() = default;
    Solver(const Solver&) = default;
    Solver& operator=(const Solver&) = default;
    Solver(Solver&&) = default;
    Solver& operator=(Solver&&) = default;

    core::TraceWriter* trace_{nullptr};
};

} // namespace jobsched::algo
