#pragma once

#include <jobsched/core/job.hpp>
#include <jobsched/core/types.hpp>

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

namespace jobsched::core {

class Problem;

/// @brief Outcome of a topological sort on a graph that is not a DAG.
///
/// Carries the jobs that never reached in-degree zero: every job on a
/// cycle, plus every job downstream of one.
///
/// @see DependencyGraph::topological_order
/// @ingroup core
struct CycleDetected {
    std::vector<JobId> blocked; ///< Jobs left unordered, in insertion order.
};

/// @brief Topological order of job identifiers, or the cycle report.
/// @ingroup core
using TopologicalOrder = std::variant<std::vector<JobId>, CycleDetected>;

/// @brief Precedence structure derived from a job set and its dependency pairs.
///
/// Stores, per job index, the list of successors (adjacency), the list of
/// predecessors and the in-degree. Job indices follow the insertion order of
/// the job set; that order is also the tie-break of topological_order().
///
/// The graph is read-only once built: topological_order() works on a private
/// copy of the in-degree counts and can be called any number of times.
///
/// @see Problem, CycleDetected
/// @ingroup core
class DependencyGraph {
public:
    /// @brief Build the graph of a validated problem.
    /// @param problem Problem whose jobs and dependencies define the graph.
    explicit DependencyGraph(const Problem& problem);

    /// @brief Build a graph directly from a job set and dependency pairs.
    /// @param jobs         Jobs, in tie-break order.
    /// @param dependencies Precedence pairs.
    /// @return The resulting graph.
    /// @throws UnknownJobReference If a dependency names a job not in @p jobs.
    /// @throws InvalidInputError   If two jobs share an identifier.
    [[nodiscard]] static DependencyGraph build(const std::vector<Job>& jobs,
                                               const std::vector<Dependency>& dependencies);

    /// @brief Number of jobs (vertices).
    [[nodiscard]] std::size_t job_count() const noexcept { return ids_.size(); }

    /// @brief Identifier of the job at index @p idx.
    [[nodiscard]] JobId job_id(std::size_t idx) const { return ids_[idx]; }

    /// @brief Jobs that depend on job @p idx, in dependency insertion order.
    [[nodiscard]] const std::vector<std::size_t>& successors(std::size_t idx) const {
        return successors_[idx];
    }

    /// @brief Jobs that job @p idx depends on, in dependency insertion order.
    [[nodiscard]] const std::vector<std::size_t>& predecessors(std::size_t idx) const {
        return predecessors_[idx];
    }

    /// @brief Number of dependency pairs ending at job @p idx.
    [[nodiscard]] std::size_t in_degree(std::size_t idx) const { return predecessors_[idx].size(); }

    /// @brief Kahn's algorithm over job identifiers.
    ///
    /// A FIFO worklist is seeded with every zero in-degree job in insertion
    /// order; each removed job is appended to the output and decrements the
    /// in-degree of its successors, enqueueing those that reach zero.
    ///
    /// @return The order, or CycleDetected if fewer than job_count() jobs
    ///         could be emitted.
    [[nodiscard]] TopologicalOrder topological_order() const;

    /// @brief Kahn's algorithm over job indices.
    /// @return Job indices in topological order, or std::nullopt on a cycle.
    /// @see topological_order
    [[nodiscard]] std::optional<std::vector<std::size_t>> topological_indices() const;

    /// @brief Check whether the graph contains a cycle.
    [[nodiscard]] bool has_cycle() const { return !topological_indices().has_value(); }

    /// @brief Longest precedence chain, weighted by processing time.
    ///
    /// This is a lower bound on the makespan of any schedule in which every
    /// successor waits for its predecessors to complete.
    ///
    /// @param problem Problem supplying the processing times (same job order).
    /// @return Length of the critical path, or std::nullopt on a cycle.
    [[nodiscard]] std::optional<Duration> critical_path_length(const Problem& problem) const;

private:
    DependencyGraph(std::vector<JobId> ids, const std::vector<Dependency>& dependencies);

    // Emits indices in Kahn order; stops short of job_count() on a cycle.
    [[nodiscard]] std::vector<std::size_t> kahn() const;

    std::vector<JobId> ids_;
    std::unordered_map<JobId, std::size_t> index_;
    std::vector<std::vector<std::size_t>> successors_;
    std::vector<std::vector<std::size_t>> predecessors_;
};

} // namespace jobsched::core
