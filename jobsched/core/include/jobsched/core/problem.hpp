#pragma once

#include <jobsched/core/job.hpp>
#include <jobsched/core/types.hpp>

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace jobsched::core {

/// @brief Validated input of one scheduling request.
///
/// The Problem owns the jobs, machines and dependency pairs supplied by the
/// caller and resolves every identifier to a dense index once, at
/// construction. Solvers work exclusively on those indices: job index @c i
/// is the i-th job in insertion order, machine index @c m the m-th machine.
///
/// A Problem is immutable after construction; every solve derives its own
/// state from it and discards that state afterwards.
///
/// @see Job, Machine, Dependency, DependencyGraph
/// @ingroup core
class Problem {
public:
    /// @brief Build and validate a problem.
    /// @param jobs         Jobs in caller order (the order defines tie-breaks).
    /// @param machines     Available machines.
    /// @param dependencies Precedence pairs.
    /// @throws InvalidInputError       On duplicate job or machine identifiers.
    /// @throws UnknownMachineReference If a job requires a machine not in @p machines.
    /// @throws UnknownJobReference     If a dependency names a job not in @p jobs.
    Problem(std::vector<Job> jobs, std::vector<Machine> machines,
            std::vector<Dependency> dependencies = {});

    /// @name Collection Sizes
    /// @{
    [[nodiscard]] std::size_t job_count() const noexcept { return jobs_.size(); }
    [[nodiscard]] std::size_t machine_count() const noexcept { return machines_.size(); }
    /// @}

    /// @name Indexed Access
    /// @{
    [[nodiscard]] const Job& job(std::size_t idx) const { return jobs_[idx]; }
    [[nodiscard]] const Machine& machine(std::size_t idx) const { return machines_[idx]; }
    [[nodiscard]] const std::vector<Job>& jobs() const noexcept { return jobs_; }
    [[nodiscard]] const std::vector<Machine>& machines() const noexcept { return machines_; }
    [[nodiscard]] const std::vector<Dependency>& dependencies() const noexcept {
        return dependencies_;
    }
    /// @}

    /// @brief Resolve a job identifier.
    /// @param id Job identifier.
    /// @return Index of the job, or std::nullopt if it is unknown.
    [[nodiscard]] std::optional<std::size_t> job_index(JobId id) const;

    /// @brief Resolve a machine identifier.
    /// @param id Machine name.
    /// @return Index of the machine, or std::nullopt if it is unknown.
    [[nodiscard]] std::optional<std::size_t> machine_index(const MachineId& id) const;

    /// @brief Machine indices required by job @p job_idx, in requirement order.
    /// @param job_idx Job index.
    /// @return Indices into machines().
    [[nodiscard]] const std::vector<std::size_t>& machines_of(std::size_t job_idx) const {
        return job_machines_[job_idx];
    }

    /// @brief Sum of all processing times.
    /// @return Total processing demand.
    [[nodiscard]] Duration total_processing_time() const noexcept { return total_processing_; }

private:
    std::vector<Job> jobs_;
    std::vector<Machine> machines_;
    std::vector<Dependency> dependencies_;

    std::unordered_map<JobId, std::size_t> job_index_;
    std::unordered_map<MachineId, std::size_t> machine_index_;
    std::vector<std::vector<std::size_t>> job_machines_;
    Duration total_processing_;
};

} // namespace jobsched::core
