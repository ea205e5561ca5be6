#pragma once

#include <jobsched/core/types.hpp>

#include <vector>

namespace jobsched::core {

/// @brief A unit of work that occupies one or more machines for its whole duration.
/// @ingroup core
///
/// A job with a single required machine is simply a job whose machine list
/// has length one; no solver special-cases it. Jobs are immutable once
/// constructed.
///
/// @see Machine, Dependency, Problem
class Job {
public:
    /// @brief Construct a new Job.
    /// @param id                Caller-assigned identifier, unique within a Problem.
    /// @param processing_time   Uninterrupted processing time; must be positive.
    /// @param required_machines Machines occupied simultaneously; non-empty, no duplicates.
    /// @throws InvalidInputError If any of the invariants above is violated.
    Job(JobId id, Duration processing_time, std::vector<MachineId> required_machines);

    /// @brief Get the job identifier.
    /// @return Job ID.
    [[nodiscard]] JobId id() const noexcept { return id_; }

    /// @brief Get the processing time.
    /// @return Time the job holds its machines.
    [[nodiscard]] Duration processing_time() const noexcept { return processing_time_; }

    /// @brief Get the machines the job occupies.
    /// @return Required machines, in the order they were given.
    [[nodiscard]] const std::vector<MachineId>& required_machines() const noexcept {
        return required_machines_;
    }

private:
    JobId id_;
    Duration processing_time_;
    std::vector<MachineId> required_machines_;
};

/// @brief A named machine.
/// @ingroup core
///
/// The capacity is accepted and validated but no solver consults it: every
/// machine processes at most one job interval at a time.
class Machine {
public:
    /// @brief Construct a new Machine.
    /// @param id       Machine name; must be non-empty.
    /// @param capacity Positive capacity value.
    /// @throws InvalidInputError If the name is empty or the capacity is not positive.
    Machine(MachineId id, int64_t capacity = 1);

    /// @brief Get the machine name.
    /// @return Machine ID.
    [[nodiscard]] const MachineId& id() const noexcept { return id_; }

    /// @brief Get the capacity.
    /// @return Capacity as given at construction.
    [[nodiscard]] int64_t capacity() const noexcept { return capacity_; }

private:
    MachineId id_;
    int64_t capacity_;
};

/// @brief Ordering constraint between two jobs.
/// @ingroup core
struct Dependency {
    JobId predecessor; ///< Job that must come first.
    JobId successor;   ///< Job that waits for the predecessor.

    constexpr bool operator==(const Dependency&) const noexcept = default;
};

} // namespace jobsched::core
