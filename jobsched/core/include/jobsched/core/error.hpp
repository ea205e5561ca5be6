#pragma once

#include <jobsched/core/types.hpp>

#include <stdexcept>
#include <string>

namespace jobsched::core {

/// @brief Base exception for all scheduling input errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch scheduling-specific errors separately
/// from other `std::runtime_error` exceptions. Input errors are raised
/// while a problem is being constructed, never from inside a solver.
///
/// @see InvalidInputError, UnknownJobReference, UnknownMachineReference, InvalidStateError
/// @ingroup core
class SchedulingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an entity violates its own invariants.
///
/// For example a job with a non-positive processing time, an empty or
/// duplicated machine list, a machine with zero capacity, or two jobs
/// sharing one identifier.
///
/// @see SchedulingError
/// @ingroup core
class InvalidInputError : public SchedulingError {
public:
    using SchedulingError::SchedulingError;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example assigning a job twice in the same Schedule, or querying the
/// start time of a job the schedule does not contain.
///
/// @see SchedulingError
/// @ingroup core
class InvalidStateError : public SchedulingError {
public:
    using SchedulingError::SchedulingError;
};

/// @brief Thrown when a dependency names a job that is not part of the problem.
///
/// @see DependencyGraph, SchedulingError
/// @ingroup core
class UnknownJobReference : public SchedulingError {
public:
    /// @brief Construct the error for the missing job @p job.
    /// @param job The identifier that could not be resolved.
    explicit UnknownJobReference(JobId job)
        : SchedulingError("dependency references unknown job " + std::to_string(job))
        , job_(job) {}

    /// @brief Get the identifier that could not be resolved.
    /// @return The unknown job id.
    [[nodiscard]] JobId job() const noexcept { return job_; }

private:
    JobId job_;
};

/// @brief Thrown when a job requires a machine that is not part of the problem.
///
/// @see Problem, SchedulingError
/// @ingroup core
class UnknownMachineReference : public SchedulingError {
public:
    /// @brief Construct the error for job @p job naming machine @p machine.
    /// @param machine The machine name that could not be resolved.
    /// @param job     The job whose requirement list named it.
    UnknownMachineReference(const MachineId& machine, JobId job)
        : SchedulingError("job " + std::to_string(job) +
                          " requires unknown machine '" + machine + "'")
        , machine_(machine)
        , job_(job) {}

    /// @brief Get the machine name that could not be resolved.
    /// @return The unknown machine id.
    [[nodiscard]] const MachineId& machine() const noexcept { return machine_; }

    /// @brief Get the job that referenced the unknown machine.
    /// @return The referencing job id.
    [[nodiscard]] JobId job() const noexcept { return job_; }

private:
    MachineId machine_;
    JobId job_;
};

} // namespace jobsched::core
