#pragma once

#include <jobsched/core/types.hpp>

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace jobsched::core {

/// @brief Placement of one job: when it runs and which machines it holds.
/// @ingroup core
struct Assignment {
    JobId job;                       ///< Assigned job.
    TimePoint start;                 ///< Start time.
    TimePoint end;                   ///< Completion time (start + processing time).
    std::vector<MachineId> machines; ///< Machines held during [start, end).

    /// @brief Interval occupied on each machine.
    [[nodiscard]] Interval interval() const noexcept { return Interval{start, end}; }
};

/// @brief Result of a solve: a start time and machine set per job.
///
/// Assignments are kept in the order the solver placed them. The schedule
/// is a plain value; solvers build a fresh one per call and hand it to the
/// caller.
///
/// @see Assignment
/// @ingroup core
class Schedule {
public:
    /// @brief Record the placement of a job.
    /// @param job             Job identifier.
    /// @param start           Start time.
    /// @param processing_time Processing time of the job.
    /// @param machines        Machines held for the whole interval.
    /// @throws InvalidStateError If @p job is already assigned.
    void assign(JobId job, TimePoint start, Duration processing_time,
                std::vector<MachineId> machines);

    /// @brief All assignments in placement order.
    [[nodiscard]] const std::vector<Assignment>& assignments() const noexcept {
        return assignments_;
    }

    [[nodiscard]] std::size_t size() const noexcept { return assignments_.size(); }
    [[nodiscard]] bool empty() const noexcept { return assignments_.empty(); }

    /// @brief Check whether @p job has been assigned.
    [[nodiscard]] bool contains(JobId job) const { return index_.contains(job); }

    /// @brief Look up the assignment of @p job.
    /// @return Pointer to the assignment, or nullptr if the job is absent.
    [[nodiscard]] const Assignment* find(JobId job) const;

    /// @brief Look up the assignment of @p job.
    /// @throws InvalidStateError If the job is absent.
    [[nodiscard]] const Assignment& at(JobId job) const;

    /// @brief Start time of @p job.
    /// @throws InvalidStateError If the job is absent.
    [[nodiscard]] TimePoint start_of(JobId job) const { return at(job).start; }

    /// @brief Time at which the last machine finishes its last job.
    /// @return Latest completion time as a Duration from the origin; zero when empty.
    [[nodiscard]] Duration makespan() const noexcept { return makespan_; }

    /// @brief Assignments holding @p machine, sorted by start time.
    /// @param machine Machine name.
    /// @return Pointers into assignments(); valid until the next assign().
    [[nodiscard]] std::vector<const Assignment*> machine_timeline(const MachineId& machine) const;

private:
    std::vector<Assignment> assignments_;
    std::unordered_map<JobId, std::size_t> index_;
    Duration makespan_;
};

} // namespace jobsched::core
