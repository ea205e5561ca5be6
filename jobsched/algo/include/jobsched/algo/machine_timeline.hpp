#pragma once

#include <jobsched/core/types.hpp>

#include <cstddef>
#include <vector>

namespace jobsched::algo {

/// @brief Per-machine "next free time" scalars.
/// @ingroup algo_timelines
///
/// Adequate for single-pass placement in which every job is put at the
/// earliest time all of its machines are free: nothing is ever inserted
/// before an existing booking, so the latest end time per machine is the
/// whole state. Used by the ScheduleEvaluator (and hence by the list
/// scheduler and the genetic optimizer).
///
/// Instances are cheap and meant to be created fresh for each evaluation.
///
/// @see MachineBookings
class MachineAvailability {
public:
    /// @brief Create a timeline with every machine free from time zero.
    /// @param machine_count Number of machines.
    explicit MachineAvailability(std::size_t machine_count)
        : next_free_(machine_count) {}

    /// @brief Earliest time at which every machine in @p machines is free.
    /// @param machines Machine indices.
    /// @return Maximum of their next-free times.
    [[nodiscard]] core::TimePoint earliest_start(const std::vector<std::size_t>& machines) const;

    /// @brief Mark @p machines busy until @p until.
    /// @param machines Machine indices.
    /// @param until    New next-free time for each of them.
    void occupy(const std::vector<std::size_t>& machines, core::TimePoint until);

    /// @brief Next-free time of machine @p machine.
    [[nodiscard]] core::TimePoint next_free(std::size_t machine) const { return next_free_[machine]; }

    /// @brief Latest next-free time over all machines (the makespan so far).
    [[nodiscard]] core::TimePoint latest() const;

private:
    std::vector<core::TimePoint> next_free_;
};

/// @brief Per-machine lists of committed intervals.
/// @ingroup algo_timelines
///
/// Required by the backtracking search, which may place a job into any gap
/// and must test each candidate against every booked interval. Placement is
/// an explicit commit/rollback pair: commit() appends the interval to every
/// machine of the job, rollback() removes it again.
///
/// @see MachineAvailability, BacktrackingSolver
class MachineBookings {
public:
    /// @brief Create a timeline with no bookings.
    /// @param machine_count Number of machines.
    explicit MachineBookings(std::size_t machine_count)
        : bookings_(machine_count) {}

    /// @brief Check that @p interval overlaps no booking on @p machine.
    [[nodiscard]] bool is_free(std::size_t machine, const core::Interval& interval) const;

    /// @brief Check that @p interval is free on every machine in @p machines.
    [[nodiscard]] bool is_free(const std::vector<std::size_t>& machines,
                               const core::Interval& interval) const;

    /// @brief Book @p interval on every machine in @p machines.
    void commit(const std::vector<std::size_t>& machines, const core::Interval& interval);

    /// @brief Remove @p interval from every machine in @p machines.
    ///
    /// The interval is normally the most recent booking on each machine;
    /// any earlier match is removed otherwise.
    void rollback(const std::vector<std::size_t>& machines, const core::Interval& interval);

    /// @brief Bookings on @p machine, in commit order.
    [[nodiscard]] const std::vector<core::Interval>& bookings(std::size_t machine) const {
        return bookings_[machine];
    }

    /// @brief Total number of booked intervals across all machines.
    [[nodiscard]] std::size_t booking_count() const noexcept;

private:
    std::vector<std::vector<core::Interval>> bookings_;
};

} // namespace jobsched::algo
