#include <jobsched/algo/machine_timeline.hpp>

#include <algorithm>
#include <iterator>

namespace jobsched::algo {

using core::Interval;
using core::TimePoint;

// =============================================================================
// MachineAvailability
// =============================================================================

TimePoint MachineAvailability::earliest_start(const std::vector<std::size_t>& machines) const {
    TimePoint start = TimePoint::origin();
    for (std::size_t machine : machines) {
        start = std::max(start, next_free_[machine]);
    }
    return start;
}

void MachineAvailability::occupy(const std::vector<std::size_t>& machines, TimePoint until) {
    for (std::size_t machine : machines) {
        next_free_[machine] = until;
    }
}

TimePoint MachineAvailability::latest() const {
    TimePoint latest = TimePoint::origin();
    for (const auto& free_at : next_free_) {
        latest = std::max(latest, free_at);
    }
    return latest;
}

// =============================================================================
// MachineBookings
// =============================================================================

bool MachineBookings::is_free(std::size_t machine, const Interval& interval) const {
    return std::none_of(bookings_[machine].begin(), bookings_[machine].end(),
        [&interval](const Interval& booked) { return booked.overlaps(interval); });
}

bool MachineBookings::is_free(const std::vector<std::size_t>& machines,
                              const Interval& interval) const {
    return std::all_of(machines.begin(), machines.end(),
        [this, &interval](std::size_t machine) { return is_free(machine, interval); });
}

void MachineBookings::commit(const std::vector<std::size_t>& machines, const Interval& interval) {
    for (std::size_t machine : machines) {
        bookings_[machine].push_back(interval);
    }
}

void MachineBookings::rollback(const std::vector<std::size_t>& machines, const Interval& interval) {
    for (std::size_t machine : machines) {
        auto& booked = bookings_[machine];
        if (!booked.empty() && booked.back() == interval) {
            booked.pop_back();
            continue;
        }
        auto it = std::find(booked.rbegin(), booked.rend(), interval);
        if (it != booked.rend()) {
            booked.erase(std::next(it).base());
        }
    }
}

std::size_t MachineBookings::booking_count() const noexcept {
    std::size_t count = 0;
    for (const auto& booked : bookings_) {
        count += booked.size();
    }
    return count;
}

} // namespace jobsched::algo
