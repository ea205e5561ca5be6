#include <jobsched/core/schedule.hpp>
#include <jobsched/core/error.hpp>

#include <algorithm>
#include <string>

namespace jobsched::core {

void Schedule::assign(JobId job, TimePoint start, Duration processing_time,
                      std::vector<MachineId> machines) {
    if (!index_.emplace(job, assignments_.size()).second) {
        throw InvalidStateError("job " + std::to_string(job) + " is already scheduled");
    }
    TimePoint end = start + processing_time;
    assignments_.push_back(Assignment{job, start, end, std::move(machines)});
    makespan_ = std::max(makespan_, end.time_since_origin());
}

const Assignment* Schedule::find(JobId job) const {
    auto it = index_.find(job);
    if (it == index_.end()) {
        return nullptr;
    }
    return &assignments_[it->second];
}

const Assignment& Schedule::at(JobId job) const {
    const Assignment* assignment = find(job);
    if (assignment == nullptr) {
        throw InvalidStateError("job " + std::to_string(job) + " is not scheduled");
    }
    return *assignment;
}

std::vector<const Assignment*> Schedule::machine_timeline(const MachineId& machine) const {
    std::vector<const Assignment*> timeline;
    for (const auto& assignment : assignments_) {
        if (std::find(assignment.machines.begin(), assignment.machines.end(), machine) !=
            assignment.machines.end()) {
            timeline.push_back(&assignment);
        }
    }
    std::stable_sort(timeline.begin(), timeline.end(),
        [](const Assignment* lhs, const Assignment* rhs) {
            return lhs->start < rhs->start;
        });
    return timeline;
}

} // namespace jobsched::core
