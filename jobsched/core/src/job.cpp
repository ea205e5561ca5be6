#include <jobsched/core/job.hpp>
#include <jobsched/core/error.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace jobsched::core {

Job::Job(JobId id, Duration processing_time, std::vector<MachineId> required_machines)
    : id_(id)
    , processing_time_(processing_time)
    , required_machines_(std::move(required_machines)) {
    const std::string ctx = "job " + std::to_string(id_);
    if (processing_time_ <= Duration::zero()) {
        throw InvalidInputError(ctx + ": processing time must be positive");
    }
    if (required_machines_.empty()) {
        throw InvalidInputError(ctx + ": at least one machine is required");
    }
    for (auto it = required_machines_.begin(); it != required_machines_.end(); ++it) {
        if (std::find(std::next(it), required_machines_.end(), *it) != required_machines_.end()) {
            throw InvalidInputError(ctx + ": machine '" + *it + "' listed twice");
        }
    }
}

Machine::Machine(MachineId id, int64_t capacity)
    : id_(std::move(id))
    , capacity_(capacity) {
    if (id_.empty()) {
        throw InvalidInputError("machine name must not be empty");
    }
    if (capacity_ <= 0) {
        throw InvalidInputError("machine '" + id_ + "': capacity must be positive");
    }
}

} // namespace jobsched::core
