#include <jobsched/core/problem.hpp>
#include <jobsched/core/error.hpp>

#include <string>
#include <utility>

namespace jobsched::core {

Problem::Problem(std::vector<Job> jobs, std::vector<Machine> machines,
                 std::vector<Dependency> dependencies)
    : jobs_(std::move(jobs))
    , machines_(std::move(machines))
    , dependencies_(std::move(dependencies)) {
    machine_index_.reserve(machines_.size());
    for (std::size_t idx = 0; idx < machines_.size(); ++idx) {
        if (!machine_index_.emplace(machines_[idx].id(), idx).second) {
            throw InvalidInputError("duplicate machine '" + machines_[idx].id() + "'");
        }
    }

    job_index_.reserve(jobs_.size());
    job_machines_.reserve(jobs_.size());
    for (std::size_t idx = 0; idx < jobs_.size(); ++idx) {
        const Job& job = jobs_[idx];
        if (!job_index_.emplace(job.id(), idx).second) {
            throw InvalidInputError("duplicate job " + std::to_string(job.id()));
        }

        std::vector<std::size_t> required;
        required.reserve(job.required_machines().size());
        for (const auto& name : job.required_machines()) {
            auto it = machine_index_.find(name);
            if (it == machine_index_.end()) {
                throw UnknownMachineReference(name, job.id());
            }
            required.push_back(it->second);
        }
        job_machines_.push_back(std::move(required));

        // Every start time a solver computes is bounded by this sum
        if (job.processing_time() > Duration::max() - total_processing_) {
            throw InvalidInputError("job " + std::to_string(job.id()) +
                                    ": total processing time exceeds the representable range");
        }
        total_processing_ += job.processing_time();
    }

    for (const auto& dep : dependencies_) {
        if (!job_index_.contains(dep.predecessor)) {
            throw UnknownJobReference(dep.predecessor);
        }
        if (!job_index_.contains(dep.successor)) {
            throw UnknownJobReference(dep.successor);
        }
    }
}

std::optional<std::size_t> Problem::job_index(JobId id) const {
    auto it = job_index_.find(id);
    if (it == job_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::size_t> Problem::machine_index(const MachineId& id) const {
    auto it = machine_index_.find(id);
    if (it == machine_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace jobsched::core
