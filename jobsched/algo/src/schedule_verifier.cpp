#include <jobsched/algo/schedule_verifier.hpp>

#include <string>

namespace jobsched::algo {

namespace {

std::string job_name(core::JobId id) {
    return "job " + std::to_string(id);
}

} // anonymous namespace

std::vector<ScheduleViolation> verify_schedule(const core::Problem& problem,
                                               const core::Schedule& schedule,
                                               PrecedenceRule rule) {
    using Kind = ScheduleViolation::Kind;
    std::vector<ScheduleViolation> violations;

    for (const auto& job : problem.jobs()) {
        const core::Assignment* assignment = schedule.find(job.id());
        if (assignment == nullptr) {
            violations.push_back({Kind::MissingJob, job_name(job.id()) + " is not scheduled"});
            continue;
        }
        if (assignment->end - assignment->start != job.processing_time()) {
            violations.push_back({Kind::WrongDuration,
                job_name(job.id()) + " runs for " +
                std::to_string((assignment->end - assignment->start).count()) +
                " instead of " + std::to_string(job.processing_time().count())});
        }
        if (assignment->machines != job.required_machines()) {
            violations.push_back({Kind::MachineMismatch,
                job_name(job.id()) + " holds a different machine set than it requires"});
        }
    }

    for (const auto& assignment : schedule.assignments()) {
        if (!problem.job_index(assignment.job)) {
            violations.push_back({Kind::UnknownJob, job_name(assignment.job) + " is not part of the problem"});
        }
    }

    for (const auto& machine : problem.machines()) {
        auto timeline = schedule.machine_timeline(machine.id());
        if (timeline.empty()) {
            continue;
        }
        // Sorted by start: compare each interval with the one reaching furthest so far
        const core::Assignment* furthest = timeline.front();
        for (std::size_t pos = 1; pos < timeline.size(); ++pos) {
            const core::Assignment* next = timeline[pos];
            if (furthest->interval().overlaps(next->interval())) {
                violations.push_back({Kind::MachineOverlap,
                    job_name(furthest->job) + " and " + job_name(next->job) +
                    " overlap on machine '" + machine.id() + "'"});
            }
            if (next->end > furthest->end) {
                furthest = next;
            }
        }
    }

    if (rule == PrecedenceRule::Completion) {
        for (const auto& dep : problem.dependencies()) {
            const core::Assignment* pred = schedule.find(dep.predecessor);
            const core::Assignment* succ = schedule.find(dep.successor);
            if (pred == nullptr || succ == nullptr) {
                continue;
            }
            if (succ->start < pred->end) {
                violations.push_back({Kind::PrecedenceViolated,
                    job_name(dep.successor) + " starts at " + std::to_string(succ->start.count()) +
                    " before " + job_name(dep.predecessor) + " completes at " +
                    std::to_string(pred->end.count())});
            }
        }
    }

    return violations;
}

} // namespace jobsched::algo
