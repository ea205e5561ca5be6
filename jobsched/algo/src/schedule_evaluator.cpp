#include <jobsched/algo/schedule_evaluator.hpp>
#include <jobsched/algo/machine_timeline.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace jobsched::algo {

using core::Duration;
using core::TimePoint;

ScheduleEvaluator::ScheduleEvaluator(const core::Problem& problem,
                                     const core::DependencyGraph& graph,
                                     PrecedenceRule rule)
    : problem_(problem)
    , graph_(graph)
    , rule_(rule) {
    if (graph_.job_count() != problem_.job_count()) {
        throw InvalidParameterError("dependency graph does not match the problem's job set");
    }
}

void ScheduleEvaluator::check_permutation(const std::vector<std::size_t>& order) const {
    const std::size_t job_count = problem_.job_count();
    if (order.size() != job_count) {
        throw InvalidParameterError("order has " + std::to_string(order.size()) +
                                    " entries, expected " + std::to_string(job_count));
    }
    std::vector<bool> seen(job_count, false);
    for (std::size_t idx : order) {
        if (idx >= job_count || seen[idx]) {
            throw InvalidParameterError("order is not a permutation of the job set");
        }
        seen[idx] = true;
    }
}

std::optional<EvaluatedOrder> ScheduleEvaluator::evaluate(const std::vector<std::size_t>& order) const {
    check_permutation(order);

    constexpr TimePoint UNPLACED{-1};
    MachineAvailability machines(problem_.machine_count());
    std::vector<TimePoint> start_times(problem_.job_count(), UNPLACED);

    for (std::size_t idx : order) {
        TimePoint start = machines.earliest_start(problem_.machines_of(idx));
        for (std::size_t pred : graph_.predecessors(idx)) {
            if (start_times[pred] == UNPLACED) {
                return std::nullopt;
            }
            if (rule_ == PrecedenceRule::Completion) {
                start = std::max(start, start_times[pred] + problem_.job(pred).processing_time());
            }
        }
        start_times[idx] = start;
        machines.occupy(problem_.machines_of(idx), start + problem_.job(idx).processing_time());
    }

    return EvaluatedOrder{order, std::move(start_times), machines.latest().time_since_origin()};
}

std::optional<EvaluatedOrder> ScheduleEvaluator::evaluate_ids(const std::vector<core::JobId>& order) const {
    return evaluate(to_indices(order));
}

std::optional<Duration> ScheduleEvaluator::makespan(const std::vector<std::size_t>& order) const {
    auto evaluated = evaluate(order);
    if (!evaluated) {
        return std::nullopt;
    }
    return evaluated->makespan;
}

core::Schedule ScheduleEvaluator::to_schedule(const EvaluatedOrder& evaluated) const {
    core::Schedule schedule;
    for (std::size_t idx : evaluated.order) {
        const core::Job& job = problem_.job(idx);
        schedule.assign(job.id(), evaluated.start_times[idx], job.processing_time(),
                        job.required_machines());
    }
    return schedule;
}

std::vector<std::size_t> ScheduleEvaluator::to_indices(const std::vector<core::JobId>& order) const {
    std::vector<std::size_t> indices;
    indices.reserve(order.size());
    for (core::JobId id : order) {
        auto idx = problem_.job_index(id);
        if (!idx) {
            throw InvalidParameterError("order names unknown job " + std::to_string(id));
        }
        indices.push_back(*idx);
    }
    return indices;
}

std::vector<core::JobId> ScheduleEvaluator::to_ids(const std::vector<std::size_t>& order) const {
    std::vector<core::JobId> ids;
    ids.reserve(order.size());
    for (std::size_t idx : order) {
        ids.push_back(problem_.job(idx).id());
    }
    return ids;
}

} // namespace jobsched::algo
