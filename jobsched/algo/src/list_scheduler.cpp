#include <jobsched/algo/list_scheduler.hpp>

#include <cstdint>

namespace jobsched::algo {

SolveOutcome ListScheduler::solve(const core::Problem& problem, const core::DependencyGraph& graph) {
    auto order = graph.topological_indices();
    if (!order) {
        if (trace_ != nullptr) {
            trace_->begin(0);
            trace_->type("cycle_detected");
            trace_->field("jobs", static_cast<uint64_t>(graph.job_count()));
            trace_->end();
        }
        return SolveFailure{FailureKind::NoValidOrder,
                            "no valid topological order (circular dependency)"};
    }
    return schedule_order(problem, graph, *order);
}

SolveOutcome ListScheduler::schedule_order(const core::Problem& problem,
                                           const core::DependencyGraph& graph,
                                           const std::vector<std::size_t>& order) {
    ScheduleEvaluator evaluator(problem, graph, rule_);
    auto evaluated = evaluator.evaluate(order);
    if (!evaluated) {
        return SolveFailure{FailureKind::Infeasible,
                            "job order places a successor before its predecessor"};
    }

    if (trace_ != nullptr) {
        trace_placements(problem, *evaluated);
    }
    return evaluator.to_schedule(*evaluated);
}

void ListScheduler::trace_placements(const core::Problem& problem, const EvaluatedOrder& evaluated) {
    uint64_t step = 0;
    for (std::size_t idx : evaluated.order) {
        const core::Job& job = problem.job(idx);
        core::TimePoint start = evaluated.start_times[idx];
        trace_->begin(step++);
        trace_->type("place");
        trace_->field("job", static_cast<uint64_t>(job.id()));
        trace_->field("start", start.count());
        trace_->field("end", (start + job.processing_time()).count());
        trace_->end();
    }
}

} // namespace jobsched::algo
