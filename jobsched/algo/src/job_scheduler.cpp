#include <jobsched/algo/job_scheduler.hpp>
#include <jobsched/algo/list_scheduler.hpp>

#include <string>
#include <utility>

namespace jobsched::algo {

JobScheduler::JobScheduler(std::vector<core::Job> jobs, std::vector<core::Dependency> dependencies,
                           std::vector<core::Machine> machines)
    : problem_(std::move(jobs), std::move(machines), std::move(dependencies))
    , graph_(problem_) {
    auto order = graph_.topological_order();
    if (auto* cycle = std::get_if<core::CycleDetected>(&order)) {
        cycle_ = std::move(*cycle);
    }
}

std::optional<SolveFailure> JobScheduler::cycle_failure() const {
    if (!cycle_) {
        return std::nullopt;
    }
    std::string blocked;
    for (core::JobId id : cycle_->blocked) {
        if (!blocked.empty()) {
            blocked += ", ";
        }
        blocked += std::to_string(id);
    }
    return SolveFailure{FailureKind::CycleDetected,
                        "circular dependency; jobs left unordered: " + blocked};
}

SolveOutcome JobScheduler::run(Solver& solver, core::TraceWriter* trace) const {
    if (auto failure = cycle_failure()) {
        return std::move(*failure);
    }
    solver.set_trace_writer(trace);
    return solver.solve(problem_, graph_);
}

SolveOutcome JobScheduler::run_list_schedule(PrecedenceRule rule, core::TraceWriter* trace) const {
    ListScheduler solver(rule);
    return run(solver, trace);
}

GeneticOutcome JobScheduler::run_genetic(std::size_t population_size, std::size_t generations,
                                         double mutation_rate, std::uint32_t rng_seed,
                                         core::TraceWriter* trace) const {
    return run_genetic(GeneticParams{population_size, generations, mutation_rate}, rng_seed,
                       PrecedenceRule::Completion, trace);
}

GeneticOutcome JobScheduler::run_genetic(const GeneticParams& params, std::uint32_t rng_seed,
                                         PrecedenceRule rule, core::TraceWriter* trace) const {
    GeneticOptimizer optimizer(params, rng_seed, rule);
    if (auto failure = cycle_failure()) {
        return std::move(*failure);
    }
    optimizer.set_trace_writer(trace);
    std::mt19937 rng(rng_seed);
    return optimizer.optimize(problem_, graph_, rng);
}

SolveOutcome JobScheduler::run_backtracking(core::Duration time_horizon,
                                            core::TraceWriter* trace) const {
    return run_backtracking(BacktrackingOptions{time_horizon, true}, trace);
}

SolveOutcome JobScheduler::run_backtracking(const BacktrackingOptions& options,
                                            core::TraceWriter* trace) const {
    BacktrackingSolver solver(options);
    return run(solver, trace);
}

} // namespace jobsched::algo
