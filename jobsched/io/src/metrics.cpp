#include <jobsched/io/metrics.hpp>

#include <jobsched/core/dependency_graph.hpp>

#include <algorithm>
#include <iomanip>
#include <ios>
#include <utility>

namespace jobsched::io {

double ScheduleMetrics::optimality_ratio() const {
    if (lower_bound.count() <= 0) {
        return 1.0;
    }
    return static_cast<double>(makespan.count()) / static_cast<double>(lower_bound.count());
}

ScheduleMetrics compute_schedule_metrics(const core::Problem& problem, const core::Schedule& schedule,
                                         algo::PrecedenceRule rule) {
    ScheduleMetrics metrics;
    metrics.makespan = schedule.makespan();
    metrics.total_processing = problem.total_processing_time();

    // Demand per machine from the input, busy time from the schedule
    std::vector<core::Duration> demand(problem.machine_count(), core::Duration::zero());
    for (std::size_t jidx = 0; jidx < problem.job_count(); ++jidx) {
        for (std::size_t midx : problem.machines_of(jidx)) {
            demand[midx] += problem.job(jidx).processing_time();
        }
    }

    metrics.machines.reserve(problem.machine_count());
    for (std::size_t midx = 0; midx < problem.machine_count(); ++midx) {
        ScheduleMetrics::MachineUsage usage;
        usage.machine = problem.machine(midx).id();
        for (const auto* assignment : schedule.machine_timeline(usage.machine)) {
            usage.busy += assignment->end - assignment->start;
            ++usage.jobs;
        }
        if (metrics.makespan.count() > 0) {
            usage.utilization = static_cast<double>(usage.busy.count()) /
                                static_cast<double>(metrics.makespan.count());
        }
        metrics.machines.push_back(std::move(usage));
        metrics.load_bound = std::max(metrics.load_bound, demand[midx]);
    }

    if (rule == algo::PrecedenceRule::Completion) {
        core::DependencyGraph graph(problem);
        metrics.critical_path = graph.critical_path_length(problem);
    }

    metrics.lower_bound = metrics.load_bound;
    if (metrics.critical_path) {
        metrics.lower_bound = std::max(metrics.lower_bound, *metrics.critical_path);
    }

    return metrics;
}

void write_metrics(const ScheduleMetrics& metrics, std::ostream& out) {
    const std::ios_base::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();

    out << "makespan:          " << metrics.makespan.count() << "\n";
    out << "total processing:  " << metrics.total_processing.count() << "\n";
    out << "load bound:        " << metrics.load_bound.count() << "\n";
    out << "critical path:     ";
    if (metrics.critical_path) {
        out << metrics.critical_path->count() << "\n";
    } else {
        out << "n/a\n";
    }
    out << "lower bound:       " << metrics.lower_bound.count() << "\n";
    out << "optimality ratio:  " << std::fixed << std::setprecision(3) << metrics.optimality_ratio() << "\n";

    for (const auto& usage : metrics.machines) {
        out << "  " << usage.machine << ": busy " << usage.busy.count() << ", jobs " << usage.jobs
            << ", utilization " << std::fixed << std::setprecision(1) << (usage.utilization * 100.0)
            << "%\n";
    }

    out.flags(flags);
    out.precision(precision);
}

} // namespace jobsched::io
