#include <jobsched/algo/backtracking_solver.hpp>

#include <algorithm>
#include <optional>
#include <string>

namespace jobsched::algo {

using core::Duration;
using core::Interval;
using core::TimePoint;

// State of one search: bookings, chosen starts and counters. Built fresh for
// every solve_order() call and discarded afterwards.
class BacktrackingSolver::Search {
public:
    Search(const core::Problem& problem, const core::DependencyGraph& graph,
           const std::vector<std::size_t>& order, const BacktrackingOptions& options,
           core::TraceWriter* trace)
        : problem_(problem)
        , graph_(graph)
        , order_(order)
        , horizon_end_(options.time_horizon)
        , respect_precedence_(options.respect_precedence)
        , trace_(trace)
        , bookings_(problem.machine_count())
        , start_times_(problem.job_count())
        , placed_(problem.job_count(), false) {}

    bool place(std::size_t position) {
        if (position == order_.size()) {
            return true;
        }

        const std::size_t idx = order_[position];
        const Duration length = problem_.job(idx).processing_time();
        const auto& machines = problem_.machines_of(idx);

        const TimePoint last_start = horizon_end_ - length;
        for (TimePoint start = earliest_start(idx); start <= last_start; start += Duration{1}) {
            ++stats_.nodes;
            const Interval interval{start, start + length};
            if (!bookings_.is_free(machines, interval)) {
                continue;
            }

            bookings_.commit(machines, interval);
            start_times_[idx] = start;
            placed_[idx] = true;
            ++stats_.commits;
            emit("commit", idx, start);

            if (place(position + 1)) {
                return true;
            }

            bookings_.rollback(machines, interval);
            placed_[idx] = false;
            ++stats_.rollbacks;
            emit("rollback", idx, start);
        }

        emit("exhausted", idx, std::nullopt);
        return false;
    }

    [[nodiscard]] core::Schedule schedule() const {
        core::Schedule schedule;
        for (std::size_t idx : order_) {
            const core::Job& job = problem_.job(idx);
            schedule.assign(job.id(), start_times_[idx], job.processing_time(),
                            job.required_machines());
        }
        return schedule;
    }

    [[nodiscard]] const SearchStats& stats() const noexcept { return stats_; }

private:
    [[nodiscard]] TimePoint earliest_start(std::size_t idx) const {
        TimePoint earliest = TimePoint::origin();
        if (!respect_precedence_) {
            return earliest;
        }
        for (std::size_t pred : graph_.predecessors(idx)) {
            if (placed_[pred]) {
                earliest = std::max(earliest, start_times_[pred] + problem_.job(pred).processing_time());
            }
        }
        return earliest;
    }

    void emit(std::string_view event, std::size_t idx, std::optional<TimePoint> start) {
        if (trace_ == nullptr) {
            return;
        }
        trace_->begin(stats_.nodes);
        trace_->type(event);
        trace_->field("job", static_cast<uint64_t>(problem_.job(idx).id()));
        if (start) {
            trace_->field("start", start->count());
        }
        trace_->end();
    }

    const core::Problem& problem_;
    const core::DependencyGraph& graph_;
    const std::vector<std::size_t>& order_;
    TimePoint horizon_end_;
    bool respect_precedence_;
    core::TraceWriter* trace_;

    MachineBookings bookings_;
    std::vector<TimePoint> start_times_;
    std::vector<bool> placed_;
    SearchStats stats_;
};

BacktrackingSolver::BacktrackingSolver(BacktrackingOptions options)
    : options_(options) {
    if (options_.time_horizon <= Duration::zero()) {
        throw InvalidParameterError("time horizon must be positive, got " +
                                    std::to_string(options_.time_horizon.count()));
    }
}

SolveOutcome BacktrackingSolver::solve(const core::Problem& problem, const core::DependencyGraph& graph) {
    auto order = graph.topological_indices();
    if (!order) {
        return SolveFailure{FailureKind::CycleDetected,
                            "dependency graph contains a cycle; no precedence-respecting order"};
    }
    return solve_order(problem, graph, *order);
}

SolveOutcome BacktrackingSolver::solve_order(const core::Problem& problem,
                                             const core::DependencyGraph& graph,
                                             const std::vector<std::size_t>& order) {
    if (order.size() != problem.job_count()) {
        throw InvalidParameterError("order must list every job exactly once");
    }
    std::vector<bool> seen(problem.job_count(), false);
    for (std::size_t idx : order) {
        if (idx >= problem.job_count() || seen[idx]) {
            throw InvalidParameterError("order must list every job exactly once");
        }
        seen[idx] = true;
    }

    Search search(problem, graph, order, options_, trace_);
    const bool found = search.place(0);
    stats_ = search.stats();

    if (trace_ != nullptr) {
        trace_->begin(stats_.nodes);
        trace_->type(found ? "solved" : "infeasible");
        trace_->field("nodes", stats_.nodes);
        trace_->field("rollbacks", stats_.rollbacks);
        trace_->end();
    }

    if (!found) {
        return SolveFailure{FailureKind::Infeasible,
                            "no feasible placement within horizon " +
                            std::to_string(options_.time_horizon.count())};
    }
    return search.schedule();
}

} // namespace jobsched::algo
