#include <jobsched/core/dependency_graph.hpp>
#include <jobsched/core/error.hpp>
#include <jobsched/core/problem.hpp>

#include <algorithm>
#include <deque>
#include <string>

namespace jobsched::core {

namespace {

std::vector<JobId> ids_of(const std::vector<Job>& jobs) {
    std::vector<JobId> ids;
    ids.reserve(jobs.size());
    for (const auto& job : jobs) {
        ids.push_back(job.id());
    }
    return ids;
}

} // anonymous namespace

DependencyGraph::DependencyGraph(std::vector<JobId> ids, const std::vector<Dependency>& dependencies)
    : ids_(std::move(ids))
    , successors_(ids_.size())
    , predecessors_(ids_.size()) {
    index_.reserve(ids_.size());
    for (std::size_t idx = 0; idx < ids_.size(); ++idx) {
        if (!index_.emplace(ids_[idx], idx).second) {
            throw InvalidInputError("duplicate job " + std::to_string(ids_[idx]));
        }
    }

    for (const auto& dep : dependencies) {
        auto pred = index_.find(dep.predecessor);
        if (pred == index_.end()) {
            throw UnknownJobReference(dep.predecessor);
        }
        auto succ = index_.find(dep.successor);
        if (succ == index_.end()) {
            throw UnknownJobReference(dep.successor);
        }
        successors_[pred->second].push_back(succ->second);
        predecessors_[succ->second].push_back(pred->second);
    }
}

DependencyGraph::DependencyGraph(const Problem& problem)
    : DependencyGraph(ids_of(problem.jobs()), problem.dependencies()) {}

DependencyGraph DependencyGraph::build(const std::vector<Job>& jobs,
                                       const std::vector<Dependency>& dependencies) {
    return DependencyGraph(ids_of(jobs), dependencies);
}

std::vector<std::size_t> DependencyGraph::kahn() const {
    std::vector<std::size_t> remaining(ids_.size());
    std::deque<std::size_t> ready;
    for (std::size_t idx = 0; idx < ids_.size(); ++idx) {
        remaining[idx] = predecessors_[idx].size();
        if (remaining[idx] == 0) {
            ready.push_back(idx);
        }
    }

    std::vector<std::size_t> order;
    order.reserve(ids_.size());
    while (!ready.empty()) {
        std::size_t current = ready.front();
        ready.pop_front();
        order.push_back(current);
        for (std::size_t succ : successors_[current]) {
            if (--remaining[succ] == 0) {
                ready.push_back(succ);
            }
        }
    }
    return order;
}

std::optional<std::vector<std::size_t>> DependencyGraph::topological_indices() const {
    auto order = kahn();
    if (order.size() != ids_.size()) {
        return std::nullopt;
    }
    return order;
}

TopologicalOrder DependencyGraph::topological_order() const {
    auto order = kahn();
    if (order.size() != ids_.size()) {
        std::vector<bool> emitted(ids_.size(), false);
        for (std::size_t idx : order) {
            emitted[idx] = true;
        }
        CycleDetected cycle;
        for (std::size_t idx = 0; idx < ids_.size(); ++idx) {
            if (!emitted[idx]) {
                cycle.blocked.push_back(ids_[idx]);
            }
        }
        return cycle;
    }

    std::vector<JobId> ids;
    ids.reserve(order.size());
    for (std::size_t idx : order) {
        ids.push_back(ids_[idx]);
    }
    return ids;
}

std::optional<Duration> DependencyGraph::critical_path_length(const Problem& problem) const {
    auto order = topological_indices();
    if (!order) {
        return std::nullopt;
    }

    // finish[i]: earliest completion of job i if machines were unlimited
    std::vector<Duration> finish(ids_.size());
    Duration longest = Duration::zero();
    for (std::size_t idx : *order) {
        Duration ready = Duration::zero();
        for (std::size_t pred : predecessors_[idx]) {
            ready = std::max(ready, finish[pred]);
        }
        finish[idx] = ready + problem.job(idx).processing_time();
        longest = std::max(longest, finish[idx]);
    }
    return longest;
}

} // namespace jobsched::core
