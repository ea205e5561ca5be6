#include <jobsched/algo/genetic_optimizer.hpp>

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>

namespace jobsched::algo {

using core::Duration;

namespace {

// Feasible individuals rank before infeasible ones, then by makespan.
bool fitter(const std::optional<Duration>& lhs, const std::optional<Duration>& rhs) {
    if (!lhs) {
        return false;
    }
    if (!rhs) {
        return true;
    }
    return *lhs < *rhs;
}

void update_best(std::optional<Duration>& best_seen, const std::optional<Duration>& candidate) {
    if (fitter(candidate, best_seen)) {
        best_seen = candidate;
    }
}

} // anonymous namespace

GeneticOptimizer::GeneticOptimizer(GeneticParams params, std::uint32_t seed, PrecedenceRule rule)
    : params_(params)
    , seed_(seed)
    , rule_(rule) {
    if (params_.population_size < 4) {
        throw InvalidParameterError("population size must be at least 4, got " +
                                    std::to_string(params_.population_size));
    }
    if (!(params_.mutation_rate >= 0.0 && params_.mutation_rate <= 1.0)) {
        throw InvalidParameterError("mutation rate must be in [0, 1], got " +
                                    std::to_string(params_.mutation_rate));
    }
}

SolveOutcome GeneticOptimizer::solve(const core::Problem& problem, const core::DependencyGraph& graph) {
    std::mt19937 rng(seed_);
    auto outcome = optimize(problem, graph, rng);
    if (auto* failure = std::get_if<SolveFailure>(&outcome)) {
        return std::move(*failure);
    }
    return std::move(std::get<GeneticResult>(outcome).schedule);
}

GeneticOptimizer::Chromosome GeneticOptimizer::crossover(const Chromosome& first,
                                                         const Chromosome& second,
                                                         std::mt19937& rng) {
    const std::size_t size = first.size();
    if (size < 2) {
        return first;
    }

    std::uniform_int_distribution<std::size_t> cut_dist(1, size - 1);
    const std::size_t cut = cut_dist(rng);

    // Genes are job indices, so membership is a dense bitmap
    std::size_t max_gene = 0;
    for (std::size_t gene : first) {
        max_gene = std::max(max_gene, gene);
    }
    std::vector<bool> taken(max_gene + 1, false);

    Chromosome child;
    child.reserve(size);
    for (std::size_t pos = 0; pos < cut; ++pos) {
        child.push_back(first[pos]);
        taken[first[pos]] = true;
    }
    for (std::size_t gene : second) {
        if (gene < taken.size() && !taken[gene]) {
            child.push_back(gene);
            taken[gene] = true;
        }
    }
    return child;
}

void GeneticOptimizer::mutate(Chromosome& individual, std::mt19937& rng) const {
    std::uniform_real_distribution<double> chance(0.0, 1.0);
    if (chance(rng) >= params_.mutation_rate || individual.size() < 2) {
        return;
    }

    std::uniform_int_distribution<std::size_t> first_dist(0, individual.size() - 1);
    std::uniform_int_distribution<std::size_t> second_dist(0, individual.size() - 2);
    std::size_t first = first_dist(rng);
    std::size_t second = second_dist(rng);
    if (second >= first) {
        ++second;
    }
    std::swap(individual[first], individual[second]);
}

std::vector<GeneticOptimizer::Scored> GeneticOptimizer::score(std::vector<Chromosome> population,
                                                              const ScheduleEvaluator& evaluator) const {
    std::vector<Scored> scored;
    scored.reserve(population.size());
    for (auto& genes : population) {
        auto makespan = evaluator.makespan(genes);
        scored.push_back(Scored{std::move(genes), makespan});
    }
    std::stable_sort(scored.begin(), scored.end(),
        [](const Scored& lhs, const Scored& rhs) { return fitter(lhs.makespan, rhs.makespan); });
    return scored;
}

std::vector<GeneticOptimizer::Chromosome> GeneticOptimizer::breed(const std::vector<Scored>& survivors,
                                                                  std::mt19937& rng) const {
    std::uniform_int_distribution<std::size_t> first_dist(0, survivors.size() - 1);
    std::uniform_int_distribution<std::size_t> second_dist(0, survivors.size() - 2);

    std::vector<Chromosome> children;
    children.reserve(params_.population_size);
    while (children.size() < params_.population_size) {
        std::size_t first = first_dist(rng);
        std::size_t second = second_dist(rng);
        if (second >= first) {
            ++second;
        }
        Chromosome child = crossover(survivors[first].genes, survivors[second].genes, rng);
        mutate(child, rng);
        children.push_back(std::move(child));
    }
    return children;
}

GeneticOutcome GeneticOptimizer::optimize(const core::Problem& problem,
                                          const core::DependencyGraph& graph,
                                          std::mt19937& rng) {
    if (graph.has_cycle()) {
        return SolveFailure{FailureKind::CycleDetected,
                            "dependency graph contains a cycle; no order is feasible"};
    }

    ScheduleEvaluator evaluator(problem, graph, rule_);
    const std::size_t job_count = problem.job_count();

    Chromosome identity(job_count);
    std::iota(identity.begin(), identity.end(), std::size_t{0});

    std::vector<Chromosome> population;
    population.reserve(params_.population_size);
    for (std::size_t idx = 0; idx < params_.population_size; ++idx) {
        Chromosome individual = identity;
        std::shuffle(individual.begin(), individual.end(), rng);
        population.push_back(std::move(individual));
    }

    GeneticResult result;
    result.history.reserve(params_.generations + 1);
    std::optional<Duration> best_seen;

    for (std::size_t generation = 0; generation < params_.generations; ++generation) {
        auto ranked = score(std::move(population), evaluator);
        update_best(best_seen, ranked.front().makespan);
        result.history.push_back(best_seen);
        if (trace_ != nullptr) {
            trace_generation(generation, ranked, best_seen);
        }

        ranked.resize(params_.population_size / 2);
        population = breed(ranked, rng);
    }

    auto final_population = score(std::move(population), evaluator);
    const Scored& best = final_population.front();
    update_best(best_seen, best.makespan);
    result.history.push_back(best_seen);
    if (trace_ != nullptr) {
        trace_generation(params_.generations, final_population, best_seen);
    }

    if (!best.makespan) {
        return SolveFailure{FailureKind::AllCandidatesInfeasible,
                            "every individual of the final population violates precedence"};
    }

    auto evaluated = evaluator.evaluate(best.genes);
    result.best_order = evaluator.to_ids(best.genes);
    result.best_makespan = *best.makespan;
    result.schedule = evaluator.to_schedule(*evaluated);

    if (trace_ != nullptr) {
        trace_->begin(static_cast<uint64_t>(params_.generations));
        trace_->type("optimum");
        trace_->field("makespan", result.best_makespan.count());
        trace_->end();
    }
    return result;
}

void GeneticOptimizer::trace_generation(std::size_t generation, const std::vector<Scored>& ranked,
                                        const std::optional<Duration>& best_seen) {
    auto feasible = std::count_if(ranked.begin(), ranked.end(),
        [](const Scored& individual) { return individual.makespan.has_value(); });

    trace_->begin(static_cast<uint64_t>(generation));
    trace_->type("generation");
    trace_->field("generation", static_cast<uint64_t>(generation));
    trace_->field("feasible", static_cast<uint64_t>(feasible));
    if (ranked.front().makespan) {
        trace_->field("best", ranked.front().makespan->count());
    }
    if (best_seen) {
        trace_->field("best_seen", best_seen->count());
    }
    trace_->end();
}

} // namespace jobsched::algo
