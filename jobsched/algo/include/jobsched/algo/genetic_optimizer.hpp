#pragma once

#include <jobsched/algo/schedule_evaluator.hpp>
#include <jobsched/algo/solver.hpp>

#include <jobsched/core/schedule.hpp>
#include <jobsched/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <variant>
#include <vector>

namespace jobsched::algo {

/// @brief Tuning knobs of the genetic optimizer.
/// @ingroup algo_solvers
struct GeneticParams {
    std::size_t population_size{50}; ///< Individuals per generation (>= 4).
    std::size_t generations{100};    ///< Selection/crossover/mutation rounds.
    double mutation_rate{0.1};       ///< Per-child swap probability in [0, 1].
};

/// @brief Best individual found by the genetic optimizer.
/// @ingroup algo_solvers
struct GeneticResult {
    std::vector<core::JobId> best_order; ///< Lowest-makespan order of the final population.
    core::Duration best_makespan;        ///< Its makespan.
    core::Schedule schedule;             ///< best_order placed by the evaluator.
    /// @brief Best makespan seen so far, one entry per evaluated population.
    ///
    /// Entry g covers the populations of generations 0..g; the last entry
    /// also covers the final population. std::nullopt until a feasible
    /// individual has been seen. The sequence never increases.
    std::vector<std::optional<core::Duration>> history;
};

/// @brief A GeneticResult or the reason there is none.
/// @ingroup algo_solvers
using GeneticOutcome = std::variant<GeneticResult, SolveFailure>;

/// @brief Permutation-based genetic search over job orders.
/// @ingroup algo_solvers
///
/// Each individual is a permutation of the job indices, scored by the
/// ScheduleEvaluator (lower makespan is better; orders that violate
/// precedence are ranked after every feasible one). Per generation:
///   - selection: stable sort by fitness, keep the best half;
///   - crossover: population_size children, each from two distinct
///     survivors drawn uniformly. The child keeps the first parent's genes
///     up to a random cut in [1, n-1] and takes the rest from the second
///     parent in their relative order, skipping genes already present;
///   - mutation: with probability mutation_rate, swap two random positions.
/// Children fully replace the previous generation. After the last
/// generation the best individual of the final population is returned.
///
/// Every random draw comes from the caller's generator, so a fixed seed
/// reproduces a run exactly.
///
/// @see ScheduleEvaluator, GeneticParams
class GeneticOptimizer : public Solver {
public:
    /// @brief Job indices in placement order.
    using Chromosome = std::vector<std::size_t>;

    /// @brief Construct an optimizer.
    /// @param params Population parameters.
    /// @param seed   Seed of the generator used by solve().
    /// @param rule   Precedence rule of the fitness evaluation.
    /// @throws InvalidParameterError If @p params are out of range.
    explicit GeneticOptimizer(GeneticParams params = {}, std::uint32_t seed = 0,
                              PrecedenceRule rule = PrecedenceRule::Completion);

    [[nodiscard]] std::string_view name() const noexcept override { return "genetic"; }

    /// @brief Run the search with the optimizer's own seeded generator.
    ///
    /// Each call restarts the generator from the construction seed.
    ///
    /// @return The schedule of the best order, or FailureKind::CycleDetected /
    ///         FailureKind::AllCandidatesInfeasible.
    SolveOutcome solve(const core::Problem& problem, const core::DependencyGraph& graph) override;

    /// @brief Run the search with a caller-supplied generator.
    /// @param problem Validated input.
    /// @param graph   Dependency graph of @p problem.
    /// @param rng     Source of every random draw.
    /// @return Best order, makespan, schedule and history, or the failure.
    GeneticOutcome optimize(const core::Problem& problem, const core::DependencyGraph& graph,
                            std::mt19937& rng);

    /// @brief Order-preserving one-point crossover.
    /// @param first  Parent providing the prefix.
    /// @param second Parent providing the remaining genes, in order.
    /// @param rng    Generator for the cut point.
    /// @return A permutation of the same gene set.
    [[nodiscard]] static Chromosome crossover(const Chromosome& first, const Chromosome& second,
                                              std::mt19937& rng);

    /// @brief Swap two distinct random positions with probability mutation_rate.
    /// @param individual Chromosome mutated in place.
    /// @param rng        Generator for the decision and the positions.
    void mutate(Chromosome& individual, std::mt19937& rng) const;

    [[nodiscard]] const GeneticParams& params() const noexcept { return params_; }
    [[nodiscard]] PrecedenceRule rule() const noexcept { return rule_; }

private:
    struct Scored {
        Chromosome genes;
        std::optional<core::Duration> makespan;
    };

    [[nodiscard]] std::vector<Scored> score(std::vector<Chromosome> population,
                                            const ScheduleEvaluator& evaluator) const;
    [[nodiscard]] std::vector<Chromosome> breed(const std::vector<Scored>& survivors,
                                                std::mt19937& rng) const;
    void trace_generation(std::size_t generation, const std::vector<Scored>& ranked,
                          const std::optional<core::Duration>& best_seen);

    GeneticParams params_;
    std::uint32_t seed_;
    PrecedenceRule rule_;
};

} // namespace jobsched::algo
