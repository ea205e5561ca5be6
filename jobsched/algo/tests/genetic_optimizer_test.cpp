#include <jobsched/algo/error.hpp>
#include <jobsched/algo/genetic_optimizer.hpp>
#include <jobsched/algo/schedule_verifier.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <functional>
#include <numeric>
#include <random>

using namespace jobsched::algo;
using namespace jobsched::core;
using namespace jobsched::test;

class GeneticOptimizerTest : public ::testing::Test {
protected:
    GeneticOptimizerTest()
        : problem_(reference_jobs(), reference_machines(), reference_dependencies())
        , graph_(problem_) {}

    static bool is_permutation_of_range(GeneticOptimizer::Chromosome genes, std::size_t size) {
        if (genes.size() != size) {
            return false;
        }
        std::sort(genes.begin(), genes.end());
        for (std::size_t i = 0; i < size; ++i) {
            if (genes[i] != i) {
                return false;
            }
        }
        return true;
    }

    Problem problem_;
    DependencyGraph graph_;
};

// =============================================================================
// Parameter validation
// =============================================================================

TEST_F(GeneticOptimizerTest, RejectsTinyPopulation) {
    EXPECT_THROW(GeneticOptimizer(GeneticParams{3, 10, 0.1}), InvalidParameterError);
    EXPECT_NO_THROW(GeneticOptimizer(GeneticParams{4, 10, 0.1}));
}

TEST_F(GeneticOptimizerTest, RejectsMutationRateOutOfRange) {
    EXPECT_THROW(GeneticOptimizer(GeneticParams{10, 10, -0.1}), InvalidParameterError);
    EXPECT_THROW(GeneticOptimizer(GeneticParams{10, 10, 1.5}), InvalidParameterError);
    EXPECT_NO_THROW(GeneticOptimizer(GeneticParams{10, 10, 0.0}));
    EXPECT_NO_THROW(GeneticOptimizer(GeneticParams{10, 10, 1.0}));
}

TEST_F(GeneticOptimizerTest, DefaultParams) {
    GeneticOptimizer optimizer;
    EXPECT_EQ(optimizer.params().population_size, 50U);
    EXPECT_EQ(optimizer.params().generations, 100U);
    EXPECT_DOUBLE_EQ(optimizer.params().mutation_rate, 0.1);
    EXPECT_EQ(optimizer.rule(), PrecedenceRule::Completion);
}

// =============================================================================
// Operators
// =============================================================================

TEST_F(GeneticOptimizerTest, CrossoverProducesPermutations) {
    std::mt19937 rng(7);
    GeneticOptimizer::Chromosome identity(12);
    std::iota(identity.begin(), identity.end(), std::size_t{0});

    for (int trial = 0; trial < 200; ++trial) {
        auto first = identity;
        auto second = identity;
        std::shuffle(first.begin(), first.end(), rng);
        std::shuffle(second.begin(), second.end(), rng);

        auto child = GeneticOptimizer::crossover(first, second, rng);
        EXPECT_TRUE(is_permutation_of_range(child, identity.size()));
        // The prefix always comes from the first parent
        EXPECT_EQ(child.front(), first.front());
    }
}

TEST_F(GeneticOptimizerTest, CrossoverKeepsSecondParentRelativeOrder) {
    std::mt19937 rng(3);
    GeneticOptimizer::Chromosome first{0, 1, 2, 3, 4};
    GeneticOptimizer::Chromosome second{4, 3, 2, 1, 0};

    auto child = GeneticOptimizer::crossover(first, second, rng);

    // child = first[0..cut) followed by the rest in descending order
    std::size_t cut = 0;
    while (cut < child.size() && child[cut] == cut) {
        ++cut;
    }
    ASSERT_GE(cut, 1U);
    EXPECT_TRUE(std::is_sorted(child.begin() + static_cast<std::ptrdiff_t>(cut), child.end(),
                               std::greater<>()));
}

TEST_F(GeneticOptimizerTest, CrossoverOfSingleGeneCopiesFirstParent) {
    std::mt19937 rng(1);
    GeneticOptimizer::Chromosome single{0};
    EXPECT_EQ(GeneticOptimizer::crossover(single, single, rng), single);
}

TEST_F(GeneticOptimizerTest, MutationSwapsTwoPositions) {
    GeneticOptimizer always(GeneticParams{4, 1, 1.0});
    std::mt19937 rng(11);

    GeneticOptimizer::Chromosome genes{0, 1, 2, 3, 4, 5};
    always.mutate(genes, rng);

    std::size_t moved = 0;
    for (std::size_t i = 0; i < genes.size(); ++i) {
        if (genes[i] != i) {
            ++moved;
        }
    }
    EXPECT_EQ(moved, 2U);
}

TEST_F(GeneticOptimizerTest, ZeroMutationRateNeverMutates) {
    GeneticOptimizer never(GeneticParams{4, 1, 0.0});
    std::mt19937 rng(11);

    GeneticOptimizer::Chromosome genes{0, 1, 2, 3, 4, 5};
    for (int i = 0; i < 100; ++i) {
        never.mutate(genes, rng);
    }
    EXPECT_EQ(genes, (GeneticOptimizer::Chromosome{0, 1, 2, 3, 4, 5}));
}

// =============================================================================
// Search
// =============================================================================

TEST_F(GeneticOptimizerTest, FindsOptimumOnReferenceScenario) {
    GeneticOptimizer optimizer(GeneticParams{50, 100, 0.1});
    std::mt19937 rng(42);
    auto outcome = optimizer.optimize(problem_, graph_, rng);

    ASSERT_TRUE(std::holds_alternative<GeneticResult>(outcome));
    const auto& result = std::get<GeneticResult>(outcome);

    // Machine B carries 8 + 6 + 4, so 18 is optimal
    EXPECT_EQ(result.best_makespan, Duration{18});
    EXPECT_EQ(result.schedule.makespan(), result.best_makespan);
    EXPECT_EQ(result.best_order.size(), 5U);
    EXPECT_TRUE(verify_schedule(problem_, result.schedule).empty());
}

TEST_F(GeneticOptimizerTest, SameSeedReproducesRun) {
    GeneticOptimizer optimizer(GeneticParams{20, 30, 0.3});
    std::mt19937 rng_a(1234);
    std::mt19937 rng_b(1234);

    auto first = std::get<GeneticResult>(optimizer.optimize(problem_, graph_, rng_a));
    auto second = std::get<GeneticResult>(optimizer.optimize(problem_, graph_, rng_b));

    EXPECT_EQ(first.best_order, second.best_order);
    EXPECT_EQ(first.best_makespan, second.best_makespan);
    EXPECT_EQ(first.history, second.history);
}

TEST_F(GeneticOptimizerTest, SolveRestartsFromConstructionSeed) {
    GeneticOptimizer optimizer(GeneticParams{10, 5, 0.5}, 99);
    auto first = optimizer.solve(problem_, graph_);
    auto second = optimizer.solve(problem_, graph_);

    ASSERT_TRUE(succeeded(first));
    ASSERT_TRUE(succeeded(second));
    EXPECT_EQ(std::get<Schedule>(first).makespan(), std::get<Schedule>(second).makespan());
}

TEST_F(GeneticOptimizerTest, HistoryIsNonIncreasing) {
    GeneticOptimizer optimizer(GeneticParams{12, 40, 0.2});
    std::mt19937 rng(5);
    auto result = std::get<GeneticResult>(optimizer.optimize(problem_, graph_, rng));

    ASSERT_EQ(result.history.size(), 41U);
    std::optional<Duration> previous;
    for (const auto& best_seen : result.history) {
        if (previous) {
            ASSERT_TRUE(best_seen.has_value());
            EXPECT_LE(*best_seen, *previous);
        }
        previous = best_seen;
    }
    ASSERT_TRUE(result.history.back().has_value());
    EXPECT_LE(*result.history.back(), result.best_makespan);
}

TEST_F(GeneticOptimizerTest, AllInfeasiblePopulationReported) {
    // A ten-job chain has one feasible order among 10! permutations
    std::vector<Job> jobs;
    std::vector<Dependency> chain;
    for (JobId id = 1; id <= 10; ++id) {
        jobs.emplace_back(id, Duration{1}, std::vector<MachineId>{"A"});
        if (id > 1) {
            chain.push_back({id - 1, id});
        }
    }
    Problem problem(std::move(jobs), {Machine("A")}, std::move(chain));
    DependencyGraph graph(problem);

    GeneticOptimizer optimizer(GeneticParams{4, 0, 0.0});
    std::mt19937 rng(2024);
    auto outcome = optimizer.optimize(problem, graph, rng);

    ASSERT_TRUE(std::holds_alternative<SolveFailure>(outcome));
    EXPECT_EQ(std::get<SolveFailure>(outcome).kind, FailureKind::AllCandidatesInfeasible);
}

TEST_F(GeneticOptimizerTest, CycleReported) {
    Problem cyclic(reference_jobs(), reference_machines(), {{1, 2}, {2, 1}});
    DependencyGraph graph(cyclic);

    GeneticOptimizer optimizer(GeneticParams{4, 2, 0.1});
    std::mt19937 rng(0);
    auto outcome = optimizer.optimize(cyclic, graph, rng);

    ASSERT_TRUE(std::holds_alternative<SolveFailure>(outcome));
    EXPECT_EQ(std::get<SolveFailure>(outcome).kind, FailureKind::CycleDetected);
}

TEST_F(GeneticOptimizerTest, SingleJobProblem) {
    Problem problem({Job(1, Duration{7}, {"A"})}, {Machine("A")});
    DependencyGraph graph(problem);

    GeneticOptimizer optimizer(GeneticParams{4, 3, 1.0});
    std::mt19937 rng(0);
    auto result = std::get<GeneticResult>(optimizer.optimize(problem, graph, rng));

    EXPECT_EQ(result.best_order, (std::vector<JobId>{1}));
    EXPECT_EQ(result.best_makespan, Duration{7});
}

TEST_F(GeneticOptimizerTest, TracesGenerations) {
    MockTraceWriter trace;
    GeneticOptimizer optimizer(GeneticParams{8, 6, 0.1});
    optimizer.set_trace_writer(&trace);
    std::mt19937 rng(17);
    auto outcome = optimizer.optimize(problem_, graph_, rng);

    ASSERT_TRUE(std::holds_alternative<GeneticResult>(outcome));
    EXPECT_EQ(trace.count("generation"), 7U);
    EXPECT_EQ(trace.count("optimum"), 1U);
    EXPECT_EQ(trace.records.back().get("makespan"),
              std::to_string(std::get<GeneticResult>(outcome).best_makespan.count()));
}
