#include <jobsched/core/dependency_graph.hpp>
#include <jobsched/core/error.hpp>
#include <jobsched/core/problem.hpp>

#include <gtest/gtest.h>

#include <algorithm>

using namespace jobsched::core;

class DependencyGraphTest : public ::testing::Test {
protected:
    // Machines A, B, C; jobs 1(A,5), 2(B,8), 3(C,3), 4(A+B,6), 5(B+C,4)
    std::vector<Job> jobs() {
        return {
            Job(1, Duration{5}, {"A"}),
            Job(2, Duration{8}, {"B"}),
            Job(3, Duration{3}, {"C"}),
            Job(4, Duration{6}, {"A", "B"}),
            Job(5, Duration{4}, {"B", "C"}),
        };
    }

    std::vector<Machine> machines() {
        return {Machine("A", 100), Machine("B", 100), Machine("C", 100)};
    }

    std::vector<Dependency> dependencies() {
        return {{1, 4}, {2, 5}, {3, 5}};
    }
};

TEST_F(DependencyGraphTest, AdjacencyAndInDegree) {
    auto graph = DependencyGraph::build(jobs(), dependencies());

    EXPECT_EQ(graph.job_count(), 5U);
    EXPECT_EQ(graph.in_degree(0), 0U);
    EXPECT_EQ(graph.in_degree(3), 1U);
    EXPECT_EQ(graph.in_degree(4), 2U);
    ASSERT_EQ(graph.successors(0).size(), 1U);
    EXPECT_EQ(graph.successors(0)[0], 3U);
    EXPECT_EQ(graph.job_id(4), 5U);
}

TEST_F(DependencyGraphTest, TopologicalOrderUsesInsertionTieBreak) {
    auto graph = DependencyGraph::build(jobs(), dependencies());
    auto order = graph.topological_order();

    ASSERT_TRUE(std::holds_alternative<std::vector<JobId>>(order));
    EXPECT_EQ(std::get<std::vector<JobId>>(order), (std::vector<JobId>{1, 2, 3, 4, 5}));
}

TEST_F(DependencyGraphTest, TieBreakFollowsJobSetNotIds) {
    std::vector<Job> reversed = {
        Job(9, Duration{1}, {"A"}),
        Job(8, Duration{1}, {"A"}),
        Job(7, Duration{1}, {"A"}),
    };
    auto graph = DependencyGraph::build(reversed, {{9, 7}});
    auto order = std::get<std::vector<JobId>>(graph.topological_order());

    EXPECT_EQ(order, (std::vector<JobId>{9, 8, 7}));
}

TEST_F(DependencyGraphTest, OrderRespectsEveryDependency) {
    std::vector<Job> chain = {
        Job(1, Duration{1}, {"A"}),
        Job(2, Duration{1}, {"A"}),
        Job(3, Duration{1}, {"A"}),
        Job(4, Duration{1}, {"A"}),
    };
    std::vector<Dependency> deps = {{4, 2}, {2, 1}, {3, 1}, {4, 3}};
    auto graph = DependencyGraph::build(chain, deps);
    auto order = std::get<std::vector<JobId>>(graph.topological_order());

    ASSERT_EQ(order.size(), 4U);
    auto position = [&order](JobId id) {
        return std::find(order.begin(), order.end(), id) - order.begin();
    };
    for (const auto& dep : deps) {
        EXPECT_LT(position(dep.predecessor), position(dep.successor));
    }
}

TEST_F(DependencyGraphTest, TwoJobCycleDetected) {
    auto graph = DependencyGraph::build(jobs(), {{1, 2}, {2, 1}});
    auto order = graph.topological_order();

    ASSERT_TRUE(std::holds_alternative<CycleDetected>(order));
    const auto& cycle = std::get<CycleDetected>(order);
    EXPECT_EQ(cycle.blocked, (std::vector<JobId>{1, 2}));
    EXPECT_TRUE(graph.has_cycle());
    EXPECT_FALSE(graph.topological_indices().has_value());
}

TEST_F(DependencyGraphTest, SelfLoopIsCycle) {
    auto graph = DependencyGraph::build(jobs(), {{3, 3}});
    EXPECT_TRUE(graph.has_cycle());
}

TEST_F(DependencyGraphTest, RepeatedSortsAgree) {
    auto graph = DependencyGraph::build(jobs(), dependencies());
    EXPECT_EQ(graph.topological_indices(), graph.topological_indices());
}

TEST_F(DependencyGraphTest, UnknownJobReference) {
    try {
        auto graph = DependencyGraph::build(jobs(), {{1, 6}});
        FAIL() << "expected UnknownJobReference";
    } catch (const UnknownJobReference& e) {
        EXPECT_EQ(e.job(), 6U);
    }
}

TEST_F(DependencyGraphTest, DuplicateJobRejected) {
    std::vector<Job> dup = {Job(1, Duration{1}, {"A"}), Job(1, Duration{2}, {"A"})};
    EXPECT_THROW(DependencyGraph::build(dup, {}), InvalidInputError);
}

TEST_F(DependencyGraphTest, CriticalPathLength) {
    Problem problem(jobs(), machines(), dependencies());
    DependencyGraph graph(problem);

    // Longest chain: 2 -> 5 = 8 + 4
    EXPECT_EQ(graph.critical_path_length(problem), Duration{12});
}

TEST_F(DependencyGraphTest, CriticalPathUndefinedOnCycle) {
    Problem problem(jobs(), machines(), {{1, 2}, {2, 1}});
    DependencyGraph graph(problem);
    EXPECT_FALSE(graph.critical_path_length(problem).has_value());
}

TEST_F(DependencyGraphTest, EmptyGraph) {
    auto graph = DependencyGraph::build({}, {});
    auto order = graph.topological_order();
    ASSERT_TRUE(std::holds_alternative<std::vector<JobId>>(order));
    EXPECT_TRUE(std::get<std::vector<JobId>>(order).empty());
}

TEST_F(DependencyGraphTest, CycleBlocksDownstreamJobs) {
    // 4 depends on 1 and 1 is on a cycle with 2, so 4 is never released
    auto graph = DependencyGraph::build(jobs(), {{1, 2}, {2, 1}, {1, 4}});
    auto cycle = std::get<CycleDetected>(graph.topological_order());
    EXPECT_EQ(cycle.blocked, (std::vector<JobId>{1, 2, 4}));
}
