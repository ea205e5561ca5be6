#include <jobsched/algo/error.hpp>
#include <jobsched/algo/schedule_evaluator.hpp>

#include <gtest/gtest.h>

using namespace jobsched::algo;
using namespace jobsched::core;

class ScheduleEvaluatorTest : public ::testing::Test {
protected:
    // Machines A, B, C; jobs 1(A,5), 2(B,8), 3(C,3), 4(A+B,6, after 1), 5(B+C,4, after 2 and 3)
    ScheduleEvaluatorTest()
        : problem_({Job(1, Duration{5}, {"A"}),
                    Job(2, Duration{8}, {"B"}),
                    Job(3, Duration{3}, {"C"}),
                    Job(4, Duration{6}, {"A", "B"}),
                    Job(5, Duration{4}, {"B", "C"})},
                   {Machine("A", 100), Machine("B", 100), Machine("C", 100)},
                   {{1, 4}, {2, 5}, {3, 5}})
        , graph_(problem_) {}

    Problem problem_;
    DependencyGraph graph_;
};

TEST_F(ScheduleEvaluatorTest, TopologicalOrderStartTimes) {
    ScheduleEvaluator evaluator(problem_, graph_);
    auto evaluated = evaluator.evaluate({0, 1, 2, 3, 4});

    ASSERT_TRUE(evaluated.has_value());
    EXPECT_EQ(evaluated->start_times[0], TimePoint{0});
    EXPECT_EQ(evaluated->start_times[1], TimePoint{0});
    EXPECT_EQ(evaluated->start_times[2], TimePoint{0});
    EXPECT_EQ(evaluated->start_times[3], TimePoint{8});
    EXPECT_EQ(evaluated->start_times[4], TimePoint{14});
    EXPECT_EQ(evaluated->makespan, Duration{18});
}

TEST_F(ScheduleEvaluatorTest, SuccessorBeforePredecessorIsInfeasible) {
    ScheduleEvaluator evaluator(problem_, graph_);
    // Job 4 (index 3) placed before job 1 (index 0)
    EXPECT_FALSE(evaluator.evaluate({3, 0, 1, 2, 4}).has_value());
    EXPECT_FALSE(evaluator.makespan({3, 0, 1, 2, 4}).has_value());
}

TEST_F(ScheduleEvaluatorTest, CompletionRuleWaitsForPredecessor) {
    Problem problem({Job(1, Duration{5}, {"A"}), Job(2, Duration{2}, {"B"})},
                    {Machine("A"), Machine("B")}, {{1, 2}});
    DependencyGraph graph(problem);

    ScheduleEvaluator completion(problem, graph, PrecedenceRule::Completion);
    auto waited = completion.evaluate({0, 1});
    ASSERT_TRUE(waited.has_value());
    EXPECT_EQ(waited->start_times[1], TimePoint{5});
    EXPECT_EQ(waited->makespan, Duration{7});

    ScheduleEvaluator placed(problem, graph, PrecedenceRule::PlacedEarlier);
    auto eager = placed.evaluate({0, 1});
    ASSERT_TRUE(eager.has_value());
    EXPECT_EQ(eager->start_times[1], TimePoint{0});
    EXPECT_EQ(eager->makespan, Duration{5});
}

TEST_F(ScheduleEvaluatorTest, RepeatedCallsDoNotShareState) {
    ScheduleEvaluator evaluator(problem_, graph_);
    auto first = evaluator.makespan({0, 1, 2, 3, 4});
    auto other = evaluator.makespan({1, 2, 0, 4, 3});
    auto again = evaluator.makespan({0, 1, 2, 3, 4});

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(other.has_value());
    EXPECT_EQ(first, again);
}

TEST_F(ScheduleEvaluatorTest, NonPermutationRejected) {
    ScheduleEvaluator evaluator(problem_, graph_);
    EXPECT_THROW((void)evaluator.evaluate({0, 1, 2, 3}), InvalidParameterError);
    EXPECT_THROW((void)evaluator.evaluate({0, 1, 2, 3, 3}), InvalidParameterError);
    EXPECT_THROW((void)evaluator.evaluate({0, 1, 2, 3, 9}), InvalidParameterError);
}

TEST_F(ScheduleEvaluatorTest, EvaluateByIds) {
    ScheduleEvaluator evaluator(problem_, graph_);
    auto evaluated = evaluator.evaluate_ids({1, 2, 3, 4, 5});
    ASSERT_TRUE(evaluated.has_value());
    EXPECT_EQ(evaluated->makespan, Duration{18});

    EXPECT_THROW((void)evaluator.evaluate_ids({1, 2, 3, 4, 6}), InvalidParameterError);
}

TEST_F(ScheduleEvaluatorTest, ToScheduleFollowsOrder) {
    ScheduleEvaluator evaluator(problem_, graph_);
    auto evaluated = evaluator.evaluate({2, 1, 0, 3, 4});
    ASSERT_TRUE(evaluated.has_value());

    auto schedule = evaluator.to_schedule(*evaluated);
    ASSERT_EQ(schedule.size(), 5U);
    EXPECT_EQ(schedule.assignments()[0].job, 3U);
    EXPECT_EQ(schedule.at(5).start, TimePoint{14});
    EXPECT_EQ(schedule.at(4).machines, (std::vector<MachineId>{"A", "B"}));
    EXPECT_EQ(schedule.makespan(), evaluated->makespan);
}

TEST_F(ScheduleEvaluatorTest, MismatchedGraphRejected) {
    auto other = DependencyGraph::build({Job(1, Duration{1}, {"A"})}, {});
    EXPECT_THROW({ ScheduleEvaluator evaluator(problem_, other); }, InvalidParameterError);
}
