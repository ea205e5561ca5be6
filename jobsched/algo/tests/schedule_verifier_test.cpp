#include <jobsched/algo/schedule_verifier.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace jobsched::algo;
using namespace jobsched::core;
using namespace jobsched::test;

class ScheduleVerifierTest : public ::testing::Test {
protected:
    ScheduleVerifierTest()
        : problem_(reference_jobs(), reference_machines(), reference_dependencies()) {}

    // The list schedule of the reference scenario
    static Schedule valid_schedule() {
        Schedule schedule;
        schedule.assign(1, TimePoint{0}, Duration{5}, {"A"});
        schedule.assign(2, TimePoint{0}, Duration{8}, {"B"});
        schedule.assign(3, TimePoint{0}, Duration{3}, {"C"});
        schedule.assign(4, TimePoint{8}, Duration{6}, {"A", "B"});
        schedule.assign(5, TimePoint{14}, Duration{4}, {"B", "C"});
        return schedule;
    }

    static bool has(const std::vector<ScheduleViolation>& violations, ScheduleViolation::Kind kind) {
        return std::any_of(violations.begin(), violations.end(),
            [kind](const ScheduleViolation& violation) { return violation.kind == kind; });
    }

    Problem problem_;
};

TEST_F(ScheduleVerifierTest, ValidScheduleHasNoViolations) {
    EXPECT_TRUE(verify_schedule(problem_, valid_schedule()).empty());
}

TEST_F(ScheduleVerifierTest, DetectsMissingJob) {
    Schedule schedule;
    schedule.assign(1, TimePoint{0}, Duration{5}, {"A"});

    auto violations = verify_schedule(problem_, schedule);
    EXPECT_TRUE(has(violations, ScheduleViolation::Kind::MissingJob));
}

TEST_F(ScheduleVerifierTest, DetectsMachineOverlap) {
    Schedule schedule;
    schedule.assign(1, TimePoint{0}, Duration{5}, {"A"});
    schedule.assign(2, TimePoint{0}, Duration{8}, {"B"});
    schedule.assign(3, TimePoint{0}, Duration{3}, {"C"});
    schedule.assign(4, TimePoint{6}, Duration{6}, {"A", "B"});  // B busy until 8
    schedule.assign(5, TimePoint{14}, Duration{4}, {"B", "C"});

    auto violations = verify_schedule(problem_, schedule);
    EXPECT_TRUE(has(violations, ScheduleViolation::Kind::MachineOverlap));
}

TEST_F(ScheduleVerifierTest, DetectsNonAdjacentOverlap) {
    Problem problem({Job(1, Duration{10}, {"A"}), Job(2, Duration{1}, {"A"}), Job(3, Duration{1}, {"A"})},
                    {Machine("A")});
    Schedule schedule;
    schedule.assign(1, TimePoint{0}, Duration{10}, {"A"});
    schedule.assign(2, TimePoint{1}, Duration{1}, {"A"});
    schedule.assign(3, TimePoint{5}, Duration{1}, {"A"});

    auto violations = verify_schedule(problem, schedule);
    EXPECT_EQ(std::count_if(violations.begin(), violations.end(),
                            [](const ScheduleViolation& v) {
                                return v.kind == ScheduleViolation::Kind::MachineOverlap;
                            }),
              2);
}

TEST_F(ScheduleVerifierTest, DetectsPrecedenceViolation) {
    Schedule schedule;
    schedule.assign(1, TimePoint{3}, Duration{5}, {"A"});
    schedule.assign(2, TimePoint{0}, Duration{8}, {"B"});
    schedule.assign(3, TimePoint{0}, Duration{3}, {"C"});
    schedule.assign(4, TimePoint{8}, Duration{6}, {"A", "B"});  // fine: 1 ends at 8
    schedule.assign(5, TimePoint{7}, Duration{4}, {"B", "C"});  // 2 ends at 8

    auto violations = verify_schedule(problem_, schedule);
    EXPECT_TRUE(has(violations, ScheduleViolation::Kind::PrecedenceViolated));

    // Start times are unconstrained by precedence under the legacy rule
    auto legacy = verify_schedule(problem_, schedule, PrecedenceRule::PlacedEarlier);
    EXPECT_FALSE(has(legacy, ScheduleViolation::Kind::PrecedenceViolated));
}

TEST_F(ScheduleVerifierTest, DetectsWrongDurationAndMachines) {
    Schedule schedule = valid_schedule();
    Schedule broken;
    for (const auto& assignment : schedule.assignments()) {
        if (assignment.job == 3) {
            broken.assign(3, assignment.start, Duration{2}, {"A"});
        } else {
            broken.assign(assignment.job, assignment.start, assignment.end - assignment.start,
                          assignment.machines);
        }
    }

    auto violations = verify_schedule(problem_, broken);
    EXPECT_TRUE(has(violations, ScheduleViolation::Kind::WrongDuration));
    EXPECT_TRUE(has(violations, ScheduleViolation::Kind::MachineMismatch));
}

TEST_F(ScheduleVerifierTest, DetectsUnknownJob) {
    Schedule schedule = valid_schedule();
    schedule.assign(99, TimePoint{20}, Duration{1}, {"A"});

    auto violations = verify_schedule(problem_, schedule);
    ASSERT_EQ(violations.size(), 1U);
    EXPECT_EQ(violations[0].kind, ScheduleViolation::Kind::UnknownJob);
}
