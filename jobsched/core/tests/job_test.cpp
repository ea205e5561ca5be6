#include <jobsched/core/error.hpp>
#include <jobsched/core/job.hpp>

#include <gtest/gtest.h>

using namespace jobsched::core;

TEST(JobTest, Construction) {
    Job job(4, Duration{6}, {"A", "B"});

    EXPECT_EQ(job.id(), 4U);
    EXPECT_EQ(job.processing_time(), Duration{6});
    ASSERT_EQ(job.required_machines().size(), 2U);
    EXPECT_EQ(job.required_machines()[0], "A");
    EXPECT_EQ(job.required_machines()[1], "B");
}

TEST(JobTest, SingleMachineIsListOfOne) {
    Job job(1, Duration{5}, {"A"});
    EXPECT_EQ(job.required_machines().size(), 1U);
}

TEST(JobTest, RejectsNonPositiveProcessingTime) {
    EXPECT_THROW(Job(1, Duration{0}, {"A"}), InvalidInputError);
    EXPECT_THROW(Job(1, Duration{-3}, {"A"}), InvalidInputError);
}

TEST(JobTest, RejectsEmptyMachineList) {
    EXPECT_THROW(Job(1, Duration{5}, {}), InvalidInputError);
}

TEST(JobTest, RejectsDuplicateMachines) {
    EXPECT_THROW(Job(1, Duration{5}, {"A", "B", "A"}), InvalidInputError);
}

TEST(JobTest, ErrorsAreSchedulingErrors) {
    EXPECT_THROW(Job(1, Duration{0}, {"A"}), SchedulingError);
}

TEST(MachineTest, Construction) {
    Machine machine("A", 100);
    EXPECT_EQ(machine.id(), "A");
    EXPECT_EQ(machine.capacity(), 100);
}

TEST(MachineTest, DefaultCapacity) {
    Machine machine("B");
    EXPECT_EQ(machine.capacity(), 1);
}

TEST(MachineTest, RejectsInvalid) {
    EXPECT_THROW(Machine("", 1), InvalidInputError);
    EXPECT_THROW(Machine("A", 0), InvalidInputError);
    EXPECT_THROW(Machine("A", -1), InvalidInputError);
}

TEST(DependencyTest, Equality) {
    EXPECT_EQ((Dependency{1, 2}), (Dependency{1, 2}));
    EXPECT_NE((Dependency{1, 2}), (Dependency{2, 1}));
}
