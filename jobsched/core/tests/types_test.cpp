#include <jobsched/core/types.hpp>
#include <gtest/gtest.h>

using namespace jobsched::core;

// ============================================================================
// Duration tests
// ============================================================================

TEST(DurationTest, Factories) {
    EXPECT_EQ(Duration{}.count(), 0);
    EXPECT_EQ(Duration::zero(), Duration{});
    EXPECT_EQ(Duration{7}.count(), 7);
    EXPECT_GT(Duration::max(), Duration{1'000'000'000});
}

TEST(DurationTest, Arithmetic) {
    Duration a{5};
    Duration b{3};

    EXPECT_EQ((a + b).count(), 8);
    EXPECT_EQ((a - b).count(), 2);

    Duration c = a;
    c += b;
    EXPECT_EQ(c.count(), 8);

    Duration d = a;
    d -= b;
    EXPECT_EQ(d.count(), 2);
}

TEST(DurationTest, Comparison) {
    EXPECT_LT(Duration{1}, Duration{2});
    EXPECT_LE(Duration{2}, Duration{2});
    EXPECT_GT(Duration{3}, Duration{2});
    EXPECT_NE(Duration{3}, Duration{2});
}

// ============================================================================
// TimePoint tests
// ============================================================================

TEST(TimePointTest, Origin) {
    EXPECT_EQ(TimePoint{}.count(), 0);
    EXPECT_EQ(TimePoint::origin(), TimePoint{});
    EXPECT_EQ(TimePoint{Duration{4}}.time_since_origin(), Duration{4});
}

TEST(TimePointTest, Arithmetic) {
    TimePoint start{10};
    Duration length{6};

    TimePoint end = start + length;
    EXPECT_EQ(end.count(), 16);
    EXPECT_EQ(end - start, length);
    EXPECT_EQ((end - length), start);

    TimePoint t = start;
    t += Duration{1};
    EXPECT_EQ(t.count(), 11);
}

TEST(TimePointTest, Comparison) {
    EXPECT_LT(TimePoint{0}, TimePoint{1});
    EXPECT_EQ(TimePoint{3}, TimePoint{Duration{3}});
}

// ============================================================================
// Interval tests
// ============================================================================

TEST(IntervalTest, Length) {
    Interval iv{TimePoint{2}, TimePoint{9}};
    EXPECT_EQ(iv.length(), Duration{7});
}

TEST(IntervalTest, HalfOpenIntervalsTouchingDoNotOverlap) {
    Interval first{TimePoint{0}, TimePoint{8}};
    Interval second{TimePoint{8}, TimePoint{14}};

    EXPECT_FALSE(first.overlaps(second));
    EXPECT_FALSE(second.overlaps(first));
}

TEST(IntervalTest, OverlapDetection) {
    Interval base{TimePoint{5}, TimePoint{10}};

    EXPECT_TRUE(base.overlaps(Interval{TimePoint{9}, TimePoint{12}}));
    EXPECT_TRUE(base.overlaps(Interval{TimePoint{0}, TimePoint{6}}));
    EXPECT_TRUE(base.overlaps(Interval{TimePoint{6}, TimePoint{7}}));   // contained
    EXPECT_TRUE(base.overlaps(Interval{TimePoint{0}, TimePoint{20}}));  // containing
    EXPECT_FALSE(base.overlaps(Interval{TimePoint{0}, TimePoint{5}}));
    EXPECT_FALSE(base.overlaps(Interval{TimePoint{10}, TimePoint{11}}));
}
