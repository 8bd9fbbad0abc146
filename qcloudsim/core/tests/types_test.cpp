#include <qcloudsim/core/types.hpp>

#include <gtest/gtest.h>

using namespace qcloudsim::core;

TEST(TypesTest, UnitsRoundTripThroughTicks) {
    EXPECT_EQ(duration_from_units(1.0).ticks(), 1'000'000'000);
    EXPECT_EQ(duration_from_units(0.02).ticks(), 20'000'000);
    EXPECT_DOUBLE_EQ(duration_to_units(duration_from_units(2.5)), 2.5);
    EXPECT_DOUBLE_EQ(time_to_units(time_from_units(0.5)), 0.5);
}

TEST(TypesTest, PollingStepsAddExactly) {
    Duration sum = Duration::zero();
    for (int i = 0; i < 50; ++i) {
        sum += duration_from_units(0.02);
    }
    EXPECT_EQ(sum, duration_from_units(1.0));
}

TEST(TypesTest, TimePointArithmetic) {
    TimePoint t = TimePoint::epoch() + duration_from_units(3.0);
    EXPECT_EQ(t - TimePoint::epoch(), duration_from_units(3.0));
    EXPECT_LT(TimePoint::epoch(), t);
    t += duration_from_units(0.5);
    EXPECT_EQ(t, time_from_units(3.5));
    EXPECT_EQ(t - duration_from_units(3.5), TimePoint::epoch());
}

TEST(TypesTest, DurationComparisons) {
    EXPECT_LT(-duration_from_units(1.0), Duration::zero());
    EXPECT_GT(duration_from_units(0.5), duration_from_units(0.25));
    EXPECT_EQ(duration_from_units(1.0) - duration_from_units(0.75), duration_from_units(0.25));
}
