#include <gtest/gtest.h>
#include <limits>
#include "boundarynormalizer.h"

TEST(BoundaryNormalizerTest, MidpointPolicy) {
    std::vector<TimeInterval> intervals = {{0, 2}, {2, 5}, {5, 40}, {40, 42}};
    std::vector<double> expected = {1.0, 3.5, 22.5, 41.0};
    EXPECT_EQ(BoundaryNormalizer::normalize(intervals, RepresentativePolicy::Midpoint), expected);
}

TEST(BoundaryNormalizerTest, IntervalStartPolicy) {
    std::vector<TimeInterval> intervals = {{0, 2}, {2, 5}, {5, 40}};
    std::vector<double> expected = {0.0, 2.0, 5.0};
    EXPECT_EQ(BoundaryNormalizer::normalize(intervals, RepresentativePolicy::IntervalStart), expected);
}

TEST(BoundaryNormalizerTest, OutputIsSorted) {
    std::vector<TimeInterval> intervals = {{10, 12}, {0, 2}, {4, 6}};
    std::vector<double> expected = {1.0, 5.0, 11.0};
    EXPECT_EQ(BoundaryNormalizer::normalize(intervals, RepresentativePolicy::Midpoint), expected);
}

TEST(BoundaryNormalizerTest, CollapsesNearEqualTimestamps) {
    std::vector<TimeInterval> intervals = {{0, 2}, {0.0004, 2.0004}, {0, 2}, {3, 3}};
    std::vector<double> result = BoundaryNormalizer::normalize(intervals, RepresentativePolicy::Midpoint);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_DOUBLE_EQ(result[0], 1.0);
    EXPECT_DOUBLE_EQ(result[1], 3.0);
}

TEST(BoundaryNormalizerTest, ReversedIntervalIsReordered) {
    TimeInterval reversed(5.0, 3.0);
    EXPECT_DOUBLE_EQ(BoundaryNormalizer::representative(reversed, RepresentativePolicy::Midpoint), 4.0);
    EXPECT_DOUBLE_EQ(BoundaryNormalizer::representative(reversed, RepresentativePolicy::IntervalStart), 3.0);
}

TEST(BoundaryNormalizerTest, DropsInvalidTimestamps) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<TimeInterval> intervals = {{-4, -2}, {nan, 1}, {1, 3}};
    std::vector<double> expected = {2.0};
    EXPECT_EQ(BoundaryNormalizer::normalize(intervals, RepresentativePolicy::Midpoint), expected);
}

TEST(BoundaryNormalizerTest, DropsTimestampsBeyondDuration) {
    std::vector<TimeInterval> intervals = {{0, 2}, {8, 12}, {12, 14}};
    std::vector<double> expected = {1.0, 10.0};
    EXPECT_EQ(BoundaryNormalizer::normalize(intervals, RepresentativePolicy::Midpoint, TimeWindow(), 10.0),
              expected);
}

TEST(BoundaryNormalizerTest, AppliesWindowInclusively) {
    std::vector<TimeInterval> intervals = {{0, 2}, {4, 6}, {8, 12}, {20, 22}};
    TimeWindow window;
    window.start = 5.0;
    window.end = 10.0;

    std::vector<double> expected = {5.0, 10.0};
    EXPECT_EQ(BoundaryNormalizer::normalize(intervals, RepresentativePolicy::Midpoint, window), expected);
}

TEST(BoundaryNormalizerTest, OpenWindowSide) {
    std::vector<TimeInterval> intervals = {{0, 2}, {4, 6}, {20, 22}};
    TimeWindow window;
    window.start = 4.0;

    std::vector<double> expected = {5.0, 21.0};
    EXPECT_EQ(BoundaryNormalizer::normalize(intervals, RepresentativePolicy::Midpoint, window), expected);
}

TEST(BoundaryNormalizerTest, EmptyInput) {
    EXPECT_TRUE(BoundaryNormalizer::normalize({}, RepresentativePolicy::Midpoint).empty());
}
