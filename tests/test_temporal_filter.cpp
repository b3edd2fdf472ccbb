#include <gtest/gtest.h>
#include "temporalfilter.h"
#include "keyframeerrors.h"
#include "fakeframesampler.h"

namespace {

FilterParameters thresholds(double staticCutoff, double duplicateCutoff, double minGap = 0.5)
{
    return FilterParameters(12.0, 5, staticCutoff, duplicateCutoff, minGap, 0.0, 15.0);
}

}

TEST(TemporalFilterTest, CoalesceKeepsFirstAndComparesToLastKept) {
    std::vector<double> expected = {0.0, 0.6};
    EXPECT_EQ(TemporalFilter::coalesceGaps({0.0, 0.3, 0.6, 1.0}, 0.5), expected);
}

TEST(TemporalFilterTest, CoalesceRespectsMinimumGap) {
    std::vector<double> input = {0.0, 0.1, 0.45, 0.5, 0.9, 1.2, 1.25, 2.0, 2.4, 3.0};
    std::vector<double> kept = TemporalFilter::coalesceGaps(input, 0.5);

    ASSERT_FALSE(kept.empty());
    EXPECT_DOUBLE_EQ(kept.front(), input.front());
    for (size_t i = 1; i < kept.size(); ++i) {
        EXPECT_GE(kept[i] - kept[i - 1], 0.5);
    }
    // Idempotent
    EXPECT_EQ(TemporalFilter::coalesceGaps(kept, 0.5), kept);
}

TEST(TemporalFilterTest, ZeroGapKeepsEverything) {
    std::vector<double> input = {0.0, 0.01, 0.02};
    EXPECT_EQ(TemporalFilter::coalesceGaps(input, 0.0), input);
}

TEST(TemporalFilterTest, NoSamplingWhenFrameChecksDisabled) {
    FakeFrameSampler sampler;
    TemporalFilter filter;

    TemporalFilterResult result = filter.filter({1.0, 3.5, 22.5}, sampler, thresholds(0.0, 0.0), 0.0);

    std::vector<double> expected = {1.0, 3.5, 22.5};
    EXPECT_EQ(result.candidates, expected);
    EXPECT_TRUE(sampler.requests().empty());
    EXPECT_FALSE(result.usedFallback);
}

TEST(TemporalFilterTest, SamplesEachCandidateOnce) {
    FakeFrameSampler sampler;
    sampler.setFrame(1.0, FakeFrameSampler::noiseFrame(1));
    sampler.setFrame(2.0, FakeFrameSampler::noiseFrame(2));
    sampler.setFrame(3.0, FakeFrameSampler::noiseFrame(3));
    TemporalFilter filter;

    filter.filter({1.0, 2.0, 3.0}, sampler, thresholds(2.0, 1.5), 0.0);

    std::vector<double> expected = {1.0, 2.0, 3.0};
    EXPECT_EQ(sampler.requests(), expected);
}

TEST(TemporalFilterTest, DropsStaticFrames) {
    FakeFrameSampler sampler;
    sampler.setFrame(1.0, FakeFrameSampler::flatFrame(30));
    sampler.setFrame(2.0, FakeFrameSampler::noiseFrame(2));
    sampler.setFrame(3.0, FakeFrameSampler::flatFrame(200));
    TemporalFilter filter;

    TemporalFilterResult result = filter.filter({1.0, 2.0, 3.0}, sampler, thresholds(2.0, 0.0), 0.0);

    std::vector<double> expected = {2.0};
    EXPECT_EQ(result.candidates, expected);
    EXPECT_EQ(result.droppedAsStatic, 2);
}

TEST(TemporalFilterTest, DropsRunningDuplicates) {
    cv::Mat slide = FakeFrameSampler::noiseFrame(10);
    FakeFrameSampler sampler;
    sampler.setFrame(1.0, slide);
    sampler.setFrame(2.0, FakeFrameSampler::shifted(slide, 0.8));
    sampler.setFrame(3.0, FakeFrameSampler::shifted(slide, 1.0));
    sampler.setFrame(4.0, FakeFrameSampler::noiseFrame(11));
    TemporalFilter filter;

    TemporalFilterResult result = filter.filter({1.0, 2.0, 3.0, 4.0}, sampler, thresholds(0.0, 1.5), 0.0);

    // 3.0 differs from 2.0 by 0.2 but is compared with the kept frame at 1.0
    std::vector<double> expected = {1.0, 4.0};
    EXPECT_EQ(result.candidates, expected);
    EXPECT_EQ(result.droppedAsDuplicate, 2);
}

TEST(TemporalFilterTest, GapCoalescingRunsBeforeFrameChecks) {
    FakeFrameSampler sampler;
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));
    TemporalFilter filter;

    TemporalFilterResult result = filter.filter({1.0, 1.2, 2.0}, sampler, thresholds(2.0, 0.0), 0.0);

    std::vector<double> expected = {1.0, 2.0};
    EXPECT_EQ(result.candidates, expected);
    EXPECT_EQ(result.droppedByGap, 1);
    EXPECT_EQ(sampler.requests(), expected);
}

TEST(TemporalFilterTest, FallbackWhenEverythingIsFiltered) {
    FakeFrameSampler sampler;
    sampler.setDefaultFrame(FakeFrameSampler::flatFrame(0));
    TemporalFilter filter;

    TemporalFilterResult result = filter.filter({1.0, 5.0}, sampler, thresholds(2.0, 0.0), 3.0);

    std::vector<double> expected = {3.0};
    EXPECT_EQ(result.candidates, expected);
    EXPECT_TRUE(result.usedFallback);
}

TEST(TemporalFilterTest, FallbackForEmptyInput) {
    FakeFrameSampler sampler;
    TemporalFilter filter;

    TemporalFilterResult result = filter.filter({}, sampler, thresholds(2.0, 1.5), 0.0);

    std::vector<double> expected = {0.0};
    EXPECT_EQ(result.candidates, expected);
    EXPECT_TRUE(result.usedFallback);
}

TEST(TemporalFilterTest, NoFallbackAvailable) {
    FakeFrameSampler sampler;
    TemporalFilter filter;

    TemporalFilterResult result = filter.filter({}, sampler, thresholds(2.0, 1.5), -1.0);

    EXPECT_TRUE(result.candidates.empty());
    EXPECT_FALSE(result.usedFallback);
}

TEST(TemporalFilterTest, UnreadableFrameIsTreatedAsStatic) {
    FakeFrameSampler sampler;
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));
    sampler.failAt(2.0);
    TemporalFilter filter;

    std::vector<double> unreadable;
    QObject::connect(&filter, &TemporalFilter::frameUnreadable,
                     [&unreadable](double timestamp) { unreadable.push_back(timestamp); });

    TemporalFilterResult result = filter.filter({1.0, 2.0}, sampler, thresholds(2.0, 0.0), 0.0);

    std::vector<double> expected = {1.0};
    EXPECT_EQ(result.candidates, expected);
    EXPECT_EQ(result.unreadableFrames, 1);
    ASSERT_EQ(unreadable.size(), 1u);
    EXPECT_DOUBLE_EQ(unreadable.front(), 2.0);
}

TEST(TemporalFilterTest, CancellationStopsBeforeSampling) {
    FakeFrameSampler sampler;
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));
    TemporalFilter filter;

    int checks = 0;
    filter.setCancellationCheck([&checks]() { return ++checks > 2; });

    EXPECT_THROW(filter.filter({1.0, 2.0, 3.0, 4.0}, sampler, thresholds(2.0, 0.0), 0.0),
                 SelectionCancelled);
    EXPECT_EQ(sampler.requests().size(), 2u);
}

TEST(TemporalFilterTest, FilterIsIdempotent) {
    cv::Mat slide = FakeFrameSampler::noiseFrame(20);
    cv::Mat nextSlide = FakeFrameSampler::noiseFrame(21);
    FakeFrameSampler sampler;
    sampler.setFrame(1.0, slide);
    sampler.setFrame(1.2, FakeFrameSampler::noiseFrame(22));
    sampler.setFrame(2.0, FakeFrameSampler::shifted(slide, 0.5));
    sampler.setFrame(3.0, FakeFrameSampler::flatFrame(40));
    sampler.failAt(4.0);
    sampler.setFrame(5.0, nextSlide);
    sampler.setFrame(6.0, FakeFrameSampler::shifted(nextSlide, 1.0));
    sampler.setFrame(7.0, FakeFrameSampler::noiseFrame(23));
    TemporalFilter filter;
    const FilterParameters params = thresholds(2.0, 1.5);

    TemporalFilterResult first = filter.filter({1.0, 1.2, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0}, sampler, params, 0.0);
    std::vector<double> expected = {1.0, 5.0, 7.0};
    ASSERT_EQ(first.candidates, expected);

    TemporalFilterResult second = filter.filter(first.candidates, sampler, params, 0.0);
    EXPECT_EQ(second.candidates, first.candidates);
    EXPECT_FALSE(second.usedFallback);
}

TEST(TemporalFilterTest, FilterIsIdempotentWithUnreadableLeadingFrame) {
    cv::Mat slide = FakeFrameSampler::noiseFrame(30);
    FakeFrameSampler sampler;
    sampler.failAt(1.0);
    sampler.setFrame(2.0, slide);
    sampler.setFrame(3.0, FakeFrameSampler::shifted(slide, 0.5));
    sampler.setFrame(4.0, FakeFrameSampler::noiseFrame(31));
    TemporalFilter filter;
    const FilterParameters params = thresholds(0.0, 1.5);

    TemporalFilterResult first = filter.filter({1.0, 2.0, 3.0, 4.0}, sampler, params, 0.0);
    std::vector<double> expected = {1.0, 2.0, 4.0};
    ASSERT_EQ(first.candidates, expected);

    EXPECT_EQ(filter.filter(first.candidates, sampler, params, 0.0).candidates, first.candidates);
}

TEST(TemporalFilterTest, FilterIsIdempotentAfterFallback) {
    FakeFrameSampler sampler;
    sampler.setDefaultFrame(FakeFrameSampler::flatFrame(0));
    TemporalFilter filter;
    const FilterParameters params = thresholds(2.0, 1.5);

    TemporalFilterResult first = filter.filter({1.0, 5.0, 9.0}, sampler, params, 3.0);
    ASSERT_TRUE(first.usedFallback);

    TemporalFilterResult second = filter.filter(first.candidates, sampler, params, 3.0);
    EXPECT_EQ(second.candidates, first.candidates);
}
