#include <gtest/gtest.h>
#include <algorithm>
#include "keyframeselector.h"
#include "keyframeerrors.h"
#include "fakeframesampler.h"

namespace {

std::vector<TimeInterval> lectureIntervals()
{
    return {{0, 2}, {2, 5}, {5, 40}, {40, 42}};
}

// No frame thresholds, no gap filling
FilterParameters passThrough()
{
    return FilterParameters(12.0, 5, 0.0, 0.0, 0.5, 0.0, 15.0);
}

bool contains(const std::vector<double>& values, double value)
{
    return std::any_of(values.begin(), values.end(),
                       [value](double v) { return std::abs(v - value) < 1e-9; });
}

}

class KeyframeSelectorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        QObject::connect(&selector, &KeyframeSelector::diagnosticReported,
                         [this](DiagnosticKind kind, const QString&) { diagnostics.push_back(kind); });
    }

    int diagnosticCount(DiagnosticKind kind) const
    {
        return static_cast<int>(std::count(diagnostics.begin(), diagnostics.end(), kind));
    }

    KeyframeSelector selector;
    FakeFrameSampler sampler;
    std::vector<DiagnosticKind> diagnostics;
};

TEST_F(KeyframeSelectorTest, MidpointCandidatesWithoutThresholds) {
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));

    KeyframeSelection selection = selector.select(lectureIntervals(), sampler, passThrough());

    std::vector<double> expected = {1.0, 3.5, 22.5, 41.0};
    EXPECT_EQ(selection.timestamps, expected);
    EXPECT_EQ(selection.keyframes.size(), 4u);
    EXPECT_FALSE(selection.degradedDetection);
    EXPECT_EQ(selection.detectorIntervals, 4);
    EXPECT_TRUE(diagnostics.empty());
}

TEST_F(KeyframeSelectorTest, GapFillingInsertsSyntheticCandidates) {
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));
    FilterParameters params = passThrough();
    params.maxTimeGap = 10.0;
    params.fillInterval = 5.0;

    KeyframeSelection selection = selector.select(lectureIntervals(), sampler, params);

    EXPECT_TRUE(contains(selection.timestamps, 27.5));
    EXPECT_TRUE(contains(selection.timestamps, 32.5));
    EXPECT_TRUE(contains(selection.timestamps, 37.5));
    EXPECT_TRUE(contains(selection.timestamps, 41.0));
    EXPECT_GT(selection.syntheticCandidates, 0);

    // Synthetic points are sampled before consolidation
    EXPECT_TRUE(contains(sampler.requests(), 27.5));

    for (const Keyframe& keyframe : selection.keyframes) {
        if (std::abs(keyframe.timestamp - 32.5) < 1e-9) {
            EXPECT_TRUE(keyframe.synthetic);
        }
        if (std::abs(keyframe.timestamp - 22.5) < 1e-9) {
            EXPECT_FALSE(keyframe.synthetic);
        }
    }
}

TEST_F(KeyframeSelectorTest, NearIdenticalConsecutiveFrameIsDropped) {
    cv::Mat slide = FakeFrameSampler::noiseFrame(2);
    sampler.setFrame(1.0, slide);
    sampler.setFrame(3.0, FakeFrameSampler::shifted(slide, 0.8));
    FilterParameters params = passThrough();
    params.duplicateThreshold = 1.5;

    KeyframeSelection selection = selector.select({{0, 2}, {2, 4}}, sampler, params);

    std::vector<double> expected = {1.0};
    EXPECT_EQ(selection.timestamps, expected);
}

TEST_F(KeyframeSelectorTest, EmptyDetectorOutputFallsBackToWindowStart) {
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(3));
    SelectionOptions options;
    options.window.start = 5.0;

    KeyframeSelection selection = selector.select({}, sampler, FilterParameters(), options);

    std::vector<double> expected = {5.0};
    EXPECT_EQ(selection.timestamps, expected);
    EXPECT_TRUE(selection.degradedDetection);
    EXPECT_EQ(diagnosticCount(DiagnosticKind::DegradedDetection), 1);
}

TEST_F(KeyframeSelectorTest, EmptyDetectorOutputFallsBackToZero) {
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(3));

    KeyframeSelection selection = selector.select({}, sampler, FilterParameters());

    std::vector<double> expected = {0.0};
    EXPECT_EQ(selection.timestamps, expected);
    EXPECT_TRUE(selection.degradedDetection);
}

TEST_F(KeyframeSelectorTest, StaticFilteringEverythingFallsBackWithoutThrowing) {
    sampler.setDefaultFrame(FakeFrameSampler::flatFrame(40));
    FilterParameters params = passThrough();
    params.staticThreshold = 1e9;

    KeyframeSelection selection;
    ASSERT_NO_THROW(selection = selector.select(lectureIntervals(), sampler, params));

    std::vector<double> expected = {0.0};
    EXPECT_EQ(selection.timestamps, expected);
    EXPECT_TRUE(selection.degradedDetection);
    EXPECT_EQ(diagnosticCount(DiagnosticKind::DegradedDetection), 1);
}

TEST_F(KeyframeSelectorTest, ZeroLengthVideoHasNoKeyframes) {
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));
    SelectionOptions options;
    options.videoDuration = 0.0;

    EXPECT_THROW(selector.select({}, sampler, FilterParameters(), options), NoKeyframesFound);
}

TEST_F(KeyframeSelectorTest, FallbackFrameUnreadableHasNoKeyframes) {
    sampler.failAt(0.0);

    EXPECT_THROW(selector.select({}, sampler, FilterParameters()), NoKeyframesFound);
}

TEST_F(KeyframeSelectorTest, InvalidParametersBeforeSampling) {
    FilterParameters params;
    params.boundarySensitivity = 0.0;

    EXPECT_THROW(selector.select(lectureIntervals(), sampler, params), InvalidParameters);
    EXPECT_TRUE(sampler.requests().empty());
}

TEST_F(KeyframeSelectorTest, InvertedWindowIsRejected) {
    SelectionOptions options;
    options.window.start = 20.0;
    options.window.end = 10.0;

    EXPECT_THROW(selector.select(lectureIntervals(), sampler, FilterParameters(), options), InvalidParameters);
    EXPECT_TRUE(sampler.requests().empty());
}

TEST_F(KeyframeSelectorTest, WindowRestrictsCandidates) {
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));
    SelectionOptions options;
    options.window.start = 2.0;
    options.window.end = 30.0;

    KeyframeSelection selection = selector.select(lectureIntervals(), sampler, passThrough(), options);

    std::vector<double> expected = {3.5, 22.5};
    EXPECT_EQ(selection.timestamps, expected);
}

TEST_F(KeyframeSelectorTest, IntervalStartPolicy) {
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));
    SelectionOptions options;
    options.policy = RepresentativePolicy::IntervalStart;

    KeyframeSelection selection = selector.select(lectureIntervals(), sampler, passThrough(), options);

    std::vector<double> expected = {0.0, 2.0, 5.0, 40.0};
    EXPECT_EQ(selection.timestamps, expected);
}

TEST_F(KeyframeSelectorTest, UnreadableFrameIsDroppedAndReported) {
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));
    sampler.failAt(3.5);

    KeyframeSelection selection = selector.select(lectureIntervals(), sampler, passThrough());

    std::vector<double> expected = {1.0, 22.5, 41.0};
    EXPECT_EQ(selection.timestamps, expected);
    EXPECT_EQ(selection.unreadableFrames, 1);
    EXPECT_EQ(diagnosticCount(DiagnosticKind::UnreadableFrame), 1);
}

TEST_F(KeyframeSelectorTest, CancellationRequestedBeforeRun) {
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));
    selector.requestCancellation();

    EXPECT_THROW(selector.select(lectureIntervals(), sampler, passThrough()), SelectionCancelled);
    EXPECT_TRUE(sampler.requests().empty());
    EXPECT_EQ(diagnosticCount(DiagnosticKind::Cancelled), 1);

    selector.resetCancellation();
    EXPECT_NO_THROW(selector.select(lectureIntervals(), sampler, passThrough()));
}

TEST_F(KeyframeSelectorTest, DeadlineCheckStopsRun) {
    sampler.setDefaultFrame(FakeFrameSampler::noiseFrame(1));
    int checks = 0;
    selector.setDeadlineCheck([&checks]() { return ++checks > 2; });

    EXPECT_THROW(selector.select(lectureIntervals(), sampler, FilterParameters()), SelectionCancelled);
    EXPECT_EQ(sampler.requests().size(), 2u);
}

TEST_F(KeyframeSelectorTest, OutputIsOrderedSubsetOfSampledCandidates) {
    for (int i = 0; i < 20; ++i) {
        sampler.setFrame(i * 3.0 + 1.0, FakeFrameSampler::noiseFrame(i % 4));
    }
    std::vector<TimeInterval> intervals;
    for (int i = 0; i < 20; ++i) {
        intervals.emplace_back(i * 3.0, i * 3.0 + 2.0);
    }
    FilterParameters params(12.0, 5, 2.0, 1.5, 0.5, 0.0, 15.0);

    KeyframeSelection selection = selector.select(intervals, sampler, params);

    ASSERT_FALSE(selection.timestamps.empty());
    EXPECT_LE(selection.timestamps.size(), intervals.size());
    for (size_t i = 1; i < selection.timestamps.size(); ++i) {
        EXPECT_LT(selection.timestamps[i - 1], selection.timestamps[i]);
    }
    for (double ts : selection.timestamps) {
        EXPECT_TRUE(contains(sampler.requests(), ts));
    }
}

TEST(KeyframeSelectorFallbackTest, FallbackTimestamp) {
    SelectionOptions options;
    EXPECT_DOUBLE_EQ(KeyframeSelector::fallbackTimestamp(options), 0.0);

    options.window.start = 12.0;
    EXPECT_DOUBLE_EQ(KeyframeSelector::fallbackTimestamp(options), 12.0);

    options.videoDuration = 10.0;
    EXPECT_LT(KeyframeSelector::fallbackTimestamp(options), 0.0);

    options.window.start = -1.0;
    options.videoDuration = 0.0;
    EXPECT_LT(KeyframeSelector::fallbackTimestamp(options), 0.0);
}
