#include "boundarynormalizer.h"
#include <algorithm>
#include <cmath>

std::vector<double> BoundaryNormalizer::normalize(const std::vector<TimeInterval>& intervals,
                                                  RepresentativePolicy policy,
                                                  const TimeWindow& window,
                                                  double videoDuration)
{
    std::vector<double> timestamps;
    timestamps.reserve(intervals.size());

    for (const TimeInterval& interval : intervals) {
        double ts = representative(interval, policy);

        if (!std::isfinite(ts) || ts < 0.0) {
            continue;
        }
        if (videoDuration >= 0.0 && ts > videoDuration) {
            continue;
        }
        if (!window.contains(ts)) {
            continue;
        }
        timestamps.push_back(ts);
    }

    // Detector output is only roughly sorted
    std::sort(timestamps.begin(), timestamps.end());

    std::vector<double> candidates;
    candidates.reserve(timestamps.size());
    for (double ts : timestamps) {
        if (candidates.empty() || ts - candidates.back() > TIMESTAMP_EPSILON) {
            candidates.push_back(ts);
        }
    }

    return candidates;
}

double BoundaryNormalizer::representative(const TimeInterval& interval, RepresentativePolicy policy)
{
    // Degenerate detector output may report end < start
    double start = std::min(interval.start, interval.end);
    double end = std::max(interval.start, interval.end);

    switch (policy) {
        case RepresentativePolicy::IntervalStart:
            return start;
        case RepresentativePolicy::Midpoint:
        default:
            return (start + end) / 2.0;
    }
}
