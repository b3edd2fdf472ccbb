#ifndef BOUNDARYNORMALIZER_H
#define BOUNDARYNORMALIZER_H

#include <vector>
#include "keyframetypes.h"

/**
 * Converts raw scene-boundary detector output into the initial candidate sequence
 */
class BoundaryNormalizer
{
public:
    /**
     * Map each interval to one representative timestamp, drop timestamps outside
     * the window (and outside [0, videoDuration] when the duration is known),
     * sort ascending and collapse timestamps closer than TIMESTAMP_EPSILON.
     * An empty detector result yields an empty sequence.
     * @param intervals Detector intervals, roughly sorted, possibly overlapping
     * @param policy Representative timestamp policy
     * @param window Optional time window
     * @param videoDuration Video duration in seconds, negative when unknown
     * @return Strictly increasing candidate timestamps
     */
    static std::vector<double> normalize(const std::vector<TimeInterval>& intervals,
                                         RepresentativePolicy policy,
                                         const TimeWindow& window = TimeWindow(),
                                         double videoDuration = -1.0);

    /**
     * Representative timestamp of a single interval
     */
    static double representative(const TimeInterval& interval, RepresentativePolicy policy);
};

#endif // BOUNDARYNORMALIZER_H
