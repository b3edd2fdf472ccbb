#ifndef GAPFILLER_H
#define GAPFILLER_H

#include <vector>

struct GapFillResult {
    std::vector<double> timestamps;   // merged, strictly increasing
    std::vector<bool> synthetic;      // parallel to timestamps
    int insertedCount = 0;
};

/**
 * Inserts periodic sampling points into long intervals between kept candidates.
 *
 * Motion-tuned detectors miss transitions between visually similar slides
 * (incremental bullet reveals); sampling long static stretches recovers them
 * without re-running detection.
 */
class GapFiller
{
public:
    /**
     * For each adjacent pair (a, b) with b - a > maxTimeGap insert
     * a + fillInterval, a + 2 * fillInterval, ... while the value stays below b.
     * Points closer to b than minTimeGap (and never within TIMESTAMP_EPSILON)
     * are not inserted.
     * Disabled (input returned unchanged) when maxTimeGap <= 0 or fillInterval <= 0.
     * @param candidates Strictly increasing filtered candidates
     * @param maxTimeGap Gap length that triggers filling
     * @param fillInterval Spacing of synthetic points
     * @param minTimeGap Minimum distance between adjacent entries
     * @return Merged sequence with synthetic markers
     */
    static GapFillResult fill(const std::vector<double>& candidates,
                              double maxTimeGap,
                              double fillInterval,
                              double minTimeGap = 0.0);
};

#endif // GAPFILLER_H
