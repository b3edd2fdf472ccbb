#ifndef CONSOLIDATOR_H
#define CONSOLIDATOR_H

#include <vector>
#include "keyframetypes.h"

struct ConsolidationResult {
    std::vector<Keyframe> keyframes;     // final display order
    std::vector<double> timestamps;      // timestamps of keyframes, for re-sampling other views
    std::vector<int> retainedIndices;    // indices into the consolidator input
    int droppedUnreadable = 0;
    int droppedAsDuplicate = 0;
};

/**
 * Final adjacency-based deduplication over materialized frames.
 *
 * Gap filling may place new adjacent duplicates next to each other; this pass
 * runs the same running-comparison filter as the temporal filter on the final
 * frame set.
 */
class Consolidator
{
public:
    /**
     * Consolidate sampled keyframes
     * @param sampled Candidates in order, each with a freshly sampled frame
     * @param duplicateThreshold Dissimilarity cutoff; <= 0 skips the duplicate pass
     * @return Keyframes never more numerous than the input and never reordered
     * @throws NoKeyframesFound when nothing readable remains
     */
    static ConsolidationResult consolidate(const std::vector<Keyframe>& sampled,
                                           double duplicateThreshold);
};

#endif // CONSOLIDATOR_H
