#ifndef DUPLICATEFILTER_H
#define DUPLICATEFILTER_H

#include <vector>
#include <opencv2/opencv.hpp>

/**
 * Running-comparison duplicate removal shared by the temporal filter and the
 * consolidator.
 *
 * Each frame is compared with the last kept frame only, never all pairs, so a
 * slow fade or a repeated cut collapses to its first representative.
 */
class DuplicateFilter
{
public:
    /**
     * Select the indices of frames that differ from their nearest kept predecessor
     * @param frames Frames in display order (empty Mat = unreadable)
     * @param duplicateThreshold Dissimilarity cutoff; <= 0 keeps every index
     * @return Ascending indices of kept frames. The first frame is always kept.
     *
     * An unreadable frame scores 0 against any reference and is dropped. When
     * the running reference itself is unreadable, the next readable frame is
     * kept and becomes the reference.
     */
    static std::vector<int> selectDistinct(const std::vector<cv::Mat>& frames,
                                           double duplicateThreshold);
};

#endif // DUPLICATEFILTER_H
