#include "duplicatefilter.h"
#include "framemetric.h"

std::vector<int> DuplicateFilter::selectDistinct(const std::vector<cv::Mat>& frames,
                                                 double duplicateThreshold)
{
    std::vector<int> kept;
    if (frames.empty()) {
        return kept;
    }

    kept.reserve(frames.size());
    kept.push_back(0);

    if (duplicateThreshold <= 0.0) {
        for (int i = 1; i < static_cast<int>(frames.size()); ++i) {
            kept.push_back(i);
        }
        return kept;
    }

    cv::Mat keptFrame = frames[0];
    for (int i = 1; i < static_cast<int>(frames.size()); ++i) {
        const cv::Mat& frame = frames[i];

        if (keptFrame.empty() && !frame.empty()) {
            kept.push_back(i);
            keptFrame = frame;
            continue;
        }

        if (FrameMetric::isDuplicate(keptFrame, frame, duplicateThreshold)) {
            continue;
        }

        kept.push_back(i);
        keptFrame = frame;
    }

    return kept;
}
