#include "consolidator.h"
#include "duplicatefilter.h"
#include "keyframeerrors.h"
#include <QDebug>

ConsolidationResult Consolidator::consolidate(const std::vector<Keyframe>& sampled,
                                              double duplicateThreshold)
{
    ConsolidationResult result;

    if (sampled.empty()) {
        throw NoKeyframesFound("No keyframe candidates left to consolidate");
    }

    // Unreadable frames have nothing to assemble
    std::vector<int> readableIndices;
    std::vector<cv::Mat> frames;
    readableIndices.reserve(sampled.size());
    frames.reserve(sampled.size());

    for (int i = 0; i < static_cast<int>(sampled.size()); ++i) {
        if (sampled[i].frame.empty()) {
            qWarning() << "Consolidator: Dropping unreadable frame at" << sampled[i].timestamp << "s";
            result.droppedUnreadable++;
            continue;
        }
        readableIndices.push_back(i);
        frames.push_back(sampled[i].frame);
    }

    if (frames.empty()) {
        throw NoKeyframesFound("None of the keyframe candidates could be decoded");
    }

    std::vector<int> kept = DuplicateFilter::selectDistinct(frames, duplicateThreshold);
    result.droppedAsDuplicate = static_cast<int>(frames.size() - kept.size());

    for (int index : kept) {
        const int sourceIndex = readableIndices[index];
        result.keyframes.push_back(sampled[sourceIndex]);
        result.timestamps.push_back(sampled[sourceIndex].timestamp);
        result.retainedIndices.push_back(sourceIndex);
    }

    return result;
}
