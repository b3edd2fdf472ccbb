#include "temporalfilter.h"
#include "duplicatefilter.h"
#include "framemetric.h"
#include "keyframeerrors.h"
#include <QDebug>

TemporalFilter::TemporalFilter(QObject *parent)
    : QObject(parent)
{
}

std::vector<double> TemporalFilter::coalesceGaps(const std::vector<double>& candidates, double minTimeGap)
{
    std::vector<double> kept;
    kept.reserve(candidates.size());

    for (double ts : candidates) {
        if (kept.empty() || ts - kept.back() >= minTimeGap) {
            kept.push_back(ts);
        }
    }

    return kept;
}

TemporalFilterResult TemporalFilter::filter(const std::vector<double>& candidates,
                                            FrameSampler& sampler,
                                            const FilterParameters& params,
                                            double fallbackTimestamp)
{
    TemporalFilterResult result;

    // Step 1: gap coalescing
    std::vector<double> remaining = coalesceGaps(candidates, params.minTimeGap);
    result.droppedByGap = static_cast<int>(candidates.size() - remaining.size());

    const bool staticEnabled = params.staticThreshold > 0.0;
    const bool duplicateEnabled = params.duplicateThreshold > 0.0;

    if ((staticEnabled || duplicateEnabled) && !remaining.empty()) {
        // One sample per candidate; the frames live only inside this stage
        std::vector<double> sampledTimes;
        std::vector<cv::Mat> frames;
        sampledTimes.reserve(remaining.size());
        frames.reserve(remaining.size());

        const int total = static_cast<int>(remaining.size());
        for (int i = 0; i < total; ++i) {
            if (m_cancellationCheck && m_cancellationCheck()) {
                throw SelectionCancelled();
            }
            emit filterProgress(i, total);

            double ts = remaining[i];
            cv::Mat frame = sampler.sampleAt(ts);
            if (frame.empty()) {
                result.unreadableFrames++;
                emit frameUnreadable(ts);
            }

            // Step 2: static filtering, no neighbor consulted
            if (staticEnabled && FrameMetric::isStatic(frame, params.staticThreshold)) {
                result.droppedAsStatic++;
                continue;
            }

            sampledTimes.push_back(ts);
            frames.push_back(frame);
        }
        emit filterProgress(total, total);

        // Step 3: running duplicate filtering
        if (duplicateEnabled) {
            std::vector<int> keptIndices = DuplicateFilter::selectDistinct(frames, params.duplicateThreshold);
            result.droppedAsDuplicate = static_cast<int>(frames.size() - keptIndices.size());

            remaining.clear();
            for (int index : keptIndices) {
                remaining.push_back(sampledTimes[index]);
            }
        } else {
            remaining = sampledTimes;
        }
    }

    if (remaining.empty() && fallbackTimestamp >= 0.0) {
        qWarning() << "TemporalFilter: No candidate survived filtering, using fallback at"
                   << fallbackTimestamp << "s";
        remaining.push_back(fallbackTimestamp);
        result.usedFallback = true;
    }

    result.candidates = remaining;
    return result;
}
