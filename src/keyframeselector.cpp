#include "keyframeselector.h"
#include "boundarynormalizer.h"
#include "consolidator.h"
#include "gapfiller.h"
#include "keyframeerrors.h"
#include <QDebug>
#include <QElapsedTimer>

KeyframeSelector::KeyframeSelector(QObject *parent)
    : QObject(parent),
      m_cancelRequested(false)
{
    m_temporalFilter.setCancellationCheck([this]() { return shouldStop(); });

    connect(&m_temporalFilter, &TemporalFilter::filterProgress, this,
            [this](int current, int total) { emit stageProgress("filter", current, total); });
    connect(&m_temporalFilter, &TemporalFilter::frameUnreadable, this,
            [this](double timestamp) {
                emit diagnosticReported(DiagnosticKind::UnreadableFrame,
                                        QString("Could not decode frame at %1s").arg(timestamp, 0, 'f', 3));
            });
}

void KeyframeSelector::requestCancellation()
{
    m_cancelRequested = true;
}

void KeyframeSelector::resetCancellation()
{
    m_cancelRequested = false;
}

bool KeyframeSelector::shouldStop() const
{
    if (m_cancelRequested) {
        return true;
    }
    return m_deadlineCheck && m_deadlineCheck();
}

double KeyframeSelector::fallbackTimestamp(const SelectionOptions& options)
{
    double fallback = options.window.hasStart() ? options.window.start : 0.0;

    if (options.videoDuration >= 0.0) {
        // A zero-length video, or a window starting past the end, has no frame to offer
        if (options.videoDuration <= 0.0 || fallback > options.videoDuration) {
            return -1.0;
        }
    }

    return fallback;
}

KeyframeSelection KeyframeSelector::select(const std::vector<TimeInterval>& intervals,
                                           FrameSampler& sampler,
                                           const FilterParameters& params,
                                           const SelectionOptions& options)
{
    KeyframeSelection selection;
    QElapsedTimer timer;
    timer.start();

    // Pre-flight validation, before any decode work
    params.validate();
    if (options.window.hasStart() && options.window.hasEnd() && options.window.start > options.window.end) {
        throw InvalidParameters("window start is after window end");
    }

    try {
        // Step 1: boundary normalization
        selection.detectorIntervals = static_cast<int>(intervals.size());
        std::vector<double> candidates = BoundaryNormalizer::normalize(intervals, options.policy,
                                                                       options.window, options.videoDuration);
        selection.normalizedCandidates = static_cast<int>(candidates.size());
        emit progressMessage(QString("Detector returned %1 intervals, %2 candidates after normalization")
                             .arg(intervals.size()).arg(candidates.size()));

        // Step 2: temporal filtering
        TemporalFilterResult filtered = m_temporalFilter.filter(candidates, sampler, params,
                                                                fallbackTimestamp(options));
        selection.filteredCandidates = static_cast<int>(filtered.candidates.size());
        selection.unreadableFrames = filtered.unreadableFrames;
        emit progressMessage(QString("Filtering kept %1 candidates (gap: -%2, static: -%3, duplicate: -%4)")
                             .arg(filtered.candidates.size())
                             .arg(filtered.droppedByGap)
                             .arg(filtered.droppedAsStatic)
                             .arg(filtered.droppedAsDuplicate));

        if (filtered.usedFallback) {
            selection.degradedDetection = true;
            emit diagnosticReported(DiagnosticKind::DegradedDetection,
                                    QString("No scene change detected, using a single frame at %1s")
                                    .arg(filtered.candidates.front(), 0, 'f', 3));
        }

        // Step 3: gap filling
        GapFillResult gapFilled = GapFiller::fill(filtered.candidates, params.maxTimeGap,
                                                    params.fillInterval, params.minTimeGap);
        selection.syntheticCandidates = gapFilled.insertedCount;
        if (gapFilled.insertedCount > 0) {
            emit progressMessage(QString("Gap filling inserted %1 candidates").arg(gapFilled.insertedCount));
        }

        // Step 4: materialize one fresh frame per candidate, in order
        std::vector<Keyframe> sampled = materialize(gapFilled.timestamps, gapFilled.synthetic,
                                                    sampler, selection.unreadableFrames);

        // Step 5: consolidation
        ConsolidationResult consolidated = Consolidator::consolidate(sampled, params.duplicateThreshold);
        selection.keyframes = consolidated.keyframes;
        selection.timestamps = consolidated.timestamps;
    } catch (const SelectionCancelled& e) {
        qInfo() << "KeyframeSelector: Selection cancelled after" << timer.elapsed() << "ms";
        emit diagnosticReported(DiagnosticKind::Cancelled, QString::fromStdString(e.what()));
        throw;
    }

    selection.processingTimeSeconds = timer.elapsed() / 1000.0;
    emit progressMessage(QString("%1 keyframes selected").arg(selection.keyframes.size()));

    return selection;
}

std::vector<Keyframe> KeyframeSelector::materialize(const std::vector<double>& timestamps,
                                                    const std::vector<bool>& synthetic,
                                                    FrameSampler& sampler,
                                                    int& unreadableFrames)
{
    std::vector<Keyframe> sampled;
    sampled.reserve(timestamps.size());

    const int total = static_cast<int>(timestamps.size());
    for (int i = 0; i < total; ++i) {
        if (shouldStop()) {
            throw SelectionCancelled();
        }
        emit stageProgress("sample", i, total);

        cv::Mat frame = sampler.sampleAt(timestamps[i]);
        if (frame.empty()) {
            unreadableFrames++;
            emit diagnosticReported(DiagnosticKind::UnreadableFrame,
                                    QString("Could not decode frame at %1s").arg(timestamps[i], 0, 'f', 3));
        }
        sampled.emplace_back(timestamps[i], frame, synthetic[i]);
    }
    emit stageProgress("sample", total, total);

    return sampled;
}
