#ifndef KEYFRAMESELECTOR_H
#define KEYFRAMESELECTOR_H

#include <atomic>
#include <functional>
#include <vector>
#include <QObject>
#include <QMetaType>
#include <QString>
#include "keyframetypes.h"
#include "filterparameters.h"
#include "framesampler.h"
#include "temporalfilter.h"

struct SelectionOptions {
    RepresentativePolicy policy = RepresentativePolicy::Midpoint;
    TimeWindow window;
    double videoDuration = -1.0;   // seconds, negative when unknown
};

struct KeyframeSelection {
    std::vector<Keyframe> keyframes;     // final (timestamp, frame) pairs in display order
    std::vector<double> timestamps;      // timestamps of keyframes
    bool degradedDetection = false;      // fallback candidate replaced detection
    int detectorIntervals = 0;
    int normalizedCandidates = 0;
    int filteredCandidates = 0;
    int syntheticCandidates = 0;
    int unreadableFrames = 0;
    double processingTimeSeconds = 0.0;
};

/**
 * Slide keyframe selection engine.
 *
 * Runs boundary normalization, temporal filtering, gap filling, frame
 * materialization and consolidation synchronously on the caller's thread.
 * A selector owns no state shared between runs besides the cancellation
 * flag; parallel runs need separate selectors and separate samplers.
 */
class KeyframeSelector : public QObject
{
    Q_OBJECT

public:
    using DeadlineCheck = std::function<bool()>;

    explicit KeyframeSelector(QObject *parent = nullptr);

    /**
     * Select the ordered, deduplicated keyframes of a presentation video
     * @param intervals Raw scene-boundary detector output
     * @param sampler Frame source for the detection view of the video
     * @param params Filter parameters (validated before any sampling)
     * @param options Representative policy, time window and video duration
     * @return Final keyframes and run statistics
     * @throws InvalidParameters when params or the window are out of domain
     * @throws NoKeyframesFound when consolidation leaves nothing
     * @throws SelectionCancelled when cancellation or the deadline check fires
     */
    KeyframeSelection select(const std::vector<TimeInterval>& intervals,
                             FrameSampler& sampler,
                             const FilterParameters& params,
                             const SelectionOptions& options = SelectionOptions());

    /**
     * Request cancellation; honored before the next frame sample
     */
    void requestCancellation();

    /**
     * Reset cancellation flag
     */
    void resetCancellation();

    /**
     * Install an externally owned deadline check, invoked at the cancellation points
     * @param check Returns true when the run must stop
     */
    void setDeadlineCheck(const DeadlineCheck& check) { m_deadlineCheck = check; }

    /**
     * Timestamp used when no candidate survives filtering
     * @return window start (or 0), negative when the video cannot provide it
     */
    static double fallbackTimestamp(const SelectionOptions& options);

signals:
    void progressMessage(const QString& message);
    void diagnosticReported(DiagnosticKind kind, const QString& message);
    void stageProgress(const QString& stage, int current, int total);

private:
    bool shouldStop() const;

    std::vector<Keyframe> materialize(const std::vector<double>& timestamps,
                                      const std::vector<bool>& synthetic,
                                      FrameSampler& sampler,
                                      int& unreadableFrames);

    std::atomic<bool> m_cancelRequested;
    DeadlineCheck m_deadlineCheck;
    TemporalFilter m_temporalFilter;
};

Q_DECLARE_METATYPE(DiagnosticKind)

#endif // KEYFRAMESELECTOR_H
