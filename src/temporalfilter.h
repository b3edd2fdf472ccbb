#ifndef TEMPORALFILTER_H
#define TEMPORALFILTER_H

#include <functional>
#include <vector>
#include <QObject>
#include "filterparameters.h"
#include "framesampler.h"

struct TemporalFilterResult {
    std::vector<double> candidates;
    bool usedFallback = false;       // every candidate was rejected, single fallback used
    int droppedByGap = 0;
    int droppedAsStatic = 0;
    int droppedAsDuplicate = 0;
    int unreadableFrames = 0;
};

/**
 * Removes candidates that are too close, static/noisy, or duplicates of their
 * kept predecessor. Steps run in that order, each a single left-to-right pass.
 */
class TemporalFilter : public QObject
{
    Q_OBJECT

public:
    using CancellationCheck = std::function<bool()>;

    explicit TemporalFilter(QObject *parent = nullptr);

    /**
     * Install a check invoked before each frame sample
     * @param check Returns true when the run must stop
     */
    void setCancellationCheck(const CancellationCheck& check) { m_cancellationCheck = check; }

    /**
     * Filter a normalized candidate sequence
     * @param candidates Strictly increasing candidate timestamps
     * @param sampler Frame source, used only when a frame threshold is enabled
     * @param params Validated filter parameters
     * @param fallbackTimestamp Candidate used when everything is filtered out;
     *                          negative when no fallback can be produced
     * @return Surviving candidates and per-step statistics
     * @throws SelectionCancelled when the cancellation check fires
     */
    TemporalFilterResult filter(const std::vector<double>& candidates,
                                FrameSampler& sampler,
                                const FilterParameters& params,
                                double fallbackTimestamp);

    /**
     * Drop candidates closer than minTimeGap to the previously kept one.
     * The first candidate is always kept.
     */
    static std::vector<double> coalesceGaps(const std::vector<double>& candidates, double minTimeGap);

signals:
    void filterProgress(int current, int total);
    void frameUnreadable(double timestamp);

private:
    CancellationCheck m_cancellationCheck;
};

#endif // TEMPORALFILTER_H
