#ifndef PARAMETERSWEEP_H
#define PARAMETERSWEEP_H

#include <vector>
#include <QObject>
#include <QString>
#include "configmanager.h"

struct SweepEntry {
    int index = 0;              // 1-based position in the sweep
    QString name;               // run directory name, e.g. "01_default"
    QString outputDir;
    int keyframeCount = -1;     // -1 when the run failed
    QString error;

    bool succeeded() const { return keyframeCount >= 0; }
};

/**
 * Runs one extraction per parameter preset, each into its own directory
 */
class ParameterSweep : public QObject
{
    Q_OBJECT

public:
    explicit ParameterSweep(const AppConfig& baseConfig, QObject *parent = nullptr);

    /**
     * Run every sweep preset on a video
     * @param videoPath Path to video file
     * @param outputBase Directory receiving one subdirectory per preset
     * @return One entry per preset, in sweep order
     */
    std::vector<SweepEntry> run(const QString& videoPath, const QString& outputBase);

    /**
     * Entries ordered by keyframe count, largest first, failed runs last
     */
    static std::vector<SweepEntry> sortedSummary(const std::vector<SweepEntry>& entries);

    /**
     * Directory name of the n-th run, e.g. runDirectoryName(7, FillAggressive) == "07_fill_aggressive"
     */
    static QString runDirectoryName(int index, ParameterPreset preset);

signals:
    void runStarted(int index, int total, const QString& name, const QString& parameters);
    void runFinished(const SweepEntry& entry);
    void progressMessage(const QString& message);

protected:
    /**
     * Run one extraction with a preset applied
     * @return Number of keyframes written
     * @throws KeyframeError or any std::exception raised by the run
     */
    virtual int runExtraction(const AppConfig& config, const QString& videoPath, const QString& outputDir);

private:
    AppConfig m_baseConfig;
};

#endif // PARAMETERSWEEP_H
