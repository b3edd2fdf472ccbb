#include "parametersweep.h"
#include "extractionrunner.h"
#include "keyframeerrors.h"
#include <QDebug>
#include <QDir>
#include <algorithm>
#include <exception>

ParameterSweep::ParameterSweep(const AppConfig& baseConfig, QObject *parent)
    : QObject(parent),
      m_baseConfig(baseConfig)
{
}

QString ParameterSweep::runDirectoryName(int index, ParameterPreset preset)
{
    // CamelCase preset name to snake_case
    const QString presetName = ConfigManager::getPresetName(preset);
    QString snake;
    for (int i = 0; i < presetName.size(); ++i) {
        const QChar c = presetName.at(i);
        if (c.isUpper() && i > 0) {
            snake.append('_');
        }
        snake.append(c.toLower());
    }

    return QString("%1_%2").arg(index, 2, 10, QChar('0')).arg(snake);
}

std::vector<SweepEntry> ParameterSweep::run(const QString& videoPath, const QString& outputBase)
{
    std::vector<SweepEntry> entries;
    const std::vector<ParameterPreset> presets = FilterParameters::sweepPresets();
    const int total = static_cast<int>(presets.size());

    QDir baseDir(outputBase);
    if (!baseDir.mkpath(".")) {
        qWarning() << "ParameterSweep: Failed to create output directory" << outputBase;
    }

    for (int i = 0; i < total; ++i) {
        SweepEntry entry;
        entry.index = i + 1;
        entry.name = runDirectoryName(entry.index, presets[i]);
        entry.outputDir = baseDir.filePath(entry.name);

        AppConfig config = m_baseConfig;
        config.preset = presets[i];
        const QString summary = QString::fromStdString(config.effectiveParameters().summary());

        qInfo() << "ParameterSweep:" << QString("[%1/%2]").arg(entry.index).arg(total)
                << entry.name << summary;
        emit runStarted(entry.index, total, entry.name, summary);

        try {
            entry.keyframeCount = runExtraction(config, videoPath, entry.outputDir);
        } catch (const KeyframeError& e) {
            entry.keyframeCount = -1;
            entry.error = QString::fromStdString(e.what());
            qWarning() << "ParameterSweep:" << entry.name << "failed:" << entry.error;
        } catch (const std::exception& e) {
            entry.keyframeCount = -1;
            entry.error = QString("Unexpected error: %1").arg(QString::fromStdString(e.what()));
            qWarning() << "ParameterSweep:" << entry.name << "failed:" << entry.error;
        }

        emit runFinished(entry);
        entries.push_back(entry);
    }

    return entries;
}

int ParameterSweep::runExtraction(const AppConfig& config, const QString& videoPath, const QString& outputDir)
{
    // Each run owns its runner and therefore its decoder handles
    ExtractionRunner runner(config);
    connect(&runner, &ExtractionRunner::progressMessage, this, &ParameterSweep::progressMessage);

    return runner.run(videoPath, outputDir).keyframeCount;
}

std::vector<SweepEntry> ParameterSweep::sortedSummary(const std::vector<SweepEntry>& entries)
{
    std::vector<SweepEntry> sorted = entries;
    std::stable_sort(sorted.begin(), sorted.end(), [](const SweepEntry& a, const SweepEntry& b) {
        if (a.succeeded() != b.succeeded()) {
            return a.succeeded();
        }
        return a.keyframeCount > b.keyframeCount;
    });
    return sorted;
}
