#include <QGuiApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include <exception>
#include <memory>
#include "configmanager.h"
#include "extractionrunner.h"
#include "keyframeerrors.h"
#include "parametersweep.h"

namespace {

double doubleOption(const QCommandLineParser& parser, const QCommandLineOption& option)
{
    bool ok = false;
    double value = parser.value(option).toDouble(&ok);
    if (!ok) {
        throw InvalidParameters("--" + option.names().last().toStdString()
                                + " expects a number, got " + parser.value(option).toStdString());
    }
    return value;
}

int intOption(const QCommandLineParser& parser, const QCommandLineOption& option)
{
    bool ok = false;
    int value = parser.value(option).toInt(&ok);
    if (!ok) {
        throw InvalidParameters("--" + option.names().last().toStdString()
                                + " expects an integer, got " + parser.value(option).toStdString());
    }
    return value;
}

}

int main(int argc, char *argv[])
{
    // PDF output needs a GUI application but never a display
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("SlideKeyframes");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("SlideKeyframes");

    QCommandLineParser parser;
    parser.setApplicationDescription("Extract the slide keyframes of a recorded presentation");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("video", "Video file to process");

    QCommandLineOption configOption("config", "Settings file (INI).", "file");
    QCommandLineOption saveConfigOption("save-config", "Store the effective settings in the settings file.");
    QCommandLineOption outputOption(QStringList() << "o" << "output", "Output directory.", "dir");
    QCommandLineOption presetOption("preset", "Parameter preset (Default, Sensitive, Medium, LowFilter, "
                                    "Conservative, VerySensitive, FillAggressive, NoFill).", "name");
    QCommandLineOption backendOption("backend", "Boundary detector: scenedetect or evp.", "name");
    QCommandLineOption policyOption("policy", "Representative timestamp: midpoint or start.", "name");
    QCommandLineOption thresholdOption("threshold", "Boundary sensitivity.", "value");
    QCommandLineOption minSceneOption("min-scene-len", "Minimum scene length in frames.", "frames");
    QCommandLineOption staticOption("static-threshold", "Sharpness cutoff for noise frames, 0 disables.", "value");
    QCommandLineOption duplicateOption("duplicate-threshold", "Dissimilarity cutoff for repeated frames, 0 disables.", "value");
    QCommandLineOption minGapOption("min-gap", "Minimum seconds between keyframes.", "seconds");
    QCommandLineOption maxGapOption("max-gap", "Gap that triggers filling, 0 disables.", "seconds");
    QCommandLineOption fillOption("fill-interval", "Seconds between filled keyframes.", "seconds");
    QCommandLineOption similarityOption("similarity", "Page similarity of the evp detector.", "value");
    QCommandLineOption startOption("start", "Start time HH:MM:SS.", "time");
    QCommandLineOption endOption("end", "End time HH:MM:SS.", "time");
    QCommandLineOption cropOption("crop", "Slide area left,top,width,height as fractions.", "region");
    QCommandLineOption fullScreenOption("full-screen", "Also write the uncropped frames.");
    QCommandLineOption noImagesOption("no-images", "Do not write page images.");
    QCommandLineOption noPdfOption("no-pdf", "Do not write PDF documents.");
    QCommandLineOption sweepOption("sweep", "Run every parameter preset into its own directory.");

    parser.addOptions({configOption, saveConfigOption, outputOption, presetOption, backendOption,
                       policyOption, thresholdOption, minSceneOption, staticOption, duplicateOption,
                       minGapOption, maxGapOption, fillOption, similarityOption, startOption,
                       endOption, cropOption, fullScreenOption, noImagesOption, noPdfOption,
                       sweepOption});
    parser.process(app);

    QTextStream err(stderr);
    QTextStream out(stdout);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        err << "Expected exactly one video file\n";
        parser.showHelp(1);
    }
    const QString videoPath = positional.first();

    std::unique_ptr<ConfigManager> configManager;
    if (parser.isSet(configOption)) {
        configManager.reset(new ConfigManager(parser.value(configOption)));
    } else {
        configManager.reset(new ConfigManager());
    }

    try {
        AppConfig config = configManager->loadConfig();

        if (parser.isSet(outputOption)) config.outputDirectory = parser.value(outputOption);
        if (parser.isSet(presetOption)) {
            bool ok = false;
            config.preset = FilterParameters::presetFromName(parser.value(presetOption).toStdString(), &ok);
            if (!ok) {
                throw InvalidParameters("unknown preset " + parser.value(presetOption).toStdString());
            }
        }
        if (parser.isSet(backendOption)) {
            bool ok = false;
            config.detectorBackend = BoundaryDetector::backendFromName(parser.value(backendOption).toStdString(), &ok);
            if (!ok) {
                throw InvalidParameters("unknown detector backend " + parser.value(backendOption).toStdString());
            }
        }
        if (parser.isSet(policyOption)) {
            bool ok = false;
            config.representativePolicy = ConfigManager::getPolicyFromName(parser.value(policyOption), &ok);
            if (!ok) {
                throw InvalidParameters("unknown representative policy " + parser.value(policyOption).toStdString());
            }
        }

        // Any individual parameter switches to a custom set seeded from the preset
        const QList<QCommandLineOption> parameterOptions = {thresholdOption, minSceneOption, staticOption,
                                                            duplicateOption, minGapOption, maxGapOption, fillOption};
        bool customParameters = false;
        for (const QCommandLineOption& option : parameterOptions) {
            customParameters = customParameters || parser.isSet(option);
        }
        if (customParameters) {
            FilterParameters params = config.effectiveParameters();
            if (parser.isSet(thresholdOption)) params.boundarySensitivity = doubleOption(parser, thresholdOption);
            if (parser.isSet(minSceneOption)) params.minBoundaryGapFrames = intOption(parser, minSceneOption);
            if (parser.isSet(staticOption)) params.staticThreshold = doubleOption(parser, staticOption);
            if (parser.isSet(duplicateOption)) params.duplicateThreshold = doubleOption(parser, duplicateOption);
            if (parser.isSet(minGapOption)) params.minTimeGap = doubleOption(parser, minGapOption);
            if (parser.isSet(maxGapOption)) params.maxTimeGap = doubleOption(parser, maxGapOption);
            if (parser.isSet(fillOption)) params.fillInterval = doubleOption(parser, fillOption);
            config.preset = ParameterPreset::Custom;
            config.customParameters = params;
        }

        if (parser.isSet(similarityOption)) config.pageSimilarity = doubleOption(parser, similarityOption);
        if (parser.isSet(startOption)) config.startTime = parser.value(startOption);
        if (parser.isSet(endOption)) config.endTime = parser.value(endOption);
        if (parser.isSet(cropOption)) config.crop = parser.value(cropOption);
        if (parser.isSet(fullScreenOption)) config.outputFullScreen = true;
        if (parser.isSet(noImagesOption)) config.extractImages = false;
        if (parser.isSet(noPdfOption)) config.writePdf = false;

        if (parser.isSet(saveConfigOption)) {
            configManager->saveConfig(config);
            qInfo() << "Settings saved to" << configManager->fileName();
        }

        if (!QFileInfo::exists(videoPath)) {
            throw KeyframeError("Video file not found: " + videoPath.toStdString());
        }

        if (parser.isSet(sweepOption)) {
            ParameterSweep sweep(config);
            QObject::connect(&sweep, &ParameterSweep::progressMessage,
                             [&out](const QString& message) { out << "   " << message << Qt::endl; });

            std::vector<SweepEntry> entries = sweep.run(videoPath, config.outputDirectory);

            out << "Summary (sorted by keyframe count)" << Qt::endl;
            for (const SweepEntry& entry : ParameterSweep::sortedSummary(entries)) {
                if (entry.succeeded()) {
                    out << "  " << entry.name << ": " << entry.keyframeCount << " keyframes -> "
                        << entry.outputDir << Qt::endl;
                } else {
                    out << "  " << entry.name << ": failed -> " << entry.error << Qt::endl;
                }
            }
            out << "All results: " << QDir(config.outputDirectory).absolutePath() << Qt::endl;
            return 0;
        }

        ExtractionRunner runner(config);
        QObject::connect(&runner, &ExtractionRunner::progressMessage,
                         [&out](const QString& message) { out << message << Qt::endl; });
        QObject::connect(&runner, &ExtractionRunner::diagnosticReported,
                         [&err](DiagnosticKind, const QString& message) { err << "warning: " << message << Qt::endl; });

        ExtractionResult result = runner.run(videoPath, config.outputDirectory);

        out << result.keyframeCount << " keyframes";
        if (result.degradedDetection) {
            out << " (no scene change detected)";
        }
        out << Qt::endl;
        for (auto it = result.artifacts.constBegin(); it != result.artifacts.constEnd(); ++it) {
            out << "  " << it.key() << ": " << it.value() << Qt::endl;
        }
    } catch (const KeyframeError& e) {
        err << "error: " << e.what() << Qt::endl;
        return 1;
    } catch (const std::exception& e) {
        err << "error: unexpected failure: " << e.what() << Qt::endl;
        return 1;
    }

    return 0;
}
