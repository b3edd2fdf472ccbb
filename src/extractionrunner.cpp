#include "extractionrunner.h"
#include "boundarydetector.h"
#include "documentassembler.h"
#include "keyframeerrors.h"
#include "timecode.h"
#include "videodecoder.h"
#include "videoframesampler.h"
#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QMutexLocker>

const char* const ARTIFACT_SLIDES_PDF = "slides_pdf";
const char* const ARTIFACT_SLIDES_IMAGES = "slides_images";
const char* const ARTIFACT_FULL_PDF = "full_pdf";
const char* const ARTIFACT_FULL_IMAGES = "full_images";

ExtractionRunner::ExtractionRunner(const AppConfig& config, QObject *parent)
    : QObject(parent),
      m_config(config),
      m_cancelRequested(false),
      m_currentDecoder(nullptr)
{
    connect(&m_selector, &KeyframeSelector::progressMessage,
            this, &ExtractionRunner::progressMessage);
    connect(&m_selector, &KeyframeSelector::diagnosticReported,
            this, &ExtractionRunner::diagnosticReported);
}

void ExtractionRunner::requestCancellation()
{
    m_cancelRequested = true;
    m_selector.requestCancellation();

    QMutexLocker locker(&m_decoderMutex);
    if (m_currentDecoder) {
        m_currentDecoder->requestCancellation();
    }
}

void ExtractionRunner::setCurrentDecoder(VideoDecoder* decoder)
{
    QMutexLocker locker(&m_decoderMutex);
    m_currentDecoder = decoder;
}

void ExtractionRunner::throwIfCancelled() const
{
    if (m_cancelRequested) {
        throw SelectionCancelled();
    }
}

TimeWindow ExtractionRunner::parseWindow(const AppConfig& config)
{
    TimeWindow window;
    window.start = Timecode::parse(config.startTime.toStdString());
    window.end = Timecode::parse(config.endTime.toStdString());

    if (window.hasStart() && window.hasEnd() && window.start > window.end) {
        throw InvalidParameters("start time " + config.startTime.toStdString()
                                + " is after end time " + config.endTime.toStdString());
    }

    return window;
}

CropRegion ExtractionRunner::parseCrop(const AppConfig& config)
{
    if (config.crop.trimmed().isEmpty()) {
        return CropRegion();
    }
    return CropRegion::parse(config.crop.toStdString());
}

ExtractionResult ExtractionRunner::run(const QString& videoPath, const QString& outputDir)
{
    ExtractionResult result;
    QElapsedTimer timer;
    timer.start();

    m_cancelRequested = false;
    m_selector.resetCancellation();

    // Validate the whole configuration before opening the video
    const FilterParameters params = m_config.effectiveParameters();
    params.validate();
    const TimeWindow window = parseWindow(m_config);
    const CropRegion crop = parseCrop(m_config);

    qInfo() << "ExtractionRunner: Processing" << videoPath
            << "preset:" << ConfigManager::getPresetName(m_config.preset)
            << "params:" << QString::fromStdString(params.summary());

    VideoFrameSampler sampler(crop);
    if (!sampler.open(videoPath.toStdString())) {
        throw KeyframeError("Failed to open video " + videoPath.toStdString() + ": "
                            + sampler.decoder().getLastError());
    }

    const VideoDecoder::VideoInfo& info = sampler.decoder().getVideoInfo();
    QString infoText = QString("%1x%2, %3 fps, %4 s, codec %5")
                       .arg(info.width).arg(info.height)
                       .arg(info.frameRate, 0, 'f', 2)
                       .arg(info.duration, 0, 'f', 2)
                       .arg(QString::fromStdString(info.codecName));
    qInfo() << "ExtractionRunner: Video info:" << infoText;
    emit videoInfoLogged(infoText);

    // Step 1: boundary detection on the slide area
    std::vector<TimeInterval> intervals = detectBoundaries(sampler.decoder(), params, crop);
    throwIfCancelled();

    // Step 2: keyframe selection
    SelectionOptions options;
    options.policy = m_config.representativePolicy;
    options.window = window;
    options.videoDuration = info.duration > 0.0 ? info.duration : -1.0;

    setCurrentDecoder(&sampler.decoder());
    KeyframeSelection selection;
    try {
        selection = m_selector.select(intervals, sampler, params, options);
    } catch (...) {
        setCurrentDecoder(nullptr);
        throw;
    }
    setCurrentDecoder(nullptr);

    result.timestamps = selection.timestamps;
    result.keyframeCount = static_cast<int>(selection.keyframes.size());
    result.degradedDetection = selection.degradedDetection;
    result.unreadableFrames = selection.unreadableFrames;

    // Step 3: outputs
    if (m_config.outputSlidesOnly) {
        std::vector<cv::Mat> frames;
        frames.reserve(selection.keyframes.size());
        for (const Keyframe& keyframe : selection.keyframes) {
            frames.push_back(keyframe.frame);
        }
        writeOutputs(frames, outputDir, "slides_ppt_only.pdf", "images_ppt_only",
                     ARTIFACT_SLIDES_PDF, ARTIFACT_SLIDES_IMAGES, result);
    }

    if (m_config.outputFullScreen) {
        std::vector<cv::Mat> frames;
        if (crop.isFullFrame()) {
            for (const Keyframe& keyframe : selection.keyframes) {
                frames.push_back(keyframe.frame);
            }
        } else {
            frames = sampleFullScreen(videoPath, selection.timestamps);
        }
        writeFullScreenOutputs(frames, outputDir, result);
    }

    result.processingTimeSeconds = timer.elapsed() / 1000.0;
    qInfo() << "ExtractionRunner: Extracted" << result.keyframeCount << "keyframes in"
            << result.processingTimeSeconds << "s";

    return result;
}

std::vector<TimeInterval> ExtractionRunner::detectBoundaries(VideoDecoder& decoder,
                                                             const FilterParameters& params,
                                                             const CropRegion& crop)
{
    BoundaryDetector detector(m_config.detectorBackend, m_config.pageSimilarity);
    emit progressMessage(QString("Detecting scene boundaries (%1)")
                         .arg(ConfigManager::getBackendName(detector.backend())));

    setCurrentDecoder(&decoder);
    std::vector<TimeInterval> intervals = detector.detect(decoder, params.boundarySensitivity,
                                                          params.minBoundaryGapFrames, crop);
    setCurrentDecoder(nullptr);

    if (intervals.empty() && !detector.getLastError().empty() && !m_cancelRequested) {
        // A failed detector run degrades to the fallback keyframe
        qWarning() << "ExtractionRunner: Boundary detection failed:"
                   << QString::fromStdString(detector.getLastError());
    }

    return intervals;
}

std::vector<cv::Mat> ExtractionRunner::sampleFullScreen(const QString& videoPath,
                                                        const std::vector<double>& timestamps)
{
    std::vector<cv::Mat> frames;

    VideoFrameSampler fullSampler;
    if (!fullSampler.open(videoPath.toStdString())) {
        throw KeyframeError("Failed to open video for the full-screen pass: "
                            + fullSampler.decoder().getLastError());
    }

    setCurrentDecoder(&fullSampler.decoder());
    for (double timestamp : timestamps) {
        if (m_cancelRequested) {
            setCurrentDecoder(nullptr);
            throw SelectionCancelled();
        }

        cv::Mat frame = fullSampler.sampleAt(timestamp);
        if (frame.empty()) {
            emit diagnosticReported(DiagnosticKind::UnreadableFrame,
                                    QString("Could not decode full-screen frame at %1s")
                                    .arg(timestamp, 0, 'f', 3));
            continue;
        }
        frames.push_back(frame);
    }
    setCurrentDecoder(nullptr);

    return frames;
}

bool ExtractionRunner::writeFullScreenOutputs(const std::vector<cv::Mat>& frames,
                                              const QString& outputDir,
                                              ExtractionResult& result)
{
    if (frames.empty()) {
        qWarning() << "ExtractionRunner: No full-screen frame could be decoded, skipping full-screen outputs";
        emit diagnosticReported(DiagnosticKind::UnreadableFrame,
                                "No full-screen frame could be decoded, full-screen outputs skipped");
        return false;
    }

    writeOutputs(frames, outputDir, "slides_full.pdf", "images_full",
                 ARTIFACT_FULL_PDF, ARTIFACT_FULL_IMAGES, result);
    return true;
}

void ExtractionRunner::writeOutputs(const std::vector<cv::Mat>& frames,
                                    const QString& outputDir,
                                    const QString& pdfName,
                                    const QString& imagesName,
                                    const QString& pdfKey,
                                    const QString& imagesKey,
                                    ExtractionResult& result)
{
    QDir dir(outputDir);
    if (!dir.mkpath(".")) {
        throw KeyframeError("Failed to create output directory " + outputDir.toStdString());
    }

    if (m_config.writePdf) {
        QString pdfPath = dir.filePath(pdfName);
        if (!DocumentAssembler::writePdf(frames, pdfPath)) {
            throw KeyframeError("Failed to write " + pdfPath.toStdString());
        }
        result.artifacts.insert(pdfKey, pdfPath);
    }

    if (m_config.extractImages) {
        QString imagesPath = dir.filePath(imagesName);
        if (DocumentAssembler::writeImages(frames, imagesPath) < 0) {
            throw KeyframeError("Failed to write images to " + imagesPath.toStdString());
        }
        result.artifacts.insert(imagesKey, imagesPath);
    }
}
