#ifndef EXTRACTIONRUNNER_H
#define EXTRACTIONRUNNER_H

#include <atomic>
#include <vector>
#include <QObject>
#include <QMap>
#include <QMutex>
#include <QString>
#include "configmanager.h"
#include "cropregion.h"
#include "keyframeselector.h"

class VideoDecoder;
class VideoFrameSampler;

// Artifact keys of ExtractionResult::artifacts
extern const char* const ARTIFACT_SLIDES_PDF;
extern const char* const ARTIFACT_SLIDES_IMAGES;
extern const char* const ARTIFACT_FULL_PDF;
extern const char* const ARTIFACT_FULL_IMAGES;

struct ExtractionResult {
    std::vector<double> timestamps;       // consolidated keyframe timestamps
    int keyframeCount = 0;
    bool degradedDetection = false;
    int unreadableFrames = 0;
    QMap<QString, QString> artifacts;     // artifact key -> written path
    double processingTimeSeconds = 0.0;
};

/**
 * One complete extraction of a video: boundary detection, keyframe
 * selection and the document outputs.
 *
 * Runs synchronously on the caller's thread; requestCancellation() may be
 * called from any thread.
 */
class ExtractionRunner : public QObject
{
    Q_OBJECT

public:
    explicit ExtractionRunner(const AppConfig& config, QObject *parent = nullptr);

    /**
     * Extract the keyframes of a video and write the enabled outputs
     * @param videoPath Path to video file
     * @param outputDir Directory receiving the outputs
     * @return Keyframe timestamps and the written artifacts
     * @throws InvalidParameters for an invalid configuration
     * @throws KeyframeError when the video cannot be opened or an output cannot be written
     * @throws NoKeyframesFound when no keyframe survives
     * @throws SelectionCancelled after requestCancellation()
     */
    ExtractionResult run(const QString& videoPath, const QString& outputDir);

    /**
     * Write the full-screen PDF and images of a run
     * @param frames Uncropped keyframes, unreadable ones already left out
     * @return false, with a diagnostic and nothing written, when no frame is left
     * @throws KeyframeError when an output cannot be written
     */
    bool writeFullScreenOutputs(const std::vector<cv::Mat>& frames,
                                const QString& outputDir,
                                ExtractionResult& result);

    /**
     * Stop the running extraction at the next cancellation point
     */
    void requestCancellation();

    /**
     * Time window of a configuration
     * @throws InvalidParameters for malformed timecodes or start after end
     */
    static TimeWindow parseWindow(const AppConfig& config);

    /**
     * Crop region of a configuration, full frame when empty
     * @throws InvalidParameters for a malformed region
     */
    static CropRegion parseCrop(const AppConfig& config);

signals:
    void progressMessage(const QString& message);
    void diagnosticReported(DiagnosticKind kind, const QString& message);
    void videoInfoLogged(const QString& info);

private:
    std::vector<TimeInterval> detectBoundaries(VideoDecoder& decoder,
                                               const FilterParameters& params,
                                               const CropRegion& crop);

    /**
     * Decode the consolidated timestamps again from the uncropped view
     */
    std::vector<cv::Mat> sampleFullScreen(const QString& videoPath,
                                          const std::vector<double>& timestamps);

    void writeOutputs(const std::vector<cv::Mat>& frames,
                      const QString& outputDir,
                      const QString& pdfName,
                      const QString& imagesName,
                      const QString& pdfKey,
                      const QString& imagesKey,
                      ExtractionResult& result);

    void setCurrentDecoder(VideoDecoder* decoder);
    void throwIfCancelled() const;

    AppConfig m_config;
    KeyframeSelector m_selector;
    std::atomic<bool> m_cancelRequested;

    // Current decoder for cancellation support
    VideoDecoder* m_currentDecoder;
    QMutex m_decoderMutex;
};

#endif // EXTRACTIONRUNNER_H
