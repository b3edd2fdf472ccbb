#ifndef BOUNDARYDETECTOR_H
#define BOUNDARYDETECTOR_H

#include <string>
#include <vector>
#include <opencv2/opencv.hpp>
#include "keyframetypes.h"
#include "cropregion.h"

class VideoDecoder;

/**
 * Scene-boundary detection backend, selected at construction
 */
enum class DetectorBackend {
    SceneContent,       // HSV content change between consecutive frames
    SimilarityPaging    // SSIM page turning on one frame per second
};

/**
 * Content-change detector: a cut when the mean HSV channel delta between
 * consecutive frames exceeds the threshold and the current scene already
 * spans at least minSceneLen frames.
 */
class ContentSceneDetector
{
public:
    ContentSceneDetector(double threshold, int minSceneLen);

    void processFrame(const cv::Mat& frame, double timestamp);
    std::vector<TimeInterval> finish(double endTime);

    /**
     * Mean absolute difference of the H, S and V channels, averaged
     */
    static double contentDelta(const cv::Mat& hsvA, const cv::Mat& hsvB);

    static constexpr int ANALYSIS_WIDTH = 320;

private:
    double m_threshold;
    int m_minSceneLen;
    cv::Mat m_previousHsv;
    int m_framesInScene;
    double m_sceneStart;
    double m_lastTimestamp;
    std::vector<TimeInterval> m_intervals;
};

/**
 * Page-turn detector: frames sampled once per second are compared with the
 * first frame of the current page; a new page starts when the similarity
 * drops below the page similarity and the page spans minPageLen samples.
 */
class SimilarityPageDetector
{
public:
    SimilarityPageDetector(double pageSimilarity, int minPageLen);

    void processFrame(const cv::Mat& frame, double timestamp);
    std::vector<TimeInterval> finish(double endTime);

    static constexpr double SAMPLE_INTERVAL = 1.0;
    static constexpr int ANALYSIS_WIDTH = 480;

private:
    double m_pageSimilarity;
    int m_minPageLen;
    cv::Mat m_pageReference;
    int m_samplesInPage;
    double m_pageStart;
    double m_lastTimestamp;
    std::vector<TimeInterval> m_intervals;
};

/**
 * Tagged scene-boundary detector over a decoded video
 */
class BoundaryDetector
{
public:
    explicit BoundaryDetector(DetectorBackend backend, double pageSimilarity = 0.45);

    DetectorBackend backend() const { return m_backend; }

    /**
     * Detect content-change intervals
     * @param decoder Opened decoder of the detection view
     * @param sensitivity Content threshold (SceneContent backend)
     * @param minSceneLen Minimum scene length in analysed frames
     * @param crop Region of each frame analysed
     * @return Intervals covering the decoded stream; empty on decoder failure
     */
    std::vector<TimeInterval> detect(VideoDecoder& decoder,
                                     double sensitivity,
                                     int minSceneLen,
                                     const CropRegion& crop = CropRegion());

    const std::string& getLastError() const { return m_lastError; }

    static std::string backendName(DetectorBackend backend);
    static DetectorBackend backendFromName(const std::string& name, bool* ok = nullptr);

    /**
     * Downscale a frame to a fixed analysis width, keeping the aspect ratio
     */
    static cv::Mat downscale(const cv::Mat& frame, int targetWidth);

private:
    DetectorBackend m_backend;
    double m_pageSimilarity;
    std::string m_lastError;
};

#endif // BOUNDARYDETECTOR_H
