#include "boundarydetector.h"
#include "framemetric.h"
#include "videodecoder.h"
#include <QDebug>
#include <algorithm>
#include <cctype>

ContentSceneDetector::ContentSceneDetector(double threshold, int minSceneLen)
    : m_threshold(threshold),
      m_minSceneLen(std::max(1, minSceneLen)),
      m_framesInScene(0),
      m_sceneStart(0.0),
      m_lastTimestamp(0.0)
{
}

double ContentSceneDetector::contentDelta(const cv::Mat& hsvA, const cv::Mat& hsvB)
{
    if (hsvA.empty() || hsvB.empty() || hsvA.size() != hsvB.size() || hsvA.type() != hsvB.type()) {
        return 0.0;
    }

    cv::Mat diff;
    cv::absdiff(hsvA, hsvB, diff);
    cv::Scalar channelMeans = cv::mean(diff);

    return (channelMeans[0] + channelMeans[1] + channelMeans[2]) / 3.0;
}

void ContentSceneDetector::processFrame(const cv::Mat& frame, double timestamp)
{
    if (frame.empty() || frame.channels() != 3) {
        return;
    }

    cv::Mat hsv;
    cv::cvtColor(BoundaryDetector::downscale(frame, ANALYSIS_WIDTH), hsv, cv::COLOR_BGR2HSV);

    if (m_previousHsv.empty()) {
        m_sceneStart = timestamp;
    } else if (contentDelta(m_previousHsv, hsv) >= m_threshold && m_framesInScene >= m_minSceneLen) {
        m_intervals.emplace_back(m_sceneStart, timestamp);
        m_sceneStart = timestamp;
        m_framesInScene = 0;
    }

    m_previousHsv = hsv;
    m_framesInScene++;
    m_lastTimestamp = timestamp;
}

std::vector<TimeInterval> ContentSceneDetector::finish(double endTime)
{
    if (!m_previousHsv.empty()) {
        m_intervals.emplace_back(m_sceneStart, std::max(endTime, m_lastTimestamp));
        m_previousHsv.release();
    }

    std::vector<TimeInterval> intervals;
    intervals.swap(m_intervals);
    return intervals;
}

SimilarityPageDetector::SimilarityPageDetector(double pageSimilarity, int minPageLen)
    : m_pageSimilarity(pageSimilarity),
      m_minPageLen(std::max(1, minPageLen)),
      m_samplesInPage(0),
      m_pageStart(0.0),
      m_lastTimestamp(0.0)
{
}

void SimilarityPageDetector::processFrame(const cv::Mat& frame, double timestamp)
{
    if (frame.empty()) {
        return;
    }

    cv::Mat gray = FrameMetric::toGrayscale(BoundaryDetector::downscale(frame, ANALYSIS_WIDTH));
    if (gray.empty()) {
        return;
    }

    if (m_pageReference.empty()) {
        m_pageReference = gray;
        m_pageStart = timestamp;
    } else if (FrameMetric::globalSimilarity(m_pageReference, gray) < m_pageSimilarity
               && m_samplesInPage >= m_minPageLen) {
        m_intervals.emplace_back(m_pageStart, timestamp);
        m_pageReference = gray;
        m_pageStart = timestamp;
        m_samplesInPage = 0;
    }

    m_samplesInPage++;
    m_lastTimestamp = timestamp;
}

std::vector<TimeInterval> SimilarityPageDetector::finish(double endTime)
{
    if (!m_pageReference.empty()) {
        m_intervals.emplace_back(m_pageStart, std::max(endTime, m_lastTimestamp));
        m_pageReference.release();
    }

    std::vector<TimeInterval> intervals;
    intervals.swap(m_intervals);
    return intervals;
}

BoundaryDetector::BoundaryDetector(DetectorBackend backend, double pageSimilarity)
    : m_backend(backend),
      m_pageSimilarity(pageSimilarity)
{
}

cv::Mat BoundaryDetector::downscale(const cv::Mat& frame, int targetWidth)
{
    if (frame.empty() || frame.cols <= targetWidth) {
        return frame;
    }

    int targetHeight = std::max(1, frame.rows * targetWidth / frame.cols);
    cv::Mat resized;
    cv::resize(frame, resized, cv::Size(targetWidth, targetHeight), 0, 0, cv::INTER_AREA);
    return resized;
}

std::vector<TimeInterval> BoundaryDetector::detect(VideoDecoder& decoder,
                                                   double sensitivity,
                                                   int minSceneLen,
                                                   const CropRegion& crop)
{
    m_lastError.clear();

    if (!decoder.isOpen()) {
        m_lastError = "Video not opened";
        return std::vector<TimeInterval>();
    }

    const double duration = decoder.getVideoInfo().duration;
    std::vector<TimeInterval> intervals;
    int decoded = -1;

    switch (m_backend) {
        case DetectorBackend::SimilarityPaging: {
            SimilarityPageDetector pager(m_pageSimilarity, minSceneLen);
            decoded = decoder.decodeFrames(
                [&pager, &crop](const cv::Mat& mat, double timestamp, int) {
                    pager.processFrame(crop.apply(mat), timestamp);
                    return true;
                },
                nullptr,
                SimilarityPageDetector::SAMPLE_INTERVAL);
            intervals = pager.finish(duration);
            break;
        }
        case DetectorBackend::SceneContent:
        default: {
            ContentSceneDetector scenes(sensitivity, minSceneLen);
            decoded = decoder.decodeFrames(
                [&scenes, &crop](const cv::Mat& mat, double timestamp, int) {
                    scenes.processFrame(crop.apply(mat), timestamp);
                    return true;
                });
            intervals = scenes.finish(duration);
            break;
        }
    }

    if (decoded < 0) {
        m_lastError = decoder.getLastError();
        qWarning() << "BoundaryDetector: Detection failed:" << QString::fromStdString(m_lastError);
        return std::vector<TimeInterval>();
    }

    qDebug() << "BoundaryDetector:" << QString::fromStdString(backendName(m_backend))
             << "analysed" << decoded << "frames," << intervals.size() << "intervals";

    return intervals;
}

std::string BoundaryDetector::backendName(DetectorBackend backend)
{
    switch (backend) {
        case DetectorBackend::SceneContent:
            return "scenedetect";
        case DetectorBackend::SimilarityPaging:
            return "evp";
        default:
            return "scenedetect";
    }
}

DetectorBackend BoundaryDetector::backendFromName(const std::string& name, bool* ok)
{
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ok) *ok = true;
    if (key == "scenedetect" || key == "content") {
        return DetectorBackend::SceneContent;
    }
    if (key == "evp" || key == "similarity") {
        return DetectorBackend::SimilarityPaging;
    }

    if (ok) *ok = false;
    return DetectorBackend::SceneContent;
}
