#include "videoframesampler.h"
#include <QDebug>

VideoFrameSampler::VideoFrameSampler(const CropRegion& crop)
    : m_crop(crop),
      m_failedSamples(0)
{
}

bool VideoFrameSampler::open(const std::string& videoPath)
{
    m_failedSamples = 0;
    return m_decoder.openVideo(videoPath);
}

cv::Mat VideoFrameSampler::sampleAt(double timestamp)
{
    cv::Mat frame;
    if (!m_decoder.decodeFrameAt(timestamp, frame)) {
        m_failedSamples++;
        qWarning() << "VideoFrameSampler: Failed to decode frame at" << timestamp << "s:"
                   << QString::fromStdString(m_decoder.getLastError());
        return cv::Mat();
    }

    return m_crop.apply(frame);
}
