#ifndef VIDEOFRAMESAMPLER_H
#define VIDEOFRAMESAMPLER_H

#include <string>
#include "framesampler.h"
#include "videodecoder.h"
#include "cropregion.h"

/**
 * FrameSampler over an FFmpeg decoder, optionally restricted to a crop region.
 *
 * Detection and the full-screen pass each use their own sampler (and thus
 * their own decoder handle) on the same file.
 */
class VideoFrameSampler : public FrameSampler
{
public:
    explicit VideoFrameSampler(const CropRegion& crop = CropRegion());

    /**
     * Open the video to sample from
     * @param videoPath Path to video file
     * @return true if successful
     */
    bool open(const std::string& videoPath);

    cv::Mat sampleAt(double timestamp) override;

    /**
     * Number of samples that failed to decode
     */
    int failedSamples() const { return m_failedSamples; }

    VideoDecoder& decoder() { return m_decoder; }
    const CropRegion& crop() const { return m_crop; }

private:
    VideoDecoder m_decoder;
    CropRegion m_crop;
    int m_failedSamples;
};

#endif // VIDEOFRAMESAMPLER_H
