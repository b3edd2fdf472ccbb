#ifndef FRAMESAMPLER_H
#define FRAMESAMPLER_H

#include <opencv2/opencv.hpp>

/**
 * Source of decoded frames at arbitrary timestamps.
 *
 * Implementations keep decoder seek state, so one sampler must not be shared
 * by concurrent pipeline runs.
 */
class FrameSampler
{
public:
    virtual ~FrameSampler() = default;

    /**
     * Decode the frame shown at a timestamp
     * @param timestamp Timestamp in seconds
     * @return Freshly allocated frame, empty on failure (never throws for decode errors)
     */
    virtual cv::Mat sampleAt(double timestamp) = 0;
};

#endif // FRAMESAMPLER_H
