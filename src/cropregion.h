#ifndef CROPREGION_H
#define CROPREGION_H

#include <string>
#include <opencv2/opencv.hpp>

/**
 * Slide area of a recording as fractions of the frame size
 */
struct CropRegion {
    double left = 0.0;
    double top = 0.0;
    double width = 1.0;
    double height = 1.0;

    /**
     * Whether the region covers the whole frame
     */
    bool isFullFrame() const;

    /**
     * Pixel rectangle of the region inside a frame of the given size
     */
    cv::Rect toRect(const cv::Size& frameSize) const;

    /**
     * Apply the region to a frame
     * @return Owning copy of the region, or the frame itself for a full-frame region
     */
    cv::Mat apply(const cv::Mat& frame) const;

    /**
     * Parse "left,top,width,height" with every value in [0, 1]
     * @throws InvalidParameters for malformed or out-of-range input
     */
    static CropRegion parse(const std::string& text);

    /**
     * Format as "left,top,width,height"
     */
    std::string toString() const;
};

#endif // CROPREGION_H
