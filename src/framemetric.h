#ifndef FRAMEMETRIC_H
#define FRAMEMETRIC_H

#include <opencv2/opencv.hpp>

/**
 * @brief Pure per-frame and frame-pair scores used by the keyframe filters
 *
 * All functions tolerate empty (unreadable) frames and return values that
 * make such frames fail validity checks instead of raising:
 * - sharpness() of an empty frame is 0 (treated as static)
 * - dissimilarity() involving an empty frame is 0 (treated as a repeat)
 */
class FrameMetric
{
public:
    /**
     * @brief Structural detail score of a frame
     * @param frame BGR, BGRA or grayscale image
     * @return Variance of the Laplacian response over the grayscale image (>= 0)
     */
    static double sharpness(const cv::Mat& frame);

    /**
     * @brief Mean absolute per-pixel intensity difference of two frames
     *
     * Both frames are converted to grayscale. When their sizes differ the
     * second frame is resized to the size of the first before comparison.
     *
     * @param frameA Reference frame
     * @param frameB Compared frame
     * @return 0 for pixel-identical frames, up to 255 for inverted ones
     */
    static double dissimilarity(const cv::Mat& frameA, const cv::Mat& frameB);

    /**
     * @brief Global (single window) SSIM of two frames
     * @param frameA Reference frame
     * @param frameB Compared frame
     * @return Similarity in [-1, 1]; 0 when either frame is empty
     */
    static double globalSimilarity(const cv::Mat& frameA, const cv::Mat& frameB);

    /**
     * @brief Whether a frame is too low-detail to represent slide content
     * @param frame Frame to check
     * @param staticThreshold Sharpness cutoff (0 disables the check)
     */
    static bool isStatic(const cv::Mat& frame, double staticThreshold);

    /**
     * @brief Whether a frame repeats a previously kept frame
     * @param keptFrame Last kept frame
     * @param frame Candidate frame
     * @param duplicateThreshold Dissimilarity cutoff (0 disables the check)
     */
    static bool isDuplicate(const cv::Mat& keptFrame, const cv::Mat& frame, double duplicateThreshold);

    /**
     * @brief Convert a frame to 8-bit single channel
     * @return Grayscale frame, empty for empty or unsupported input
     */
    static cv::Mat toGrayscale(const cv::Mat& frame);

private:
    static constexpr double C1 = 6.5025;   // (0.01 * 255)^2
    static constexpr double C2 = 58.5225;  // (0.03 * 255)^2
};

#endif // FRAMEMETRIC_H
