#include "framemetric.h"

double FrameMetric::sharpness(const cv::Mat& frame)
{
    cv::Mat gray = toGrayscale(frame);
    if (gray.empty()) {
        return 0.0;
    }

    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);

    cv::Scalar mean;
    cv::Scalar stddev;
    cv::meanStdDev(laplacian, mean, stddev);

    return stddev[0] * stddev[0];
}

double FrameMetric::dissimilarity(const cv::Mat& frameA, const cv::Mat& frameB)
{
    cv::Mat gray1 = toGrayscale(frameA);
    cv::Mat gray2 = toGrayscale(frameB);

    if (gray1.empty() || gray2.empty()) {
        return 0.0;
    }

    // Frames decoded at different resolutions are compared at the reference size
    if (gray1.size() != gray2.size()) {
        cv::Mat resized;
        cv::resize(gray2, resized, gray1.size(), 0, 0, cv::INTER_AREA);
        gray2 = resized;
    }

    cv::Mat diff;
    cv::absdiff(gray1, gray2, diff);

    return cv::mean(diff)[0];
}

double FrameMetric::globalSimilarity(const cv::Mat& frameA, const cv::Mat& frameB)
{
    cv::Mat gray1 = toGrayscale(frameA);
    cv::Mat gray2 = toGrayscale(frameB);

    if (gray1.empty() || gray2.empty()) {
        return 0.0;
    }

    if (gray1.size() != gray2.size()) {
        cv::Mat resized;
        cv::resize(gray2, resized, gray1.size(), 0, 0, cv::INTER_AREA);
        gray2 = resized;
    }

    cv::Mat f1;
    cv::Mat f2;
    gray1.convertTo(f1, CV_64F);
    gray2.convertTo(f2, CV_64F);

    double mean1 = cv::mean(f1)[0];
    double mean2 = cv::mean(f2)[0];

    cv::Mat d1 = f1 - mean1;
    cv::Mat d2 = f2 - mean2;

    double var1 = cv::mean(d1.mul(d1))[0];
    double var2 = cv::mean(d2.mul(d2))[0];
    double covariance = cv::mean(d1.mul(d2))[0];

    double numerator = (2 * mean1 * mean2 + C1) * (2 * covariance + C2);
    double denominator = (mean1 * mean1 + mean2 * mean2 + C1) * (var1 + var2 + C2);

    if (denominator == 0.0) {
        return 1.0;
    }

    return numerator / denominator;
}

bool FrameMetric::isStatic(const cv::Mat& frame, double staticThreshold)
{
    if (staticThreshold <= 0.0) {
        return false;
    }
    return sharpness(frame) < staticThreshold;
}

bool FrameMetric::isDuplicate(const cv::Mat& keptFrame, const cv::Mat& frame, double duplicateThreshold)
{
    if (duplicateThreshold <= 0.0) {
        return false;
    }
    return dissimilarity(keptFrame, frame) < duplicateThreshold;
}

cv::Mat FrameMetric::toGrayscale(const cv::Mat& frame)
{
    if (frame.empty()) {
        return cv::Mat();
    }

    cv::Mat source = frame;
    if (frame.depth() != CV_8U) {
        frame.convertTo(source, CV_MAKETYPE(CV_8U, frame.channels()));
    }

    cv::Mat gray;
    switch (source.channels()) {
        case 1:
            gray = source;
            break;
        case 3:
            cv::cvtColor(source, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(source, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            return cv::Mat();
    }

    return gray;
}
