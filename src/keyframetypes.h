#ifndef KEYFRAMETYPES_H
#define KEYFRAMETYPES_H

#include <vector>
#include <opencv2/opencv.hpp>

/**
 * Content-change interval reported by a scene-boundary detector (seconds)
 */
struct TimeInterval {
    double start;
    double end;

    TimeInterval() : start(0.0), end(0.0) {}
    TimeInterval(double s, double e) : start(s), end(e) {}
};

/**
 * Optional time window restricting candidate timestamps.
 * A negative bound means the window is open on that side.
 */
struct TimeWindow {
    double start = -1.0;
    double end = -1.0;

    bool hasStart() const { return start >= 0.0; }
    bool hasEnd() const { return end >= 0.0; }

    bool contains(double timestamp) const
    {
        if (hasStart() && timestamp < start) return false;
        if (hasEnd() && timestamp > end) return false;
        return true;
    }
};

/**
 * How a detector interval is mapped to a single candidate timestamp
 */
enum class RepresentativePolicy {
    Midpoint,       // (start + end) / 2, for tightly isolated scenes
    IntervalStart   // start of interval, for static slides without narrator motion
};

/**
 * Non-fatal conditions reported through the diagnostic channel
 */
enum class DiagnosticKind {
    DegradedDetection,  // no usable candidate survived; single fallback candidate used
    UnreadableFrame,    // frame sampling failed for one timestamp
    Cancelled           // run aborted at a cancellation point
};

/**
 * A candidate timestamp paired with its freshly sampled frame
 */
struct Keyframe {
    double timestamp = 0.0;
    cv::Mat frame;           // empty when the sample failed
    bool synthetic = false;  // inserted by gap filling

    Keyframe() = default;
    Keyframe(double ts, const cv::Mat& mat, bool isSynthetic = false)
        : timestamp(ts), frame(mat), synthetic(isSynthetic) {}
};

// Tolerance for timestamp equality (1 ms)
constexpr double TIMESTAMP_EPSILON = 0.001;

#endif // KEYFRAMETYPES_H
