#ifndef VIDEODECODER_H
#define VIDEODECODER_H

#include <string>
#include <functional>
#include <atomic>
#include <opencv2/opencv.hpp>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

/**
 * Video decoder using FFmpeg C API.
 *
 * Holds seek/position state: one instance serves one caller at a time.
 * Every returned cv::Mat owns its pixels (BGR, 8-bit, 3 channels).
 */
class VideoDecoder
{
public:
    /**
     * Video information structure
     */
    struct VideoInfo {
        double duration = 0.0;          // Duration in seconds
        double frameRate = 0.0;         // Frame rate
        int width = 0;                  // Video width
        int height = 0;                 // Video height
        std::string codecName;          // Codec name
    };

    /**
     * Progress callback function type
     * Parameters: current_time_seconds, total_duration_seconds, progress_percentage
     */
    using ProgressCallback = std::function<void(double, double, double)>;

    /**
     * Frame callback function type
     * Parameters: frame_mat, timestamp_seconds, frame_number
     * Returns false to stop decoding
     */
    using FrameCallback = std::function<bool(const cv::Mat&, double, int)>;

    VideoDecoder();
    ~VideoDecoder();

    VideoDecoder(const VideoDecoder&) = delete;
    VideoDecoder& operator=(const VideoDecoder&) = delete;

    /**
     * Open video file and read its properties
     * @param videoPath Path to video file
     * @return true if successful
     */
    bool openVideo(const std::string& videoPath);

    /**
     * Whether a video is currently open
     */
    bool isOpen() const { return m_formatContext != nullptr && m_codecContext != nullptr; }

    /**
     * Get video information
     * @return VideoInfo structure with video properties
     */
    const VideoInfo& getVideoInfo() const { return m_videoInfo; }

    /**
     * Decode the frame displayed at a timestamp.
     * Seeks backward to the nearest key frame and decodes forward to the first
     * frame at or after the timestamp; beyond the last frame the last decoded
     * frame is returned.
     * @param timestamp Timestamp in seconds from the start of the video
     * @param mat Output frame
     * @return true if a frame was decoded
     */
    bool decodeFrameAt(double timestamp, cv::Mat& mat);

    /**
     * Decode the whole stream sequentially, delivering one frame per interval
     * @param frameCallback Callback function called for each delivered frame
     * @param progressCallback Optional progress callback
     * @param intervalSeconds Interval between delivered frames, 0 delivers every frame
     * @return Number of frames delivered, -1 on error or cancellation
     */
    int decodeFrames(const FrameCallback& frameCallback,
                     const ProgressCallback& progressCallback = nullptr,
                     double intervalSeconds = 0.0);

    /**
     * Close video and cleanup resources
     */
    void close();

    /**
     * Request cancellation of current operation
     * This will interrupt FFmpeg operations like av_read_frame
     */
    void requestCancellation();

    /**
     * Reset cancellation flag
     */
    void resetCancellation();

    /**
     * Get error message from last operation
     * @return Error message string
     */
    const std::string& getLastError() const { return m_lastError; }

private:
    /**
     * Seek to the key frame at or before a timestamp and flush the decoder
     * @param timestamp Timestamp in seconds
     * @return true if successful
     */
    bool seekToTimestamp(double timestamp);

    /**
     * Presentation time of a decoded frame in seconds from the stream start
     */
    double frameTimestamp(const AVFrame* frame) const;

    /**
     * Convert AVFrame to an owning BGR OpenCV Mat
     * @param frame AVFrame to convert
     * @param mat Output OpenCV Mat
     * @return true if successful
     */
    bool convertFrameToMat(const AVFrame* frame, cv::Mat& mat);

    // FFmpeg context objects
    AVFormatContext* m_formatContext;
    AVCodecContext* m_codecContext;
    const AVCodec* m_codec;
    SwsContext* m_swsContext;
    AVFrame* m_frame;
    AVFrame* m_previousFrame;
    AVPacket* m_packet;

    // Video stream info
    int m_videoStreamIndex;
    AVRational m_timeBase;
    int64_t m_streamStartTime;
    VideoInfo m_videoInfo;

    // Error handling
    std::string m_lastError;

    // Cancellation support
    std::atomic<bool> m_shouldCancel;

    // FFmpeg interrupt callback
    static int interruptCallback(void* ctx);
};

#endif // VIDEODECODER_H
