#include "videodecoder.h"
#include <algorithm>
#include <cmath>

VideoDecoder::VideoDecoder()
    : m_formatContext(nullptr)
    , m_codecContext(nullptr)
    , m_codec(nullptr)
    , m_swsContext(nullptr)
    , m_frame(nullptr)
    , m_previousFrame(nullptr)
    , m_packet(nullptr)
    , m_videoStreamIndex(-1)
    , m_timeBase{1, 1}
    , m_streamStartTime(0)
    , m_shouldCancel(false)
{
}

VideoDecoder::~VideoDecoder()
{
    close();
}

int VideoDecoder::interruptCallback(void* ctx)
{
    VideoDecoder* decoder = static_cast<VideoDecoder*>(ctx);
    return (decoder && decoder->m_shouldCancel) ? 1 : 0;
}

void VideoDecoder::requestCancellation()
{
    m_shouldCancel = true;
}

void VideoDecoder::resetCancellation()
{
    m_shouldCancel = false;
}

bool VideoDecoder::openVideo(const std::string& videoPath)
{
    close(); // Clean up any previous state

    m_formatContext = avformat_alloc_context();
    if (!m_formatContext) {
        m_lastError = "Could not allocate format context";
        return false;
    }
    m_formatContext->interrupt_callback.callback = &VideoDecoder::interruptCallback;
    m_formatContext->interrupt_callback.opaque = this;

    // Open input file (frees the context on failure)
    if (avformat_open_input(&m_formatContext, videoPath.c_str(), nullptr, nullptr) < 0) {
        m_formatContext = nullptr;
        m_lastError = "Could not open video file: " + videoPath;
        return false;
    }

    // Retrieve stream information
    if (avformat_find_stream_info(m_formatContext, nullptr) < 0) {
        m_lastError = "Could not find stream information";
        close();
        return false;
    }

    m_videoStreamIndex = av_find_best_stream(m_formatContext, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (m_videoStreamIndex < 0) {
        m_lastError = "Could not find video stream";
        close();
        return false;
    }

    AVStream* stream = m_formatContext->streams[m_videoStreamIndex];
    AVCodecParameters* codecParams = stream->codecpar;

    // Find decoder
    m_codec = avcodec_find_decoder(codecParams->codec_id);
    if (!m_codec) {
        m_lastError = "Unsupported codec";
        close();
        return false;
    }

    // Allocate codec context
    m_codecContext = avcodec_alloc_context3(m_codec);
    if (!m_codecContext) {
        m_lastError = "Could not allocate codec context";
        close();
        return false;
    }

    // Copy codec parameters to context
    if (avcodec_parameters_to_context(m_codecContext, codecParams) < 0) {
        m_lastError = "Could not copy codec parameters";
        close();
        return false;
    }

    if (avcodec_open2(m_codecContext, m_codec, nullptr) < 0) {
        m_lastError = "Could not open codec";
        close();
        return false;
    }

    // Allocate frames and packet
    m_frame = av_frame_alloc();
    m_previousFrame = av_frame_alloc();
    m_packet = av_packet_alloc();

    if (!m_frame || !m_previousFrame || !m_packet) {
        m_lastError = "Could not allocate frames or packet";
        close();
        return false;
    }

    m_timeBase = stream->time_base;
    m_streamStartTime = (stream->start_time != AV_NOPTS_VALUE) ? stream->start_time : 0;

    // Fill video info
    m_videoInfo.width = codecParams->width;
    m_videoInfo.height = codecParams->height;
    m_videoInfo.codecName = m_codec->name;

    if (stream->duration != AV_NOPTS_VALUE) {
        m_videoInfo.duration = stream->duration * av_q2d(m_timeBase);
    } else if (m_formatContext->duration != AV_NOPTS_VALUE) {
        m_videoInfo.duration = (double)m_formatContext->duration / AV_TIME_BASE;
    } else {
        m_videoInfo.duration = 0.0;
    }

    AVRational frameRate = stream->avg_frame_rate.den != 0 ? stream->avg_frame_rate : stream->r_frame_rate;
    if (frameRate.den != 0 && frameRate.num != 0) {
        m_videoInfo.frameRate = av_q2d(frameRate);
    } else {
        m_videoInfo.frameRate = 25.0; // Default fallback
    }

    return true;
}

double VideoDecoder::frameTimestamp(const AVFrame* frame) const
{
    int64_t pts = frame->best_effort_timestamp;
    if (pts == AV_NOPTS_VALUE) {
        pts = frame->pts;
    }
    if (pts == AV_NOPTS_VALUE) {
        return 0.0;
    }
    return (pts - m_streamStartTime) * av_q2d(m_timeBase);
}

bool VideoDecoder::seekToTimestamp(double timestamp)
{
    int64_t target = m_streamStartTime + static_cast<int64_t>(std::llround(timestamp / av_q2d(m_timeBase)));

    if (av_seek_frame(m_formatContext, m_videoStreamIndex, target, AVSEEK_FLAG_BACKWARD) < 0) {
        // Some demuxers cannot seek by stream timestamp; restart from the beginning
        if (av_seek_frame(m_formatContext, m_videoStreamIndex, m_streamStartTime, AVSEEK_FLAG_BACKWARD) < 0) {
            m_lastError = "Seek failed";
            return false;
        }
    }

    avcodec_flush_buffers(m_codecContext);
    return true;
}

bool VideoDecoder::decodeFrameAt(double timestamp, cv::Mat& mat)
{
    mat.release();

    if (!isOpen()) {
        m_lastError = "Video not opened";
        return false;
    }

    if (!seekToTimestamp(std::max(0.0, timestamp))) {
        return false;
    }

    // Frames within half a frame period before the target count as reached
    const double tolerance = 0.5 / std::max(1.0, m_videoInfo.frameRate);
    bool havePrevious = false;
    bool draining = false;
    av_frame_unref(m_previousFrame);

    while (!m_shouldCancel) {
        if (!draining) {
            int readResult = av_read_frame(m_formatContext, m_packet);
            if (readResult < 0) {
                // End of stream: flush the decoder
                draining = true;
                avcodec_send_packet(m_codecContext, nullptr);
            } else {
                if (m_packet->stream_index != m_videoStreamIndex) {
                    av_packet_unref(m_packet);
                    continue;
                }
                int sendResult = avcodec_send_packet(m_codecContext, m_packet);
                av_packet_unref(m_packet);
                if (sendResult < 0 && sendResult != AVERROR(EAGAIN)) {
                    continue;
                }
            }
        }

        int receiveResult = 0;
        while ((receiveResult = avcodec_receive_frame(m_codecContext, m_frame)) >= 0) {
            if (frameTimestamp(m_frame) + tolerance >= timestamp) {
                bool converted = convertFrameToMat(m_frame, mat);
                av_frame_unref(m_frame);
                av_frame_unref(m_previousFrame);
                return converted;
            }
            av_frame_unref(m_previousFrame);
            av_frame_move_ref(m_previousFrame, m_frame);
            havePrevious = true;
        }

        if (draining && receiveResult != AVERROR(EAGAIN)) {
            break;
        }
    }

    if (m_shouldCancel) {
        m_lastError = "Cancelled";
        av_frame_unref(m_previousFrame);
        return false;
    }

    // Timestamp lies beyond the last frame
    if (havePrevious) {
        bool converted = convertFrameToMat(m_previousFrame, mat);
        av_frame_unref(m_previousFrame);
        return converted;
    }

    m_lastError = "No frame decoded at requested timestamp";
    return false;
}

int VideoDecoder::decodeFrames(const FrameCallback& frameCallback,
                               const ProgressCallback& progressCallback,
                               double intervalSeconds)
{
    if (!isOpen() || !frameCallback) {
        m_lastError = "Video not opened or invalid callback";
        return -1;
    }

    if (!seekToTimestamp(0.0)) {
        return -1;
    }

    int frameCount = 0;
    double nextTargetTime = 0.0;
    bool draining = false;
    bool stopped = false;

    while (!stopped) {
        if (m_shouldCancel) {
            m_lastError = "Cancelled";
            return -1;
        }

        if (!draining) {
            int readResult = av_read_frame(m_formatContext, m_packet);
            if (readResult < 0) {
                draining = true;
                avcodec_send_packet(m_codecContext, nullptr);
            } else {
                if (m_packet->stream_index != m_videoStreamIndex) {
                    av_packet_unref(m_packet);
                    continue;
                }
                int sendResult = avcodec_send_packet(m_codecContext, m_packet);
                av_packet_unref(m_packet);
                if (sendResult < 0 && sendResult != AVERROR(EAGAIN)) {
                    continue;
                }
            }
        }

        int receiveResult = 0;
        while (!stopped && (receiveResult = avcodec_receive_frame(m_codecContext, m_frame)) >= 0) {
            double timestamp = frameTimestamp(m_frame);

            if (timestamp >= nextTargetTime) {
                cv::Mat mat;
                if (convertFrameToMat(m_frame, mat)) {
                    if (!frameCallback(mat, timestamp, frameCount)) {
                        stopped = true;
                    }
                    frameCount++;

                    if (intervalSeconds > 0.0) {
                        while (nextTargetTime <= timestamp) {
                            nextTargetTime += intervalSeconds;
                        }
                    }

                    // Progress callback
                    if (progressCallback && m_videoInfo.duration > 0) {
                        double progress = std::min(100.0, (timestamp / m_videoInfo.duration) * 100.0);
                        progressCallback(timestamp, m_videoInfo.duration, progress);
                    }
                }
            }
            av_frame_unref(m_frame);
        }

        if (draining && receiveResult != AVERROR(EAGAIN)) {
            break;
        }
    }

    return frameCount;
}

bool VideoDecoder::convertFrameToMat(const AVFrame* frame, cv::Mat& mat)
{
    if (!frame || frame->width <= 0 || frame->height <= 0) {
        return false;
    }

    m_swsContext = sws_getCachedContext(
        m_swsContext,
        frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
        frame->width, frame->height, AV_PIX_FMT_BGR24,
        SWS_BILINEAR, nullptr, nullptr, nullptr
    );

    if (!m_swsContext) {
        m_lastError = "Could not create conversion context";
        return false;
    }

    // Convert straight into the Mat's buffer, which the caller then owns
    mat.create(frame->height, frame->width, CV_8UC3);
    uint8_t* destData[4] = { mat.data, nullptr, nullptr, nullptr };
    int destLinesize[4] = { static_cast<int>(mat.step[0]), 0, 0, 0 };

    sws_scale(m_swsContext, frame->data, frame->linesize, 0, frame->height,
              destData, destLinesize);

    return true;
}

void VideoDecoder::close()
{
    // Free frames
    if (m_frame) {
        av_frame_free(&m_frame);
    }
    if (m_previousFrame) {
        av_frame_free(&m_previousFrame);
    }

    // Free packet
    if (m_packet) {
        av_packet_free(&m_packet);
    }

    // Free conversion context
    if (m_swsContext) {
        sws_freeContext(m_swsContext);
        m_swsContext = nullptr;
    }

    // Free codec context
    if (m_codecContext) {
        avcodec_free_context(&m_codecContext);
    }

    // Free format context
    if (m_formatContext) {
        avformat_close_input(&m_formatContext);
    }

    // Reset state
    m_codec = nullptr;
    m_videoStreamIndex = -1;
    m_streamStartTime = 0;
    m_videoInfo = VideoInfo();
}
