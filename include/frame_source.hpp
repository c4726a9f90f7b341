/**
 * @file frame_source.hpp
 * @brief Frame acquisition interface and its OpenCV VideoCapture implementation.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <opencv2/videoio.hpp>

#include "frame.hpp"

/**
 * @class FrameSource
 * @brief Lazy, non-restartable stream of decoded frames.
 *
 * open() throws ConnectionError when the source is unreachable or invalid.
 * read() returns false once the stream has ended or dropped; a new open() is
 * needed after that.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual void open(const std::string& sourceIdentifier) = 0;
    virtual bool read(Frame& frame) = 0;
    virtual void close() = 0;
    virtual bool isOpened() const = 0;
};

/// Creates a fresh, unopened source for each monitoring session
using FrameSourceFactory = std::function<std::unique_ptr<FrameSource>()>;

/**
 * @class VideoCaptureSource
 * @brief FrameSource backed by cv::VideoCapture (network stream, file or camera).
 *
 * An identifier made only of digits selects a local camera index. Capture
 * hints (resolution, fps, one-frame driver buffer) are requested after open;
 * backends are free to ignore them. Open and read timeouts are passed to the
 * backend at open time.
 */
class VideoCaptureSource : public FrameSource {
public:
    struct CaptureSettings {
        int width = 640;
        int height = 480;
        int fps = 30;
        int bufferSize = 1;   // Keep latency low on network streams
        int openTimeoutMs = 10000;
        int readTimeoutMs = 5000;   // A stalled stream fails the read instead of blocking
    };

    VideoCaptureSource();
    explicit VideoCaptureSource(const CaptureSettings& settings);
    ~VideoCaptureSource() override;

    void open(const std::string& sourceIdentifier) override;
    bool read(Frame& frame) override;
    void close() override;
    bool isOpened() const override;

    const std::string& getSourceIdentifier() const { return sourceIdentifier; }

private:
    cv::VideoCapture cap;
    CaptureSettings settings;
    std::string sourceIdentifier;
    uint64_t nextSequence;
};
