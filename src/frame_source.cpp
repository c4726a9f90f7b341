/**
 * @file frame_source.cpp
 * @brief cv::VideoCapture frame source.
 */

#include "frame_source.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <vector>

VideoCaptureSource::VideoCaptureSource() : VideoCaptureSource(CaptureSettings()) {
}

VideoCaptureSource::VideoCaptureSource(const CaptureSettings& settings)
    : settings(settings), nextSequence(0) {
}

VideoCaptureSource::~VideoCaptureSource() {
    close();
}

void VideoCaptureSource::open(const std::string& identifier) {
    if (identifier.empty()) {
        throw ConnectionError("empty source identifier");
    }

    close();

    bool isCameraIndex = std::all_of(identifier.begin(), identifier.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
    const std::vector<int> openParams = {
        cv::CAP_PROP_OPEN_TIMEOUT_MSEC, settings.openTimeoutMs,
        cv::CAP_PROP_READ_TIMEOUT_MSEC, settings.readTimeoutMs
    };
    try {
        if (isCameraIndex) {
            cap.open(std::stoi(identifier), cv::CAP_ANY, openParams);
        } else {
            cap.open(identifier, cv::CAP_ANY, openParams);
        }
    } catch (const cv::Exception& e) {
        throw ConnectionError("cannot open source " + identifier + ": " + e.what());
    } catch (const std::out_of_range&) {
        throw ConnectionError("camera index out of range: " + identifier);
    }

    if (!cap.isOpened()) {
        throw ConnectionError("cannot open source " + identifier);
    }

    cap.set(cv::CAP_PROP_FRAME_WIDTH, settings.width);
    cap.set(cv::CAP_PROP_FRAME_HEIGHT, settings.height);
    cap.set(cv::CAP_PROP_BUFFERSIZE, settings.bufferSize);
    cap.set(cv::CAP_PROP_FPS, settings.fps);

    sourceIdentifier = identifier;
    nextSequence = 0;
    std::cout << "FrameSource: connected to " << identifier << " ("
              << cap.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
              << cap.get(cv::CAP_PROP_FRAME_HEIGHT) << ")" << std::endl;
}

bool VideoCaptureSource::read(Frame& frame) {
    if (!cap.isOpened()) return false;

    cv::Mat image;
    try {
        if (!cap.read(image) || image.empty()) {
            return false;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "FrameSource: read failed: " << e.what() << std::endl;
        return false;
    }

    frame.image = image;
    frame.timestamp = SteadyClock::now();
    frame.sequence = nextSequence++;
    return true;
}

void VideoCaptureSource::close() {
    if (cap.isOpened()) {
        cap.release();
        std::cout << "FrameSource: released " << sourceIdentifier << std::endl;
    }
}

bool VideoCaptureSource::isOpened() const {
    return cap.isOpened();
}
