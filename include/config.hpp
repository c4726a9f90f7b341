/**
 * @file config.hpp
 * @brief Centralized configuration for all tunable parameters.
 *
 * Provides default values and startup configuration for detection
 * thresholds, the background model, frame capture and trigger dispatch.
 * Can load settings from YAML config file.
 */

#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <iostream>

#include "background_model.hpp"
#include "detection_parameters.hpp"
#include "frame_source.hpp"
#include "trigger_sink.hpp"

/**
 * @struct Config
 * @brief Centralized configuration for all tunable parameters.
 */
struct Config {
    // Detection settings (live-tunable at runtime, these are the start values)
    double sensitivity = DetectionParameters::DEFAULT_SENSITIVITY;        // MOG2 variance threshold [10, 100]
    double cooldownSeconds = DetectionParameters::DEFAULT_COOLDOWN_SECONDS; // Quiet period after a scare [1, 30]
    int minMotionArea = DetectionParameters::DEFAULT_MIN_MOTION_AREA;     // Pixels [100, 2000]

    // Background model
    int history = BackgroundModel::DEFAULT_HISTORY;   // Frames of history
    double learningRate = -1.0;                       // < 0: 1 / history
    int warmupFrames = -1;                            // < 0: same as history
    int openKernelSize = BackgroundModel::DEFAULT_OPEN_KERNEL;

    // Capture settings
    std::string videoSource;          // URL, file path, or camera index; empty = command line
    int captureWidth = 640;
    int captureHeight = 480;
    int captureFps = 30;
    int captureBufferSize = 1;
    int openTimeoutMs = 10000;
    int readTimeoutMs = 5000;

    // Trigger dispatch
    int triggerQueueSize = static_cast<int>(AsyncTriggerSink::DEFAULT_QUEUE_SIZE);

    BackgroundModel::Settings backgroundSettings() const {
        BackgroundModel::Settings s;
        s.history = history;
        s.learningRate = learningRate;
        s.warmupFrames = warmupFrames;
        s.openKernelSize = openKernelSize;
        s.varThreshold = sensitivity;
        return s;
    }

    VideoCaptureSource::CaptureSettings captureSettings() const {
        VideoCaptureSource::CaptureSettings s;
        s.width = captureWidth;
        s.height = captureHeight;
        s.fps = captureFps;
        s.bufferSize = captureBufferSize;
        s.openTimeoutMs = openTimeoutMs;
        s.readTimeoutMs = readTimeoutMs;
        return s;
    }

    // Load configuration from YAML file (OpenCV YAML requires %YAML:1.0 header)
    bool loadFromFile(const std::string& configPath) {
        cv::FileStorage fs;
        try {
            fs.open(configPath, cv::FileStorage::READ);
        } catch (const cv::Exception&) {
            std::cerr << "Warning: Invalid config file: " << configPath << std::endl;
            return false;
        }
        if (!fs.isOpened()) {
            return false;
        }

        std::cout << "Loading config from: " << configPath << std::endl;

        try {
            // Detection settings
            if (!fs["detection"].empty()) {
                cv::FileNode detection = fs["detection"];
                if (!detection["sensitivity"].empty()) detection["sensitivity"] >> sensitivity;
                if (!detection["cooldown_seconds"].empty()) detection["cooldown_seconds"] >> cooldownSeconds;
                if (!detection["min_motion_area"].empty()) detection["min_motion_area"] >> minMotionArea;
            }

            // Background model
            if (!fs["background"].empty()) {
                cv::FileNode background = fs["background"];
                if (!background["history"].empty()) background["history"] >> history;
                if (!background["learning_rate"].empty()) background["learning_rate"] >> learningRate;
                if (!background["warmup_frames"].empty()) background["warmup_frames"] >> warmupFrames;
                if (!background["open_kernel_size"].empty()) background["open_kernel_size"] >> openKernelSize;
            }

            // Capture settings
            if (!fs["capture"].empty()) {
                cv::FileNode capture = fs["capture"];
                if (!capture["source"].empty()) capture["source"] >> videoSource;
                if (!capture["width"].empty()) capture["width"] >> captureWidth;
                if (!capture["height"].empty()) capture["height"] >> captureHeight;
                if (!capture["fps"].empty()) capture["fps"] >> captureFps;
                if (!capture["buffer_size"].empty()) capture["buffer_size"] >> captureBufferSize;
                if (!capture["open_timeout_ms"].empty()) capture["open_timeout_ms"] >> openTimeoutMs;
                if (!capture["read_timeout_ms"].empty()) capture["read_timeout_ms"] >> readTimeoutMs;
            }

            // Trigger dispatch
            if (!fs["trigger"].empty()) {
                cv::FileNode trigger = fs["trigger"];
                if (!trigger["queue_size"].empty()) trigger["queue_size"] >> triggerQueueSize;
            }
        } catch (const cv::Exception& e) {
            std::cerr << "Warning: Malformed config file " << configPath << ": " << e.what() << std::endl;
            fs.release();
            return false;
        }

        fs.release();
        return true;
    }

    /**
     * @brief Replace out-of-range values with defaults.
     * @return List of problems found (empty if everything was valid)
     */
    std::vector<std::string> validate() {
        std::vector<std::string> problems;

        if (!DetectionParameters::isValidSensitivity(sensitivity)) {
            problems.push_back("detection.sensitivity out of [10, 100]");
            sensitivity = DetectionParameters::DEFAULT_SENSITIVITY;
        }
        if (!DetectionParameters::isValidCooldown(cooldownSeconds)) {
            problems.push_back("detection.cooldown_seconds out of [1, 30]");
            cooldownSeconds = DetectionParameters::DEFAULT_COOLDOWN_SECONDS;
        }
        if (!DetectionParameters::isValidMotionArea(minMotionArea)) {
            problems.push_back("detection.min_motion_area out of [100, 2000]");
            minMotionArea = DetectionParameters::DEFAULT_MIN_MOTION_AREA;
        }
        if (history <= 0) {
            problems.push_back("background.history must be positive");
            history = BackgroundModel::DEFAULT_HISTORY;
        }
        if (learningRate > 1.0) {
            problems.push_back("background.learning_rate must be <= 1");
            learningRate = -1.0;
        }
        if (openKernelSize < 0 || (openKernelSize > 0 && openKernelSize % 2 == 0)) {
            problems.push_back("background.open_kernel_size must be 0 or odd");
            openKernelSize = BackgroundModel::DEFAULT_OPEN_KERNEL;
        }
        if (captureWidth <= 0 || captureHeight <= 0 || captureFps <= 0) {
            problems.push_back("capture width/height/fps must be positive");
            captureWidth = 640;
            captureHeight = 480;
            captureFps = 30;
        }
        if (captureBufferSize < 1) {
            problems.push_back("capture.buffer_size must be >= 1");
            captureBufferSize = 1;
        }
        if (openTimeoutMs <= 0 || readTimeoutMs <= 0) {
            problems.push_back("capture open/read timeouts must be positive");
            openTimeoutMs = 10000;
            readTimeoutMs = 5000;
        }
        if (triggerQueueSize < 1) {
            problems.push_back("trigger.queue_size must be >= 1");
            triggerQueueSize = static_cast<int>(AsyncTriggerSink::DEFAULT_QUEUE_SIZE);
        }

        for (const auto& p : problems) {
            std::cerr << "Warning: config " << p << ", using default" << std::endl;
        }
        return problems;
    }

    // Print current configuration
    void print() const {
        std::cout << "=== ScareCam Configuration ===" << std::endl;
        std::cout << "Detection:" << std::endl;
        std::cout << "  sensitivity: " << sensitivity << std::endl;
        std::cout << "  cooldown_seconds: " << cooldownSeconds << std::endl;
        std::cout << "  min_motion_area: " << minMotionArea << std::endl;
        std::cout << "Background:" << std::endl;
        std::cout << "  history: " << history << std::endl;
        std::cout << "  learning_rate: " << (learningRate < 0 ? 1.0 / history : learningRate) << std::endl;
        std::cout << "  warmup_frames: " << (warmupFrames < 0 ? history : warmupFrames) << std::endl;
        std::cout << "Capture:" << std::endl;
        std::cout << "  source: " << (videoSource.empty() ? "(command line)" : videoSource) << std::endl;
        std::cout << "  size: " << captureWidth << "x" << captureHeight << " @ " << captureFps << " fps" << std::endl;
        std::cout << "  timeouts: open " << openTimeoutMs << " ms, read " << readTimeoutMs << " ms" << std::endl;
        std::cout << "Trigger:" << std::endl;
        std::cout << "  queue_size: " << triggerQueueSize << std::endl;
        std::cout << "==============================" << std::endl;
    }
};
