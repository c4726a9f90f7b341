/**
 * @file background_model.hpp
 * @brief Adaptive background model built on OpenCV's MOG2 subtractor.
 *
 * Keeps a per-pixel Gaussian mixture estimate of the empty scene, classifies
 * each new frame against it, then folds the frame into the estimate. Gradual
 * illumination drift is absorbed by the update; abrupt change shows up as
 * foreground because the classification happens before the update.
 */

#pragma once

#include <opencv2/core.hpp>
#include <opencv2/video/background_segm.hpp>

#include "frame.hpp"

/**
 * @class BackgroundModel
 * @brief Foreground/background pixel classifier with a learning background.
 *
 * Not thread-safe: only the processing thread may call classify() and the
 * setters. The variance threshold is the live "sensitivity" knob; lower
 * values flag more pixels as foreground.
 */
class BackgroundModel {
public:
    static constexpr int DEFAULT_HISTORY = 100;               // Frames of history (learning window)
    static constexpr double DEFAULT_VAR_THRESHOLD = 25.0;
    static constexpr int DEFAULT_OPEN_KERNEL = 3;             // Morphological opening (0 = off)
    static constexpr double MASK_BINARY_THRESHOLD = 250.0;    // Drops MOG2 shadow values (127)

    struct Settings {
        int history = DEFAULT_HISTORY;
        double learningRate = -1.0;     // < 0: derive from history (1 / history)
        int warmupFrames = -1;          // < 0: same as history
        int openKernelSize = DEFAULT_OPEN_KERNEL;
        double varThreshold = DEFAULT_VAR_THRESHOLD;
    };

    BackgroundModel();
    explicit BackgroundModel(const Settings& settings);

    // Discard everything learned; the model starts unconverged
    void initialize();

    // Classify the frame (foreground = 255), then update the model
    cv::Mat classify(const Frame& frame);

    void setVarThreshold(double threshold);
    double getVarThreshold() const { return varThreshold; }

    double getLearningRate() const { return learningRate; }
    int getWarmupFrames() const { return warmupFrames; }
    int getFramesSeen() const { return framesSeen; }
    bool isConverged() const { return framesSeen >= warmupFrames; }

private:
    void validateFrame(const Frame& frame) const;

    cv::Ptr<cv::BackgroundSubtractorMOG2> subtractor;
    cv::Mat openKernel;

    int history;
    double learningRate;
    int warmupFrames;
    double varThreshold;

    int framesSeen;
    cv::Size modelSize;   // Geometry of the frames the model was built on
    int modelType;
};
