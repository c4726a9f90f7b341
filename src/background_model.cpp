/**
 * @file background_model.cpp
 * @brief MOG2-based background model with mask cleanup.
 */

#include "background_model.hpp"
#include "errors.hpp"

#include <iostream>
#include <string>
#include <opencv2/imgproc.hpp>

BackgroundModel::BackgroundModel() : BackgroundModel(Settings()) {
}

BackgroundModel::BackgroundModel(const Settings& settings)
    : history(settings.history > 0 ? settings.history : DEFAULT_HISTORY),
      learningRate(settings.learningRate),
      warmupFrames(settings.warmupFrames),
      varThreshold(settings.varThreshold),
      framesSeen(0), modelType(-1) {
    if (learningRate < 0.0 || learningRate > 1.0) {
        learningRate = 1.0 / history;
    }
    if (warmupFrames < 0) {
        warmupFrames = history;
    }
    if (settings.openKernelSize > 0) {
        openKernel = cv::getStructuringElement(
            cv::MORPH_RECT, cv::Size(settings.openKernelSize, settings.openKernelSize));
    }
    initialize();
}

void BackgroundModel::initialize() {
    // Shadow detection off: shadows would otherwise be reported as motion-ish gray
    subtractor = cv::createBackgroundSubtractorMOG2(history, varThreshold, false);
    framesSeen = 0;
    modelSize = cv::Size();
    modelType = -1;
}

void BackgroundModel::setVarThreshold(double threshold) {
    varThreshold = threshold;
    if (subtractor) {
        subtractor->setVarThreshold(threshold);
    }
}

void BackgroundModel::validateFrame(const Frame& frame) const {
    const cv::Mat& img = frame.image;

    if (img.empty()) {
        throw InvalidFrameError("empty frame #" + std::to_string(frame.sequence));
    }
    if (img.depth() != CV_8U || (img.channels() != 1 && img.channels() != 3)) {
        throw InvalidFrameError("frame #" + std::to_string(frame.sequence) +
                                " has unsupported pixel format (type " +
                                std::to_string(img.type()) + ")");
    }
    if (modelType >= 0 && (img.size() != modelSize || img.type() != modelType)) {
        throw InvalidFrameError("frame #" + std::to_string(frame.sequence) + " is " +
                                std::to_string(img.cols) + "x" + std::to_string(img.rows) +
                                ", model expects " + std::to_string(modelSize.width) +
                                "x" + std::to_string(modelSize.height));
    }
}

/**
 * @brief Classify a frame against the background, then learn from it.
 *
 * Steps:
 * 1. Reject malformed frames (model untouched)
 * 2. MOG2 apply: per-pixel mixture test, then model update at learningRate
 * 3. Binarise (drops shadow-valued pixels if any)
 * 4. Morphological opening to remove isolated noise pixels
 */
cv::Mat BackgroundModel::classify(const Frame& frame) {
    validateFrame(frame);

    cv::Mat raw;
    try {
        subtractor->apply(frame.image, raw, learningRate);
    } catch (const cv::Exception& e) {
        throw InvalidFrameError(std::string("background update failed: ") + e.what());
    }

    if (modelType < 0) {
        modelSize = frame.image.size();
        modelType = frame.image.type();
    }

    bool wasConverged = isConverged();
    framesSeen++;
    if (!wasConverged && isConverged()) {
        std::cout << "BackgroundModel: converged after " << framesSeen << " frames" << std::endl;
    }

    cv::Mat mask;
    cv::threshold(raw, mask, MASK_BINARY_THRESHOLD, 255, cv::THRESH_BINARY);

    if (!openKernel.empty()) {
        cv::morphologyEx(mask, mask, cv::MORPH_OPEN, openKernel);
    }

    return mask;
}
