/**
 * @file frame.hpp
 * @brief Frame snapshot passed between pipeline stages.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <opencv2/core.hpp>

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

/**
 * @struct Frame
 * @brief Decoded video frame with its monotonic capture timestamp.
 *
 * The image is 8-bit, row-major, with 1 (gray) or 3 (BGR) channels. A frame
 * is handed from stage to stage and never modified in place.
 */
struct Frame {
    cv::Mat image;
    TimePoint timestamp;
    uint64_t sequence = 0;

    bool empty() const { return image.empty(); }
};
