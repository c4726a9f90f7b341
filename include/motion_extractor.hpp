/**
 * @file motion_extractor.hpp
 * @brief Reduction of a foreground mask to discrete motion regions.
 *
 * Connected foreground pixels (8-connectivity) are grouped into blobs, each
 * blob is measured by its exact pixel count, and blobs smaller than the
 * minimum area are dropped. No state is kept between calls.
 */

#pragma once

#include <vector>
#include <opencv2/core.hpp>

/// Connected-component labelling parameters
namespace MotionExtractorParams {
    constexpr int CONNECTIVITY = 8;
    constexpr uchar FOREGROUND_MIN = 1;  ///< Mask values >= this count as foreground
}

/**
 * @struct Region
 * @brief One contiguous blob of foreground pixels.
 */
struct Region {
    cv::Rect bbox;       ///< Bounding box in frame coordinates
    int area;            ///< Number of foreground pixels in the blob
    cv::Point2d centroid;
};

/**
 * @brief Extract motion regions from a foreground mask.
 * @param mask Single-channel 8-bit mask (0 = background, non-zero = foreground)
 * @param minArea Blobs with fewer pixels than this are discarded
 * @return Surviving regions, ordered by label (top-to-bottom scan order)
 */
std::vector<Region> extractMotionRegions(const cv::Mat& mask, int minArea);

/**
 * @brief Sum of the areas of the given regions.
 *
 * Used as the single "how much motion" signal for the trigger decision.
 */
long long totalMotionArea(const std::vector<Region>& regions);
