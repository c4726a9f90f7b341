/**
 * @file motion_extractor.cpp
 * @brief Connected-component extraction of motion regions.
 */

#include "motion_extractor.hpp"
#include <opencv2/imgproc.hpp>

/**
 * @brief Extract area-filtered motion regions from a mask.
 *
 * Algorithm:
 * 1. Binarise the mask (any non-zero pixel is foreground)
 * 2. Label 8-connected components with statistics
 * 3. Keep components whose pixel count reaches minArea
 */
std::vector<Region> extractMotionRegions(const cv::Mat& mask, int minArea) {
    std::vector<Region> regions;
    if (mask.empty()) return regions;

    CV_Assert(mask.type() == CV_8UC1);

    cv::Mat binary;
    cv::threshold(mask, binary, MotionExtractorParams::FOREGROUND_MIN - 1, 255, cv::THRESH_BINARY);

    cv::Mat labels, stats, centroids;
    int count = cv::connectedComponentsWithStats(binary, labels, stats, centroids,
                                                 MotionExtractorParams::CONNECTIVITY, CV_32S);

    // Label 0 is the background
    for (int label = 1; label < count; label++) {
        int area = stats.at<int>(label, cv::CC_STAT_AREA);
        if (area < minArea) continue;

        Region region;
        region.bbox = cv::Rect(stats.at<int>(label, cv::CC_STAT_LEFT),
                               stats.at<int>(label, cv::CC_STAT_TOP),
                               stats.at<int>(label, cv::CC_STAT_WIDTH),
                               stats.at<int>(label, cv::CC_STAT_HEIGHT));
        region.area = area;
        region.centroid = cv::Point2d(centroids.at<double>(label, 0),
                                      centroids.at<double>(label, 1));
        regions.push_back(region);
    }

    return regions;
}

long long totalMotionArea(const std::vector<Region>& regions) {
    long long total = 0;
    for (const auto& region : regions) {
        total += region.area;
    }
    return total;
}
