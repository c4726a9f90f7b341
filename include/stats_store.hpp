/**
 * @file stats_store.hpp
 * @brief Detection statistics shared between the pipeline and observers.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "frame.hpp"

/**
 * @struct Statistics
 * @brief Consistent copy of the session-independent detection counters.
 */
struct Statistics {
    uint64_t totalDetections = 0;
    std::optional<TimePoint> lastDetectionTimestamp;
    std::optional<std::chrono::system_clock::time_point> lastDetectionWallTime;
    uint64_t framesProcessed = 0;
    uint64_t framesSkipped = 0;

    /// Last detection as local "HH:MM:SS", or "None"
    std::string lastDetectionText() const;
};

/**
 * @class StatsStore
 * @brief Single-writer, multi-reader statistics store.
 *
 * Only the detection controller writes. Readers get a full copy taken under
 * the same lock as the writes, so they see either the values before a commit
 * or after it. The lock is never held longer than one struct copy.
 */
class StatsStore {
public:
    StatsStore() = default;

    StatsStore(const StatsStore&) = delete;
    StatsStore& operator=(const StatsStore&) = delete;

    // Writer side (detection controller only)
    uint64_t recordDetection(TimePoint timestamp);   // Returns the new total
    void recordFrameProcessed();
    void recordFrameSkipped();

    // Reader side (any thread)
    Statistics snapshot() const;
    uint64_t totalDetections() const;

private:
    mutable std::mutex statsMutex;
    Statistics stats;
};
