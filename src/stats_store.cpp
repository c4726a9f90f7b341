#include "stats_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

std::string Statistics::lastDetectionText() const {
    if (!lastDetectionWallTime) return "None";

    std::time_t t = std::chrono::system_clock::to_time_t(*lastDetectionWallTime);
    std::tm local{};
    localtime_r(&t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

uint64_t StatsStore::recordDetection(TimePoint timestamp) {
    auto wallTime = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(statsMutex);
    stats.totalDetections++;
    stats.lastDetectionTimestamp = timestamp;
    stats.lastDetectionWallTime = wallTime;
    return stats.totalDetections;
}

void StatsStore::recordFrameProcessed() {
    std::lock_guard<std::mutex> lock(statsMutex);
    stats.framesProcessed++;
}

void StatsStore::recordFrameSkipped() {
    std::lock_guard<std::mutex> lock(statsMutex);
    stats.framesSkipped++;
}

Statistics StatsStore::snapshot() const {
    std::lock_guard<std::mutex> lock(statsMutex);
    return stats;
}

uint64_t StatsStore::totalDetections() const {
    std::lock_guard<std::mutex> lock(statsMutex);
    return stats.totalDetections;
}
