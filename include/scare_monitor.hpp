/**
 * @file scare_monitor.hpp
 * @brief Monitoring session: capture thread, processing thread, control surface.
 *
 * ScareMonitor wires a FrameSource to the DetectionController through a
 * single-slot LatestFrameBuffer and exposes the command and observation
 * interfaces used by front ends. Front ends never touch pipeline internals.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "background_model.hpp"
#include "detection_controller.hpp"
#include "detection_parameters.hpp"
#include "frame_buffer.hpp"
#include "frame_source.hpp"
#include "stats_store.hpp"
#include "trigger_sink.hpp"

/**
 * @class ScareMonitor
 * @brief Runs detection sessions against a frame source.
 *
 * Threads per session:
 * - capture: FrameSource::read() -> LatestFrameBuffer::publish()
 * - processing: LatestFrameBuffer::take() -> DetectionController::processFrame()
 *
 * Statistics survive stop()/start(); everything else is per session.
 * stop() does not wait for a read in progress: the capture thread closes the
 * source when its read returns, and start() joins it before reopening.
 */
class ScareMonitor {
public:
    /// Observation snapshot, safe to take from any thread
    struct Snapshot {
        DetectionState state;
        uint64_t totalDetections;
        std::optional<TimePoint> lastDetectionTimestamp;
        std::string lastDetectionText;
        double cooldownRemaining;
        bool modelConverged;
        uint64_t framesProcessed;
        uint64_t framesSkipped;
        uint64_t framesDropped;
    };

    using CycleObserver = std::function<void(const CycleResult&)>;

    ScareMonitor(FrameSourceFactory sourceFactory, DetectionParameters& parameters,
                 TriggerSink& sink,
                 const BackgroundModel::Settings& modelSettings = BackgroundModel::Settings());
    ~ScareMonitor();

    ScareMonitor(const ScareMonitor&) = delete;
    ScareMonitor& operator=(const ScareMonitor&) = delete;

    // Control interface
    void start(const std::string& sourceIdentifier);
    void stop();
    void pause();
    void resume();
    void testTrigger();

    // Observation interface
    Snapshot snapshot() const;
    DetectionState getState() const { return controller.getState(); }
    std::optional<std::string> getLastError() const;
    const std::string& getSourceIdentifier() const { return sourceIdentifier; }

    // Parameter interface
    DetectionParameters& getParameters() { return parameters; }

    // Called on the processing thread after every cycle (set before start())
    void setCycleObserver(CycleObserver observer) { cycleObserver = std::move(observer); }

    // Wait for the pipeline to go Idle (stop() or stream end)
    bool waitForIdle(std::chrono::milliseconds timeout) const;

private:
    void captureThreadFunc();
    void processingThreadFunc();
    void joinThreads();
    void setLastError(const std::string& message);

    FrameSourceFactory sourceFactory;
    DetectionParameters& parameters;
    TriggerSink& sink;

    BackgroundModel model;
    StatsStore stats;
    DetectionController controller;
    LatestFrameBuffer frameBuffer;

    std::unique_ptr<FrameSource> source;
    std::string sourceIdentifier;
    CycleObserver cycleObserver;

    // Threading
    std::mutex commandMutex;            // Serializes start/stop
    std::thread captureThread;
    std::thread processingThread;
    std::atomic<bool> stopRequested;

    mutable std::mutex errorMutex;
    std::optional<std::string> lastError;

    static constexpr int IDLE_POLL_MS = 10;
};
