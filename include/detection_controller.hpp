/**
 * @file detection_controller.hpp
 * @brief Motion-event state machine: trigger decision, cooldown, statistics.
 *
 * DetectionController consumes one frame per cycle, runs it through the
 * background model and the motion extractor, and decides whether a scare
 * fires. Commands (start/stop/pause/resume) may arrive from any thread while
 * cycles run on the processing thread.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>

#include "background_model.hpp"
#include "detection_parameters.hpp"
#include "frame.hpp"
#include "motion_extractor.hpp"
#include "stats_store.hpp"
#include "trigger_sink.hpp"

enum class DetectionState {
    Idle,         ///< Not running
    Monitoring,   ///< Running, trigger evaluation active
    Paused,       ///< Running, model keeps learning, no trigger evaluation
    Cooldown      ///< Running, triggers suppressed until the cooldown elapses
};

const char* toString(DetectionState state);

/**
 * @struct CycleResult
 * @brief What happened while processing one frame.
 */
struct CycleResult {
    DetectionState stateBefore = DetectionState::Idle;
    DetectionState stateAfter = DetectionState::Idle;
    std::vector<Region> regions;      ///< Regions that passed the area filter
    long long totalMotionArea = 0;
    bool skipped = false;             ///< Malformed frame, nothing else ran
    bool evaluated = false;           ///< Regions were extracted this cycle
    bool triggered = false;           ///< A scare fired on this frame
    cv::Mat mask;                     ///< Foreground mask (empty when skipped)
};

/**
 * @class DetectionController
 * @brief Owns DetectionState and drives the per-frame detection cycle.
 *
 * Cycle (processFrame):
 * 1. Snapshot parameters, apply sensitivity, feed the frame to the model
 * 2. Paused: stop here (the model still learned from the frame)
 * 3. Model warming up: stop here (triggers suppressed)
 * 4. Extract regions with the snapshot's minimum area
 * 5. Cooldown: leave it if elapsed and evaluate this same frame, else stop
 * 6. Monitoring with any surviving region: fire, commit stats, enter Cooldown
 *
 * The frame's capture timestamp is "now" for all cooldown arithmetic. The
 * cooldown length is captured when a trigger fires; later parameter changes
 * apply to the next trigger only.
 */
class DetectionController {
public:
    DetectionController(BackgroundModel& model, DetectionParameters& parameters,
                        StatsStore& stats, TriggerSink& sink);

    DetectionController(const DetectionController&) = delete;
    DetectionController& operator=(const DetectionController&) = delete;

    // Commands (any thread). Invalid transitions throw InvalidStateTransitionError.
    void start();
    void stop();
    void pause();
    void resume();

    // One detection cycle (processing thread only)
    CycleResult processFrame(const Frame& frame);

    // Observation (any thread)
    DetectionState getState() const;
    bool isRunning() const { return getState() != DetectionState::Idle; }
    std::optional<TimePoint> getLastTriggerTimestamp() const;
    double getCooldownRemaining(TimePoint now) const;
    bool isModelConverged() const { return modelConverged.load(); }

private:
    bool cooldownElapsed(TimePoint now) const;   // Caller holds stateMutex

    BackgroundModel& model;
    DetectionParameters& parameters;
    StatsStore& stats;
    TriggerSink& sink;

    // Guarded by stateMutex (held only for field access, never a whole cycle)
    mutable std::mutex stateMutex;
    DetectionState state;
    DetectionState resumeState;                 // Where resume() returns to
    std::optional<TimePoint> lastTriggerTimestamp;
    double activeCooldownSeconds;               // Cooldown in effect at the last trigger
    bool modelResetPending;

    // Processing thread only
    bool warmupWarned;

    std::atomic<bool> modelConverged{false};
};
