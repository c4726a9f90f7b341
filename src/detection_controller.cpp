/**
 * @file detection_controller.cpp
 * @brief Implementation of the detection state machine.
 */

#include "detection_controller.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iostream>
#include <string>

const char* toString(DetectionState state) {
    switch (state) {
        case DetectionState::Idle:       return "Idle";
        case DetectionState::Monitoring: return "Monitoring";
        case DetectionState::Paused:     return "Paused";
        case DetectionState::Cooldown:   return "Cooldown";
    }
    return "Unknown";
}

// ============================================================================
// Constructor
// ============================================================================

DetectionController::DetectionController(BackgroundModel& model, DetectionParameters& parameters,
                                         StatsStore& stats, TriggerSink& sink)
    : model(model), parameters(parameters), stats(stats), sink(sink),
      state(DetectionState::Idle), resumeState(DetectionState::Monitoring),
      activeCooldownSeconds(0.0), modelResetPending(false), warmupWarned(false) {
}

// ============================================================================
// Commands
// ============================================================================

void DetectionController::start() {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (state != DetectionState::Idle) {
        throw InvalidStateTransitionError(std::string("start() while ") + toString(state));
    }
    state = DetectionState::Monitoring;
    resumeState = DetectionState::Monitoring;
    lastTriggerTimestamp.reset();
    activeCooldownSeconds = 0.0;
    modelResetPending = true;  // applied by the processing thread on its next cycle
    modelConverged = false;
    std::cout << "DetectionController: monitoring started" << std::endl;
}

/// Tear down the session; statistics live in StatsStore and are kept
void DetectionController::stop() {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (state == DetectionState::Idle) {
        throw InvalidStateTransitionError("stop() while Idle");
    }
    state = DetectionState::Idle;
    resumeState = DetectionState::Monitoring;
    lastTriggerTimestamp.reset();
    activeCooldownSeconds = 0.0;
    std::cout << "DetectionController: stopped" << std::endl;
}

void DetectionController::pause() {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (state != DetectionState::Monitoring && state != DetectionState::Cooldown) {
        throw InvalidStateTransitionError(std::string("pause() while ") + toString(state));
    }
    resumeState = state;
    state = DetectionState::Paused;
    std::cout << "DetectionController: detection paused" << std::endl;
}

/// A cooldown pending at pause time is resumed; the next cycle checks whether it elapsed
void DetectionController::resume() {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (state != DetectionState::Paused) {
        throw InvalidStateTransitionError(std::string("resume() while ") + toString(state));
    }
    state = resumeState;
    std::cout << "DetectionController: detection resumed (" << toString(state) << ")" << std::endl;
}

// ============================================================================
// Observation
// ============================================================================

DetectionState DetectionController::getState() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return state;
}

std::optional<TimePoint> DetectionController::getLastTriggerTimestamp() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return lastTriggerTimestamp;
}

double DetectionController::getCooldownRemaining(TimePoint now) const {
    std::lock_guard<std::mutex> lock(stateMutex);
    bool coolingDown = state == DetectionState::Cooldown ||
                       (state == DetectionState::Paused && resumeState == DetectionState::Cooldown);
    if (!coolingDown || !lastTriggerTimestamp) return 0.0;

    double elapsed = std::chrono::duration<double>(now - *lastTriggerTimestamp).count();
    return std::max(0.0, activeCooldownSeconds - elapsed);
}

bool DetectionController::cooldownElapsed(TimePoint now) const {
    if (!lastTriggerTimestamp) return true;
    return std::chrono::duration<double>(now - *lastTriggerTimestamp).count() >= activeCooldownSeconds;
}

// ============================================================================
// Detection Cycle
// ============================================================================

CycleResult DetectionController::processFrame(const Frame& frame) {
    CycleResult result;

    DetectionState current;
    bool resetModel;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        current = state;
        resetModel = modelResetPending;
        modelResetPending = false;
    }
    result.stateBefore = current;
    result.stateAfter = current;

    if (current == DetectionState::Idle) return result;

    if (resetModel) {
        model.initialize();
        warmupWarned = false;
        modelConverged = false;
    }

    // Parameters are read once; changes made during this cycle apply to the next
    const DetectionParameters::Snapshot params = parameters.snapshot();
    if (params.sensitivityThreshold != model.getVarThreshold()) {
        model.setVarThreshold(params.sensitivityThreshold);
    }

    // Stage 1: the model learns from every frame, paused or not
    try {
        result.mask = model.classify(frame);
    } catch (const InvalidFrameError& e) {
        stats.recordFrameSkipped();
        std::cerr << "DetectionController: skipping frame: " << e.what() << std::endl;
        result.skipped = true;
        return result;
    }
    stats.recordFrameProcessed();
    modelConverged = model.isConverged();

    // Stage 2: paused
    if (current == DetectionState::Paused) return result;

    // Stage 3: warm-up
    if (!model.isConverged()) {
        if (!warmupWarned) {
            std::cerr << "DetectionController: background model warming up ("
                      << model.getWarmupFrames() << " frames), triggers suppressed" << std::endl;
            warmupWarned = true;
        }
        return result;
    }

    // Stage 4: extraction
    result.regions = extractMotionRegions(result.mask, params.minMotionArea);
    result.totalMotionArea = totalMotionArea(result.regions);
    result.evaluated = true;

    // Stage 5: cooldown
    if (current == DetectionState::Cooldown) {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (state != DetectionState::Cooldown) {
            // A command changed the state while this cycle ran
            result.stateAfter = state;
            return result;
        }
        if (!cooldownElapsed(frame.timestamp)) return result;

        state = DetectionState::Monitoring;
        current = DetectionState::Monitoring;
        result.stateAfter = current;
    }

    // Stage 6: trigger decision
    if (current != DetectionState::Monitoring || result.totalMotionArea <= 0) return result;

    std::optional<TriggerEvent> event;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (state != DetectionState::Monitoring) {
            result.stateAfter = state;
            return result;
        }
        state = DetectionState::Cooldown;
        lastTriggerTimestamp = frame.timestamp;
        activeCooldownSeconds = params.cooldownSeconds;

        uint64_t sequence = stats.recordDetection(frame.timestamp);
        event = TriggerEvent{frame.timestamp, result.totalMotionArea,
                             static_cast<int>(result.regions.size()), sequence, false};
    }
    result.triggered = true;
    result.stateAfter = DetectionState::Cooldown;

    std::cout << "DetectionController: motion detected, " << result.regions.size()
              << " region(s), area " << result.totalMotionArea << " px (detection #"
              << event->sequence << ")" << std::endl;

    // Hand-off outside the lock; fire() never blocks or throws
    sink.fire(*event);
    return result;
}
