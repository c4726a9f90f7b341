/**
 * @file scare_monitor.cpp
 * @brief Session lifecycle and pipeline threads.
 */

#include "scare_monitor.hpp"
#include "errors.hpp"

#include <iostream>

// ============================================================================
// Constructor / Destructor
// ============================================================================

ScareMonitor::ScareMonitor(FrameSourceFactory sourceFactory, DetectionParameters& parameters,
                           TriggerSink& sink, const BackgroundModel::Settings& modelSettings)
    : sourceFactory(std::move(sourceFactory)), parameters(parameters), sink(sink),
      model(modelSettings), controller(model, parameters, stats, sink),
      stopRequested(false) {
}

ScareMonitor::~ScareMonitor() {
    std::lock_guard<std::mutex> lock(commandMutex);
    if (controller.isRunning()) {
        controller.stop();
    }
    stopRequested = true;
    frameBuffer.close();
    joinThreads();
    if (source) {
        source->close();
    }
}

// ============================================================================
// Control Interface
// ============================================================================

/**
 * @brief Open the source and start a monitoring session.
 *
 * Throws InvalidStateTransitionError when already running and
 * ConnectionError when the source cannot be opened (state stays Idle).
 */
void ScareMonitor::start(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(commandMutex);

    if (controller.isRunning()) {
        throw InvalidStateTransitionError(std::string("start() while ") +
                                          toString(controller.getState()));
    }

    // Threads of a session that ended on its own (stream drop) are still joinable
    joinThreads();

    std::unique_ptr<FrameSource> newSource = sourceFactory();
    if (!newSource) {
        throw ConnectionError("no frame source available");
    }
    newSource->open(identifier);

    source = std::move(newSource);
    sourceIdentifier = identifier;
    {
        std::lock_guard<std::mutex> errorLock(errorMutex);
        lastError.reset();
    }

    controller.start();
    stopRequested = false;
    frameBuffer.reopen();

    captureThread = std::thread(&ScareMonitor::captureThreadFunc, this);
    processingThread = std::thread(&ScareMonitor::processingThreadFunc, this);
    std::cout << "ScareMonitor: session started on " << identifier << std::endl;
}

void ScareMonitor::stop() {
    std::lock_guard<std::mutex> lock(commandMutex);

    controller.stop();   // throws when already Idle
    stopRequested = true;
    frameBuffer.close();

    // The capture thread may sit in a stalled read; it releases the source
    // once the read returns and is joined by the next start() or the destructor
    if (processingThread.joinable()) {
        processingThread.join();
    }
    std::cout << "ScareMonitor: session stopped" << std::endl;
}

void ScareMonitor::pause() {
    controller.pause();
}

void ScareMonitor::resume() {
    controller.resume();
}

/// Fire a manual event at the sink; statistics and state are untouched
void ScareMonitor::testTrigger() {
    sink.fire(TriggerEvent{SteadyClock::now(), 0, 0, 0, true});
}

// ============================================================================
// Observation
// ============================================================================

ScareMonitor::Snapshot ScareMonitor::snapshot() const {
    Statistics s = stats.snapshot();

    Snapshot snap;
    snap.state = controller.getState();
    snap.totalDetections = s.totalDetections;
    snap.lastDetectionTimestamp = s.lastDetectionTimestamp;
    snap.lastDetectionText = s.lastDetectionText();
    snap.cooldownRemaining = controller.getCooldownRemaining(SteadyClock::now());
    snap.modelConverged = controller.isModelConverged();
    snap.framesProcessed = s.framesProcessed;
    snap.framesSkipped = s.framesSkipped;
    snap.framesDropped = frameBuffer.getDroppedCount();
    return snap;
}

std::optional<std::string> ScareMonitor::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex);
    return lastError;
}

void ScareMonitor::setLastError(const std::string& message) {
    std::lock_guard<std::mutex> lock(errorMutex);
    lastError = message;
}

bool ScareMonitor::waitForIdle(std::chrono::milliseconds timeout) const {
    auto deadline = SteadyClock::now() + timeout;
    while (controller.isRunning()) {
        if (SteadyClock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(IDLE_POLL_MS));
    }
    return true;
}

// ============================================================================
// Pipeline Threads
// ============================================================================

/**
 * @brief Capture loop: read frames and publish them, newest wins.
 *
 * A failed read ends the session: the error is recorded as a connection
 * error, the source is released and the controller goes Idle. There is no
 * automatic reconnect. The source is closed on every exit path.
 */
void ScareMonitor::captureThreadFunc() {
    while (!stopRequested) {
        Frame frame;
        if (!source->read(frame)) {
            if (stopRequested) break;

            ConnectionError error("stream " + sourceIdentifier + " ended or dropped");
            std::cerr << "ScareMonitor: " << error.what() << std::endl;
            setLastError(error.what());

            // Released before going Idle so a caller that sees Idle can reopen the device
            source->close();
            try {
                controller.stop();
            } catch (const InvalidStateTransitionError&) {
                // stop() raced us; already Idle
            }
            break;
        }

        if (!frameBuffer.publish(std::move(frame))) break;
    }

    source->close();
    frameBuffer.close();
}

/// Processing loop: one full detection cycle per frame taken from the buffer
void ScareMonitor::processingThreadFunc() {
    while (true) {
        std::optional<Frame> frame = frameBuffer.take();
        if (!frame) break;
        if (!controller.isRunning()) break;

        CycleResult result = controller.processFrame(*frame);
        if (cycleObserver) {
            cycleObserver(result);
        }
    }
}

void ScareMonitor::joinThreads() {
    if (captureThread.joinable()) {
        captureThread.join();
    }
    if (processingThread.joinable()) {
        processingThread.join();
    }
}
