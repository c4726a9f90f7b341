/**
 * @file trigger_sink.cpp
 * @brief Asynchronous trigger dispatch.
 */

#include "trigger_sink.hpp"
#include <iostream>

// ============================================================================
// Constructor / Destructor
// ============================================================================

AsyncTriggerSink::AsyncTriggerSink(Handler handler, size_t maxQueueSize)
    : handler(std::move(handler)), maxQueueSize(maxQueueSize > 0 ? maxQueueSize : 1),
      stopRequested(false), busy(false), workerExited(false) {
    dispatchThread = std::thread(&AsyncTriggerSink::dispatchThreadFunc, this);
}

AsyncTriggerSink::~AsyncTriggerSink() {
    shutdown();
}

void AsyncTriggerSink::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stopRequested = true;
    }
    queueCv.notify_all();

    if (dispatchThread.joinable()) {
        dispatchThread.join();
    }
}

// ============================================================================
// Dispatch
// ============================================================================

void AsyncTriggerSink::fire(const TriggerEvent& event) noexcept {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (stopRequested || pending.size() >= maxQueueSize) {
            dropped++;
            return;
        }
        pending.push(event);
    }
    queueCv.notify_one();
}

void AsyncTriggerSink::waitIdle() {
    std::unique_lock<std::mutex> lock(queueMutex);
    idleCv.wait(lock, [this] {
        return (pending.empty() && !busy) || workerExited;
    });
}

/**
 * @brief Worker loop: pop events and run the handler outside the lock.
 *
 * Queued events are drained before the thread exits on shutdown.
 */
void AsyncTriggerSink::dispatchThreadFunc() {
    while (true) {
        TriggerEvent event;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            queueCv.wait(lock, [this] { return stopRequested || !pending.empty(); });

            if (pending.empty()) break;  // stop requested and drained

            event = pending.front();
            pending.pop();
            busy = true;
        }

        if (handler) {
            try {
                handler(event);
                dispatched++;
            } catch (const std::exception& e) {
                failed++;
                std::cerr << "TriggerSink: handler failed: " << e.what() << std::endl;
            } catch (...) {
                failed++;
                std::cerr << "TriggerSink: handler failed: unknown exception" << std::endl;
            }
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex);
            busy = false;
        }
        idleCv.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex);
        workerExited = true;
    }
    idleCv.notify_all();
}

void logScareEvent(const TriggerEvent& event) {
    if (event.manual) {
        std::cout << "TriggerSink: test scare" << std::endl;
        return;
    }
    std::cout << "TriggerSink: SCARE #" << event.sequence
              << " (" << event.regionCount << " region(s), area "
              << event.totalMotionArea << " px)" << std::endl;
}
