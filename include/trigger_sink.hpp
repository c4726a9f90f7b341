/**
 * @file trigger_sink.hpp
 * @brief Trigger event delivery to the outside world.
 *
 * The detection pipeline hands every fired event to a TriggerSink and moves
 * on. AsyncTriggerSink runs the actual work (playing a sound, sending a
 * message, ...) on its own thread so a slow or failing handler can never
 * stall frame processing.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

#include "frame.hpp"

/**
 * @struct TriggerEvent
 * @brief A committed "motion detected" decision.
 */
struct TriggerEvent {
    TimePoint timestamp;          ///< Capture time of the frame that fired
    long long totalMotionArea;    ///< Summed area of all qualifying regions
    int regionCount;
    uint64_t sequence;            ///< Detection number (1-based); 0 for manual tests
    bool manual = false;          ///< Fired by testTrigger(), not by motion
};

/**
 * @class TriggerSink
 * @brief Receiver of trigger events.
 *
 * fire() must return immediately and must not throw.
 */
class TriggerSink {
public:
    virtual ~TriggerSink() = default;
    virtual void fire(const TriggerEvent& event) noexcept = 0;
};

/**
 * @class AsyncTriggerSink
 * @brief Fire-and-forget dispatcher that runs a handler on a worker thread.
 *
 * Events are queued in a bounded queue. When the queue is full the new event
 * is dropped and counted; fire() never waits. Anything thrown by the
 * handler is caught, counted as failed and logged on the worker thread.
 */
class AsyncTriggerSink : public TriggerSink {
public:
    using Handler = std::function<void(const TriggerEvent&)>;

    static constexpr size_t DEFAULT_QUEUE_SIZE = 8;

    explicit AsyncTriggerSink(Handler handler, size_t maxQueueSize = DEFAULT_QUEUE_SIZE);
    ~AsyncTriggerSink() override;

    AsyncTriggerSink(const AsyncTriggerSink&) = delete;
    AsyncTriggerSink& operator=(const AsyncTriggerSink&) = delete;

    void fire(const TriggerEvent& event) noexcept override;

    // Finish queued events and join the worker (idempotent)
    void shutdown();

    uint64_t getDispatchedCount() const { return dispatched.load(); }
    uint64_t getDroppedCount() const { return dropped.load(); }
    uint64_t getFailedCount() const { return failed.load(); }

    // Block until the queue is empty and no handler is running (tests, shutdown)
    void waitIdle();

private:
    void dispatchThreadFunc();

    Handler handler;
    size_t maxQueueSize;

    std::thread dispatchThread;
    std::mutex queueMutex;
    std::condition_variable queueCv;
    std::condition_variable idleCv;
    std::queue<TriggerEvent> pending;
    bool stopRequested;
    bool busy;
    bool workerExited;

    std::atomic<uint64_t> dispatched{0};
    std::atomic<uint64_t> dropped{0};
    std::atomic<uint64_t> failed{0};
};

/**
 * @brief Default handler: announce the scare on the console.
 */
void logScareEvent(const TriggerEvent& event);
