/**
 * @file frame_buffer.hpp
 * @brief Single-slot, newest-frame-wins handoff between capture and processing.
 *
 * The capture thread publishes every frame it reads; if processing has not
 * picked up the previous one yet, that older frame is replaced and counted as
 * dropped. This bounds latency to one frame instead of letting a queue grow.
 */

#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

#include "frame.hpp"

class LatestFrameBuffer {
public:
    LatestFrameBuffer() : closed(false), dropped(0) {}

    LatestFrameBuffer(const LatestFrameBuffer&) = delete;
    LatestFrameBuffer& operator=(const LatestFrameBuffer&) = delete;

    // Returns false once the buffer has been closed
    bool publish(Frame frame) {
        {
            std::lock_guard<std::mutex> lock(slotMutex);
            if (closed) return false;
            if (slot) dropped++;
            slot = std::move(frame);
        }
        slotCv.notify_one();
        return true;
    }

    // Blocks until a frame is available; nullopt once closed
    std::optional<Frame> take() {
        std::unique_lock<std::mutex> lock(slotMutex);
        slotCv.wait(lock, [this] { return closed || slot.has_value(); });
        if (closed) return std::nullopt;

        std::optional<Frame> frame = std::move(slot);
        slot.reset();
        return frame;
    }

    // Wake all waiters; pending frame is discarded
    void close() {
        {
            std::lock_guard<std::mutex> lock(slotMutex);
            closed = true;
            slot.reset();
        }
        slotCv.notify_all();
    }

    // Make the buffer usable again for a new session
    void reopen() {
        std::lock_guard<std::mutex> lock(slotMutex);
        closed = false;
        slot.reset();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(slotMutex);
        return closed;
    }

    uint64_t getDroppedCount() const {
        std::lock_guard<std::mutex> lock(slotMutex);
        return dropped;
    }

private:
    mutable std::mutex slotMutex;
    std::condition_variable slotCv;
    std::optional<Frame> slot;
    bool closed;
    uint64_t dropped;
};
