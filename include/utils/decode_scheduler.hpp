/**
 * ThumbCache - Visibility-aware decode scheduler
 */

#pragma once

#include "utils/decode_backend.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace thumbcache {

// Opaque reference to a UI element; only ever handed back to the oracle
using VisibilityRef = const void*;

// Answers "is this element on screen right now". Must be side-effect free.
class VisibilityOracle {
public:
    virtual ~VisibilityOracle() = default;
    virtual bool isVisible(VisibilityRef ref) const = 0;
};

// A decode request waiting for a free slot
struct QueuedLoad {
    std::string key;
    ImageSource source;
    int priority = 0;  // 0 = front of the stack (highest)
    std::chrono::steady_clock::time_point enqueuedAt;
    VisibilityRef visibilityRef = nullptr;  // nullptr = always visible
    uint64_t loadId = 0;  // Binds the request to its pending registration
};

/**
 * Holds queued loads and hands them out priority first, visibility second,
 * FIFO third, never more than maxConcurrent at a time.
 */
class DecodeScheduler {
public:
    using StartFn = std::function<void(QueuedLoad&&)>;

    DecodeScheduler(const VisibilityOracle* oracle, int maxConcurrent);

    void enqueue(QueuedLoad load);

    // Start loads while there is work and a free slot
    void dispatch(const StartFn& start);

    // Called when a started load completes (success or failure)
    void onLoadFinished();

    // Drop queued loads for key; returns how many were removed
    size_t remove(const std::string& key);

    // Drop every queued load and return them
    std::vector<QueuedLoad> takeAll();

    // Index of the load the next free slot would get, or -1 if the queue is empty
    int pickNext() const;

    bool isQueued(const std::string& key) const;
    size_t getQueuedCount() const { return m_queue.size(); }
    int getActiveCount() const { return m_activeLoads; }
    int getMaxConcurrent() const { return m_maxConcurrent; }
    void setMaxConcurrent(int maxConcurrent);

private:
    bool isVisible(const QueuedLoad& load) const;

    const VisibilityOracle* m_oracle;
    std::vector<QueuedLoad> m_queue;  // Enqueue order
    int m_activeLoads = 0;
    int m_maxConcurrent;
};

} // namespace thumbcache
