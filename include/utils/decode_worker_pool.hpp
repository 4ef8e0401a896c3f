/**
 * ThumbCache - Background decode worker pool
 * Round-robin dispatch to persistent worker threads, replies correlated by request id
 */

#pragma once

#include "utils/decode_backend.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace thumbcache {

// Outcome of one decode request
struct DecodeResult {
    bool success = false;
    BitmapHandle bitmap;
    std::string error;
};

struct DecodePoolOptions {
    int workerCount = 0;             // 0 = use the hardware parallelism hint
    int warmupRequests = 12;         // First N requests decode inline
    int warmupWindowMs = 3000;       // Requests within this window after construction decode inline
};

/**
 * Fixed set of decode threads. decode() and pumpReplies() belong to the control
 * thread; workers only run the backend and post replies to the response channel.
 */
class DecodeWorkerPool {
public:
    using DecodeCallback = std::function<void(DecodeResult&&)>;

    DecodeWorkerPool(std::shared_ptr<const DecodeBackend> backend, const DecodePoolOptions& options);
    ~DecodeWorkerPool();

    DecodeWorkerPool(const DecodeWorkerPool&) = delete;
    DecodeWorkerPool& operator=(const DecodeWorkerPool&) = delete;

    // Queue a decode. The callback runs from pumpReplies() on the control thread,
    // whether the decode ran inline (warm-up / no workers) or on a worker.
    void decode(const ImageSource& source, DecodeCallback callback);

    // Deliver every reply posted so far. Returns the number of callbacks invoked.
    size_t pumpReplies();

    // Block until at least one reply is waiting or the timeout expires
    bool waitForReplies(std::chrono::milliseconds timeout);

    // Stop and join all workers. Requests still in a worker inbox are rejected.
    // Safe to call more than once; later decodes run inline.
    void shutdown();

    // Hook invoked (from any thread) each time a reply is posted
    void setReplyNotifier(std::function<void()> notifier);

    int getWorkerCount() const { return static_cast<int>(m_workers.size()); }
    bool hasWorkers() const { return !m_workers.empty(); }
    size_t getPendingCount() const { return m_pendingDecodes.size(); }
    uint64_t getInlineDecodeCount() const { return m_inlineDecodes; }
    uint64_t getWorkerDecodeCount() const { return m_workerDecodes; }

    // Hard cap on concurrent decodes for this platform
    static int concurrencyCap();

    // Worker count for a hardware hint: clamp(hint, 2, cap)
    static int workerCountForHint(unsigned int hardwareThreads, int cap);

private:
    struct DecodeRequest {
        uint64_t id = 0;
        ImageSource source;
    };

    struct DecodeReply {
        uint64_t id = 0;
        DecodeResult result;
    };

    // One executor with its own inbox (request channel)
    struct Worker {
        int index = 0;
        std::thread thread;
        std::deque<DecodeRequest> inbox;
        std::mutex mutex;
        std::condition_variable cv;
    };

    void startWorkers(int count);
    void workerThreadFunc(Worker* worker);
    bool shouldDecodeInline() const;
    DecodeResult runBackend(const ImageSource& source) const;
    void postReply(DecodeReply&& reply);

    std::shared_ptr<const DecodeBackend> m_backend;
    DecodePoolOptions m_options;
    std::chrono::steady_clock::time_point m_createdAt;

    std::vector<std::unique_ptr<Worker>> m_workers;
    size_t m_workerIndex = 0;
    std::atomic<bool> m_shutdownWorkers{false};

    // Control-thread only
    uint64_t m_nextRequestId = 0;
    uint64_t m_requestCount = 0;
    uint64_t m_inlineDecodes = 0;
    uint64_t m_workerDecodes = 0;
    std::map<uint64_t, DecodeCallback> m_pendingDecodes;

    // Response channel
    std::deque<DecodeReply> m_replies;
    std::mutex m_replyMutex;
    std::condition_variable m_replyCV;
    std::function<void()> m_notifier;
    std::mutex m_notifierMutex;
};

} // namespace thumbcache
