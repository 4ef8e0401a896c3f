/**
 * ThumbCache - Thumbnail cache
 * Coalesces requests per key, schedules decodes by stack position and visibility,
 * and keeps the results in a byte-budgeted LRU store.
 */

#pragma once

#include "utils/cache_store.hpp"
#include "utils/decode_scheduler.hpp"
#include "utils/decode_worker_pool.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace thumbcache {

struct ThumbnailCacheOptions {
    size_t maxBytes = LruCacheStore::DEFAULT_MAX_BYTES;
    DecodePoolOptions pool;
    int maxConcurrentDecodes = 0;  // 0 = min(worker count, platform cap)
};

/**
 * All methods, and every callback, run on the single control (UI) thread.
 * Worker replies are delivered by pump(); the application arranges for pump()
 * to run after the reply notifier fires.
 */
class ThumbnailCache {
public:
    using LoadCallback = std::function<void(const LoadResult&)>;

    ThumbnailCache(const ThumbnailCacheOptions& options, std::shared_ptr<const DecodeBackend> backend,
                   const VisibilityOracle* oracle = nullptr);
    ~ThumbnailCache();

    ThumbnailCache(const ThumbnailCache&) = delete;
    ThumbnailCache& operator=(const ThumbnailCache&) = delete;

    // Hit: callback runs immediately. Miss: joins the pending decode for key, or queues one.
    // If alive is set and *alive is false when the result lands, the callback is skipped.
    void get(const std::string& key, const ImageSource& source, LoadCallback callback,
             int priority = 0, VisibilityRef visibilityRef = nullptr,
             std::shared_ptr<bool> alive = nullptr);

    // Warm the cache without a callback
    void preload(const std::string& key, const ImageSource& source, int priority = 0,
                 VisibilityRef visibilityRef = nullptr);

    // Cache-only lookup, marks the entry recently used
    bool getIfPresent(const std::string& key, CacheEntry& entry);

    bool has(const std::string& key) const;

    // Drop the entry, any queued request and any pending registration for key.
    // A decode already running for key finishes and its result is discarded.
    void invalidate(const std::string& key);

    // Drop every resident entry. Holders of returned bitmaps are unaffected.
    void clear();

    // Drop every queued (not yet started) request and reject its callers
    void cancelAll();

    CacheStats stats() const;

    // Stop the decode workers. Later requests decode inline.
    void shutdown();

    // Deliver finished decodes. Returns the number of decodes completed.
    size_t pump();

    // Wait up to timeout for a finished decode, then pump
    size_t waitAndPump(std::chrono::milliseconds timeout);

    // Invoked from any thread whenever a decode finishes
    void setReplyNotifier(std::function<void()> notifier);

    bool isPending(const std::string& key) const { return m_pending.count(key) > 0; }
    size_t getQueuedCount() const { return m_scheduler.getQueuedCount(); }
    int getActiveDecodes() const { return m_scheduler.getActiveCount(); }
    int getMaxConcurrentDecodes() const { return m_scheduler.getMaxConcurrent(); }
    const DecodeWorkerPool& getWorkerPool() const { return *m_pool; }

private:
    struct Waiter {
        LoadCallback callback;
        std::shared_ptr<bool> alive;
    };

    // Callers coalesced on one in-flight or queued decode
    struct PendingLoad {
        uint64_t loadId = 0;
        std::vector<Waiter> waiters;
    };

    void runScheduler();
    void startDecode(QueuedLoad&& load);
    void onDecodeFinished(const std::string& key, uint64_t loadId, DecodeResult&& result);
    static void notifyWaiters(std::vector<Waiter>& waiters, const LoadResult& result);
    static void rejectWaiters(std::vector<Waiter>& waiters, const std::string& error);

    LruCacheStore m_store;
    std::unique_ptr<DecodeWorkerPool> m_pool;
    DecodeScheduler m_scheduler;
    std::map<std::string, PendingLoad> m_pending;
    uint64_t m_nextLoadId = 1;
};

} // namespace thumbcache
