/**
 * ThumbCache - Thumbnail cache implementation
 */

#include "utils/thumbnail_cache.hpp"

#include <borealis.hpp>
#include <algorithm>

namespace thumbcache {

static int deriveMaxConcurrent(const DecodeWorkerPool& pool, int requested) {
    int cap = DecodeWorkerPool::concurrencyCap();
    int limit = pool.hasWorkers() ? std::min(pool.getWorkerCount(), cap) : cap;
    if (requested > 0) {
        limit = std::min(limit, requested);
    }
    return std::max(1, limit);
}

ThumbnailCache::ThumbnailCache(const ThumbnailCacheOptions& options, std::shared_ptr<const DecodeBackend> backend,
                               const VisibilityOracle* oracle)
    : m_store(options.maxBytes)
    , m_pool(std::make_unique<DecodeWorkerPool>(std::move(backend), options.pool))
    , m_scheduler(oracle, deriveMaxConcurrent(*m_pool, options.maxConcurrentDecodes)) {
    brls::Logger::info("ThumbnailCache: {} bytes budget, {} workers, {} concurrent decodes",
                       options.maxBytes, m_pool->getWorkerCount(), m_scheduler.getMaxConcurrent());
}

ThumbnailCache::~ThumbnailCache() {
    m_pool->setReplyNotifier(nullptr);
    m_pool->shutdown();
}

void ThumbnailCache::get(const std::string& key, const ImageSource& source, LoadCallback callback,
                         int priority, VisibilityRef visibilityRef, std::shared_ptr<bool> alive) {
    // Check memory cache first (promotes to most recently used on hit)
    CacheEntry entry;
    if (m_store.get(key, entry)) {
        if (alive && !*alive) return;
        LoadResult result;
        result.success = true;
        result.entry = entry;
        if (callback) callback(result);
        return;
    }

    // Join the decode already queued or running for this key
    auto it = m_pending.find(key);
    if (it != m_pending.end()) {
        it->second.waiters.push_back({std::move(callback), std::move(alive)});
        return;
    }

    PendingLoad pending;
    pending.loadId = m_nextLoadId++;
    pending.waiters.push_back({std::move(callback), std::move(alive)});

    QueuedLoad load;
    load.key = key;
    load.source = source;
    load.priority = std::max(0, priority);
    load.enqueuedAt = std::chrono::steady_clock::now();
    load.visibilityRef = visibilityRef;
    load.loadId = pending.loadId;

    m_pending[key] = std::move(pending);
    m_scheduler.enqueue(std::move(load));
    runScheduler();
}

void ThumbnailCache::preload(const std::string& key, const ImageSource& source, int priority,
                             VisibilityRef visibilityRef) {
    if (m_store.has(key) || isPending(key)) return;
    get(key, source, nullptr, priority, visibilityRef);
}

bool ThumbnailCache::getIfPresent(const std::string& key, CacheEntry& entry) {
    return m_store.get(key, entry);
}

bool ThumbnailCache::has(const std::string& key) const {
    return m_store.has(key);
}

void ThumbnailCache::invalidate(const std::string& key) {
    bool wasResident = m_store.remove(key);
    size_t dequeued = m_scheduler.remove(key);

    // Without a registration a decode still in flight cannot resurrect the key
    bool wasPending = false;
    auto it = m_pending.find(key);
    if (it != m_pending.end()) {
        std::vector<Waiter> waiters = std::move(it->second.waiters);
        m_pending.erase(it);
        wasPending = true;
        rejectWaiters(waiters, "Thumbnail invalidated");
    }

    if (wasResident || dequeued > 0 || wasPending) {
        brls::Logger::debug("ThumbnailCache: Invalidated {} (resident={}, queued={}, pending={})",
                            key, wasResident, dequeued, wasPending);
    }
}

void ThumbnailCache::clear() {
    brls::Logger::debug("ThumbnailCache: Clearing {} entries", m_store.size());
    m_store.clear();
}

void ThumbnailCache::cancelAll() {
    std::vector<QueuedLoad> cancelled = m_scheduler.takeAll();
    for (const auto& load : cancelled) {
        auto it = m_pending.find(load.key);
        if (it == m_pending.end() || it->second.loadId != load.loadId) continue;

        std::vector<Waiter> waiters = std::move(it->second.waiters);
        m_pending.erase(it);
        rejectWaiters(waiters, "Thumbnail load cancelled");
    }

    if (!cancelled.empty()) {
        brls::Logger::debug("ThumbnailCache: Cancelled {} queued loads", cancelled.size());
    }
}

CacheStats ThumbnailCache::stats() const {
    return m_store.stats();
}

void ThumbnailCache::shutdown() {
    m_pool->shutdown();
}

size_t ThumbnailCache::pump() {
    return m_pool->pumpReplies();
}

size_t ThumbnailCache::waitAndPump(std::chrono::milliseconds timeout) {
    if (!m_pool->waitForReplies(timeout)) {
        return 0;
    }
    return pump();
}

void ThumbnailCache::setReplyNotifier(std::function<void()> notifier) {
    m_pool->setReplyNotifier(std::move(notifier));
}

void ThumbnailCache::runScheduler() {
    m_scheduler.dispatch([this](QueuedLoad&& load) {
        startDecode(std::move(load));
    });
}

void ThumbnailCache::startDecode(QueuedLoad&& load) {
    std::string key = load.key;
    uint64_t loadId = load.loadId;
    m_pool->decode(load.source, [this, key, loadId](DecodeResult&& result) {
        onDecodeFinished(key, loadId, std::move(result));
    });
}

void ThumbnailCache::onDecodeFinished(const std::string& key, uint64_t loadId, DecodeResult&& result) {
    m_scheduler.onLoadFinished();

    auto it = m_pending.find(key);
    if (it == m_pending.end() || it->second.loadId != loadId) {
        // Invalidated (and maybe re-requested) while decoding
        brls::Logger::debug("ThumbnailCache: Discarding stale result for {}", key);
        runScheduler();
        return;
    }

    // Unregister before yielding so callbacks can request the key again
    std::vector<Waiter> waiters = std::move(it->second.waiters);
    m_pending.erase(it);

    if (result.success && result.bitmap) {
        LoadResult loaded;
        loaded.success = true;
        loaded.entry = makeCacheEntry(std::move(result.bitmap));
        m_store.insert(key, loaded.entry);
        notifyWaiters(waiters, loaded);
    } else {
        brls::Logger::warning("ThumbnailCache: Failed to decode {}: {}", key, result.error);
        rejectWaiters(waiters, result.error.empty() ? "Decode failed" : result.error);
    }

    runScheduler();
}

void ThumbnailCache::notifyWaiters(std::vector<Waiter>& waiters, const LoadResult& result) {
    for (auto& waiter : waiters) {
        // Skip if the owner went away while the image was decoding
        if (waiter.alive && !*waiter.alive) continue;
        if (waiter.callback) waiter.callback(result);
    }
}

void ThumbnailCache::rejectWaiters(std::vector<Waiter>& waiters, const std::string& error) {
    LoadResult failed;
    failed.success = false;
    failed.error = error;
    notifyWaiters(waiters, failed);
}

} // namespace thumbcache
