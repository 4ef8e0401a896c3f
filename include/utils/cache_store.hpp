/**
 * ThumbCache - Byte-budgeted LRU store for decoded bitmaps
 */

#pragma once

#include "utils/decoded_bitmap.hpp"
#include <list>
#include <map>
#include <string>

namespace thumbcache {

struct CacheStats {
    size_t count = 0;
    size_t totalBytes = 0;
    size_t maxBytes = 0;
    double utilization = 0.0;  // Percent of maxBytes in use (0-100, may exceed 100 transiently)
};

// Render utilization the way the stats overlay shows it, e.g. "12.5%"
std::string formatUtilization(const CacheStats& stats);

/**
 * Least-recently-used map from cache key to decoded entry with a soft byte budget.
 * Not thread-safe: only the control thread touches it.
 */
class LruCacheStore {
public:
    static constexpr size_t DEFAULT_MAX_BYTES = 100 * 1024 * 1024;

    explicit LruCacheStore(size_t maxBytes = DEFAULT_MAX_BYTES);

    // Lookup; on hit the entry becomes the most recently used
    bool get(const std::string& key, CacheEntry& entry);

    // Membership test without touching recency
    bool has(const std::string& key) const;

    // Evicts LRU entries until the new entry fits (or the store is empty), then inserts.
    // Never refuses an entry, even one larger than the whole budget.
    void insert(const std::string& key, const CacheEntry& entry);

    // Drop the least recently used entry. Returns false if the store is empty.
    bool evictOne();

    // Drop one entry by key. Returns false if it was not resident.
    bool remove(const std::string& key);

    void clear();

    CacheStats stats() const;

    size_t size() const { return m_entries.size(); }
    size_t totalBytes() const { return m_totalBytes; }
    size_t maxBytes() const { return m_maxBytes; }

private:
    struct Node {
        std::string key;
        CacheEntry entry;
    };

    // Access order: front = stalest (eviction candidate), back = freshest
    std::list<Node> m_entries;
    std::map<std::string, std::list<Node>::iterator> m_index;
    size_t m_totalBytes = 0;
    size_t m_maxBytes;
};

} // namespace thumbcache
