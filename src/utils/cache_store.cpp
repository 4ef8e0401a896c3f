/**
 * ThumbCache - Byte-budgeted LRU store implementation
 */

#include "utils/cache_store.hpp"

#include <borealis.hpp>
#include <cstdio>
#include <iterator>

namespace thumbcache {

std::string formatUtilization(const CacheStats& stats) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%", stats.utilization);
    return buffer;
}

LruCacheStore::LruCacheStore(size_t maxBytes)
    : m_maxBytes(maxBytes) {
}

bool LruCacheStore::get(const std::string& key, CacheEntry& entry) {
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return false;
    }

    // Move to the fresh end (mark as recently used)
    m_entries.splice(m_entries.end(), m_entries, it->second);
    entry = it->second->entry;
    return true;
}

bool LruCacheStore::has(const std::string& key) const {
    return m_index.find(key) != m_index.end();
}

void LruCacheStore::insert(const std::string& key, const CacheEntry& entry) {
    // Replacing a key must not count its old size twice
    remove(key);

    while (m_totalBytes + entry.size > m_maxBytes && !m_entries.empty()) {
        evictOne();
    }

    if (entry.size > m_maxBytes) {
        brls::Logger::debug("LruCacheStore: Admitting {} ({} bytes) over budget of {} bytes",
                            key, entry.size, m_maxBytes);
    }

    m_entries.push_back({key, entry});
    m_index[key] = std::prev(m_entries.end());
    m_totalBytes += entry.size;
}

bool LruCacheStore::evictOne() {
    if (m_entries.empty()) {
        return false;
    }

    // Only our handle goes away; other holders keep the pixels alive
    Node& stalest = m_entries.front();
    brls::Logger::debug("LruCacheStore: Evicting {} ({} bytes)", stalest.key, stalest.entry.size);
    m_totalBytes -= stalest.entry.size;
    m_index.erase(stalest.key);
    m_entries.pop_front();
    return true;
}

bool LruCacheStore::remove(const std::string& key) {
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return false;
    }

    m_totalBytes -= it->second->entry.size;
    m_entries.erase(it->second);
    m_index.erase(it);
    return true;
}

void LruCacheStore::clear() {
    m_entries.clear();
    m_index.clear();
    m_totalBytes = 0;
}

CacheStats LruCacheStore::stats() const {
    CacheStats stats;
    stats.count = m_entries.size();
    stats.totalBytes = m_totalBytes;
    stats.maxBytes = m_maxBytes;
    stats.utilization = m_maxBytes > 0
        ? (static_cast<double>(m_totalBytes) / static_cast<double>(m_maxBytes)) * 100.0
        : 0.0;
    return stats;
}

} // namespace thumbcache
