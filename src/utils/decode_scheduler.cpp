/**
 * ThumbCache - Visibility-aware decode scheduler implementation
 */

#include "utils/decode_scheduler.hpp"

#include <borealis.hpp>
#include <algorithm>

namespace thumbcache {

// a goes before b: smaller priority number, then earlier request
static bool runsBefore(const QueuedLoad& a, const QueuedLoad& b) {
    if (a.priority != b.priority) {
        return a.priority < b.priority;
    }
    return a.enqueuedAt < b.enqueuedAt;
}

DecodeScheduler::DecodeScheduler(const VisibilityOracle* oracle, int maxConcurrent)
    : m_oracle(oracle)
    , m_maxConcurrent(std::max(1, maxConcurrent)) {
}

void DecodeScheduler::setMaxConcurrent(int maxConcurrent) {
    m_maxConcurrent = std::max(1, maxConcurrent);
}

void DecodeScheduler::enqueue(QueuedLoad load) {
    m_queue.push_back(std::move(load));
}

bool DecodeScheduler::isVisible(const QueuedLoad& load) const {
    if (!load.visibilityRef || !m_oracle) return true;
    return m_oracle->isVisible(load.visibilityRef);
}

int DecodeScheduler::pickNext() const {
    int best = -1;
    int bestVisible = -1;

    // Single pass; visibility is asked fresh every time a slot opens
    for (size_t i = 0; i < m_queue.size(); i++) {
        const QueuedLoad& load = m_queue[i];
        if (best < 0 || runsBefore(load, m_queue[best])) {
            best = static_cast<int>(i);
        }
        if ((bestVisible < 0 || runsBefore(load, m_queue[bestVisible])) && isVisible(load)) {
            bestVisible = static_cast<int>(i);
        }
    }

    return bestVisible >= 0 ? bestVisible : best;
}

void DecodeScheduler::dispatch(const StartFn& start) {
    while (!m_queue.empty() && m_activeLoads < m_maxConcurrent) {
        int index = pickNext();
        if (index < 0) break;

        QueuedLoad load = std::move(m_queue[index]);
        m_queue.erase(m_queue.begin() + index);
        m_activeLoads++;

        brls::Logger::debug("DecodeScheduler: Dispatching {} (priority {}, {} active, {} queued)",
                            load.key, load.priority, m_activeLoads, m_queue.size());
        start(std::move(load));
    }
}

void DecodeScheduler::onLoadFinished() {
    if (m_activeLoads > 0) {
        m_activeLoads--;
    }
}

size_t DecodeScheduler::remove(const std::string& key) {
    size_t before = m_queue.size();
    m_queue.erase(std::remove_if(m_queue.begin(), m_queue.end(),
                                 [&key](const QueuedLoad& load) { return load.key == key; }),
                  m_queue.end());
    return before - m_queue.size();
}

std::vector<QueuedLoad> DecodeScheduler::takeAll() {
    std::vector<QueuedLoad> taken;
    taken.swap(m_queue);
    return taken;
}

bool DecodeScheduler::isQueued(const std::string& key) const {
    return std::any_of(m_queue.begin(), m_queue.end(),
                       [&key](const QueuedLoad& load) { return load.key == key; });
}

} // namespace thumbcache
