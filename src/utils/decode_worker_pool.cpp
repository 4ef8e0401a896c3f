/**
 * ThumbCache - Background decode worker pool implementation
 */

#include "utils/decode_worker_pool.hpp"

#include <borealis.hpp>
#include <algorithm>
#include <exception>
#include <system_error>

namespace thumbcache {

#ifdef __vita__
static const int CONCURRENCY_CAP = 3;  // Vita thrashes with more decodes in flight
#else
static const int CONCURRENCY_CAP = 6;
#endif

int DecodeWorkerPool::concurrencyCap() {
    return CONCURRENCY_CAP;
}

int DecodeWorkerPool::workerCountForHint(unsigned int hardwareThreads, int cap) {
    int count = static_cast<int>(std::min<unsigned int>(hardwareThreads, 1024));
    return std::max(2, std::min(count, std::max(2, cap)));
}

DecodeWorkerPool::DecodeWorkerPool(std::shared_ptr<const DecodeBackend> backend, const DecodePoolOptions& options)
    : m_backend(std::move(backend))
    , m_options(options)
    , m_createdAt(std::chrono::steady_clock::now()) {
    int numWorkers = options.workerCount > 0
        ? options.workerCount
        : workerCountForHint(std::thread::hardware_concurrency(), CONCURRENCY_CAP);
    startWorkers(numWorkers);
}

DecodeWorkerPool::~DecodeWorkerPool() {
    shutdown();
}

void DecodeWorkerPool::startWorkers(int count) {
    m_shutdownWorkers = false;
    brls::Logger::info("DecodeWorkerPool: Starting {} worker threads", count);

    for (int i = 0; i < count; i++) {
        auto worker = std::make_unique<Worker>();
        worker->index = i;
        try {
            worker->thread = std::thread(&DecodeWorkerPool::workerThreadFunc, this, worker.get());
        } catch (const std::system_error& e) {
            brls::Logger::error("DecodeWorkerPool: Failed to start worker {}: {}", i, e.what());
            break;
        }
        m_workers.push_back(std::move(worker));
    }

    if (m_workers.empty()) {
        brls::Logger::warning("DecodeWorkerPool: No workers available, decoding inline");
    }
}

void DecodeWorkerPool::workerThreadFunc(Worker* worker) {
    brls::Logger::debug("DecodeWorkerPool: Worker {} started", worker->index);

    while (!m_shutdownWorkers) {
        DecodeRequest request;
        {
            std::unique_lock<std::mutex> lock(worker->mutex);
            // Timeout lets the loop re-check the shutdown flag
            worker->cv.wait_for(lock, std::chrono::milliseconds(500), [this, worker]() {
                return !worker->inbox.empty() || m_shutdownWorkers;
            });

            if (m_shutdownWorkers) break;
            if (worker->inbox.empty()) continue;

            request = std::move(worker->inbox.front());
            worker->inbox.pop_front();
        }

        DecodeReply reply;
        reply.id = request.id;
        try {
            reply.result = runBackend(request.source);
        } catch (const std::exception& e) {
            // Executor-level failure: only this request is rejected, the worker keeps running
            brls::Logger::error("DecodeWorkerPool: Worker {} failed on request {}: {}",
                                worker->index, request.id, e.what());
            reply.result = DecodeResult();
            reply.result.error = std::string("Decode worker failure: ") + e.what();
        } catch (...) {
            brls::Logger::error("DecodeWorkerPool: Worker {} failed on request {}: unknown exception",
                                worker->index, request.id);
            reply.result = DecodeResult();
            reply.result.error = "Decode worker failure: unknown exception";
        }
        postReply(std::move(reply));
    }

    brls::Logger::debug("DecodeWorkerPool: Worker {} exiting", worker->index);
}

bool DecodeWorkerPool::shouldDecodeInline() const {
    if (m_workers.empty()) {
        return true;
    }
    if (m_requestCount < static_cast<uint64_t>(std::max(0, m_options.warmupRequests))) {
        return true;
    }
    auto elapsed = std::chrono::steady_clock::now() - m_createdAt;
    return elapsed < std::chrono::milliseconds(std::max(0, m_options.warmupWindowMs));
}

DecodeResult DecodeWorkerPool::runBackend(const ImageSource& source) const {
    DecodeResult result;
    if (!m_backend) {
        result.error = "No decode backend configured";
        return result;
    }

    DecodedBitmap bitmap;
    std::string error;
    if (m_backend->decode(source, bitmap, error)) {
        result.success = true;
        result.bitmap = std::make_shared<const DecodedBitmap>(std::move(bitmap));
    } else {
        result.error = error.empty() ? "Decode failed" : error;
    }
    return result;
}

void DecodeWorkerPool::decode(const ImageSource& source, DecodeCallback callback) {
    uint64_t id = m_nextRequestId++;
    m_pendingDecodes[id] = std::move(callback);

    bool decodeInline = shouldDecodeInline();
    m_requestCount++;

    if (decodeInline) {
        // Workers are cold (or missing): paint the first screenful from this thread
        m_inlineDecodes++;
        DecodeReply reply;
        reply.id = id;
        try {
            reply.result = runBackend(source);
        } catch (const std::exception& e) {
            brls::Logger::error("DecodeWorkerPool: Inline decode of {} failed: {}", source.describe(), e.what());
            reply.result = DecodeResult();
            reply.result.error = std::string("Decode failure: ") + e.what();
        } catch (...) {
            brls::Logger::error("DecodeWorkerPool: Inline decode of {} failed: unknown exception",
                                source.describe());
            reply.result = DecodeResult();
            reply.result.error = "Decode failure: unknown exception";
        }
        postReply(std::move(reply));
        return;
    }

    m_workerDecodes++;
    Worker* worker = m_workers[m_workerIndex].get();
    m_workerIndex = (m_workerIndex + 1) % m_workers.size();
    {
        std::lock_guard<std::mutex> lock(worker->mutex);
        DecodeRequest request;
        request.id = id;
        request.source = source;
        worker->inbox.push_back(std::move(request));
    }
    worker->cv.notify_one();
}

void DecodeWorkerPool::postReply(DecodeReply&& reply) {
    {
        std::lock_guard<std::mutex> lock(m_replyMutex);
        m_replies.push_back(std::move(reply));
    }
    m_replyCV.notify_all();

    std::function<void()> notifier;
    {
        std::lock_guard<std::mutex> lock(m_notifierMutex);
        notifier = m_notifier;
    }
    if (notifier) notifier();
}

size_t DecodeWorkerPool::pumpReplies() {
    std::deque<DecodeReply> batch;
    {
        std::lock_guard<std::mutex> lock(m_replyMutex);
        batch.swap(m_replies);
    }

    size_t delivered = 0;
    for (auto& reply : batch) {
        auto it = m_pendingDecodes.find(reply.id);
        if (it == m_pendingDecodes.end()) {
            brls::Logger::debug("DecodeWorkerPool: Dropping reply for unknown request {}", reply.id);
            continue;
        }

        // Remove before calling so the callback may queue more decodes
        DecodeCallback callback = std::move(it->second);
        m_pendingDecodes.erase(it);
        if (callback) callback(std::move(reply.result));
        delivered++;
    }
    return delivered;
}

bool DecodeWorkerPool::waitForReplies(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_replyMutex);
    return m_replyCV.wait_for(lock, timeout, [this]() {
        return !m_replies.empty();
    });
}

void DecodeWorkerPool::setReplyNotifier(std::function<void()> notifier) {
    std::lock_guard<std::mutex> lock(m_notifierMutex);
    m_notifier = std::move(notifier);
}

void DecodeWorkerPool::shutdown() {
    if (m_workers.empty()) {
        return;
    }

    brls::Logger::info("DecodeWorkerPool: Stopping {} worker threads", m_workers.size());
    m_shutdownWorkers = true;
    for (auto& worker : m_workers) {
        std::lock_guard<std::mutex> lock(worker->mutex);
        worker->cv.notify_all();
    }
    for (auto& worker : m_workers) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }

    // Requests the workers never picked up are rejected, not lost
    for (auto& worker : m_workers) {
        for (auto& request : worker->inbox) {
            DecodeReply reply;
            reply.id = request.id;
            reply.result.error = "Decode worker stopped";
            postReply(std::move(reply));
        }
        worker->inbox.clear();
    }

    m_workers.clear();
    m_workerIndex = 0;
}

} // namespace thumbcache
