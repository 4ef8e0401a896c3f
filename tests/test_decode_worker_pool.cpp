#include "utils/decode_worker_pool.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace thumbcache;
using thumbcache::testing::FakeDecodeBackend;
using thumbcache::testing::labelSource;

namespace {

DecodePoolOptions noWarmup(int workers) {
    DecodePoolOptions options;
    options.workerCount = workers;
    options.warmupRequests = 0;
    options.warmupWindowMs = 0;
    return options;
}

struct ReplyLog {
    std::map<std::string, DecodeResult> results;

    DecodeWorkerPool::DecodeCallback record(const std::string& label) {
        return [this, label](DecodeResult&& result) { results[label] = std::move(result); };
    }
};

void pumpUntil(DecodeWorkerPool& pool, const ReplyLog& log, size_t expected) {
    for (int i = 0; i < 400 && log.results.size() < expected; i++) {
        pool.waitForReplies(std::chrono::milliseconds(25));
        pool.pumpReplies();
    }
}

} // namespace

TEST(DecodeWorkerPoolTest, WorkerCountHintIsClampedToCap) {
    EXPECT_EQ(DecodeWorkerPool::workerCountForHint(0, 6), 2);
    EXPECT_EQ(DecodeWorkerPool::workerCountForHint(1, 6), 2);
    EXPECT_EQ(DecodeWorkerPool::workerCountForHint(4, 6), 4);
    EXPECT_EQ(DecodeWorkerPool::workerCountForHint(32, 6), 6);
    EXPECT_EQ(DecodeWorkerPool::workerCountForHint(32, 3), 3);
}

TEST(DecodeWorkerPoolTest, DesktopConcurrencyCapIsSix) {
    EXPECT_EQ(DecodeWorkerPool::concurrencyCap(), 6);
}

TEST(DecodeWorkerPoolTest, DecodesOnWorkersAfterWarmup) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodeWorkerPool pool(backend, noWarmup(2));
    ASSERT_EQ(pool.getWorkerCount(), 2);

    ReplyLog log;
    pool.decode(labelSource("3x2"), log.record("3x2"));
    EXPECT_EQ(pool.getPendingCount(), 1u);
    pumpUntil(pool, log, 1);

    ASSERT_EQ(log.results.count("3x2"), 1u);
    const DecodeResult& result = log.results["3x2"];
    EXPECT_TRUE(result.success);
    ASSERT_TRUE(result.bitmap);
    EXPECT_EQ(result.bitmap->width, 3);
    EXPECT_EQ(result.bitmap->height, 2);
    EXPECT_EQ(pool.getPendingCount(), 0u);
    EXPECT_EQ(pool.getWorkerDecodeCount(), 1u);
    EXPECT_EQ(pool.getInlineDecodeCount(), 0u);
    EXPECT_NE(backend->threadFor("3x2"), std::this_thread::get_id());
}

TEST(DecodeWorkerPoolTest, RoutesRequestsRoundRobin) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodeWorkerPool pool(backend, noWarmup(2));

    ReplyLog log;
    const std::vector<std::string> labels = {"1x1:a", "1x1:b", "1x1:c", "1x1:d"};
    for (const auto& label : labels) {
        pool.decode(labelSource(label), log.record(label));
    }
    pumpUntil(pool, log, labels.size());
    ASSERT_EQ(log.results.size(), labels.size());

    EXPECT_EQ(backend->threadFor("1x1:a"), backend->threadFor("1x1:c"));
    EXPECT_EQ(backend->threadFor("1x1:b"), backend->threadFor("1x1:d"));
    EXPECT_NE(backend->threadFor("1x1:a"), backend->threadFor("1x1:b"));
}

TEST(DecodeWorkerPoolTest, FirstRequestsDecodeInlineDuringWarmup) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodePoolOptions options = noWarmup(2);
    options.warmupRequests = 2;
    DecodeWorkerPool pool(backend, options);

    ReplyLog log;
    pool.decode(labelSource("1x1:a"), log.record("a"));
    pool.decode(labelSource("1x1:b"), log.record("b"));
    pool.decode(labelSource("1x1:c"), log.record("c"));
    pumpUntil(pool, log, 3);

    EXPECT_EQ(pool.getInlineDecodeCount(), 2u);
    EXPECT_EQ(pool.getWorkerDecodeCount(), 1u);
    EXPECT_EQ(backend->threadFor("1x1:a"), std::this_thread::get_id());
    EXPECT_EQ(backend->threadFor("1x1:b"), std::this_thread::get_id());
    EXPECT_NE(backend->threadFor("1x1:c"), std::this_thread::get_id());
}

TEST(DecodeWorkerPoolTest, RequestsInsideWarmupWindowDecodeInline) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodePoolOptions options = noWarmup(2);
    options.warmupWindowMs = 60000;
    DecodeWorkerPool pool(backend, options);

    ReplyLog log;
    for (int i = 0; i < 20; i++) {
        std::string label = "1x1:" + std::to_string(i);
        pool.decode(labelSource(label), log.record(label));
    }
    pumpUntil(pool, log, 20);

    EXPECT_EQ(pool.getInlineDecodeCount(), 20u);
    EXPECT_EQ(pool.getWorkerDecodeCount(), 0u);
}

TEST(DecodeWorkerPoolTest, InlineResultsArriveOnPump) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodePoolOptions options = noWarmup(1);
    options.warmupRequests = 10;
    DecodeWorkerPool pool(backend, options);

    ReplyLog log;
    pool.decode(labelSource("2x2"), log.record("2x2"));
    EXPECT_EQ(backend->decodeCount(), 1u);
    EXPECT_TRUE(log.results.empty());

    EXPECT_EQ(pool.pumpReplies(), 1u);
    EXPECT_TRUE(log.results["2x2"].success);
}

TEST(DecodeWorkerPoolTest, DecodeFailureRejectsOnlyThatRequest) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodeWorkerPool pool(backend, noWarmup(2));

    ReplyLog log;
    pool.decode(labelSource("fail"), log.record("fail"));
    pool.decode(labelSource("4x4"), log.record("4x4"));
    pumpUntil(pool, log, 2);

    ASSERT_EQ(log.results.size(), 2u);
    EXPECT_FALSE(log.results["fail"].success);
    EXPECT_EQ(log.results["fail"].error, "corrupt image");
    EXPECT_FALSE(log.results["fail"].bitmap);
    EXPECT_TRUE(log.results["4x4"].success);
}

TEST(DecodeWorkerPoolTest, WorkerExceptionRejectsOnlyItsRequestAndWorkerSurvives) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodeWorkerPool pool(backend, noWarmup(1));

    ReplyLog log;
    pool.decode(labelSource("throw"), log.record("throw"));
    pool.decode(labelSource("2x3"), log.record("2x3"));
    pumpUntil(pool, log, 2);

    ASSERT_EQ(log.results.size(), 2u);
    EXPECT_FALSE(log.results["throw"].success);
    EXPECT_NE(log.results["throw"].error.find("executor crashed"), std::string::npos);
    EXPECT_TRUE(log.results["2x3"].success);
    EXPECT_EQ(pool.getWorkerCount(), 1);
}

TEST(DecodeWorkerPoolTest, NonStandardExceptionRejectsOnlyItsRequest) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodeWorkerPool pool(backend, noWarmup(1));

    ReplyLog log;
    pool.decode(labelSource("throwint"), log.record("bad"));
    pool.decode(labelSource("2x2"), log.record("good"));
    pumpUntil(pool, log, 2);

    ASSERT_EQ(log.results.size(), 2u);
    EXPECT_FALSE(log.results["bad"].success);
    EXPECT_EQ(log.results["bad"].error, "Decode worker failure: unknown exception");
    EXPECT_TRUE(log.results["good"].success);
    EXPECT_EQ(pool.getWorkerCount(), 1);
    EXPECT_EQ(pool.getPendingCount(), 0u);
}

TEST(DecodeWorkerPoolTest, NonStandardExceptionInlineIsRejected) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodePoolOptions options = noWarmup(1);
    options.warmupRequests = 10;
    DecodeWorkerPool pool(backend, options);

    ReplyLog log;
    pool.decode(labelSource("throwint"), log.record("bad"));
    EXPECT_EQ(pool.pumpReplies(), 1u);

    EXPECT_FALSE(log.results["bad"].success);
    EXPECT_NE(log.results["bad"].error.find("unknown exception"), std::string::npos);
}

TEST(DecodeWorkerPoolTest, ShutdownRejectsRequestsLeftInInbox) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodeWorkerPool pool(backend, noWarmup(1));

    backend->closeGate();
    ReplyLog log;
    pool.decode(labelSource("2x2:first"), log.record("first"));
    // Wait for the worker to be busy on the first request
    for (int i = 0; i < 400 && backend->decodeCount() == 0; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(backend->decodeCount(), 1u);
    pool.decode(labelSource("2x2:second"), log.record("second"));

    std::thread releaser([&backend]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        backend->openGate();
    });
    pool.shutdown();
    releaser.join();

    pool.pumpReplies();
    ASSERT_EQ(log.results.size(), 2u);
    EXPECT_TRUE(log.results["first"].success);
    EXPECT_FALSE(log.results["second"].success);
    EXPECT_NE(log.results["second"].error.find("stopped"), std::string::npos);
    EXPECT_EQ(backend->decodeCount(), 1u);
    EXPECT_EQ(pool.getPendingCount(), 0u);
}

TEST(DecodeWorkerPoolTest, ShutdownIsIdempotentAndFallsBackToInline) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodeWorkerPool pool(backend, noWarmup(2));

    pool.shutdown();
    pool.shutdown();
    EXPECT_FALSE(pool.hasWorkers());

    ReplyLog log;
    pool.decode(labelSource("1x1"), log.record("1x1"));
    EXPECT_EQ(pool.getInlineDecodeCount(), 1u);
    EXPECT_EQ(pool.pumpReplies(), 1u);
    EXPECT_TRUE(log.results["1x1"].success);
}

TEST(DecodeWorkerPoolTest, NotifierFiresForEveryReply) {
    auto backend = std::make_shared<FakeDecodeBackend>();
    DecodeWorkerPool pool(backend, noWarmup(2));

    std::atomic<int> notified{0};
    pool.setReplyNotifier([&notified]() { notified++; });

    ReplyLog log;
    pool.decode(labelSource("1x1:a"), log.record("a"));
    pool.decode(labelSource("1x1:b"), log.record("b"));
    pumpUntil(pool, log, 2);

    EXPECT_EQ(notified.load(), 2);
    pool.setReplyNotifier(nullptr);
}

TEST(DecodeWorkerPoolTest, MissingBackendRejectsRequests) {
    DecodePoolOptions options = noWarmup(1);
    options.warmupRequests = 1;
    DecodeWorkerPool pool(nullptr, options);

    ReplyLog log;
    pool.decode(labelSource("1x1"), log.record("1x1"));
    pool.pumpReplies();

    EXPECT_FALSE(log.results["1x1"].success);
    EXPECT_FALSE(log.results["1x1"].error.empty());
}
