#include <gtest/gtest.h>
#include "cache/BatchMetadataCache.h"
#include "ledger/errors.h"
#include "mocks/fake_ledger.h"
#include "mocks/mock_collaborators.h"
#include <atomic>
#include <future>
#include <thread>
#include <vector>

using namespace ledgerproof;
using namespace std::chrono_literals;

namespace {

BatchDescriptor descriptor(const std::string &id) {
    BatchDescriptor d;
    d.batchId = id;
    d.storageRef = "batches/" + id + ".json";
    d.transactionCount = 1;
    return d;
}

/// Steady clock the test advances by hand.
struct ManualClock {
    SteadyClock::time_point now = SteadyClock::time_point{} + 1h;
    BatchMetadataCache::Clock fn() {
        return [this] { return now; };
    }
};

BatchMetadataCache::Options options(std::size_t capacity = 16) {
    BatchMetadataCache::Options opts;
    opts.ttl = 60s;
    opts.capacity = capacity;
    return opts;
}

} // namespace

TEST(BatchMetadataCache, HitAfterMiss) {
    std::atomic<int> loads{0};
    BatchMetadataCache cache(
        [&](const std::string &id, const CancellationToken &) -> std::optional<BatchDescriptor> {
            ++loads;
            return descriptor(id);
        },
        options());
    auto first = cache.get("BATCH-2025-01-01-a");
    auto second = cache.get("BATCH-2025-01-01-a");
    ASSERT_TRUE(first && second);
    EXPECT_EQ(second->batchId, "BATCH-2025-01-01-a");
    EXPECT_EQ(loads.load(), 1);
    auto stats = cache.stats();
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(cache.size(), 1u);
}

/**
 * @brief Concurrent misses for one id share a single loader call.
 */
TEST(BatchMetadataCache, SingleFlight) {
    std::atomic<int> loads{0};
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    BatchMetadataCache cache(
        [&](const std::string &id, const CancellationToken &) -> std::optional<BatchDescriptor> {
            ++loads;
            opened.wait();
            return descriptor(id);
        },
        options());

    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    std::atomic<int> found{0};
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&] {
            if (cache.get("BATCH-2025-01-01-shared"))
                ++found;
        });
    }
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (cache.stats().coalesced < kThreads - 1 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);
    gate.set_value();
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(loads.load(), 1);
    EXPECT_EQ(found.load(), kThreads);
    EXPECT_EQ(cache.stats().coalesced, static_cast<uint64_t>(kThreads - 1));
}

TEST(BatchMetadataCache, EntriesExpireAfterTtl) {
    ManualClock clock;
    std::atomic<int> loads{0};
    BatchMetadataCache cache(
        [&](const std::string &id, const CancellationToken &) -> std::optional<BatchDescriptor> {
            ++loads;
            return descriptor(id);
        },
        options(), clock.fn());
    cache.get("BATCH-2025-01-01-a");
    clock.now += 59s;
    cache.get("BATCH-2025-01-01-a");
    EXPECT_EQ(loads.load(), 1);
    clock.now += 2s;
    cache.get("BATCH-2025-01-01-a");
    EXPECT_EQ(loads.load(), 2);
}

TEST(BatchMetadataCache, SweepRemovesExpired) {
    ManualClock clock;
    BatchMetadataCache cache(
        [](const std::string &id, const CancellationToken &) -> std::optional<BatchDescriptor> {
            return descriptor(id);
        },
        options(), clock.fn());
    cache.get("BATCH-2025-01-01-a");
    clock.now += 30s;
    cache.get("BATCH-2025-01-01-b");
    clock.now += 31s;
    EXPECT_EQ(cache.sweep(), 1u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(BatchMetadataCache, NotFoundIsNotCached) {
    std::atomic<int> loads{0};
    BatchMetadataCache cache(
        [&](const std::string &, const CancellationToken &) -> std::optional<BatchDescriptor> {
            ++loads;
            return std::nullopt;
        },
        options());
    EXPECT_FALSE(cache.get("BATCH-2025-01-01-missing").has_value());
    EXPECT_FALSE(cache.get("BATCH-2025-01-01-missing").has_value());
    EXPECT_EQ(loads.load(), 2);
    EXPECT_EQ(cache.size(), 0u);
}

TEST(BatchMetadataCache, FailuresPropagateAndAreNotCached) {
    int loads = 0;
    BatchMetadataCache cache(
        [&](const std::string &id, const CancellationToken &) -> std::optional<BatchDescriptor> {
            if (++loads == 1)
                throw TransientCollaboratorError("get_batch", "timeout");
            return descriptor(id);
        },
        options());
    EXPECT_THROW(cache.get("BATCH-2025-01-01-a"), TransientCollaboratorError);
    EXPECT_TRUE(cache.get("BATCH-2025-01-01-a").has_value());
    EXPECT_EQ(loads, 2);
}

TEST(BatchMetadataCache, CapacityEvictsSoonestExpiry) {
    ManualClock clock;
    BatchMetadataCache cache(
        [](const std::string &id, const CancellationToken &) -> std::optional<BatchDescriptor> {
            return descriptor(id);
        },
        options(2), clock.fn());
    cache.get("BATCH-2025-01-01-a");
    clock.now += 1s;
    cache.get("BATCH-2025-01-01-b");
    clock.now += 1s;
    cache.get("BATCH-2025-01-01-c");
    EXPECT_EQ(cache.size(), 2u);
    auto before = cache.stats().misses;
    cache.get("BATCH-2025-01-01-c");
    cache.get("BATCH-2025-01-01-b");
    EXPECT_EQ(cache.stats().misses, before);
    cache.get("BATCH-2025-01-01-a");
    EXPECT_EQ(cache.stats().misses, before + 1);
}

TEST(BatchMetadataCache, InvalidateForcesReload) {
    std::atomic<int> loads{0};
    BatchMetadataCache cache(
        [&](const std::string &id, const CancellationToken &) -> std::optional<BatchDescriptor> {
            ++loads;
            return descriptor(id);
        },
        options());
    cache.get("BATCH-2025-01-01-a");
    cache.invalidate("BATCH-2025-01-01-a");
    cache.get("BATCH-2025-01-01-a");
    EXPECT_EQ(loads.load(), 2);
}

TEST(BatchMetadataCache, CancelledTokenThrows) {
    BatchMetadataCache cache(
        [](const std::string &id, const CancellationToken &) -> std::optional<BatchDescriptor> {
            return descriptor(id);
        },
        options());
    CancellationSource src;
    src.cancel();
    EXPECT_THROW(cache.get("BATCH-2025-01-01-a", src.token()), Cancelled);
}

/**
 * @brief Coalesced waiters wake as soon as the shared load settles or their
 * own token fires.
 */
TEST(BatchMetadataCache, CoalescedWaitersWakePromptly) {
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    BatchMetadataCache cache(
        [&](const std::string &id, const CancellationToken &) -> std::optional<BatchDescriptor> {
            opened.wait();
            return descriptor(id);
        },
        options());

    auto leader = std::async(std::launch::async, [&] { return cache.get("BATCH-2025-01-01-slow"); });
    auto until = std::chrono::steady_clock::now() + 5s;
    while (cache.stats().misses < 1 && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(1ms);

    // A waiter cancelled by hand leaves without waiting for the loader.
    CancellationSource src;
    std::atomic<bool> waiting{false};
    auto cancelled = std::async(std::launch::async, [&] {
        waiting = true;
        return cache.get("BATCH-2025-01-01-slow", src.token());
    });
    while ((!waiting || cache.stats().coalesced < 1) && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(1ms);
    auto start = std::chrono::steady_clock::now();
    src.cancel();
    EXPECT_THROW(cancelled.get(), Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    // A waiter with a deadline gives up at the deadline.
    CancellationSource timed;
    timed.setTimeout(50ms);
    start = std::chrono::steady_clock::now();
    EXPECT_THROW(cache.get("BATCH-2025-01-01-slow", timed.token()), Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    auto waiter = std::async(std::launch::async, [&] { return cache.get("BATCH-2025-01-01-slow"); });
    while (cache.stats().coalesced < 3 && std::chrono::steady_clock::now() < until)
        std::this_thread::sleep_for(1ms);
    start = std::chrono::steady_clock::now();
    gate.set_value();
    auto shared = waiter.get();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    ASSERT_TRUE(shared);
    EXPECT_EQ(shared->batchId, "BATCH-2025-01-01-slow");
    EXPECT_TRUE(leader.get());
    EXPECT_EQ(cache.stats().fetches, 1u);
}

TEST(BatchMetadataCache, StartStopSweeper) {
    BatchMetadataCache::Options opts = options();
    opts.sweepInterval = 1s;
    BatchMetadataCache cache(
        [](const std::string &id, const CancellationToken &) -> std::optional<BatchDescriptor> {
            return descriptor(id);
        },
        opts);
    cache.start();
    cache.start();
    cache.stop();
    cache.stop();
    SUCCEED();
}

/** @brief The anchored root overrides the descriptor's copy. */
TEST(BatchMetadataCacheLedgerLoader, AnchoredRootWins) {
    fixtures::FakeLedger ledger;
    auto d = ledger.addBatch("BATCH-2025-01-01-a", "shop", {"orders"},
                             {fixtures::makeRecord(1), fixtures::makeRecord(2)},
                             fixtures::at("2025-01-01T00:00:00Z"));
    Digest anchored{};
    anchored[0] = 0xee;
    ledger.setAnchoredRoot(d.batchId, anchored);

    RetryPolicy retry;
    BatchMetadataCache cache(BatchMetadataCache::ledgerLoader(ledger, retry), options());
    auto loaded = cache.get(d.batchId);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->merkleRoot, anchored);
}

TEST(BatchMetadataCacheLedgerLoader, MissingRootIsPermanent) {
    fixtures::FakeLedger ledger;
    auto d = ledger.addBatch("BATCH-2025-01-01-a", "shop", {"orders"},
                             {fixtures::makeRecord(1)}, fixtures::at("2025-01-01T00:00:00Z"));
    ledger.setAnchoredRoot(d.batchId, std::nullopt);
    RetryPolicy retry;
    BatchMetadataCache cache(BatchMetadataCache::ledgerLoader(ledger, retry), options());
    EXPECT_THROW(cache.get(d.batchId), PermanentCollaboratorError);
}

TEST(BatchMetadataCacheLedgerLoader, UnknownBatchSkipsRootLookup) {
    ::testing::StrictMock<MockLedgerClient> ledger;
    EXPECT_CALL(ledger, getBatch("BATCH-2025-01-01-none", ::testing::_))
        .WillOnce(::testing::Return(std::nullopt));
    RetryPolicy retry;
    BatchMetadataCache cache(BatchMetadataCache::ledgerLoader(ledger, retry), options());
    EXPECT_FALSE(cache.get("BATCH-2025-01-01-none").has_value());
}

TEST(BatchMetadataCacheLedgerLoader, RetriesTransientLedgerErrors) {
    fixtures::FakeLedger ledger;
    ledger.addBatch("BATCH-2025-01-01-a", "shop", {"orders"}, {fixtures::makeRecord(1)},
                    fixtures::at("2025-01-01T00:00:00Z"));
    ledger.failNext("get_batch", 1);
    RetryPolicy::Options ro;
    ro.baseDelay = 1ms;
    ro.jitter = 0.0;
    RetryPolicy retry(ro, 1);
    BatchMetadataCache cache(BatchMetadataCache::ledgerLoader(ledger, retry), options());
    EXPECT_TRUE(cache.get("BATCH-2025-01-01-a").has_value());
    EXPECT_EQ(ledger.calls("get_batch"), 2);
}
