#include <gtest/gtest.h>
#include "ledger/errors.h"
#include "utilities/cancellation.hpp"
#include "utilities/worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace ledgerproof;
using namespace std::chrono_literals;

TEST(Cancellation, DefaultTokenNeverFires) {
    CancellationToken token;
    EXPECT_FALSE(token.cancelled());
    EXPECT_NO_THROW(token.throwIfCancelled("test"));
    EXPECT_TRUE(token.waitFor(1ms));
    EXPECT_FALSE(token.deadline().has_value());
}

TEST(Cancellation, CancelPropagatesToChildren) {
    CancellationSource parent;
    CancellationSource child(parent.token());
    EXPECT_FALSE(child.token().cancelled());
    parent.cancel();
    EXPECT_TRUE(child.token().cancelled());
    EXPECT_THROW(child.token().throwIfCancelled("child"), Cancelled);
}

TEST(Cancellation, ChildOfCancelledParentStartsCancelled) {
    CancellationSource parent;
    parent.cancel();
    CancellationSource child(parent.token());
    EXPECT_TRUE(child.token().cancelled());
}

TEST(Cancellation, ChildCancelDoesNotReachParent) {
    CancellationSource parent;
    CancellationSource child(parent.token());
    child.cancel();
    EXPECT_FALSE(parent.token().cancelled());
}

TEST(Cancellation, DeadlineFires) {
    CancellationSource src;
    src.setTimeout(20ms);
    auto token = src.token();
    ASSERT_TRUE(token.deadline().has_value());
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.waitFor(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_TRUE(token.cancelled());
}

TEST(Cancellation, ParentDeadlineBoundsChild) {
    CancellationSource parent;
    parent.setTimeout(10ms);
    CancellationSource child(parent.token());
    child.setTimeout(10s);
    EXPECT_LE(*child.token().deadline(), *parent.token().deadline());
}

TEST(Cancellation, HugeTimeoutSaturates) {
    CancellationSource src;
    src.setTimeout(std::chrono::milliseconds(10000000000000000));
    auto token = src.token();
    ASSERT_TRUE(token.deadline().has_value());
    EXPECT_EQ(*token.deadline(), std::chrono::steady_clock::time_point::max());
    EXPECT_FALSE(token.cancelled());

    src.setTimeout(std::chrono::milliseconds::max());
    EXPECT_EQ(*token.deadline(), std::chrono::steady_clock::time_point::max());
    EXPECT_TRUE(token.waitFor(1ms));
}

TEST(Cancellation, NonPositiveTimeoutFiresAtOnce) {
    CancellationSource src;
    src.setTimeout(std::chrono::milliseconds(-5));
    EXPECT_TRUE(src.token().cancelled());
}

TEST(Cancellation, WaitWakesOnCancel) {
    CancellationSource src;
    auto token = src.token();
    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        src.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.waitFor(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    canceller.join();
}

TEST(Cancellation, CallbacksRunOnceOnCancel) {
    CancellationSource parent;
    CancellationSource child(parent.token());
    int runs = 0;
    int dropped = 0;
    auto kept = child.token().onCancel([&] { ++runs; });
    {
        auto removed = child.token().onCancel([&] { ++dropped; });
    }
    parent.cancel();
    child.cancel();
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(dropped, 0);

    // Registering on a cancelled token runs the function immediately.
    auto late = child.token().onCancel([&] { ++runs; });
    EXPECT_EQ(runs, 2);

    // A token that can never be cancelled accepts and ignores callbacks.
    auto never = CancellationToken().onCancel([&] { ++runs; });
    EXPECT_EQ(runs, 2);
}

TEST(WorkerPool, RunsAllTasks) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(4);
        EXPECT_EQ(pool.size(), 4u);
        for (int i = 0; i < 100; ++i)
            ASSERT_TRUE(pool.submit([&done] { ++done; }));
        pool.stop();
        EXPECT_FALSE(pool.submit([] {}));
    }
    EXPECT_EQ(done.load(), 100);
}

TEST(WorkerPool, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> done{0};
    WorkerPool pool(1);
    pool.submit([] { throw std::runtime_error("boom"); });
    pool.submit([&done] { ++done; });
    pool.stop();
    EXPECT_EQ(done.load(), 1);
}
