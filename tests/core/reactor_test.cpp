#include <gtest/gtest.h>
#include <peerlink/core/reactor.hpp>
#include <atomic>
#include <thread>
#include <vector>

namespace peerlink::core::test {

using namespace std::chrono_literals;

TEST(ReactorTest, PostedCallbacksRunInOrder) {
    Reactor reactor;
    std::vector<int> order;

    for (int i = 0; i < 5; ++i) {
        reactor.post([&order, i]() { order.push_back(i); });
    }

    ASSERT_TRUE(reactor.runUntil([&]() { return order.size() == 5; }, 1000ms));
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(ReactorTest, TimerFiresAfterDelay) {
    Reactor reactor;
    bool fired = false;

    auto start = std::chrono::steady_clock::now();
    auto id = reactor.schedule(30ms, [&]() { fired = true; });
    EXPECT_NE(id, Reactor::kInvalidTimer);

    ASSERT_TRUE(reactor.runUntil([&]() { return fired; }, 1000ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(ReactorTest, CancelledTimerDoesNotFire) {
    Reactor reactor;
    bool fired = false;
    bool marker = false;

    auto id = reactor.schedule(20ms, [&]() { fired = true; });
    reactor.cancel(id);
    reactor.schedule(60ms, [&]() { marker = true; });

    ASSERT_TRUE(reactor.runUntil([&]() { return marker; }, 1000ms));
    EXPECT_FALSE(fired);
    EXPECT_EQ(reactor.pendingTimers(), 0u);
}

TEST(ReactorTest, CancelAfterStartStopsTimer) {
    Reactor reactor;
    bool fired = false;

    auto id = reactor.schedule(50ms, [&]() { fired = true; });
    reactor.runFor(10ms);
    EXPECT_EQ(reactor.pendingTimers(), 1u);

    reactor.cancel(id);
    reactor.runFor(100ms);
    EXPECT_FALSE(fired);
    EXPECT_EQ(reactor.pendingTimers(), 0u);
}

TEST(ReactorTest, RunUntilTimesOut) {
    Reactor reactor;
    EXPECT_FALSE(reactor.runUntil([]() { return false; }, 20ms));
}

TEST(ReactorTest, WorkerThreadRunsPostsFromOtherThreads) {
    Reactor reactor;
    reactor.start();
    EXPECT_TRUE(reactor.isRunning());

    std::atomic<int> counter{0};
    std::atomic<bool> on_loop_thread{true};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) {
                reactor.post([&]() {
                    if (!reactor.isLoopThread()) on_loop_thread = false;
                    counter++;
                });
            }
        });
    }
    for (auto& thread : threads) thread.join();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (counter < 100 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }

    reactor.stop();
    EXPECT_FALSE(reactor.isRunning());
    EXPECT_EQ(counter, 100);
    EXPECT_TRUE(on_loop_thread);
}

TEST(ReactorTest, ThrowingCallbackDoesNotBreakLoop) {
    Reactor reactor;
    bool after = false;

    reactor.post([]() { throw Error(ErrorCode::Unknown, "boom"); });
    reactor.post([&]() { after = true; });

    EXPECT_TRUE(reactor.runUntil([&]() { return after; }, 1000ms));
}

} // namespace peerlink::core::test
