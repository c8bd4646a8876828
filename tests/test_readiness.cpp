#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>
#include "readiness.hpp"

class ReadinessTest : public ::testing::Test {
protected:
    std::vector<std::chrono::milliseconds> sleeps_;

    Sleeper RecordingSleeper() {
        return [this](std::chrono::milliseconds d) { sleeps_.push_back(d); };
    }

    static RetryPolicy Policy(int attempts, long interval_ms) {
        RetryPolicy policy;
        policy.max_attempts = attempts;
        policy.interval = std::chrono::milliseconds(interval_ms);
        return policy;
    }
};

TEST_F(ReadinessTest, ReadyOnFirstProbeDoesNotSleep) {
    ReadinessResult result = WaitUntilReady([] { return true; }, Policy(5, 100), "Test", RecordingSleeper());

    EXPECT_TRUE(result.Ready());
    EXPECT_EQ(result.attempts, 1);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(result.waited.count(), 0);
}

TEST_F(ReadinessTest, BecomesReadyAfterFailures) {
    int calls = 0;
    ReadinessResult result = WaitUntilReady([&calls] { return ++calls == 3; }, Policy(10, 250), "Test",
                                            RecordingSleeper());

    EXPECT_TRUE(result.Ready());
    EXPECT_EQ(result.attempts, 3);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0].count(), 250);
    EXPECT_EQ(sleeps_[1].count(), 250);
    EXPECT_EQ(result.waited.count(), 500);
}

TEST_F(ReadinessTest, GivesUpWithoutSleepingAfterLastAttempt) {
    int calls = 0;
    ReadinessResult result = WaitUntilReady([&calls] { ++calls; return false; }, Policy(4, 10), "Test",
                                            RecordingSleeper());

    EXPECT_FALSE(result.Ready());
    EXPECT_EQ(result.state, ReadyState::TimedOut);
    EXPECT_EQ(result.attempts, 4);
    EXPECT_EQ(calls, 4);
    EXPECT_EQ(sleeps_.size(), 3u);
}

TEST_F(ReadinessTest, ThrowingProbeCountsAsFailure) {
    int calls = 0;
    ReadinessResult result = WaitUntilReady(
        [&calls]() -> bool {
            if (++calls < 2) throw std::runtime_error("connection refused");
            return true;
        },
        Policy(3, 1), "Test", RecordingSleeper());

    EXPECT_TRUE(result.Ready());
    EXPECT_EQ(result.attempts, 2);
}

TEST_F(ReadinessTest, ExponentialBackoffIsCapped) {
    RetryPolicy policy = Policy(5, 100);
    policy.multiplier = 3.0;
    policy.max_interval = std::chrono::milliseconds(500);

    WaitUntilReady([] { return false; }, policy, "Test", RecordingSleeper());

    ASSERT_EQ(sleeps_.size(), 4u);
    EXPECT_EQ(sleeps_[0].count(), 100);
    EXPECT_EQ(sleeps_[1].count(), 300);
    EXPECT_EQ(sleeps_[2].count(), 500);
    EXPECT_EQ(sleeps_[3].count(), 500);
}

TEST_F(ReadinessTest, CancellationStopsBeforeTheNextProbe) {
    int calls = 0;
    bool stop = false;
    ReadinessResult result = WaitUntilReady(
        [&calls] { ++calls; return false; }, Policy(10, 3000), "Test",
        [this, &stop](std::chrono::milliseconds d) {
            sleeps_.push_back(d);
            if (sleeps_.size() == 2) stop = true;
        },
        [&stop] { return stop; });

    EXPECT_EQ(result.state, ReadyState::Cancelled);
    EXPECT_FALSE(result.Ready());
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(calls, 2);
}

TEST_F(ReadinessTest, CancelledBeforeStartNeverProbes) {
    int calls = 0;
    ReadinessResult result =
        WaitUntilReady([&calls] { ++calls; return true; }, Policy(3, 1), "Test", RecordingSleeper(), [] { return true; });

    EXPECT_EQ(result.state, ReadyState::Cancelled);
    EXPECT_EQ(result.attempts, 0);
    EXPECT_EQ(calls, 0);
}

TEST(ShutdownLatchTest, TriggerWakesSleeper) {
    ShutdownLatch latch;
    EXPECT_FALSE(latch.Triggered());

    std::thread trigger([&latch] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        latch.Trigger();
    });
    auto start = std::chrono::steady_clock::now();
    latch.SleepFor(std::chrono::seconds(30));
    auto slept = std::chrono::steady_clock::now() - start;
    trigger.join();

    EXPECT_TRUE(latch.Triggered());
    EXPECT_LT(slept, std::chrono::seconds(10));
}

TEST(ShutdownLatchTest, SleepAfterTriggerReturnsImmediately) {
    ShutdownLatch latch;
    latch.Trigger();
    auto start = std::chrono::steady_clock::now();
    latch.SleepFor(std::chrono::seconds(30));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
}
