#ifndef READINESS_HPP
#define READINESS_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>

enum class ReadyState {
    Ready,
    TimedOut,
    Cancelled
};

struct ReadinessResult {
    ReadyState state = ReadyState::TimedOut;
    int attempts = 0;
    std::chrono::milliseconds waited{0};

    bool Ready() const { return state == ReadyState::Ready; }
};

// Fixed interval when multiplier is 1.0, exponential otherwise (capped at max_interval).
struct RetryPolicy {
    int max_attempts = 10;
    std::chrono::milliseconds interval{1000};
    double multiplier = 1.0;
    std::chrono::milliseconds max_interval{30000};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

void SleepFor(std::chrono::milliseconds duration);

// Set once by the signal waiter; sleeps on it end early when it fires.
class ShutdownLatch {
public:
    void Trigger();
    bool Triggered() const;
    void SleepFor(std::chrono::milliseconds duration);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool triggered_ = false;
};

// Probes until it returns true or max_attempts probes have failed. A probe
// that throws counts as a failure. Never sleeps after the last attempt.
// `cancelled` is checked before every probe; once it returns true the wait
// ends with ReadyState::Cancelled.
ReadinessResult WaitUntilReady(const std::function<bool()>& probe,
                               const RetryPolicy& policy,
                               const std::string& component,
                               const Sleeper& sleep = SleepFor,
                               const std::function<bool()>& cancelled = nullptr);

#endif // READINESS_HPP
