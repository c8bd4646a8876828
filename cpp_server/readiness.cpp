#include "readiness.hpp"
#include "logger.hpp"
#include <algorithm>
#include <thread>

void SleepFor(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

void ShutdownLatch::Trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    cv_.notify_all();
}

bool ShutdownLatch::Triggered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return triggered_;
}

void ShutdownLatch::SleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [this] { return triggered_; });
}

ReadinessResult WaitUntilReady(const std::function<bool()>& probe,
                               const RetryPolicy& policy,
                               const std::string& component,
                               const Sleeper& sleep,
                               const std::function<bool()>& cancelled) {
    ReadinessResult result;
    std::chrono::milliseconds delay = policy.interval;

    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        if (cancelled && cancelled()) {
            result.state = ReadyState::Cancelled;
            Logger::Info("Readiness wait cancelled after " + std::to_string(result.attempts) + " attempt(s)", component);
            return result;
        }
        result.attempts = attempt;

        bool ready = false;
        try {
            ready = probe();
        } catch (const std::exception& e) {
            Logger::Warn(std::string("Readiness probe threw: ") + e.what(), component);
        }

        if (ready) {
            result.state = ReadyState::Ready;
            Logger::Info("Object store ready after " + std::to_string(attempt) + " attempt(s)", component);
            return result;
        }

        if (attempt == policy.max_attempts) break;

        Logger::Warn("Object store not ready (attempt " + std::to_string(attempt) + "/" +
                     std::to_string(policy.max_attempts) + "); retrying in " +
                     std::to_string(delay.count()) + "ms", component);
        sleep(delay);
        result.waited += delay;

        if (policy.multiplier > 1.0) {
            auto next = std::chrono::milliseconds(static_cast<long long>(delay.count() * policy.multiplier));
            delay = std::min(next, policy.max_interval);
        }
    }

    result.state = ReadyState::TimedOut;
    Logger::Error("Object store not ready after " + std::to_string(result.attempts) + " attempt(s)", component);
    return result;
}
