#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

struct RateLimiterOptions {
    int requestsPerWindow = 5;
    int windowMs = 1000;
    int jitterMs = 0;              // added to every interval
    int maxSignaledWaitMs = 60000; // ceiling for server-declared waits
};

// Spaces out calls to a quota-constrained API. One instance per run, shared by
// reference between every call site that talks to that API.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using NowFn = std::function<Clock::time_point()>;

    // Both waits go through sleeper; now defaults to Clock::now.
    explicit RateLimiter(RateLimiterOptions options, Sleeper sleeper = {}, NowFn now = {});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Blocks until min_interval() has passed since the previous acquire.
    void acquire();

    // Sleeps for a server-declared wait, capped, without touching the
    // interval bookkeeping. Returns the time actually waited.
    std::chrono::milliseconds honor_retry_after(std::chrono::milliseconds declared);

    std::chrono::milliseconds min_interval() const { return minInterval_; }
    std::chrono::milliseconds max_signaled_wait() const { return maxSignaledWait_; }

private:
    std::chrono::milliseconds minInterval_;
    std::chrono::milliseconds maxSignaledWait_;
    Sleeper sleeper_;
    NowFn now_;

    std::mutex mtx_;
    std::optional<Clock::time_point> lastCall_;
};
