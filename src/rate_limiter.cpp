#include "rate_limiter.hpp"

#include "log.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

static std::chrono::milliseconds compute_min_interval(const RateLimiterOptions& o) {
    if (o.requestsPerWindow <= 0) throw std::invalid_argument("requestsPerWindow must be positive");
    if (o.windowMs < 0 || o.jitterMs < 0) throw std::invalid_argument("windowMs and jitterMs must not be negative");
    // ceil(windowMs / requestsPerWindow)
    long long perCall = (static_cast<long long>(o.windowMs) + o.requestsPerWindow - 1) / o.requestsPerWindow;
    return std::chrono::milliseconds(perCall + o.jitterMs);
}

RateLimiter::RateLimiter(RateLimiterOptions options, Sleeper sleeper, NowFn now)
    : minInterval_(compute_min_interval(options)),
      maxSignaledWait_(std::max(0, options.maxSignaledWaitMs)),
      sleeper_(std::move(sleeper)),
      now_(std::move(now)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (!now_) now_ = [] { return Clock::now(); };
}

void RateLimiter::acquire() {
    // Held across the sleep so concurrent callers queue up behind each other.
    std::lock_guard<std::mutex> lk(mtx_);
    if (lastCall_) {
        const auto target = *lastCall_ + minInterval_;
        auto now = now_();
        while (now < target) {
            sleeper_(std::max(std::chrono::milliseconds(1),
                              std::chrono::ceil<std::chrono::milliseconds>(target - now)));
            now = now_();
        }
    }
    lastCall_ = now_();
}

std::chrono::milliseconds RateLimiter::honor_retry_after(std::chrono::milliseconds declared) {
    auto wait = std::clamp(declared, std::chrono::milliseconds(0), maxSignaledWait_);
    if (wait < declared) {
        log_warn("RATE", "server asked for " + std::to_string(declared.count()) + "ms, capping at " +
                 std::to_string(wait.count()) + "ms");
    }
    if (wait.count() > 0) sleeper_(wait);
    return wait;
}
