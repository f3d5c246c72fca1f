#include "retry_policy.hpp"

#include <stdexcept>
#include <thread>

RetryPolicy::RetryPolicy(int maxAttempts,
                         BackoffFn backoff,
                         Sleeper sleeper,
                         std::chrono::milliseconds maxSignaledWait)
    : maxAttempts_(maxAttempts),
      backoff_(std::move(backoff)),
      sleeper_(std::move(sleeper)),
      maxSignaledWait_(maxSignaledWait) {
    if (maxAttempts_ < 1) throw std::invalid_argument("maxAttempts must be at least 1");
    if (!backoff_) throw std::invalid_argument("backoff function required");
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

RetryPolicy::BackoffFn RetryPolicy::exponential(std::chrono::milliseconds base, std::chrono::milliseconds cap) {
    return [base, cap](int n) {
        long long ms = base.count();
        for (int i = 1; i < n && ms < cap.count(); ++i) ms *= 2;
        return std::min(std::chrono::milliseconds(ms), cap);
    };
}

RetryPolicy::BackoffFn RetryPolicy::linear(std::chrono::milliseconds step) {
    return [step](int n) { return step * std::max(1, n); };
}
