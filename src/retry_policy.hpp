#pragma once

#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

template <class T>
struct RetryOutcome {
    CallResult<T> result;
    int attempts = 0;
    std::chrono::milliseconds waited{0};
};

// Bounded retry loop shared by the catalog, page download and delivery paths.
// Transient failures follow the back-off schedule; rate-limited responses
// wait the server-declared time instead, without advancing the schedule, but
// still use up an attempt. Non-retryable failures return immediately.
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using BackoffFn = std::function<std::chrono::milliseconds(int)>;
    // Receives the declared wait, sleeps, and returns the time actually slept.
    using RateLimitHandler = std::function<std::chrono::milliseconds(std::chrono::milliseconds)>;

    RetryPolicy(int maxAttempts,
                BackoffFn backoff,
                Sleeper sleeper = {},
                std::chrono::milliseconds maxSignaledWait = std::chrono::milliseconds(60000));

    // min(base * 2^(n-1), cap) for the n-th transient failure.
    static BackoffFn exponential(std::chrono::milliseconds base, std::chrono::milliseconds cap);
    // step * n for the n-th transient failure.
    static BackoffFn linear(std::chrono::milliseconds step);

    void set_rate_limit_handler(RateLimitHandler handler) { rateLimitHandler_ = std::move(handler); }

    int max_attempts() const { return maxAttempts_; }

    template <class T, class Fn>
    RetryOutcome<T> run(const std::string& what, Fn&& attempt) const {
        RetryOutcome<T> out{transient_failure("not attempted"), 0, std::chrono::milliseconds(0)};
        int transientCount = 0;
        while (out.attempts < maxAttempts_) {
            ++out.attempts;
            out.result = attempt(out.attempts);
            if (is_ok(out.result)) return out;

            const bool lastAttempt = out.attempts >= maxAttempts_;
            bool stop = false;
            std::chrono::milliseconds wait{0};
            std::visit([&](const auto& alt) {
                using A = std::decay_t<decltype(alt)>;
                if constexpr (std::is_same_v<A, Ok<T>>) {
                    stop = true;
                } else if constexpr (std::is_same_v<A, RateLimited>) {
                    wait = alt.waitHint;
                    if (wait.count() <= 0) wait = backoff_(std::max(1, transientCount));
                } else {
                    if (!alt.retryable) {
                        stop = true;
                    } else {
                        wait = backoff_(++transientCount);
                    }
                }
            }, out.result);

            log_warn("RETRY", what + " attempt " + std::to_string(out.attempts) + "/" +
                     std::to_string(maxAttempts_) + " failed: " + describe(out.result));
            if (stop || lastAttempt) return out;

            if (std::holds_alternative<RateLimited>(out.result)) {
                if (rateLimitHandler_) {
                    out.waited += rateLimitHandler_(wait);
                } else {
                    auto capped = std::min(wait, maxSignaledWait_);
                    sleeper_(capped);
                    out.waited += capped;
                }
            } else {
                sleeper_(wait);
                out.waited += wait;
            }
        }
        return out;
    }

private:
    int maxAttempts_;
    BackoffFn backoff_;
    Sleeper sleeper_;
    std::chrono::milliseconds maxSignaledWait_;
    RateLimitHandler rateLimitHandler_;
};
