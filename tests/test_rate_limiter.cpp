#include <catch2/catch.hpp>

#include "rate_limiter.hpp"
#include "test_support.hpp"

#include <thread>

using namespace std::chrono;
using testing_support::FakeClock;
using testing_support::SleepRecorder;

TEST_CASE("min interval is ceil(window / requests) plus jitter") {
    RateLimiter a(RateLimiterOptions{3, 1000, 10, 60000});
    REQUIRE(a.min_interval() == milliseconds(344));

    RateLimiter b(RateLimiterOptions{5, 1000, 0, 60000});
    REQUIRE(b.min_interval() == milliseconds(200));
}

TEST_CASE("consecutive acquires are spaced by the minimum interval") {
    FakeClock clock;
    RateLimiter limiter(RateLimiterOptions{1, 40, 5, 60000}, clock.sleeper(), clock.now_fn());
    for (int i = 0; i < 5; ++i) limiter.acquire();

    REQUIRE(clock.sleeps == std::vector<milliseconds>(4, milliseconds(45)));
    REQUIRE(clock.current.time_since_epoch() == milliseconds(180));
}

TEST_CASE("acquire only waits for the remainder of the interval") {
    FakeClock clock;
    RateLimiter limiter(RateLimiterOptions{5, 1000, 0, 60000}, clock.sleeper(), clock.now_fn());
    limiter.acquire();
    clock.advance(milliseconds(150));
    limiter.acquire();
    clock.advance(milliseconds(500));
    limiter.acquire();

    REQUIRE(clock.sleeps == std::vector<milliseconds>{milliseconds(50)});
}

TEST_CASE("acquires from several threads are serialized") {
    FakeClock clock;
    RateLimiter limiter(RateLimiterOptions{2, 60, 0, 60000}, clock.sleeper(), clock.now_fn());
    const int n = 6;
    std::vector<std::thread> threads;
    for (int i = 0; i < n; ++i) threads.emplace_back([&] { limiter.acquire(); });
    for (auto& t : threads) t.join();

    REQUIRE(clock.sleeps == std::vector<milliseconds>(n - 1, milliseconds(30)));
}

TEST_CASE("first acquire does not wait") {
    FakeClock clock;
    RateLimiter limiter(RateLimiterOptions{1, 5000, 0, 60000}, clock.sleeper(), clock.now_fn());
    limiter.acquire();
    REQUIRE(clock.sleeps.empty());
}

TEST_CASE("a server-declared wait counts toward the next interval") {
    FakeClock clock;
    RateLimiter limiter(RateLimiterOptions{1, 1000, 0, 60000}, clock.sleeper(), clock.now_fn());
    limiter.acquire();
    REQUIRE(limiter.honor_retry_after(seconds(2)) == milliseconds(2000));
    limiter.acquire();
    REQUIRE(clock.sleeps == std::vector<milliseconds>{milliseconds(2000)});
}

TEST_CASE("server-declared waits are honored and capped") {
    SleepRecorder rec;
    RateLimiter limiter(RateLimiterOptions{5, 1000, 0, 60000}, rec.fn());

    REQUIRE(limiter.honor_retry_after(seconds(5)) == milliseconds(5000));
    REQUIRE(limiter.honor_retry_after(seconds(120)) == milliseconds(60000));
    REQUIRE(limiter.honor_retry_after(milliseconds(0)) == milliseconds(0));

    REQUIRE(rec.sleeps.size() == 2);
    REQUIRE(rec.sleeps[0] == milliseconds(5000));
    REQUIRE(rec.sleeps[1] == milliseconds(60000));
}

TEST_CASE("rate limiter rejects a non-positive request budget") {
    REQUIRE_THROWS_AS(RateLimiter((RateLimiterOptions{0, 1000, 0, 60000})), std::invalid_argument);
}
