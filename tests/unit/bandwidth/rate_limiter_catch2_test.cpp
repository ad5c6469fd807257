#include <catch2/catch_test_macros.hpp>

#include <parfetch/bandwidth/rate_limiter.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

using namespace parfetch;
using namespace parfetch::bandwidth;
using namespace std::chrono_literals;

namespace {

auto elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::steady_clock::now() - start;
}

} // namespace

TEST_CASE("RateLimiter: unlimited admits immediately", "[bandwidth][limiter]") {
    auto limiter = makeRateLimiter(0);
    CHECK_FALSE(limiter->enabled());
    const auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 100; ++i)
        REQUIRE(limiter->acquire(1, Priority::Normal, 10'000'000, {}));
    CHECK(elapsedSince(start) < 200ms);
}

TEST_CASE("RateLimiter: global bucket paces transfers", "[bandwidth][limiter]") {
    auto limiter = makeRateLimiter(100'000);
    CHECK(limiter->enabled());
    CHECK(limiter->globalLimit() == 100'000);

    // The bucket starts full: one second of allowance passes at once
    auto start = std::chrono::steady_clock::now();
    REQUIRE(limiter->acquire(1, Priority::Normal, 100'000, {}));
    CHECK(elapsedSince(start) < 200ms);

    // The next half second of allowance has to refill
    start = std::chrono::steady_clock::now();
    REQUIRE(limiter->acquire(1, Priority::Normal, 50'000, {}));
    CHECK(elapsedSince(start) >= 300ms);
}

TEST_CASE("RateLimiter: per-download cap applies on its own", "[bandwidth][limiter]") {
    auto limiter = makeRateLimiter(0);
    limiter->setDownloadLimit(7, 50'000);
    CHECK(limiter->enabled());

    REQUIRE(limiter->acquire(7, Priority::Normal, 50'000, {}));
    auto start = std::chrono::steady_clock::now();
    REQUIRE(limiter->acquire(7, Priority::Normal, 25'000, {}));
    CHECK(elapsedSince(start) >= 300ms);

    // Other downloads are untouched
    start = std::chrono::steady_clock::now();
    REQUIRE(limiter->acquire(8, Priority::Normal, 1'000'000, {}));
    CHECK(elapsedSince(start) < 200ms);

    limiter->removeDownload(7);
    CHECK_FALSE(limiter->enabled());
}

TEST_CASE("RateLimiter: waiting acquire honors cancellation", "[bandwidth][limiter]") {
    auto limiter = makeRateLimiter(1'000);
    REQUIRE(limiter->acquire(1, Priority::Normal, 1'000, {}));

    std::atomic<bool> cancel{false};
    std::thread canceller([&] {
        std::this_thread::sleep_for(100ms);
        cancel = true;
        limiter->wakeAll();
    });
    const auto start = std::chrono::steady_clock::now();
    const bool granted = limiter->acquire(1, Priority::Normal, 1'000, [&] { return cancel.load(); });
    canceller.join();
    CHECK_FALSE(granted);
    CHECK(elapsedSince(start) < 900ms);
}

TEST_CASE("RateLimiter: raising the limit wakes waiters", "[bandwidth][limiter]") {
    auto limiter = makeRateLimiter(1'000);
    REQUIRE(limiter->acquire(1, Priority::Normal, 1'000, {}));

    std::thread raiser([&] {
        std::this_thread::sleep_for(100ms);
        limiter->setGlobalLimit(0);
    });
    const auto start = std::chrono::steady_clock::now();
    CHECK(limiter->acquire(1, Priority::Normal, 100'000, {}));
    raiser.join();
    CHECK(elapsedSince(start) < 2s);
}

TEST_CASE("RateLimiter: higher priority receives the larger share", "[bandwidth][limiter]") {
    auto limiter = makeRateLimiter(20'000);
    REQUIRE(limiter->acquire(99, Priority::Normal, 20'000, {}));

    std::atomic<int> critical{0};
    std::atomic<int> background{0};
    const auto deadline = std::chrono::steady_clock::now() + 1200ms;
    auto run = [&](DownloadId id, Priority p, std::atomic<int>& counter) {
        while (std::chrono::steady_clock::now() < deadline) {
            const ShouldCancel expired = [&] { return std::chrono::steady_clock::now() >= deadline; };
            if (limiter->acquire(id, p, 1'000, expired))
                ++counter;
        }
    };
    std::thread a(run, 1, Priority::Critical, std::ref(critical));
    std::thread b(run, 2, Priority::Background, std::ref(background));
    a.join();
    b.join();

    CHECK(critical.load() > 0);
    CHECK(critical.load() > 2 * background.load());
}
