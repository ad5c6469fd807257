#include <catch2/catch_test_macros.hpp>

#include <parfetch/orchestrator/event_channel.h>

#include <future>
#include <thread>

using namespace parfetch;
using namespace parfetch::orchestrator;
using namespace std::chrono_literals;

TEST_CASE("EventChannel: full queue drops progress only", "[orchestrator][events]") {
    EventChannel ch(2);
    REQUIRE(ch.publish(Added{1, "https://a/x"}));
    REQUIRE(ch.publish(StateChange{1, DownloadState::Probing, DownloadState::Active}));
    CHECK(ch.size() == 2);

    CHECK_FALSE(ch.publish(ProgressUpdate{1, 10, 10}));
    CHECK(ch.dropped() == 1);
    CHECK(ch.size() == 2);

    auto first = ch.tryReceive();
    REQUIRE(first.has_value());
    CHECK(std::holds_alternative<Added>(*first));
    CHECK(eventDownloadId(*first) == 1);

    // Space again: progress gets through
    CHECK(ch.publish(ProgressUpdate{1, 20, 20}));
    CHECK(ch.dropped() == 1);
}

TEST_CASE("EventChannel: publish never blocks without a consumer", "[orchestrator][events]") {
    EventChannel ch(2);
    auto producer = std::async(std::launch::async, [&] {
        std::size_t accepted = 0;
        for (DownloadId id = 1; id <= 3; ++id)
            accepted += ch.publish(StateChange{id, DownloadState::Probing, DownloadState::Active})
                            ? 1
                            : 0;
        return accepted;
    });
    REQUIRE(producer.wait_for(2s) == std::future_status::ready);
    CHECK(producer.get() == 3);
    CHECK(ch.size() == 3);
    CHECK(ch.dropped() == 0);

    SECTION("lifecycle events past the overflow allowance are dropped and counted") {
        CHECK(ch.publish(Complete{4, "/tmp/d", 1, std::nullopt}));
        CHECK_FALSE(ch.publish(Complete{5, "/tmp/e", 1, std::nullopt}));
        CHECK(ch.size() == 4);
        CHECK(ch.dropped() == 1);
        CHECK(ch.droppedLifecycle() == 1);
    }
}

TEST_CASE("EventChannel: lifecycle event evicts the oldest progress", "[orchestrator][events]") {
    EventChannel ch(2);
    REQUIRE(ch.publish(ProgressUpdate{1, 10, 10}));
    REQUIRE(ch.publish(Added{2, "u"}));

    REQUIRE(ch.publish(Complete{1, "/tmp/x", 5, std::nullopt}));
    CHECK(ch.size() == 2);
    CHECK(ch.dropped() == 1);
    CHECK(ch.droppedLifecycle() == 0);

    auto first = ch.tryReceive();
    REQUIRE(first.has_value());
    CHECK(std::holds_alternative<Added>(*first));
    auto done = ch.tryReceive();
    REQUIRE(done.has_value());
    REQUIRE(std::holds_alternative<Complete>(*done));
    CHECK(std::get<Complete>(*done).size == 5);
}

TEST_CASE("EventChannel: state changes of one download fold together when full",
          "[orchestrator][events]") {
    EventChannel ch(2);
    REQUIRE(ch.publish(Added{1, "u"}));
    REQUIRE(ch.publish(StateChange{1, DownloadState::Probing, DownloadState::Segmenting}));

    REQUIRE(ch.publish(StateChange{1, DownloadState::Segmenting, DownloadState::Active}));
    CHECK(ch.size() == 2);
    CHECK(ch.dropped() == 0);

    REQUIRE(ch.tryReceive().has_value());
    auto change = ch.tryReceive();
    REQUIRE(change.has_value());
    REQUIRE(std::holds_alternative<StateChange>(*change));
    CHECK(std::get<StateChange>(*change).from == DownloadState::Probing);
    CHECK(std::get<StateChange>(*change).to == DownloadState::Active);

    SECTION("not across another event of the same download") {
        EventChannel full(2);
        REQUIRE(full.publish(StateChange{1, DownloadState::Probing, DownloadState::Active}));
        REQUIRE(full.publish(ErrorEvent{1, Error{ErrorCode::Timeout, "slow"}, false}));
        REQUIRE(full.publish(StateChange{1, DownloadState::Active, DownloadState::Paused}));
        CHECK(full.size() == 3);
    }
}

TEST_CASE("EventChannel: close", "[orchestrator][events]") {
    EventChannel ch(4);

    SECTION("publish after close is discarded") {
        ch.close();
        CHECK(ch.closed());
        CHECK_FALSE(ch.publish(Added{2, "u"}));
        CHECK(ch.size() == 0);
    }
    SECTION("close wakes a blocked receiver") {
        std::thread closer([&] {
            std::this_thread::sleep_for(30ms);
            ch.close();
        });
        const auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(ch.receive(5s).has_value());
        CHECK(std::chrono::steady_clock::now() - start < 4s);
        closer.join();
    }
    SECTION("receive times out on an empty channel") {
        CHECK_FALSE(ch.receive(10ms).has_value());
    }
}

TEST_CASE("ProgressThrottle: one emission per interval", "[orchestrator][events]") {
    ProgressThrottle throttle;
    const auto t0 = ProgressThrottle::clock::now();

    CHECK(throttle.admit(1, t0));
    CHECK_FALSE(throttle.admit(1, t0 + 10ms));
    CHECK(throttle.admit(2, t0 + 10ms)); // independent per download
    CHECK(throttle.admit(1, t0 + 40ms));

    throttle.forget(1);
    CHECK(throttle.admit(1, t0 + 41ms));
}

TEST_CASE("downloadStateToString: names", "[orchestrator]") {
    CHECK(downloadStateToString(DownloadState::SingleStream) == "single_stream");
    CHECK(downloadStateToString(DownloadState::Cancelled) == "cancelled");
    CHECK(isTerminal(DownloadState::Complete));
    CHECK_FALSE(isTerminal(DownloadState::Failed));
}
