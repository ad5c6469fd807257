#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <parfetch/segment/segment_manager.h>

#include <algorithm>

using namespace parfetch;
using namespace parfetch::segment;
using namespace std::chrono_literals;

namespace {

using Clock = SegmentManager::clock;

// Receive and flush `n` bytes of a leased segment at its current offset.
void feed(SegmentManager& mgr, SegmentId id, std::size_t n) {
    auto seg = mgr.get(id);
    REQUIRE(seg.has_value());
    const auto offset = seg->range.start + seg->downloadedOffset;
    const auto admitted = mgr.admitReceived(id, n);
    REQUIRE(admitted.accepted == n);
    const auto bytes = test::make_payload(n, static_cast<std::uint32_t>(id + 1));
    REQUIRE(mgr.markFlushed(id, offset, bytes).ok());
}

void claimAll(SegmentManager& mgr, Clock::time_point now, std::size_t expected) {
    for (std::size_t i = 0; i < expected; ++i)
        REQUIRE(mgr.claimNext(now).has_value());
}

} // namespace

TEST_CASE("SegmentManager: partition tiles the resource", "[segment][manager]") {
    config::SegmentConfig cfg;
    SegmentManager mgr(cfg, HashAlgo::Sha256);

    mgr.partition(10'000'000, 4);
    CHECK(mgr.size() == 4);
    CHECK_FALSE(mgr.checkPartition(10'000'000).has_value());
    CHECK(mgr.checkPartition(10'000'001).has_value());

    auto segs = mgr.snapshot();
    for (std::size_t i = 0; i < segs.size(); ++i) {
        CHECK(segs[i].id == i);
        CHECK(segs[i].range.length() == 2'500'000);
        CHECK(segs[i].state == SegmentState::Pending);
    }

    SECTION("zero-size resource has nothing to do") {
        mgr.partition(0, 4);
        CHECK(mgr.size() == 0);
        CHECK(mgr.allComplete());
    }
}

TEST_CASE("SegmentManager: claims follow offset order", "[segment][manager]") {
    SegmentManager mgr(config::SegmentConfig{}, std::nullopt);
    mgr.partition(300, 3);
    const auto now = Clock::now();

    auto a = mgr.claimNext(now);
    auto b = mgr.claimNext(now);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(a->range.start == 0);
    CHECK(b->range.start == 100);
    CHECK(a->state == SegmentState::Active);
    CHECK(mgr.leasedCount() == 2);

    mgr.releaseLease(a->id);
    auto again = mgr.claimNext(now);
    REQUIRE(again.has_value());
    CHECK(again->id == a->id);
}

TEST_CASE("SegmentManager: admitReceived truncates at the end", "[segment][manager]") {
    SegmentManager mgr(config::SegmentConfig{}, std::nullopt);
    mgr.partition(100, 1);
    REQUIRE(mgr.claimNext(Clock::now()).has_value());

    auto first = mgr.admitReceived(0, 60);
    CHECK(first.accepted == 60);
    CHECK_FALSE(first.stop);

    auto second = mgr.admitReceived(0, 90);
    CHECK(second.accepted == 40);
    CHECK(second.stop);

    auto extra = mgr.admitReceived(0, 10);
    CHECK(extra.accepted == 0);
    CHECK(extra.stop);
    CHECK(mgr.receivedBytes() == 100);
    CHECK(mgr.downloadedBytes() == 0);
}

TEST_CASE("SegmentManager: flush accounting", "[segment][manager]") {
    SegmentManager mgr(config::SegmentConfig{}, HashAlgo::Sha256);
    mgr.partition(1000, 2);
    REQUIRE(mgr.claimNext(Clock::now()).has_value());

    const auto bytes = test::make_payload(100);
    REQUIRE(mgr.admitReceived(0, 100).accepted == 100);

    SECTION("wrong offset is rejected") {
        auto r = mgr.markFlushed(0, 50, bytes);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::IoError);
    }
    SECTION("contiguous flush advances the checkpoint") {
        REQUIRE(mgr.markFlushed(0, 0, bytes).ok());
        auto seg = mgr.get(0);
        REQUIRE(seg.has_value());
        CHECK(seg->downloadedOffset == 100);
        CHECK(seg->checkpoint.covered == 100);

        integrity::SegmentHasher expected;
        expected.update(bytes);
        CHECK(seg->checkpoint.digestHex == expected.digestHex());
    }
    SECTION("completion requires every byte on disk") {
        REQUIRE(mgr.markFlushed(0, 0, bytes).ok());
        CHECK_FALSE(mgr.markComplete(0, Clock::now()).completed);
        CHECK(mgr.get(0)->state == SegmentState::Active);
    }
}

TEST_CASE("SegmentManager: completed segment splits a slow sibling", "[segment][manager][split]") {
    config::SegmentConfig cfg;
    cfg.maxSegments = 8;
    cfg.minSegmentSize = 1000;
    SegmentManager mgr(cfg, HashAlgo::Sha256);
    mgr.partition(100'000, 2);
    const auto now = Clock::now();
    claimAll(mgr, now, 2);

    feed(mgr, 0, 50'000);
    feed(mgr, 1, 1'000);
    mgr.markSlow(1);
    CHECK(mgr.get(1)->state == SegmentState::Slow);

    auto done = mgr.markComplete(0, now);
    CHECK(done.completed);
    REQUIRE(done.split.has_value());
    CHECK(done.split->source == 1);
    CHECK(done.split->created == 2);
    CHECK(done.split->sourceRange == ByteRange{50'000, 75'500});
    CHECK(done.split->createdRange == ByteRange{75'500, 100'000});

    CHECK(mgr.size() == 3);
    CHECK_FALSE(mgr.checkPartition(100'000).has_value());
    CHECK(mgr.get(2)->state == SegmentState::Pending);
    CHECK(mgr.get(1)->downloadedOffset == 1'000);

    SECTION("the new segment can be claimed") {
        auto next = mgr.claimNext(now);
        REQUIRE(next.has_value());
        CHECK(next->id == 2);
    }
    SECTION("the shrunk segment stops at its new end") {
        auto tail = mgr.admitReceived(1, 30'000);
        CHECK(tail.accepted == 24'500);
        CHECK(tail.stop);
    }
}

TEST_CASE("SegmentManager: split needs room", "[segment][manager][split]") {
    config::SegmentConfig cfg;
    cfg.minSegmentSize = 1000;
    const auto now = Clock::now();

    SECTION("slow segment with too little left") {
        cfg.maxSegments = 8;
        SegmentManager mgr(cfg, std::nullopt);
        mgr.partition(4'000, 2);
        claimAll(mgr, now, 2);
        feed(mgr, 0, 2'000);
        feed(mgr, 1, 500);
        mgr.markSlow(1);
        // 1500 left, below twice the minimum segment size
        CHECK_FALSE(mgr.markComplete(0, now).split.has_value());
    }
    SECTION("live segment count at the maximum") {
        cfg.maxSegments = 2;
        SegmentManager mgr(cfg, std::nullopt);
        mgr.partition(100'000, 3);
        claimAll(mgr, now, 2);
        feed(mgr, 0, mgr.get(0)->range.length());
        mgr.markSlow(1);
        CHECK_FALSE(mgr.markComplete(0, now).split.has_value());
    }
    SECTION("no slow segment") {
        cfg.maxSegments = 8;
        SegmentManager mgr(cfg, std::nullopt);
        mgr.partition(100'000, 2);
        claimAll(mgr, now, 2);
        feed(mgr, 0, 50'000);
        CHECK_FALSE(mgr.markComplete(0, now).split.has_value());
    }
}

TEST_CASE("SegmentManager: rebalance marks the laggard", "[segment][manager][rebalance]") {
    config::SegmentConfig cfg;
    cfg.slowThresholdPct = 0.20;
    SegmentManager mgr(cfg, std::nullopt);
    mgr.partition(40'000, 4);
    const auto t0 = Clock::now();
    claimAll(mgr, t0, 4);

    CHECK(mgr.rebalance(t0).empty()); // baseline only

    for (SegmentId id = 0; id < 3; ++id)
        REQUIRE(mgr.admitReceived(id, 1'000).accepted == 1'000);
    REQUIRE(mgr.admitReceived(3, 10).accepted == 10);

    auto slow = mgr.rebalance(t0 + 1s);
    REQUIRE(slow.size() == 1);
    CHECK(slow[0] == 3);
    CHECK(mgr.get(3)->state == SegmentState::Slow);
    CHECK(mgr.get(3)->throughputBps == 10.0);
    CHECK(mgr.get(0)->state == SegmentState::Active);

    SECTION("a recovered segment returns to Active") {
        for (SegmentId id = 0; id < 4; ++id)
            REQUIRE(mgr.admitReceived(id, 1'000).accepted == 1'000);
        CHECK(mgr.rebalance(t0 + 2s).empty());
        CHECK(mgr.get(3)->state == SegmentState::Active);
    }
}

TEST_CASE("SegmentManager: sustained rate limiting halves concurrency",
          "[segment][manager][ratelimit]") {
    config::SegmentConfig cfg;
    cfg.maxSegments = 16;
    cfg.minSegmentSize = 1000;
    cfg.rateLimitStrikes = 2;
    cfg.rateLimitWindow = 5s;
    cfg.rateLimitBackoff = 10s;
    SegmentManager mgr(cfg, std::nullopt);
    mgr.partition(160'000, 16);
    const auto t0 = Clock::now();
    claimAll(mgr, t0, 16);
    CHECK(mgr.activeLimit(t0) == 16);

    // One signal is not sustained
    CHECK(mgr.onRateLimited(t0).empty());
    CHECK(mgr.activeLimit(t0) == 16);
    CHECK_FALSE(mgr.inBackoff(t0));

    auto parked = mgr.onRateLimited(t0 + 1s);
    REQUIRE(parked.size() == 8);
    std::sort(parked.begin(), parked.end());
    for (std::size_t i = 0; i < parked.size(); ++i)
        CHECK(parked[i] == 8 + i);
    CHECK(mgr.activeLimit(t0 + 1s) == 8);
    CHECK(mgr.inBackoff(t0 + 1s));
    CHECK(mgr.shouldStop(15));
    CHECK_FALSE(mgr.shouldStop(0));

    // Parked segments still hold their lease until the worker returns it
    CHECK_FALSE(mgr.claimNext(t0 + 1s).has_value());
    mgr.releaseLease(15);
    CHECK_FALSE(mgr.claimNext(t0 + 1s).has_value());

    // No growth while backing off
    feed(mgr, 0, 10'000);
    mgr.markSlow(1);
    auto during = mgr.markComplete(0, t0 + 2s);
    CHECK(during.completed);
    CHECK_FALSE(during.split.has_value());

    SECTION("a signal during backoff only extends the window") {
        CHECK(mgr.onRateLimited(t0 + 5s).empty());
        CHECK(mgr.activeLimit(t0 + 5s) == 8);
        CHECK(mgr.inBackoff(t0 + 12s));
        CHECK_FALSE(mgr.inBackoff(t0 + 16s));
    }
    SECTION("the limit returns once the window elapses") {
        const auto later = t0 + 12s;
        CHECK_FALSE(mgr.inBackoff(later));
        CHECK(mgr.activeLimit(later) == 16);
        feed(mgr, 2, 10'000);
        auto after = mgr.markComplete(2, later);
        CHECK(after.completed);
        REQUIRE(after.split.has_value());
        CHECK(after.split->source == 1);
        CHECK(after.split->created == 16);
        CHECK_FALSE(mgr.checkPartition(160'000).has_value());
    }
}

TEST_CASE("SegmentManager: restore", "[segment][manager][resume]") {
    config::SegmentConfig cfg;

    Segment a;
    a.id = 0;
    a.range = {0, 1'000};
    a.downloadedOffset = 400;
    Segment b;
    b.id = 3;
    b.range = {1'000, 2'000};
    b.downloadedOffset = 1'000;

    SECTION("segments without an accumulator restart") {
        SegmentManager mgr(cfg, HashAlgo::Sha256);
        mgr.restore({a, b}, {});
        CHECK(mgr.get(0)->downloadedOffset == 0);
        CHECK(mgr.get(0)->state == SegmentState::Pending);
        CHECK(mgr.get(3)->downloadedOffset == 0);
        CHECK_FALSE(mgr.checkPartition(2'000).has_value());
    }
    SECTION("a matching accumulator keeps the progress") {
        SegmentManager mgr(cfg, HashAlgo::Sha256);
        const auto prefix = test::make_payload(400);
        integrity::SegmentHasher h;
        h.update(prefix);
        std::unordered_map<SegmentId, integrity::SegmentHasher> hashers;
        hashers.emplace(0, std::move(h));
        mgr.restore({a, b}, std::move(hashers));

        auto seg = mgr.get(0);
        CHECK(seg->downloadedOffset == 400);
        CHECK(seg->receivedOffset == 400);
        CHECK(seg->resumeOffset() == 400);
        CHECK(mgr.downloadedBytes() == 400);
    }
    SECTION("without hashing the offsets are trusted") {
        SegmentManager mgr(cfg, std::nullopt);
        mgr.restore({a, b}, {});
        CHECK(mgr.get(0)->downloadedOffset == 400);
        CHECK(mgr.get(3)->state == SegmentState::Complete);
        CHECK(mgr.downloadedBytes() == 1'400);

        // Completed segments are never handed out again
        auto claimed = mgr.claimNext(Clock::now());
        REQUIRE(claimed.has_value());
        CHECK(claimed->id == 0);
    }
}

TEST_CASE("SegmentManager: error and restart", "[segment][manager]") {
    SegmentManager mgr(config::SegmentConfig{}, std::nullopt);
    mgr.partition(1'000, 1);
    REQUIRE(mgr.claimNext(Clock::now()).has_value());
    feed(mgr, 0, 300);

    mgr.markError(0);
    CHECK(mgr.anyError());
    CHECK(mgr.leasedCount() == 0);

    mgr.restartSegment(0);
    auto seg = mgr.get(0);
    CHECK(seg->state == SegmentState::Pending);
    CHECK(seg->downloadedOffset == 0);
    CHECK_FALSE(mgr.anyError());
}

TEST_CASE("SegmentManager: open-ended segment", "[segment][manager]") {
    SegmentManager mgr(config::SegmentConfig{}, std::nullopt);
    mgr.openEnded();
    REQUIRE(mgr.claimNext(Clock::now()).has_value());
    auto a = mgr.admitReceived(0, 5'000);
    CHECK(a.accepted == 5'000);
    CHECK_FALSE(a.stop);
    const auto bytes = test::make_payload(5'000);
    REQUIRE(mgr.markFlushed(0, 0, bytes).ok());

    auto done = mgr.markComplete(0, Clock::now());
    CHECK(done.completed);
    CHECK(mgr.get(0)->range == ByteRange{0, 5'000});
    CHECK(mgr.allComplete());
}
