#include <catch2/catch_test_macros.hpp>

#include <parfetch/segment/segment_planner.h>

using namespace parfetch;
using namespace parfetch::segment;

TEST_CASE("sizeBucketCap: decimal size buckets", "[segment][planner]") {
    CHECK(sizeBucketCap(0) == 1);
    CHECK(sizeBucketCap(1'000'000) == 1);
    CHECK(sizeBucketCap(1'000'001) == 4);
    CHECK(sizeBucketCap(10'000'000) == 4);
    CHECK(sizeBucketCap(100'000'000) == 8);
    CHECK(sizeBucketCap(1'000'000'000) == 16);
    CHECK(sizeBucketCap(1'000'000'001) == 32);
}

TEST_CASE("initialSegmentCount: clamps the estimate", "[segment][planner]") {
    config::SegmentConfig cfg;

    SECTION("bucket cap without a throughput estimate") {
        CHECK(initialSegmentCount(10'000'000, std::nullopt, cfg) == 4);
        CHECK(initialSegmentCount(500'000'000, std::nullopt, cfg) == 16);
    }
    SECTION("BDP estimate below the cap wins") {
        CHECK(initialSegmentCount(10'000'000, 2, cfg) == 2);
    }
    SECTION("BDP estimate above the cap is capped") {
        CHECK(initialSegmentCount(10'000'000, 30, cfg) == 4);
    }
    SECTION("small resources use one segment") {
        CHECK(initialSegmentCount(1'000'000, 8, cfg) == 1);
        CHECK(initialSegmentCount(0, std::nullopt, cfg) == 1);
    }
    SECTION("configured maximum") {
        cfg.maxSegments = 3;
        CHECK(initialSegmentCount(10'000'000, std::nullopt, cfg) == 3);
    }
    SECTION("minimum segment size") {
        cfg.minSegmentSize = 4'000'000;
        CHECK(initialSegmentCount(10'000'000, std::nullopt, cfg) == 2);
    }
    SECTION("configured minimum raises a low estimate") {
        cfg.minSegments = 3;
        CHECK(initialSegmentCount(10'000'000, 1, cfg) == 3);
    }
}

TEST_CASE("splitRange: contiguous tiling", "[segment][planner]") {
    auto r = splitRange(10, 3);
    REQUIRE(r.size() == 3);
    CHECK(r[0] == ByteRange{0, 4});
    CHECK(r[1] == ByteRange{4, 7});
    CHECK(r[2] == ByteRange{7, 10});

    CHECK(splitRange(0, 4).empty());

    SECTION("count larger than size") {
        auto tiny = splitRange(2, 8);
        REQUIRE(tiny.size() == 2);
        CHECK(tiny[1] == ByteRange{1, 2});
    }
    SECTION("zero count means one range") {
        auto one = splitRange(100, 0);
        REQUIRE(one.size() == 1);
        CHECK(one[0] == ByteRange{0, 100});
    }
}
