#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <parfetch/bandwidth/bandwidth_monitor.h>

using namespace parfetch::bandwidth;
using namespace std::chrono_literals;
using Catch::Approx;

TEST_CASE("BandwidthMonitor: throughput over the sample window", "[bandwidth][monitor]") {
    BandwidthMonitor m;
    const auto t0 = BandwidthMonitor::clock::now();

    CHECK(m.currentSpeed() == 0.0);
    m.record(0, t0);
    CHECK(m.currentSpeed() == 0.0);

    m.record(500'000, t0 + 500ms);
    m.record(1'000'000, t0 + 1s);
    CHECK(m.currentSpeed() == Approx(1'000'000.0));
}

TEST_CASE("BandwidthMonitor: samples older than ten seconds expire", "[bandwidth][monitor]") {
    BandwidthMonitor m;
    const auto t0 = BandwidthMonitor::clock::now();
    m.record(0, t0);
    m.record(1'000, t0 + 1s);
    // A burst long after the first samples only counts against recent history
    m.record(1'000, t0 + 20s);
    m.record(11'000, t0 + 21s);
    CHECK(m.currentSpeed() == Approx(10'000.0));
}

TEST_CASE("BandwidthMonitor: smoothed RTT and bandwidth-delay product", "[bandwidth][monitor]") {
    BandwidthMonitor m;
    CHECK_FALSE(m.smoothedRtt().has_value());
    CHECK_FALSE(m.optimalSegmentCount(64 * 1024).has_value());

    m.recordRtt(100ms);
    REQUIRE(m.smoothedRtt().has_value());
    CHECK(*m.smoothedRtt() == 100ms);

    m.recordRtt(200ms);
    // EWMA with alpha 0.2: 0.8 * 100 + 0.2 * 200
    CHECK(*m.smoothedRtt() == 120ms);
    CHECK(*m.minRtt() == 100ms);

    // No throughput yet: no estimate
    CHECK_FALSE(m.bandwidthDelayProduct().has_value());

    const auto t0 = BandwidthMonitor::clock::now();
    m.record(0, t0);
    m.record(1'000'000, t0 + 1s);
    auto bdp = m.bandwidthDelayProduct();
    REQUIRE(bdp.has_value());
    CHECK(*bdp >= 119'999);
    CHECK(*bdp <= 120'000);
    // ceil(120000 / 65536)
    CHECK(m.optimalSegmentCount(64 * 1024) == std::optional<std::size_t>(2));
    CHECK_FALSE(m.optimalSegmentCount(0).has_value());

    m.reset();
    CHECK_FALSE(m.smoothedRtt().has_value());
    CHECK(m.currentSpeed() == 0.0);
}
