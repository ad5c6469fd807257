#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace parfetch::bandwidth {

/**
 * Sliding-window throughput and smoothed RTT estimates for one download.
 * Feeds the bandwidth-delay product used to size initial parallelism.
 */
class BandwidthMonitor {
public:
    using clock = std::chrono::steady_clock;

    static constexpr std::size_t kSampleWindow = 10;
    static constexpr std::size_t kRttWindow = 20;
    static constexpr double kEwmaAlpha = 0.2;

    // Record the cumulative byte count observed at `now`.
    void record(std::uint64_t totalBytes, clock::time_point now = clock::now());
    void recordRtt(std::chrono::microseconds rtt);

    // Bytes per second across the sample window, 0 with fewer than two samples.
    [[nodiscard]] double currentSpeed() const;
    [[nodiscard]] std::optional<std::chrono::microseconds> smoothedRtt() const;
    [[nodiscard]] std::optional<std::chrono::microseconds> minRtt() const;
    [[nodiscard]] std::optional<std::uint64_t> bandwidthDelayProduct() const;

    // ceil(BDP / windowBytes); empty until both throughput and RTT are known.
    [[nodiscard]] std::optional<std::size_t> optimalSegmentCount(std::uint64_t windowBytes) const;

    void reset();

private:
    mutable std::mutex mutex_;
    std::deque<std::pair<clock::time_point, std::uint64_t>> samples_;
    std::deque<std::chrono::microseconds> rttSamples_;
    std::optional<double> smoothedRttUs_;
};

} // namespace parfetch::bandwidth
