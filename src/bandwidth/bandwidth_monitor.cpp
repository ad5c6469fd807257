#include <parfetch/bandwidth/bandwidth_monitor.h>

#include <algorithm>

namespace parfetch::bandwidth {

void BandwidthMonitor::record(std::uint64_t totalBytes, clock::time_point now) {
    std::lock_guard<std::mutex> lk(mutex_);
    samples_.emplace_back(now, totalBytes);
    const auto cutoff = now - std::chrono::seconds(10);
    while (!samples_.empty() && samples_.front().first < cutoff)
        samples_.pop_front();
    while (samples_.size() > kSampleWindow)
        samples_.pop_front();
}

void BandwidthMonitor::recordRtt(std::chrono::microseconds rtt) {
    std::lock_guard<std::mutex> lk(mutex_);
    rttSamples_.push_back(rtt);
    while (rttSamples_.size() > kRttWindow)
        rttSamples_.pop_front();
    const double us = static_cast<double>(rtt.count());
    smoothedRttUs_ = smoothedRttUs_ ? (*smoothedRttUs_ * (1.0 - kEwmaAlpha) + us * kEwmaAlpha) : us;
}

double BandwidthMonitor::currentSpeed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (samples_.size() < 2)
        return 0.0;
    const auto& [t0, b0] = samples_.front();
    const auto& [t1, b1] = samples_.back();
    const double elapsed = std::chrono::duration<double>(t1 - t0).count();
    if (elapsed < 0.001 || b1 < b0)
        return 0.0;
    return static_cast<double>(b1 - b0) / elapsed;
}

std::optional<std::chrono::microseconds> BandwidthMonitor::smoothedRtt() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!smoothedRttUs_)
        return std::nullopt;
    return std::chrono::microseconds(static_cast<std::int64_t>(*smoothedRttUs_));
}

std::optional<std::chrono::microseconds> BandwidthMonitor::minRtt() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (rttSamples_.empty())
        return std::nullopt;
    return *std::min_element(rttSamples_.begin(), rttSamples_.end());
}

std::optional<std::uint64_t> BandwidthMonitor::bandwidthDelayProduct() const {
    const double speed = currentSpeed();
    if (speed <= 0.0)
        return std::nullopt;
    auto rtt = smoothedRtt();
    if (!rtt)
        return std::nullopt;
    const double seconds = static_cast<double>(rtt->count()) / 1e6;
    return static_cast<std::uint64_t>(speed * seconds);
}

std::optional<std::size_t> BandwidthMonitor::optimalSegmentCount(std::uint64_t windowBytes) const {
    auto bdp = bandwidthDelayProduct();
    if (!bdp || windowBytes == 0)
        return std::nullopt;
    return static_cast<std::size_t>((*bdp + windowBytes - 1) / windowBytes);
}

void BandwidthMonitor::reset() {
    std::lock_guard<std::mutex> lk(mutex_);
    samples_.clear();
    rttSamples_.clear();
    smoothedRttUs_.reset();
}

} // namespace parfetch::bandwidth
