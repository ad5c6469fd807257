#pragma once

#include <parfetch/orchestrator/events.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace parfetch::orchestrator {

/**
 * Bounded outbound event queue. One producer (the orchestrator), any number
 * of consumers that poll or block-receive.
 *
 * publish never blocks: the producer is the control thread shared by every
 * download. When the queue is full an incoming ProgressUpdate is dropped.
 * Any other event first evicts the oldest queued ProgressUpdate, then folds
 * into a queued StateChange when that is the download's latest event.
 * Failing both it takes one of `capacity` overflow slots; once those are
 * used up it is dropped as well. Every drop is counted.
 */
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity);

    // False if the event was dropped or the channel is closed.
    bool publish(Event ev);

    std::optional<Event> tryReceive();
    std::optional<Event> receive(std::chrono::milliseconds timeout);

    // Wakes every waiter; later publishes are discarded.
    void close();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    // Every event that never reached a consumer (progress and lifecycle)
    [[nodiscard]] std::uint64_t dropped() const;
    [[nodiscard]] std::uint64_t droppedLifecycle() const;
    [[nodiscard]] bool closed() const;

private:
    bool evictProgressLocked();
    bool coalesceLocked(const StateChange& change);

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::deque<Event> queue_;
    std::uint64_t dropped_{0};
    std::uint64_t droppedLifecycle_{0};
    bool closed_{false};
};

/**
 * Per-download progress rate limit: at most one emission per interval
 * (30 per second by default).
 */
class ProgressThrottle {
public:
    using clock = std::chrono::steady_clock;

    explicit ProgressThrottle(std::chrono::microseconds minInterval = std::chrono::microseconds(
                                  1'000'000 / 30))
        : minInterval_(minInterval) {}

    bool admit(DownloadId id, clock::time_point now);
    void forget(DownloadId id);

private:
    std::chrono::microseconds minInterval_;
    std::mutex mutex_;
    std::unordered_map<DownloadId, clock::time_point> last_;
};

} // namespace parfetch::orchestrator
