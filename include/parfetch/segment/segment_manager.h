#pragma once

#include <parfetch/config/config.h>
#include <parfetch/core/types.h>
#include <parfetch/integrity/integrity_verifier.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace parfetch::segment {

enum class SegmentState { Pending, Active, Complete, Error, Slow };

std::string_view segmentStateToString(SegmentState s) noexcept;

// End marker for a single-stream segment of unknown size
inline constexpr std::uint64_t kOpenEnd = std::numeric_limits<std::uint64_t>::max();

/**
 * One contiguous slice of the resource.
 *
 * downloadedOffset counts bytes from range.start that are flushed and hashed;
 * receivedOffset also counts bytes still sitting in the write buffer.
 */
struct Segment {
    SegmentId id{0};
    ByteRange range;
    std::uint64_t downloadedOffset{0};
    std::uint64_t receivedOffset{0};
    SegmentState state{SegmentState::Pending};
    ConnectionId connection{kNoConnection};
    integrity::Checkpoint checkpoint;
    bool leased{false};
    double throughputBps{0.0};

    [[nodiscard]] bool openEnded() const noexcept { return range.end == kOpenEnd; }
    [[nodiscard]] std::uint64_t remaining() const noexcept {
        return openEnded() ? kOpenEnd : range.length() - std::min(range.length(), receivedOffset);
    }
    // Absolute offset of the next byte to request
    [[nodiscard]] std::uint64_t resumeOffset() const noexcept { return range.start + receivedOffset; }
};

struct SplitResult {
    SegmentId source{0};
    SegmentId created{0};
    ByteRange sourceRange;
    ByteRange createdRange;
};

// How many received bytes fall inside the segment, and whether it is done.
struct Admission {
    std::size_t accepted{0};
    bool stop{false};
};

struct CompletionResult {
    bool completed{false};
    std::optional<SplitResult> split;
};

/**
 * Owns the segment table of one download.
 *
 * Every mutation and snapshot happens under one mutex, so splits, flush
 * accounting and manifest snapshots never interleave. Time-dependent
 * operations take `now` explicitly.
 */
class SegmentManager {
public:
    using clock = std::chrono::steady_clock;

    // `hashing` empty disables per-segment accumulators.
    SegmentManager(config::SegmentConfig cfg, std::optional<HashAlgo> hashing);

    // Fresh partition of [0, size) into `count` segments; size 0 yields none.
    void partition(std::uint64_t size, std::size_t count);

    // One segment of unknown length (single-stream without size).
    void openEnded();

    /**
     * Replace the table with persisted segments. `hashers` carries restored
     * accumulators keyed by segment id; segments without one restart from 0.
     */
    void restore(std::vector<Segment> segments,
                 std::unordered_map<SegmentId, integrity::SegmentHasher> hashers);

    /**
     * Lease the lowest-offset Pending segment if the active limit allows.
     * The segment becomes Active.
     */
    std::optional<Segment> claimNext(clock::time_point now);

    void assignConnection(SegmentId id, ConnectionId connection);

    // Account `n` received bytes; truncates at the (possibly shrunk) end.
    Admission admitReceived(SegmentId id, std::size_t n);

    /**
     * Flush listener side: bytes at absolute `offset` reached disk. Advances
     * downloadedOffset and the segment accumulator.
     */
    Expected<void> markFlushed(SegmentId id, std::uint64_t offset,
                               std::span<const std::byte> data);

    /**
     * Transfer finished. Completes the segment when every byte is flushed
     * and, if a Slow sibling has enough left, splits its tail.
     */
    CompletionResult markComplete(SegmentId id, clock::time_point now);

    // Return the lease; the segment goes back to Pending with progress kept.
    void releaseLease(SegmentId id);

    // Retries exhausted.
    void markError(SegmentId id);

    // Timeouts make a segment the preferred split candidate.
    void markSlow(SegmentId id);

    // Drop progress (hash mismatch on resume).
    void restartSegment(SegmentId id);

    /**
     * Sample per-segment throughput since the previous call and mark segments
     * below slowThresholdPct of the mean as Slow. Returns the newly slow ids.
     */
    std::vector<SegmentId> rebalance(clock::time_point now);

    /**
     * Server rate-limit signal. A sustained signal halves the active limit,
     * parks surplus segments and opens the backoff window. Returns parked ids.
     */
    std::vector<SegmentId> onRateLimited(clock::time_point now);

    [[nodiscard]] std::size_t activeLimit(clock::time_point now);
    [[nodiscard]] bool inBackoff(clock::time_point now) const;

    // Stop predicate for a leased segment (parked or no longer running).
    [[nodiscard]] bool shouldStop(SegmentId id) const;

    // For open-ended segments: fix the end at what was received.
    void closeOpenEnd(SegmentId id);

    [[nodiscard]] std::vector<Segment> snapshot() const;
    [[nodiscard]] std::optional<Segment> get(SegmentId id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t leasedCount() const;
    [[nodiscard]] bool allComplete() const;
    [[nodiscard]] bool anyError() const;
    [[nodiscard]] std::uint64_t downloadedBytes() const;
    [[nodiscard]] std::uint64_t receivedBytes() const;

    // Empty when the table partitions [0, size) exactly; otherwise a description.
    [[nodiscard]] std::optional<std::string> checkPartition(std::uint64_t size) const;

private:
    std::optional<SplitResult> trySplitLocked(clock::time_point now);
    [[nodiscard]] std::size_t liveCountLocked() const;
    void refreshLimitLocked(clock::time_point now);

    config::SegmentConfig cfg_;
    std::optional<HashAlgo> hashing_;

    mutable std::mutex mutex_;
    std::map<SegmentId, Segment> segments_;
    std::unordered_map<SegmentId, integrity::SegmentHasher> hashers_;
    std::unordered_map<SegmentId, std::uint64_t> receivedAtTick_;
    SegmentId nextId_{0};

    std::optional<clock::time_point> lastTick_;
    std::deque<clock::time_point> rateLimitHits_;
    std::optional<clock::time_point> backoffUntil_;
    std::size_t activeLimit_{config::kMaxSegmentsCeiling};
};

} // namespace parfetch::segment
