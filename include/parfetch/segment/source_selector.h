#pragma once

#include <parfetch/core/types.h>
#include <parfetch/net/resource.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace parfetch::segment {

/**
 * Per-source counters, as reported in download snapshots.
 */
struct SourceStats {
    std::string url;
    net::MirrorPriority priority{net::MirrorPriority::Secondary};
    std::uint64_t bytes{0};
    double bytesPerSecond{0.0};
    std::uint32_t errors{0}; // consecutive, reset by a success
    std::size_t active{0};
    bool disabled{false};
};

/**
 * Chooses which source (primary URL or mirror) serves each segment.
 *
 * Index 0 is always the primary URL. A source scores
 *   (MB/s + 1) * priority weight / (1 + errors / 2) / (1 + active segments)
 * with weights 1.5, 1.0 and 0.5 for Primary, Secondary and Fallback. Ties go
 * to the lower index. After kMaxErrors consecutive errors a source is
 * disabled and only used when every source is.
 */
class SourceSelector {
public:
    static constexpr std::uint32_t kMaxErrors = 5;
    static constexpr double kEwmaAlpha = 0.3;

    // Replace the source list; drops every assignment.
    void reset(std::vector<net::Mirror> sources);

    // Best source for a newly leased segment.
    std::size_t assign(SegmentId id);

    /**
     * Move a segment off its current source after an error. Empty when no
     * other usable source exists; the assignment is unchanged then.
     */
    std::optional<std::size_t> failover(SegmentId id);

    void recordSuccess(std::size_t source, std::uint64_t bytes, std::chrono::microseconds elapsed);
    void recordError(std::size_t source);

    // The segment's worker ended.
    void release(SegmentId id);

    [[nodiscard]] std::optional<std::size_t> sourceOf(SegmentId id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<SourceStats> stats() const;

private:
    [[nodiscard]] double scoreLocked(std::size_t index) const;
    [[nodiscard]] std::optional<std::size_t> bestLocked(std::optional<std::size_t> exclude,
                                                        bool allowDisabled) const;

    mutable std::mutex mutex_;
    std::vector<SourceStats> sources_;
    std::unordered_map<SegmentId, std::size_t> assigned_;
};

} // namespace parfetch::segment
