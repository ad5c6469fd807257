#include <parfetch/segment/segment_planner.h>

#include <algorithm>

namespace parfetch::segment {

namespace {
constexpr std::uint64_t kMB = 1000ull * 1000ull;
} // namespace

std::size_t sizeBucketCap(std::uint64_t size) noexcept {
    if (size <= kMB)
        return 1;
    if (size <= 10 * kMB)
        return 4;
    if (size <= 100 * kMB)
        return 8;
    if (size <= 1000 * kMB)
        return 16;
    return config::kMaxSegmentsCeiling;
}

std::size_t initialSegmentCount(std::uint64_t size, std::optional<std::size_t> bdpSegments,
                                const config::SegmentConfig& cfg) {
    const std::size_t cap = sizeBucketCap(size);
    if (cap <= 1)
        return 1;

    std::size_t count = bdpSegments.value_or(cap);
    count = std::clamp<std::size_t>(count, 1, cap);
    count = std::min(count, std::clamp<std::size_t>(cfg.maxSegments, 1, config::kMaxSegmentsCeiling));
    count = std::max(count, std::min(cfg.minSegments, cap));

    if (cfg.minSegmentSize > 0) {
        const auto bySize = static_cast<std::size_t>(
            std::max<std::uint64_t>(1, size / cfg.minSegmentSize));
        count = std::min(count, bySize);
    }
    return std::max<std::size_t>(count, 1);
}

std::vector<ByteRange> splitRange(std::uint64_t size, std::size_t count) {
    std::vector<ByteRange> out;
    if (size == 0)
        return out;
    count = std::max<std::size_t>(1, count);
    if (count > size)
        count = static_cast<std::size_t>(size);

    const std::uint64_t base = size / count;
    const std::uint64_t remainder = size % count;
    out.reserve(count);
    std::uint64_t start = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint64_t len = base + (i < remainder ? 1 : 0);
        out.push_back(ByteRange{start, start + len});
        start += len;
    }
    return out;
}

} // namespace parfetch::segment
