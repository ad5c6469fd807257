#pragma once

#include <parfetch/config/config.h>
#include <parfetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace parfetch::segment {

/**
 * Segment cap by resource size (decimal megabytes):
 * <=1MB: 1, <=10MB: 4, <=100MB: 8, <=1GB: 16, above: 32.
 */
std::size_t sizeBucketCap(std::uint64_t size) noexcept;

/**
 * Initial segment count for a resource of `size` bytes.
 *
 * `bdpSegments` is ceil(bandwidth * rtt / window) when a throughput estimate
 * exists; without one the bucket cap is used. The result is clamped to
 * [1, bucket cap], to cfg.maxSegments and to size / cfg.minSegmentSize.
 */
std::size_t initialSegmentCount(std::uint64_t size, std::optional<std::size_t> bdpSegments,
                                const config::SegmentConfig& cfg);

/**
 * Partition [0, size) into `count` contiguous ranges. The remainder of the
 * division goes to the first ranges, one byte each. Empty for size 0.
 */
std::vector<ByteRange> splitRange(std::uint64_t size, std::size_t count);

} // namespace parfetch::segment
