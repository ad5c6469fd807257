#pragma once

#include <parfetch/core/types.h>

#include <cstdint>
#include <memory>

namespace parfetch::bandwidth {

/**
 * Token-bucket bandwidth admission shared by every download.
 *
 * - A global bucket (capacity 0 = disabled, no per-byte accounting at all)
 * - Optional per-download buckets applied before the global one
 * - Global tokens are granted in weighted-fair order: each request is tagged with a
 *   virtual finish time `bytes / priorityWeight`, smallest tag first
 * - A request that cannot be satisfied sleeps until the deficit has refilled; it is
 *   woken early by limit changes and by wakeAll()
 *
 * Thread-safe for concurrent acquire() calls.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * Block until `bytes` may be transferred on behalf of `download`.
     * Returns false if `shouldCancel` fired while waiting.
     */
    virtual bool acquire(DownloadId download, Priority priority, std::uint64_t bytes,
                         const ShouldCancel& shouldCancel) = 0;

    virtual void setGlobalLimit(std::uint64_t bps) = 0;
    virtual void setDownloadLimit(DownloadId download, std::uint64_t bps) = 0;
    virtual void removeDownload(DownloadId download) = 0;

    // Wake every waiter so it re-checks its cancellation predicate.
    virtual void wakeAll() = 0;

    [[nodiscard]] virtual std::uint64_t globalLimit() const = 0;
    [[nodiscard]] virtual bool enabled() const = 0;
};

std::unique_ptr<IRateLimiter> makeRateLimiter(std::uint64_t globalBps = 0);

} // namespace parfetch::bandwidth
