/*
 * parfetch/src/bandwidth/rate_limiter.cpp
 *
 * Weighted token-bucket RateLimiter
 * - Global bucket plus optional per-download buckets; 0 means unlimited
 * - Bucket capacity = rate (burst <= 1 second of allowance)
 * - Tokens are doubles to allow partial-byte accumulation between waits
 * - Waiting is scheduled: a waiter sleeps until the computed refill time
 */

#include <parfetch/bandwidth/rate_limiter.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <mutex>
#include <unordered_map>

namespace parfetch::bandwidth {

namespace {

using clock_t = std::chrono::steady_clock;

// Upper bound on a single wait so a missed wakeAll() cannot strand a waiter.
constexpr auto kMaxWait = std::chrono::seconds(1);

struct Bucket {
    double rate_bps{0.0};
    double capacity{0.0};
    double tokens{0.0};
    clock_t::time_point last_refill{clock_t::now()};
};

struct Waiter {
    DownloadId download{0};
    double tag{0.0};
    std::uint64_t seq{0};
    std::condition_variable cv;
};

class TokenBucketLimiter final : public IRateLimiter {
public:
    explicit TokenBucketLimiter(std::uint64_t globalBps) {
        initBucket(global_, static_cast<double>(globalBps), clock_t::now());
        refreshEnabled();
    }
    ~TokenBucketLimiter() override = default;

    bool acquire(DownloadId download, Priority priority, std::uint64_t bytes,
                 const ShouldCancel& shouldCancel) override {
        if (bytes == 0)
            return true;
        // Fast-path: nothing limited anywhere
        if (!anyLimited_.load(std::memory_order_acquire))
            return true;

        std::unique_lock<std::mutex> lk(mutex_);
        std::uint64_t remaining = bytes;
        while (remaining > 0) {
            const auto slice = std::min<std::uint64_t>(remaining, sliceLimit(download));
            if (!acquireDownload(lk, download, slice, shouldCancel))
                return false;
            if (!acquireGlobal(lk, download, priority, slice, shouldCancel))
                return false;
            remaining -= slice;
        }
        return true;
    }

    void setGlobalLimit(std::uint64_t bps) override {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            initBucket(global_, static_cast<double>(bps), clock_t::now());
            refreshEnabled();
            notifyAllLocked();
        }
        spdlog::info("rate limiter: global limit set to {} B/s", bps);
    }

    void setDownloadLimit(DownloadId download, std::uint64_t bps) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (bps == 0) {
            perDownload_.erase(download);
        } else {
            initBucket(perDownload_[download], static_cast<double>(bps), clock_t::now());
        }
        refreshEnabled();
        notifyAllLocked();
    }

    void removeDownload(DownloadId download) override {
        std::lock_guard<std::mutex> lk(mutex_);
        perDownload_.erase(download);
        lastTag_.erase(download);
        refreshEnabled();
        notifyAllLocked();
    }

    void wakeAll() override {
        std::lock_guard<std::mutex> lk(mutex_);
        notifyAllLocked();
    }

    std::uint64_t globalLimit() const override {
        std::lock_guard<std::mutex> lk(mutex_);
        return static_cast<std::uint64_t>(global_.rate_bps);
    }

    bool enabled() const override { return anyLimited_.load(std::memory_order_acquire); }

private:
    // Per-download buckets are independent of each other, so a simple timed wait suffices.
    bool acquireDownload(std::unique_lock<std::mutex>& lk, DownloadId download,
                         std::uint64_t bytes, const ShouldCancel& shouldCancel) {
        while (true) {
            if (shouldCancel && shouldCancel())
                return false;
            auto it = perDownload_.find(download);
            if (it == perDownload_.end())
                return true;
            auto& b = it->second;
            const auto now = clock_t::now();
            refill(b, now);
            const double need = needFor(b, bytes);
            if (need <= 0.0) {
                deduct(b, bytes);
                return true;
            }
            downloadCv_.wait_until(lk, now + waitFor(b, need));
        }
    }

    bool acquireGlobal(std::unique_lock<std::mutex>& lk, DownloadId download, Priority priority,
                       std::uint64_t bytes, const ShouldCancel& shouldCancel) {
        if (global_.rate_bps <= 0.0)
            return true;

        const double weight = static_cast<double>(priorityWeight(priority));
        double& last = lastTag_[download];
        auto waiter = waiters_.emplace(waiters_.end());
        waiter->download = download;
        waiter->tag = std::max(vclock_, last) + static_cast<double>(bytes) / weight;
        waiter->seq = nextSeq_++;
        last = waiter->tag;
        // A new waiter may outrank the current head: let the head re-evaluate.
        notifyHeadLocked();

        while (true) {
            if (shouldCancel && shouldCancel()) {
                waiters_.erase(waiter);
                notifyHeadLocked();
                return false;
            }
            if (global_.rate_bps <= 0.0) {
                waiters_.erase(waiter);
                notifyHeadLocked();
                return true;
            }
            if (head() != waiter) {
                waiter->cv.wait_for(lk, kMaxWait);
                continue;
            }
            const auto now = clock_t::now();
            refill(global_, now);
            const double need = needFor(global_, bytes);
            if (need <= 0.0) {
                deduct(global_, bytes);
                vclock_ = std::max(vclock_, waiter->tag);
                waiters_.erase(waiter);
                notifyHeadLocked();
                return true;
            }
            waiter->cv.wait_until(lk, now + waitFor(global_, need));
        }
    }

    std::list<Waiter>::iterator head() {
        return std::min_element(waiters_.begin(), waiters_.end(),
                                [](const Waiter& a, const Waiter& b) {
                                    return a.tag < b.tag || (a.tag == b.tag && a.seq < b.seq);
                                });
    }

    void notifyHeadLocked() {
        if (!waiters_.empty())
            head()->cv.notify_one();
    }

    void notifyAllLocked() {
        for (auto& w : waiters_)
            w.cv.notify_one();
        downloadCv_.notify_all();
    }

    std::uint64_t sliceLimit(DownloadId download) const {
        double cap = global_.rate_bps > 0.0 ? global_.capacity : 0.0;
        if (auto it = perDownload_.find(download); it != perDownload_.end()) {
            cap = cap > 0.0 ? std::min(cap, it->second.capacity) : it->second.capacity;
        }
        if (cap < 1.0)
            return UINT64_MAX;
        return static_cast<std::uint64_t>(cap);
    }

    void refreshEnabled() {
        anyLimited_.store(global_.rate_bps > 0.0 || !perDownload_.empty(),
                          std::memory_order_release);
    }

    static void initBucket(Bucket& b, double rate_bps, clock_t::time_point now) {
        b.rate_bps = rate_bps;
        if (b.rate_bps > 0.0) {
            b.capacity = b.rate_bps; // 1 second burst
            b.tokens = b.capacity;
        } else {
            b.capacity = 0.0;
            b.tokens = 0.0;
        }
        b.last_refill = now;
    }

    static void refill(Bucket& b, clock_t::time_point now) {
        if (b.rate_bps <= 0.0) {
            b.last_refill = now;
            return;
        }
        const auto dt = std::chrono::duration<double>(now - b.last_refill).count();
        if (dt <= 0.0)
            return;
        b.tokens = std::min(b.capacity, b.tokens + b.rate_bps * dt);
        b.last_refill = now;
    }

    static double needFor(const Bucket& b, std::uint64_t bytes) {
        if (b.rate_bps <= 0.0)
            return 0.0;
        // Limits may shrink below an in-flight slice; never ask for more than a full bucket.
        const double want = std::min(static_cast<double>(bytes), b.capacity);
        const double need = want - b.tokens;
        return (need > 0.0) ? need : 0.0;
    }

    static clock_t::duration waitFor(const Bucket& b, double need) {
        auto d = std::chrono::duration_cast<clock_t::duration>(
            std::chrono::duration<double>(need / b.rate_bps));
        if (d <= clock_t::duration::zero())
            d = std::chrono::microseconds(100);
        return std::min<clock_t::duration>(d, kMaxWait);
    }

    static void deduct(Bucket& b, std::uint64_t bytes) {
        if (b.rate_bps <= 0.0)
            return;
        const double d = static_cast<double>(bytes);
        b.tokens = (b.tokens > d) ? (b.tokens - d) : 0.0;
    }

    mutable std::mutex mutex_;
    std::atomic<bool> anyLimited_{false};
    Bucket global_{};
    std::unordered_map<DownloadId, Bucket> perDownload_;
    std::condition_variable downloadCv_;

    std::list<Waiter> waiters_;
    std::unordered_map<DownloadId, double> lastTag_;
    double vclock_{0.0};
    std::uint64_t nextSeq_{0};
};

} // namespace

std::unique_ptr<IRateLimiter> makeRateLimiter(std::uint64_t globalBps) {
    return std::make_unique<TokenBucketLimiter>(globalBps);
}

} // namespace parfetch::bandwidth
