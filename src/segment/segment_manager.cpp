#include <parfetch/segment/segment_manager.h>
#include <parfetch/segment/segment_planner.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace parfetch::segment {

std::string_view segmentStateToString(SegmentState s) noexcept {
    switch (s) {
        case SegmentState::Pending:
            return "pending";
        case SegmentState::Active:
            return "active";
        case SegmentState::Complete:
            return "complete";
        case SegmentState::Error:
            return "error";
        case SegmentState::Slow:
            return "slow";
    }
    return "pending";
}

namespace {
bool running(SegmentState s) {
    return s == SegmentState::Active || s == SegmentState::Slow;
}
} // namespace

SegmentManager::SegmentManager(config::SegmentConfig cfg, std::optional<HashAlgo> hashing)
    : cfg_(cfg), hashing_(hashing) {
    cfg_.maxSegments = std::clamp<std::size_t>(cfg_.maxSegments, 1, config::kMaxSegmentsCeiling);
    activeLimit_ = cfg_.maxSegments;
}

void SegmentManager::partition(std::uint64_t size, std::size_t count) {
    std::lock_guard<std::mutex> lk(mutex_);
    segments_.clear();
    hashers_.clear();
    receivedAtTick_.clear();
    lastTick_.reset();
    nextId_ = 0;
    for (const auto& r : splitRange(size, count)) {
        Segment s;
        s.id = nextId_++;
        s.range = r;
        segments_.emplace(s.id, s);
        if (hashing_)
            hashers_.emplace(s.id, integrity::SegmentHasher(*hashing_));
    }
    activeLimit_ = cfg_.maxSegments;
}

void SegmentManager::openEnded() {
    std::lock_guard<std::mutex> lk(mutex_);
    segments_.clear();
    hashers_.clear();
    receivedAtTick_.clear();
    lastTick_.reset();
    Segment s;
    s.id = 0;
    s.range = ByteRange{0, kOpenEnd};
    segments_.emplace(s.id, s);
    if (hashing_)
        hashers_.emplace(s.id, integrity::SegmentHasher(*hashing_));
    nextId_ = 1;
}

void SegmentManager::restore(std::vector<Segment> segments,
                             std::unordered_map<SegmentId, integrity::SegmentHasher> hashers) {
    std::lock_guard<std::mutex> lk(mutex_);
    segments_.clear();
    hashers_.clear();
    receivedAtTick_.clear();
    lastTick_.reset();
    nextId_ = 0;
    for (auto& s : segments) {
        s.leased = false;
        s.connection = kNoConnection;
        s.throughputBps = 0.0;
        s.downloadedOffset = std::min(s.downloadedOffset, s.range.length());
        if (hashing_) {
            auto it = hashers.find(s.id);
            if (it != hashers.end() && it->second.covered() == s.downloadedOffset) {
                hashers_.insert_or_assign(s.id, std::move(it->second));
            } else {
                if (s.downloadedOffset > 0) {
                    spdlog::debug("segment {}: no usable accumulator, restarting from {}", s.id,
                                  s.range.start);
                }
                s.downloadedOffset = 0;
                s.checkpoint = {};
                hashers_.insert_or_assign(s.id, integrity::SegmentHasher(*hashing_));
            }
        }
        s.receivedOffset = s.downloadedOffset;
        s.state = (!s.openEnded() && s.downloadedOffset == s.range.length()) ? SegmentState::Complete
                                                                            : SegmentState::Pending;
        nextId_ = std::max<SegmentId>(nextId_, s.id + 1);
        const auto id = s.id;
        segments_.insert_or_assign(id, std::move(s));
    }
    activeLimit_ = cfg_.maxSegments;
}

void SegmentManager::refreshLimitLocked(clock::time_point now) {
    if (backoffUntil_ && now >= *backoffUntil_) {
        backoffUntil_.reset();
        activeLimit_ = cfg_.maxSegments;
        spdlog::info("rate-limit backoff elapsed, active limit restored to {}", activeLimit_);
    }
}

std::optional<Segment> SegmentManager::claimNext(clock::time_point now) {
    std::lock_guard<std::mutex> lk(mutex_);
    refreshLimitLocked(now);
    std::size_t leased = 0;
    for (const auto& [id, s] : segments_)
        leased += s.leased ? 1 : 0;
    if (leased >= activeLimit_)
        return std::nullopt;

    Segment* pick = nullptr;
    for (auto& [id, s] : segments_) {
        if (s.state != SegmentState::Pending || s.leased)
            continue;
        if (!pick || s.range.start < pick->range.start)
            pick = &s;
    }
    if (!pick)
        return std::nullopt;
    pick->state = SegmentState::Active;
    pick->leased = true;
    receivedAtTick_[pick->id] = pick->receivedOffset;
    return *pick;
}

void SegmentManager::assignConnection(SegmentId id, ConnectionId connection) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = segments_.find(id);
    if (it != segments_.end())
        it->second.connection = connection;
}

Admission SegmentManager::admitReceived(SegmentId id, std::size_t n) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end())
        return Admission{0, true};
    auto& s = it->second;
    if (!s.leased || !running(s.state))
        return Admission{0, true};
    if (s.openEnded()) {
        s.receivedOffset += n;
        return Admission{n, false};
    }
    const auto accepted = static_cast<std::size_t>(std::min<std::uint64_t>(n, s.remaining()));
    s.receivedOffset += accepted;
    return Admission{accepted, s.receivedOffset >= s.range.length()};
}

Expected<void> SegmentManager::markFlushed(SegmentId id, std::uint64_t offset,
                                           std::span<const std::byte> data) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end())
        return Error{ErrorCode::InvalidArgument, "flush for unknown segment " + std::to_string(id)};
    auto& s = it->second;
    const auto expected = s.range.start + s.downloadedOffset;
    if (offset != expected) {
        return Error{ErrorCode::IoError, "segment " + std::to_string(id) + " flushed at " +
                                             std::to_string(offset) + ", expected " +
                                             std::to_string(expected)};
    }
    s.downloadedOffset += data.size();
    if (hashing_) {
        auto& h = hashers_.try_emplace(id, *hashing_).first->second;
        h.update(data);
        s.checkpoint = h.checkpoint();
    } else {
        s.checkpoint.covered = s.downloadedOffset;
    }
    return Expected<void>{};
}

std::size_t SegmentManager::liveCountLocked() const {
    return static_cast<std::size_t>(
        std::count_if(segments_.begin(), segments_.end(), [](const auto& kv) {
            return kv.second.state != SegmentState::Complete;
        }));
}

std::optional<SplitResult> SegmentManager::trySplitLocked(clock::time_point now) {
    refreshLimitLocked(now);
    if (backoffUntil_)
        return std::nullopt;
    if (liveCountLocked() >= cfg_.maxSegments)
        return std::nullopt;

    const std::uint64_t minRemaining = 2 * std::max<std::uint64_t>(cfg_.minSegmentSize, 1);
    Segment* victim = nullptr;
    for (auto& [id, s] : segments_) {
        if (s.state != SegmentState::Slow || s.openEnded())
            continue;
        if (s.remaining() < minRemaining)
            continue;
        if (!victim || s.remaining() > victim->remaining())
            victim = &s;
    }
    if (!victim)
        return std::nullopt;

    const auto mid = victim->resumeOffset() + victim->remaining() / 2;
    Segment created;
    created.id = nextId_++;
    created.range = ByteRange{mid, victim->range.end};
    victim->range.end = mid;

    SplitResult out{victim->id, created.id, victim->range, created.range};
    receivedAtTick_[created.id] = 0;
    if (hashing_)
        hashers_.insert_or_assign(created.id, integrity::SegmentHasher(*hashing_));
    segments_.emplace(created.id, std::move(created));

    spdlog::debug("split segment {} at {}: [{}, {}) + new segment {} [{}, {})", out.source, mid,
                  out.sourceRange.start, out.sourceRange.end, out.created, out.createdRange.start,
                  out.createdRange.end);
    return out;
}

CompletionResult SegmentManager::markComplete(SegmentId id, clock::time_point now) {
    std::lock_guard<std::mutex> lk(mutex_);
    CompletionResult result;
    auto it = segments_.find(id);
    if (it == segments_.end())
        return result;
    auto& s = it->second;
    if (s.openEnded()) {
        s.range.end = s.range.start + s.receivedOffset;
    }
    if (s.downloadedOffset < s.range.length()) {
        spdlog::debug("segment {} not complete: {} of {} bytes flushed", id, s.downloadedOffset,
                      s.range.length());
        return result;
    }
    s.state = SegmentState::Complete;
    s.leased = false;
    s.connection = kNoConnection;
    result.completed = true;
    result.split = trySplitLocked(now);
    return result;
}

void SegmentManager::releaseLease(SegmentId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end())
        return;
    auto& s = it->second;
    s.leased = false;
    s.connection = kNoConnection;
    if (s.state != SegmentState::Complete && s.state != SegmentState::Error)
        s.state = SegmentState::Pending;
}

void SegmentManager::markError(SegmentId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end())
        return;
    it->second.state = SegmentState::Error;
    it->second.leased = false;
    it->second.connection = kNoConnection;
}

void SegmentManager::markSlow(SegmentId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = segments_.find(id);
    if (it != segments_.end() && it->second.state == SegmentState::Active)
        it->second.state = SegmentState::Slow;
}

void SegmentManager::restartSegment(SegmentId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end())
        return;
    auto& s = it->second;
    s.downloadedOffset = 0;
    s.receivedOffset = 0;
    s.checkpoint = {};
    if (!s.leased)
        s.state = SegmentState::Pending;
    receivedAtTick_[id] = 0;
    if (hashing_)
        hashers_.insert_or_assign(id, integrity::SegmentHasher(*hashing_));
}

std::vector<SegmentId> SegmentManager::rebalance(clock::time_point now) {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<SegmentId> newlySlow;
    if (!lastTick_) {
        lastTick_ = now;
        for (const auto& [id, s] : segments_)
            receivedAtTick_[id] = s.receivedOffset;
        return newlySlow;
    }
    const double elapsed = std::chrono::duration<double>(now - *lastTick_).count();
    if (elapsed <= 0.0)
        return newlySlow;

    double sum = 0.0;
    std::size_t n = 0;
    for (auto& [id, s] : segments_) {
        if (!s.leased || !running(s.state))
            continue;
        const auto before = receivedAtTick_[id];
        const auto delta = s.receivedOffset >= before ? s.receivedOffset - before : 0;
        s.throughputBps = static_cast<double>(delta) / elapsed;
        sum += s.throughputBps;
        ++n;
    }

    if (n >= 2 && sum > 0.0) {
        const double mean = sum / static_cast<double>(n);
        const double threshold = mean * cfg_.slowThresholdPct;
        for (auto& [id, s] : segments_) {
            if (!s.leased || !running(s.state))
                continue;
            if (s.throughputBps < threshold) {
                if (s.state != SegmentState::Slow) {
                    s.state = SegmentState::Slow;
                    newlySlow.push_back(id);
                }
            } else if (s.state == SegmentState::Slow) {
                s.state = SegmentState::Active;
            }
        }
    }

    for (const auto& [id, s] : segments_)
        receivedAtTick_[id] = s.receivedOffset;
    lastTick_ = now;
    return newlySlow;
}

std::vector<SegmentId> SegmentManager::onRateLimited(clock::time_point now) {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<SegmentId> parked;
    refreshLimitLocked(now);

    if (backoffUntil_) {
        // Already backing off: extend the window, do not halve again
        backoffUntil_ = now + cfg_.rateLimitBackoff;
        return parked;
    }

    rateLimitHits_.push_back(now);
    while (!rateLimitHits_.empty() && now - rateLimitHits_.front() > cfg_.rateLimitWindow)
        rateLimitHits_.pop_front();
    if (rateLimitHits_.size() < std::max<std::size_t>(cfg_.rateLimitStrikes, 1))
        return parked;
    rateLimitHits_.clear();

    std::vector<Segment*> leased;
    for (auto& [id, s] : segments_) {
        if (s.leased && running(s.state))
            leased.push_back(&s);
    }
    const std::size_t current = leased.empty() ? activeLimit_ : leased.size();
    activeLimit_ = std::max<std::size_t>(1, current / 2);
    backoffUntil_ = now + cfg_.rateLimitBackoff;

    // Park the most recently created segments first
    std::sort(leased.begin(), leased.end(),
              [](const Segment* a, const Segment* b) { return a->id > b->id; });
    for (std::size_t i = 0; i + activeLimit_ < leased.size(); ++i) {
        leased[i]->state = SegmentState::Pending;
        parked.push_back(leased[i]->id);
    }
    spdlog::warn("sustained server rate limiting: active segments {} -> {}, backoff {}ms", current,
                 activeLimit_, cfg_.rateLimitBackoff.count());
    return parked;
}

std::size_t SegmentManager::activeLimit(clock::time_point now) {
    std::lock_guard<std::mutex> lk(mutex_);
    refreshLimitLocked(now);
    return activeLimit_;
}

bool SegmentManager::inBackoff(clock::time_point now) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return backoffUntil_ && now < *backoffUntil_;
}

bool SegmentManager::shouldStop(SegmentId id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end())
        return true;
    return !running(it->second.state);
}

void SegmentManager::closeOpenEnd(SegmentId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = segments_.find(id);
    if (it != segments_.end() && it->second.openEnded())
        it->second.range.end = it->second.range.start + it->second.receivedOffset;
}

std::vector<Segment> SegmentManager::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<Segment> out;
    out.reserve(segments_.size());
    for (const auto& [id, s] : segments_)
        out.push_back(s);
    return out;
}

std::optional<Segment> SegmentManager::get(SegmentId id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end())
        return std::nullopt;
    return it->second;
}

std::size_t SegmentManager::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return segments_.size();
}

std::size_t SegmentManager::leasedCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return static_cast<std::size_t>(std::count_if(
        segments_.begin(), segments_.end(), [](const auto& kv) { return kv.second.leased; }));
}

bool SegmentManager::allComplete() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::all_of(segments_.begin(), segments_.end(), [](const auto& kv) {
        return kv.second.state == SegmentState::Complete;
    });
}

bool SegmentManager::anyError() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::any_of(segments_.begin(), segments_.end(), [](const auto& kv) {
        return kv.second.state == SegmentState::Error;
    });
}

std::uint64_t SegmentManager::downloadedBytes() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::uint64_t total = 0;
    for (const auto& [id, s] : segments_)
        total += s.downloadedOffset;
    return total;
}

std::uint64_t SegmentManager::receivedBytes() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::uint64_t total = 0;
    for (const auto& [id, s] : segments_)
        total += s.receivedOffset;
    return total;
}

std::optional<std::string> SegmentManager::checkPartition(std::uint64_t size) const {
    std::vector<Segment> segs = snapshot();
    std::sort(segs.begin(), segs.end(),
              [](const Segment& a, const Segment& b) { return a.range.start < b.range.start; });
    std::uint64_t cursor = 0;
    for (const auto& s : segs) {
        if (s.range.start != cursor) {
            return "segment " + std::to_string(s.id) + " starts at " +
                   std::to_string(s.range.start) + ", expected " + std::to_string(cursor);
        }
        if (s.range.empty())
            return "segment " + std::to_string(s.id) + " is empty";
        if (s.downloadedOffset > s.range.length() || s.receivedOffset < s.downloadedOffset)
            return "segment " + std::to_string(s.id) + " progress out of range";
        cursor = s.range.end;
    }
    if (cursor != size)
        return "segments cover " + std::to_string(cursor) + " of " + std::to_string(size) + " bytes";
    return std::nullopt;
}

} // namespace parfetch::segment
