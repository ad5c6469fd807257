#include <parfetch/segment/source_selector.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace parfetch::segment {

namespace {

double priorityWeight(net::MirrorPriority p) noexcept {
    switch (p) {
        case net::MirrorPriority::Primary:
            return 1.5;
        case net::MirrorPriority::Secondary:
            return 1.0;
        case net::MirrorPriority::Fallback:
            return 0.5;
    }
    return 1.0;
}

} // namespace

void SourceSelector::reset(std::vector<net::Mirror> sources) {
    std::lock_guard<std::mutex> lk(mutex_);
    sources_.clear();
    assigned_.clear();
    for (auto& m : sources) {
        SourceStats s;
        s.url = std::move(m.url);
        s.priority = m.priority;
        sources_.push_back(std::move(s));
    }
}

double SourceSelector::scoreLocked(std::size_t index) const {
    const auto& s = sources_[index];
    const double speed = s.bytesPerSecond / 1e6 + 1.0;
    const double errorPenalty = 1.0 / (1.0 + 0.5 * static_cast<double>(s.errors));
    const double load = 1.0 / (1.0 + static_cast<double>(s.active));
    return speed * priorityWeight(s.priority) * errorPenalty * load;
}

std::optional<std::size_t> SourceSelector::bestLocked(std::optional<std::size_t> exclude,
                                                      bool allowDisabled) const {
    std::optional<std::size_t> best;
    double bestScore = -1.0;
    for (std::size_t i = 0; i < sources_.size(); ++i) {
        if ((exclude && *exclude == i) || (sources_[i].disabled && !allowDisabled))
            continue;
        const double score = scoreLocked(i);
        if (score > bestScore) {
            bestScore = score;
            best = i;
        }
    }
    return best;
}

std::size_t SourceSelector::assign(SegmentId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (sources_.empty())
        return 0;
    auto pick = bestLocked(std::nullopt, false);
    if (!pick)
        pick = bestLocked(std::nullopt, true);
    if (auto it = assigned_.find(id); it != assigned_.end() && sources_[it->second].active > 0)
        --sources_[it->second].active;
    assigned_[id] = *pick;
    ++sources_[*pick].active;
    return *pick;
}

std::optional<std::size_t> SourceSelector::failover(SegmentId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = assigned_.find(id);
    if (it == assigned_.end() || sources_.size() < 2)
        return std::nullopt;
    const auto from = it->second;
    auto next = bestLocked(from, false);
    if (!next)
        return std::nullopt;
    if (sources_[from].active > 0)
        --sources_[from].active;
    ++sources_[*next].active;
    it->second = *next;
    spdlog::info("segment {}: switching source {} -> {}", id, sources_[from].url,
                 sources_[*next].url);
    return next;
}

void SourceSelector::recordSuccess(std::size_t source, std::uint64_t bytes,
                                   std::chrono::microseconds elapsed) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (source >= sources_.size())
        return;
    auto& s = sources_[source];
    s.bytes += bytes;
    s.errors = 0;
    s.disabled = false;
    if (elapsed.count() > 0 && bytes > 0) {
        const double bps = static_cast<double>(bytes) * 1e6 / static_cast<double>(elapsed.count());
        s.bytesPerSecond =
            s.bytesPerSecond == 0.0 ? bps : kEwmaAlpha * bps + (1.0 - kEwmaAlpha) * s.bytesPerSecond;
    }
}

void SourceSelector::recordError(std::size_t source) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (source >= sources_.size())
        return;
    auto& s = sources_[source];
    ++s.errors;
    if (!s.disabled && s.errors >= kMaxErrors) {
        s.disabled = true;
        spdlog::warn("source {} disabled after {} consecutive errors", s.url, s.errors);
    }
}

void SourceSelector::release(SegmentId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = assigned_.find(id);
    if (it == assigned_.end())
        return;
    if (it->second < sources_.size() && sources_[it->second].active > 0)
        --sources_[it->second].active;
    assigned_.erase(it);
}

std::optional<std::size_t> SourceSelector::sourceOf(SegmentId id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = assigned_.find(id);
    if (it == assigned_.end())
        return std::nullopt;
    return it->second;
}

std::size_t SourceSelector::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return sources_.size();
}

std::vector<SourceStats> SourceSelector::stats() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return sources_;
}

} // namespace parfetch::segment
