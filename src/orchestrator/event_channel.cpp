#include <parfetch/orchestrator/event_channel.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <type_traits>

namespace parfetch::orchestrator {

std::string_view downloadStateToString(DownloadState s) noexcept {
    switch (s) {
        case DownloadState::Probing:
            return "probing";
        case DownloadState::Queued:
            return "queued";
        case DownloadState::SingleStream:
            return "single_stream";
        case DownloadState::Segmenting:
            return "segmenting";
        case DownloadState::Active:
            return "active";
        case DownloadState::Paused:
            return "paused";
        case DownloadState::Complete:
            return "complete";
        case DownloadState::Failed:
            return "failed";
        case DownloadState::Cancelled:
            return "cancelled";
    }
    return "probing";
}

DownloadId eventDownloadId(const Event& ev) noexcept {
    return std::visit([](const auto& e) { return e.id; }, ev);
}

namespace {
std::string_view eventName(const Event& ev) noexcept {
    return std::visit(
        [](const auto& e) -> std::string_view {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, Added>)
                return "added";
            else if constexpr (std::is_same_v<T, ProgressUpdate>)
                return "progress";
            else if constexpr (std::is_same_v<T, StateChange>)
                return "state change";
            else if constexpr (std::is_same_v<T, SegmentRebalanced>)
                return "rebalance";
            else if constexpr (std::is_same_v<T, ErrorEvent>)
                return "error";
            else
                return "complete";
        },
        ev);
}
} // namespace

EventChannel::EventChannel(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

bool EventChannel::publish(Event ev) {
    std::unique_lock<std::mutex> lk(mutex_);
    if (closed_)
        return false;
    if (queue_.size() >= capacity_) {
        if (std::holds_alternative<ProgressUpdate>(ev)) {
            ++dropped_;
            return false;
        }
        if (!evictProgressLocked()) {
            const auto* change = std::get_if<StateChange>(&ev);
            if (change && coalesceLocked(*change)) {
                lk.unlock();
                notEmpty_.notify_one();
                return true;
            }
            if (queue_.size() >= 2 * capacity_) {
                ++dropped_;
                ++droppedLifecycle_;
                const auto queued = queue_.size();
                lk.unlock();
                spdlog::warn("[EventChannel] queue full ({} events); dropped {} for download {}",
                             queued, eventName(ev), eventDownloadId(ev));
                return false;
            }
        }
    }
    queue_.push_back(std::move(ev));
    lk.unlock();
    notEmpty_.notify_one();
    return true;
}

bool EventChannel::evictProgressLocked() {
    auto it = std::find_if(queue_.begin(), queue_.end(), [](const Event& e) {
        return std::holds_alternative<ProgressUpdate>(e);
    });
    if (it == queue_.end())
        return false;
    queue_.erase(it);
    ++dropped_;
    return true;
}

// Merge into the download's latest event when that is a StateChange too.
bool EventChannel::coalesceLocked(const StateChange& change) {
    for (auto it = queue_.rbegin(); it != queue_.rend(); ++it) {
        if (eventDownloadId(*it) != change.id)
            continue;
        auto* prev = std::get_if<StateChange>(&*it);
        if (!prev)
            return false;
        prev->to = change.to;
        return true;
    }
    return false;
}

std::optional<Event> EventChannel::tryReceive() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (queue_.empty())
        return std::nullopt;
    Event ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

std::optional<Event> EventChannel::receive(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    if (!notEmpty_.wait_for(lk, timeout, [&] { return closed_ || !queue_.empty(); }))
        return std::nullopt;
    if (queue_.empty())
        return std::nullopt;
    Event ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
    }
    notEmpty_.notify_all();
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return queue_.size();
}

std::uint64_t EventChannel::dropped() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return dropped_;
}

std::uint64_t EventChannel::droppedLifecycle() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return droppedLifecycle_;
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return closed_;
}

bool ProgressThrottle::admit(DownloadId id, clock::time_point now) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = last_.find(id);
    if (it != last_.end() && now - it->second < minInterval_)
        return false;
    last_[id] = now;
    return true;
}

void ProgressThrottle::forget(DownloadId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    last_.erase(id);
}

} // namespace parfetch::orchestrator
