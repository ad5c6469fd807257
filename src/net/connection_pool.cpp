#include <parfetch/config/config.h>
#include <parfetch/net/connection_pool.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

namespace parfetch::net {

// libcurl share handle plus the locks it requires when used from several threads.
struct ConnectionPool::HostSession {
    CURLSH* share{nullptr};
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    HostSession() {
        share = curl_share_init();
        if (!share)
            return;
        curl_share_setopt(share, CURLSHOPT_LOCKFUNC, &HostSession::lock);
        curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, &HostSession::unlock);
        curl_share_setopt(share, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }
    ~HostSession() {
        if (share)
            curl_share_cleanup(share);
    }
    HostSession(const HostSession&) = delete;
    HostSession& operator=(const HostSession&) = delete;

    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        auto* self = static_cast<HostSession*>(userptr);
        if (data >= 0 && data < CURL_LOCK_DATA_LAST)
            self->locks[static_cast<std::size_t>(data)].lock();
    }
    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        auto* self = static_cast<HostSession*>(userptr);
        if (data >= 0 && data < CURL_LOCK_DATA_LAST)
            self->locks[static_cast<std::size_t>(data)].unlock();
    }
};

ConnectionPool::ConnectionPool(PoolLimits limits) : limits_(limits) {
    limits_.perHostLegacy =
        std::clamp<std::size_t>(limits_.perHostLegacy, 1, config::kMaxConnectionsPerHostCeiling);
    limits_.perHostMultiplexed = std::clamp<std::size_t>(limits_.perHostMultiplexed, 1,
                                                         config::kMaxConnectionsPerHostCeiling);
    if (limits_.maxStreamsPerConnection == 0)
        limits_.maxStreamsPerConnection = 1;
}

ConnectionPool::~ConnectionPool() {
    std::lock_guard<std::mutex> lk(mutex_);
    // Easy handles reference the share handles; drop them first.
    connections_.clear();
    sessions_.clear();
}

std::size_t ConnectionPool::hostLimit(Generation generation) const noexcept {
    return isMultiplexed(generation) ? limits_.perHostMultiplexed : limits_.perHostLegacy;
}

ConnectionPool::HostSession& ConnectionPool::sessionFor(const std::string& host) {
    auto& slot = sessions_[host];
    if (!slot)
        slot = std::make_unique<HostSession>();
    return *slot;
}

std::optional<ConnectionId> ConnectionPool::tryLeaseLocked(const std::string& host,
                                                           Generation generation) {
    const std::size_t streamCap = isMultiplexed(generation) ? limits_.maxStreamsPerConnection : 1;

    // Prefer another stream on an existing connection over a new transport connection.
    Connection* best = nullptr;
    std::size_t live = 0;
    for (auto& [id, c] : connections_) {
        if (c.host != host || c.retired)
            continue;
        ++live;
        if (c.generation != generation || c.activeStreams >= streamCap)
            continue;
        if (!best || c.activeStreams < best->activeStreams)
            best = &c;
    }
    if (best) {
        ++best->activeStreams;
        return best->id;
    }
    if (live >= hostLimit(generation))
        return std::nullopt;

    Connection c;
    c.id = nextId_++;
    c.host = host;
    c.generation = generation;
    c.activeStreams = 1;
    const auto id = c.id;
    connections_.emplace(id, std::move(c));
    spdlog::debug("pool: opened connection {} to {} ({})", id, host,
                  generationToString(generation));
    return id;
}

Expected<ConnectionId> ConnectionPool::acquire(const std::string& host, Generation generation,
                                               const ShouldCancel& shouldCancel) {
    std::unique_lock<std::mutex> lk(mutex_);
    while (true) {
        if (shouldCancel && shouldCancel())
            return Error{ErrorCode::Cancelled, "connection acquire cancelled"};
        if (auto id = tryLeaseLocked(host, generation))
            return *id;
        cv_.wait_for(lk, std::chrono::milliseconds(250));
    }
}

void ConnectionPool::releaseLocked(ConnectionId id) {
    auto it = connections_.find(id);
    if (it == connections_.end())
        return;
    auto& c = it->second;
    if (c.activeStreams > 0)
        --c.activeStreams;
    if (c.retired && c.activeStreams == 0) {
        spdlog::debug("pool: closed retired connection {} to {}", id, c.host);
        connections_.erase(it);
    }
}

void ConnectionPool::release(ConnectionId id) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        releaseLocked(id);
    }
    cv_.notify_all();
}

void ConnectionPool::recordSuccess(ConnectionId id, std::uint64_t bytes,
                                   std::chrono::microseconds elapsed) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end())
        return;
    auto& s = it->second.stats;
    ++s.requests;
    s.bytes += bytes;
    s.busy += elapsed;
}

void ConnectionPool::recordFailure(ConnectionId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end())
        return;
    ++it->second.stats.requests;
    ++it->second.stats.errors;
}

bool ConnectionPool::unhealthyLocked(const Connection& c) const {
    return c.stats.requests >= limits_.retireMinRequests &&
           c.stats.errorRate() > limits_.retireErrorRate;
}

Expected<ConnectionId> ConnectionPool::reassignIfUnhealthy(ConnectionId id,
                                                           const ShouldCancel& shouldCancel) {
    std::string host;
    Generation generation{Generation::Http1};
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = connections_.find(id);
        if (it == connections_.end())
            return Error{ErrorCode::InvalidArgument, "unknown connection"};
        auto& c = it->second;
        if (!c.retired && !unhealthyLocked(c))
            return id;
        if (!c.retired) {
            spdlog::warn("pool: retiring connection {} to {} (error rate {:.0f}% over {} requests)",
                         id, c.host, c.stats.errorRate() * 100.0, c.stats.requests);
            c.retired = true;
            c.idle.clear();
        }
        host = c.host;
        generation = c.generation;
        releaseLocked(id);
    }
    cv_.notify_all();
    return acquire(host, generation, shouldCancel);
}

Stream ConnectionPool::checkout(ConnectionId id) {
    Stream s;
    s.connection = id;
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end())
        return s;
    auto& c = it->second;
    s.share = sessionFor(c.host).share;
    if (!c.idle.empty()) {
        s.easy = std::move(c.idle.back());
        c.idle.pop_back();
    } else {
        s.easy.reset(curl_easy_init());
    }
    return s;
}

void ConnectionPool::checkin(Stream&& stream) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = connections_.find(stream.connection);
    if (it == connections_.end() || it->second.retired || !stream.easy)
        return; // handle destroyed with `stream`
    it->second.idle.push_back(std::move(stream.easy));
}

std::optional<ConnectionSnapshot> ConnectionPool::snapshot(ConnectionId id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = connections_.find(id);
    if (it == connections_.end())
        return std::nullopt;
    const auto& c = it->second;
    return ConnectionSnapshot{c.id, c.host, c.generation, c.activeStreams, c.retired, c.stats};
}

std::size_t ConnectionPool::connectionCount(const std::string& host) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return static_cast<std::size_t>(
        std::count_if(connections_.begin(), connections_.end(),
                      [&](const auto& kv) { return kv.second.host == host && !kv.second.retired; }));
}

std::size_t ConnectionPool::activeStreams(const std::string& host) const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::size_t n = 0;
    for (const auto& [id, c] : connections_) {
        if (c.host == host)
            n += c.activeStreams;
    }
    return n;
}

void ConnectionPool::wakeAll() {
    cv_.notify_all();
}

} // namespace parfetch::net
