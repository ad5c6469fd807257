#pragma once

#include <parfetch/core/types.h>
#include <parfetch/net/resource.h>

#include <curl/curl.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace parfetch::net {

struct PoolLimits {
    std::size_t perHostLegacy{6};
    std::size_t perHostMultiplexed{2};
    std::size_t maxStreamsPerConnection{16};
    double retireErrorRate{0.5};
    std::size_t retireMinRequests{4};
};

struct ConnectionStats {
    std::uint64_t requests{0};
    std::uint64_t errors{0};
    std::uint64_t bytes{0};
    std::chrono::microseconds busy{0};

    [[nodiscard]] double errorRate() const noexcept {
        return requests == 0 ? 0.0 : static_cast<double>(errors) / static_cast<double>(requests);
    }
    [[nodiscard]] double throughputBps() const noexcept {
        return busy.count() <= 0 ? 0.0
                                 : static_cast<double>(bytes) * 1e6 /
                                       static_cast<double>(busy.count());
    }
};

struct ConnectionSnapshot {
    ConnectionId id{kNoConnection};
    std::string host;
    Generation generation{Generation::Http1};
    std::size_t activeStreams{0};
    bool retired{false};
    ConnectionStats stats;
};

namespace detail {
struct CurlEasyDeleter {
    void operator()(CURL* h) const noexcept { curl_easy_cleanup(h); }
};
} // namespace detail

using EasyHandle = std::unique_ptr<CURL, detail::CurlEasyDeleter>;

/**
 * One leased logical stream on a pooled connection. The easy handle keeps the
 * transport alive between requests; `share` is the host's session cache.
 */
struct Stream {
    ConnectionId connection{kNoConnection};
    EasyHandle easy;
    CURLSH* share{nullptr};
};

/**
 * Per-host pool of transport connections.
 *
 * The pool is the sole owner of connection objects (arena indexed by ConnectionId);
 * segments refer to connections only by id. Legacy connections carry one stream,
 * multiplexed ones carry up to `maxStreamsPerConnection`. Every host gets one
 * libcurl share handle so TLS sessions, DNS and the connection cache are reused
 * by subsequent connections to that host.
 */
class ConnectionPool {
public:
    explicit ConnectionPool(PoolLimits limits = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * Lease a stream slot for `host`. Blocks while the host is at its limit;
     * fails with Cancelled when `shouldCancel` fires.
     */
    Expected<ConnectionId> acquire(const std::string& host, Generation generation,
                                   const ShouldCancel& shouldCancel);

    // Return a stream slot. Retired connections are dropped once idle.
    void release(ConnectionId id);

    void recordSuccess(ConnectionId id, std::uint64_t bytes, std::chrono::microseconds elapsed);
    void recordFailure(ConnectionId id);

    /**
     * If `id` crossed the error-rate threshold, retire it and move the caller's
     * lease to a replacement connection. Returns the id the caller now holds.
     */
    Expected<ConnectionId> reassignIfUnhealthy(ConnectionId id, const ShouldCancel& shouldCancel);

    // Native handles for a leased connection
    Stream checkout(ConnectionId id);
    void checkin(Stream&& stream);

    [[nodiscard]] std::optional<ConnectionSnapshot> snapshot(ConnectionId id) const;
    [[nodiscard]] std::size_t connectionCount(const std::string& host) const;
    [[nodiscard]] std::size_t activeStreams(const std::string& host) const;
    [[nodiscard]] std::size_t hostLimit(Generation generation) const noexcept;
    [[nodiscard]] const PoolLimits& limits() const noexcept { return limits_; }

    // Wake blocked acquirers so they re-check cancellation.
    void wakeAll();

private:
    struct HostSession;
    struct Connection {
        ConnectionId id{kNoConnection};
        std::string host;
        Generation generation{Generation::Http1};
        std::size_t activeStreams{0};
        bool retired{false};
        ConnectionStats stats;
        std::vector<EasyHandle> idle;
    };

    HostSession& sessionFor(const std::string& host);
    std::optional<ConnectionId> tryLeaseLocked(const std::string& host, Generation generation);
    void releaseLocked(ConnectionId id);
    bool unhealthyLocked(const Connection& c) const;

    PoolLimits limits_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<ConnectionId, Connection> connections_;
    std::unordered_map<std::string, std::unique_ptr<HostSession>> sessions_;
    ConnectionId nextId_{1};
};

} // namespace parfetch::net
