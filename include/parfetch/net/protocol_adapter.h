#pragma once

#include <parfetch/core/types.h>
#include <parfetch/net/connection_pool.h>
#include <parfetch/net/resource.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>

namespace parfetch::net {

/**
 * What a sink wants after consuming a chunk: keep going, or end the transfer
 * cleanly (e.g. the segment was shrunk by a split and its new end was reached).
 */
enum class SinkStatus { Continue, Stop };

// Called on the transfer thread, possibly many times per request.
using DataSink = std::function<Expected<SinkStatus>(std::span<const std::byte>)>;

// Bytes received so far by the current request.
using TransferProgress = std::function<void(std::uint64_t received)>;

/**
 * Transport settings shared by every adapter variant.
 */
struct TransportOptions {
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds readTimeout{30000}; // abort when stalled this long
    bool tlsInsecure{false};
    std::string caPath;
    std::string userAgent{"parfetch/0.1"};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

/**
 * Uniform contract every transport generation satisfies.
 *
 * fetchRange/fetchFull report failures with distinct kinds (Timeout,
 * ConnectionReset, ServerRejected with status, RateLimited, RangeUnsupported,
 * ProtocolNegotiationFailed) so callers can choose retry, fallback or failure.
 */
class IProtocolAdapter {
public:
    virtual ~IProtocolAdapter() = default;

    virtual Expected<ResourceInfo> probe(const ResourceRequest& request,
                                         const ShouldCancel& shouldCancel) = 0;

    virtual Expected<void> fetchRange(const ResourceInfo& resource, ByteRange range,
                                      Stream& stream, const DataSink& sink,
                                      const TransferProgress& progress,
                                      const ShouldCancel& shouldCancel) = 0;

    virtual Expected<void> fetchFull(const ResourceInfo& resource, Stream& stream,
                                     const DataSink& sink, const TransferProgress& progress,
                                     const ShouldCancel& shouldCancel) = 0;
};

// ===========================
// libcurl-backed generations
// ===========================

/**
 * HTTP/1.1: one transport connection per active segment.
 */
class Http1Adapter {
public:
    static constexpr Generation kGeneration = Generation::Http1;
    explicit Http1Adapter(TransportOptions opts) : opts_(std::move(opts)) {}

    Expected<ResourceInfo> probe(const ResourceRequest& request, const ShouldCancel& shouldCancel);
    Expected<void> fetchRange(const ResourceInfo& resource, ByteRange range, Stream& stream,
                              const DataSink& sink, const TransferProgress& progress,
                              const ShouldCancel& shouldCancel);
    Expected<void> fetchFull(const ResourceInfo& resource, Stream& stream, const DataSink& sink,
                             const TransferProgress& progress, const ShouldCancel& shouldCancel);

private:
    TransportOptions opts_;
};

/**
 * HTTP/2 over TLS (ALPN may settle on HTTP/1.1, which probe() reports).
 */
class Http2Adapter {
public:
    static constexpr Generation kGeneration = Generation::Http2;
    explicit Http2Adapter(TransportOptions opts) : opts_(std::move(opts)) {}

    Expected<ResourceInfo> probe(const ResourceRequest& request, const ShouldCancel& shouldCancel);
    Expected<void> fetchRange(const ResourceInfo& resource, ByteRange range, Stream& stream,
                              const DataSink& sink, const TransferProgress& progress,
                              const ShouldCancel& shouldCancel);
    Expected<void> fetchFull(const ResourceInfo& resource, Stream& stream, const DataSink& sink,
                             const TransferProgress& progress, const ShouldCancel& shouldCancel);

private:
    TransportOptions opts_;
};

/**
 * HTTP/3 over QUIC. Only usable when libcurl was built with HTTP/3 support.
 */
class Http3Adapter {
public:
    static constexpr Generation kGeneration = Generation::Http3;
    explicit Http3Adapter(TransportOptions opts) : opts_(std::move(opts)) {}

    static bool available() noexcept;

    Expected<ResourceInfo> probe(const ResourceRequest& request, const ShouldCancel& shouldCancel);
    Expected<void> fetchRange(const ResourceInfo& resource, ByteRange range, Stream& stream,
                              const DataSink& sink, const TransferProgress& progress,
                              const ShouldCancel& shouldCancel);
    Expected<void> fetchFull(const ResourceInfo& resource, Stream& stream, const DataSink& sink,
                             const TransferProgress& progress, const ShouldCancel& shouldCancel);

private:
    TransportOptions opts_;
};

/**
 * FTP/FTPS: size from SIZE, validator from MDTM, ranges via REST.
 */
class FtpAdapter {
public:
    static constexpr Generation kGeneration = Generation::Ftp;
    explicit FtpAdapter(TransportOptions opts) : opts_(std::move(opts)) {}

    Expected<ResourceInfo> probe(const ResourceRequest& request, const ShouldCancel& shouldCancel);
    Expected<void> fetchRange(const ResourceInfo& resource, ByteRange range, Stream& stream,
                              const DataSink& sink, const TransferProgress& progress,
                              const ShouldCancel& shouldCancel);
    Expected<void> fetchFull(const ResourceInfo& resource, Stream& stream, const DataSink& sink,
                             const TransferProgress& progress, const ShouldCancel& shouldCancel);

private:
    TransportOptions opts_;
};

using AdapterVariant = std::variant<Http1Adapter, Http2Adapter, Http3Adapter, FtpAdapter>;

AdapterVariant makeAdapter(Generation generation, const TransportOptions& opts);

/**
 * Negotiated generation per host, kept for the process lifetime.
 */
class NegotiationCache {
public:
    [[nodiscard]] std::optional<Generation> get(const std::string& host) const;
    void put(const std::string& host, Generation generation);
    void erase(const std::string& host);
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Generation> byHost_;
};

/**
 * Production adapter: negotiates the generation on probe (most advanced
 * advertised first, falling back in descending order) and dispatches fetches
 * to the matching variant.
 */
class ProtocolAdapter final : public IProtocolAdapter {
public:
    explicit ProtocolAdapter(TransportOptions opts,
                             std::shared_ptr<NegotiationCache> cache = nullptr);

    Expected<ResourceInfo> probe(const ResourceRequest& request,
                                 const ShouldCancel& shouldCancel) override;
    Expected<void> fetchRange(const ResourceInfo& resource, ByteRange range, Stream& stream,
                              const DataSink& sink, const TransferProgress& progress,
                              const ShouldCancel& shouldCancel) override;
    Expected<void> fetchFull(const ResourceInfo& resource, Stream& stream, const DataSink& sink,
                             const TransferProgress& progress,
                             const ShouldCancel& shouldCancel) override;

    [[nodiscard]] const NegotiationCache& negotiationCache() const noexcept { return *cache_; }

private:
    Expected<ResourceInfo> negotiate(const ResourceRequest& request,
                                     const ShouldCancel& shouldCancel);

    TransportOptions opts_;
    std::shared_ptr<NegotiationCache> cache_;
};

std::unique_ptr<IProtocolAdapter> makeProtocolAdapter(const TransportOptions& opts);

} // namespace parfetch::net
