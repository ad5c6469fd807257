#include <parfetch/net/protocol_adapter.h>

#include <spdlog/spdlog.h>

namespace parfetch::net {

AdapterVariant makeAdapter(Generation generation, const TransportOptions& opts) {
    switch (generation) {
        case Generation::Http3:
            return Http3Adapter{opts};
        case Generation::Http2:
            return Http2Adapter{opts};
        case Generation::Ftp:
            return FtpAdapter{opts};
        case Generation::Http1:
            break;
    }
    return Http1Adapter{opts};
}

std::optional<Generation> NegotiationCache::get(const std::string& host) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = byHost_.find(host);
    if (it == byHost_.end())
        return std::nullopt;
    return it->second;
}

void NegotiationCache::put(const std::string& host, Generation generation) {
    std::lock_guard<std::mutex> lk(mutex_);
    byHost_[host] = generation;
}

void NegotiationCache::erase(const std::string& host) {
    std::lock_guard<std::mutex> lk(mutex_);
    byHost_.erase(host);
}

std::size_t NegotiationCache::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return byHost_.size();
}

ProtocolAdapter::ProtocolAdapter(TransportOptions opts, std::shared_ptr<NegotiationCache> cache)
    : opts_(std::move(opts)), cache_(std::move(cache)) {
    if (!cache_)
        cache_ = std::make_shared<NegotiationCache>();
}

Expected<ResourceInfo> ProtocolAdapter::probe(const ResourceRequest& request,
                                              const ShouldCancel& shouldCancel) {
    return negotiate(request, shouldCancel);
}

Expected<ResourceInfo> ProtocolAdapter::negotiate(const ResourceRequest& request,
                                                  const ShouldCancel& shouldCancel) {
    const auto scheme = schemeOf(request.url);
    if (scheme == "ftp" || scheme == "ftps")
        return FtpAdapter{opts_}.probe(request, shouldCancel);
    if (scheme != "http" && scheme != "https")
        return Error{ErrorCode::InvalidArgument, "unsupported URL scheme: '" + scheme + "'"};

    const auto host = hostOf(request.url);
    if (host.empty())
        return Error{ErrorCode::InvalidArgument, "URL has no host: " + request.url};

    if (auto cached = cache_->get(host)) {
        auto adapter = makeAdapter(*cached, opts_);
        auto r = std::visit([&](auto& a) { return a.probe(request, shouldCancel); }, adapter);
        if (r.ok() || r.error().code != ErrorCode::ProtocolNegotiationFailed)
            return r;
        spdlog::info("negotiation: cached {} for {} no longer works, renegotiating",
                     generationToString(*cached), host);
        cache_->erase(host);
    }

    // HTTP/2 over ALPN also tells us whether the server advertises HTTP/3.
    auto r = Http2Adapter{opts_}.probe(request, shouldCancel);
    if (!r.ok() && r.error().code == ErrorCode::ProtocolNegotiationFailed) {
        spdlog::debug("negotiation: HTTP/2 failed for {} ({}), trying HTTP/1.1", host,
                      r.error().message);
        r = Http1Adapter{opts_}.probe(request, shouldCancel);
    }
    if (!r.ok())
        return r;

    auto info = std::move(r).value();
    if (info.h3Advertised && Http3Adapter::available()) {
        auto h3 = Http3Adapter{opts_}.probe(request, shouldCancel);
        if (h3.ok()) {
            info = std::move(h3).value();
        } else {
            spdlog::debug("negotiation: HTTP/3 advertised by {} but failed: {}", host,
                          h3.error().message);
        }
    }

    cache_->put(host, info.generation);
    spdlog::debug("negotiation: {} -> {}", host, generationToString(info.generation));
    return info;
}

Expected<void> ProtocolAdapter::fetchRange(const ResourceInfo& resource, ByteRange range,
                                           Stream& stream, const DataSink& sink,
                                           const TransferProgress& progress,
                                           const ShouldCancel& shouldCancel) {
    auto adapter = makeAdapter(resource.generation, opts_);
    return std::visit(
        [&](auto& a) { return a.fetchRange(resource, range, stream, sink, progress, shouldCancel); },
        adapter);
}

Expected<void> ProtocolAdapter::fetchFull(const ResourceInfo& resource, Stream& stream,
                                          const DataSink& sink, const TransferProgress& progress,
                                          const ShouldCancel& shouldCancel) {
    auto adapter = makeAdapter(resource.generation, opts_);
    return std::visit(
        [&](auto& a) { return a.fetchFull(resource, stream, sink, progress, shouldCancel); },
        adapter);
}

std::unique_ptr<IProtocolAdapter> makeProtocolAdapter(const TransportOptions& opts) {
    return std::make_unique<ProtocolAdapter>(opts);
}

} // namespace parfetch::net
