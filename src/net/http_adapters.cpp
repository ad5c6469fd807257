#include <parfetch/net/protocol_adapter.h>

#include "curl_transport.h"

#include <curl/curl.h>

namespace parfetch::net {

namespace {

constexpr long kHttp1Version = CURL_HTTP_VERSION_1_1;
constexpr long kHttp2Version = CURL_HTTP_VERSION_2TLS;

long http3Version() noexcept {
#if LIBCURL_VERSION_NUM >= 0x075800
    return CURL_HTTP_VERSION_3ONLY;
#elif LIBCURL_VERSION_NUM >= 0x074200
    return CURL_HTTP_VERSION_3;
#else
    return CURL_HTTP_VERSION_2TLS;
#endif
}

Error http3Unavailable() {
    return Error{ErrorCode::ProtocolNegotiationFailed, "libcurl was built without HTTP/3"};
}

} // namespace

// ---------------- HTTP/1.1 ----------------

Expected<ResourceInfo> Http1Adapter::probe(const ResourceRequest& request,
                                           const ShouldCancel& shouldCancel) {
    return detail::probeHttp(opts_, kHttp1Version, request, shouldCancel);
}

Expected<void> Http1Adapter::fetchRange(const ResourceInfo& resource, ByteRange range,
                                        Stream& stream, const DataSink& sink,
                                        const TransferProgress& progress,
                                        const ShouldCancel& shouldCancel) {
    return detail::fetchHttp(opts_, kHttp1Version, resource, range, stream, sink, progress,
                             shouldCancel);
}

Expected<void> Http1Adapter::fetchFull(const ResourceInfo& resource, Stream& stream,
                                       const DataSink& sink, const TransferProgress& progress,
                                       const ShouldCancel& shouldCancel) {
    return detail::fetchHttp(opts_, kHttp1Version, resource, std::nullopt, stream, sink, progress,
                             shouldCancel);
}

// ---------------- HTTP/2 ----------------

Expected<ResourceInfo> Http2Adapter::probe(const ResourceRequest& request,
                                           const ShouldCancel& shouldCancel) {
    return detail::probeHttp(opts_, kHttp2Version, request, shouldCancel);
}

Expected<void> Http2Adapter::fetchRange(const ResourceInfo& resource, ByteRange range,
                                        Stream& stream, const DataSink& sink,
                                        const TransferProgress& progress,
                                        const ShouldCancel& shouldCancel) {
    return detail::fetchHttp(opts_, kHttp2Version, resource, range, stream, sink, progress,
                             shouldCancel);
}

Expected<void> Http2Adapter::fetchFull(const ResourceInfo& resource, Stream& stream,
                                       const DataSink& sink, const TransferProgress& progress,
                                       const ShouldCancel& shouldCancel) {
    return detail::fetchHttp(opts_, kHttp2Version, resource, std::nullopt, stream, sink, progress,
                             shouldCancel);
}

// ---------------- HTTP/3 ----------------

bool Http3Adapter::available() noexcept {
#ifdef CURL_VERSION_HTTP3
    const auto* info = curl_version_info(CURLVERSION_NOW);
    return info && (info->features & CURL_VERSION_HTTP3) != 0;
#else
    return false;
#endif
}

Expected<ResourceInfo> Http3Adapter::probe(const ResourceRequest& request,
                                           const ShouldCancel& shouldCancel) {
    if (!available())
        return http3Unavailable();
    return detail::probeHttp(opts_, http3Version(), request, shouldCancel);
}

Expected<void> Http3Adapter::fetchRange(const ResourceInfo& resource, ByteRange range,
                                        Stream& stream, const DataSink& sink,
                                        const TransferProgress& progress,
                                        const ShouldCancel& shouldCancel) {
    if (!available())
        return http3Unavailable();
    return detail::fetchHttp(opts_, http3Version(), resource, range, stream, sink, progress,
                             shouldCancel);
}

Expected<void> Http3Adapter::fetchFull(const ResourceInfo& resource, Stream& stream,
                                       const DataSink& sink, const TransferProgress& progress,
                                       const ShouldCancel& shouldCancel) {
    if (!available())
        return http3Unavailable();
    return detail::fetchHttp(opts_, http3Version(), resource, std::nullopt, stream, sink,
                             progress, shouldCancel);
}

} // namespace parfetch::net
