#include <parfetch/net/protocol_adapter.h>

#include "curl_transport.h"

#include <spdlog/spdlog.h>

namespace parfetch::net {

namespace {

Expected<void> fetchFtp(const TransportOptions& opts, const ResourceInfo& resource,
                        std::optional<ByteRange> range, Stream& stream, const DataSink& sink,
                        const TransferProgress& progress, const ShouldCancel& shouldCancel) {
    EasyHandle transient;
    CURL* easy = stream.easy.get();
    if (!easy) {
        transient.reset(curl_easy_init());
        easy = transient.get();
    }
    if (!easy)
        return Error{ErrorCode::Unknown, "curl_easy_init failed"};

    detail::RequestSpec spec;
    spec.url = resource.url;
    spec.ftp = true;
    spec.range = range;
    if (range)
        spec.bodyLimit = range->length();

    detail::ResponseValidator none;
    auto out =
        detail::perform(easy, stream.share, opts, spec, &sink, &progress, &shouldCancel, none);
    std::optional<std::uint64_t> expected;
    if (range)
        expected = range->length();
    return detail::finish(out, range ? "fetchRange(RETR)" : "fetchFull(RETR)", expected);
}

} // namespace

Expected<ResourceInfo> FtpAdapter::probe(const ResourceRequest& request,
                                         const ShouldCancel& shouldCancel) {
    EasyHandle easy(curl_easy_init());
    if (!easy)
        return Error{ErrorCode::Unknown, "curl_easy_init failed"};

    detail::RequestSpec spec;
    spec.url = request.url;
    spec.ftp = true;
    spec.headOnly = true; // SIZE + MDTM, no RETR

    detail::ResponseValidator none;
    auto out = detail::perform(easy.get(), nullptr, opts_, spec, nullptr, nullptr, &shouldCancel,
                               none);
    if (auto r = detail::finish(out, "probe(FTP)", std::nullopt); !r)
        return r.error();

    ResourceInfo info;
    info.url = request.url;
    info.headers = request.headers;
    info.generation = Generation::Ftp;
    if (out.downloadLength >= 0)
        info.size = static_cast<std::uint64_t>(out.downloadLength);
    // REST is part of the base protocol; without SIZE we cannot plan ranges anyway
    info.rangeSupported = info.size.has_value();
    if (out.fileTime >= 0)
        info.lastModified = std::to_string(static_cast<long long>(out.fileTime));
    info.filename = filenameFromUrl(request.url);
    info.rtt = out.elapsed;

    spdlog::debug("FTP probe {}: size={} mdtm={}", request.url,
                  info.size ? std::to_string(*info.size) : std::string("unknown"),
                  info.lastModified.value_or("unknown"));
    return info;
}

Expected<void> FtpAdapter::fetchRange(const ResourceInfo& resource, ByteRange range,
                                      Stream& stream, const DataSink& sink,
                                      const TransferProgress& progress,
                                      const ShouldCancel& shouldCancel) {
    return fetchFtp(opts_, resource, range, stream, sink, progress, shouldCancel);
}

Expected<void> FtpAdapter::fetchFull(const ResourceInfo& resource, Stream& stream,
                                     const DataSink& sink, const TransferProgress& progress,
                                     const ShouldCancel& shouldCancel) {
    return fetchFtp(opts_, resource, std::nullopt, stream, sink, progress, shouldCancel);
}

} // namespace parfetch::net
