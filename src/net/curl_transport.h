#pragma once

// Internal libcurl plumbing shared by the adapter variants.

#include <parfetch/net/protocol_adapter.h>

#include <curl/curl.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace parfetch::net::detail {

struct ContentRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> total; // "*" = unknown
};

// Response metadata of the final response (headers of redirects are discarded).
struct ResponseMeta {
    long status{0};
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength;
    std::optional<ContentRange> contentRange;
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::optional<std::string> contentType;
    std::optional<std::string> contentDisposition;
    std::optional<std::string> altSvc;
    std::optional<std::string> retryAfter;
};

struct RequestSpec {
    std::string url;
    const std::vector<Header>* headers{nullptr};
    std::optional<long> httpVersion; // CURL_HTTP_VERSION_*; unset for FTP
    bool headOnly{false};
    std::optional<ByteRange> range;
    bool ftp{false};
    std::optional<std::uint64_t> bodyLimit; // deliver at most this many bytes
    std::optional<std::string> ifRange;     // sent with an HTTP range only
};

using ResponseValidator = std::function<std::optional<Error>(const ResponseMeta&)>;

struct TransferOutcome {
    CURLcode rc{CURLE_OK};
    ResponseMeta meta;
    long negotiatedVersion{0};
    std::uint64_t received{0};
    std::chrono::microseconds elapsed{0};
    std::chrono::microseconds firstByte{0};
    curl_off_t downloadLength{-1};
    curl_off_t fileTime{-1};
    bool stopped{false};
    bool cancelled{false};
    std::optional<Error> failure; // validator or sink error
};

// Run one request on `easy`, which is reset first. `share` may be null.
TransferOutcome perform(CURL* easy, CURLSH* share, const TransportOptions& opts,
                        const RequestSpec& spec, const DataSink* sink,
                        const TransferProgress* progress, const ShouldCancel* shouldCancel,
                        const ResponseValidator& validate);

Error makeCurlError(CURLcode code, std::string_view where);

// Status-based classification: RateLimited, ServerRejected or none for 2xx.
std::optional<Error> statusError(const ResponseMeta& meta);

// Turn a finished transfer into the uniform result.
Expected<void> finish(const TransferOutcome& out, std::string_view where,
                      std::optional<std::uint64_t> expectedBytes);

Generation generationFromCurl(long version) noexcept;

std::optional<ContentRange> parseContentRange(std::string_view value);

// Validator for If-Range: a strong ETag, else Last-Modified, else none.
std::optional<std::string> ifRangeValidator(const ResourceInfo& resource);

/**
 * Judge the answer to a fetch. With If-Range sent, a 200 that does not carry
 * the same validator means the resource changed (ResourceChanged). Otherwise
 * a 200 is RangeUnsupported unless the range spans the whole resource.
 */
std::optional<Error> checkFetchResponse(const ResponseMeta& meta, std::optional<ByteRange> range,
                                        std::optional<std::uint64_t> size,
                                        const std::optional<std::string>& ifRange);
bool advertisesH3(std::string_view altSvc);

// HTTP flavour of the uniform contract, parameterized by CURL_HTTP_VERSION_*.
Expected<ResourceInfo> probeHttp(const TransportOptions& opts, long httpVersion,
                                 const ResourceRequest& request, const ShouldCancel& shouldCancel);
Expected<void> fetchHttp(const TransportOptions& opts, long httpVersion,
                         const ResourceInfo& resource, std::optional<ByteRange> range,
                         Stream& stream, const DataSink& sink, const TransferProgress& progress,
                         const ShouldCancel& shouldCancel);

} // namespace parfetch::net::detail
