/*
 * curl_transport.cpp
 *
 * Notes
 * - One request per perform(); the easy handle is reset and reused so libcurl keeps
 *   the transport connection, TLS session and DNS entries warm.
 * - Response status is validated on the first body chunk so an error page is never
 *   handed to the sink.
 * - Sinks may stop a transfer early; that is reported as success.
 */

#include "curl_transport.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <memory>

namespace parfetch::net::detail {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

bool istarts_with(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size())
        return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::uint64_t> parse_u64(std::string_view sv) {
    std::uint64_t tmp{0};
    auto res = std::from_chars(sv.data(), sv.data() + sv.size(), tmp);
    if (res.ec != std::errc() || res.ptr != sv.data() + sv.size())
        return std::nullopt;
    return tmp;
}

struct CallbackContext {
    ResponseMeta meta;
    CURL* easy{nullptr};
    const DataSink* sink{nullptr};
    const TransferProgress* progress{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    const ResponseValidator* validate{nullptr};
    std::optional<std::uint64_t> limit;
    std::uint64_t received{0};
    bool validated{false};
    bool stopped{false};
    bool cancelled{false};
    std::optional<Error> failure;
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<CallbackContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    // A new status line starts a new response (redirect hop or 100-continue).
    if (istarts_with(line, "HTTP/")) {
        ctx->meta = ResponseMeta{};
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        if (to_lower(val) == "bytes")
            ctx->meta.acceptRangesBytes = true;
    } else if (key == "content-length") {
        ctx->meta.contentLength = parse_u64(val);
    } else if (key == "content-range") {
        ctx->meta.contentRange = parseContentRange(val);
    } else if (key == "etag") {
        // Weak and strong tags compare as opaque strings; only quotes are stripped
        auto v = val;
        if (v.size() >= 2 &&
            ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\''))) {
            v = v.substr(1, v.size() - 2);
        }
        ctx->meta.etag = std::move(v);
    } else if (key == "last-modified") {
        ctx->meta.lastModified = val;
    } else if (key == "content-type") {
        ctx->meta.contentType = val;
    } else if (key == "content-disposition") {
        ctx->meta.contentDisposition = val;
    } else if (key == "alt-svc") {
        ctx->meta.altSvc = val;
    } else if (key == "retry-after") {
        ctx->meta.retryAfter = val;
    }
    return total;
}

bool validateOnce(CallbackContext* ctx) {
    if (ctx->validated)
        return !ctx->failure.has_value();
    ctx->validated = true;
    long status = 0;
    curl_easy_getinfo(ctx->easy, CURLINFO_RESPONSE_CODE, &status);
    ctx->meta.status = status;
    if (ctx->validate && *ctx->validate) {
        if (auto err = (*ctx->validate)(ctx->meta)) {
            ctx->failure = std::move(err);
            return false;
        }
    }
    return true;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<CallbackContext*>(userdata);
    if (total == 0)
        return 0;

    if (!validateOnce(ctx))
        return 0; // CURLE_WRITE_ERROR, reported via ctx->failure

    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelled = true;
        return 0;
    }

    std::size_t deliver = total;
    bool truncated = false;
    if (ctx->limit) {
        const auto left = *ctx->limit - std::min(*ctx->limit, ctx->received);
        if (deliver > left) {
            deliver = static_cast<std::size_t>(left);
            truncated = true;
        }
    }

    if (deliver > 0 && ctx->sink && *ctx->sink) {
        std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), deliver};
        auto r = (*ctx->sink)(bytes);
        if (!r.ok()) {
            ctx->failure = r.error();
            return 0;
        }
        ctx->received += deliver;
        if (ctx->progress && *ctx->progress)
            (*ctx->progress)(ctx->received);
        if (r.value() == SinkStatus::Stop) {
            ctx->stopped = true;
            return 0;
        }
    } else {
        ctx->received += deliver;
    }

    if (truncated) {
        ctx->stopped = true;
        return 0;
    }
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<CallbackContext*>(userdata);
    if (ctx && ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelled = true;
        return 1; // CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

curl_slist* build_header_list(const std::vector<Header>* headers) {
    curl_slist* list = nullptr;
    if (!headers)
        return list;
    for (const auto& h : *headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

void configure_common(CURL* curl, const TransportOptions& opts) {
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(opts.connectTimeout.count()));
    // Read timeout: abort when fewer than 1 byte/s arrives for the whole window
    const long stallSeconds =
        std::max<long>(1, static_cast<long>((opts.readTimeout.count() + 999) / 1000));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stallSeconds);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, opts.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl, CURLOPT_USE_SSL, CURLUSESSL_TRY);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, opts.tlsInsecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, opts.tlsInsecure ? 0L : 2L);
    if (!opts.caPath.empty())
        curl_easy_setopt(curl, CURLOPT_CAINFO, opts.caPath.c_str());
    if (opts.proxy && !opts.proxy->empty())
        curl_easy_setopt(curl, CURLOPT_PROXY, opts.proxy->c_str());
    if (!opts.userAgent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, opts.userAgent.c_str());

    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
}

std::chrono::microseconds infoTime(CURL* curl, CURLINFO what) {
    curl_off_t us = 0;
    if (curl_easy_getinfo(curl, what, &us) != CURLE_OK)
        return std::chrono::microseconds{0};
    return std::chrono::microseconds{static_cast<std::int64_t>(us)};
}

} // namespace

std::optional<ContentRange> parseContentRange(std::string_view value) {
    // bytes <first>-<last>/<total|*>
    auto v = trim(value);
    std::string_view sv(v);
    if (!istarts_with(sv, "bytes"))
        return std::nullopt;
    sv.remove_prefix(5);
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '='))
        sv.remove_prefix(1);
    auto dash = sv.find('-');
    auto slash = sv.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || slash < dash)
        return std::nullopt;
    auto first = parse_u64(sv.substr(0, dash));
    auto last = parse_u64(sv.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first)
        return std::nullopt;
    ContentRange cr{*first, *last, std::nullopt};
    auto totalPart = sv.substr(slash + 1);
    if (totalPart != "*")
        cr.total = parse_u64(totalPart);
    return cr;
}

bool advertisesH3(std::string_view altSvc) {
    auto lower = to_lower(altSvc);
    std::string_view sv(lower);
    size_t pos = 0;
    while ((pos = sv.find("h3", pos)) != std::string_view::npos) {
        const bool atStart = pos == 0 || sv[pos - 1] == ' ' || sv[pos - 1] == ',';
        const bool tokenEnd = pos + 2 < sv.size() && (sv[pos + 2] == '=' || sv[pos + 2] == '-');
        if (atStart && tokenEnd)
            return true;
        pos += 2;
    }
    return false;
}

Generation generationFromCurl(long version) noexcept {
    switch (version) {
        case CURL_HTTP_VERSION_2_0:
            return Generation::Http2;
#if LIBCURL_VERSION_NUM >= 0x074200
        case CURL_HTTP_VERSION_3:
            return Generation::Http3;
#endif
        default:
            return Generation::Http1;
    }
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            err.code = ErrorCode::ConnectionReset;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
#if LIBCURL_VERSION_NUM >= 0x074400
        case CURLE_HTTP3:
#endif
#if LIBCURL_VERSION_NUM >= 0x074500
        case CURLE_QUIC_CONNECT_ERROR:
#endif
            err.code = ErrorCode::ProtocolNegotiationFailed;
            break;
        case CURLE_RANGE_ERROR:
        case CURLE_FTP_COULDNT_USE_REST:
            err.code = ErrorCode::RangeUnsupported;
            break;
        case CURLE_REMOTE_FILE_NOT_FOUND:
            err.code = ErrorCode::ServerRejected;
            err.status = 550;
            break;
        case CURLE_LOGIN_DENIED:
        case CURLE_REMOTE_ACCESS_DENIED:
            err.code = ErrorCode::ServerRejected;
            err.status = 530;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::Cancelled;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

std::optional<Error> statusError(const ResponseMeta& meta) {
    const long s = meta.status;
    if (s == 429 || (s == 503 && meta.retryAfter)) {
        Error e{ErrorCode::RateLimited, "server rate limit (HTTP " + std::to_string(s) + ")",
                static_cast<int>(s)};
        return e;
    }
    if (s >= 300) {
        Error e{ErrorCode::ServerRejected, "HTTP error " + std::to_string(s), static_cast<int>(s)};
        return e;
    }
    return std::nullopt;
}

TransferOutcome perform(CURL* easy, CURLSH* share, const TransportOptions& opts,
                        const RequestSpec& spec, const DataSink* sink,
                        const TransferProgress* progress, const ShouldCancel* shouldCancel,
                        const ResponseValidator& validate) {
    TransferOutcome out;
    curl_easy_reset(easy);
    if (share)
        curl_easy_setopt(easy, CURLOPT_SHARE, share);

    SlistPtr list(build_header_list(spec.headers));
    std::string rangeValue;
    if (spec.range && !spec.range->empty()) {
        rangeValue = std::to_string(spec.range->start) + "-" + std::to_string(spec.range->end - 1);
        if (spec.ftp) {
            curl_easy_setopt(easy, CURLOPT_RANGE, rangeValue.c_str());
        } else {
            const std::string header = "Range: bytes=" + rangeValue;
            list.reset(curl_slist_append(list.release(), header.c_str()));
            if (spec.ifRange) {
                const std::string cond = "If-Range: " + *spec.ifRange;
                list.reset(curl_slist_append(list.release(), cond.c_str()));
            }
        }
    }

    CallbackContext ctx;
    ctx.easy = easy;
    ctx.sink = sink;
    ctx.progress = progress;
    ctx.shouldCancel = shouldCancel;
    ctx.validate = &validate;
    ctx.limit = spec.bodyLimit;

    curl_easy_setopt(easy, CURLOPT_URL, spec.url.c_str());
    if (list)
        curl_easy_setopt(easy, CURLOPT_HTTPHEADER, list.get());
    if (spec.headOnly) {
        curl_easy_setopt(easy, CURLOPT_NOBODY, 1L);
    } else if (!spec.ftp) {
        curl_easy_setopt(easy, CURLOPT_HTTPGET, 1L);
    }
    if (spec.ftp)
        curl_easy_setopt(easy, CURLOPT_FILETIME, 1L);
    if (spec.httpVersion)
        curl_easy_setopt(easy, CURLOPT_HTTP_VERSION, *spec.httpVersion);

    curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(easy, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(easy, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
    curl_easy_setopt(easy, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(easy, CURLOPT_NOPROGRESS, 0L);

    configure_common(easy, opts);

    out.rc = curl_easy_perform(easy);

    // Responses without a body never reach write_cb; validate them here.
    if (out.rc == CURLE_OK)
        validateOnce(&ctx);
    else if (!ctx.validated) {
        long status = 0;
        curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
        ctx.meta.status = status;
    }

    curl_easy_getinfo(easy, CURLINFO_HTTP_VERSION, &out.negotiatedVersion);
    curl_easy_getinfo(easy, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &out.downloadLength);
    curl_easy_getinfo(easy, CURLINFO_FILETIME_T, &out.fileTime);
    out.elapsed = infoTime(easy, CURLINFO_TOTAL_TIME_T);
    out.firstByte = infoTime(easy, CURLINFO_STARTTRANSFER_TIME_T) -
                    infoTime(easy, CURLINFO_PRETRANSFER_TIME_T);

    out.meta = std::move(ctx.meta);
    out.received = ctx.received;
    out.stopped = ctx.stopped;
    out.cancelled = ctx.cancelled;
    out.failure = std::move(ctx.failure);
    return out;
}

Expected<void> finish(const TransferOutcome& out, std::string_view where,
                      std::optional<std::uint64_t> expectedBytes) {
    if (out.failure)
        return *out.failure;
    if (out.cancelled)
        return Error{ErrorCode::Cancelled, std::string(where) + ": transfer cancelled"};
    if (out.rc == CURLE_WRITE_ERROR && out.stopped)
        return Expected<void>{};
    if (out.rc != CURLE_OK)
        return makeCurlError(out.rc, where);
    if (expectedBytes && out.received < *expectedBytes) {
        return Error{ErrorCode::ConnectionReset,
                     std::string(where) + ": short read (" + std::to_string(out.received) + " of " +
                         std::to_string(*expectedBytes) + " bytes)"};
    }
    return Expected<void>{};
}

std::optional<std::string> ifRangeValidator(const ResourceInfo& resource) {
    // Weak validators are not allowed in If-Range
    if (resource.etag && !resource.etag->empty() && !istarts_with(*resource.etag, "W/"))
        return resource.etag;
    if (resource.lastModified && !resource.lastModified->empty())
        return resource.lastModified;
    return std::nullopt;
}

std::optional<Error> checkFetchResponse(const ResponseMeta& meta, std::optional<ByteRange> range,
                                        std::optional<std::uint64_t> size,
                                        const std::optional<std::string>& ifRange) {
    if (auto err = statusError(meta))
        return err;
    if (!range)
        return std::nullopt;
    if (meta.status == 206) {
        if (meta.contentRange && meta.contentRange->first != range->start) {
            return Error{ErrorCode::RangeUnsupported,
                         "Content-Range starts at " + std::to_string(meta.contentRange->first) +
                             ", requested " + std::to_string(range->start)};
        }
        return std::nullopt;
    }
    if (ifRange) {
        const bool sameValidator = (meta.etag && *meta.etag == *ifRange) ||
                                   (meta.lastModified && *meta.lastModified == *ifRange);
        if (!sameValidator) {
            return Error{ErrorCode::ResourceChanged,
                         "If-Range " + *ifRange + " no longer matches (HTTP " +
                             std::to_string(meta.status) + ")",
                         static_cast<int>(meta.status)};
        }
    }
    // 200 for a range request is only usable when the range is the whole resource
    if (range->start == 0 && (!size || range->end >= *size))
        return std::nullopt;
    return Error{ErrorCode::RangeUnsupported,
                 "server ignored Range (HTTP " + std::to_string(meta.status) + ")"};
}

Expected<ResourceInfo> probeHttp(const TransportOptions& opts, long httpVersion,
                                 const ResourceRequest& request,
                                 const ShouldCancel& shouldCancel) {
    EasyHandle easy(curl_easy_init());
    if (!easy)
        return Error{ErrorCode::Unknown, "curl_easy_init failed"};

    ResponseValidator none;
    RequestSpec head;
    head.url = request.url;
    head.headers = &request.headers;
    head.httpVersion = httpVersion;
    head.headOnly = true;

    ResourceInfo info;
    info.url = request.url;
    info.headers = request.headers;

    auto headOut = perform(easy.get(), nullptr, opts, head, nullptr, nullptr, &shouldCancel, none);
    if (headOut.cancelled)
        return Error{ErrorCode::Cancelled, "probe cancelled"};

    TransferOutcome chosen;
    bool haveAnswer = false;
    if (headOut.rc == CURLE_OK && headOut.meta.status >= 200 && headOut.meta.status < 300 &&
        headOut.meta.contentLength && headOut.meta.acceptRangesBytes) {
        chosen = std::move(headOut);
        haveAnswer = true;
        info.rangeSupported = true;
        info.size = chosen.meta.contentLength;
    } else {
        if (headOut.rc != CURLE_OK) {
            auto err = makeCurlError(headOut.rc, "probe(HEAD)");
            if (err.code == ErrorCode::ProtocolNegotiationFailed ||
                err.code == ErrorCode::TlsVerificationFailed)
                return err;
            spdlog::debug("HEAD probe failed ({}), attempting GET Range 0-0", err.message);
        } else if (headOut.meta.status == 429) {
            return *statusError(headOut.meta);
        }

        // Some servers reject HEAD or omit Accept-Ranges; a one-byte range settles it
        RequestSpec get;
        get.url = request.url;
        get.headers = &request.headers;
        get.httpVersion = httpVersion;
        get.range = ByteRange{0, 1};
        get.bodyLimit = 1;
        DataSink discard = [](std::span<const std::byte>) -> Expected<SinkStatus> {
            return SinkStatus::Continue;
        };
        auto getOut =
            perform(easy.get(), nullptr, opts, get, &discard, nullptr, &shouldCancel, none);
        if (getOut.cancelled)
            return Error{ErrorCode::Cancelled, "probe cancelled"};
        if (getOut.rc != CURLE_OK && !(getOut.rc == CURLE_WRITE_ERROR && getOut.stopped))
            return makeCurlError(getOut.rc, "probe(GET range)");
        if (auto err = statusError(getOut.meta))
            return *err;

        if (getOut.meta.status == 206) {
            info.rangeSupported = true;
            if (getOut.meta.contentRange)
                info.size = getOut.meta.contentRange->total;
        } else {
            info.rangeSupported = false;
            // Our body limit may have cut the transfer; the declared length still holds
            info.size = getOut.meta.contentLength;
        }
        chosen = std::move(getOut);
        haveAnswer = true;
    }

    if (!haveAnswer)
        return Error{ErrorCode::ProbeFailed, "probe produced no response"};

    const auto& meta = chosen.meta;
    info.etag = meta.etag;
    info.lastModified = meta.lastModified;
    info.contentType = meta.contentType;
    if (meta.contentDisposition)
        info.filename = filenameFromContentDisposition(*meta.contentDisposition);
    if (!info.filename)
        info.filename = filenameFromUrl(request.url);
    info.generation = generationFromCurl(chosen.negotiatedVersion);
    info.rtt = chosen.firstByte.count() > 0 ? chosen.firstByte : chosen.elapsed;
    info.h3Advertised = meta.altSvc && advertisesH3(*meta.altSvc);

    if (info.etag)
        spdlog::debug("HTTP probe captured ETag: {}", *info.etag);
    if (info.lastModified)
        spdlog::debug("HTTP probe captured Last-Modified: {}", *info.lastModified);
    return info;
}

Expected<void> fetchHttp(const TransportOptions& opts, long httpVersion,
                         const ResourceInfo& resource, std::optional<ByteRange> range,
                         Stream& stream, const DataSink& sink, const TransferProgress& progress,
                         const ShouldCancel& shouldCancel) {
    EasyHandle transient;
    CURL* easy = stream.easy.get();
    if (!easy) {
        transient.reset(curl_easy_init());
        easy = transient.get();
    }
    if (!easy)
        return Error{ErrorCode::Unknown, "curl_easy_init failed"};

    RequestSpec spec;
    spec.url = resource.url;
    spec.headers = &resource.headers;
    spec.httpVersion = httpVersion;
    spec.range = range;
    if (range) {
        spec.bodyLimit = range->length();
        spec.ifRange = ifRangeValidator(resource);
    }

    ResponseValidator validate = [range, size = resource.size,
                                  ifRange = spec.ifRange](const ResponseMeta& meta) {
        return checkFetchResponse(meta, range, size, ifRange);
    };

    auto out = perform(easy, stream.share, opts, spec, &sink, &progress, &shouldCancel, validate);
    std::optional<std::uint64_t> expected;
    if (range)
        expected = range->length();
    return finish(out, range ? "fetchRange(GET)" : "fetchFull(GET)", expected);
}

} // namespace parfetch::net::detail
