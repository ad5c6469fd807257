// Response parsing and error mapping of the libcurl transport

#include <catch2/catch_test_macros.hpp>

#include "net/curl_transport.h"

#include <parfetch/net/protocol_adapter.h>

using namespace parfetch;
using namespace parfetch::net;
using namespace parfetch::net::detail;

TEST_CASE("CurlTransport: Content-Range parsing", "[net][curl]") {
    SECTION("full form") {
        auto cr = parseContentRange("bytes 0-99/1000");
        REQUIRE(cr.has_value());
        CHECK(cr->first == 0);
        CHECK(cr->last == 99);
        CHECK(cr->total == std::optional<std::uint64_t>(1000));
    }
    SECTION("unknown total") {
        auto cr = parseContentRange("bytes 100-199/*");
        REQUIRE(cr.has_value());
        CHECK(cr->first == 100);
        CHECK_FALSE(cr->total.has_value());
    }
    SECTION("malformed values") {
        CHECK_FALSE(parseContentRange("items 0-1/2").has_value());
        CHECK_FALSE(parseContentRange("bytes 10-5/100").has_value());
        CHECK_FALSE(parseContentRange("bytes */100").has_value());
    }
}

TEST_CASE("CurlTransport: Alt-Svc HTTP/3 detection", "[net][curl]") {
    CHECK(advertisesH3(R"(h3=":443"; ma=86400)"));
    CHECK(advertisesH3(R"(h2=":443", h3-29=":443")"));
    CHECK_FALSE(advertisesH3(R"(h2=":443"; ma=2592000)"));
    CHECK_FALSE(advertisesH3("clear"));
}

TEST_CASE("CurlTransport: status classification", "[net][curl]") {
    ResponseMeta meta;

    meta.status = 206;
    CHECK_FALSE(statusError(meta).has_value());

    meta.status = 429;
    auto limited = statusError(meta);
    REQUIRE(limited.has_value());
    CHECK(limited->code == ErrorCode::RateLimited);
    CHECK(limited->status == std::optional<int>(429));

    SECTION("503 without Retry-After is a server failure") {
        meta.status = 503;
        auto e = statusError(meta);
        REQUIRE(e.has_value());
        CHECK(e->code == ErrorCode::ServerRejected);
        CHECK(isTransient(*e));
    }
    SECTION("503 with Retry-After is rate limiting") {
        meta.status = 503;
        meta.retryAfter = "30";
        auto e = statusError(meta);
        REQUIRE(e.has_value());
        CHECK(e->code == ErrorCode::RateLimited);
    }
    SECTION("client errors are not retried") {
        meta.status = 404;
        auto e = statusError(meta);
        REQUIRE(e.has_value());
        CHECK(e->code == ErrorCode::ServerRejected);
        CHECK_FALSE(isTransient(*e));
    }
}

TEST_CASE("CurlTransport: If-Range validator choice", "[net][curl]") {
    ResourceInfo info;
    CHECK_FALSE(ifRangeValidator(info).has_value());

    info.lastModified = "Wed, 21 Oct 2015 07:28:00 GMT";
    CHECK(ifRangeValidator(info) == info.lastModified);

    info.etag = "\"v1\"";
    CHECK(ifRangeValidator(info) == std::optional<std::string>("\"v1\""));

    // Weak tags are not allowed in If-Range
    info.etag = "W/\"v1\"";
    CHECK(ifRangeValidator(info) == info.lastModified);
}

TEST_CASE("CurlTransport: fetch responses to range requests", "[net][curl]") {
    const ByteRange tail{500, 1000};
    const std::optional<std::uint64_t> size = 1000;
    const std::optional<std::string> tag = "\"v1\"";
    ResponseMeta meta;

    SECTION("206 at the requested offset") {
        meta.status = 206;
        meta.contentRange = ContentRange{500, 999, 1000};
        CHECK_FALSE(checkFetchResponse(meta, tail, size, tag).has_value());
    }
    SECTION("206 at another offset") {
        meta.status = 206;
        meta.contentRange = ContentRange{0, 499, 1000};
        auto e = checkFetchResponse(meta, tail, size, tag);
        REQUIRE(e.has_value());
        CHECK(e->code == ErrorCode::RangeUnsupported);
    }
    SECTION("200 after If-Range means the resource changed") {
        meta.status = 200;
        meta.etag = "\"v2\"";
        auto e = checkFetchResponse(meta, tail, size, tag);
        REQUIRE(e.has_value());
        CHECK(e->code == ErrorCode::ResourceChanged);
        CHECK(e->status == std::optional<int>(200));
    }
    SECTION("200 after If-Range on the whole resource with a new tag") {
        meta.status = 200;
        meta.etag = "\"v2\"";
        auto e = checkFetchResponse(meta, ByteRange{0, 1000}, size, tag);
        REQUIRE(e.has_value());
        CHECK(e->code == ErrorCode::ResourceChanged);
    }
    SECTION("200 with the same tag is a server ignoring Range") {
        meta.status = 200;
        meta.etag = tag;
        auto e = checkFetchResponse(meta, tail, size, tag);
        REQUIRE(e.has_value());
        CHECK(e->code == ErrorCode::RangeUnsupported);
        CHECK_FALSE(checkFetchResponse(meta, ByteRange{0, 1000}, size, tag).has_value());
    }
    SECTION("200 without If-Range") {
        meta.status = 200;
        auto e = checkFetchResponse(meta, tail, size, std::nullopt);
        REQUIRE(e.has_value());
        CHECK(e->code == ErrorCode::RangeUnsupported);
        CHECK_FALSE(checkFetchResponse(meta, ByteRange{0, 1000}, size, std::nullopt).has_value());
    }
    SECTION("status errors come first") {
        meta.status = 503;
        auto e = checkFetchResponse(meta, tail, size, tag);
        REQUIRE(e.has_value());
        CHECK(e->code == ErrorCode::ServerRejected);
    }
}

TEST_CASE("CurlTransport: libcurl codes map to error kinds", "[net][curl]") {
    CHECK(makeCurlError(CURLE_OPERATION_TIMEDOUT, "x").code == ErrorCode::Timeout);
    CHECK(makeCurlError(CURLE_RECV_ERROR, "x").code == ErrorCode::ConnectionReset);
    CHECK(makeCurlError(CURLE_COULDNT_CONNECT, "x").code == ErrorCode::NetworkError);
    CHECK(makeCurlError(CURLE_PEER_FAILED_VERIFICATION, "x").code ==
          ErrorCode::TlsVerificationFailed);
    CHECK(makeCurlError(CURLE_RANGE_ERROR, "x").code == ErrorCode::RangeUnsupported);
    CHECK(makeCurlError(CURLE_UNSUPPORTED_PROTOCOL, "x").code ==
          ErrorCode::ProtocolNegotiationFailed);
    CHECK(makeCurlError(CURLE_ABORTED_BY_CALLBACK, "x").code == ErrorCode::Cancelled);
}

TEST_CASE("CurlTransport: finished transfers become uniform results", "[net][curl]") {
    TransferOutcome out;
    out.received = 100;
    CHECK(finish(out, "fetch", 100).ok());

    SECTION("short body") {
        auto r = finish(out, "fetch", 200);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ConnectionReset);
    }
    SECTION("sink asked to stop") {
        out.rc = CURLE_WRITE_ERROR;
        out.stopped = true;
        CHECK(finish(out, "fetch", 200).ok());
    }
    SECTION("validator failure wins") {
        out.failure = Error{ErrorCode::RangeUnsupported, "200 instead of 206"};
        auto r = finish(out, "fetch", 100);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::RangeUnsupported);
    }
    SECTION("cancelled") {
        out.cancelled = true;
        CHECK(finish(out, "fetch", 100).error().code == ErrorCode::Cancelled);
    }
}

TEST_CASE("CurlTransport: negotiated generation from libcurl", "[net][curl]") {
    CHECK(generationFromCurl(CURL_HTTP_VERSION_2_0) == Generation::Http2);
    CHECK(generationFromCurl(CURL_HTTP_VERSION_1_1) == Generation::Http1);
}

TEST_CASE("NegotiationCache: per-host memory", "[net][negotiation]") {
    NegotiationCache cache;
    CHECK_FALSE(cache.get("h.example").has_value());
    cache.put("h.example", Generation::Http2);
    cache.put("f.example", Generation::Ftp);
    CHECK(cache.get("h.example") == Generation::Http2);
    CHECK(cache.size() == 2);
    cache.put("h.example", Generation::Http1);
    CHECK(cache.get("h.example") == Generation::Http1);
    cache.erase("h.example");
    CHECK_FALSE(cache.get("h.example").has_value());
    CHECK(cache.size() == 1);
}
