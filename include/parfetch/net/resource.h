#pragma once

#include <parfetch/core/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parfetch::net {

/**
 * Transport generations and alternate schemes, most advanced HTTP first.
 */
enum class Generation { Http3, Http2, Http1, Ftp };

// Multiplexed generations carry many logical streams per transport connection.
constexpr bool isMultiplexed(Generation g) noexcept {
    return g == Generation::Http2 || g == Generation::Http3;
}

std::string_view generationToString(Generation g) noexcept;
std::optional<Generation> generationFromString(std::string_view s) noexcept;

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Alternate location serving the same bytes. Fallback mirrors only carry
 * segments when the better ones are failing.
 */
enum class MirrorPriority { Primary, Secondary, Fallback };

std::string_view mirrorPriorityToString(MirrorPriority p) noexcept;
std::optional<MirrorPriority> mirrorPriorityFromString(std::string_view s) noexcept;

struct Mirror {
    std::string url;
    MirrorPriority priority{MirrorPriority::Secondary};
};

/**
 * What the caller knows about a resource before probing.
 */
struct ResourceRequest {
    std::string url;
    std::vector<Header> headers;
};

/**
 * Probed resource metadata. Immutable once probed; re-probed on resume.
 */
struct ResourceInfo {
    std::string url;
    std::vector<Header> headers; // request headers replayed on every fetch
    std::optional<std::uint64_t> size;
    bool rangeSupported{false};
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    std::optional<std::string> contentType;
    std::optional<std::string> filename;
    Generation generation{Generation::Http1};
    std::chrono::microseconds rtt{0};
    bool h3Advertised{false};

    [[nodiscard]] bool hasValidator() const noexcept { return etag || lastModified; }

    // Validators match when every validator present on both sides agrees.
    [[nodiscard]] bool sameValidator(const ResourceInfo& other) const noexcept;
};

// Lower-cased host[:port] of a URL; empty when the URL has no authority.
std::string hostOf(std::string_view url);
std::string schemeOf(std::string_view url);

// Last non-empty path segment of a URL (query and fragment stripped).
std::optional<std::string> filenameFromUrl(std::string_view url);

// filename / filename* parameter of a Content-Disposition header.
std::optional<std::string> filenameFromContentDisposition(std::string_view header);

} // namespace parfetch::net
