#include <parfetch/net/resource.h>

#include <algorithm>
#include <cctype>

namespace parfetch::net {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(std::string_view sv) {
    size_t b = 0, e = sv.size();
    while (b < e && std::isspace(static_cast<unsigned char>(sv[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(sv[e - 1])))
        --e;
    return std::string(sv.substr(b, e - b));
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percentDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

// Reject names that would escape the output directory.
std::optional<std::string> sanitizeFilename(std::string name) {
    auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos)
        name = name.substr(slash + 1);
    if (name.empty() || name == "." || name == "..")
        return std::nullopt;
    return name;
}

} // namespace

std::string_view generationToString(Generation g) noexcept {
    switch (g) {
        case Generation::Http3:
            return "http3";
        case Generation::Http2:
            return "http2";
        case Generation::Http1:
            return "http1.1";
        case Generation::Ftp:
            return "ftp";
    }
    return "http1.1";
}

std::optional<Generation> generationFromString(std::string_view s) noexcept {
    if (s == "http3")
        return Generation::Http3;
    if (s == "http2")
        return Generation::Http2;
    if (s == "http1.1" || s == "http1")
        return Generation::Http1;
    if (s == "ftp")
        return Generation::Ftp;
    return std::nullopt;
}

std::string_view mirrorPriorityToString(MirrorPriority p) noexcept {
    switch (p) {
        case MirrorPriority::Primary:
            return "primary";
        case MirrorPriority::Secondary:
            return "secondary";
        case MirrorPriority::Fallback:
            return "fallback";
    }
    return "secondary";
}

std::optional<MirrorPriority> mirrorPriorityFromString(std::string_view s) noexcept {
    if (s == "primary")
        return MirrorPriority::Primary;
    if (s == "secondary")
        return MirrorPriority::Secondary;
    if (s == "fallback")
        return MirrorPriority::Fallback;
    return std::nullopt;
}

bool ResourceInfo::sameValidator(const ResourceInfo& other) const noexcept {
    bool compared = false;
    if (etag && other.etag) {
        if (*etag != *other.etag)
            return false;
        compared = true;
    }
    if (lastModified && other.lastModified) {
        if (*lastModified != *other.lastModified)
            return false;
        compared = true;
    }
    if (compared)
        return true;
    // A validator that appeared or vanished counts as a change
    return hasValidator() == other.hasValidator() && size == other.size;
}

std::string schemeOf(std::string_view url) {
    auto pos = url.find("://");
    if (pos == std::string_view::npos)
        return {};
    return to_lower(url.substr(0, pos));
}

std::string hostOf(std::string_view url) {
    auto pos = url.find("://");
    if (pos == std::string_view::npos)
        return {};
    auto rest = url.substr(pos + 3);
    auto end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, end);
    if (auto at = authority.rfind('@'); at != std::string_view::npos)
        authority = authority.substr(at + 1);
    return to_lower(authority);
}

std::optional<std::string> filenameFromUrl(std::string_view url) {
    auto pos = url.find("://");
    auto rest = pos == std::string_view::npos ? url : url.substr(pos + 3);
    auto cut = rest.find_first_of("?#");
    rest = rest.substr(0, cut);
    auto slash = rest.find('/');
    if (slash == std::string_view::npos)
        return std::nullopt;
    auto path = rest.substr(slash);
    while (!path.empty() && path.back() == '/')
        path.remove_suffix(1);
    auto last = path.rfind('/');
    auto segment = path.substr(last == std::string_view::npos ? 0 : last + 1);
    if (segment.empty())
        return std::nullopt;
    return sanitizeFilename(percentDecode(segment));
}

std::optional<std::string> filenameFromContentDisposition(std::string_view header) {
    std::optional<std::string> plain;
    size_t start = 0;
    while (start <= header.size()) {
        auto end = header.find(';', start);
        auto part = trim(header.substr(start, end == std::string_view::npos ? std::string_view::npos
                                                                             : end - start));
        auto lower = to_lower(part);
        if (lower.rfind("filename*=", 0) == 0) {
            // RFC 5987: charset'lang'percent-encoded
            auto value = part.substr(10);
            auto tick = value.find("''");
            if (tick != std::string::npos) {
                if (auto name = sanitizeFilename(percentDecode(value.substr(tick + 2))))
                    return name;
            }
        } else if (lower.rfind("filename=", 0) == 0 && !plain) {
            auto value = trim(part.substr(9));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
                value = value.substr(1, value.size() - 2);
            plain = sanitizeFilename(value);
        }
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return plain;
}

} // namespace parfetch::net
