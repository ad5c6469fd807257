#include <parfetch/core/types.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <thread>

namespace parfetch {

namespace {

std::string lowered(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::string_view priorityToString(Priority p) noexcept {
    switch (p) {
        case Priority::Critical:
            return "critical";
        case Priority::High:
            return "high";
        case Priority::Normal:
            return "normal";
        case Priority::Low:
            return "low";
        case Priority::Background:
            return "background";
    }
    return "normal";
}

std::optional<Priority> priorityFromString(std::string_view s) noexcept {
    const auto v = lowered(s);
    if (v == "critical")
        return Priority::Critical;
    if (v == "high")
        return Priority::High;
    if (v == "normal")
        return Priority::Normal;
    if (v == "low")
        return Priority::Low;
    if (v == "background")
        return Priority::Background;
    return std::nullopt;
}

std::string_view hashAlgoToString(HashAlgo a) noexcept {
    switch (a) {
        case HashAlgo::Sha256:
            return "sha256";
        case HashAlgo::Sha512:
            return "sha512";
        case HashAlgo::Md5:
            return "md5";
    }
    return "sha256";
}

std::optional<HashAlgo> hashAlgoFromString(std::string_view s) noexcept {
    const auto v = lowered(s);
    if (v == "sha256" || v == "sha-256")
        return HashAlgo::Sha256;
    if (v == "sha512" || v == "sha-512")
        return HashAlgo::Sha512;
    if (v == "md5")
        return HashAlgo::Md5;
    return std::nullopt;
}

std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::ConnectionReset:
            return "ConnectionReset";
        case ErrorCode::ServerRejected:
            return "ServerRejected";
        case ErrorCode::RangeUnsupported:
            return "RangeUnsupported";
        case ErrorCode::ProtocolNegotiationFailed:
            return "ProtocolNegotiationFailed";
        case ErrorCode::RateLimited:
            return "RateLimited";
        case ErrorCode::TlsVerificationFailed:
            return "TlsVerificationFailed";
        case ErrorCode::ProbeFailed:
            return "ProbeFailed";
        case ErrorCode::ResourceChanged:
            return "ResourceChanged";
        case ErrorCode::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::StorageFull:
            return "StorageFull";
        case ErrorCode::PermissionDenied:
            return "PermissionDenied";
        case ErrorCode::ManifestCorrupt:
            return "ManifestCorrupt";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

bool isTransient(const Error& e) noexcept {
    switch (e.code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ConnectionReset:
            return true;
        case ErrorCode::ServerRejected:
            return e.status.has_value() && *e.status >= 500;
        default:
            return false;
    }
}

bool isFatalStorage(const Error& e) noexcept {
    return e.code == ErrorCode::IoError || e.code == ErrorCode::StorageFull ||
           e.code == ErrorCode::PermissionDenied;
}

std::string describe(const Error& e) {
    if (e.status) {
        return fmt::format("{} ({}): {}", errorCodeToString(e.code), *e.status, e.message);
    }
    return fmt::format("{}: {}", errorCodeToString(e.code), e.message);
}

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt) const noexcept {
    if (attempt <= 0)
        return std::chrono::milliseconds{0};
    const double scaled =
        static_cast<double>(initialBackoff.count()) * std::pow(multiplier, attempt - 1);
    const auto capped = std::min<double>(scaled, static_cast<double>(maxBackoff.count()));
    return std::chrono::milliseconds{static_cast<std::int64_t>(capped)};
}

bool sleepCancellable(std::chrono::milliseconds d, const ShouldCancel& shouldCancel) {
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + d;
    while (steady_clock::now() < deadline) {
        if (shouldCancel && shouldCancel())
            return false;
        auto left = duration_cast<milliseconds>(deadline - steady_clock::now());
        std::this_thread::sleep_for(std::min(left, milliseconds(50)));
    }
    return !(shouldCancel && shouldCancel());
}

} // namespace parfetch
