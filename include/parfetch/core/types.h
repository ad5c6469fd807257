#pragma once

/*
 * parfetch - Core vocabulary types (C++20)
 *
 * Identifiers, byte ranges, priorities, the canonical error object and the
 * lightweight Expected<T> used across every module. Contains no behavior
 * beyond small inline helpers.
 *
 * Copyright (c) parfetch Contributors
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace parfetch {

// ================================
// Identifiers and byte ranges
// ================================

using DownloadId = std::uint64_t;
using SegmentId = std::uint32_t;
using ConnectionId = std::uint64_t;

inline constexpr ConnectionId kNoConnection = 0;

/**
 * Half-open byte range [start, end).
 */
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end > start ? end - start : 0; }
    [[nodiscard]] bool empty() const noexcept { return length() == 0; }
    [[nodiscard]] bool contains(std::uint64_t offset) const noexcept {
        return offset >= start && offset < end;
    }

    friend bool operator==(const ByteRange&, const ByteRange&) = default;
};

/**
 * Download priority. Weights drive the rate limiter's share of tokens.
 */
enum class Priority { Critical, High, Normal, Low, Background };

constexpr std::uint32_t priorityWeight(Priority p) noexcept {
    switch (p) {
        case Priority::Critical:
            return 16;
        case Priority::High:
            return 8;
        case Priority::Normal:
            return 4;
        case Priority::Low:
            return 2;
        case Priority::Background:
            return 1;
    }
    return 4;
}

std::string_view priorityToString(Priority p) noexcept;
std::optional<Priority> priorityFromString(std::string_view s) noexcept;

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo {
    Sha256,
    Sha512,
    Md5 // final verification only; segment checkpoints use SHA-2
};

std::string_view hashAlgoToString(HashAlgo a) noexcept;
std::optional<HashAlgo> hashAlgoFromString(std::string_view s) noexcept;

/**
 * Expected digest for whole-resource verification.
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex; // lower-case hex
};

// ================================
// Errors
// ================================

/**
 * Canonical error codes. The network/protocol kinds are distinct so callers can
 * pick a recovery strategy without parsing messages.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    ConnectionReset,
    ServerRejected,
    RangeUnsupported,
    ProtocolNegotiationFailed,
    RateLimited,
    TlsVerificationFailed,
    ProbeFailed,
    ResourceChanged,
    ChecksumMismatch,
    IoError,
    StorageFull,
    PermissionDenied,
    ManifestCorrupt,
    Cancelled,
    Unknown
};

std::string_view errorCodeToString(ErrorCode code) noexcept;

/**
 * Canonical error object. `status` carries the server status code for
 * ServerRejected and RateLimited.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<int> status{};
};

// Network failures and 5xx answers are worth another attempt.
[[nodiscard]] bool isTransient(const Error& e) noexcept;

// Storage failures end the whole download.
[[nodiscard]] bool isFatalStorage(const Error& e) noexcept;

std::string describe(const Error& e);

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    explicit operator bool() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    explicit operator bool() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ShouldCancel = std::function<bool()>; // return true to cancel ASAP

/**
 * Retry/backoff policy for transient failures.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};

    [[nodiscard]] std::chrono::milliseconds backoffFor(int attempt) const noexcept;
};

// Sleeps for `d` in short slices, returning false if cancelled meanwhile.
bool sleepCancellable(std::chrono::milliseconds d, const ShouldCancel& shouldCancel);

} // namespace parfetch
