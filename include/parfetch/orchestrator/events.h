#pragma once

#include <parfetch/core/types.h>
#include <parfetch/net/resource.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace parfetch::orchestrator {

/**
 * Per-download lifecycle.
 *
 * Probing -> (Queued) -> SingleStream | Segmenting -> Active -> Paused | Complete | Failed.
 * Active is re-entered from Paused via Resume; Cancelled is terminal for discarded downloads.
 */
enum class DownloadState {
    Probing,
    Queued,
    SingleStream,
    Segmenting,
    Active,
    Paused,
    Complete,
    Failed,
    Cancelled
};

std::string_view downloadStateToString(DownloadState s) noexcept;

[[nodiscard]] constexpr bool isTerminal(DownloadState s) noexcept {
    return s == DownloadState::Complete || s == DownloadState::Cancelled;
}

/**
 * Everything needed to start a download.
 */
struct DownloadRequest {
    std::string url;
    std::vector<net::Mirror> mirrors; // same bytes elsewhere; url stays the primary
    std::vector<net::Header> headers;
    std::filesystem::path outputDir{"."};
    std::optional<std::string> filename; // else Content-Disposition, URL, "download"
    Priority priority{Priority::Normal};
    std::optional<std::uint64_t> bandwidthLimit;
    std::optional<Checksum> expected;
};

// ================
// Commands
// ================

struct AddDownload {
    DownloadRequest request;
};
struct Pause {
    DownloadId id{0};
};
struct Resume {
    DownloadId id{0};
};
struct Cancel {
    DownloadId id{0};
    bool discard{false};
};
// Global limit when `id` is empty, otherwise that download's cap. 0 = unlimited.
struct SetBandwidthLimit {
    std::optional<DownloadId> id;
    std::uint64_t bps{0};
};

using Command = std::variant<AddDownload, Pause, Resume, Cancel, SetBandwidthLimit>;

// ================
// Events
// ================

struct Added {
    DownloadId id{0};
    std::string url;
};

struct ProgressUpdate {
    DownloadId id{0};
    std::uint64_t received{0};
    std::uint64_t verified{0}; // flushed and hashed
    std::optional<std::uint64_t> total;
    double bytesPerSecond{0.0};
    std::size_t activeSegments{0};
};

struct StateChange {
    DownloadId id{0};
    DownloadState from{DownloadState::Probing};
    DownloadState to{DownloadState::Probing};
};

struct SegmentRebalanced {
    DownloadId id{0};
    SegmentId source{0};
    SegmentId created{0};
    ByteRange sourceRange;
    ByteRange createdRange;
};

struct ErrorEvent {
    DownloadId id{0};
    Error error;
    bool fatal{false};
};

struct Complete {
    DownloadId id{0};
    std::filesystem::path path;
    std::uint64_t size{0};
    std::optional<Checksum> digest;
};

using Event =
    std::variant<Added, ProgressUpdate, StateChange, SegmentRebalanced, ErrorEvent, Complete>;

// Download id carried by any event.
DownloadId eventDownloadId(const Event& ev) noexcept;

} // namespace parfetch::orchestrator
