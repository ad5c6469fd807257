#pragma once

#include <parfetch/bandwidth/bandwidth_monitor.h>
#include <parfetch/config/config.h>
#include <parfetch/integrity/integrity_verifier.h>
#include <parfetch/manifest/manifest_store.h>
#include <parfetch/net/resource.h>
#include <parfetch/orchestrator/events.h>
#include <parfetch/orchestrator/orchestrator.h>
#include <parfetch/segment/segment_manager.h>
#include <parfetch/segment/source_selector.h>
#include <parfetch/storage/storage_writer.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace parfetch::orchestrator {

using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

// Segment table rebuilt from a manifest, ready for SegmentManager::restore.
struct PreparedResume {
    std::vector<segment::Segment> segments;
    std::unordered_map<SegmentId, integrity::SegmentHasher> hashers;
};

// A mirror whose probe agreed with the primary URL.
struct ProbedMirror {
    net::ResourceInfo info;
    net::MirrorPriority priority{net::MirrorPriority::Secondary};
};

// Result of one segment worker, posted back to the download's strand.
struct WorkerOutcome {
    SegmentId id{0};
    bool completed{false};
    bool segmentFailed{false};
    bool rangeUnsupported{false};
    bool resourceChanged{false};
    std::optional<segment::SplitResult> split;
    std::vector<SegmentId> parked;
    std::optional<Error> failure;
};

/**
 * Per-download state. Fields marked "strand" are only touched from the
 * download's strand; the rest are safe from any thread.
 */
struct DownloadTask {
    DownloadTask(DownloadId id, DownloadRequest req, const config::EngineConfig& cfg,
                 Strand strand)
        : id(id), request(std::move(req)), cfg(cfg), strand(std::move(strand)),
          segments(cfg.segments, cfg.integrity.enabled
                                     ? std::optional<HashAlgo>(cfg.integrity.algorithm)
                                     : std::nullopt),
          bandwidthCap(request.bandwidthLimit) {}

    const DownloadId id;
    const DownloadRequest request;
    const config::EngineConfig cfg; // copied at creation
    Strand strand;

    segment::SegmentManager segments; // thread-safe
    segment::SourceSelector sources;  // thread-safe
    bandwidth::BandwidthMonitor monitor;

    std::atomic<DownloadState> state{DownloadState::Probing};
    std::atomic<bool> stopRequested{false};

    // Written on the strand under viewMutex; snapshot() reads under it
    mutable std::mutex viewMutex;
    net::ResourceInfo info;
    std::filesystem::path output;
    // Index-aligned with `sources`; entry 0 is the primary URL
    std::shared_ptr<const std::vector<net::ResourceInfo>> sourceInfos;

    // strand
    std::optional<std::uint64_t> bandwidthCap;
    bool useFull{false};
    bool finishing{false};
    bool forceSingle{false};
    std::shared_ptr<storage::StorageWriter> writer;
    std::optional<manifest::ManifestRecord> manifest;
    std::optional<PreparedResume> prepared;
    std::size_t workers{0};
    std::size_t busyJobs{0};
    bool holdsSlot{false};
    bool flushInFlight{false};
    StopAction pending{StopAction::None};
    std::optional<Error> fatal;
    std::uint64_t tickEpoch{0};
    std::uint64_t lastBytes{0};

    // Serializes manifest writes; once retired no write may recreate the file
    std::mutex manifestMutex;
    bool manifestRetired{false};
};

} // namespace parfetch::orchestrator
