/*
 * orchestrator.cpp
 *
 * - One strand per download on a single control io_context; all lifecycle
 *   transitions of a download run on its strand
 * - Segment transfers block on the transfer pool; probe, rehash, flush,
 *   manifest and verification jobs run on the work pool
 * - A stop (pause, cancel, shutdown, failure, single-stream fallback, restart
 *   after a content change) is a pending action applied once every worker and
 *   job of the download drained
 */

#include "download_task.h"

#include <parfetch/integrity/integrity_verifier.h>
#include <parfetch/orchestrator/orchestrator.h>
#include <parfetch/segment/resource_prober.h>
#include <parfetch/segment/segment_planner.h>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <system_error>
#include <type_traits>
#include <utility>

namespace parfetch::orchestrator {

namespace fs = std::filesystem;
using SteadyClock = std::chrono::steady_clock;

namespace {

constexpr auto kShutdownGrace = std::chrono::seconds(30);
constexpr std::size_t kWorkPoolThreads = 4;

bool isLive(DownloadState s) noexcept {
    switch (s) {
        case DownloadState::Probing:
        case DownloadState::Queued:
        case DownloadState::SingleStream:
        case DownloadState::Segmenting:
        case DownloadState::Active:
            return true;
        default:
            return false;
    }
}

// Explicit name, then Content-Disposition / URL as probed, then "download".
fs::path resolveOutput(const DownloadRequest& request, const net::ResourceInfo& info) {
    std::string name;
    if (request.filename && !request.filename->empty()) {
        name = fs::path(*request.filename).filename().string();
    } else if (info.filename) {
        name = fs::path(*info.filename).filename().string();
    } else if (auto fromUrl = net::filenameFromUrl(request.url)) {
        name = fs::path(*fromUrl).filename().string();
    }
    if (name.empty() || name == "." || name == "..")
        name = "download";
    return request.outputDir / name;
}

HashAlgo checkpointAlgo(HashAlgo algo) noexcept {
    return algo == HashAlgo::Md5 ? HashAlgo::Sha256 : algo;
}

/**
 * Holds a pooled stream for the lifetime of one segment worker and returns it
 * (and the connection lease) on every exit path.
 */
class LeasedStream {
public:
    LeasedStream(net::ConnectionPool& pool, ConnectionId id)
        : pool_(pool), id_(id), stream_(pool.checkout(id)) {}

    ~LeasedStream() {
        pool_.checkin(std::move(stream_));
        if (id_ != kNoConnection)
            pool_.release(id_);
    }

    LeasedStream(const LeasedStream&) = delete;
    LeasedStream& operator=(const LeasedStream&) = delete;

    [[nodiscard]] ConnectionId id() const noexcept { return id_; }
    net::Stream& stream() noexcept { return stream_; }

    // Move to a replacement when the pool retired this connection. False when
    // cancelled while waiting; the lease is gone then.
    bool refresh(const ShouldCancel& shouldCancel) {
        auto next = pool_.reassignIfUnhealthy(id_, shouldCancel);
        if (!next) {
            pool_.checkin(std::move(stream_));
            id_ = kNoConnection;
            return false;
        }
        if (next.value() != id_) {
            pool_.checkin(std::move(stream_));
            id_ = next.value();
            stream_ = pool_.checkout(id_);
        }
        return true;
    }

private:
    net::ConnectionPool& pool_;
    ConnectionId id_;
    net::Stream stream_;
};

/**
 * Rebuild the segment table of `m` against its part file. Clean pauses (or
 * resume.verify = false) continue from the persisted midstate; otherwise each
 * segment's prefix is rehashed and compared with its checkpoint digest, and a
 * mismatching segment restarts from its start offset.
 *
 * Empty result: the part file or the table is unusable and the download
 * starts over.
 */
Expected<std::optional<PreparedResume>> prepareResume(const manifest::ManifestRecord& m,
                                                      const config::EngineConfig& cfg,
                                                      const ShouldCancel& shouldCancel) {
    const auto part = storage::partPathFor(m.output);
    std::error_code ec;
    if (!m.size || !fs::is_regular_file(part, ec)) {
        spdlog::info("[Orchestrator] download {}: nothing to resume from {}", m.id, part.string());
        return std::optional<PreparedResume>{};
    }

    auto records = m.segments;
    std::sort(records.begin(), records.end(),
              [](const auto& a, const auto& b) { return a.range.start < b.range.start; });
    std::uint64_t cursor = 0;
    for (const auto& r : records) {
        if (r.range.start != cursor || r.range.end < r.range.start ||
            r.completedBytes > r.range.length()) {
            spdlog::warn("[Orchestrator] download {}: persisted segment table is inconsistent",
                         m.id);
            return std::optional<PreparedResume>{};
        }
        cursor = r.range.end;
    }
    if (cursor != *m.size) {
        spdlog::warn("[Orchestrator] download {}: segments cover {} of {} bytes", m.id, cursor,
                     *m.size);
        return std::optional<PreparedResume>{};
    }

    const bool hashing = cfg.integrity.enabled;
    const bool trustCheckpoints = m.cleanlyPaused || !cfg.resume.verify;

    PreparedResume prepared;
    for (const auto& r : records) {
        segment::Segment s;
        s.id = r.id;
        s.range = r.range;
        s.downloadedOffset = r.completedBytes;
        s.receivedOffset = r.completedBytes;
        s.checkpoint = r.checkpoint;

        if (!hashing || r.completedBytes == 0) {
            prepared.segments.push_back(std::move(s));
            continue;
        }

        if (trustCheckpoints) {
            auto restored = integrity::SegmentHasher::restore(m.segmentAlgo, r.checkpoint);
            if (restored && restored.value().covered() == r.completedBytes) {
                prepared.hashers.insert_or_assign(r.id, std::move(restored).value());
                prepared.segments.push_back(std::move(s));
                continue;
            }
            spdlog::info("[Orchestrator] download {}: checkpoint of segment {} unusable ({}), "
                         "rehashing",
                         m.id, r.id,
                         restored ? std::string("length mismatch") : restored.error().message);
        }

        auto rehashed =
            integrity::rehashRange(part, r.range.start, r.completedBytes, m.segmentAlgo, shouldCancel);
        if (!rehashed && rehashed.error().code == ErrorCode::Cancelled)
            return rehashed.error();

        if (rehashed && r.checkpoint.covered == r.completedBytes &&
            integrity::digestEquals(rehashed.value().digestHex(), r.checkpoint.digestHex)) {
            prepared.hashers.insert_or_assign(r.id, std::move(rehashed).value());
        } else {
            spdlog::warn("[Orchestrator] download {}: segment {} failed verification, refetching "
                         "from offset {}",
                         m.id, r.id, r.range.start);
            s.downloadedOffset = 0;
            s.receivedOffset = 0;
            s.checkpoint = {};
        }
        prepared.segments.push_back(std::move(s));
    }
    return std::optional<PreparedResume>(std::move(prepared));
}

struct Finished {
    fs::path path;
    std::optional<Checksum> digest;
};

} // namespace

net::TransportOptions transportOptionsFrom(const config::EngineConfig& cfg) {
    net::TransportOptions o;
    o.connectTimeout = cfg.connections.connectTimeout;
    o.readTimeout = cfg.connections.readTimeout;
    o.tlsInsecure = cfg.connections.tlsInsecure;
    o.caPath = cfg.connections.caPath;
    o.userAgent = cfg.connections.userAgent;
    if (!cfg.connections.proxy.empty())
        o.proxy = cfg.connections.proxy;
    o.followRedirects = cfg.connections.followRedirects;
    return o;
}

net::PoolLimits poolLimitsFrom(const config::EngineConfig& cfg) {
    net::PoolLimits l;
    l.perHostLegacy = cfg.connections.perHostLegacy;
    l.perHostMultiplexed = cfg.connections.perHostMultiplexed;
    l.maxStreamsPerConnection = cfg.connections.maxStreamsPerConnection;
    l.retireErrorRate = cfg.connections.retireErrorRate;
    l.retireMinRequests = cfg.connections.retireMinRequests;
    return l;
}

// ============
// Lifecycle
// ============

Orchestrator::Orchestrator(config::EngineConfig cfg, std::shared_ptr<net::IProtocolAdapter> adapter)
    : cfg_(config::normalized(std::move(cfg))), adapter_(std::move(adapter)),
      pool_(poolLimitsFrom(cfg_)), limiter_(bandwidth::makeRateLimiter(cfg_.bandwidth.globalBps)),
      manifests_(cfg_.storage.manifestDir), events_(cfg_.orchestrator.eventCapacity) {
    if (!adapter_)
        adapter_ = net::makeProtocolAdapter(transportOptionsFrom(cfg_));

    io_ = std::make_unique<boost::asio::io_context>(1);
    workGuard_.emplace(boost::asio::make_work_guard(*io_));
    transferPool_ = std::make_unique<boost::asio::thread_pool>(
        std::max<std::size_t>(1, cfg_.orchestrator.transferThreads));
    workPool_ = std::make_unique<boost::asio::thread_pool>(kWorkPoolThreads);

    // New ids continue after every persisted download
    for (const auto& rec : manifests_.loadAll()) {
        if (rec.id >= nextId_.load())
            nextId_.store(rec.id + 1);
    }
}

Orchestrator::~Orchestrator() {
    stop();
}

void Orchestrator::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("[Orchestrator] Already running, skipping start");
        return;
    }
    controlThread_ = std::thread([this] {
        try {
            io_->run();
        } catch (const std::exception& e) {
            spdlog::error("[Orchestrator] control loop terminated: {}", e.what());
        }
    });
    spdlog::info("[Orchestrator] Started (max_concurrent={}, transfer_threads={})",
                 cfg_.orchestrator.maxConcurrentDownloads, cfg_.orchestrator.transferThreads);
}

void Orchestrator::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel))
        return;
    stopping_.store(true, std::memory_order_release);
    spdlog::info("[Orchestrator] Stopping; pausing active downloads");

    std::vector<std::shared_ptr<DownloadTask>> all;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& [id, task] : tasks_)
            all.push_back(task);
    }
    for (const auto& task : all) {
        boost::asio::post(task->strand, [this, task] {
            if (isLive(task->state.load()))
                requestStop(task, StopAction::Shutdown);
        });
    }

    bool drained = false;
    {
        std::unique_lock<std::mutex> lk(mutex_);
        drained = stateCv_.wait_for(lk, kShutdownGrace, [&] {
            return std::none_of(tasks_.begin(), tasks_.end(),
                                [](const auto& kv) { return isLive(kv.second->state.load()); });
        });
    }
    if (!drained) {
        spdlog::warn("[Orchestrator] Downloads did not settle within {}s; forcing shutdown",
                     kShutdownGrace.count());
        events_.close();
    }

    for (const auto& task : all)
        task->stopRequested.store(true, std::memory_order_release);
    limiter_->wakeAll();
    pool_.wakeAll();

    workGuard_.reset();
    io_->stop();
    if (controlThread_.joinable())
        controlThread_.join();
    transferPool_->join();
    workPool_->join();
    spdlog::info("[Orchestrator] Stopped");
}

// ============
// Commands
// ============

Expected<DownloadId> Orchestrator::submit(Command command) {
    return std::visit(
        [this](auto&& cmd) -> Expected<DownloadId> {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, AddDownload>) {
                if (cmd.request.url.empty())
                    return Error{ErrorCode::InvalidArgument, "download URL is empty"};
                return addDownload(std::move(cmd.request));
            } else if constexpr (std::is_same_v<T, Pause>) {
                if (auto r = pause(cmd.id); !r)
                    return r.error();
                return cmd.id;
            } else if constexpr (std::is_same_v<T, Resume>) {
                if (auto r = resume(cmd.id); !r)
                    return r.error();
                return cmd.id;
            } else if constexpr (std::is_same_v<T, Cancel>) {
                if (auto r = cancel(cmd.id, cmd.discard); !r)
                    return r.error();
                return cmd.id;
            } else {
                if (auto r = setBandwidthLimit(cmd.id, cmd.bps); !r)
                    return r.error();
                return cmd.id.value_or(0);
            }
        },
        std::move(command));
}

std::shared_ptr<DownloadTask> Orchestrator::createTask(DownloadId id, DownloadRequest request) {
    auto task = std::make_shared<DownloadTask>(id, std::move(request), cfg_,
                                               boost::asio::make_strand(*io_));
    const auto cap = task->request.bandwidthLimit.value_or(cfg_.bandwidth.perDownloadBps);
    if (cap > 0)
        limiter_->setDownloadLimit(id, cap);
    std::lock_guard<std::mutex> lk(mutex_);
    tasks_[id] = task;
    return task;
}

std::shared_ptr<DownloadTask> Orchestrator::find(DownloadId id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : it->second;
}

DownloadId Orchestrator::addDownload(DownloadRequest request) {
    const auto id = nextId_.fetch_add(1);
    auto task = createTask(id, std::move(request));
    spdlog::info("[Orchestrator] download {} added: {}", id, task->request.url);
    boost::asio::post(task->strand, [this, task] {
        events_.publish(Added{task->id, task->request.url});
        beginProbe(task);
    });
    return id;
}

Expected<void> Orchestrator::pause(DownloadId id) {
    auto task = find(id);
    if (!task)
        return Error{ErrorCode::InvalidArgument, "unknown download " + std::to_string(id)};
    boost::asio::post(task->strand, [this, task] {
        if (!isLive(task->state.load())) {
            spdlog::debug("[Orchestrator] pause ignored for download {} in state {}", task->id,
                          downloadStateToString(task->state.load()));
            return;
        }
        requestStop(task, StopAction::Pause);
    });
    return Expected<void>{};
}

Expected<void> Orchestrator::resume(DownloadId id) {
    auto task = find(id);
    if (!task)
        return Error{ErrorCode::InvalidArgument, "unknown download " + std::to_string(id)};
    boost::asio::post(task->strand, [this, task] {
        const auto state = task->state.load();
        if (state != DownloadState::Paused && state != DownloadState::Failed) {
            spdlog::debug("[Orchestrator] resume ignored for download {} in state {}", task->id,
                          downloadStateToString(state));
            return;
        }
        task->stopRequested.store(false, std::memory_order_release);
        task->pending = StopAction::None;
        task->fatal.reset();
        if (!task->manifest) {
            auto loaded = manifests_.load(task->id);
            if (loaded && loaded.value())
                task->manifest = *loaded.value();
        }
        transition(task, DownloadState::Probing);
        beginProbe(task);
    });
    return Expected<void>{};
}

Expected<void> Orchestrator::cancel(DownloadId id, bool discard) {
    auto task = find(id);
    if (!task)
        return Error{ErrorCode::InvalidArgument, "unknown download " + std::to_string(id)};
    boost::asio::post(task->strand, [this, task, discard] {
        const auto state = task->state.load();
        if (isTerminal(state))
            return;
        if (discard) {
            requestStop(task, StopAction::CancelDiscard);
        } else if (isLive(state)) {
            requestStop(task, StopAction::Cancel);
        }
    });
    return Expected<void>{};
}

Expected<void> Orchestrator::setBandwidthLimit(std::optional<DownloadId> id, std::uint64_t bps) {
    if (!id) {
        limiter_->setGlobalLimit(bps);
        spdlog::info("[Orchestrator] global bandwidth limit set to {} B/s", bps);
        return Expected<void>{};
    }
    auto task = find(*id);
    if (!task)
        return Error{ErrorCode::InvalidArgument, "unknown download " + std::to_string(*id)};
    limiter_->setDownloadLimit(*id, bps);
    boost::asio::post(task->strand, [task, bps] {
        task->bandwidthCap = bps > 0 ? std::optional<std::uint64_t>(bps) : std::nullopt;
    });
    return Expected<void>{};
}

std::vector<DownloadId> Orchestrator::resumeAll() {
    std::vector<DownloadId> ids;
    for (auto& rec : manifests_.loadAll()) {
        if (find(rec.id))
            continue;
        auto current = nextId_.load();
        while (rec.id >= current && !nextId_.compare_exchange_weak(current, rec.id + 1)) {
        }
        if (rec.state == manifest::ManifestState::Complete) {
            manifests_.remove(rec.id);
            continue;
        }

        DownloadRequest req;
        req.url = rec.url;
        req.mirrors = rec.mirrors;
        req.headers = rec.headers;
        req.outputDir = rec.output.parent_path();
        req.filename = rec.output.filename().string();
        req.priority = rec.priority;
        req.bandwidthLimit = rec.bandwidthCap;
        req.expected = rec.expected;

        auto task = createTask(rec.id, std::move(req));
        {
            std::lock_guard<std::mutex> lk(task->viewMutex);
            task->output = rec.output;
        }
        const bool failed = rec.state == manifest::ManifestState::Failed;
        if (failed)
            task->state.store(DownloadState::Failed);
        task->manifest = std::move(rec);

        boost::asio::post(task->strand, [this, task, failed] {
            events_.publish(Added{task->id, task->request.url});
            if (!failed)
                beginProbe(task);
        });
        ids.push_back(task->id);
    }
    spdlog::info("[Orchestrator] found {} resumable download(s)", ids.size());
    return ids;
}

std::optional<DownloadSnapshot> Orchestrator::snapshot(DownloadId id) const {
    auto task = find(id);
    if (!task)
        return std::nullopt;
    DownloadSnapshot s;
    s.id = task->id;
    s.state = task->state.load();
    s.url = task->request.url;
    s.priority = task->request.priority;
    {
        std::lock_guard<std::mutex> lk(task->viewMutex);
        s.output = task->output;
        s.total = task->info.size;
    }
    s.segments = task->segments.snapshot();
    s.sources = task->sources.stats();
    s.received = task->segments.receivedBytes();
    s.verified = task->segments.downloadedBytes();
    return s;
}

std::vector<DownloadId> Orchestrator::downloads() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<DownloadId> ids;
    ids.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_)
        ids.push_back(id);
    return ids;
}

// =================
// State machine
// =================

void Orchestrator::notifyStateChanged() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
    }
    stateCv_.notify_all();
}

void Orchestrator::transition(const std::shared_ptr<DownloadTask>& task, DownloadState to) {
    const auto from = task->state.exchange(to);
    if (from == to)
        return;
    spdlog::debug("[Orchestrator] download {}: {} -> {}", task->id, downloadStateToString(from),
                  downloadStateToString(to));
    events_.publish(StateChange{task->id, from, to});
    notifyStateChanged();
}

void Orchestrator::beginProbe(const std::shared_ptr<DownloadTask>& task) {
    ++task->busyJobs;
    net::ResourceRequest request{task->request.url, task->request.headers};
    boost::asio::post(*workPool_, [this, task, request = std::move(request)] {
        const ShouldCancel cancelled = [task] {
            return task->stopRequested.load(std::memory_order_acquire);
        };
        Expected<net::ResourceInfo> probed = Error{ErrorCode::ProbeFailed, "probe not run"};
        std::vector<ProbedMirror> mirrors;
        try {
            segment::ResourceProber prober(*adapter_, task->cfg.orchestrator.retry, &task->monitor);
            probed = prober.probe(request, cancelled);

            // Mirrors only count when they serve the same length with ranges
            segment::ResourceProber mirrorProber(*adapter_, task->cfg.orchestrator.retry);
            for (std::size_t i = 0; probed && i < task->request.mirrors.size() && !cancelled();
                 ++i) {
                const auto& m = task->request.mirrors[i];
                auto info = mirrorProber.probe({m.url, task->request.headers}, cancelled);
                if (!info) {
                    spdlog::warn("[Orchestrator] download {}: mirror {} unusable: {}", task->id,
                                 m.url, describe(info.error()));
                    continue;
                }
                if (info.value().size != probed.value().size || !info.value().rangeSupported) {
                    spdlog::warn("[Orchestrator] download {}: mirror {} does not match the primary "
                                 "(size {}, ranges {})",
                                 task->id, m.url,
                                 info.value().size ? std::to_string(*info.value().size)
                                                   : std::string("unknown"),
                                 info.value().rangeSupported);
                    continue;
                }
                mirrors.push_back(ProbedMirror{std::move(info).value(), m.priority});
            }
        } catch (const std::exception& e) {
            probed = Error{ErrorCode::Unknown, std::string("probe: ") + e.what()};
        }
        boost::asio::post(task->strand, [this, task, probed = std::move(probed),
                                         mirrors = std::move(mirrors)]() mutable {
            --task->busyJobs;
            onProbed(task, std::move(probed), std::move(mirrors));
        });
    });
}

void Orchestrator::useSources(const std::shared_ptr<DownloadTask>& task,
                              const net::ResourceInfo& primary,
                              const std::vector<ProbedMirror>& mirrors) {
    std::vector<net::ResourceInfo> infos{primary};
    std::vector<net::Mirror> list{{primary.url, net::MirrorPriority::Primary}};
    for (const auto& m : mirrors) {
        infos.push_back(m.info);
        list.push_back({m.info.url, m.priority});
    }
    if (list.size() > 1)
        spdlog::info("[Orchestrator] download {}: {} source(s) usable", task->id, list.size());
    task->sources.reset(std::move(list));
    std::lock_guard<std::mutex> lk(task->viewMutex);
    task->sourceInfos = std::make_shared<const std::vector<net::ResourceInfo>>(std::move(infos));
}

void Orchestrator::onProbed(const std::shared_ptr<DownloadTask>& task,
                            Expected<net::ResourceInfo> probed, std::vector<ProbedMirror> mirrors) {
    if (task->pending != StopAction::None) {
        settleIfIdle(task);
        return;
    }
    if (!probed) {
        onFatal(task, probed.error());
        return;
    }

    auto info = std::move(probed).value();
    useSources(task, info, mirrors);
    if (task->manifest && !task->manifest->segments.empty()) {
        const auto& m = *task->manifest;
        net::ResourceInfo previous;
        previous.etag = m.etag;
        previous.lastModified = m.lastModified;
        const bool changed = !info.sameValidator(previous) || info.size != m.size;
        {
            std::lock_guard<std::mutex> lk(task->viewMutex);
            task->info = info;
            task->output = m.output;
        }

        if (changed || !info.rangeSupported || !m.rangeSupported) {
            if (changed) {
                spdlog::warn("[Orchestrator] download {}: resource changed since it was paused; "
                             "starting over",
                             task->id);
                events_.publish(ErrorEvent{
                    task->id,
                    Error{ErrorCode::ResourceChanged, "validator or size changed; restarting"},
                    false});
            } else {
                spdlog::info("[Orchestrator] download {}: server cannot resume ranges; starting "
                             "over",
                             task->id);
            }
            manifests_.remove(task->id);
            std::error_code ec;
            fs::remove(storage::partPathFor(m.output), ec);
            task->manifest.reset();
            admit(task);
            return;
        }

        ++task->busyJobs;
        boost::asio::post(*workPool_, [this, task, record = m] {
            const ShouldCancel cancelled = [task] {
                return task->stopRequested.load(std::memory_order_acquire);
            };
            Expected<std::optional<PreparedResume>> prepared = std::optional<PreparedResume>{};
            try {
                prepared = prepareResume(record, task->cfg, cancelled);
            } catch (const std::exception& e) {
                prepared = Error{ErrorCode::Unknown, std::string("resume: ") + e.what()};
            }
            boost::asio::post(task->strand, [this, task, prepared = std::move(prepared)]() mutable {
                --task->busyJobs;
                onResumePrepared(task, std::move(prepared));
            });
        });
        return;
    }

    {
        std::lock_guard<std::mutex> lk(task->viewMutex);
        task->info = info;
        if (task->output.empty())
            task->output = resolveOutput(task->request, info);
    }
    admit(task);
}

void Orchestrator::onResumePrepared(const std::shared_ptr<DownloadTask>& task,
                                    Expected<std::optional<PreparedResume>> prepared) {
    if (task->pending != StopAction::None) {
        settleIfIdle(task);
        return;
    }
    if (!prepared) {
        onFatal(task, prepared.error());
        return;
    }
    auto& resumed = prepared.value();
    if (resumed) {
        task->prepared = std::move(*resumed);
    } else {
        task->manifest.reset();
    }
    admit(task);
}

void Orchestrator::admit(const std::shared_ptr<DownloadTask>& task) {
    if (requestSlot(task)) {
        startTransfer(task);
        return;
    }
    spdlog::info("[Orchestrator] download {} queued (priority {})", task->id,
                 priorityToString(task->request.priority));
    transition(task, DownloadState::Queued);
}

void Orchestrator::startTransfer(const std::shared_ptr<DownloadTask>& task) {
    const auto& info = task->info;
    const auto& segCfg = task->cfg.segments;
    const bool knownSize = info.size.has_value();
    const bool resumed = task->prepared.has_value() && !task->forceSingle;

    task->finishing = false;
    task->useFull = task->forceSingle || !info.rangeSupported || !knownSize;
    if (task->useFull) {
        transition(task, DownloadState::SingleStream);
        if (knownSize)
            task->segments.partition(*info.size, 1);
        else
            task->segments.openEnded();
    } else if (resumed) {
        transition(task, DownloadState::Segmenting);
        task->segments.restore(std::move(task->prepared->segments),
                               std::move(task->prepared->hashers));
    } else {
        transition(task, DownloadState::Segmenting);
        const auto count = segment::initialSegmentCount(
            *info.size, task->monitor.optimalSegmentCount(segCfg.assumedWindowBytes), segCfg);
        task->segments.partition(*info.size, count);
    }
    task->prepared.reset();

    storage::WriterOptions wo;
    wo.bufferSize = task->cfg.storage.bufferSize;
    wo.flushInterval = task->cfg.storage.flushInterval;
    wo.syncOnFlush = task->cfg.storage.syncOnFlush;
    auto opened = storage::StorageWriter::open(task->output, info.size, wo, !resumed);
    if (!opened) {
        onFatal(task, opened.error());
        return;
    }
    task->writer = std::shared_ptr<storage::StorageWriter>(std::move(opened).value());
    auto* segments = &task->segments;
    task->writer->setFlushListener(
        [segments](SegmentId id, std::uint64_t offset, std::span<const std::byte> data) {
            return segments->markFlushed(id, offset, data);
        });

    spdlog::info("[Orchestrator] download {}: {} segment(s) over {} ({}), {} -> {}", task->id,
                 task->segments.size(), net::generationToString(info.generation),
                 task->useFull ? "single stream" : (resumed ? "resumed" : "fresh"),
                 info.size ? std::to_string(*info.size) : std::string("unknown"),
                 task->output.string());

    persistManifest(task, manifest::ManifestState::InProgress, false, true);
    transition(task, DownloadState::Active);
    boost::asio::co_spawn(task->strand, tickLoop(task, ++task->tickEpoch), boost::asio::detached);
    dispatch(task);
}

void Orchestrator::dispatch(const std::shared_ptr<DownloadTask>& task) {
    if (task->pending != StopAction::None || task->finishing ||
        task->state.load() != DownloadState::Active)
        return;
    const auto now = SteadyClock::now();
    while (auto seg = task->segments.claimNext(now))
        launchWorker(task, *seg);
    if (task->workers == 0 && task->segments.allComplete())
        finishDownload(task);
}

void Orchestrator::launchWorker(const std::shared_ptr<DownloadTask>& task,
                                const segment::Segment& seg) {
    ++task->workers;
    const auto source = task->useFull ? std::size_t{0} : task->sources.assign(seg.id);
    spdlog::debug("[Orchestrator] download {}: segment {} [{}, {}) from offset {} via source {}",
                  task->id, seg.id, seg.range.start, seg.range.end, seg.resumeOffset(), source);
    boost::asio::post(*transferPool_, [this, task, writer = task->writer,
                                       infos = task->sourceInfos, source, seg,
                                       useFull = task->useFull] {
        WorkerOutcome out;
        try {
            out = runSegment(task, writer, infos, source, seg, useFull);
        } catch (const std::exception& e) {
            out = WorkerOutcome{};
            out.id = seg.id;
            out.failure = Error{ErrorCode::Unknown, std::string("segment worker: ") + e.what()};
            task->segments.releaseLease(seg.id);
        }
        task->sources.release(seg.id);
        boost::asio::post(task->strand,
                          [this, task, out = std::move(out)] { onWorkerDone(task, out); });
    });
}

WorkerOutcome Orchestrator::runSegment(const std::shared_ptr<DownloadTask>& task,
                                       std::shared_ptr<storage::StorageWriter> writer,
                                       std::shared_ptr<const std::vector<net::ResourceInfo>> infos,
                                       std::size_t source, const segment::Segment& seg,
                                       bool useFull) {
    WorkerOutcome out;
    out.id = seg.id;
    const auto id = seg.id;
    auto& segments = task->segments;
    const ShouldCancel cancelled = [&task, &segments, id] {
        return task->stopRequested.load(std::memory_order_acquire) || segments.shouldStop(id);
    };

    if (!infos || infos->empty()) {
        out.failure = Error{ErrorCode::Unknown, "segment started before the resource was probed"};
        segments.releaseLease(id);
        return out;
    }
    std::size_t src = source < infos->size() ? source : 0;
    const net::ResourceInfo* info = &(*infos)[src];

    auto acquired = pool_.acquire(net::hostOf(info->url), info->generation, cancelled);
    if (!acquired) {
        if (acquired.error().code != ErrorCode::Cancelled)
            out.failure = acquired.error();
        segments.releaseLease(id);
        return out;
    }
    std::optional<LeasedStream> lease;
    lease.emplace(pool_, acquired.value());
    segments.assignConnection(id, lease->id());
    writer->beginSegment(id, seg.resumeOffset());

    const auto& retry = task->cfg.orchestrator.retry;
    const auto priority = task->request.priority;
    const int maxFailovers = std::max(1, retry.maxAttempts) * static_cast<int>(infos->size());
    int failures = 0;
    int failovers = 0;
    bool done = false;

    while (!cancelled()) {
        auto cur = segments.get(id);
        if (!cur)
            break;
        if (!cur->openEnded() && cur->remaining() == 0) {
            done = true;
            break;
        }
        if (useFull && cur->receivedOffset > 0) {
            // A whole-body transfer cannot pick up mid-stream
            writer->dropSegment(id);
            segments.restartSegment(id);
            writer->beginSegment(id, cur->range.start);
            continue;
        }

        std::uint64_t got = 0;
        const net::DataSink sink =
            [&](std::span<const std::byte> data) -> Expected<net::SinkStatus> {
            if (!limiter_->acquire(task->id, priority, data.size(), cancelled))
                return net::SinkStatus::Stop;
            const auto admission = segments.admitReceived(id, data.size());
            if (admission.accepted > 0) {
                if (auto w = writer->append(id, data.first(admission.accepted)); !w)
                    return w.error();
                got += admission.accepted;
            }
            return admission.stop ? net::SinkStatus::Stop : net::SinkStatus::Continue;
        };

        const auto started = SteadyClock::now();
        Expected<void> r =
            useFull ? adapter_->fetchFull(*info, lease->stream(), sink, {}, cancelled)
                    : adapter_->fetchRange(*info, ByteRange{cur->resumeOffset(), cur->range.end},
                                           lease->stream(), sink, {}, cancelled);
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - started);

        if (r) {
            pool_.recordSuccess(lease->id(), got, elapsed);
            task->sources.recordSuccess(src, got, elapsed);
            if (cancelled())
                break;
            auto after = segments.get(id);
            if (after && (after->openEnded() || after->remaining() == 0)) {
                done = true;
                break;
            }
            r = Error{ErrorCode::ConnectionReset,
                      "transfer ended " + std::to_string(after ? after->remaining() : 0) +
                          " bytes short"};
        }

        const Error err = r.error();
        if (err.code == ErrorCode::Cancelled || cancelled())
            break;
        pool_.recordFailure(lease->id());
        task->sources.recordError(src);

        if (isFatalStorage(err)) {
            out.failure = err;
            break;
        }
        if (err.code == ErrorCode::RangeUnsupported && !useFull) {
            out.rangeUnsupported = true;
            break;
        }
        if (err.code == ErrorCode::ResourceChanged) {
            out.resourceChanged = true;
            break;
        }
        if (err.code == ErrorCode::RateLimited) {
            auto parked = segments.onRateLimited(SteadyClock::now());
            out.parked.insert(out.parked.end(), parked.begin(), parked.end());
            if (segments.shouldStop(id))
                break;
        } else if (err.code == ErrorCode::Timeout) {
            segments.markSlow(id);
        }

        // Retry from durable bytes only
        if (auto f = writer->flush(id); !f) {
            out.failure = f.error();
            break;
        }

        const bool retryable = isTransient(err) || err.code == ErrorCode::RateLimited;

        // A failing source hands the segment to another one before retries count
        const bool sourceFault = isTransient(err) || err.code == ErrorCode::ServerRejected;
        if (sourceFault && !useFull && failovers < maxFailovers) {
            if (auto next = task->sources.failover(id)) {
                ++failovers;
                spdlog::warn("[Orchestrator] download {}: segment {} leaves {} ({}) for {}",
                             task->id, id, info->url, describe(err), (*infos)[*next].url);
                lease.reset();
                src = *next;
                info = &(*infos)[src];
                auto again = pool_.acquire(net::hostOf(info->url), info->generation, cancelled);
                if (!again) {
                    if (again.error().code != ErrorCode::Cancelled)
                        out.failure = again.error();
                    break;
                }
                lease.emplace(pool_, again.value());
                segments.assignConnection(id, lease->id());
                continue;
            }
        }

        if (!retryable || ++failures >= std::max(1, retry.maxAttempts)) {
            spdlog::error("[Orchestrator] download {}: segment {} failed: {}", task->id, id,
                          describe(err));
            segments.markError(id);
            out.segmentFailed = true;
            out.failure = err;
            break;
        }

        const auto wait = retry.backoffFor(failures);
        spdlog::warn("[Orchestrator] download {}: segment {} attempt {}/{} failed ({}); retrying "
                     "in {}ms",
                     task->id, id, failures, retry.maxAttempts, describe(err), wait.count());
        if (!lease->refresh(cancelled))
            break;
        segments.assignConnection(id, lease->id());
        if (!sleepCancellable(wait, cancelled))
            break;
    }

    if (!out.failure) {
        if (auto f = writer->flush(id); !f)
            out.failure = f.error();
    }
    if (done && !out.failure) {
        auto completion = segments.markComplete(id, SteadyClock::now());
        out.completed = completion.completed;
        out.split = completion.split;
        if (out.completed)
            writer->dropSegment(id);
    }
    if (!out.completed && !out.segmentFailed)
        segments.releaseLease(id);
    return out;
}

void Orchestrator::onWorkerDone(const std::shared_ptr<DownloadTask>& task,
                                const WorkerOutcome& out) {
    --task->workers;
    if (out.failure) {
        onFatal(task, *out.failure);
    } else if (out.rangeUnsupported) {
        spdlog::warn("[Orchestrator] download {}: server stopped honoring ranges; falling back to "
                     "a single stream",
                     task->id);
        requestStop(task, StopAction::FallbackSingle);
    } else if (out.resourceChanged &&
               static_cast<int>(task->pending) < static_cast<int>(StopAction::Restart)) {
        spdlog::warn("[Orchestrator] download {}: resource changed during the transfer; starting "
                     "over",
                     task->id);
        events_.publish(ErrorEvent{
            task->id, Error{ErrorCode::ResourceChanged, "validator no longer matches; restarting"},
            false});
        requestStop(task, StopAction::Restart);
    }

    if (out.split) {
        const auto& s = *out.split;
        spdlog::info("[Orchestrator] download {}: split segment {} at {} into new segment {}",
                     task->id, s.source, s.createdRange.start, s.created);
        events_.publish(
            SegmentRebalanced{task->id, s.source, s.created, s.sourceRange, s.createdRange});
    }
    if (!out.parked.empty()) {
        events_.publish(ErrorEvent{task->id,
                                   Error{ErrorCode::RateLimited,
                                         "server rate limiting; parked " +
                                             std::to_string(out.parked.size()) + " segment(s)"},
                                   false});
    }

    if (task->pending != StopAction::None) {
        settleIfIdle(task);
        return;
    }
    dispatch(task);
}

void Orchestrator::finishDownload(const std::shared_ptr<DownloadTask>& task) {
    if (task->finishing)
        return;
    task->finishing = true;
    ++task->tickEpoch;
    ++task->busyJobs;

    const bool verify = task->cfg.integrity.enabled || task->request.expected.has_value();
    boost::asio::post(*workPool_, [this, task, writer = task->writer, output = task->output,
                                   expected = task->request.expected,
                                   algo = task->cfg.integrity.algorithm, verify] {
        const ShouldCancel cancelled = [task] {
            return task->stopRequested.load(std::memory_order_acquire);
        };
        Expected<Finished> result = Finished{};
        try {
            result = [&]() -> Expected<Finished> {
                if (auto f = writer->flushAll(); !f)
                    return f.error();
                Finished fin;
                if (verify) {
                    auto checked = integrity::verifyFile(writer->partPath(), expected, algo,
                                                         cancelled);
                    if (!checked)
                        return checked.error();
                    fin.digest = checked.value();
                }
                auto moved = writer->finalize(output);
                if (!moved)
                    return moved.error();
                fin.path = moved.value();
                return fin;
            }();
        } catch (const std::exception& e) {
            result = Error{ErrorCode::Unknown, std::string("finalize: ") + e.what()};
        }

        boost::asio::post(task->strand, [this, task, result = std::move(result)] {
            --task->busyJobs;
            task->finishing = false;
            if (!result) {
                if (result.error().code == ErrorCode::Cancelled &&
                    task->pending != StopAction::None) {
                    settleIfIdle(task);
                    return;
                }
                onFatal(task, result.error());
                return;
            }

            {
                std::lock_guard<std::mutex> lk(task->manifestMutex);
                task->manifestRetired = true;
            }
            manifests_.remove(task->id);
            task->manifest.reset();
            task->writer.reset();
            task->pending = StopAction::None;
            task->stopRequested.store(false, std::memory_order_release);
            limiter_->removeDownload(task->id);
            throttle_.forget(task->id);

            const auto size = task->segments.downloadedBytes();
            const auto& fin = result.value();
            releaseSlot(task);
            transition(task, DownloadState::Complete);
            events_.publish(Complete{task->id, fin.path, size, fin.digest});
            spdlog::info("[Orchestrator] download {} complete: {} ({} bytes, digest {})", task->id,
                         fin.path.string(), size, fin.digest ? fin.digest->hex : std::string("-"));
        });
    });
}

void Orchestrator::onFatal(const std::shared_ptr<DownloadTask>& task, const Error& error) {
    if (!task->fatal) {
        task->fatal = error;
        spdlog::error("[Orchestrator] download {} failed: {}", task->id, describe(error));
        events_.publish(ErrorEvent{task->id, error, true});
    }
    requestStop(task, StopAction::Fail);
}

void Orchestrator::requestStop(const std::shared_ptr<DownloadTask>& task, StopAction action) {
    if (static_cast<int>(action) > static_cast<int>(task->pending))
        task->pending = action;
    task->stopRequested.store(true, std::memory_order_release);
    ++task->tickEpoch;
    limiter_->wakeAll();
    pool_.wakeAll();
    settleIfIdle(task);
}

void Orchestrator::settleIfIdle(const std::shared_ptr<DownloadTask>& task) {
    if (task->pending != StopAction::None && task->workers == 0 && task->busyJobs == 0)
        settle(task);
}

void Orchestrator::settle(const std::shared_ptr<DownloadTask>& task) {
    const auto action = std::exchange(task->pending, StopAction::None);
    const auto writer = task->writer;
    task->finishing = false;

    switch (action) {
        case StopAction::None:
            return;

        case StopAction::FallbackSingle:
            if (writer)
                writer->discard();
            task->writer.reset();
            task->forceSingle = true;
            task->prepared.reset();
            task->stopRequested.store(false, std::memory_order_release);
            startTransfer(task);
            return;

        case StopAction::Restart:
            if (writer)
                writer->discard();
            task->writer.reset();
            task->forceSingle = false;
            task->prepared.reset();
            task->manifest.reset();
            manifests_.remove(task->id);
            task->stopRequested.store(false, std::memory_order_release);
            // The transfer slot stays with the download
            transition(task, DownloadState::Probing);
            beginProbe(task);
            return;

        case StopAction::Pause:
        case StopAction::Shutdown:
        case StopAction::Cancel: {
            removeFromQueue(task->id);
            bool clean = true;
            if (writer) {
                if (auto r = writer->flushAll(); !r) {
                    clean = false;
                    spdlog::warn("[Orchestrator] download {}: final flush failed: {}", task->id,
                                 describe(r.error()));
                }
            }
            if (writer || task->manifest)
                persistManifest(task, manifest::ManifestState::Paused, clean, false);
            task->writer.reset();
            releaseSlot(task);
            transition(task, DownloadState::Paused);
            spdlog::info("[Orchestrator] download {} paused ({} bytes on disk)", task->id,
                         task->segments.downloadedBytes());
            return;
        }

        case StopAction::CancelDiscard: {
            removeFromQueue(task->id);
            if (writer) {
                writer->discard();
                task->writer.reset();
            } else if (!task->output.empty()) {
                std::error_code ec;
                fs::remove(storage::partPathFor(task->output), ec);
            }
            {
                std::lock_guard<std::mutex> lk(task->manifestMutex);
                task->manifestRetired = true;
            }
            manifests_.remove(task->id);
            task->manifest.reset();
            limiter_->removeDownload(task->id);
            throttle_.forget(task->id);
            releaseSlot(task);
            transition(task, DownloadState::Cancelled);
            spdlog::info("[Orchestrator] download {} cancelled and discarded", task->id);
            return;
        }

        case StopAction::Fail:
            removeFromQueue(task->id);
            if (writer) {
                if (auto r = writer->flushAll(); !r) {
                    spdlog::warn("[Orchestrator] download {}: flush after failure failed: {}",
                                 task->id, describe(r.error()));
                }
            }
            // Kept for a manual retry
            if (writer || task->manifest)
                persistManifest(task, manifest::ManifestState::Failed, false, false);
            task->writer.reset();
            releaseSlot(task);
            transition(task, DownloadState::Failed);
            return;
    }
}

void Orchestrator::persistManifest(const std::shared_ptr<DownloadTask>& task,
                                   manifest::ManifestState state, bool cleanlyPaused,
                                   bool background) {
    if (!task->writer && task->manifest) {
        // Transfer never (re)started: keep the persisted table, update the state
        auto rec = *task->manifest;
        rec.state = state;
        rec.bandwidthCap = task->bandwidthCap;
        task->manifest = rec;
        std::lock_guard<std::mutex> lk(task->manifestMutex);
        if (task->manifestRetired)
            return;
        if (auto r = manifests_.save(rec); !r) {
            spdlog::warn("[Orchestrator] download {}: manifest save failed: {}", task->id,
                         describe(r.error()));
        }
        return;
    }

    manifest::ManifestRecord rec;
    rec.id = task->id;
    rec.url = task->request.url;
    rec.mirrors = task->request.mirrors;
    rec.headers = task->request.headers;
    rec.output = task->output;
    rec.size = task->info.size;
    rec.rangeSupported = task->info.rangeSupported && !task->useFull;
    rec.etag = task->info.etag;
    rec.lastModified = task->info.lastModified;
    rec.generation = task->info.generation;
    rec.priority = task->request.priority;
    rec.bandwidthCap = task->bandwidthCap;
    rec.expected = task->request.expected;
    rec.segmentAlgo = checkpointAlgo(task->cfg.integrity.algorithm);
    rec.state = state;
    rec.cleanlyPaused = cleanlyPaused;
    for (const auto& s : task->segments.snapshot())
        rec.segments.push_back(
            manifest::SegmentRecord{s.id, s.range, s.downloadedOffset, s.checkpoint});
    task->manifest = rec;

    auto write = [this, task, rec = std::move(rec)] {
        std::lock_guard<std::mutex> lk(task->manifestMutex);
        if (task->manifestRetired)
            return;
        if (auto r = manifests_.save(rec); !r) {
            spdlog::warn("[Orchestrator] download {}: manifest save failed: {}", task->id,
                         describe(r.error()));
        }
    };

    if (!background) {
        write();
        return;
    }
    ++task->busyJobs;
    boost::asio::post(*workPool_, [this, task, write = std::move(write)] {
        write();
        boost::asio::post(task->strand, [this, task] {
            --task->busyJobs;
            settleIfIdle(task);
        });
    });
}

void Orchestrator::publishProgress(const std::shared_ptr<DownloadTask>& task) {
    if (!throttle_.admit(task->id, SteadyClock::now()))
        return;
    ProgressUpdate p;
    p.id = task->id;
    p.received = task->segments.receivedBytes();
    p.verified = task->segments.downloadedBytes();
    p.total = task->info.size;
    p.bytesPerSecond = task->monitor.currentSpeed();
    p.activeSegments = task->segments.leasedCount();
    events_.publish(std::move(p));
}

boost::asio::awaitable<void> Orchestrator::tickLoop(std::shared_ptr<DownloadTask> task,
                                                    std::uint64_t epoch) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor);

    const auto& cfg = task->cfg;
    const auto tick = std::max(std::chrono::milliseconds(10),
                               std::min({cfg.orchestrator.progressInterval,
                                         cfg.storage.flushInterval, cfg.segments.rebalanceInterval,
                                         cfg.orchestrator.manifestInterval}));
    auto now = SteadyClock::now();
    auto nextRebalance = now + cfg.segments.rebalanceInterval;
    auto nextFlush = now + cfg.storage.flushInterval;
    auto nextProgress = now;
    auto nextManifest = now + cfg.orchestrator.manifestInterval;

    while (task->tickEpoch == epoch) {
        timer.expires_after(tick);
        try {
            co_await timer.async_wait(boost::asio::use_awaitable);
        } catch (const boost::system::system_error& e) {
            if (e.code() != boost::asio::error::operation_aborted)
                spdlog::warn("[Orchestrator] download {}: tick timer failed: {}", task->id,
                             e.what());
            break;
        }
        if (task->tickEpoch != epoch || task->state.load() != DownloadState::Active ||
            task->pending != StopAction::None)
            break;

        now = SteadyClock::now();
        if (now >= nextRebalance) {
            nextRebalance = now + cfg.segments.rebalanceInterval;
            task->monitor.record(task->segments.receivedBytes(), now);
            for (auto id : task->segments.rebalance(now))
                spdlog::debug("[Orchestrator] download {}: segment {} is slow", task->id, id);
            dispatch(task);
        }
        if (now >= nextFlush && task->writer && !task->flushInFlight) {
            nextFlush = now + cfg.storage.flushInterval;
            task->flushInFlight = true;
            ++task->busyJobs;
            boost::asio::post(*workPool_, [this, task, writer = task->writer] {
                Expected<void> flushed;
                try {
                    flushed = writer->flushDue(SteadyClock::now());
                } catch (const std::exception& e) {
                    flushed = Error{ErrorCode::IoError, std::string("flush: ") + e.what()};
                }
                boost::asio::post(task->strand, [this, task, flushed] {
                    --task->busyJobs;
                    task->flushInFlight = false;
                    if (!flushed)
                        onFatal(task, flushed.error());
                    else
                        settleIfIdle(task);
                });
            });
        }
        if (now >= nextProgress) {
            nextProgress = now + cfg.orchestrator.progressInterval;
            publishProgress(task);
        }
        if (now >= nextManifest) {
            nextManifest = now + cfg.orchestrator.manifestInterval;
            persistManifest(task, manifest::ManifestState::InProgress, false, true);
        }
    }
    co_return;
}

// ==============
// Transfer slots
// ==============

bool Orchestrator::requestSlot(const std::shared_ptr<DownloadTask>& task) {
    if (task->holdsSlot)
        return true;
    std::lock_guard<std::mutex> lk(mutex_);
    if (!stopping_.load() && slotsInUse_ < cfg_.orchestrator.maxConcurrentDownloads) {
        ++slotsInUse_;
        task->holdsSlot = true;
        return true;
    }
    queue_.push_back(QueueEntry{task->request.priority, queueSeq_++, task->id});
    return false;
}

void Orchestrator::releaseSlot(const std::shared_ptr<DownloadTask>& task) {
    if (!task->holdsSlot)
        return;
    task->holdsSlot = false;

    std::shared_ptr<DownloadTask> next;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (slotsInUse_ > 0)
            --slotsInUse_;
        while (!stopping_.load() && !next && !queue_.empty()) {
            auto best = std::min_element(queue_.begin(), queue_.end(),
                                         [](const QueueEntry& a, const QueueEntry& b) {
                                             if (a.priority != b.priority)
                                                 return a.priority < b.priority;
                                             return a.seq < b.seq;
                                         });
            const auto id = best->id;
            queue_.erase(best);
            auto it = tasks_.find(id);
            if (it != tasks_.end()) {
                next = it->second;
                ++slotsInUse_;
            }
        }
    }
    if (!next)
        return;
    boost::asio::post(next->strand, [this, next] {
        next->holdsSlot = true;
        if (next->state.load() != DownloadState::Queued || next->pending != StopAction::None) {
            releaseSlot(next);
            return;
        }
        startTransfer(next);
    });
}

bool Orchestrator::removeFromQueue(DownloadId id) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [id](const QueueEntry& e) { return e.id == id; });
    if (it == queue_.end())
        return false;
    queue_.erase(it);
    return true;
}

} // namespace parfetch::orchestrator
