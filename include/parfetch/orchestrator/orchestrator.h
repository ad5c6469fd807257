#pragma once

#include <parfetch/bandwidth/rate_limiter.h>
#include <parfetch/config/config.h>
#include <parfetch/core/types.h>
#include <parfetch/manifest/manifest_store.h>
#include <parfetch/net/connection_pool.h>
#include <parfetch/net/protocol_adapter.h>
#include <parfetch/orchestrator/event_channel.h>
#include <parfetch/orchestrator/events.h>
#include <parfetch/segment/segment_manager.h>
#include <parfetch/segment/source_selector.h>
#include <parfetch/storage/storage_writer.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace parfetch::orchestrator {

struct DownloadTask;
struct WorkerOutcome;
struct PreparedResume;
struct ProbedMirror;

// What a stopping download does once its workers and jobs have drained.
// Ordered by precedence: a stronger pending action replaces a weaker one.
enum class StopAction {
    None,
    FallbackSingle,
    Restart, // resource changed under the transfer: discard and probe again
    Pause,
    Shutdown,
    Cancel,
    CancelDiscard,
    Fail
};

/**
 * Read-only view of one download.
 */
struct DownloadSnapshot {
    DownloadId id{0};
    DownloadState state{DownloadState::Probing};
    std::string url;
    std::filesystem::path output;
    Priority priority{Priority::Normal};
    std::optional<std::uint64_t> total;
    std::uint64_t received{0};
    std::uint64_t verified{0};
    std::vector<segment::Segment> segments;
    std::vector<segment::SourceStats> sources; // primary URL first, then accepted mirrors
};

// Transport and pool settings derived from the connection section.
net::TransportOptions transportOptionsFrom(const config::EngineConfig& cfg);
net::PoolLimits poolLimitsFrom(const config::EngineConfig& cfg);

/**
 * Top-level coordinator.
 *
 * Every download runs on its own strand of a single control io_context, so
 * state transitions of one download are serialized while different downloads
 * proceed independently. Blocking transfers run on a transfer thread pool;
 * probing, hashing, flushing and verification run on a smaller work pool and
 * report back to the owning strand.
 *
 * At most `maxConcurrentDownloads` downloads hold a transfer slot; the rest
 * wait in a priority queue (FIFO within a priority).
 */
class Orchestrator {
public:
    explicit Orchestrator(config::EngineConfig cfg,
                          std::shared_ptr<net::IProtocolAdapter> adapter = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void start();

    // Pause every running download cleanly, then stop the control thread.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /**
     * Apply a command. Returns the affected download (a fresh id for
     * AddDownload, 0 for a global bandwidth limit); unknown ids fail with
     * InvalidArgument. Commands complete asynchronously; watch events().
     */
    Expected<DownloadId> submit(Command command);

    DownloadId addDownload(DownloadRequest request);
    Expected<void> pause(DownloadId id);
    Expected<void> resume(DownloadId id);
    Expected<void> cancel(DownloadId id, bool discard = false);
    Expected<void> setBandwidthLimit(std::optional<DownloadId> id, std::uint64_t bps);

    /**
     * Register every manifest found in the manifest directory. In-progress and
     * paused downloads enter the resume protocol; failed ones are registered
     * as Failed and wait for an explicit resume.
     */
    std::vector<DownloadId> resumeAll();

    [[nodiscard]] EventChannel& events() noexcept { return events_; }
    [[nodiscard]] std::optional<DownloadSnapshot> snapshot(DownloadId id) const;
    [[nodiscard]] std::vector<DownloadId> downloads() const;
    [[nodiscard]] const config::EngineConfig& config() const noexcept { return cfg_; }

private:
    std::shared_ptr<DownloadTask> find(DownloadId id) const;
    std::shared_ptr<DownloadTask> createTask(DownloadId id, DownloadRequest request);

    // Strand-side state machine
    void transition(const std::shared_ptr<DownloadTask>& task, DownloadState to);
    void beginProbe(const std::shared_ptr<DownloadTask>& task);
    void onProbed(const std::shared_ptr<DownloadTask>& task, Expected<net::ResourceInfo> probed,
                  std::vector<ProbedMirror> mirrors);
    void useSources(const std::shared_ptr<DownloadTask>& task, const net::ResourceInfo& primary,
                    const std::vector<ProbedMirror>& mirrors);
    void onResumePrepared(const std::shared_ptr<DownloadTask>& task,
                          Expected<std::optional<PreparedResume>> prepared);
    void admit(const std::shared_ptr<DownloadTask>& task);
    void startTransfer(const std::shared_ptr<DownloadTask>& task);
    void dispatch(const std::shared_ptr<DownloadTask>& task);
    void launchWorker(const std::shared_ptr<DownloadTask>& task, const segment::Segment& seg);
    void onWorkerDone(const std::shared_ptr<DownloadTask>& task, const WorkerOutcome& out);
    void finishDownload(const std::shared_ptr<DownloadTask>& task);
    void onFatal(const std::shared_ptr<DownloadTask>& task, const Error& error);
    void requestStop(const std::shared_ptr<DownloadTask>& task, StopAction action);
    void settleIfIdle(const std::shared_ptr<DownloadTask>& task);
    void settle(const std::shared_ptr<DownloadTask>& task);
    void persistManifest(const std::shared_ptr<DownloadTask>& task, manifest::ManifestState state,
                         bool cleanlyPaused, bool background);
    void publishProgress(const std::shared_ptr<DownloadTask>& task);
    boost::asio::awaitable<void> tickLoop(std::shared_ptr<DownloadTask> task, std::uint64_t epoch);

    // Runs on the transfer pool
    WorkerOutcome runSegment(const std::shared_ptr<DownloadTask>& task,
                             std::shared_ptr<storage::StorageWriter> writer,
                             std::shared_ptr<const std::vector<net::ResourceInfo>> infos,
                             std::size_t source, const segment::Segment& seg, bool useFull);

    // Transfer slots
    bool requestSlot(const std::shared_ptr<DownloadTask>& task);
    void releaseSlot(const std::shared_ptr<DownloadTask>& task);
    bool removeFromQueue(DownloadId id);
    void notifyStateChanged();

    config::EngineConfig cfg_;
    std::shared_ptr<net::IProtocolAdapter> adapter_;
    net::ConnectionPool pool_;
    std::unique_ptr<bandwidth::IRateLimiter> limiter_;
    manifest::ManifestStore manifests_;
    EventChannel events_;
    ProgressThrottle throttle_;

    std::unique_ptr<boost::asio::io_context> io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;
    std::thread controlThread_;
    std::unique_ptr<boost::asio::thread_pool> transferPool_;
    std::unique_ptr<boost::asio::thread_pool> workPool_;

    struct QueueEntry {
        Priority priority{Priority::Normal};
        std::uint64_t seq{0};
        DownloadId id{0};
    };

    mutable std::mutex mutex_;
    std::condition_variable stateCv_;
    std::map<DownloadId, std::shared_ptr<DownloadTask>> tasks_;
    std::vector<QueueEntry> queue_;
    std::size_t slotsInUse_{0};
    std::uint64_t queueSeq_{0};

    std::atomic<DownloadId> nextId_{1};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
};

} // namespace parfetch::orchestrator
