#pragma once

#include <parfetch/core/types.h>
#include <parfetch/integrity/integrity_verifier.h>
#include <parfetch/net/resource.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parfetch::manifest {

inline constexpr int kManifestVersion = 1;
inline constexpr std::chrono::seconds kStaleTempAge{60};

enum class ManifestState { InProgress, Paused, Complete, Failed };

std::string_view manifestStateToString(ManifestState s) noexcept;
std::optional<ManifestState> manifestStateFromString(std::string_view s) noexcept;

struct SegmentRecord {
    SegmentId id{0};
    ByteRange range;
    std::uint64_t completedBytes{0};
    integrity::Checkpoint checkpoint;
};

/**
 * Persisted mirror of one download: resource identity and validator, the
 * segment table with hash checkpoints, and the overall state.
 */
struct ManifestRecord {
    int version{kManifestVersion};
    DownloadId id{0};
    std::string url;
    std::vector<net::Mirror> mirrors;
    std::vector<net::Header> headers;
    std::filesystem::path output;
    std::optional<std::uint64_t> size;
    bool rangeSupported{false};
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;
    net::Generation generation{net::Generation::Http1};
    Priority priority{Priority::Normal};
    std::optional<std::uint64_t> bandwidthCap;
    std::optional<Checksum> expected;
    HashAlgo segmentAlgo{HashAlgo::Sha256};
    ManifestState state{ManifestState::InProgress};
    // Set only when every buffer was flushed and checkpointed before stopping
    bool cleanlyPaused{false};
    std::vector<SegmentRecord> segments;
    std::int64_t updatedMs{0};
};

nlohmann::json toJson(const ManifestRecord& record);
Expected<ManifestRecord> fromJson(const nlohmann::json& j);

/**
 * Directory of `<id>.manifest.json` files. Every save is a temp-file write,
 * fsync, rename and directory fsync, so a crash leaves either the old or the
 * new record.
 */
class ManifestStore {
public:
    explicit ManifestStore(std::filesystem::path dir);

    Expected<void> save(const ManifestRecord& record);
    Expected<std::optional<ManifestRecord>> load(DownloadId id) const;

    /**
     * Every readable record; corrupt files are skipped with a warning. Temp
     * files older than kStaleTempAge (left by a crash between write and
     * rename) are deleted on the way.
     */
    std::vector<ManifestRecord> loadAll();

    void remove(DownloadId id) noexcept;

    [[nodiscard]] std::filesystem::path pathFor(DownloadId id) const;
    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

private:
    Expected<ManifestRecord> readFile(const std::filesystem::path& p) const;
    void removeStaleTemps();

    std::filesystem::path dir_;
    mutable std::mutex mutex_;
    std::uint64_t tempCounter_{0};
};

} // namespace parfetch::manifest
