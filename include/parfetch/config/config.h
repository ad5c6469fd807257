#pragma once

#include <parfetch/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace parfetch::config {

/**
 * Segment planning and rebalancing knobs.
 */
struct SegmentConfig {
    std::size_t minSegments{1};
    std::size_t maxSegments{32};
    std::uint64_t minSegmentSize{256ull * 1024ull};
    std::chrono::milliseconds rebalanceInterval{500};
    double slowThresholdPct{0.20};
    std::uint64_t assumedWindowBytes{64ull * 1024ull};

    // Server rate-limit handling
    std::size_t rateLimitStrikes{2};
    std::chrono::milliseconds rateLimitWindow{5000};
    std::chrono::milliseconds rateLimitBackoff{10000};
};

struct ConnectionConfig {
    std::size_t perHostLegacy{6};
    std::size_t perHostMultiplexed{2};
    std::size_t maxStreamsPerConnection{16};
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds readTimeout{30000};
    double retireErrorRate{0.5};
    std::size_t retireMinRequests{4};
    bool tlsInsecure{false};
    std::string caPath; // empty = system default
    std::string userAgent{"parfetch/0.1"};
    std::string proxy; // empty = libcurl's environment lookup
    bool followRedirects{true};
};

/**
 * Bandwidth caps in bytes per second (0 = unlimited).
 */
struct BandwidthConfig {
    std::uint64_t globalBps{0};
    std::uint64_t perDownloadBps{0};
};

struct StorageConfig {
    std::size_t bufferSize{1024ull * 1024ull};
    std::chrono::milliseconds flushInterval{200};
    std::filesystem::path manifestDir{"manifests"};
    bool syncOnFlush{true};
};

struct IntegrityConfig {
    bool enabled{true};
    HashAlgo algorithm{HashAlgo::Sha256};
};

struct ResumeConfig {
    bool verify{true};
};

struct OrchestratorConfig {
    std::size_t maxConcurrentDownloads{3};
    std::size_t eventCapacity{1024};
    std::size_t transferThreads{64};
    std::chrono::milliseconds progressInterval{100};
    std::chrono::milliseconds manifestInterval{1000};
    RetryPolicy retry{};
};

/**
 * Immutable engine configuration. Copied into each download at creation so a
 * running transfer never observes later changes.
 */
struct EngineConfig {
    SegmentConfig segments{};
    ConnectionConfig connections{};
    BandwidthConfig bandwidth{};
    StorageConfig storage{};
    IntegrityConfig integrity{};
    ResumeConfig resume{};
    OrchestratorConfig orchestrator{};
};

// Hard ceilings applied regardless of configuration
inline constexpr std::size_t kMaxSegmentsCeiling = 32;
inline constexpr std::size_t kMaxConnectionsPerHostCeiling = 32;

/**
 * Clamp values into their legal ranges (segment and connection ceilings,
 * non-zero buffer sizes).
 */
EngineConfig normalized(EngineConfig cfg);

/**
 * Load a config.toml file. Missing keys keep their defaults; unknown keys are
 * ignored. A missing file yields the defaults.
 */
Expected<EngineConfig> loadConfig(const std::filesystem::path& path);

/**
 * Resolve config path: PARFETCH_CONFIG, then XDG_CONFIG_HOME, then ~/.config.
 */
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace parfetch::config
