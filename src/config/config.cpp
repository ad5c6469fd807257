#include <parfetch/config/config.h>
#include <parfetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <system_error>

namespace parfetch::config {

namespace {

Error badValue(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "invalid value for '" + key + "': '" + value + "'"};
}

// Each apply helper returns false with `err` set when the key exists but is malformed.
bool applySize(const FlatConfig& flat, const std::string& key, std::uint64_t& out, Error& err) {
    auto it = flat.find(key);
    if (it == flat.end())
        return true;
    if (!parse_size(it->second, out)) {
        err = badValue(key, it->second);
        return false;
    }
    return true;
}

bool applyCount(const FlatConfig& flat, const std::string& key, std::size_t& out, Error& err) {
    std::uint64_t v = out;
    if (!applySize(flat, key, v, err))
        return false;
    out = static_cast<std::size_t>(v);
    return true;
}

bool applyMs(const FlatConfig& flat, const std::string& key, std::chrono::milliseconds& out,
             Error& err) {
    auto it = flat.find(key);
    if (it == flat.end())
        return true;
    std::uint64_t v = 0;
    if (!parse_u64(it->second, v)) {
        err = badValue(key, it->second);
        return false;
    }
    out = std::chrono::milliseconds(static_cast<std::int64_t>(v));
    return true;
}

bool applyDouble(const FlatConfig& flat, const std::string& key, double& out, Error& err) {
    auto it = flat.find(key);
    if (it == flat.end())
        return true;
    if (!parse_double(it->second, out)) {
        err = badValue(key, it->second);
        return false;
    }
    return true;
}

bool applyBool(const FlatConfig& flat, const std::string& key, bool& out, Error& err) {
    auto it = flat.find(key);
    if (it == flat.end())
        return true;
    if (!parse_bool(it->second, out)) {
        err = badValue(key, it->second);
        return false;
    }
    return true;
}

} // namespace

EngineConfig normalized(EngineConfig cfg) {
    auto& s = cfg.segments;
    s.maxSegments = std::clamp<std::size_t>(s.maxSegments, 1, kMaxSegmentsCeiling);
    s.minSegments = std::clamp<std::size_t>(s.minSegments, 1, s.maxSegments);
    if (s.minSegmentSize == 0)
        s.minSegmentSize = 1;
    if (s.assumedWindowBytes == 0)
        s.assumedWindowBytes = 64ull * 1024ull;
    s.slowThresholdPct = std::clamp(s.slowThresholdPct, 0.0, 1.0);
    if (s.rebalanceInterval.count() <= 0)
        s.rebalanceInterval = std::chrono::milliseconds(500);
    if (s.rateLimitStrikes == 0)
        s.rateLimitStrikes = 1;

    auto& c = cfg.connections;
    c.perHostLegacy = std::clamp<std::size_t>(c.perHostLegacy, 1, kMaxConnectionsPerHostCeiling);
    c.perHostMultiplexed =
        std::clamp<std::size_t>(c.perHostMultiplexed, 1, kMaxConnectionsPerHostCeiling);
    if (c.maxStreamsPerConnection == 0)
        c.maxStreamsPerConnection = 1;
    c.retireErrorRate = std::clamp(c.retireErrorRate, 0.0, 1.0);

    if (cfg.storage.bufferSize == 0)
        cfg.storage.bufferSize = 1024ull * 1024ull;
    if (cfg.storage.flushInterval.count() <= 0)
        cfg.storage.flushInterval = std::chrono::milliseconds(200);

    auto& o = cfg.orchestrator;
    if (o.maxConcurrentDownloads == 0)
        o.maxConcurrentDownloads = 1;
    if (o.eventCapacity == 0)
        o.eventCapacity = 1;
    if (o.transferThreads == 0)
        o.transferThreads = 1;
    return cfg;
}

Expected<EngineConfig> loadConfig(const std::filesystem::path& path) {
    EngineConfig cfg;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("config: {} not found, using defaults", path.string());
        return normalized(cfg);
    }

    const auto flat = parse_config_file(path);
    Error err;

    auto& s = cfg.segments;
    std::uint64_t minSize = s.minSegmentSize;
    if (!applyCount(flat, "segments.min", s.minSegments, err) ||
        !applyCount(flat, "segments.max", s.maxSegments, err) ||
        !applySize(flat, "segments.min_size", minSize, err) ||
        !applyMs(flat, "segments.rebalance_interval_ms", s.rebalanceInterval, err) ||
        !applyDouble(flat, "segments.slow_threshold_pct", s.slowThresholdPct, err)) {
        return err;
    }
    s.minSegmentSize = minSize;
    // Accept "20" as well as "0.2"
    if (s.slowThresholdPct > 1.0)
        s.slowThresholdPct /= 100.0;

    auto& c = cfg.connections;
    if (!applyCount(flat, "connections.per_host_legacy", c.perHostLegacy, err) ||
        !applyCount(flat, "connections.per_host_multiplexed", c.perHostMultiplexed, err) ||
        !applyCount(flat, "connections.max_streams_per_connection", c.maxStreamsPerConnection,
                    err) ||
        !applyMs(flat, "connections.connect_timeout_ms", c.connectTimeout, err) ||
        !applyMs(flat, "connections.read_timeout_ms", c.readTimeout, err) ||
        !applyDouble(flat, "connections.retire_error_rate", c.retireErrorRate, err) ||
        !applyBool(flat, "connections.tls_insecure", c.tlsInsecure, err) ||
        !applyBool(flat, "connections.follow_redirects", c.followRedirects, err)) {
        return err;
    }
    if (auto it = flat.find("connections.ca_path"); it != flat.end())
        c.caPath = expand_tilde(it->second).string();
    if (auto it = flat.find("connections.user_agent"); it != flat.end())
        c.userAgent = it->second;
    if (auto it = flat.find("connections.proxy"); it != flat.end())
        c.proxy = it->second;

    if (!applySize(flat, "bandwidth.global_bps", cfg.bandwidth.globalBps, err) ||
        !applySize(flat, "bandwidth.per_download_bps", cfg.bandwidth.perDownloadBps, err)) {
        return err;
    }

    std::uint64_t bufferSize = cfg.storage.bufferSize;
    if (!applySize(flat, "storage.buffer_size", bufferSize, err) ||
        !applyMs(flat, "storage.flush_interval_ms", cfg.storage.flushInterval, err) ||
        !applyBool(flat, "storage.sync_on_flush", cfg.storage.syncOnFlush, err)) {
        return err;
    }
    cfg.storage.bufferSize = static_cast<std::size_t>(bufferSize);
    if (auto it = flat.find("storage.manifest_dir"); it != flat.end())
        cfg.storage.manifestDir = expand_tilde(it->second);

    if (!applyBool(flat, "integrity.enabled", cfg.integrity.enabled, err))
        return err;
    if (auto it = flat.find("integrity.algorithm"); it != flat.end()) {
        auto algo = hashAlgoFromString(it->second);
        if (!algo)
            return badValue("integrity.algorithm", it->second);
        cfg.integrity.algorithm = *algo;
    }

    if (!applyBool(flat, "resume.verify", cfg.resume.verify, err))
        return err;

    auto& o = cfg.orchestrator;
    if (!applyCount(flat, "orchestrator.max_concurrent_downloads", o.maxConcurrentDownloads,
                    err) ||
        !applyCount(flat, "orchestrator.event_capacity", o.eventCapacity, err) ||
        !applyCount(flat, "orchestrator.transfer_threads", o.transferThreads, err)) {
        return err;
    }

    spdlog::info("config: loaded {}", path.string());
    return normalized(cfg);
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }
    if (const char* env = std::getenv("PARFETCH_CONFIG"); env && *env) {
        return std::filesystem::path(env);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "parfetch" / "config.toml";
    }

    return configHome / "parfetch" / "config.toml";
}

} // namespace parfetch::config
