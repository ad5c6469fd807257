#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <parfetch/config/config.h>
#include <parfetch/config/config_helpers.h>

#include <filesystem>

using namespace parfetch;
using namespace parfetch::config;
using namespace std::chrono_literals;

namespace {

struct ConfigFixture {
    ConfigFixture() { dir = test::make_temp_dir("parfetch_config_test_"); }
    ~ConfigFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
    std::filesystem::path dir;
};

} // namespace

TEST_CASE_METHOD(ConfigFixture, "Config: missing file yields defaults", "[config]") {
    auto cfg = loadConfig(dir / "absent.toml");
    REQUIRE(cfg.ok());
    const auto& c = cfg.value();
    CHECK(c.segments.maxSegments == 32);
    CHECK(c.segments.minSegmentSize == 256ull * 1024ull);
    CHECK(c.connections.perHostLegacy == 6);
    CHECK(c.connections.perHostMultiplexed == 2);
    CHECK(c.storage.bufferSize == 1024ull * 1024ull);
    CHECK(c.integrity.enabled);
    CHECK(c.resume.verify);
    CHECK(c.orchestrator.maxConcurrentDownloads == 3);
}

TEST_CASE_METHOD(ConfigFixture, "Config: sections and dotted keys are read", "[config]") {
    const auto path = test::write_file(dir / "config.toml", R"(# parfetch settings
[segments]
max = 12
min_size = "512K"
rebalance_interval_ms = 250
slow_threshold_pct = 25   # percent form

[connections]
per_host_legacy = 4
connect_timeout_ms = 1500
tls_insecure = true
user_agent = "agent/1.0"
proxy = "http://proxy.internal:3128"
follow_redirects = false

bandwidth.global_bps = 2M

[storage]
buffer_size = 64K
manifest_dir = "/var/tmp/parfetch"

[integrity]
algorithm = "sha512"

[resume]
verify = false

[orchestrator]
max_concurrent_downloads = 5
)");

    auto cfg = loadConfig(path);
    REQUIRE(cfg.ok());
    const auto& c = cfg.value();
    CHECK(c.segments.maxSegments == 12);
    CHECK(c.segments.minSegmentSize == 512ull * 1024ull);
    CHECK(c.segments.rebalanceInterval == 250ms);
    CHECK(c.segments.slowThresholdPct == 0.25);
    CHECK(c.connections.perHostLegacy == 4);
    CHECK(c.connections.connectTimeout == 1500ms);
    CHECK(c.connections.tlsInsecure);
    CHECK(c.connections.userAgent == "agent/1.0");
    CHECK(c.connections.proxy == "http://proxy.internal:3128");
    CHECK_FALSE(c.connections.followRedirects);
    CHECK(c.bandwidth.globalBps == 2ull * 1024ull * 1024ull);
    CHECK(c.storage.bufferSize == 64ull * 1024ull);
    CHECK(c.storage.manifestDir == std::filesystem::path("/var/tmp/parfetch"));
    CHECK(c.integrity.algorithm == HashAlgo::Sha512);
    CHECK_FALSE(c.resume.verify);
    CHECK(c.orchestrator.maxConcurrentDownloads == 5);
}

TEST_CASE_METHOD(ConfigFixture, "Config: ceilings are enforced", "[config]") {
    const auto path = test::write_file(dir / "config.toml", "[segments]\nmax = 100\nmin = 0\n"
                                                            "[connections]\nper_host_legacy = 64\n");
    auto cfg = loadConfig(path);
    REQUIRE(cfg.ok());
    CHECK(cfg.value().segments.maxSegments == kMaxSegmentsCeiling);
    CHECK(cfg.value().segments.minSegments == 1);
    CHECK(cfg.value().connections.perHostLegacy == kMaxConnectionsPerHostCeiling);
}

TEST_CASE_METHOD(ConfigFixture, "Config: malformed values are rejected", "[config]") {
    SECTION("non-numeric count") {
        const auto path = test::write_file(dir / "bad.toml", "[segments]\nmax = lots\n");
        auto cfg = loadConfig(path);
        REQUIRE_FALSE(cfg.ok());
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
    }
    SECTION("unknown algorithm") {
        const auto path = test::write_file(dir / "bad.toml", "[integrity]\nalgorithm = crc32\n");
        auto cfg = loadConfig(path);
        REQUIRE_FALSE(cfg.ok());
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Config: normalized repairs zero values", "[config]") {
    EngineConfig raw;
    raw.storage.bufferSize = 0;
    raw.orchestrator.maxConcurrentDownloads = 0;
    raw.segments.slowThresholdPct = 3.0;
    const auto c = normalized(raw);
    CHECK(c.storage.bufferSize > 0);
    CHECK(c.orchestrator.maxConcurrentDownloads == 1);
    CHECK(c.segments.slowThresholdPct == 1.0);
}

TEST_CASE("Config: helper parsers", "[config][helpers]") {
    std::uint64_t v = 0;
    CHECK(parse_size("4M", v));
    CHECK(v == 4ull * 1024ull * 1024ull);
    CHECK(parse_size(" 10k ", v));
    CHECK(v == 10240);
    CHECK_FALSE(parse_size("ten", v));

    bool b = false;
    CHECK(parse_bool("Yes", b));
    CHECK(b);
    CHECK(parse_bool("off", b));
    CHECK_FALSE(b);
    CHECK_FALSE(parse_bool("maybe", b));

    double d = 0.0;
    CHECK(parse_double("0.5", d));
    CHECK(d == 0.5);
    CHECK_FALSE(parse_double("0.5x", d));
}

TEST_CASE("Config: path resolution order", "[config][path]") {
    SECTION("explicit override wins") {
        test::ScopedEnvVar env("PARFETCH_CONFIG", std::string("/tmp/from-env.toml"));
        CHECK(get_config_path("/etc/parfetch.toml") == std::filesystem::path("/etc/parfetch.toml"));
    }
    SECTION("environment variable") {
        test::ScopedEnvVar env("PARFETCH_CONFIG", std::string("/tmp/from-env.toml"));
        CHECK(get_config_path() == std::filesystem::path("/tmp/from-env.toml"));
    }
    SECTION("XDG config home") {
        test::ScopedEnvVar env("PARFETCH_CONFIG", std::nullopt);
        test::ScopedEnvVar xdg("XDG_CONFIG_HOME", std::string("/tmp/xdg"));
        CHECK(get_config_path() == std::filesystem::path("/tmp/xdg/parfetch/config.toml"));
    }
}
