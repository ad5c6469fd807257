#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <parfetch/manifest/manifest_store.h>

#include <chrono>
#include <filesystem>

using namespace parfetch;
using namespace parfetch::manifest;

namespace {

struct ManifestFixture {
    ManifestFixture() : dir(test::make_temp_dir("parfetch_manifest_test_")), store(dir / "m") {}
    ~ManifestFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    static ManifestRecord sample(DownloadId id) {
        ManifestRecord r;
        r.id = id;
        r.url = "https://mirror.example.org/iso/disk.img";
        r.mirrors = {{"https://eu.example.org/iso/disk.img", net::MirrorPriority::Secondary},
                     {"ftp://archive.example.org/disk.img", net::MirrorPriority::Fallback}};
        r.headers = {{"Authorization", "Bearer t"}};
        r.output = "/tmp/out/disk.img";
        r.size = 4'000'000;
        r.rangeSupported = true;
        r.etag = "\"abc\"";
        r.generation = net::Generation::Http2;
        r.priority = Priority::High;
        r.bandwidthCap = 1'000'000;
        r.expected = Checksum{HashAlgo::Sha256, "00ff"};
        r.state = ManifestState::Paused;
        r.cleanlyPaused = true;

        SegmentRecord a;
        a.id = 0;
        a.range = {0, 2'000'000};
        a.completedBytes = 500'000;
        a.checkpoint.covered = 500'000;
        a.checkpoint.digestHex = "aa";
        a.checkpoint.midstate = "bb";
        a.checkpoint.format = "openssl3-sha256ctx112-le";
        SegmentRecord b;
        b.id = 1;
        b.range = {2'000'000, 4'000'000};
        r.segments = {a, b};
        return r;
    }

    std::filesystem::path dir;
    ManifestStore store;
};

} // namespace

TEST_CASE_METHOD(ManifestFixture, "ManifestStore: save and load", "[manifest]") {
    REQUIRE(store.save(sample(7)).ok());
    CHECK(std::filesystem::exists(store.pathFor(7)));
    CHECK(store.pathFor(7).filename() == "7.manifest.json");

    auto loaded = store.load(7);
    REQUIRE(loaded.ok());
    REQUIRE(loaded.value().has_value());
    const auto& r = *loaded.value();
    CHECK(r.url == "https://mirror.example.org/iso/disk.img");
    REQUIRE(r.headers.size() == 1);
    CHECK(r.headers[0].value == "Bearer t");
    CHECK(r.size == std::optional<std::uint64_t>(4'000'000));
    CHECK(r.etag == std::optional<std::string>("\"abc\""));
    CHECK_FALSE(r.lastModified.has_value());
    CHECK(r.generation == net::Generation::Http2);
    CHECK(r.priority == Priority::High);
    CHECK(r.state == ManifestState::Paused);
    CHECK(r.cleanlyPaused);
    REQUIRE(r.expected.has_value());
    CHECK(r.expected->hex == "00ff");
    REQUIRE(r.segments.size() == 2);
    CHECK(r.segments[0].completedBytes == 500'000);
    CHECK(r.segments[0].checkpoint.midstate == "bb");
    CHECK(r.segments[0].checkpoint.format == "openssl3-sha256ctx112-le");
    CHECK(r.segments[1].checkpoint.format.empty());
    REQUIRE(r.mirrors.size() == 2);
    CHECK(r.mirrors[0].url == "https://eu.example.org/iso/disk.img");
    CHECK(r.mirrors[1].priority == net::MirrorPriority::Fallback);
    CHECK(r.segments[1].range.start == 2'000'000);
    CHECK(r.updatedMs > 0);

    SECTION("save replaces the previous record") {
        auto next = sample(7);
        next.state = ManifestState::InProgress;
        next.cleanlyPaused = false;
        REQUIRE(store.save(next).ok());
        auto again = store.load(7);
        REQUIRE(again.ok());
        CHECK(again.value()->state == ManifestState::InProgress);
    }

    SECTION("no temp files are left behind") {
        std::size_t files = 0;
        for (const auto& e : std::filesystem::directory_iterator(store.dir())) {
            CHECK(e.path().filename().string().find(".tmp.") == std::string::npos);
            ++files;
        }
        CHECK(files == 1);
    }

    SECTION("remove") {
        store.remove(7);
        auto gone = store.load(7);
        REQUIRE(gone.ok());
        CHECK_FALSE(gone.value().has_value());
        store.remove(7); // idempotent
    }
}

TEST_CASE_METHOD(ManifestFixture, "ManifestStore: missing id", "[manifest]") {
    auto r = store.load(42);
    REQUIRE(r.ok());
    CHECK_FALSE(r.value().has_value());
    CHECK(store.loadAll().empty());
}

TEST_CASE_METHOD(ManifestFixture, "ManifestStore: loadAll skips corrupt files", "[manifest]") {
    REQUIRE(store.save(sample(3)).ok());
    REQUIRE(store.save(sample(1)).ok());
    test::write_file(store.dir() / "2.manifest.json", "{ not json");
    test::write_file(store.dir() / "notes.txt", "ignored");

    auto all = store.loadAll();
    REQUIRE(all.size() == 2);
    CHECK(all[0].id == 1);
    CHECK(all[1].id == 3);

    auto bad = store.load(2);
    REQUIRE_FALSE(bad.ok());
    CHECK(bad.error().code == ErrorCode::ManifestCorrupt);
}

TEST_CASE_METHOD(ManifestFixture, "ManifestStore: loadAll clears abandoned temp files",
                 "[manifest]") {
    namespace fs = std::filesystem;
    REQUIRE(store.save(sample(4)).ok());
    const auto stale = test::write_file(store.dir() / "4.manifest.json.tmp.999.1", "{ partial");
    const auto fresh = test::write_file(store.dir() / "5.manifest.json.tmp.999.2", "{ partial");
    fs::last_write_time(stale, fs::file_time_type::clock::now() - std::chrono::hours(1));

    auto all = store.loadAll();
    REQUIRE(all.size() == 1);
    CHECK(all[0].id == 4);
    CHECK_FALSE(fs::exists(stale));
    // A temp this young may still be renamed by a concurrent save
    CHECK(fs::exists(fresh));
    CHECK(fs::exists(store.pathFor(4)));
}

TEST_CASE("fromJson: rejects malformed records", "[manifest]") {
    auto j = toJson(ManifestFixture::sample(5));

    SECTION("well formed") {
        CHECK(fromJson(j).ok());
    }
    SECTION("unsupported version") {
        j["version"] = 2;
        auto r = fromJson(j);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::ManifestCorrupt);
    }
    SECTION("segment progress beyond its range") {
        j["segments"][1]["completed"] = 3'000'000;
        CHECK(fromJson(j).error().code == ErrorCode::ManifestCorrupt);
    }
    SECTION("unknown mirror priority") {
        j["mirrors"][0]["priority"] = "best";
        CHECK(fromJson(j).error().code == ErrorCode::ManifestCorrupt);
    }
    SECTION("records without mirrors or checkpoint format") {
        j.erase("mirrors");
        j["segments"][0]["checkpoint"].erase("format");
        auto r = fromJson(j);
        REQUIRE(r.ok());
        CHECK(r.value().mirrors.empty());
        CHECK(r.value().segments[0].checkpoint.format.empty());
    }
    SECTION("unknown state") {
        j["state"] = "sleeping";
        CHECK(fromJson(j).error().code == ErrorCode::ManifestCorrupt);
    }
    SECTION("missing field") {
        j.erase("url");
        CHECK(fromJson(j).error().code == ErrorCode::ManifestCorrupt);
    }
}

TEST_CASE("ManifestState: string names", "[manifest]") {
    CHECK(manifestStateToString(ManifestState::InProgress) == "in_progress");
    CHECK(manifestStateFromString("complete") == ManifestState::Complete);
    CHECK_FALSE(manifestStateFromString("done").has_value());
}
