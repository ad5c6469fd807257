#include <parfetch/manifest/manifest_store.h>
#include <parfetch/storage/storage_writer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace parfetch::manifest {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr std::string_view kSuffix = ".manifest.json";
constexpr std::string_view kTempMarker = ".manifest.json.tmp.";

std::int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

template <typename T> void putOptional(json& j, const char* key, const std::optional<T>& v) {
    if (v)
        j[key] = *v;
    else
        j[key] = nullptr;
}

template <typename T> std::optional<T> getOptional(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null())
        return std::nullopt;
    return j.at(key).get<T>();
}

Expected<void> writeFileDurably(const fs::path& p, const std::string& data) {
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0)
        return storage::makeIoError(errno, "manifest: open failed for " + p.string());
    std::size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::write(fd, data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int err = errno;
            ::close(fd);
            return storage::makeIoError(err, "manifest: write failed for " + p.string());
        }
        done += static_cast<std::size_t>(n);
    }
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return storage::makeIoError(err, "manifest: fsync failed for " + p.string());
    }
    ::close(fd);
    return Expected<void>{};
}

void fsyncDir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
        return;
    if (::fsync(fd) != 0)
        spdlog::debug("manifest: fsync(dir) failed for {}", dir.string());
    ::close(fd);
}

} // namespace

std::string_view manifestStateToString(ManifestState s) noexcept {
    switch (s) {
        case ManifestState::InProgress:
            return "in_progress";
        case ManifestState::Paused:
            return "paused";
        case ManifestState::Complete:
            return "complete";
        case ManifestState::Failed:
            return "failed";
    }
    return "in_progress";
}

std::optional<ManifestState> manifestStateFromString(std::string_view s) noexcept {
    if (s == "in_progress")
        return ManifestState::InProgress;
    if (s == "paused")
        return ManifestState::Paused;
    if (s == "complete")
        return ManifestState::Complete;
    if (s == "failed")
        return ManifestState::Failed;
    return std::nullopt;
}

json toJson(const ManifestRecord& r) {
    json j;
    j["version"] = r.version;
    j["id"] = r.id;
    j["url"] = r.url;
    json mirrors = json::array();
    for (const auto& m : r.mirrors)
        mirrors.push_back(
            {{"url", m.url}, {"priority", std::string(net::mirrorPriorityToString(m.priority))}});
    j["mirrors"] = mirrors;
    json headers = json::array();
    for (const auto& h : r.headers)
        headers.push_back({{"name", h.name}, {"value", h.value}});
    j["headers"] = headers;
    j["output"] = r.output.string();
    putOptional(j, "size", r.size);
    j["range_supported"] = r.rangeSupported;
    putOptional(j, "etag", r.etag);
    putOptional(j, "last_modified", r.lastModified);
    j["generation"] = std::string(net::generationToString(r.generation));
    j["priority"] = std::string(priorityToString(r.priority));
    putOptional(j, "bandwidth_cap", r.bandwidthCap);
    if (r.expected) {
        j["expected"] = {{"algo", std::string(hashAlgoToString(r.expected->algo))},
                         {"hex", r.expected->hex}};
    } else {
        j["expected"] = nullptr;
    }
    j["segment_algo"] = std::string(hashAlgoToString(r.segmentAlgo));
    j["state"] = std::string(manifestStateToString(r.state));
    j["cleanly_paused"] = r.cleanlyPaused;
    json segs = json::array();
    for (const auto& s : r.segments) {
        segs.push_back({{"id", s.id},
                        {"start", s.range.start},
                        {"end", s.range.end},
                        {"completed", s.completedBytes},
                        {"checkpoint",
                         {{"covered", s.checkpoint.covered},
                          {"digest", s.checkpoint.digestHex},
                          {"midstate", s.checkpoint.midstate},
                          {"format", s.checkpoint.format}}}});
    }
    j["segments"] = segs;
    j["updated_ms"] = r.updatedMs;
    return j;
}

Expected<ManifestRecord> fromJson(const json& j) {
    try {
        ManifestRecord r;
        r.version = j.at("version").get<int>();
        if (r.version != kManifestVersion) {
            return Error{ErrorCode::ManifestCorrupt,
                         "unsupported manifest version " + std::to_string(r.version)};
        }
        r.id = j.at("id").get<DownloadId>();
        r.url = j.at("url").get<std::string>();
        if (j.contains("mirrors")) {
            for (const auto& m : j.at("mirrors")) {
                auto prio =
                    net::mirrorPriorityFromString(m.value("priority", std::string("secondary")));
                if (!prio)
                    return Error{ErrorCode::ManifestCorrupt, "manifest has an unknown mirror priority"};
                r.mirrors.push_back({m.at("url").get<std::string>(), *prio});
            }
        }
        if (j.contains("headers")) {
            for (const auto& h : j.at("headers"))
                r.headers.push_back({h.at("name").get<std::string>(), h.at("value").get<std::string>()});
        }
        r.output = j.at("output").get<std::string>();
        r.size = getOptional<std::uint64_t>(j, "size");
        r.rangeSupported = j.value("range_supported", false);
        r.etag = getOptional<std::string>(j, "etag");
        r.lastModified = getOptional<std::string>(j, "last_modified");

        auto gen = net::generationFromString(j.at("generation").get<std::string>());
        auto prio = priorityFromString(j.value("priority", std::string("normal")));
        auto segAlgo = hashAlgoFromString(j.value("segment_algo", std::string("sha256")));
        auto state = manifestStateFromString(j.at("state").get<std::string>());
        if (!gen || !prio || !segAlgo || !state)
            return Error{ErrorCode::ManifestCorrupt, "manifest has an unknown enum value"};
        r.generation = *gen;
        r.priority = *prio;
        r.segmentAlgo = *segAlgo;
        r.state = *state;

        r.bandwidthCap = getOptional<std::uint64_t>(j, "bandwidth_cap");
        if (j.contains("expected") && !j.at("expected").is_null()) {
            const auto& e = j.at("expected");
            auto algo = hashAlgoFromString(e.at("algo").get<std::string>());
            if (!algo)
                return Error{ErrorCode::ManifestCorrupt, "manifest has an unknown digest algorithm"};
            r.expected = Checksum{*algo, e.at("hex").get<std::string>()};
        }
        r.cleanlyPaused = j.value("cleanly_paused", false);

        for (const auto& s : j.at("segments")) {
            SegmentRecord seg;
            seg.id = s.at("id").get<SegmentId>();
            seg.range = ByteRange{s.at("start").get<std::uint64_t>(), s.at("end").get<std::uint64_t>()};
            seg.completedBytes = s.at("completed").get<std::uint64_t>();
            const auto& cp = s.at("checkpoint");
            seg.checkpoint.covered = cp.at("covered").get<std::uint64_t>();
            seg.checkpoint.digestHex = cp.at("digest").get<std::string>();
            seg.checkpoint.midstate = cp.value("midstate", std::string{});
            seg.checkpoint.format = cp.value("format", std::string{});
            if (seg.range.end < seg.range.start || seg.completedBytes > seg.range.length())
                return Error{ErrorCode::ManifestCorrupt, "manifest segment out of range"};
            r.segments.push_back(std::move(seg));
        }
        r.updatedMs = j.value("updated_ms", std::int64_t{0});
        return r;
    } catch (const json::exception& e) {
        return Error{ErrorCode::ManifestCorrupt, std::string("manifest parse error: ") + e.what()};
    }
}

ManifestStore::ManifestStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path ManifestStore::pathFor(DownloadId id) const {
    return dir_ / (std::to_string(id) + std::string(kSuffix));
}

Expected<void> ManifestStore::save(const ManifestRecord& record) {
    ManifestRecord stamped = record;
    stamped.updatedMs = nowMs();
    const std::string body = toJson(stamped).dump(2);

    std::lock_guard<std::mutex> lk(mutex_);
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec)
        return storage::makeIoError(ec.value(), "manifest: cannot create " + dir_.string());

    const auto target = pathFor(record.id);
    auto temp = target;
    temp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(++tempCounter_);

    if (auto r = writeFileDurably(temp, body); !r) {
        fs::remove(temp, ec);
        return r;
    }
    std::error_code ren_ec;
    fs::rename(temp, target, ren_ec);
    if (ren_ec) {
        fs::remove(temp, ec);
        return storage::makeIoError(ren_ec.value(), "manifest: rename failed for " + target.string());
    }
    fsyncDir(dir_);
    return Expected<void>{};
}

Expected<ManifestRecord> ManifestStore::readFile(const fs::path& p) const {
    std::ifstream in(p);
    if (!in.good())
        return Error{ErrorCode::IoError, "manifest: cannot open " + p.string()};
    json j = json::parse(in, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded())
        return Error{ErrorCode::ManifestCorrupt, "manifest: invalid JSON in " + p.string()};
    return fromJson(j);
}

Expected<std::optional<ManifestRecord>> ManifestStore::load(DownloadId id) const {
    const auto p = pathFor(id);
    std::error_code ec;
    if (!fs::exists(p, ec))
        return std::optional<ManifestRecord>{std::nullopt};
    auto r = readFile(p);
    if (!r)
        return r.error();
    return std::optional<ManifestRecord>{std::move(r).value()};
}

void ManifestStore::removeStaleTemps() {
    std::lock_guard<std::mutex> lk(mutex_);
    const auto cutoff = fs::file_time_type::clock::now() - kStaleTempAge;
    std::vector<fs::path> stale;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        std::error_code fe;
        if (name.find(kTempMarker) == std::string::npos || !it->is_regular_file(fe))
            continue;
        // Younger temps may belong to a save still in progress elsewhere
        const auto written = it->last_write_time(fe);
        if (!fe && written < cutoff)
            stale.push_back(it->path());
    }
    for (const auto& p : stale) {
        std::error_code re;
        if (fs::remove(p, re))
            spdlog::info("Removed stale manifest temp file {}", p.string());
        else if (re)
            spdlog::warn("Failed to remove stale manifest temp file {}: {}", p.string(),
                         re.message());
    }
}

std::vector<ManifestRecord> ManifestStore::loadAll() {
    std::vector<ManifestRecord> out;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec))
        return out;
    removeStaleTemps();
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        const auto name = p.filename().string();
        std::error_code fe;
        if (!it->is_regular_file(fe) || name.size() <= kSuffix.size() ||
            name.compare(name.size() - kSuffix.size(), kSuffix.size(), kSuffix) != 0)
            continue;
        auto r = readFile(p);
        if (!r) {
            spdlog::warn("Skipping unreadable manifest {}: {}", p.string(), r.error().message);
            continue;
        }
        out.push_back(std::move(r).value());
    }
    std::sort(out.begin(), out.end(),
              [](const ManifestRecord& a, const ManifestRecord& b) { return a.id < b.id; });
    return out;
}

void ManifestStore::remove(DownloadId id) noexcept {
    std::lock_guard<std::mutex> lk(mutex_);
    std::error_code ec;
    fs::remove(pathFor(id), ec);
    if (ec) {
        spdlog::debug("manifest: failed to remove {}: {}", pathFor(id).string(), ec.message());
    }
}

} // namespace parfetch::manifest
