/*
 * storage_writer.cpp
 *
 * - Output is written to "<output>.part" and renamed into place on finalize
 * - Pre-allocation with posix_fallocate (ftruncate where the filesystem lacks it)
 * - pwrite at absolute offsets followed by fdatasync; the flush listener only
 *   sees bytes after they are durable
 * - EXDEV fallback on finalize: copy + fsync + remove
 */

#include <parfetch/storage/storage_writer.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace parfetch::storage {

namespace fs = std::filesystem;

namespace {

Expected<void> fsync_path(const fs::path& p, bool directory) {
    int flags = O_RDONLY | O_CLOEXEC;
    if (directory)
        flags |= O_DIRECTORY;
    int fd = ::open(p.c_str(), flags);
    if (fd < 0)
        return makeIoError(errno, "open() for fsync failed: " + p.string());
    if (::fsync(fd) != 0) {
        const int err = errno;
        ::close(fd);
        return makeIoError(err, "fsync() failed for: " + p.string());
    }
    ::close(fd);
    return Expected<void>{};
}

Expected<void> fsync_dir(const fs::path& dir) {
    return fsync_path(dir.empty() ? fs::path(".") : dir, true);
}

// Copy file contents and make the destination durable. Replaces `dst`.
Expected<void> copy_file_fsync_replace(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    if (fs::exists(dst, ec))
        fs::remove(dst, ec);

    {
        std::ifstream is(src, std::ios::binary);
        if (!is.good())
            return Error{ErrorCode::IoError, "copy: failed to open source: " + src.string()};
        std::ofstream os(dst, std::ios::binary | std::ios::trunc);
        if (!os.good())
            return makeIoError(errno, "copy: failed to open destination: " + dst.string());
        std::vector<char> buffer(1 << 20);
        while (is.good()) {
            is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = is.gcount();
            if (got > 0) {
                os.write(buffer.data(), got);
                if (!os.good())
                    return makeIoError(errno, "copy: write failed for: " + dst.string());
            }
        }
        if (!is.eof())
            return Error{ErrorCode::IoError, "copy: read failed for source: " + src.string()};
    }

    if (auto r = fsync_path(dst, false); !r)
        return r;
    return fsync_dir(dst.parent_path());
}

Expected<void> preallocate(int fd, std::uint64_t size, const fs::path& p) {
    if (size == 0)
        return Expected<void>{};
    int rc = ::posix_fallocate(fd, 0, static_cast<off_t>(size));
    if (rc == 0)
        return Expected<void>{};
    if (rc == EOPNOTSUPP || rc == EINVAL) {
        // Filesystem cannot reserve blocks; at least size the file
        spdlog::debug("posix_fallocate unsupported for {}, using ftruncate", p.string());
        struct stat st{};
        if (::fstat(fd, &st) == 0 && static_cast<std::uint64_t>(st.st_size) >= size)
            return Expected<void>{};
        if (::ftruncate(fd, static_cast<off_t>(size)) != 0)
            return makeIoError(errno, "ftruncate failed for: " + p.string());
        return Expected<void>{};
    }
    return makeIoError(rc, "posix_fallocate failed for: " + p.string());
}

} // namespace

fs::path partPathFor(const fs::path& output) {
    fs::path p = output;
    p += ".part";
    return p;
}

Error makeIoError(int errnum, std::string_view what) {
    Error e;
    switch (errnum) {
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            e.code = ErrorCode::StorageFull;
            break;
        case EACCES:
        case EPERM:
        case EROFS:
            e.code = ErrorCode::PermissionDenied;
            break;
        default:
            e.code = ErrorCode::IoError;
            break;
    }
    e.message = std::string(what) + ": " + std::strerror(errnum);
    return e;
}

StorageWriter::StorageWriter(int fd, fs::path partPath, WriterOptions options)
    : fd_(fd), partPath_(std::move(partPath)), options_(options) {
    if (options_.bufferSize == 0)
        options_.bufferSize = 64 * 1024;
}

StorageWriter::~StorageWriter() {
    closeFd();
}

void StorageWriter::closeFd() noexcept {
    std::unique_lock<std::shared_mutex> lk(fdMutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Expected<std::unique_ptr<StorageWriter>> StorageWriter::open(const fs::path& output,
                                                             std::optional<std::uint64_t> size,
                                                             WriterOptions options,
                                                             bool truncate) {
    const auto part = partPathFor(output);
    std::error_code ec;
    if (part.has_parent_path()) {
        fs::create_directories(part.parent_path(), ec);
        if (ec) {
            return makeIoError(ec.value(), "Failed to create output dir: " +
                                               part.parent_path().string());
        }
    }

    int flags = O_RDWR | O_CREAT | O_CLOEXEC;
    if (truncate)
        flags |= O_TRUNC;
    int fd = ::open(part.c_str(), flags, 0644);
    if (fd < 0)
        return makeIoError(errno, "Failed to open part file: " + part.string());

    if (size) {
        if (auto r = preallocate(fd, *size, part); !r) {
            ::close(fd);
            return r.error();
        }
    }

    spdlog::debug("storage: opened {} (size={}, truncate={})", part.string(),
                  size ? std::to_string(*size) : std::string("unknown"), truncate);
    return std::unique_ptr<StorageWriter>(new StorageWriter(fd, part, options));
}

void StorageWriter::setFlushListener(FlushListener listener) {
    listener_ = std::move(listener);
}

std::shared_ptr<StorageWriter::SegmentBuffer> StorageWriter::bufferFor(SegmentId segment) const {
    std::lock_guard<std::mutex> lk(mapMutex_);
    auto it = buffers_.find(segment);
    return it == buffers_.end() ? nullptr : it->second;
}

void StorageWriter::beginSegment(SegmentId segment, std::uint64_t offset) {
    auto buf = std::make_shared<SegmentBuffer>();
    buf->fileOffset = offset;
    buf->data.reserve(options_.bufferSize);
    std::lock_guard<std::mutex> lk(mapMutex_);
    buffers_[segment] = std::move(buf);
}

void StorageWriter::dropSegment(SegmentId segment) {
    std::shared_ptr<SegmentBuffer> buf;
    {
        std::lock_guard<std::mutex> lk(mapMutex_);
        auto it = buffers_.find(segment);
        if (it == buffers_.end())
            return;
        buf = std::move(it->second);
        buffers_.erase(it);
    }
    // A concurrent flushDue() may still hold this buffer
    std::lock_guard<std::mutex> lk(buf->mutex);
    buf->data.clear();
}

Expected<void> StorageWriter::writeFully(std::uint64_t offset, std::span<const std::byte> data) {
    if (fd_ < 0)
        return Error{ErrorCode::IoError, "part file is closed: " + partPath_.string()};
    std::size_t done = 0;
    while (done < data.size()) {
        ssize_t n = ::pwrite(fd_, data.data() + done, data.size() - done,
                             static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return makeIoError(errno, "pwrite failed on: " + partPath_.string());
        }
        if (n == 0)
            return Error{ErrorCode::IoError, "pwrite made no progress on: " + partPath_.string()};
        done += static_cast<std::size_t>(n);
    }
    return Expected<void>{};
}

Expected<void> StorageWriter::flushLocked(SegmentId segment, SegmentBuffer& buf) {
    if (buf.data.empty())
        return Expected<void>{};

    std::span<const std::byte> bytes{buf.data.data(), buf.data.size()};
    {
        std::shared_lock<std::shared_mutex> fdLock(fdMutex_);
        if (auto r = writeFully(buf.fileOffset, bytes); !r)
            return r;
        if (options_.syncOnFlush && ::fdatasync(fd_) != 0)
            return makeIoError(errno, "fdatasync failed on: " + partPath_.string());
    }

    if (listener_) {
        if (auto r = listener_(segment, buf.fileOffset, bytes); !r)
            return r;
    }
    buf.fileOffset += buf.data.size();
    buf.data.clear();
    return Expected<void>{};
}

Expected<void> StorageWriter::append(SegmentId segment, std::span<const std::byte> data) {
    auto buf = bufferFor(segment);
    if (!buf) {
        return Error{ErrorCode::InvalidArgument,
                     "append to unknown segment " + std::to_string(segment)};
    }
    std::lock_guard<std::mutex> lk(buf->mutex);
    while (!data.empty()) {
        if (buf->data.empty())
            buf->firstAppend = std::chrono::steady_clock::now();
        const auto room = options_.bufferSize - buf->data.size();
        const auto take = std::min(room, data.size());
        buf->data.insert(buf->data.end(), data.begin(), data.begin() + take);
        data = data.subspan(take);
        if (buf->data.size() >= options_.bufferSize) {
            if (auto r = flushLocked(segment, *buf); !r)
                return r;
        }
    }
    return Expected<void>{};
}

Expected<void> StorageWriter::flush(SegmentId segment) {
    auto buf = bufferFor(segment);
    if (!buf)
        return Expected<void>{};
    std::lock_guard<std::mutex> lk(buf->mutex);
    return flushLocked(segment, *buf);
}

Expected<void> StorageWriter::flushDue(std::chrono::steady_clock::time_point now) {
    std::vector<std::pair<SegmentId, std::shared_ptr<SegmentBuffer>>> all;
    {
        std::lock_guard<std::mutex> lk(mapMutex_);
        all.assign(buffers_.begin(), buffers_.end());
    }
    for (auto& [id, buf] : all) {
        // Segments busy appending flush themselves when full
        std::unique_lock<std::mutex> lk(buf->mutex, std::try_to_lock);
        if (!lk.owns_lock() || buf->data.empty())
            continue;
        if (now - buf->firstAppend < options_.flushInterval)
            continue;
        if (auto r = flushLocked(id, *buf); !r)
            return r;
    }
    return Expected<void>{};
}

Expected<void> StorageWriter::flushAll() {
    std::vector<std::pair<SegmentId, std::shared_ptr<SegmentBuffer>>> all;
    {
        std::lock_guard<std::mutex> lk(mapMutex_);
        all.assign(buffers_.begin(), buffers_.end());
    }
    for (auto& [id, buf] : all) {
        std::lock_guard<std::mutex> lk(buf->mutex);
        if (auto r = flushLocked(id, *buf); !r)
            return r;
    }
    return Expected<void>{};
}

std::size_t StorageWriter::buffered(SegmentId segment) const {
    auto buf = bufferFor(segment);
    if (!buf)
        return 0;
    std::lock_guard<std::mutex> lk(buf->mutex);
    return buf->data.size();
}

Expected<fs::path> StorageWriter::finalize(const fs::path& finalPath) {
    if (auto r = flushAll(); !r)
        return r.error();
    {
        std::shared_lock<std::shared_mutex> fdLock(fdMutex_);
        if (fd_ >= 0 && ::fsync(fd_) != 0)
            return makeIoError(errno, "fsync failed on: " + partPath_.string());
    }
    closeFd();
    {
        std::lock_guard<std::mutex> lk(mapMutex_);
        buffers_.clear();
    }

    std::error_code ec;
    if (finalPath.has_parent_path())
        fs::create_directories(finalPath.parent_path(), ec);

    std::error_code ren_ec;
    fs::rename(partPath_, finalPath, ren_ec);
    if (ren_ec) {
        if (ren_ec == std::errc::cross_device_link) {
            spdlog::warn("Cross-device rename detected; performing copy+fsync+replace for {}",
                         finalPath.string());
            if (auto r = copy_file_fsync_replace(partPath_, finalPath); !r)
                return r.error();
            std::error_code del_ec;
            fs::remove(partPath_, del_ec);
            return finalPath;
        }
        return makeIoError(ren_ec.value(), "rename() from " + partPath_.string() + " to " +
                                               finalPath.string());
    }

    if (auto rr = fsync_dir(finalPath.parent_path()); !rr) {
        spdlog::debug("fsync on output dir failed (continuing): {}", rr.error().message);
    }
    return finalPath;
}

void StorageWriter::discard() noexcept {
    closeFd();
    {
        std::lock_guard<std::mutex> lk(mapMutex_);
        buffers_.clear();
    }
    std::error_code ec;
    fs::remove(partPath_, ec);
    if (ec) {
        spdlog::debug("discard: failed to remove part file {}: {}", partPath_.string(),
                      ec.message());
    }
}

} // namespace parfetch::storage
