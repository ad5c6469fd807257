#pragma once

#include <parfetch/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace parfetch::storage {

/**
 * Invoked once bytes [offset, offset + data.size()) of a segment are durably
 * on disk, in per-segment order. A failure from the listener fails the flush.
 */
using FlushListener =
    std::function<Expected<void>(SegmentId segment, std::uint64_t offset,
                                 std::span<const std::byte> data)>;

struct WriterOptions {
    std::size_t bufferSize{1024ull * 1024ull};
    std::chrono::milliseconds flushInterval{200};
    bool syncOnFlush{true};
};

// Temporary path a download writes into before finalization.
std::filesystem::path partPathFor(const std::filesystem::path& output);

// errno -> StorageFull / PermissionDenied / IoError
Error makeIoError(int errnum, std::string_view what);

/**
 * Offset-addressed writer for one download's output file.
 *
 * Each segment appends into its own bounded buffer; a buffer is written with
 * pwrite at its absolute offset when full, when flushDue() finds it older than
 * the flush interval, or on flush()/flushAll(). The flush listener runs only
 * after the data sync succeeded.
 */
class StorageWriter {
public:
    /**
     * Open (or create) `<output>.part`. When `size` is known the file is
     * pre-allocated to it; `truncate` discards existing content.
     */
    static Expected<std::unique_ptr<StorageWriter>> open(const std::filesystem::path& output,
                                                         std::optional<std::uint64_t> size,
                                                         WriterOptions options, bool truncate);

    ~StorageWriter();
    StorageWriter(const StorageWriter&) = delete;
    StorageWriter& operator=(const StorageWriter&) = delete;

    void setFlushListener(FlushListener listener);

    // Start (or restart) buffering for `segment` at absolute file offset `offset`.
    void beginSegment(SegmentId segment, std::uint64_t offset);

    // Drop a segment's buffer without writing it.
    void dropSegment(SegmentId segment);

    Expected<void> append(SegmentId segment, std::span<const std::byte> data);
    Expected<void> flush(SegmentId segment);
    Expected<void> flushDue(std::chrono::steady_clock::time_point now);
    Expected<void> flushAll();

    [[nodiscard]] std::size_t buffered(SegmentId segment) const;

    /**
     * Flush, sync, close and atomically move the part file to `finalPath`
     * (copy + remove across filesystems).
     */
    Expected<std::filesystem::path> finalize(const std::filesystem::path& finalPath);

    // Close and remove the part file.
    void discard() noexcept;

    [[nodiscard]] const std::filesystem::path& partPath() const noexcept { return partPath_; }

private:
    struct SegmentBuffer {
        std::mutex mutex;
        std::uint64_t fileOffset{0}; // absolute offset of data[0]
        std::vector<std::byte> data;
        std::chrono::steady_clock::time_point firstAppend{};
    };

    StorageWriter(int fd, std::filesystem::path partPath, WriterOptions options);

    std::shared_ptr<SegmentBuffer> bufferFor(SegmentId segment) const;
    Expected<void> flushLocked(SegmentId segment, SegmentBuffer& buf);
    Expected<void> writeFully(std::uint64_t offset, std::span<const std::byte> data);
    void closeFd() noexcept;

    // Shared while writing or syncing, exclusive while closing
    mutable std::shared_mutex fdMutex_;
    int fd_{-1};
    std::filesystem::path partPath_;
    WriterOptions options_;
    FlushListener listener_;

    mutable std::mutex mapMutex_;
    std::unordered_map<SegmentId, std::shared_ptr<SegmentBuffer>> buffers_;
};

} // namespace parfetch::storage
