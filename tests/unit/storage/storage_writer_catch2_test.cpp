#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <parfetch/storage/storage_writer.h>

#include <cerrno>
#include <filesystem>
#include <mutex>
#include <vector>

using namespace parfetch;
using namespace parfetch::storage;
using namespace std::chrono_literals;

namespace {

struct FlushCall {
    SegmentId segment;
    std::uint64_t offset;
    std::size_t length;
};

struct WriterFixture {
    WriterFixture() {
        dir = test::make_temp_dir("parfetch_storage_test_");
        output = dir / "out.bin";
    }
    ~WriterFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::unique_ptr<StorageWriter> open(std::optional<std::uint64_t> size, std::size_t bufferSize,
                                        bool truncate = true) {
        WriterOptions o;
        o.bufferSize = bufferSize;
        o.flushInterval = 50ms;
        o.syncOnFlush = true;
        auto w = StorageWriter::open(output, size, o, truncate);
        REQUIRE(w.ok());
        auto writer = std::move(w).value();
        writer->setFlushListener(
            [this](SegmentId id, std::uint64_t offset, std::span<const std::byte> data) {
                std::lock_guard<std::mutex> lk(mutex);
                calls.push_back({id, offset, data.size()});
                return Expected<void>{};
            });
        return writer;
    }

    std::filesystem::path dir;
    std::filesystem::path output;
    std::mutex mutex;
    std::vector<FlushCall> calls;
};

} // namespace

TEST_CASE_METHOD(WriterFixture, "StorageWriter: segments land at their offsets",
                 "[storage][writer]") {
    const auto payload = test::make_payload(1000);
    auto writer = open(payload.size(), 4096);
    CHECK(writer->partPath() == partPathFor(output));
    CHECK(std::filesystem::file_size(writer->partPath()) == 1000);

    // Two segments written out of order
    writer->beginSegment(1, 500);
    writer->beginSegment(0, 0);
    REQUIRE(writer->append(1, std::span(payload).subspan(500)).ok());
    REQUIRE(writer->append(0, std::span(payload).first(500)).ok());
    CHECK(writer->buffered(0) == 500);
    CHECK(calls.empty());

    REQUIRE(writer->flushAll().ok());
    CHECK(writer->buffered(0) == 0);
    REQUIRE(calls.size() == 2);

    auto finalPath = writer->finalize(output);
    REQUIRE(finalPath.ok());
    CHECK(finalPath.value() == output);
    CHECK_FALSE(std::filesystem::exists(partPathFor(output)));
    CHECK(test::read_file(output) == payload);
}

TEST_CASE_METHOD(WriterFixture, "StorageWriter: a full buffer flushes in order",
                 "[storage][writer]") {
    const auto payload = test::make_payload(250);
    auto writer = open(payload.size(), 100);
    writer->beginSegment(0, 0);
    REQUIRE(writer->append(0, payload).ok());

    // 100 + 100 flushed, 50 still buffered
    REQUIRE(calls.size() == 2);
    CHECK(calls[0].offset == 0);
    CHECK(calls[1].offset == 100);
    CHECK(writer->buffered(0) == 50);

    REQUIRE(writer->flush(0).ok());
    REQUIRE(calls.size() == 3);
    CHECK(calls[2].offset == 200);
    CHECK(calls[2].length == 50);
}

TEST_CASE_METHOD(WriterFixture, "StorageWriter: flushDue honors the interval",
                 "[storage][writer]") {
    auto writer = open(100, 4096);
    writer->beginSegment(0, 0);
    REQUIRE(writer->append(0, test::as_bytes("hello")).ok());

    const auto now = std::chrono::steady_clock::now();
    REQUIRE(writer->flushDue(now).ok());
    CHECK(calls.empty());

    REQUIRE(writer->flushDue(now + 1s).ok());
    REQUIRE(calls.size() == 1);
    CHECK(calls[0].length == 5);
}

TEST_CASE_METHOD(WriterFixture, "StorageWriter: listener failure fails the flush",
                 "[storage][writer]") {
    auto writer = open(100, 4096);
    writer->setFlushListener([](SegmentId, std::uint64_t, std::span<const std::byte>) {
        return Expected<void>{Error{ErrorCode::IoError, "offset mismatch"}};
    });
    writer->beginSegment(0, 0);
    REQUIRE(writer->append(0, test::as_bytes("abc")).ok());
    auto r = writer->flush(0);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::IoError);
}

TEST_CASE_METHOD(WriterFixture, "StorageWriter: dropped segments never reach disk",
                 "[storage][writer]") {
    auto writer = open(100, 4096);
    writer->beginSegment(3, 10);
    REQUIRE(writer->append(3, test::as_bytes("stale")).ok());
    writer->dropSegment(3);
    CHECK(writer->buffered(3) == 0);
    REQUIRE(writer->flushAll().ok());
    CHECK(calls.empty());

    auto r = writer->append(3, test::as_bytes("late"));
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE_METHOD(WriterFixture, "StorageWriter: reopening keeps existing bytes",
                 "[storage][writer]") {
    {
        auto writer = open(10, 4096);
        writer->beginSegment(0, 0);
        REQUIRE(writer->append(0, test::as_bytes("01234")).ok());
        REQUIRE(writer->flushAll().ok());
    }
    auto writer = open(10, 4096, /*truncate=*/false);
    writer->beginSegment(0, 5);
    REQUIRE(writer->append(0, test::as_bytes("56789")).ok());
    REQUIRE(writer->finalize(output).ok());

    const auto bytes = test::read_file(output);
    REQUIRE(bytes.size() == 10);
    CHECK(static_cast<char>(bytes[0]) == '0');
    CHECK(static_cast<char>(bytes[9]) == '9');
}

TEST_CASE_METHOD(WriterFixture, "StorageWriter: discard removes the part file",
                 "[storage][writer]") {
    auto writer = open(100, 4096);
    REQUIRE(std::filesystem::exists(partPathFor(output)));
    writer->discard();
    CHECK_FALSE(std::filesystem::exists(partPathFor(output)));
    CHECK_FALSE(std::filesystem::exists(output));
}

TEST_CASE("StorageWriter: errno classification", "[storage][errors]") {
    CHECK(makeIoError(ENOSPC, "write").code == ErrorCode::StorageFull);
    CHECK(makeIoError(EACCES, "open").code == ErrorCode::PermissionDenied);
    CHECK(makeIoError(EROFS, "open").code == ErrorCode::PermissionDenied);
    CHECK(makeIoError(EIO, "read").code == ErrorCode::IoError);
    CHECK(isFatalStorage(makeIoError(ENOSPC, "write")));
}
