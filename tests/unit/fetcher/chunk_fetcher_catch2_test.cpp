// ChunkFetcher: resume detection, progress accounting and per-range failure modes.

#include <catch2/catch_test_macros.hpp>

#include <parafetch/fetcher/fetcher.hpp>
#include <parafetch/fetcher/progress_channel.hpp>

#include "../../support/fetch_fixtures.hpp"
#include "../../support/memory_http_adapter.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace fs = std::filesystem;
using namespace parafetch;
using parafetch::test_support::MemoryHttpAdapter;
using parafetch::test_support::TempDirScope;

namespace {

ChunkRequest make_request(const fs::path& temp, ByteRange range, std::int64_t total) {
    ChunkRequest req;
    req.url = "https://example.test/blob.bin";
    req.tempPath = temp;
    req.range = range;
    req.total = total;
    req.resumable = true;
    return req;
}

std::span<const std::byte> slice(const std::vector<std::byte>& v, std::size_t from,
                                 std::size_t to) {
    return std::span<const std::byte>(v).subspan(from, to - from);
}

} // namespace

TEST_CASE("ChunkFetcher downloads a fresh range", "[fetcher][chunk]") {
    auto tmp = TempDirScope::unique_under("parafetch-chunk");
    const auto body = test_support::make_payload(100000);
    MemoryHttpAdapter http(body);
    ProgressChannel progress;

    auto req = make_request(tmp / "chunks/1", ByteRange{1, 40000, 90000}, 100000);
    auto r = fetchChunk(http, req, &progress);
    progress.close();

    REQUIRE(r.ok());
    CHECK(r.value().resumedBytes == 0);
    CHECK(r.value().fetchedBytes == 50000);
    CHECK(r.value().networkUsed);
    CHECK(http.getCount() == 1);
    CHECK(http.offsets() == std::vector<std::uint64_t>{40000});

    const auto onDisk = test_support::read_file(req.tempPath);
    REQUIRE(onDisk.size() == 50000);
    CHECK(std::equal(onDisk.begin(), onDisk.end(), body.begin() + 40000));

    const auto reports = test_support::drain(progress);
    // 16 KiB pieces: 16384 * 3 + 848
    REQUIRE(reports.size() == 4);
    CHECK(test_support::sum_written(reports) == 50000);
    for (const auto& rep : reports) {
        CHECK(rep.total == 100000);
        CHECK(rep.writtenBytes > 0);
    }
}

TEST_CASE("ChunkFetcher complete chunk costs no request", "[fetcher][chunk]") {
    auto tmp = TempDirScope::unique_under("parafetch-chunk");
    const auto body = test_support::make_payload(4096);
    MemoryHttpAdapter http(body);
    ProgressChannel progress;

    auto req = make_request(tmp / "0", ByteRange{0, 0, 4096}, 4096);
    test_support::write_file(req.tempPath, body);

    auto r = fetchChunk(http, req, &progress);
    progress.close();

    REQUIRE(r.ok());
    CHECK_FALSE(r.value().networkUsed);
    CHECK(r.value().resumedBytes == 4096);
    CHECK(http.getCount() == 0);

    const auto reports = test_support::drain(progress);
    REQUIRE(reports.size() == 1);
    CHECK(reports[0].writtenBytes == 4096);
    CHECK(reports[0].total == 4096);
}

TEST_CASE("ChunkFetcher empty complete chunk reports nothing", "[fetcher][chunk]") {
    auto tmp = TempDirScope::unique_under("parafetch-chunk");
    MemoryHttpAdapter http(test_support::make_payload(0));
    ProgressChannel progress;

    auto req = make_request(tmp / "0", ByteRange{0, 0, 0}, 0);
    auto r = fetchChunk(http, req, &progress);
    progress.close();

    REQUIRE(r.ok());
    CHECK(http.getCount() == 0);
    CHECK(test_support::drain(progress).empty());
    CHECK(fs::exists(req.tempPath));
}

TEST_CASE("ChunkFetcher resumes a partial chunk", "[fetcher][chunk]") {
    auto tmp = TempDirScope::unique_under("parafetch-chunk");
    const auto body = test_support::make_payload(60000);
    MemoryHttpAdapter http(body);
    ProgressChannel progress;

    auto req = make_request(tmp / "2", ByteRange{2, 20000, 60000}, 60000);
    test_support::write_file(req.tempPath, slice(body, 20000, 30000));

    auto r = fetchChunk(http, req, &progress);
    progress.close();

    REQUIRE(r.ok());
    CHECK(r.value().resumedBytes == 10000);
    CHECK(r.value().fetchedBytes == 30000);
    CHECK(http.offsets() == std::vector<std::uint64_t>{30000});
    CHECK(http.servedBytes() == 30000);

    const auto onDisk = test_support::read_file(req.tempPath);
    REQUIRE(onDisk.size() == 40000);
    CHECK(std::equal(onDisk.begin(), onDisk.end(), body.begin() + 20000));

    const auto reports = test_support::drain(progress);
    REQUIRE_FALSE(reports.empty());
    CHECK(reports.front().writtenBytes == 10000);
    CHECK(test_support::sum_written(reports) == 40000);
}

TEST_CASE("ChunkFetcher starts over when it cannot resume", "[fetcher][chunk]") {
    auto tmp = TempDirScope::unique_under("parafetch-chunk");
    const auto body = test_support::make_payload(30000);

    SECTION("server without range support") {
        MemoryHttpAdapter::Behavior behavior;
        behavior.acceptRanges = false;
        MemoryHttpAdapter http(body, behavior);

        auto req = make_request(tmp / "0", ByteRange{0, 0, 30000}, 30000);
        req.resumable = false;
        test_support::write_file(req.tempPath, slice(body, 0, 5000));

        auto r = fetchChunk(http, req, nullptr);
        REQUIRE(r.ok());
        CHECK(r.value().resumedBytes == 0);
        CHECK(http.offsets() == std::vector<std::uint64_t>{0});
        CHECK(test_support::read_file(req.tempPath) == body);
    }

    SECTION("file larger than its range") {
        MemoryHttpAdapter http(body);
        auto req = make_request(tmp / "0", ByteRange{0, 0, 10000}, 30000);
        test_support::write_file(req.tempPath, slice(body, 0, 12000));

        auto r = fetchChunk(http, req, nullptr);
        REQUIRE(r.ok());
        CHECK(http.offsets() == std::vector<std::uint64_t>{0});
        const auto onDisk = test_support::read_file(req.tempPath);
        REQUIRE(onDisk.size() == 10000);
        CHECK(std::equal(onDisk.begin(), onDisk.end(), body.begin()));
    }
}

TEST_CASE("ChunkFetcher open-ended range", "[fetcher][chunk]") {
    auto tmp = TempDirScope::unique_under("parafetch-chunk");
    const auto body = test_support::make_payload(50000);
    MemoryHttpAdapter::Behavior behavior;
    behavior.sendContentLength = false;
    MemoryHttpAdapter http(body, behavior);
    ProgressChannel progress;

    auto req = make_request(tmp / "blob.part", ByteRange{0, 0, -1}, -1);
    auto r = fetchChunk(http, req, &progress);
    progress.close();

    REQUIRE(r.ok());
    CHECK(r.value().fetchedBytes == 50000);
    CHECK(test_support::read_file(req.tempPath) == body);
    for (const auto& rep : test_support::drain(progress)) {
        CHECK(rep.total == -1);
    }
}

TEST_CASE("ChunkFetcher drops bytes beyond the range", "[fetcher][chunk]") {
    auto tmp = TempDirScope::unique_under("parafetch-chunk");
    const auto body = test_support::make_payload(40000);
    MemoryHttpAdapter::Behavior behavior;
    behavior.extraBytes = 5000;
    MemoryHttpAdapter http(body, behavior);
    ProgressChannel progress;

    auto req = make_request(tmp / "0", ByteRange{0, 0, 20000}, 40000);
    auto r = fetchChunk(http, req, &progress);
    progress.close();

    REQUIRE(r.ok());
    CHECK(r.value().fetchedBytes == 20000);
    CHECK(test_support::read_file(req.tempPath).size() == 20000);
    CHECK(test_support::sum_written(test_support::drain(progress)) == 20000);
}

TEST_CASE("ChunkFetcher failures", "[fetcher][chunk]") {
    auto tmp = TempDirScope::unique_under("parafetch-chunk");
    const auto body = test_support::make_payload(20000);

    SECTION("non-2xx status is an upstream error") {
        MemoryHttpAdapter::Behavior behavior;
        behavior.getStatus = 503;
        MemoryHttpAdapter http(body, behavior);
        auto r = fetchChunk(http, make_request(tmp / "0", ByteRange{0, 0, 20000}, 20000),
                            nullptr);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::UpstreamError);
        REQUIRE(r.error().httpStatus.has_value());
        CHECK(*r.error().httpStatus == 503);
    }

    SECTION("transport error is passed through") {
        MemoryHttpAdapter::Behavior behavior;
        behavior.failOffsets = {0};
        MemoryHttpAdapter http(body, behavior);
        auto r = fetchChunk(http, make_request(tmp / "0", ByteRange{0, 0, 20000}, 20000),
                            nullptr);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::NetworkError);
    }

    SECTION("short body is an upstream error and keeps what arrived") {
        MemoryHttpAdapter http(body);
        // The range claims more bytes than the server holds.
        auto req = make_request(tmp / "0", ByteRange{0, 10000, 30000}, 30000);
        auto r = fetchChunk(http, req, nullptr);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::UpstreamError);
        CHECK(fs::file_size(req.tempPath) == 10000);
    }
}
