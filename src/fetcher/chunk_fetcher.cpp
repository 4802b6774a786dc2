/*
 * parafetch/src/fetcher/chunk_fetcher.cpp
 *
 * Downloads one byte range into one local file.
 * - The file is opened in append mode; whatever is already on disk is kept and only the
 *   missing tail is requested (resume across restarts).
 * - A file that already holds the whole range costs no network I/O.
 * - Body bytes go through CountingWriter, which reports every write to the progress sink.
 */

#include <parafetch/fetcher/fetcher.hpp>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <span>
#include <string>
#include <system_error>

namespace parafetch {

namespace fs = std::filesystem;

namespace {

// Decorator over a plain output stream: writes, then reports the bytes of that one write.
class CountingWriter {
public:
    CountingWriter(std::ostream& out, IProgressSink* sink, std::int64_t total)
        : out_(out), sink_(sink), total_(total) {}

    Expected<void> write(std::span<const std::byte> data) {
        if (data.empty())
            return {};
        out_.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!out_) {
            return Error{ErrorCode::IoError, "write to chunk file failed"};
        }
        written_ += static_cast<std::int64_t>(data.size());
        if (sink_) {
            sink_->send(ProgressReport{total_, static_cast<std::int64_t>(data.size())});
        }
        return {};
    }

    [[nodiscard]] std::int64_t written() const noexcept { return written_; }

private:
    std::ostream& out_;
    IProgressSink* sink_;
    std::int64_t total_;
    std::int64_t written_{0};
};

Expected<void> truncateAndReopen(std::ofstream& out, const fs::path& path) {
    out.close();
    std::error_code ec;
    fs::resize_file(path, 0, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "failed to truncate " + path.string() + ": " +
                                             ec.message()};
    }
    out.open(path, std::ios::binary | std::ios::app);
    if (!out) {
        return Error{ErrorCode::IoError, "failed to reopen " + path.string()};
    }
    return {};
}

} // namespace

Expected<ChunkOutcome> fetchChunk(IHttpAdapter& http, const ChunkRequest& request,
                                  IProgressSink* progress) {
    const auto& range = request.range;
    const auto& path = request.tempPath;

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "failed to create " + path.parent_path().string() +
                                                 ": " + ec.message()};
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) {
        return Error{ErrorCode::IoError, "failed to open chunk file " + path.string()};
    }

    const auto onDisk = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "failed to stat " + path.string() + ": " + ec.message()};
    }
    auto present = static_cast<std::int64_t>(onDisk);
    const std::int64_t width = range.width();

    ChunkOutcome outcome;

    if (range.bounded() && present == width) {
        spdlog::debug("Chunk {} already complete ({} bytes); skipping", range.index, present);
        if (present > 0 && progress) {
            progress->send(ProgressReport{request.total, present});
        }
        outcome.resumedBytes = present;
        return outcome;
    }

    if (range.bounded() && present > width) {
        spdlog::warn("Chunk {} holds {} bytes but the range is {} bytes; starting over",
                     range.index, present, width);
        auto tr = truncateAndReopen(out, path);
        if (!tr.ok())
            return tr.error();
        present = 0;
    }

    if (present > 0 && !request.resumable) {
        spdlog::warn("Server does not accept ranges; discarding {} partial bytes of chunk {}",
                     present, range.index);
        auto tr = truncateAndReopen(out, path);
        if (!tr.ok())
            return tr.error();
        present = 0;
    }

    if (present > 0) {
        spdlog::info("Resuming chunk {} at offset {} ({} bytes on disk)", range.index,
                     range.start + present, present);
        if (progress) {
            progress->send(ProgressReport{request.total, present});
        }
        outcome.resumedBytes = present;
    }

    const auto offset = static_cast<std::uint64_t>(range.start + present);
    const std::int64_t remaining = range.bounded() ? width - present : -1;
    const auto size = remaining > 0 ? static_cast<std::uint64_t>(remaining) : 0;

    CountingWriter writer(out, progress, request.total);
    std::int64_t discarded = 0;

    auto sink = [&](std::span<const std::byte> data) -> Expected<void> {
        auto slice = data;
        if (remaining >= 0) {
            const auto room = remaining - writer.written();
            if (room <= 0) {
                discarded += static_cast<std::int64_t>(data.size());
                return {};
            }
            if (static_cast<std::int64_t>(slice.size()) > room) {
                discarded += static_cast<std::int64_t>(slice.size()) - room;
                slice = slice.first(static_cast<std::size_t>(room));
            }
        }
        return writer.write(slice);
    };

    outcome.networkUsed = true;
    auto fr = http.fetchRange(request.url, offset, size, request.options, sink);

    out.flush();
    if (!out) {
        return Error{ErrorCode::IoError, "failed to flush chunk file " + path.string()};
    }
    outcome.fetchedBytes = writer.written();

    if (!fr.ok()) {
        spdlog::debug("Chunk {} failed after {} new bytes: {}", range.index, writer.written(),
                      fr.error().message);
        return fr.error();
    }
    if (discarded > 0) {
        spdlog::warn("Chunk {}: dropped {} bytes beyond the requested range", range.index,
                     discarded);
    }
    if (remaining >= 0 && writer.written() < remaining) {
        return Error{ErrorCode::UpstreamError,
                     "short body for chunk " + std::to_string(range.index) + ": got " +
                         std::to_string(writer.written()) + " of " + std::to_string(remaining) +
                         " bytes"};
    }

    spdlog::debug("Chunk {} done ({} resumed, {} fetched)", range.index, outcome.resumedBytes,
                  outcome.fetchedBytes);
    return outcome;
}

} // namespace parafetch
