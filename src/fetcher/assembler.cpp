/*
 * parafetch/src/fetcher/assembler.cpp
 *
 * Joins chunk files into the destination file:
 * - chunks are appended strictly in index order, whatever order they finished in
 * - a missing or unreadable chunk is fatal (AssemblyError)
 * - the chunk directory is removed only after the destination was fully written
 */

#include <parafetch/fetcher/fetcher.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>

namespace parafetch {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kCopyBufferBytes = 256 * 1024;

Expected<std::uint64_t> appendFile(std::ofstream& out, const fs::path& chunk,
                                   std::array<char, kCopyBufferBytes>& buf) {
    std::ifstream in(chunk, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::AssemblyError, "cannot open chunk " + chunk.string()};
    }
    std::uint64_t copied = 0;
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = in.gcount();
        if (got <= 0)
            break;
        out.write(buf.data(), got);
        if (!out) {
            return Error{ErrorCode::IoError, "write failed while appending " + chunk.string()};
        }
        copied += static_cast<std::uint64_t>(got);
    }
    if (in.bad()) {
        return Error{ErrorCode::AssemblyError, "read failed on chunk " + chunk.string()};
    }
    return copied;
}

} // namespace

Expected<FetchedFile> assembleChunks(const fs::path& destination, const fs::path& chunkDir,
                                     std::size_t rangeCount) {
    std::error_code ec;
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
    }

    // Check every chunk up front so a missing one leaves the destination untouched.
    for (std::size_t i = 0; i < rangeCount; ++i) {
        const auto chunk = chunkDir / std::to_string(i);
        if (!fs::is_regular_file(chunk, ec)) {
            return Error{ErrorCode::AssemblyError, "missing chunk " + chunk.string()};
        }
    }

    std::uint64_t total = 0;
    {
        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "cannot create " + destination.string()};
        }

        auto buf = std::make_unique<std::array<char, kCopyBufferBytes>>();
        for (std::size_t i = 0; i < rangeCount; ++i) {
            auto r = appendFile(out, chunkDir / std::to_string(i), *buf);
            if (!r.ok())
                return r.error();
            total += r.value();
        }
        out.flush();
        if (!out) {
            return Error{ErrorCode::IoError, "flush failed for " + destination.string()};
        }
    }

    fs::remove_all(chunkDir, ec);
    if (ec) {
        spdlog::warn("Failed to remove chunk directory {}: {}", chunkDir.string(), ec.message());
    }

    FetchedFile file;
    file.path = destination;
    file.sizeBytes = total;
    file.stream = std::make_unique<std::fstream>(destination, std::ios::in | std::ios::binary);
    if (!*file.stream) {
        return Error{ErrorCode::IoError, "cannot reopen " + destination.string()};
    }
    file.stream->seekg(0, std::ios::beg);

    spdlog::debug("Assembled {} chunks into {} ({} bytes)", rangeCount, destination.string(),
                  total);
    return std::move(file);
}

} // namespace parafetch
