/*
 * parafetch/src/fetcher/change_token_cache.cpp
 *
 * Change-token markers on disk:
 *   <root>/<resource>/<token>   (empty file)
 * A marker only says "a download of this token completed". The local file size is checked
 * against the server length on top of it before a download is skipped.
 */

#include <parafetch/fetcher/fetcher.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace parafetch {

namespace fs = std::filesystem;

namespace {

// Tokens and resource names become single path components.
std::string sanitizeComponent(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.')
            out.push_back(static_cast<char>(c));
        else
            out.push_back('_');
    }
    if (out.empty() || out == "." || out == "..")
        out.insert(0, "_");
    return out;
}

} // namespace

ChangeTokenCache::ChangeTokenCache(fs::path root, bool enabled)
    : root_(std::move(root)), enabled_(enabled) {}

fs::path ChangeTokenCache::markerPath(std::string_view resourceKey, std::string_view token) const {
    return root_ / sanitizeComponent(resourceKey) / sanitizeComponent(token);
}

bool ChangeTokenCache::shouldSkip(std::string_view resourceKey, std::string_view token,
                                  const fs::path& localFile, std::int64_t expectedLength) const {
    if (!enabled_ || token.empty())
        return false;

    std::error_code ec;
    if (!fs::exists(markerPath(resourceKey, token), ec))
        return false;

    const auto size = fs::file_size(localFile, ec);
    if (ec) {
        spdlog::debug("Change token '{}' is cached but {} is unavailable: {}", token,
                      localFile.string(), ec.message());
        return false;
    }
    if (expectedLength < 0 || static_cast<std::int64_t>(size) != expectedLength) {
        spdlog::info("Change token '{}' is cached but local size {} != server length {}", token,
                     size, expectedLength);
        return false;
    }
    return true;
}

Expected<void> ChangeTokenCache::record(std::string_view resourceKey, std::string_view token) {
    if (!enabled_ || token.empty())
        return {};

    const auto marker = markerPath(resourceKey, token);
    std::error_code ec;
    fs::create_directories(marker.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "failed to create cache directory " +
                                             marker.parent_path().string() + ": " + ec.message()};
    }
    fs::permissions(marker.parent_path(), fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) {
        spdlog::debug("Failed to set permissions for dir {}: {}", marker.parent_path().string(),
                      ec.message());
    }

    std::ofstream touch(marker, std::ios::binary | std::ios::app);
    if (!touch) {
        return Error{ErrorCode::IoError, "failed to create marker " + marker.string()};
    }
    spdlog::debug("Recorded change token '{}' for {}", token, resourceKey);
    return {};
}

bool ChangeTokenCache::hasAnyEntry(std::string_view resourceKey) const {
    if (!enabled_)
        return false;
    std::error_code ec;
    fs::directory_iterator it(root_ / sanitizeComponent(resourceKey), ec);
    if (ec)
        return false;
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec))
            return true;
    }
    return false;
}

} // namespace parafetch
