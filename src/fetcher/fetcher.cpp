/*
 * parafetch/src/fetcher/fetcher.cpp
 *
 * Fetcher (orchestrator):
 *   PREFLIGHT -> (CACHE_HIT | PLANNING) -> DOWNLOADING -> ASSEMBLING -> (VERIFYING) -> DONE
 * - HEAD preflight for length, range support and change token
 * - Optional change-token cache short-circuit
 * - Single stream into <dest>.part (renamed on completion) when the transfer cannot or should
 *   not be split; otherwise one std::async worker per planned range into <dest>.chunks/<i>
 * - Every worker is joined before success or failure is decided; range failures are
 *   aggregated into one PartialTransferError
 * - The progress sink is closed exactly once per fetch, on every exit path
 */

#include <parafetch/config/config_helpers.h>
#include <parafetch/fetcher/fetcher.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace parafetch {

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string resourceNameForUrl(std::string_view url) {
    auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos)
        url = url.substr(0, cut);
    while (!url.empty() && url.back() == '/')
        url.remove_suffix(1);
    auto slash = url.rfind('/');
    auto name = slash == std::string_view::npos ? url : url.substr(slash + 1);
    if (name.empty() || name == "." || name == "..")
        return "index";
    return std::string(name);
}

namespace {

enum class FetchState { Preflight, CacheHit, Planning, Downloading, Assembling, Verifying, Done };

const char* stateName(FetchState s) {
    switch (s) {
        case FetchState::Preflight:
            return "PREFLIGHT";
        case FetchState::CacheHit:
            return "CACHE_HIT";
        case FetchState::Planning:
            return "PLANNING";
        case FetchState::Downloading:
            return "DOWNLOADING";
        case FetchState::Assembling:
            return "ASSEMBLING";
        case FetchState::Verifying:
            return "VERIFYING";
        case FetchState::Done:
            return "DONE";
    }
    return "?";
}

struct RangeResult {
    std::size_t index{0};
    Expected<ChunkOutcome> result;
};

Expected<FetchedFile> openExisting(const fs::path& path, bool fromCache) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "cannot stat " + path.string() + ": " + ec.message()};
    }
    FetchedFile file;
    file.path = path;
    file.sizeBytes = size;
    file.fromCache = fromCache;
    file.stream = std::make_unique<std::fstream>(path, std::ios::in | std::ios::binary);
    if (!*file.stream) {
        return Error{ErrorCode::IoError, "cannot open " + path.string()};
    }
    return std::move(file);
}

constexpr const char* kPlanFile = "plan.json";

// Partial data is only resumed against the plan that produced it. Without a recorded plan
// it is trusted only when the server sends no ETag to tell versions apart.
bool planMatches(const fs::path& planPath, const json& current) {
    std::error_code ec;
    if (!fs::exists(planPath, ec))
        return current.value("etag", std::string{}).empty();

    json prior;
    try {
        std::ifstream in(planPath);
        in >> prior;
    } catch (const json::exception& ex) {
        spdlog::debug("Unreadable plan {}: {}", planPath.string(), ex.what());
        return false;
    }
    return prior == current;
}

Expected<void> writePlan(const fs::path& planPath, const json& current) {
    std::ofstream out(planPath, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "cannot write " + planPath.string()};
    }
    out << current.dump(2);
    return {};
}

Expected<void> reconcileChunkDir(const fs::path& chunkDir, const ContentMetadata& meta,
                                 std::size_t rangeCount) {
    const auto planPath = chunkDir / kPlanFile;
    const json current = {{"total_bytes", meta.totalLength},
                          {"ranges", rangeCount},
                          {"etag", meta.changeToken}};

    if (!planMatches(planPath, current)) {
        std::error_code ec;
        if (!fs::is_empty(chunkDir, ec))
            spdlog::info("Chunk plan changed; discarding partial chunks in {}", chunkDir.string());
        fs::remove_all(chunkDir, ec);
        fs::create_directories(chunkDir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "cannot recreate " + chunkDir.string() + ": " + ec.message()};
        }
    }
    return writePlan(planPath, current);
}

// <dest>.part is resumed only when <dest>.part.json describes the same length and ETag.
Expected<void> reconcilePartFile(const fs::path& partPath, const fs::path& planPath,
                                 const ContentMetadata& meta) {
    const json current = {{"total_bytes", meta.totalLength}, {"etag", meta.changeToken}};

    std::error_code ec;
    if (fs::exists(partPath, ec) && !planMatches(planPath, current)) {
        spdlog::info("Resource changed; discarding partial file {}", partPath.string());
        fs::remove(partPath, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "cannot remove " + partPath.string() + ": " + ec.message()};
        }
    }
    return writePlan(planPath, current);
}

// Leftovers of the strategy a successful download did not use.
void removeStaleLeftovers(const std::vector<fs::path>& paths) {
    for (const auto& p : paths) {
        std::error_code ec;
        if (fs::remove_all(p, ec) > 0)
            spdlog::debug("Removed leftover {}", p.string());
        if (ec)
            spdlog::warn("Cannot remove leftover {}: {}", p.string(), ec.message());
    }
}

Error aggregate(std::vector<RangeError> failures, std::size_t rangeCount) {
    Error err;
    err.code = ErrorCode::PartialTransferError;
    err.message = std::to_string(failures.size()) + " of " + std::to_string(rangeCount) +
                  " ranges failed:";
    for (const auto& f : failures) {
        err.message += " [" + std::to_string(f.index) + "] " + errorCodeName(f.code) + ": " +
                       f.message + ";";
    }
    err.ranges = std::move(failures);
    return err;
}

class Fetcher final : public IFetcher {
public:
    Fetcher(FetcherConfig cfg, std::optional<HashAlgo> verifyAlgo,
            std::unique_ptr<IHttpAdapter> http)
        : config_(std::move(cfg)), http_(std::move(http)),
          cache_(config_.cacheRoot, config_.trackChangeTokens), verifyAlgo_(verifyAlgo) {
        options_.headers = config_.headers;
        options_.timeout = config_.timeout;
        options_.tls = config_.tls;
        options_.proxy = config_.proxy;
        options_.followRedirects = config_.followRedirects;
    }

    Expected<FetchedFile> fetch(std::string_view url, IProgressSink* progress) override {
        // Closed exactly once, after every worker below has been joined.
        struct SinkCloser {
            IProgressSink* sink;
            ~SinkCloser() {
                if (sink)
                    sink->close();
            }
        } closer{progress};

        if (url.empty()) {
            return Error{ErrorCode::InvalidConfiguration, "URL is required"};
        }

        const std::string urlStr(url);
        const std::string name = resourceNameForUrl(url);
        const fs::path destination = config_.destDir / name;

        std::error_code ec;
        if (config_.tokenRevalidation == TokenRevalidation::TrustCached &&
            cache_.hasAnyEntry(name) && fs::is_regular_file(destination, ec)) {
            transition(name, FetchState::CacheHit);
            spdlog::info("Using cached {} without revalidation", destination.string());
            return openExisting(destination, true);
        }

        transition(name, FetchState::Preflight);
        auto probed = http_->probe(urlStr, options_);
        if (!probed.ok()) {
            return probed.error();
        }
        const ContentMetadata meta = probed.value();

        if (cache_.shouldSkip(name, meta.changeToken, destination, meta.totalLength)) {
            transition(name, FetchState::CacheHit);
            spdlog::info("{} unchanged (ETag {}); skipping download", destination.string(),
                         meta.changeToken);
            return openExisting(destination, true);
        }

        transition(name, FetchState::Planning);
        int concurrency = config_.concurrency;
        if (concurrency > 1) {
            if (!meta.acceptsRanges) {
                spdlog::debug("Server does not accept byte ranges; using a single stream");
                concurrency = 1;
            } else if (meta.totalLength >= 0 && meta.totalLength < config_.minParallelBytes) {
                spdlog::debug("{} bytes is below the split threshold; using a single stream",
                              meta.totalLength);
                concurrency = 1;
            }
        }
        auto planned = planRanges(meta.totalLength, concurrency);
        if (!planned.ok()) {
            return planned.error();
        }
        const auto& ranges = planned.value();

        fs::create_directories(config_.destDir, ec);
        if (ec) {
            return Error{ErrorCode::IoError, "cannot create destination directory " +
                                                 config_.destDir.string() + ": " + ec.message()};
        }

        transition(name, FetchState::Downloading);
        const fs::path partPath = destination.string() + ".part";
        const fs::path partPlanPath = destination.string() + ".part.json";
        const fs::path chunkDir = config_.destDir / (name + ".chunks");
        const bool single = ranges.size() == 1;
        auto downloaded =
            single ? downloadSingle(urlStr, destination, partPath, partPlanPath, ranges.front(),
                                    meta, progress)
                   : downloadParallel(urlStr, name, chunkDir, destination, ranges, meta, progress);
        if (!downloaded.ok()) {
            return downloaded.error();
        }
        FetchedFile file = std::move(downloaded).value();
        if (single)
            removeStaleLeftovers({chunkDir});
        else
            removeStaleLeftovers({partPath, partPlanPath});

        if (verifyAlgo_) {
            transition(name, FetchState::Verifying);
            auto verified =
                verifyStream(*file.stream, config_.integrity->algorithm,
                             config_.integrity->expectedHex);
            if (!verified.ok()) {
                Error err = verified.error();
                err.message = "failed verifying file integrity; content of " +
                              file.path.string() + " is untrusted: " + err.message;
                spdlog::warn("{}", err.message);
                return err;
            }
            file.stream->clear();
            file.stream->seekg(0, std::ios::beg);
        }

        if (auto rec = cache_.record(name, meta.changeToken); !rec.ok()) {
            spdlog::warn("Failed to record change token for {}: {}", name, rec.error().message);
        }

        transition(name, FetchState::Done);
        spdlog::info("Fetched {} ({} bytes)", file.path.string(), file.sizeBytes);
        return std::move(file);
    }

    [[nodiscard]] const FetcherConfig& config() const override { return config_; }

private:
    static void transition(const std::string& name, FetchState next) {
        spdlog::debug("[{}] -> {}", name, stateName(next));
    }

    Expected<FetchedFile> downloadSingle(const std::string& url, const fs::path& destination,
                                         const fs::path& partPath, const fs::path& planPath,
                                         const ByteRange& range, const ContentMetadata& meta,
                                         IProgressSink* progress) {
        if (auto rec = reconcilePartFile(partPath, planPath, meta); !rec.ok()) {
            return rec.error();
        }

        ChunkRequest req;
        req.url = url;
        req.tempPath = partPath;
        req.range = range;
        req.total = meta.totalLength;
        req.resumable = meta.acceptsRanges;
        req.options = options_;

        auto r = fetchChunk(*http_, req, progress);
        if (!r.ok()) {
            const auto& e = r.error();
            return aggregate({RangeError{range.index, e.code, e.message}}, 1);
        }

        std::error_code ec;
        fs::rename(req.tempPath, destination, ec);
        if (ec) {
            return Error{ErrorCode::IoError, "cannot move " + req.tempPath.string() + " to " +
                                                 destination.string() + ": " + ec.message()};
        }
        fs::remove(planPath, ec);
        return openExisting(destination, false);
    }

    Expected<FetchedFile> downloadParallel(const std::string& url, const std::string& name,
                                           const fs::path& chunkDir, const fs::path& destination,
                                           const std::vector<ByteRange>& ranges,
                                           const ContentMetadata& meta, IProgressSink* progress) {
        std::error_code ec;
        fs::create_directories(chunkDir, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "cannot create chunk directory " + chunkDir.string() + ": " + ec.message()};
        }
        if (auto rec = reconcileChunkDir(chunkDir, meta, ranges.size()); !rec.ok()) {
            return rec.error();
        }

        std::vector<RangeError> failures;
        std::vector<std::future<RangeResult>> workers;
        workers.reserve(ranges.size());

        for (const auto& range : ranges) {
            ChunkRequest req;
            req.url = url;
            req.tempPath = chunkDir / std::to_string(range.index);
            req.range = range;
            req.total = meta.totalLength;
            req.resumable = meta.acceptsRanges;
            req.options = options_;

            try {
                workers.push_back(std::async(
                    std::launch::async, [this, req = std::move(req), progress]() -> RangeResult {
                        try {
                            return RangeResult{req.range.index, fetchChunk(*http_, req, progress)};
                        } catch (const std::exception& ex) {
                            return RangeResult{req.range.index,
                                               Error{ErrorCode::IoError, ex.what()}};
                        }
                    }));
            } catch (const std::system_error& ex) {
                failures.push_back(RangeError{range.index, ErrorCode::Unknown,
                                              std::string("cannot start worker: ") + ex.what()});
            }
        }

        spdlog::debug("[{}] {} range workers running", name, workers.size());
        for (auto& w : workers) {
            RangeResult rr = w.get();
            if (!rr.result.ok()) {
                const auto& e = rr.result.error();
                failures.push_back(RangeError{rr.index, e.code, e.message});
            }
        }

        if (!failures.empty()) {
            std::sort(failures.begin(), failures.end(),
                      [](const RangeError& a, const RangeError& b) { return a.index < b.index; });
            auto err = aggregate(std::move(failures), ranges.size());
            spdlog::warn("{}", err.message);
            return err;
        }

        transition(name, FetchState::Assembling);
        return assembleChunks(destination, chunkDir, ranges.size());
    }

    FetcherConfig config_;
    std::unique_ptr<IHttpAdapter> http_;
    ChangeTokenCache cache_;
    std::optional<HashAlgo> verifyAlgo_;
    RequestOptions options_;
};

} // namespace

Expected<std::unique_ptr<IFetcher>> makeFetcher(const FetcherConfig& cfg,
                                                std::unique_ptr<IHttpAdapter> http) {
    if (cfg.concurrency < 1) {
        return Error{ErrorCode::InvalidConfiguration,
                     "concurrency must be >= 1, got " + std::to_string(cfg.concurrency)};
    }
    if (cfg.minParallelBytes < 0) {
        return Error{ErrorCode::InvalidConfiguration, "minParallelBytes must be >= 0"};
    }
    if (cfg.timeout.count() < 0) {
        return Error{ErrorCode::InvalidConfiguration, "timeout must be >= 0"};
    }

    std::optional<HashAlgo> algo;
    if (cfg.integrity) {
        auto parsed = parseHashAlgo(cfg.integrity->algorithm);
        if (!parsed.ok()) {
            return parsed.error();
        }
        if (cfg.integrity->expectedHex.empty()) {
            return Error{ErrorCode::InvalidConfiguration, "expected checksum is empty"};
        }
        algo = parsed.value();
    }

    FetcherConfig effective = cfg;
    if (effective.destDir.empty())
        effective.destDir = ".";
    if (effective.cacheRoot.empty())
        effective.cacheRoot = parafetch::config::default_cache_root();
    if (!http)
        http = makeCurlHttpAdapter();

    std::unique_ptr<IFetcher> fetcher =
        std::make_unique<Fetcher>(std::move(effective), algo, std::move(http));
    return fetcher;
}

} // namespace parafetch
