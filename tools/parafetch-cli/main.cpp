#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <future>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <parafetch/config/config_helpers.h>
#include <parafetch/fetcher/fetcher.hpp>
#include <parafetch/fetcher/progress_channel.hpp>

using json = nlohmann::json;

namespace {

std::string format_bytes(std::int64_t bytes) {
    static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    std::size_t u = 0;
    while (v >= 1024.0 && u + 1 < std::size(kUnits)) {
        v /= 1024.0;
        ++u;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), u == 0 ? "%.0f %s" : "%.1f %s", v, kUnits[u]);
    return buf;
}

// Consumes the channel until the fetcher closes it. Redraws at most once per percent.
std::int64_t render_progress(parafetch::ProgressChannel& channel, bool draw) {
    std::int64_t done = 0;
    int lastPct = -1;
    std::int64_t lastDrawn = 0;
    while (auto report = channel.receive()) {
        done += report->writtenBytes;
        if (!draw)
            continue;
        if (report->total > 0) {
            const int pct = static_cast<int>(
                std::min<std::int64_t>(100, done * 100 / report->total));
            if (pct == lastPct)
                continue;
            lastPct = pct;
            std::cerr << "\r  " << pct << "%  " << format_bytes(done) << " / "
                      << format_bytes(report->total) << std::flush;
        } else if (done - lastDrawn >= 1024 * 1024) {
            lastDrawn = done;
            std::cerr << "\r  " << format_bytes(done) << std::flush;
        }
    }
    if (draw && done > 0)
        std::cerr << "\n";
    return done;
}

json error_to_json(const parafetch::Error& err) {
    json j;
    j["code"] = parafetch::errorCodeName(err.code);
    j["message"] = err.message;
    if (err.httpStatus)
        j["http_status"] = *err.httpStatus;
    if (!err.ranges.empty()) {
        j["ranges"] = json::array();
        for (const auto& r : err.ranges) {
            j["ranges"].push_back(
                {{"index", r.index}, {"code", parafetch::errorCodeName(r.code)},
                 {"message", r.message}});
        }
    }
    return j;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"parafetch - chunked, resumable HTTP downloads"};

        std::string url;
        std::string destDir;
        std::string configPath;
        std::string checksum;
        std::optional<int> concurrency;
        std::optional<long long> timeoutMs;
        std::vector<std::string> headers;
        bool etag{false};
        bool trustCached{false};
        bool jsonOutput{false};
        bool verbose{false};
        bool quiet{false};

        app.add_option("url", url, "Resource URL.")->required();
        app.add_option("-d,--dest", destDir, "Destination directory (default: current directory).");
        app.add_option("-c,--concurrency", concurrency, "Parallel range requests (default 1).")
            ->check(CLI::Range(1, 256));
        app.add_flag("--etag", etag, "Skip the download when the server ETag is unchanged.");
        app.add_flag("--trust-cached", trustCached,
                     "With --etag: reuse a cached download without asking the server.");
        app.add_option("--timeout", timeoutMs, "Per-request timeout in ms (0 = none).")
            ->check(CLI::NonNegativeNumber);
        app.add_option("--checksum", checksum, "Expected checksum '<algo>:<hex>'.");
        app.add_option("-H,--header", headers, "Extra request header 'Name: value' (repeatable).");
        app.add_option("--config", configPath, "Config file (default: XDG config path).");
        app.add_flag("--json", jsonOutput, "Print the result as JSON on stdout.");
        auto* verboseFlag = app.add_flag("-v,--verbose", verbose, "Debug logging.");
        app.add_flag("-q,--quiet", quiet, "Errors only, no progress.")->excludes(verboseFlag);

        CLI11_PARSE(app, argc, argv);

        if (verbose)
            spdlog::set_level(spdlog::level::debug);
        else if (quiet)
            spdlog::set_level(spdlog::level::err);

        auto loaded = parafetch::config::load_fetcher_config(
            parafetch::config::get_config_path(configPath));
        if (!loaded.ok()) {
            spdlog::error("{}", loaded.error().message);
            return 2;
        }
        parafetch::FetcherConfig cfg = loaded.value();
        if (!destDir.empty())
            cfg.destDir = parafetch::config::expand_tilde(destDir);
        if (concurrency)
            cfg.concurrency = *concurrency;
        if (etag)
            cfg.trackChangeTokens = true;
        if (trustCached)
            cfg.tokenRevalidation = parafetch::TokenRevalidation::TrustCached;
        if (timeoutMs)
            cfg.timeout = std::chrono::milliseconds(*timeoutMs);
        if (!checksum.empty()) {
            auto spec = parafetch::config::parse_checksum(checksum);
            if (!spec.ok()) {
                spdlog::error("{}", spec.error().message);
                return 2;
            }
            cfg.integrity = spec.value();
        }
        for (const auto& h : headers) {
            auto pos = h.find(':');
            if (pos == std::string::npos || pos == 0) {
                spdlog::warn("Ignoring header without 'Name: value' form: {}", h);
                continue;
            }
            std::string name = h.substr(0, pos);
            std::string value = h.substr(pos + 1);
            parafetch::config::trim(name);
            parafetch::config::trim(value);
            cfg.headers.push_back({name, value});
        }

        auto made = parafetch::makeFetcher(cfg);
        if (!made.ok()) {
            spdlog::error("{}", made.error().message);
            return 2;
        }
        auto fetcher = std::move(made).value();

        parafetch::ProgressChannel progress;
        auto pending = std::async(std::launch::async,
                                  [&] { return fetcher->fetch(url, &progress); });
        const auto reported = render_progress(progress, !quiet && !jsonOutput);
        auto result = pending.get();

        if (!result.ok()) {
            const auto& err = result.error();
            if (jsonOutput) {
                json j;
                j["success"] = false;
                j["url"] = url;
                j["error"] = error_to_json(err);
                std::cout << j.dump(2) << std::endl;
            } else {
                spdlog::error("{}: {}", parafetch::errorCodeName(err.code), err.message);
            }
            return 1;
        }

        const auto& file = result.value();
        if (jsonOutput) {
            json j;
            j["success"] = true;
            j["url"] = url;
            j["path"] = file.path.string();
            j["size_bytes"] = file.sizeBytes;
            j["from_cache"] = file.fromCache;
            j["reported_bytes"] = reported;
            if (cfg.integrity)
                j["checksum"] = cfg.integrity->algorithm + ":" + cfg.integrity->expectedHex;
            std::cout << j.dump(2) << std::endl;
        } else if (!quiet) {
            std::cout << (file.fromCache ? "Up to date: " : "Downloaded: ") << file.path.string()
                      << " (" << format_bytes(static_cast<std::int64_t>(file.sizeBytes)) << ")"
                      << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
