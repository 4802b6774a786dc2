#include <parafetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>

namespace parafetch::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        if (in_target_section) {
            size_t eq = line.find('=');
            if (eq != std::string::npos) {
                std::string k = line.substr(0, eq);
                std::string v = line.substr(eq + 1);

                trim(k);
                trim(v);

                // Inline comments only outside of quotes
                if (v.empty() || (v.front() != '"' && v.front() != '\'')) {
                    size_t comment = v.find('#');
                    if (comment != std::string::npos) {
                        v = v.substr(0, comment);
                        trim(v);
                    }
                }

                if (k == key || k == section + "." + key) {
                    return unquote(v);
                }
            }
        }
    }

    return "";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return std::filesystem::path(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome && *xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "parafetch" / "config.toml";
    }

    return configHome / "parafetch" / "config.toml";
}

std::filesystem::path default_cache_root() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "parafetch";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".cache" / "parafetch";
    }
    return std::filesystem::temp_directory_path() / "parafetch-cache";
}

Expected<IntegritySpec> parse_checksum(std::string_view value) {
    auto pos = value.find(':');
    if (pos == std::string_view::npos || pos == 0 || pos + 1 >= value.size()) {
        return Error{ErrorCode::InvalidConfiguration,
                     "checksum must be '<algo>:<hex>', got '" + std::string(value) + "'"};
    }
    IntegritySpec spec;
    spec.algorithm = std::string(value.substr(0, pos));
    spec.expectedHex = std::string(value.substr(pos + 1));
    return spec;
}

namespace {

template <typename Int> bool parse_int(std::string_view s, Int& out) {
    Int tmp{};
    auto res = std::from_chars(s.data(), s.data() + s.size(), tmp);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size())
        return false;
    out = tmp;
    return true;
}

// Applies one key/value pair (file or environment) to cfg.
Expected<void> apply_setting(FetcherConfig& cfg, const std::string& key, const std::string& raw,
                             std::string_view origin) {
    if (raw.empty())
        return {};

    auto invalid = [&](std::string_view what) {
        return Error{ErrorCode::InvalidConfiguration,
                     std::string(origin) + ": invalid " + std::string(what) + " '" + raw + "'"};
    };

    if (key == "dest_dir") {
        cfg.destDir = expand_tilde(raw);
    } else if (key == "concurrency") {
        if (!parse_int(raw, cfg.concurrency))
            return invalid("concurrency");
    } else if (key == "etag") {
        cfg.trackChangeTokens = parse_bool(raw, cfg.trackChangeTokens);
    } else if (key == "token_revalidation") {
        if (raw == "always") {
            cfg.tokenRevalidation = TokenRevalidation::Always;
        } else if (raw == "trust-cached") {
            cfg.tokenRevalidation = TokenRevalidation::TrustCached;
        } else {
            return invalid("token_revalidation");
        }
    } else if (key == "timeout_ms") {
        long long ms = 0;
        if (!parse_int(raw, ms) || ms < 0)
            return invalid("timeout_ms");
        cfg.timeout = std::chrono::milliseconds(ms);
    } else if (key == "checksum") {
        auto spec = parse_checksum(raw);
        if (!spec.ok())
            return spec.error();
        cfg.integrity = spec.value();
    } else if (key == "cache_dir") {
        cfg.cacheRoot = expand_tilde(raw);
    } else if (key == "min_parallel_bytes") {
        if (!parse_int(raw, cfg.minParallelBytes) || cfg.minParallelBytes < 0)
            return invalid("min_parallel_bytes");
    } else if (key == "follow_redirects") {
        cfg.followRedirects = parse_bool(raw, cfg.followRedirects);
    } else if (key == "insecure") {
        cfg.tls.insecure = parse_bool(raw, cfg.tls.insecure);
    } else if (key == "ca_path") {
        cfg.tls.caPath = expand_tilde(raw).string();
    } else if (key == "proxy") {
        cfg.proxy = raw;
    }
    return {};
}

constexpr const char* kKeys[] = {"dest_dir",         "concurrency", "etag",
                                 "token_revalidation", "timeout_ms", "checksum",
                                 "cache_dir",        "min_parallel_bytes", "follow_redirects",
                                 "insecure",         "ca_path",     "proxy"};

std::string env_name_for(std::string_view key) {
    std::string name("PARAFETCH_");
    for (char c : key)
        name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return name;
}

} // namespace

Expected<FetcherConfig> load_fetcher_config(const std::filesystem::path& config_path) {
    FetcherConfig cfg;

    std::error_code ec;
    const bool haveFile = !config_path.empty() && std::filesystem::exists(config_path, ec);
    if (haveFile) {
        spdlog::debug("Loading fetch configuration from {}", config_path.string());
        for (const char* key : kKeys) {
            auto r = apply_setting(cfg, key, parse_config_value(config_path, "fetch", key),
                                   config_path.string());
            if (!r.ok())
                return r.error();
        }
    }

    // Environment wins over the file
    for (const char* key : kKeys) {
        const auto name = env_name_for(key);
        if (const char* env = std::getenv(name.c_str()); env && *env) {
            auto r = apply_setting(cfg, key, env, name);
            if (!r.ok())
                return r.error();
        }
    }

    if (cfg.cacheRoot.empty())
        cfg.cacheRoot = default_cache_root();
    return cfg;
}

} // namespace parafetch::config
