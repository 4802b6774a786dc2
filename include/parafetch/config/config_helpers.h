#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>

#include <parafetch/fetcher/fetcher.hpp>

namespace parafetch::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

inline bool parse_bool(std::string_view s, bool fallback) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return fallback;
}

// Parse a value from a TOML-style config file. Returns "" when absent.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

/// Returns the user config file
/// $XDG_CONFIG_HOME/parafetch/config.toml or ~/.config/parafetch/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the change-token cache root
/// $XDG_CACHE_HOME/parafetch or ~/.cache/parafetch
std::filesystem::path default_cache_root();

/**
 * Splits "algo:hex" into an IntegritySpec. Fails with InvalidConfiguration when the
 * separator or either half is missing.
 */
Expected<IntegritySpec> parse_checksum(std::string_view value);

/**
 * Reads the [fetch] section of config_path (missing file = defaults), then applies the
 * PARAFETCH_* environment overrides.
 */
Expected<FetcherConfig> load_fetcher_config(const std::filesystem::path& config_path);

} // namespace parafetch::config
