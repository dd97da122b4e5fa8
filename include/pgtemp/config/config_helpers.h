#pragma once

#include <pgtemp/core/types.h>
#include <pgtemp/temp_db/options.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pgtemp::config {

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
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// section -> key -> raw (unquoted) value; keys before any header go to ""
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// Parse a TOML-style file: [section] headers, key = value, # comments
Result<ConfigSections> parse_config_file(const std::filesystem::path& config_path);

// Parse "a,b" or ["a", "b"] into trimmed, unquoted, non-empty items
std::vector<std::string> parse_list(const std::string& raw);

// Split "key=value"; the key must be non-empty
Result<std::pair<std::string, std::string>> parse_key_value(std::string_view raw);

/// Config file path: override, else $PGTEMP_CONFIG, else
/// $XDG_CONFIG_HOME/pgtemp/config.toml, else ~/.config/pgtemp/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/**
 * @brief Overlay settings from a config file onto @p options
 *
 * Sections: [pgtemp] (verbosity, retry, retry_interval_ms, databases,
 * base_dir, socket_dir, image, run_as, container_runtime), [tools] (initdb,
 * postgres, psql, createuser) and [server] (every key is a server option).
 * A missing file is not an error.
 */
Result<void> applyConfigFile(const std::filesystem::path& path, TempDbOptions& options);

// Defaults overlaid with @p path
Result<TempDbOptions> loadOptions(const std::filesystem::path& path);

/**
 * @brief Overlay PGTEMP_* environment variables onto @p options
 *
 * PGTEMP_VERBOSITY, PGTEMP_RETRY, PGTEMP_RETRY_INTERVAL_MS, PGTEMP_IMAGE,
 * PGTEMP_BASE_DIR, PGTEMP_SOCKET_DIR, PGTEMP_RUN_AS, PGTEMP_CONTAINER_RUNTIME,
 * PGTEMP_INITDB, PGTEMP_POSTGRES, PGTEMP_PSQL, PGTEMP_CREATEUSER
 */
Result<void> applyEnvironment(TempDbOptions& options);

} // namespace pgtemp::config
