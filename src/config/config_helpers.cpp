#include <pgtemp/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>

namespace pgtemp::config {

namespace fs = std::filesystem;

namespace {

Result<int> parse_int(std::string_view key, const std::string& raw) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{} || ptr != raw.data() + raw.size() || value < 0) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid value for " + std::string(key) + ": '" + raw + "'"};
    }
    return value;
}

const char* env_value(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

Result<ConfigSections> parse_config_file(const fs::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + config_path.string()};
    }

    ConfigSections sections;
    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        }

        // Arrays stay raw for parse_list()
        sections[currentSection][unquote(k)] = (!v.empty() && v.front() == '[') ? v : unquote(v);
    }
    return sections;
}

std::vector<std::string> parse_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        std::string item = s.substr(start, comma == std::string::npos ? std::string::npos
                                                                      : comma - start);
        item = unquote(item);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

Result<std::pair<std::string, std::string>> parse_key_value(std::string_view raw) {
    auto eq = raw.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return Error{ErrorCode::InvalidArgument,
                     "Expected key=value, got '" + std::string(raw) + "'"};
    }
    std::string key(raw.substr(0, eq));
    trim(key);
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Expected key=value, got '" + std::string(raw) + "'"};
    }
    return std::make_pair(std::move(key), std::string(raw.substr(eq + 1)));
}

fs::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = env_value("PGTEMP_CONFIG")) {
        return expand_tilde(env);
    }
    if (const char* xdg = env_value("XDG_CONFIG_HOME")) {
        return fs::path(xdg) / "pgtemp" / "config.toml";
    }
    if (const char* home = env_value("HOME")) {
        return fs::path(home) / ".config" / "pgtemp" / "config.toml";
    }
    return fs::path("~/.config") / "pgtemp" / "config.toml";
}

Result<void> applyConfigFile(const fs::path& path, TempDbOptions& options) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return {};
    }
    auto parsed = parse_config_file(path);
    if (!parsed) {
        return parsed.error();
    }
    const auto& sections = parsed.value();
    spdlog::debug("Loading config from {}", path.string());

    if (auto it = sections.find("pgtemp"); it != sections.end()) {
        for (const auto& [key, value] : it->second) {
            if (key == "verbosity" || key == "retry" || key == "retry_interval_ms") {
                auto n = parse_int(key, value);
                if (!n) {
                    return n.error();
                }
                if (key == "verbosity")
                    options.verbosity = n.value();
                else if (key == "retry")
                    options.retry = n.value();
                else
                    options.retryInterval = Duration(n.value());
            } else if (key == "databases") {
                options.databases = parse_list(value);
            } else if (key == "base_dir") {
                options.baseDir = expand_tilde(value);
            } else if (key == "socket_dir") {
                options.socketDir = expand_tilde(value);
            } else if (key == "image") {
                options.containerImage = value;
            } else if (key == "run_as") {
                options.runAs = value;
            } else if (key == "container_runtime") {
                options.containerRuntime = value;
            } else {
                spdlog::debug("Ignoring unknown config key pgtemp.{}", key);
            }
        }
    }

    if (auto it = sections.find("tools"); it != sections.end()) {
        for (const auto& [key, value] : it->second) {
            if (key == "initdb")
                options.tools.initdb = expand_tilde(value).string();
            else if (key == "postgres")
                options.tools.postgres = expand_tilde(value).string();
            else if (key == "psql")
                options.tools.psql = expand_tilde(value).string();
            else if (key == "createuser")
                options.tools.createuser = expand_tilde(value).string();
        }
    }

    if (auto it = sections.find("server"); it != sections.end()) {
        for (const auto& [key, value] : it->second) {
            options.serverOptions[key] = value;
        }
    }
    return {};
}

Result<TempDbOptions> loadOptions(const fs::path& path) {
    TempDbOptions options;
    if (auto r = applyConfigFile(path, options); !r) {
        return r.error();
    }
    return options;
}

Result<void> applyEnvironment(TempDbOptions& options) {
    struct IntSetting {
        const char* name;
        int* target;
    };
    int intervalMs = static_cast<int>(options.retryInterval.count());
    for (auto [name, target] : {IntSetting{"PGTEMP_VERBOSITY", &options.verbosity},
                                IntSetting{"PGTEMP_RETRY", &options.retry},
                                IntSetting{"PGTEMP_RETRY_INTERVAL_MS", &intervalMs}}) {
        if (const char* v = env_value(name)) {
            auto n = parse_int(name, v);
            if (!n) {
                return n.error();
            }
            *target = n.value();
        }
    }
    options.retryInterval = Duration(intervalMs);

    if (const char* v = env_value("PGTEMP_IMAGE"))
        options.containerImage = v;
    if (const char* v = env_value("PGTEMP_BASE_DIR"))
        options.baseDir = expand_tilde(v);
    if (const char* v = env_value("PGTEMP_SOCKET_DIR"))
        options.socketDir = expand_tilde(v);
    if (const char* v = env_value("PGTEMP_RUN_AS"))
        options.runAs = v;
    if (const char* v = env_value("PGTEMP_CONTAINER_RUNTIME"))
        options.containerRuntime = v;
    if (const char* v = env_value("PGTEMP_INITDB"))
        options.tools.initdb = v;
    if (const char* v = env_value("PGTEMP_POSTGRES"))
        options.tools.postgres = v;
    if (const char* v = env_value("PGTEMP_PSQL"))
        options.tools.psql = v;
    if (const char* v = env_value("PGTEMP_CREATEUSER"))
        options.tools.createuser = v;
    return {};
}

} // namespace pgtemp::config
