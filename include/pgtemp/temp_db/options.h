#pragma once

#include <pgtemp/core/types.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pgtemp {

// Names (or paths) of the external PostgreSQL tools
struct ToolPaths {
    std::string initdb{"initdb"};
    std::string postgres{"postgres"};
    std::string psql{"psql"};
    std::string createuser{"createuser"};
};

struct TempDbOptions {
    std::vector<std::string> databases; // Created after the server is ready
    int verbosity = 1;                  // 0 = silent, 1 = progress, 2+ = tool output too
    int retry = 5;                      // Readiness probe attempts
    Duration retryInterval{1000};       // Sleep before each probe attempt
    ToolPaths tools;
    std::string containerRuntime{"docker"};
    std::optional<std::string> containerImage;      // Set = force container mode
    std::optional<std::filesystem::path> baseDir;   // Caller-owned; never removed
    std::optional<std::filesystem::path> socketDir; // Caller-owned; used as-is
    std::map<std::string, std::string> serverOptions; // Passed as `-c key=value`
    std::optional<std::string> runAs;                 // Explicit server account
};

/**
 * @brief Per-instance verbosity gate
 *
 * Several TempDb instances with different verbosity can share one process, so
 * gating happens here rather than through the global spdlog level.
 */
class Verbosity {
public:
    explicit Verbosity(int level = 1) noexcept : level_(level) {}

    [[nodiscard]] bool enabled(int level) const noexcept { return level <= level_; }

    // Subordinate tool output is shown from level 2
    [[nodiscard]] bool showToolOutput() const noexcept { return enabled(2); }

    void progress(const std::string& message, int level = 1) const;
    void warn(const std::string& message, int level = 1) const;

    [[nodiscard]] int level() const noexcept { return level_; }

private:
    int level_;
};

} // namespace pgtemp
