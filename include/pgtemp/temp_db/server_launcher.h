#pragma once

#include <pgtemp/core/types.h>
#include <pgtemp/privilege/privilege.h>
#include <pgtemp/process/child_process.h>
#include <pgtemp/temp_db/options.h>
#include <pgtemp/temp_db/workspace.h>

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pgtemp {

enum class ExecutionMode { Direct, Container };

constexpr const char* executionModeName(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Direct: return "direct";
        case ExecutionMode::Container: return "container";
    }
    return "unknown";
}

// Image used when no local installation exists and none was requested
inline constexpr const char* kFallbackImage = "postgres";
// Where the image's server creates its socket
inline constexpr const char* kContainerSocketDir = "/var/run/postgresql";

// Server running as our own child process
struct DirectServer {
    std::unique_ptr<process::ChildProcess> process;
};

// Server running inside a detached container
struct ContainerServer {
    std::string runtime;
    std::string id;
};

using ServerHandle = std::variant<std::monostate, DirectServer, ContainerServer>;

/**
 * @brief How client tools reach a launched server
 *
 * In container mode the tools run inside the container and see the socket at
 * kContainerSocketDir rather than at the host directory that is mounted there.
 */
struct ClientChannel {
    std::string socketPath;
    std::function<std::vector<std::string>(std::vector<std::string>)> wrap;

    [[nodiscard]] std::vector<std::string> command(std::vector<std::string> argv) const {
        return wrap ? wrap(std::move(argv)) : argv;
    }
};

/**
 * @brief Starts the server in direct or container mode
 *
 * All direct/container branching lives here and in teardown().
 */
class ServerLauncher {
public:
    ServerLauncher(const TempDbOptions& options, const privilege::Privileges& privileges,
                   const Verbosity& verbosity);

    /**
     * @brief Pick an execution mode
     *
     * Direct when a local installation is found and no image was requested;
     * otherwise container when the runtime is available; otherwise an error.
     */
    Result<ExecutionMode> selectMode() const;

    /**
     * @brief Launch the server; @p handle is filled as soon as there is
     * something to tear down, even when launch() later fails
     */
    Result<void> launch(ExecutionMode mode, const Workspace& workspace, ServerHandle& handle) const;

    // Image launch() uses in container mode
    [[nodiscard]] std::string containerImage() const;

    [[nodiscard]] bool hasLocalInstall() const;
    [[nodiscard]] bool hasContainerRuntime() const;

    // `-c key=value` pairs for the configured server options
    [[nodiscard]] std::vector<std::string> serverOptionArgs() const;

private:
    Result<void> launchDirect(const Workspace& workspace, ServerHandle& handle) const;
    Result<void> launchContainer(const Workspace& workspace, ServerHandle& handle) const;

    const TempDbOptions& options_;
    const privilege::Privileges& privileges_;
    const Verbosity& verbosity_;
};

/**
 * @brief Client channel for the server behind @p handle
 */
ClientChannel clientChannel(const ServerHandle& handle, const Workspace& workspace,
                            const privilege::Privileges& privileges);

/**
 * @brief Stop whatever @p handle refers to and reset it to empty
 *
 * Containers are force-removed with output suppressed; a direct server is
 * killed and reaped. Never throws.
 */
void teardown(ServerHandle& handle) noexcept;

} // namespace pgtemp
