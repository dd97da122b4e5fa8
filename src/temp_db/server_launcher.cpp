#include <pgtemp/core/scope_guard.h>
#include <pgtemp/process/command.h>
#include <pgtemp/temp_db/server_launcher.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>

#include <stdlib.h>

namespace pgtemp {

namespace fs = std::filesystem;

namespace {

// The runtime refuses to overwrite an existing cidfile, so the marker lives in
// a fresh directory and is only named, not created, here.
Result<fs::path> makeMarkerDir() {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    std::string pattern = (tmp / "pg_tmp_cid_XXXXXX").string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        return Error{ErrorCode::PermissionDenied,
                     "mkdtemp(" + pattern + "): " + std::strerror(errno)};
    }
    return fs::path(pattern);
}

std::string readMarker(const fs::path& marker) {
    std::ifstream in(marker);
    std::string id;
    std::getline(in, id);
    while (!id.empty() && (id.back() == '\n' || id.back() == '\r' || id.back() == ' ')) {
        id.pop_back();
    }
    return id;
}

} // namespace

ServerLauncher::ServerLauncher(const TempDbOptions& options,
                               const privilege::Privileges& privileges,
                               const Verbosity& verbosity)
    : options_(options), privileges_(privileges), verbosity_(verbosity) {}

bool ServerLauncher::hasLocalInstall() const {
    return process::findExecutable(options_.tools.initdb).has_value() &&
           process::findExecutable(options_.tools.postgres).has_value();
}

bool ServerLauncher::hasContainerRuntime() const {
    return process::findExecutable(options_.containerRuntime).has_value();
}

std::string ServerLauncher::containerImage() const {
    return options_.containerImage.value_or(kFallbackImage);
}

std::vector<std::string> ServerLauncher::serverOptionArgs() const {
    std::vector<std::string> args;
    for (const auto& [key, value] : options_.serverOptions) {
        args.emplace_back("-c");
        args.push_back(key + "=" + value);
    }
    return args;
}

Result<ExecutionMode> ServerLauncher::selectMode() const {
    if (!options_.containerImage && hasLocalInstall()) {
        return ExecutionMode::Direct;
    }
    if (hasContainerRuntime()) {
        if (!options_.containerImage) {
            verbosity_.warn("No local PostgreSQL installation found; falling back to " +
                            options_.containerRuntime + " image " + containerImage());
        }
        return ExecutionMode::Container;
    }
    if (options_.containerImage) {
        return Error{ErrorCode::NotFound,
                     "Container image requested but " + options_.containerRuntime +
                         " was not found"};
    }
    return Error{ErrorCode::NotFound,
                 "No local PostgreSQL installation and no container runtime found"};
}

Result<void> ServerLauncher::launch(ExecutionMode mode, const Workspace& workspace,
                                    ServerHandle& handle) const {
    spdlog::debug("ServerLauncher: launching in {} mode", executionModeName(mode));
    switch (mode) {
        case ExecutionMode::Direct: return launchDirect(workspace, handle);
        case ExecutionMode::Container: return launchContainer(workspace, handle);
    }
    return Error{ErrorCode::InvalidArgument, "Unknown execution mode"};
}

Result<void> ServerLauncher::launchDirect(const Workspace& workspace,
                                          ServerHandle& handle) const {
    const bool showOutput = verbosity_.showToolOutput();

    auto initdb = process::runCommand(
        privileges_.wrap({options_.tools.initdb, workspace.dataDir.string()}), showOutput);
    if (!initdb || initdb.value() != 0) {
        if (!initdb) {
            spdlog::debug("initdb could not be run: {}", initdb.error().message);
        }
        return Error{ErrorCode::ProcessFailed, "Couldn't initialize temp PG data dir"};
    }

    // -F: no fsync, -h '': no TCP listener, the socket directory is the only address
    std::vector<std::string> cmd{options_.tools.postgres,
                                 "-F",
                                 "-T",
                                 "-D",
                                 workspace.dataDir.string(),
                                 "-k",
                                 workspace.socketDir.string(),
                                 "-h",
                                 ""};
    auto extra = serverOptionArgs();
    cmd.insert(cmd.end(), extra.begin(), extra.end());

    verbosity_.progress("Running " + process::joinCommand(cmd));

    try {
        auto child = std::make_unique<process::ChildProcess>(
            process::ProcessConfig{.argv = privileges_.wrap(cmd), .env = {},
                                   .inherit_output = showOutput});
        spdlog::debug("ServerLauncher: server pid={}", child->pid());
        handle = DirectServer{std::move(child)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::ProcessFailed, std::string("Couldn't start PG server: ") + e.what()};
    }
    return {};
}

Result<void> ServerLauncher::launchContainer(const Workspace& workspace,
                                             ServerHandle& handle) const {
    auto markerDir = makeMarkerDir();
    if (!markerDir) {
        return markerDir.error();
    }
    const auto marker = markerDir.value() / "container.id";
    auto removeMarker = scope_exit([&] {
        std::error_code ec;
        fs::remove_all(markerDir.value(), ec);
    });

    std::vector<std::string> cmd{options_.containerRuntime,
                                 "run",
                                 "-d",
                                 "--cidfile",
                                 marker.string(),
                                 "-e",
                                 "POSTGRES_HOST_AUTH_METHOD=trust",
                                 "-v",
                                 workspace.socketDir.string() + ":" + kContainerSocketDir,
                                 containerImage()};
    auto extra = serverOptionArgs();
    cmd.insert(cmd.end(), extra.begin(), extra.end());

    verbosity_.progress("Running " + process::joinCommand(cmd));

    auto rc = process::runCommand(cmd, verbosity_.showToolOutput());
    std::string id = readMarker(marker);

    // A container may exist even when the runtime reported failure
    if (!id.empty()) {
        handle = ContainerServer{options_.containerRuntime, id};
        spdlog::debug("ServerLauncher: container id={}", id);
    }
    if (!rc || rc.value() != 0 || id.empty()) {
        return Error{ErrorCode::ProcessFailed, "Couldn't start PG container"};
    }
    return {};
}

ClientChannel clientChannel(const ServerHandle& handle, const Workspace& workspace,
                            const privilege::Privileges& privileges) {
    if (const auto* container = std::get_if<ContainerServer>(&handle)) {
        return ClientChannel{
            kContainerSocketDir,
            [runtime = container->runtime, id = container->id](std::vector<std::string> argv) {
                std::vector<std::string> cmd{runtime, "exec", "-u", privilege::kServiceAccount,
                                             id};
                cmd.insert(cmd.end(), argv.begin(), argv.end());
                return cmd;
            }};
    }
    return ClientChannel{workspace.socketDir.string(),
                         [privileges](std::vector<std::string> argv) {
                             return privileges.wrap(std::move(argv));
                         }};
}

void teardown(ServerHandle& handle) noexcept {
    if (auto* container = std::get_if<ContainerServer>(&handle)) {
        try {
            auto rc = process::runCommand({container->runtime, "rm", "-f", container->id}, false);
            if (!rc || rc.value() != 0) {
                spdlog::debug("teardown: removing container {} failed", container->id);
            }
        } catch (const std::exception& e) {
            spdlog::debug("teardown: removing container {} failed: {}", container->id, e.what());
        }
    } else if (auto* direct = std::get_if<DirectServer>(&handle)) {
        if (direct->process) {
            direct->process->kill();
        }
    }
    handle = std::monostate{};
}

} // namespace pgtemp
