#include <pgtemp/process/command.h>
#include <pgtemp/temp_db/provisioner.h>
#include <pgtemp/temp_db/readiness_prober.h>
#include <pgtemp/temp_db/temp_db.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>

namespace pgtemp {

namespace fs = std::filesystem;

TempDb::TempDb(TempDbOptions options)
    : options_(std::move(options)), verbosity_(options_.verbosity) {
    try {
        setup();
    } catch (...) {
        cleanup();
        throw;
    }
}

TempDb::~TempDb() {
    cleanup();
}

void TempDb::setup() {
    auto privileges = privilege::resolvePrivileges(options_.runAs);
    if (!privileges) {
        throw SetupError(privileges.error().message);
    }
    privileges_ = std::move(privileges).value();

    verbosity_.progress("Creating temp PG server...");

    {
        privilege::ScopedPrivilegeDrop drop{privileges_.target};
        if (auto r = allocateWorkspace(options_.baseDir, options_.socketDir, workspace_); !r) {
            throw SetupError("Couldn't create temp PG directories: " + r.error().message);
        }
    }
    if (std::error_code ec;
        workspace_.socketDirSupplied && !fs::is_directory(workspace_.socketDir, ec)) {
        verbosity_.warn("Socket directory " + workspace_.socketDir.string() + " does not exist");
    }

    ServerLauncher launcher{options_, privileges_, verbosity_};
    auto mode = launcher.selectMode();
    if (!mode) {
        throw SetupError(mode.error().message);
    }
    mode_ = mode.value();

    if (auto r = launcher.launch(mode_, workspace_, server_); !r) {
        throw SetupError(r.error().message);
    }

    // Container mode: tools run inside the container, by their plain names, and see
    // the container-side socket path until setup is done
    const auto channel = clientChannel(server_, workspace_, privileges_);
    const ToolPaths clientTools = mode_ == ExecutionMode::Container ? ToolPaths{} : options_.tools;
    const bool showOutput = verbosity_.showToolOutput();

    ReadinessProber prober{options_.retry, options_.retryInterval, showOutput};
    if (auto ready = prober.waitReady(channel, clientTools.psql); !ready) {
        throw SetupError(ready.error().message);
    }

    Provisioner provisioner{channel, clientTools, showOutput};
    (void)provisioner.createSuperuser(privileges_.invokingUser);
    if (auto r = provisioner.createDatabases(options_.databases); !r) {
        throw SetupError(r.error().message);
    }

    verbosity_.progress("done");
    verbosity_.progress("(Connect on: `" + connectionHint() + "`)");
}

void TempDb::cleanup() noexcept {
    std::lock_guard lock{mutex_};

    teardown(server_);

    if (workspace_.ownedBaseDir) {
        std::error_code ec;
        fs::remove_all(*workspace_.ownedBaseDir, ec);
        if (ec) {
            spdlog::debug("TempDb: removing {} failed: {}", workspace_.ownedBaseDir->string(),
                          ec.message());
        }
        workspace_.ownedBaseDir.reset();
    }
}

std::optional<fs::path> TempDb::tempDir() const {
    std::lock_guard lock{mutex_};
    return workspace_.ownedBaseDir;
}

std::optional<pid_t> TempDb::serverPid() const {
    std::lock_guard lock{mutex_};
    if (const auto* direct = std::get_if<DirectServer>(&server_); direct && direct->process) {
        return direct->process->pid();
    }
    return std::nullopt;
}

std::optional<std::string> TempDb::containerId() const {
    std::lock_guard lock{mutex_};
    if (const auto* container = std::get_if<ContainerServer>(&server_)) {
        return container->id;
    }
    return std::nullopt;
}

std::string TempDb::connectionHint() const {
    return "psql -h " + process::shellQuote(workspace_.socketDir.string());
}

// ============================================================================
// Process-wide instance
// ============================================================================

namespace {

std::mutex& globalMutex() {
    static std::mutex m;
    return m;
}

// Never destroyed; the at-exit hook may run after static destructors
std::unique_ptr<TempDb>* globalSlot() {
    static auto* slot = new std::unique_ptr<TempDb>();
    return slot;
}

bool g_atexitRegistered = false;

} // namespace

TempDb& initTempDb(TempDbOptions options) {
    std::lock_guard lock{globalMutex()};
    auto* slot = globalSlot();
    if (!*slot) {
        *slot = std::make_unique<TempDb>(std::move(options));
        if (!g_atexitRegistered) {
            std::atexit(cleanupTempDb);
            g_atexitRegistered = true;
        }
    }
    return **slot;
}

void cleanupTempDb() noexcept {
    TempDb* db = nullptr;
    {
        std::lock_guard lock{globalMutex()};
        db = globalSlot()->get();
    }
    if (db) {
        db->cleanup();
    }
}

TempDb* currentTempDb() noexcept {
    std::lock_guard lock{globalMutex()};
    return globalSlot()->get();
}

} // namespace pgtemp
