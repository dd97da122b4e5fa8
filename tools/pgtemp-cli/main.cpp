#include <pgtemp/config/config_helpers.h>
#include <pgtemp/process/child_process.h>
#include <pgtemp/process/signals.h>
#include <pgtemp/temp_db/temp_db.h>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

namespace {

// While a command runs, the terminal delivers SIGINT to it directly; we only
// need to survive it. SIGTERM is passed on.
int run_command(const pgtemp::TempDb& db, const std::vector<std::string>& command) {
    pgtemp::process::ProcessConfig config{.argv = command};
    config.with_env("PGHOST", db.socketDir().string()).with_output(true);
    config.inherit_input = true;
    config.own_group = false; // stay in the terminal's foreground group

    pgtemp::process::ChildProcess child{std::move(config)};
    pgtemp::process::forwardTerminationTo(child.pid());
    int rc = child.wait();
    pgtemp::process::forwardTerminationTo(0);

    if (rc == 127) {
        spdlog::error("Could not run '{}'", command.front());
    }
    return rc;
}

int wait_for_signal(const pgtemp::TempDb& db) {
    std::cout << db.connectionHint() << std::endl;
    int signo = pgtemp::process::waitForShutdown();
    spdlog::info("Received signal {}, shutting down", signo);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    CLI::App app{"pgtemp - run a throwaway PostgreSQL server"};

    std::vector<std::string> databases;
    int retry = 0;
    int intervalMs = 0;
    std::string image;
    std::string baseDir;
    std::string socketDir;
    std::vector<std::string> serverOptions;
    std::string runAs;
    std::string configPath;
    int verbose = 0;
    bool quiet = false;
    std::vector<std::string> command;

    app.add_option("-d,--database", databases, "Database to create (repeatable)");
    auto* retryOpt = app.add_option("-r,--retry", retry, "Readiness probe attempts");
    auto* intervalOpt =
        app.add_option("-i,--interval-ms", intervalMs, "Milliseconds to wait before each probe");
    auto* imageOpt = app.add_option("--image", image, "Run the server in this container image");
    auto* baseDirOpt =
        app.add_option("--base-dir", baseDir, "Use this directory instead of a temp directory");
    auto* socketDirOpt = app.add_option("--socket-dir", socketDir, "Use this socket directory");
    app.add_option("-o,--option", serverOptions, "Server setting key=value (repeatable)");
    auto* runAsOpt = app.add_option("--run-as", runAs, "Account to run the server as");
    app.add_option("--config", configPath, "Configuration file path");
    app.add_flag("-v,--verbose", verbose, "Increase verbosity (repeatable)");
    app.add_flag("-q,--quiet", quiet, "Suppress progress output");
    app.add_option("command", command, "Command to run with PGHOST set (after --)");

    CLI11_PARSE(app, argc, argv);

    auto loaded = pgtemp::config::loadOptions(pgtemp::config::get_config_path(configPath));
    if (!loaded) {
        spdlog::error("{}", loaded.error().message);
        return 2;
    }
    pgtemp::TempDbOptions options = std::move(loaded).value();
    if (auto r = pgtemp::config::applyEnvironment(options); !r) {
        spdlog::error("{}", r.error().message);
        return 2;
    }

    if (!databases.empty())
        options.databases = databases;
    if (retryOpt->count() > 0)
        options.retry = retry;
    if (intervalOpt->count() > 0)
        options.retryInterval = pgtemp::Duration(intervalMs);
    if (imageOpt->count() > 0)
        options.containerImage = image;
    if (baseDirOpt->count() > 0)
        options.baseDir = baseDir;
    if (socketDirOpt->count() > 0)
        options.socketDir = socketDir;
    if (runAsOpt->count() > 0)
        options.runAs = runAs;
    for (const auto& raw : serverOptions) {
        auto kv = pgtemp::config::parse_key_value(raw);
        if (!kv) {
            spdlog::error("{}", kv.error().message);
            return 2;
        }
        options.serverOptions[kv.value().first] = kv.value().second;
    }
    if (quiet) {
        options.verbosity = 0;
        spdlog::set_level(spdlog::level::warn);
    }
    options.verbosity += verbose;
    if (options.verbosity >= 3) {
        spdlog::set_level(spdlog::level::debug);
    }

    // Installed before setup so an interrupt during it still ends in cleanup
    pgtemp::process::installShutdownHandlers();

    try {
        pgtemp::TempDb db{std::move(options)};
        if (int signo = pgtemp::process::shutdownSignal(); signo != 0) {
            spdlog::info("Received signal {} during setup, shutting down", signo);
            db.cleanup();
            return 128 + signo;
        }
        int rc = command.empty() ? wait_for_signal(db) : run_command(db, command);
        db.cleanup();
        return rc;
    } catch (const pgtemp::SetupError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
