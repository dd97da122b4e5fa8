#pragma once

#include <pgtemp/core/setup_error.h>
#include <pgtemp/privilege/privilege.h>
#include <pgtemp/temp_db/options.h>
#include <pgtemp/temp_db/server_launcher.h>
#include <pgtemp/temp_db/workspace.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include <sys/types.h>

namespace pgtemp {

/**
 * @brief A disposable PostgreSQL server for one test run
 *
 * Construction runs the whole setup in order: resolve the server account,
 * allocate the directories, launch the server (locally, or in a container when
 * no local installation exists), wait until it accepts connections, then create
 * the caller's superuser role and the requested databases.
 *
 * If any step fails, everything acquired so far is released and the
 * constructor throws SetupError. A constructed TempDb is connectable through
 * socketDir().
 *
 * @code
 * pgtemp::TempDb db{{.databases = {"alpha", "beta"}, .retryInterval = 100ms}};
 * connect("host=" + db.socketDir().string() + " dbname=alpha");
 * db.cleanup();
 * @endcode
 *
 * Instances are independent: each has its own directories and its own socket
 * directory as address, so several can run side by side.
 */
class TempDb {
public:
    /**
     * @throws SetupError on any setup failure (after cleanup)
     */
    explicit TempDb(TempDbOptions options = {});

    // Runs cleanup()
    ~TempDb();

    TempDb(const TempDb&) = delete;
    TempDb& operator=(const TempDb&) = delete;
    TempDb(TempDb&&) = delete;
    TempDb& operator=(TempDb&&) = delete;

    /**
     * @brief Stop the server and remove owned directories
     *
     * Idempotent and safe to call concurrently with the at-exit hook. A
     * container is force-removed; otherwise the server process is killed and
     * reaped. The temporary base directory is removed when this instance
     * created it. Errors are logged and swallowed.
     */
    void cleanup() noexcept;

    [[nodiscard]] const std::filesystem::path& socketDir() const noexcept {
        return workspace_.socketDir;
    }
    [[nodiscard]] const std::filesystem::path& dataDir() const noexcept {
        return workspace_.dataDir;
    }
    // Set only when this instance created (and will remove) the base directory
    [[nodiscard]] std::optional<std::filesystem::path> tempDir() const;

    [[nodiscard]] ExecutionMode mode() const noexcept { return mode_; }
    [[nodiscard]] std::optional<pid_t> serverPid() const;
    [[nodiscard]] std::optional<std::string> containerId() const;

    // `psql -h <socket dir>`
    [[nodiscard]] std::string connectionHint() const;

    [[nodiscard]] const TempDbOptions& options() const noexcept { return options_; }
    [[nodiscard]] const privilege::Privileges& privileges() const noexcept {
        return privileges_;
    }

private:
    void setup();

    TempDbOptions options_;
    Verbosity verbosity_;

    privilege::Privileges privileges_;
    Workspace workspace_;
    ExecutionMode mode_ = ExecutionMode::Direct;
    ServerHandle server_;

    mutable std::mutex mutex_;
};

/**
 * @brief Process-wide TempDb, created on first call
 *
 * Later calls return the same instance and ignore @p options. The first call
 * registers cleanupTempDb() to run at process exit. Not meant for call sites
 * that each expect their own server; construct TempDb directly for that.
 *
 * @throws SetupError if the first construction fails (a later call retries)
 */
TempDb& initTempDb(TempDbOptions options = {});

// Cleans up the process-wide instance, if any. Safe to call repeatedly.
void cleanupTempDb() noexcept;

// The process-wide instance, or nullptr
TempDb* currentTempDb() noexcept;

} // namespace pgtemp
