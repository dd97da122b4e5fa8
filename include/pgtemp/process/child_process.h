#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

namespace pgtemp::process {

/**
 * @brief Lifecycle state of a spawned child
 */
enum class ProcessState : uint8_t {
    Running,   ///< Spawned and not yet reaped
    Terminated ///< Exited (or killed) and reaped
};

/**
 * @brief Configuration for spawning an external command
 *
 * Example:
 * @code
 * ProcessConfig config{.argv = {"postgres", "-D", dataDir}};
 * config.with_env("PGTZ", "UTC").with_output(true);
 * @endcode
 */
struct ProcessConfig {
    std::vector<std::string> argv;                    ///< argv[0] is resolved through PATH
    std::unordered_map<std::string, std::string> env; ///< Added to the inherited environment
    bool inherit_output{false}; ///< Inherit stdout/stderr instead of /dev/null
    bool inherit_input{false};  ///< Inherit stdin instead of /dev/null
    bool own_group{true};       ///< Run in a new process group (see ChildProcess::kill)

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& with_output(bool inherit) {
        inherit_output = inherit;
        return *this;
    }
};

/**
 * @brief RAII handle for an external child process
 *
 * By default the child is placed in its own process group so that kill() also
 * reaches any grandchildren it started (a `su` wrapper shell, a forking
 * server), and its stdin is /dev/null.
 *
 * The destructor kills and reaps a child that is still running.
 */
class ChildProcess {
public:
    /**
     * @brief Spawn the configured command
     * @throws std::runtime_error if argv is empty or fork() fails
     *
     * A command that cannot be executed is reported as exit code 127, the same
     * way a shell reports it.
     */
    explicit ChildProcess(ProcessConfig config);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    [[nodiscard]] ProcessState state() const noexcept { return state_; }

    /**
     * @brief Poll (non-blocking) whether the child is still running
     */
    [[nodiscard]] bool is_alive() noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /**
     * @brief Block until the child exits
     * @return Exit status, or 128 + signal number if it was killed
     */
    int wait() noexcept;

    /**
     * @brief Wait up to @p timeout for the child to exit
     * @return true if the child exited within the timeout
     */
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout) noexcept;

    /**
     * @brief SIGKILL the child's process group and reap it
     *
     * No-op when the child has already been reaped.
     */
    void kill() noexcept;

    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }

    [[nodiscard]] const std::vector<std::string>& argv() const noexcept { return argv_; }

private:
    void spawn(const ProcessConfig& config);
    void record_status(int status) noexcept;
    void release() noexcept;

    std::vector<std::string> argv_;
    pid_t pid_{-1};
    ProcessState state_{ProcessState::Terminated};
    std::optional<int> exit_code_;
    bool own_group_{true};
};

} // namespace pgtemp::process
