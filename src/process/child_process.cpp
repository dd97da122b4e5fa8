#include <pgtemp/process/child_process.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pgtemp::process {

ChildProcess::ChildProcess(ProcessConfig config) : argv_{config.argv} {
    if (argv_.empty()) {
        throw std::runtime_error("ChildProcess: empty command");
    }
    spawn(config);
}

ChildProcess::~ChildProcess() {
    kill();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : argv_{std::move(other.argv_)}, pid_{other.pid_}, state_{other.state_},
      exit_code_{other.exit_code_}, own_group_{other.own_group_} {
    other.release();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        kill();
        argv_ = std::move(other.argv_);
        pid_ = other.pid_;
        state_ = other.state_;
        exit_code_ = other.exit_code_;
        own_group_ = other.own_group_;
        other.release();
    }
    return *this;
}

void ChildProcess::spawn(const ProcessConfig& config) {
    // Everything the child touches is prepared before fork()
    std::vector<char*> argv;
    argv.reserve(argv_.size() + 1);
    for (auto& arg : argv_) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error("fork() failed: " + std::string(strerror(errno)));
    }

    if (pid == 0) {
        // Own process group, so kill() reaches whatever this command spawns
        if (config.own_group)
            (void)::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            if (!config.inherit_input) {
                (void)::dup2(devnull, STDIN_FILENO);
            }
            if (!config.inherit_output) {
                (void)::dup2(devnull, STDOUT_FILENO);
                (void)::dup2(devnull, STDERR_FILENO);
            }
            if (devnull > 2)
                ::close(devnull);
        }

        for (const auto& [key, value] : config.env) {
            ::setenv(key.c_str(), value.c_str(), 1);
        }

        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    // Parent: also set the group to close the race with an early kill()
    if (config.own_group)
        (void)::setpgid(pid, pid);

    pid_ = pid;
    own_group_ = config.own_group;
    state_ = ProcessState::Running;
    spdlog::debug("ChildProcess: spawned {} (pid={})", argv_.front(), pid_);
}

void ChildProcess::record_status(int status) noexcept {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    state_ = ProcessState::Terminated;
}

bool ChildProcess::is_alive() noexcept {
    if (state_ != ProcessState::Running) {
        return false;
    }
    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        record_status(status);
        return false;
    }
    if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere
        state_ = ProcessState::Terminated;
        return false;
    }
    return true;
}

int ChildProcess::wait() noexcept {
    if (state_ != ProcessState::Running) {
        return exit_code_.value_or(-1);
    }
    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        record_status(status);
    } else {
        state_ = ProcessState::Terminated;
    }
    return exit_code_.value_or(-1);
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) noexcept {
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout) {
        if (!is_alive()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return !is_alive();
}

void ChildProcess::kill() noexcept {
    if (state_ != ProcessState::Running || pid_ <= 0) {
        return;
    }
    spdlog::debug("ChildProcess: killing {} (pid={})", argv_.front(), pid_);

    if (!own_group_ || ::kill(-pid_, SIGKILL) != 0) {
        // Group may not exist if the child changed it; fall back to the pid
        (void)::kill(pid_, SIGKILL);
    }
    (void)wait();
}

void ChildProcess::release() noexcept {
    pid_ = -1;
    state_ = ProcessState::Terminated;
    exit_code_.reset();
}

} // namespace pgtemp::process
