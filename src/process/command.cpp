#include <pgtemp/process/child_process.h>
#include <pgtemp/process/command.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include <unistd.h>

namespace pgtemp::process {

namespace fs = std::filesystem;

namespace {

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

// Characters the shell never needs quoted
bool is_shell_safe(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           std::string_view{"@%+=:,./-_"}.find(c) != std::string_view::npos;
}

} // namespace

Result<int> runCommand(const std::vector<std::string>& argv, bool inheritOutput) {
    if (argv.empty()) {
        return Error{ErrorCode::InvalidArgument, "runCommand: empty command"};
    }
    try {
        ChildProcess child{ProcessConfig{.argv = argv, .env = {}, .inherit_output = inheritOutput}};
        int rc = child.wait();
        spdlog::debug("runCommand: {} exited with {}", argv.front(), rc);
        return rc;
    } catch (const std::exception& e) {
        return Error{ErrorCode::ProcessFailed, e.what()};
    }
}

std::optional<fs::path> findExecutable(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string_view::npos) {
        fs::path candidate{name};
        if (is_executable_file(candidate))
            return candidate;
        return std::nullopt;
    }

    const char* env = std::getenv("PATH");
    std::string path = (env && *env) ? env : "/usr/local/bin:/usr/bin:/bin";

    std::istringstream stream(path);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty())
            dir = ".";
        auto candidate = fs::path(dir) / name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::string shellQuote(std::string_view word) {
    if (word.empty()) {
        return "''";
    }
    if (std::all_of(word.begin(), word.end(), is_shell_safe)) {
        return std::string(word);
    }
    std::string out = "'";
    for (char c : word) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

std::string joinCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty())
            out.push_back(' ');
        out += shellQuote(arg);
    }
    return out;
}

} // namespace pgtemp::process
