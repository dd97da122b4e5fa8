#include <pgtemp/core/setup_error.h>
#include <pgtemp/privilege/privilege.h>
#include <pgtemp/process/command.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <pwd.h>
#include <unistd.h>

namespace pgtemp::privilege {

std::vector<std::string> Privileges::wrap(std::vector<std::string> argv) const {
    if (!target) {
        return argv;
    }
    return {"su", "-", target->name, "-c", process::joinCommand(argv)};
}

std::optional<Account> lookupAccount(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    struct passwd pwd {};
    struct passwd* result = nullptr;
    std::vector<char> buf(16384);
    if (::getpwnam_r(name.c_str(), &pwd, buf.data(), buf.size(), &result) != 0 || !result) {
        return std::nullopt;
    }
    return Account{result->pw_name, result->pw_uid, result->pw_gid};
}

std::string currentUserName() {
    uid_t euid = ::geteuid();
    struct passwd pwd {};
    struct passwd* result = nullptr;
    std::vector<char> buf(16384);
    if (::getpwuid_r(euid, &pwd, buf.data(), buf.size(), &result) == 0 && result) {
        return result->pw_name;
    }
    // No passwd entry (common in containers); fall back to the environment
    if (const char* user = std::getenv("USER"); user && *user) {
        return user;
    }
    return std::to_string(euid);
}

Result<Privileges> resolvePrivileges(const std::optional<std::string>& runAs) {
    Privileges privileges;
    privileges.invokingUser = currentUserName();

    if (runAs && !runAs->empty()) {
        auto account = lookupAccount(*runAs);
        if (!account) {
            return Error{ErrorCode::NotFound, "Unknown account: " + *runAs};
        }
        if (account->uid != ::geteuid()) {
            privileges.target = std::move(account);
        }
        return privileges;
    }

    if (::geteuid() == 0) {
        auto account = lookupAccount(kServiceAccount);
        if (!account) {
            return Error{ErrorCode::PermissionDenied,
                         "Can't create DB server as root, and there's no postgres user!"};
        }
        privileges.target = std::move(account);
    }
    return privileges;
}

ScopedPrivilegeDrop::ScopedPrivilegeDrop(const std::optional<Account>& target) {
    if (!target) {
        return;
    }
    savedUid_ = ::geteuid();
    savedGid_ = ::getegid();

    // Group first: once the uid is dropped we may no longer change the gid
    if (::setegid(target->gid) != 0) {
        throw SetupError("Couldn't switch to group of " + target->name + ": " +
                         std::strerror(errno));
    }
    if (::seteuid(target->uid) != 0) {
        int err = errno;
        (void)::setegid(savedGid_);
        throw SetupError("Couldn't switch to account " + target->name + ": " +
                         std::strerror(err));
    }
    active_ = true;
    spdlog::debug("ScopedPrivilegeDrop: running as {} (uid={}, gid={})", target->name,
                  target->uid, target->gid);
}

ScopedPrivilegeDrop::~ScopedPrivilegeDrop() {
    if (!active_) {
        return;
    }
    if (::seteuid(savedUid_) != 0 || ::setegid(savedGid_) != 0) {
        spdlog::error("ScopedPrivilegeDrop: failed to restore uid={} gid={}: {}", savedUid_,
                      savedGid_, std::strerror(errno));
    }
}

} // namespace pgtemp::privilege
