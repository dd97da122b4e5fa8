#pragma once

#include <pgtemp/core/types.h>

#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace pgtemp::privilege {

// Account the server runs under when the caller is root
inline constexpr const char* kServiceAccount = "postgres";

struct Account {
    std::string name;
    uid_t uid{0};
    gid_t gid{0};
};

/**
 * @brief Outcome of privilege resolution for one TempDb
 *
 * `target` is empty when commands can run as the caller. When it is set,
 * every server-side command must be launched through wrap(): the server
 * refuses to start when its real and effective ids differ or are root, and a
 * process that must give up root cannot change both ids and get back.
 */
struct Privileges {
    std::optional<Account> target;
    std::string invokingUser; ///< Name of the caller's effective uid

    [[nodiscard]] bool needsSwitch() const noexcept { return target.has_value(); }

    /**
     * @brief Rewrite argv into `su - <account> -c '<argv>'` when a switch is needed
     */
    [[nodiscard]] std::vector<std::string> wrap(std::vector<std::string> argv) const;
};

/**
 * @brief Decide which account the server must run as
 *
 * - explicit @p runAs: that account, or an error if it does not exist
 * - caller is root: the `postgres` service account, or an error if missing
 * - otherwise: no switch
 *
 * An explicit account equal to the caller's effective uid needs no switch.
 */
Result<Privileges> resolvePrivileges(const std::optional<std::string>& runAs);

/**
 * @brief Look up an account by name
 */
std::optional<Account> lookupAccount(const std::string& name);

/**
 * @brief Name of the account owning the effective uid
 */
std::string currentUserName();

/**
 * @brief Assume the target account's effective gid then uid for one scope
 *
 * The original effective ids are restored on every exit path, uid before gid.
 * With no target this does nothing.
 *
 * @code
 * {
 *     ScopedPrivilegeDrop drop{privileges.target};
 *     fs::create_directories(dataDir);   // owned by the target account
 * }
 * @endcode
 */
class ScopedPrivilegeDrop {
public:
    /**
     * @throws pgtemp::SetupError if the effective ids cannot be changed
     */
    explicit ScopedPrivilegeDrop(const std::optional<Account>& target);
    ~ScopedPrivilegeDrop();

    ScopedPrivilegeDrop(const ScopedPrivilegeDrop&) = delete;
    ScopedPrivilegeDrop& operator=(const ScopedPrivilegeDrop&) = delete;

    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    uid_t savedUid_{0};
    gid_t savedGid_{0};
    bool active_{false};
};

} // namespace pgtemp::privilege
