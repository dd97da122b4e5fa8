#include <pgtemp/process/command.h>
#include <pgtemp/temp_db/provisioner.h>

#include <spdlog/spdlog.h>

namespace pgtemp {

bool Provisioner::createSuperuser(const std::string& user) const {
    auto rc = process::runCommand(
        channel_.command({tools_.createuser, "-h", channel_.socketPath, user, "-s"}), showOutput_);
    if (!rc || rc.value() != 0) {
        // Usually "role already exists"
        spdlog::debug("Provisioner: createuser {} failed, continuing", user);
        return false;
    }
    return true;
}

Result<void> Provisioner::createDatabases(const std::vector<std::string>& databases) const {
    bool ok = true;
    for (const auto& db : databases) {
        auto rc = process::runCommand(channel_.command({tools_.psql, "-d", "postgres", "-h",
                                                        channel_.socketPath, "-c",
                                                        "create database " + db + ";"}),
                                      showOutput_);
        if (!rc || rc.value() != 0) {
            spdlog::debug("Provisioner: create database {} failed", db);
            ok = false;
        }
    }
    if (!ok) {
        return Error{ErrorCode::ProcessFailed, "Couldn't create databases"};
    }
    return {};
}

} // namespace pgtemp
