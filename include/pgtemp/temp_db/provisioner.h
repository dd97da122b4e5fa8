#pragma once

#include <pgtemp/core/types.h>
#include <pgtemp/temp_db/options.h>
#include <pgtemp/temp_db/server_launcher.h>

#include <string>
#include <vector>

namespace pgtemp {

/**
 * @brief Creates the caller's role and the requested databases
 *
 * Database names are interpolated into `create database <name>;` verbatim;
 * callers must not pass untrusted names.
 */
class Provisioner {
public:
    Provisioner(const ClientChannel& channel, const ToolPaths& tools, bool showOutput)
        : channel_(channel), tools_(tools), showOutput_(showOutput) {}

    /**
     * @brief `createuser -h <socket> <user> -s`
     *
     * A failure is tolerated: most often the role already exists. Other causes
     * (permissions, connectivity) are not told apart.
     *
     * @return Whether the command succeeded
     */
    bool createSuperuser(const std::string& user) const;

    /**
     * @brief Create each database in order
     *
     * Every name is attempted even after a failure; any failure fails the batch.
     */
    Result<void> createDatabases(const std::vector<std::string>& databases) const;

private:
    const ClientChannel& channel_;
    const ToolPaths& tools_;
    bool showOutput_;
};

} // namespace pgtemp
