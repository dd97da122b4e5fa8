#pragma once

#include <pgtemp/core/types.h>

#include <filesystem>
#include <optional>

namespace pgtemp {

/**
 * @brief Directories a TempDb runs in
 *
 * Layout is `<base>/data` and `<base>/socket`. Only `ownedBaseDir` is ever
 * removed by cleanup; caller-supplied directories are left untouched.
 */
struct Workspace {
    std::filesystem::path dataDir;
    std::filesystem::path socketDir;
    std::optional<std::filesystem::path> ownedBaseDir;
    bool socketDirSupplied = false;
};

inline constexpr const char* kTempDirPrefix = "pg_tmp_";

/**
 * @brief Create the data and socket directories
 *
 * Without @p baseDir a fresh `pg_tmp_XXXXXX` directory is created under the
 * system temp directory and recorded in `workspace.ownedBaseDir` as soon as it
 * exists, so a later failure still leaves it for cleanup to remove.
 * A created socket directory is made world-writable (0777) so a server
 * running under another account, or inside a container, can use it.
 * A supplied socket directory is used as-is and never created.
 */
Result<void> allocateWorkspace(const std::optional<std::filesystem::path>& baseDir,
                               const std::optional<std::filesystem::path>& socketDir,
                               Workspace& workspace);

} // namespace pgtemp
