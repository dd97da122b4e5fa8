#include <pgtemp/temp_db/workspace.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <string>

#include <stdlib.h>

namespace pgtemp {

namespace fs = std::filesystem;

namespace {

Result<fs::path> makeTempBase() {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    std::string pattern = (tmp / (std::string(kTempDirPrefix) + "XXXXXX")).string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        return Error{ErrorCode::PermissionDenied,
                     "mkdtemp(" + pattern + "): " + std::strerror(errno)};
    }
    return fs::path(pattern);
}

Result<void> makeDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied, dir.string() + ": " + ec.message()};
    }
    return {};
}

} // namespace

Result<void> allocateWorkspace(const std::optional<fs::path>& baseDir,
                               const std::optional<fs::path>& socketDir, Workspace& workspace) {
    fs::path base;
    if (baseDir && !baseDir->empty()) {
        base = *baseDir;
        if (auto r = makeDir(base); !r) {
            return r;
        }
    } else {
        auto created = makeTempBase();
        if (!created) {
            return created.error();
        }
        base = created.value();
        workspace.ownedBaseDir = base;
    }

    workspace.dataDir = base / "data";
    if (auto r = makeDir(workspace.dataDir); !r) {
        return r;
    }

    if (socketDir && !socketDir->empty()) {
        workspace.socketDir = *socketDir;
        workspace.socketDirSupplied = true;
        std::error_code ec;
        if (!fs::is_directory(workspace.socketDir, ec)) {
            spdlog::debug("Workspace: socket directory {} does not exist",
                          workspace.socketDir.string());
        }
    } else {
        workspace.socketDir = base / "socket";
        if (auto r = makeDir(workspace.socketDir); !r) {
            return r;
        }
        std::error_code ec;
        fs::permissions(workspace.socketDir, fs::perms::all, fs::perm_options::replace, ec);
        if (ec) {
            return Error{ErrorCode::PermissionDenied,
                         workspace.socketDir.string() + ": " + ec.message()};
        }
    }

    spdlog::debug("Workspace: data={} socket={} owned={}", workspace.dataDir.string(),
                  workspace.socketDir.string(), workspace.ownedBaseDir.has_value());
    return {};
}

} // namespace pgtemp
