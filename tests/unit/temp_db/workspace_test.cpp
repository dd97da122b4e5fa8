#include <filesystem>
#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

#include <pgtemp/temp_db/workspace.h>

namespace pgtemp::test {

namespace fs = std::filesystem;

class WorkspaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        tmp_ = make_temp_dir("pgtemp_ws_");
        tmpdir_.emplace("TMPDIR", tmp_.string());
    }

    void TearDown() override {
        tmpdir_.reset();
        std::error_code ec;
        fs::remove_all(tmp_, ec);
    }

    fs::path tmp_;
    std::optional<ScopedEnvVar> tmpdir_;
};

TEST_F(WorkspaceTest, CreatesOwnedTempBase) {
    Workspace ws;
    ASSERT_TRUE(allocateWorkspace(std::nullopt, std::nullopt, ws));

    ASSERT_TRUE(ws.ownedBaseDir.has_value());
    EXPECT_EQ(ws.ownedBaseDir->parent_path(), tmp_);
    EXPECT_EQ(ws.ownedBaseDir->filename().string().rfind(kTempDirPrefix, 0), 0u);
    EXPECT_EQ(ws.dataDir, *ws.ownedBaseDir / "data");
    EXPECT_EQ(ws.socketDir, *ws.ownedBaseDir / "socket");
    EXPECT_FALSE(ws.socketDirSupplied);

    EXPECT_TRUE(fs::is_directory(ws.dataDir));
    EXPECT_TRUE(fs::is_directory(ws.socketDir));
    EXPECT_EQ(fs::status(ws.socketDir).permissions() & fs::perms::all, fs::perms::all);
}

TEST_F(WorkspaceTest, EachAllocationIsDistinct) {
    Workspace first;
    Workspace second;
    ASSERT_TRUE(allocateWorkspace(std::nullopt, std::nullopt, first));
    ASSERT_TRUE(allocateWorkspace(std::nullopt, std::nullopt, second));
    EXPECT_NE(*first.ownedBaseDir, *second.ownedBaseDir);
    EXPECT_NE(first.socketDir, second.socketDir);
}

TEST_F(WorkspaceTest, SuppliedBaseIsNotOwned) {
    auto base = tmp_ / "mine";
    Workspace ws;
    ASSERT_TRUE(allocateWorkspace(base, std::nullopt, ws));

    EXPECT_FALSE(ws.ownedBaseDir.has_value());
    EXPECT_EQ(ws.dataDir, base / "data");
    EXPECT_EQ(ws.socketDir, base / "socket");
    EXPECT_TRUE(fs::is_directory(ws.dataDir));
}

TEST_F(WorkspaceTest, SuppliedSocketDirIsUsedAsIs) {
    auto sock = tmp_ / "sockets";
    fs::create_directories(sock);
    fs::permissions(sock, fs::perms::owner_all, fs::perm_options::replace);

    Workspace ws;
    ASSERT_TRUE(allocateWorkspace(std::nullopt, sock, ws));
    EXPECT_EQ(ws.socketDir, sock);
    EXPECT_TRUE(ws.socketDirSupplied);
    EXPECT_FALSE(fs::exists(*ws.ownedBaseDir / "socket"));
    // Permissions of a caller's directory are left alone
    EXPECT_EQ(fs::status(sock).permissions() & fs::perms::all, fs::perms::owner_all);
}

TEST_F(WorkspaceTest, MissingSuppliedSocketDirIsNotCreated) {
    auto sock = tmp_ / "not-there";
    Workspace ws;
    ASSERT_TRUE(allocateWorkspace(std::nullopt, sock, ws));
    EXPECT_EQ(ws.socketDir, sock);
    EXPECT_FALSE(fs::exists(sock));
}

TEST_F(WorkspaceTest, UncreatableBaseFails) {
    auto file = write_file(tmp_ / "plain-file", "x");
    Workspace ws;
    auto result = allocateWorkspace(file / "base", std::nullopt, ws);
    ASSERT_FALSE(result);
    EXPECT_FALSE(ws.ownedBaseDir.has_value());
}

} // namespace pgtemp::test
