#include <filesystem>
#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

#include <pgtemp/process/command.h>
#include <pgtemp/temp_db/temp_db.h>

#include <unistd.h>

namespace pgtemp::test {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

bool havePostgres() {
    return process::findExecutable("initdb") && process::findExecutable("postgres") &&
           process::findExecutable("psql") && process::findExecutable("createuser");
}

// Run a query as the invoking user and return psql's exit status
int query(const TempDb& db, const std::string& dbname, const std::string& sql) {
    std::vector<std::string> argv{"psql", "-X", "-q", "-d", dbname, "-h", db.socketDir().string(),
                                  "-c", sql};
    auto rc = process::runCommand(argv, false);
    return rc ? rc.value() : -1;
}

} // namespace

class TempDbPostgresTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!havePostgres()) {
            GTEST_SKIP() << "PostgreSQL tools not on PATH";
        }
        if (::geteuid() == 0 && !privilege::lookupAccount(privilege::kServiceAccount)) {
            GTEST_SKIP() << "running as root without a postgres account";
        }
    }

    static TempDbOptions realOptions() {
        TempDbOptions options;
        options.verbosity = 0;
        options.retry = 60;
        options.retryInterval = 250ms;
        return options;
    }
};

TEST_F(TempDbPostgresTest, ServesRequestedDatabases) {
    auto options = realOptions();
    options.databases = {"alpha", "beta"};
    options.serverOptions = {{"fsync", "off"}};

    TempDb db{options};
    ASSERT_EQ(db.mode(), ExecutionMode::Direct);
    EXPECT_TRUE(fs::exists(db.socketDir() / ".s.PGSQL.5432"));

    EXPECT_EQ(query(db, "alpha", "create table t (id int); insert into t values (1);"), 0);
    EXPECT_EQ(query(db, "beta", "select 1;"), 0);
    EXPECT_NE(query(db, "gamma", "select 1;"), 0);

    auto tempDir = db.tempDir();
    auto pid = db.serverPid();
    ASSERT_TRUE(tempDir && pid);

    db.cleanup();
    EXPECT_TRUE(wait_process_gone(*pid, 10s));
    EXPECT_FALSE(fs::exists(*tempDir));
}

TEST_F(TempDbPostgresTest, TwoServersSideBySide) {
    TempDb first{realOptions()};
    TempDb second{realOptions()};

    EXPECT_NE(first.socketDir(), second.socketDir());
    EXPECT_EQ(query(first, "postgres", "select 1;"), 0);
    EXPECT_EQ(query(second, "postgres", "select 1;"), 0);

    first.cleanup();
    EXPECT_EQ(query(second, "postgres", "select 1;"), 0);
}

} // namespace pgtemp::test
