#include <filesystem>
#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

#include <pgtemp/process/command.h>

namespace pgtemp::process::test {

namespace fs = std::filesystem;

TEST(RunCommandTest, ReturnsExitStatus) {
    auto ok = runCommand({"true"}, false);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 0);

    auto failing = runCommand({"false"}, false);
    ASSERT_TRUE(failing);
    EXPECT_NE(failing.value(), 0);
}

TEST(RunCommandTest, UnknownCommandIs127) {
    auto rc = runCommand({"pgtemp-definitely-not-installed"}, false);
    ASSERT_TRUE(rc);
    EXPECT_EQ(rc.value(), 127);
}

TEST(RunCommandTest, EmptyCommandIsAnError) {
    auto rc = runCommand({}, false);
    ASSERT_FALSE(rc);
    EXPECT_EQ(rc.error().code, ErrorCode::InvalidArgument);
}

TEST(FindExecutableTest, SearchesPath) {
    auto sh = findExecutable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(fs::exists(*sh));
    EXPECT_EQ(sh->filename(), "sh");

    EXPECT_FALSE(findExecutable("pgtemp-definitely-not-installed").has_value());
    EXPECT_FALSE(findExecutable("").has_value());
}

TEST(FindExecutableTest, ChecksPathsDirectly) {
    auto dir = pgtemp::test::make_temp_dir("pgtemp_find_");
    auto script = pgtemp::test::write_file(dir / "tool", "#!/bin/sh\nexit 0\n");

    // Not executable yet
    fs::permissions(script, fs::perms::owner_read | fs::perms::owner_write);
    EXPECT_FALSE(findExecutable(script.string()).has_value());

    fs::permissions(script, fs::perms::owner_all);
    auto found = findExecutable(script.string());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, script);

    EXPECT_FALSE(findExecutable(dir.string()).has_value());

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(FindExecutableTest, HonorsPathVariable) {
    auto dir = pgtemp::test::make_temp_dir("pgtemp_path_");
    auto script = pgtemp::test::write_file(dir / "pgtemp-probe-tool", "#!/bin/sh\nexit 0\n");
    fs::permissions(script, fs::perms::owner_all);

    pgtemp::test::ScopedEnvVar path{"PATH", dir.string()};
    auto found = findExecutable("pgtemp-probe-tool");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, script);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST(ShellQuoteTest, LeavesSafeWordsAlone) {
    EXPECT_EQ(shellQuote("initdb"), "initdb");
    EXPECT_EQ(shellQuote("/tmp/pg_tmp_abc/data"), "/tmp/pg_tmp_abc/data");
    EXPECT_EQ(shellQuote("work_mem=64MB"), "work_mem=64MB");
}

TEST(ShellQuoteTest, QuotesEverythingElse) {
    EXPECT_EQ(shellQuote(""), "''");
    EXPECT_EQ(shellQuote("a b"), "'a b'");
    EXPECT_EQ(shellQuote("\\dt"), "'\\dt'");
    EXPECT_EQ(shellQuote("it's"), "'it'\"'\"'s'");
}

TEST(JoinCommandTest, QuotesEachWord) {
    EXPECT_EQ(joinCommand({"postgres", "-D", "/tmp/x y", "-h", ""}),
              "postgres -D '/tmp/x y' -h ''");
    EXPECT_EQ(joinCommand({}), "");
}

TEST(JoinCommandTest, RoundTripsThroughShell) {
    auto dir = pgtemp::test::make_temp_dir("pgtemp_join_");
    auto out = dir / "args.txt";
    std::vector<std::string> argv{"printf", "%s|", "a b", "it's", "", "$HOME"};
    auto line = joinCommand(argv) + " > " + shellQuote(out.string());

    auto rc = runCommand({"sh", "-c", line}, false);
    ASSERT_TRUE(rc);
    ASSERT_EQ(rc.value(), 0);

    auto lines = pgtemp::test::read_lines(out);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "a b|it's||$HOME|");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

} // namespace pgtemp::process::test
