#include <filesystem>
#include <gtest/gtest.h>

#include "../../common/test_helpers.h"

#include <pgtemp/config/config_helpers.h>

namespace pgtemp::config::test {

namespace fs = std::filesystem;
using pgtemp::test::ScopedEnvVar;

class ConfigHelpersTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = pgtemp::test::make_temp_dir("pgtemp_config_"); }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path writeConfig(std::string_view text) {
        return pgtemp::test::write_file(dir_ / "config.toml", text);
    }

    fs::path dir_;
};

TEST_F(ConfigHelpersTest, ParsesSectionsAndComments) {
    auto path = writeConfig(R"(# leading comment
top = 1

[pgtemp]
retry = 7   # inline comment
image = "postgres:16"
databases = ["app", 'audit']

[server]
"work_mem" = '64MB'
)");
    auto parsed = parse_config_file(path);
    ASSERT_TRUE(parsed);
    const auto& sections = parsed.value();

    EXPECT_EQ(sections.at("").at("top"), "1");
    EXPECT_EQ(sections.at("pgtemp").at("retry"), "7");
    EXPECT_EQ(sections.at("pgtemp").at("image"), "postgres:16");
    EXPECT_EQ(sections.at("pgtemp").at("databases"), R"(["app", 'audit'])");
    EXPECT_EQ(sections.at("server").at("work_mem"), "64MB");
}

TEST_F(ConfigHelpersTest, MissingFileIsReportedByParser) {
    auto parsed = parse_config_file(dir_ / "absent.toml");
    ASSERT_FALSE(parsed);
    EXPECT_EQ(parsed.error().code, ErrorCode::FileNotFound);
}

TEST(ConfigParseTest, ParseListAcceptsBothForms) {
    EXPECT_EQ(parse_list("app, audit"), (std::vector<std::string>{"app", "audit"}));
    EXPECT_EQ(parse_list(R"(["app", "audit",])"), (std::vector<std::string>{"app", "audit"}));
    EXPECT_TRUE(parse_list("").empty());
    EXPECT_TRUE(parse_list("[]").empty());
}

TEST(ConfigParseTest, ParseKeyValue) {
    auto kv = parse_key_value("shared_buffers=128MB");
    ASSERT_TRUE(kv);
    EXPECT_EQ(kv.value().first, "shared_buffers");
    EXPECT_EQ(kv.value().second, "128MB");

    auto withEquals = parse_key_value("search_path=a=b");
    ASSERT_TRUE(withEquals);
    EXPECT_EQ(withEquals.value().second, "a=b");

    auto empty = parse_key_value("fsync=");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty.value().second, "");

    EXPECT_FALSE(parse_key_value("fsync"));
    EXPECT_FALSE(parse_key_value("=off"));
    EXPECT_FALSE(parse_key_value("  =off"));
}

TEST(ConfigParseTest, UnquoteAndTilde) {
    EXPECT_EQ(unquote("  \"x y\" "), "x y");
    EXPECT_EQ(unquote("'x'"), "x");
    EXPECT_EQ(unquote("\"x'"), "\"x'");

    ScopedEnvVar home{"HOME", "/home/tester"};
    EXPECT_EQ(expand_tilde("~/pg"), fs::path("/home/tester/pg"));
    EXPECT_EQ(expand_tilde("/abs/~/pg"), fs::path("/abs/~/pg"));
}

TEST(ConfigPathTest, ResolutionOrder) {
    ScopedEnvVar home{"HOME", "/home/tester"};
    ScopedEnvVar xdg{"XDG_CONFIG_HOME", std::nullopt};
    ScopedEnvVar explicitPath{"PGTEMP_CONFIG", std::nullopt};

    EXPECT_EQ(get_config_path(), fs::path("/home/tester/.config/pgtemp/config.toml"));
    {
        ScopedEnvVar xdgSet{"XDG_CONFIG_HOME", "/xdg"};
        EXPECT_EQ(get_config_path(), fs::path("/xdg/pgtemp/config.toml"));
        {
            ScopedEnvVar envPath{"PGTEMP_CONFIG", "/etc/pgtemp.toml"};
            EXPECT_EQ(get_config_path(), fs::path("/etc/pgtemp.toml"));
            EXPECT_EQ(get_config_path("~/mine.toml"), fs::path("/home/tester/mine.toml"));
        }
    }
}

TEST_F(ConfigHelpersTest, LoadOptionsAppliesAllSections) {
    auto path = writeConfig(R"([pgtemp]
verbosity = 2
retry = 9
retry_interval_ms = 250
databases = "app,audit"
base_dir = "/srv/pg"
socket_dir = "/srv/sock"
image = "postgres:16"
run_as = "postgres"
container_runtime = "podman"
something_else = 1

[tools]
initdb = "/opt/pg/bin/initdb"
psql = "/opt/pg/bin/psql"

[server]
fsync = off
work_mem = 64MB
)");
    auto loaded = loadOptions(path);
    ASSERT_TRUE(loaded);
    const auto& options = loaded.value();

    EXPECT_EQ(options.verbosity, 2);
    EXPECT_EQ(options.retry, 9);
    EXPECT_EQ(options.retryInterval, Duration(250));
    EXPECT_EQ(options.databases, (std::vector<std::string>{"app", "audit"}));
    EXPECT_EQ(options.baseDir, fs::path("/srv/pg"));
    EXPECT_EQ(options.socketDir, fs::path("/srv/sock"));
    EXPECT_EQ(options.containerImage, "postgres:16");
    EXPECT_EQ(options.runAs, "postgres");
    EXPECT_EQ(options.containerRuntime, "podman");
    EXPECT_EQ(options.tools.initdb, "/opt/pg/bin/initdb");
    EXPECT_EQ(options.tools.postgres, "postgres");
    EXPECT_EQ(options.tools.psql, "/opt/pg/bin/psql");
    EXPECT_EQ(options.tools.createuser, "createuser");
    ASSERT_EQ(options.serverOptions.size(), 2u);
    EXPECT_EQ(options.serverOptions.at("fsync"), "off");
    EXPECT_EQ(options.serverOptions.at("work_mem"), "64MB");
}

TEST_F(ConfigHelpersTest, MissingFileKeepsDefaults) {
    auto loaded = loadOptions(dir_ / "absent.toml");
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value().verbosity, 1);
    EXPECT_EQ(loaded.value().retry, 5);
    EXPECT_EQ(loaded.value().retryInterval, Duration(1000));
    EXPECT_FALSE(loaded.value().containerImage.has_value());
}

TEST_F(ConfigHelpersTest, BadIntegerIsRejected) {
    auto path = writeConfig("[pgtemp]\nretry = many\n");
    auto loaded = loadOptions(path);
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(loaded.error().message.find("retry"), std::string::npos);

    writeConfig("[pgtemp]\nverbosity = -1\n");
    EXPECT_FALSE(loadOptions(path));
}

TEST(ConfigEnvironmentTest, OverridesFileValues) {
    TempDbOptions options;
    options.retry = 9;
    options.containerImage = "postgres:15";

    ScopedEnvVar retry{"PGTEMP_RETRY", "3"};
    ScopedEnvVar interval{"PGTEMP_RETRY_INTERVAL_MS", "20"};
    ScopedEnvVar image{"PGTEMP_IMAGE", "postgres:16"};
    ScopedEnvVar psql{"PGTEMP_PSQL", "/opt/psql"};
    ScopedEnvVar verbosity{"PGTEMP_VERBOSITY", ""};

    ASSERT_TRUE(applyEnvironment(options));
    EXPECT_EQ(options.retry, 3);
    EXPECT_EQ(options.retryInterval, Duration(20));
    EXPECT_EQ(options.containerImage, "postgres:16");
    EXPECT_EQ(options.tools.psql, "/opt/psql");
    // Empty variables are ignored
    EXPECT_EQ(options.verbosity, 1);
}

TEST(ConfigEnvironmentTest, BadIntegerIsRejected) {
    TempDbOptions options;
    ScopedEnvVar retry{"PGTEMP_RETRY", "3x"};
    auto result = applyEnvironment(options);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

} // namespace pgtemp::config::test
