#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("fleet_config_test_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_config(const std::string& yaml) {
        fs::path path = test_dir / "config.yaml";
        std::ofstream(path) << yaml;
        return path;
    }
};

TEST_F(ConfigTest, Defaults) {
    Config c = Config::defaults();
    EXPECT_EQ(c.connect_timeout(), CONNECT_TIMEOUT_SECS);
    EXPECT_EQ(c.command_timeout(), COMMAND_TIMEOUT_SECS);
    EXPECT_EQ(c.monitor().tick_seconds, MONITOR_TICK_SECS);
    EXPECT_EQ(c.monitor().alert_cap, MAX_ALERTS);
    EXPECT_EQ(c.sync().history_cap, MAX_SYNC_HISTORY);
    EXPECT_EQ(c.sync().remote_temp_dir, "/tmp");
    EXPECT_EQ(c.state_dir(), get_global_config_dir() / "state");
    EXPECT_FALSE(c.log_file().empty());
}

TEST_F(ConfigTest, LoadAllFields) {
    auto path = write_config(
        "state_dir: " + (test_dir / "state").string() + "\n"
        "log_file: " + (test_dir / "fleet.log").string() + "\n"
        "connect_timeout: 5\n"
        "command_timeout: 120\n"
        "monitor:\n"
        "  tick_seconds: 2\n"
        "  alert_cap: 50\n"
        "sync:\n"
        "  history_cap: 20\n"
        "  remote_temp_dir: /var/tmp\n");

    auto r = Config::load(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.state_dir(), test_dir / "state");
    EXPECT_EQ(r.value.log_file(), (test_dir / "fleet.log").string());
    EXPECT_EQ(r.value.connect_timeout(), 5);
    EXPECT_EQ(r.value.command_timeout(), 120);
    EXPECT_EQ(r.value.monitor().tick_seconds, 2);
    EXPECT_EQ(r.value.monitor().alert_cap, 50);
    EXPECT_EQ(r.value.sync().history_cap, 20);
    EXPECT_EQ(r.value.sync().remote_temp_dir, "/var/tmp");
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    auto r = Config::load(write_config("monitor:\n  alert_cap: 10\n"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.monitor().alert_cap, 10);
    EXPECT_EQ(r.value.monitor().tick_seconds, MONITOR_TICK_SECS);
    EXPECT_EQ(r.value.sync().history_cap, MAX_SYNC_HISTORY);
}

TEST_F(ConfigTest, NonPositiveAndBadValuesFallBack) {
    auto r = Config::load(write_config(
        "connect_timeout: 0\n"
        "command_timeout: -3\n"
        "sync:\n"
        "  history_cap: lots\n"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.connect_timeout(), CONNECT_TIMEOUT_SECS);
    EXPECT_EQ(r.value.command_timeout(), COMMAND_TIMEOUT_SECS);
    EXPECT_EQ(r.value.sync().history_cap, MAX_SYNC_HISTORY);
}

TEST_F(ConfigTest, EmptyLogFileDisablesLog) {
    auto r = Config::load(write_config("log_file: \"\"\n"));
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.log_file().empty());
}

TEST_F(ConfigTest, EmptyFileIsDefaults) {
    auto r = Config::load(write_config(""));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.connect_timeout(), CONNECT_TIMEOUT_SECS);
}

TEST_F(ConfigTest, RootMustBeMapping) {
    auto r = Config::load(write_config("- a\n- b\n"));
    EXPECT_EQ(r.kind, ErrorKind::Validation);
}

TEST_F(ConfigTest, MalformedYamlIsValidationError) {
    auto r = Config::load(write_config("monitor: {tick_seconds: 2\n"));
    EXPECT_EQ(r.kind, ErrorKind::Validation);
    EXPECT_NE(r.error.find("config.yaml"), std::string::npos);
}

TEST_F(ConfigTest, MissingFileIsError) {
    auto r = Config::load(test_dir / "nope.yaml");
    EXPECT_TRUE(r.is_err());
}

TEST_F(ConfigTest, ExpandHome) {
    EXPECT_EQ(expand_home("~"), platform::home_dir());
    EXPECT_EQ(expand_home("~/fleet/state"), platform::home_dir() / "fleet/state");
    EXPECT_EQ(expand_home("/srv/fleet"), fs::path("/srv/fleet"));
    EXPECT_EQ(expand_home("relative"), fs::path("relative"));
}
