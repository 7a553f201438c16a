#include <gtest/gtest.h>
#include <core/config.hpp>
#include <cstdlib>
#include <fstream>

TEST(Config, DefaultsWhenEmpty) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.connect_timeout_ms(), DEFAULT_CONNECT_TIMEOUT_MS);
    EXPECT_EQ(r.value.wait_ms(), DEFAULT_WAIT_MS);
    EXPECT_EQ(r.value.timing().poll_interval_ms, 100);
    EXPECT_EQ(r.value.timing().silence_threshold_ms, 1000);
    EXPECT_EQ(r.value.timing().grace_ms, 200);
    EXPECT_EQ(r.value.timing().slow_command_floor_ms, 12000);
    EXPECT_EQ(r.value.baseline().pagination_command, "terminal length 0");
    EXPECT_EQ(r.value.slow_commands().size(), 8u);
    EXPECT_TRUE(r.value.log_file().empty());
}

TEST(Config, Overrides) {
    auto r = Config::parse(R"(
defaults:
  connect_timeout_ms: 3000
  wait_ms: 4000
timing:
  poll_interval_ms: 50
  slow_command_floor_ms: 30000
baseline:
  probe_count: 0
  pagination_command: "terminal pager 0"
slow_commands: [PING, " Show Tech ", verify]
log_file: /var/tmp/telcon.log
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;
    EXPECT_EQ(c.connect_timeout_ms(), 3000);
    EXPECT_EQ(c.wait_ms(), 4000);
    EXPECT_EQ(c.timing().poll_interval_ms, 50);
    EXPECT_EQ(c.timing().grace_ms, 200);
    EXPECT_EQ(c.timing().slow_command_floor_ms, 30000);
    EXPECT_EQ(c.baseline().probe_count, 0);
    EXPECT_EQ(c.baseline().wake_count, 3);
    EXPECT_EQ(c.baseline().pagination_command, "terminal pager 0");
    ASSERT_EQ(c.slow_commands().size(), 3u);
    EXPECT_EQ(c.slow_commands()[0], "ping");
    EXPECT_EQ(c.slow_commands()[1], "show tech");
    EXPECT_EQ(c.log_file(), "/var/tmp/telcon.log");
}

TEST(Config, InvalidNumbersKeepDefaults) {
    auto r = Config::parse(R"(
defaults:
  wait_ms: -5
timing:
  grace_ms: soon
)");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.wait_ms(), DEFAULT_WAIT_MS);
    EXPECT_EQ(r.value.timing().grace_ms, 200);
}

TEST(Config, MalformedYaml) {
    auto r = Config::parse("timing: [unterminated");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST(Config, RootMustBeMapping) {
    auto r = Config::parse("- a\n- b\n");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST(Config, LoadFileMissing) {
    auto r = Config::load_file("/nonexistent/telcon/config.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

TEST(Config, LoadFileRecordsSource) {
    auto path = fs::temp_directory_path() / "telcon_test_config.yaml";
    {
        std::ofstream out(path);
        out << "defaults:\n  wait_ms: 2500\n";
    }
    auto r = Config::load_file(path);
    fs::remove(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.wait_ms(), 2500);
    EXPECT_EQ(r.value.source(), path);
}

TEST(Config, CreateDefaultRoundTrips) {
    auto dir = fs::temp_directory_path() / "telcon_test_home";
    fs::remove_all(dir);
    auto path = dir / "config.yaml";
    setenv("TELCON_CONFIG", path.c_str(), 1);

    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_TRUE(global_config_exists());
    auto r = Config::load();
    unsetenv("TELCON_CONFIG");
    fs::remove_all(dir);

    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.connect_timeout_ms(), DEFAULT_CONNECT_TIMEOUT_MS);
    EXPECT_EQ(r.value.timing().silence_threshold_ms, 1000);
    EXPECT_EQ(r.value.baseline().exit_config_command, "end");
    EXPECT_EQ(r.value.slow_commands().size(), 8u);
}
