#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(ConfigTest, EmptyTextGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;

    EXPECT_EQ(c.fleet().max_concurrency, DEFAULT_MAX_CONCURRENCY);
    EXPECT_EQ(c.fleet().path_strategy, "unified");
    EXPECT_EQ(c.fleet().directory_prefix, "issues");
    EXPECT_EQ(c.fleet().manual_mode, DumpMode::Interactive);
    EXPECT_EQ(c.fleet().automated_mode, DumpMode::Headless);
    EXPECT_EQ(c.fleet().timeouts.headless_secs, 300);
    EXPECT_EQ(c.fleet().timeouts.interactive_secs, 600);
    EXPECT_EQ(c.fleet().timeouts.cancel_grace_secs, 5);
    EXPECT_TRUE(c.fleet().upload_enabled);
    EXPECT_EQ(c.fleet().log_directory, expand_user(DEFAULT_LOG_DIRECTORY));
    EXPECT_EQ(c.fleet().script_path, default_script_path());
    EXPECT_TRUE(c.devices().empty());
    EXPECT_FALSE(c.crash_monitor().enabled);
    EXPECT_EQ(c.artifact_store().server_id, DEFAULT_JFROG_SERVER);
}

TEST(ConfigTest, FullConfig) {
    auto r = Config::parse(R"(
log_directory: /srv/dumps
script: /opt/dumpfleet/extract.sh
devices: [R5CT20ABC, R5CT20DEF]
dump:
  max_concurrency: 5
  path_strategy: hybrid
  directory_prefix: incidents
  mode:
    manual: headless
    automated: interactive
  timeouts:
    headless: 120
    interactive: 900
    cancel_grace: 2
upload:
  enabled: false
  directory_prefix: uploads
  server_url: https://art.example.com/artifactory
  repository: crash-dumps
  server_id: ci
  timeout: 60
crash_monitor:
  enabled: true
  interval_ms: 2500
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& c = r.value;

    EXPECT_EQ(c.fleet().log_directory, fs::path("/srv/dumps"));
    EXPECT_EQ(c.fleet().script_path, fs::path("/opt/dumpfleet/extract.sh"));
    EXPECT_EQ(c.devices(), (std::vector<std::string>{"R5CT20ABC", "R5CT20DEF"}));
    EXPECT_EQ(c.fleet().max_concurrency, 5);
    EXPECT_EQ(c.fleet().path_strategy, "hybrid");
    EXPECT_EQ(c.fleet().directory_prefix, "incidents");
    EXPECT_EQ(c.fleet().manual_mode, DumpMode::Headless);
    EXPECT_EQ(c.fleet().automated_mode, DumpMode::Interactive);
    EXPECT_EQ(c.fleet().timeouts.headless_secs, 120);
    EXPECT_EQ(c.fleet().timeouts.interactive_secs, 900);
    EXPECT_EQ(c.fleet().timeouts.cancel_grace_secs, 2);
    EXPECT_FALSE(c.fleet().upload_enabled);
    EXPECT_EQ(c.fleet().upload_prefix, "uploads");
    EXPECT_EQ(c.artifact_store().server_url, "https://art.example.com/artifactory");
    EXPECT_EQ(c.artifact_store().repository, "crash-dumps");
    EXPECT_EQ(c.artifact_store().server_id, "ci");
    EXPECT_EQ(c.artifact_store().timeout_secs, 60);
    EXPECT_TRUE(c.crash_monitor().enabled);
    EXPECT_EQ(c.crash_monitor().interval_ms, 2500);

    EXPECT_EQ(c.mode_for(DumpTrigger::Manual), DumpMode::Headless);
    EXPECT_EQ(c.mode_for(DumpTrigger::HealthCheck), DumpMode::Interactive);
}

TEST(ConfigTest, TildeIsExpanded) {
    auto r = Config::parse("log_directory: ~/crashes\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.fleet().log_directory, platform::home_dir() / "crashes");
}

TEST(ConfigTest, UnknownModeKeepsDefault) {
    auto r = Config::parse("dump:\n  mode:\n    manual: silent\n    automated: headless\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.fleet().manual_mode, DumpMode::Interactive);
    EXPECT_EQ(r.value.fleet().automated_mode, DumpMode::Headless);
}

TEST(ConfigTest, LimitsAreClamped) {
    auto r = Config::parse("dump:\n  max_concurrency: 0\ncrash_monitor:\n  interval_ms: 5\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.fleet().max_concurrency, 1);
    EXPECT_EQ(r.value.crash_monitor().interval_ms, 100);
}

TEST(ConfigTest, NonPositiveTimeoutsFallBack) {
    auto r = Config::parse("dump:\n"
                           "  timeouts:\n"
                           "    headless: 0\n"
                           "    interactive: -30\n"
                           "    cancel_grace: -1\n"
                           "upload:\n"
                           "  timeout: 0\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.fleet().timeouts.headless_secs, HEADLESS_DUMP_TIMEOUT_SECS);
    EXPECT_EQ(r.value.fleet().timeouts.interactive_secs, INTERACTIVE_DUMP_TIMEOUT_SECS);
    EXPECT_EQ(r.value.fleet().timeouts.cancel_grace_secs, 0);
    EXPECT_EQ(r.value.artifact_store().timeout_secs, UPLOAD_TIMEOUT_SECS);
}

TEST(ConfigTest, InvalidYamlIsAnError) {
    auto r = Config::parse("dump: [unclosed\n");
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Invalid config"), std::string::npos);
}

TEST(ConfigTest, UnreadableNumberKeepsDefault) {
    auto r = Config::parse("dump:\n  max_concurrency: lots\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.fleet().max_concurrency, DEFAULT_MAX_CONCURRENCY);
}

TEST(ConfigTest, NonMappingRootIsAnError) {
    EXPECT_TRUE(Config::parse("- a\n- b\n").is_err());
}

TEST(ConfigTest, LoadFromFile) {
    auto dir = fs::temp_directory_path() / "dumpfleet_config_test";
    fs::create_directories(dir);
    std::ofstream(dir / "config.yaml") << "devices: [dev1]\n";

    auto r = Config::load_from(dir / "config.yaml");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.devices(), std::vector<std::string>{"dev1"});

    auto missing = Config::load_from(dir / "absent.yaml");
    EXPECT_TRUE(missing.is_err());

    fs::remove_all(dir);
}

TEST(ConfigTest, ConcurrencyOverrideIsClamped) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok());
    Config c = r.value;
    c.set_max_concurrency(6);
    EXPECT_EQ(c.fleet().max_concurrency, 6);
    c.set_max_concurrency(-2);
    EXPECT_EQ(c.fleet().max_concurrency, 1);
}
