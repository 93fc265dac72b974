#include <catch2/catch_test_macros.hpp>
#include "config/GuardConfig.hpp"
#include "utils/fakes.hpp"

#include <cstdlib>

using namespace focusguard;
namespace fs = std::filesystem;

TEST_CASE("GuardConfig - defaults", "[config]")
{
    auto config = GuardConfig::Defaults("/tmp/fg-home");

    REQUIRE(config.home_dir == fs::path("/tmp/fg-home"));
    REQUIRE(config.credentialPath() == fs::path("/tmp/fg-home/password.hash"));
    REQUIRE(config.logPath() == fs::path("/tmp/fg-home/focusguard.log"));
    REQUIRE(config.monitorScriptPath() == fs::path("/tmp/fg-home/monitor.sh"));
    REQUIRE_FALSE(config.user_name.empty());
    REQUIRE(config.launch_agents_dir.filename() == "LaunchAgents");

    REQUIRE(config.monitor.check_interval == std::chrono::milliseconds(1000));
    REQUIRE(config.monitor.pause_threshold == 1200);
    REQUIRE(config.monitor.pause_duration == std::chrono::seconds(60));

    REQUIRE(config.targets.size() == 2);
    REQUIRE(config.targets[0].name == "Forest");
    REQUIRE(config.targets[0].strategy == RelaunchStrategy::Spotlight);
    REQUIRE(config.targets[1].name == "SelfControl");
    REQUIRE(config.targets[1].strategy == RelaunchStrategy::BundleOpen);
    REQUIRE(config.targets[1].argument == "/Applications/SelfControl.app");
}

TEST_CASE("GuardConfig - service label and descriptor", "[config]")
{
    auto config = GuardConfig::Defaults("/tmp/fg-home");
    config.user_name = "alice";
    config.launch_agents_dir = "/Users/alice/Library/LaunchAgents";

    REQUIRE(config.serviceLabel() == "com.alice.focusguard");
    REQUIRE(config.descriptorPath() == fs::path("/Users/alice/Library/LaunchAgents/com.alice.focusguard.plist"));
}

TEST_CASE("GuardConfig - loading config.toml", "[config]")
{
    test_utils::TempDir dir;
    GuardConfig config;
    GuardError error;

    SECTION("Missing file yields defaults")
    {
        REQUIRE(GuardConfig::Load(dir.path(), config, error));
        REQUIRE(config.home_dir == dir.path());
        REQUIRE(config.targets.size() == 2);
    }

    SECTION("Values override defaults")
    {
        test_utils::writeFile(dir.path() / "config.toml", R"(
[paths]
lock_target = "/opt/focus/controller"

[monitor]
check_interval_ms = 250
pause_threshold = 10
pause_seconds = 5
notification_message = "Break time"

[logging]
level = 5
console = true

[[targets]]
name = "Forest"

[[targets]]
name = "Cold Turkey"
strategy = "bundle_open"
argument = "/Applications/Cold Turkey Blocker.app"
)");

        REQUIRE(GuardConfig::Load(dir.path(), config, error));
        REQUIRE(config.lock_target == fs::path("/opt/focus/controller"));
        REQUIRE(config.monitor.check_interval == std::chrono::milliseconds(250));
        REQUIRE(config.monitor.pause_threshold == 10);
        REQUIRE(config.monitor.pause_duration == std::chrono::seconds(5));
        REQUIRE(config.monitor.notification_message == "Break time");
        REQUIRE(config.monitor.notification_title == "focusguard");
        REQUIRE(config.log_level == 5);
        REQUIRE(config.log_to_console);

        REQUIRE(config.targets.size() == 2);
        REQUIRE(config.targets[0].strategy == RelaunchStrategy::Spotlight);
        REQUIRE(config.targets[0].argument == "Forest");
        REQUIRE(config.targets[1].name == "Cold Turkey");
        REQUIRE(config.targets[1].strategy == RelaunchStrategy::BundleOpen);
        REQUIRE(config.targets[1].argument == "/Applications/Cold Turkey Blocker.app");
    }

    SECTION("Unknown strategy is a configuration error")
    {
        test_utils::writeFile(dir.path() / "config.toml", "[[targets]]\nname = \"Forest\"\nstrategy = \"dock\"\n");
        REQUIRE_FALSE(GuardConfig::Load(dir.path(), config, error));
        REQUIRE(error.kind == GuardErrorKind::Configuration);
        REQUIRE(error.message.find("dock") != std::string::npos);
    }

    SECTION("Non-positive threshold is a configuration error")
    {
        test_utils::writeFile(dir.path() / "config.toml", "[monitor]\npause_threshold = 0\n");
        REQUIRE_FALSE(GuardConfig::Load(dir.path(), config, error));
        REQUIRE(error.kind == GuardErrorKind::Configuration);
    }

    SECTION("Syntax errors report the line")
    {
        test_utils::writeFile(dir.path() / "config.toml", "[monitor]\npause_threshold = = 3\n");
        REQUIRE_FALSE(GuardConfig::Load(dir.path(), config, error));
        REQUIRE(error.kind == GuardErrorKind::Configuration);
        REQUIRE(error.technicalInfo.find("line 2") != std::string::npos);
    }
}

TEST_CASE("GuardConfig - helpers", "[config]")
{
    SECTION("Tilde expansion uses HOME")
    {
        const char* home = std::getenv("HOME");
        if (home && *home)
        {
            REQUIRE(GuardConfig::ExpandUser("~/.focusguard") == fs::path(home) / ".focusguard");
            REQUIRE(GuardConfig::ExpandUser("~") == fs::path(home));
        }
        REQUIRE(GuardConfig::ExpandUser("/abs/path") == fs::path("/abs/path"));
        REQUIRE(GuardConfig::ExpandUser("~other/x") == fs::path("~other/x"));
    }

    SECTION("Strategy names")
    {
        RelaunchStrategy strategy = RelaunchStrategy::Spotlight;
        REQUIRE(GuardConfig::ParseStrategy("bundle_open", strategy));
        REQUIRE(strategy == RelaunchStrategy::BundleOpen);
        REQUIRE_FALSE(GuardConfig::ParseStrategy("Spotlight", strategy));
        REQUIRE(std::string(GuardConfig::StrategyToString(RelaunchStrategy::Spotlight)) == "spotlight");
    }
}
