#pragma once

#include "../utils/GuardError.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace focusguard
{

enum class RelaunchStrategy
{
    Spotlight = 0, // Cmd+Space, type the query, Return
    BundleOpen = 1 // Terminal runs `open <bundle path>`
};

struct TargetConfig
{
    std::string name; // process name, matched case-insensitively
    RelaunchStrategy strategy = RelaunchStrategy::Spotlight;
    std::string argument; // spotlight query or bundle path
};

struct MonitorSettings
{
    std::chrono::milliseconds check_interval{1000};
    int pause_threshold = 1200;
    std::chrono::seconds pause_duration{60};
    std::string notification_title = "focusguard";
    std::string notification_message = "Taking a 60 second break from checks";
};

// Everything the dispatcher and the monitor need, built once per process and
// handed to each component. Loaded from <home>/config.toml when it exists.
struct GuardConfig
{
    std::filesystem::path home_dir;
    std::filesystem::path launch_agents_dir;
    std::filesystem::path lock_target;
    std::string user_name;
    MonitorSettings monitor;
    std::vector<TargetConfig> targets;
    int log_level = 4; // plog::info
    bool log_to_console = false;

    std::filesystem::path configPath() const { return home_dir / "config.toml"; }
    std::filesystem::path credentialPath() const { return home_dir / "password.hash"; }
    std::filesystem::path logPath() const { return home_dir / "focusguard.log"; }
    std::filesystem::path monitorScriptPath() const { return home_dir / "monitor.sh"; }
    std::filesystem::path monitorOutputPath() const { return home_dir / "monitor.out"; }
    std::string serviceLabel() const;
    std::filesystem::path descriptorPath() const;

    static GuardConfig Defaults(const std::filesystem::path& home_dir);

    // Defaults overlaid with <home>/config.toml. A missing file is not an error.
    static bool Load(const std::filesystem::path& home_dir, GuardConfig& out, GuardError& error);

    // $FOCUSGUARD_HOME, else ~/.focusguard
    static std::filesystem::path ResolveHomeDir();
    static std::filesystem::path ExpandUser(const std::string& path);
    static std::string CurrentUserName();

    static bool ParseStrategy(const std::string& text, RelaunchStrategy& out);
    static const char* StrategyToString(RelaunchStrategy strategy);
};

} // namespace focusguard
