#include "GuardConfig.hpp"
#include "../platform/ProcessUtils.hpp"

#include <toml++/toml.h>

#include <cstdlib>
#include <fstream>

#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace focusguard
{

std::string GuardConfig::serviceLabel() const
{
    return "com." + user_name + ".focusguard";
}

fs::path GuardConfig::descriptorPath() const
{
    return launch_agents_dir / (serviceLabel() + ".plist");
}

GuardConfig GuardConfig::Defaults(const fs::path& home_dir)
{
    GuardConfig config;
    config.home_dir = home_dir;
    config.launch_agents_dir = ExpandUser("~/Library/LaunchAgents");
    config.lock_target = utils::ProcessUtils::GetExecutablePath();
    config.user_name = CurrentUserName();
    config.targets = {
        {"Forest", RelaunchStrategy::Spotlight, "Forest"},
        {"SelfControl", RelaunchStrategy::BundleOpen, "/Applications/SelfControl.app"},
    };
    return config;
}

bool GuardConfig::Load(const fs::path& home_dir, GuardConfig& out, GuardError& error)
{
    GuardConfig config = Defaults(home_dir);
    const fs::path config_path = config.configPath();

    std::ifstream ifs(config_path, std::ios::binary);
    if (!ifs)
    {
        out = std::move(config);
        return true;
    }

    try
    {
        toml::table root = toml::parse(ifs, config_path.string());

        if (auto paths = root["paths"].as_table())
        {
            if (auto dir = (*paths)["launch_agents_dir"].value<std::string>(); dir && !dir->empty())
                config.launch_agents_dir = ExpandUser(*dir);
            if (auto target = (*paths)["lock_target"].value<std::string>(); target && !target->empty())
                config.lock_target = ExpandUser(*target);
        }

        if (auto monitor = root["monitor"].as_table())
        {
            if (auto v = (*monitor)["check_interval_ms"].value<int64_t>())
            {
                if (*v < 0)
                {
                    error = GuardError(GuardErrorKind::Configuration, "monitor.check_interval_ms must not be negative");
                    return false;
                }
                config.monitor.check_interval = std::chrono::milliseconds(*v);
            }
            if (auto v = (*monitor)["pause_threshold"].value<int64_t>())
            {
                if (*v <= 0)
                {
                    error = GuardError(GuardErrorKind::Configuration, "monitor.pause_threshold must be positive");
                    return false;
                }
                config.monitor.pause_threshold = static_cast<int>(*v);
            }
            if (auto v = (*monitor)["pause_seconds"].value<int64_t>())
            {
                if (*v < 0)
                {
                    error = GuardError(GuardErrorKind::Configuration, "monitor.pause_seconds must not be negative");
                    return false;
                }
                config.monitor.pause_duration = std::chrono::seconds(*v);
            }
            if (auto v = (*monitor)["notification_title"].value<std::string>())
                config.monitor.notification_title = *v;
            if (auto v = (*monitor)["notification_message"].value<std::string>())
                config.monitor.notification_message = *v;
        }

        if (auto logging = root["logging"].as_table())
        {
            if (auto level = (*logging)["level"].value<int64_t>())
            {
                int level_int = static_cast<int>(*level);
                if (level_int >= 0 && level_int <= 6)
                    config.log_level = level_int;
            }
            if (auto console = (*logging)["console"].value<bool>())
                config.log_to_console = *console;
        }

        if (auto targets = root["targets"].as_array())
        {
            std::vector<TargetConfig> parsed;
            for (const auto& node : *targets)
            {
                const toml::table* entry = node.as_table();
                if (!entry)
                {
                    error = GuardError(GuardErrorKind::Configuration, "Each [[targets]] entry must be a table");
                    return false;
                }

                TargetConfig target;
                target.name = (*entry)["name"].value_or(std::string());
                if (target.name.empty())
                {
                    error = GuardError(GuardErrorKind::Configuration, "A target is missing its name");
                    return false;
                }

                std::string strategy = (*entry)["strategy"].value_or(std::string("spotlight"));
                if (!ParseStrategy(strategy, target.strategy))
                {
                    error = GuardError(GuardErrorKind::Configuration,
                                       "Unknown relaunch strategy '" + strategy + "' for target " + target.name);
                    return false;
                }

                target.argument = (*entry)["argument"].value_or(std::string(target.name));
                parsed.push_back(std::move(target));
            }
            config.targets = std::move(parsed);
        }
    }
    catch (const toml::parse_error& pe)
    {
        std::string details = std::string(pe.description());
        if (pe.source().begin.line > 0)
        {
            details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + details;
        }
        error = GuardError(GuardErrorKind::Configuration, "Configuration file has errors",
                           details + "\nFile: " + config_path.string(), 0);
        return false;
    }

    out = std::move(config);
    return true;
}

fs::path GuardConfig::ResolveHomeDir()
{
    if (const char* env = std::getenv("FOCUSGUARD_HOME"); env && *env)
        return ExpandUser(env);
    return ExpandUser("~/.focusguard");
}

fs::path GuardConfig::ExpandUser(const std::string& path)
{
    if (path.empty() || path[0] != '~')
        return fs::path(path);

    std::string home;
    if (const char* env = std::getenv("HOME"); env && *env)
    {
        home = env;
    }
    else if (const passwd* pw = getpwuid(getuid()))
    {
        home = pw->pw_dir;
    }

    if (path.size() == 1)
        return fs::path(home);
    if (path[1] == '/')
        return fs::path(home) / path.substr(2);
    return fs::path(path);
}

std::string GuardConfig::CurrentUserName()
{
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_name && *pw->pw_name)
        return pw->pw_name;
    if (const char* env = std::getenv("USER"); env && *env)
        return env;
    return "user";
}

bool GuardConfig::ParseStrategy(const std::string& text, RelaunchStrategy& out)
{
    if (text == "spotlight")
    {
        out = RelaunchStrategy::Spotlight;
        return true;
    }
    if (text == "bundle_open")
    {
        out = RelaunchStrategy::BundleOpen;
        return true;
    }
    return false;
}

const char* GuardConfig::StrategyToString(RelaunchStrategy strategy)
{
    switch (strategy)
    {
    case RelaunchStrategy::Spotlight:
        return "spotlight";
    case RelaunchStrategy::BundleOpen:
        return "bundle_open";
    default:
        return "unknown";
    }
}

} // namespace focusguard
