#include "MonitorService.hpp"
#include "IRelauncher.hpp"
#include "IProcessProbe.hpp"
#include "INotifier.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>

namespace focusguard
{

namespace
{
std::atomic<bool> g_keep_running{true};

void onSignal(int)
{
    g_keep_running = false;
}
} // namespace

std::vector<MonitorTarget> MonitorService::BuildTargets(const std::vector<TargetConfig>& targets)
{
    std::vector<MonitorTarget> built;
    built.reserve(targets.size());
    for (const auto& target : targets)
    {
        auto relauncher = createRelauncher(target.strategy, target.argument);
        if (!relauncher)
        {
            PLOG_WARNING << "Skipping target " << target.name << ": no relauncher for strategy "
                         << GuardConfig::StrategyToString(target.strategy);
            continue;
        }
        built.push_back({target.name, std::move(relauncher)});
    }
    return built;
}

int MonitorService::RunMonitorProcess(int argc, char** argv)
{
    std::filesystem::path home_dir;
    for (int i = 2; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--home") == 0 && i + 1 < argc)
            home_dir = argv[++i];
    }
    if (home_dir.empty())
        home_dir = GuardConfig::ResolveHomeDir();

    GuardConfig config;
    GuardError config_error;
    bool config_ok = GuardConfig::Load(home_dir, config, config_error);
    if (!config_ok)
    {
        // launchd restarts us on exit, so keep running with defaults instead
        config = GuardConfig::Defaults(home_dir);
    }

    if (!utils::LogManager::Initialize(static_cast<plog::Severity>(config.log_level), config.home_dir) ||
        !utils::LogManager::RegisterLogger<utils::LogManager::kMainLogInstance>(
            {.name = "monitor", .filepath = config.logPath(), .level_override = std::nullopt,
             .add_console_appender = false}))
    {
        std::cerr << "focusguard monitor: unable to open " << config.logPath().string() << std::endl;
    }

    if (!config_ok)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            config_error.message + ", using defaults", config_error.technicalInfo);
    }

    auto targets = BuildTargets(config.targets);
    if (targets.empty())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Monitor, "No targets configured, nothing to watch");
    }

    std::signal(SIGTERM, onSignal);
    std::signal(SIGINT, onSignal);

    SystemProcessProbe probe;
    OsascriptNotifier notifier;
    MonitorLoop loop(config.monitor, std::move(targets), probe, notifier);
    return loop.run(g_keep_running);
}

} // namespace focusguard
