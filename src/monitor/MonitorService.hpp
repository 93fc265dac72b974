#pragma once

#include "MonitorLoop.hpp"

#include <filesystem>
#include <vector>

namespace focusguard
{

class MonitorService
{
public:
    // Entry point for `focusguard --monitor-internal-mode --home <dir>`.
    // Started by the launcher script under launchd; does not return until
    // SIGTERM/SIGINT.
    static int RunMonitorProcess(int argc, char** argv);

    static std::vector<MonitorTarget> BuildTargets(const std::vector<TargetConfig>& targets);

    static constexpr const char* kInternalModeFlag = "--monitor-internal-mode";
};

} // namespace focusguard
