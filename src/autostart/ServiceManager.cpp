#include "ServiceManager.hpp"
#include "../platform/ProcessUtils.hpp"

#include <string>
#include <vector>

namespace focusguard
{

LaunchctlServiceManager::LaunchctlServiceManager(std::filesystem::path launchctl)
    : launchctl_(std::move(launchctl))
{
}

bool LaunchctlServiceManager::load(const std::filesystem::path& descriptor, GuardError& error)
{
    return run("load", descriptor, error);
}

bool LaunchctlServiceManager::unload(const std::filesystem::path& descriptor, GuardError& error)
{
    return run("unload", descriptor, error);
}

bool LaunchctlServiceManager::run(const char* verb, const std::filesystem::path& descriptor, GuardError& error)
{
    std::vector<std::string> args{verb};
    if (std::string(verb) == "load")
        args.push_back("-w");
    args.push_back(descriptor.string());

    std::string output;
    int status = utils::ProcessUtils::RunProcess(launchctl_, args, &output);

    while (!output.empty() && (output.back() == '\n' || output.back() == '\r'))
        output.pop_back();

    // load/unload are silent on success. A refusal such as "service already
    // loaded" or "Could not find specified service" is printed with exit status 0.
    if (status != 0 || !output.empty())
    {
        std::string details = launchctl_.string() + " " + verb + " exited with " + std::to_string(status);
        if (!output.empty())
            details += ": " + output;
        error = GuardError(GuardErrorKind::ServiceManager, std::string("launchd refused to ") + verb + " the monitor",
                           details, status);
        return false;
    }

    return true;
}

} // namespace focusguard
