#pragma once

#include "../utils/GuardError.hpp"

#include <filesystem>

namespace focusguard
{

class IServiceManager
{
public:
    virtual ~IServiceManager() = default;
    virtual bool load(const std::filesystem::path& descriptor, GuardError& error) = 0;
    virtual bool unload(const std::filesystem::path& descriptor, GuardError& error) = 0;
};

// Per-user launchd through the launchctl command line tool. Any output from
// load/unload counts as a rejection, whatever the exit status.
class LaunchctlServiceManager : public IServiceManager
{
public:
    explicit LaunchctlServiceManager(std::filesystem::path launchctl = "/bin/launchctl");

    bool load(const std::filesystem::path& descriptor, GuardError& error) override;
    bool unload(const std::filesystem::path& descriptor, GuardError& error) override;

private:
    bool run(const char* verb, const std::filesystem::path& descriptor, GuardError& error);

    std::filesystem::path launchctl_;
};

} // namespace focusguard
