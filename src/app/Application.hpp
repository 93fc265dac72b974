#pragma once

#include "../config/GuardConfig.hpp"
#include "../utils/GuardError.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace utils
{
enum class ErrorCategory;
}

namespace focusguard
{

class IPasswordPrompt;
class IServiceManager;
class CredentialStore;
class LockController;
class LaunchAgentRegistrar;

struct ApplicationServices
{
    std::unique_ptr<IPasswordPrompt> prompt;
    std::unique_ptr<IServiceManager> service_manager;
    std::filesystem::path executable; // what the launcher script execs

    static ApplicationServices Defaults();
};

// Command dispatcher: setup (no arguments), start, stop, status.
// Every command runs its steps in order and stops at the first failure.
class Application
{
public:
    Application(GuardConfig config, ApplicationServices services);
    ~Application();

    int run(const std::vector<std::string>& args);

    // Process entry point: resolves the home directory, loads config, sets up
    // logging and runs the command line
    static int Main(int argc, char** argv);

    const GuardError& lastError() const { return last_error_; }
    const GuardConfig& config() const { return config_; }

private:
    int runSetup();
    int runStart();
    int runStop();
    int runStatus();
    int printUsage();

    int fail(utils::ErrorCategory category, const GuardError& error);
    void flushErrors();

    GuardConfig config_;
    ApplicationServices services_;
    std::unique_ptr<CredentialStore> credentials_;
    std::unique_ptr<LockController> lock_;
    std::unique_ptr<LaunchAgentRegistrar> registrar_;
    GuardError last_error_;
};

} // namespace focusguard
