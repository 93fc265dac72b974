#include "Application.hpp"
#include "../autostart/LaunchAgentRegistrar.hpp"
#include "../autostart/ServiceManager.hpp"
#include "../credential/CredentialStore.hpp"
#include "../credential/PasswordPrompt.hpp"
#include "../lock/LockController.hpp"
#include "../platform/ProcessUtils.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <iostream>

namespace focusguard
{

ApplicationServices ApplicationServices::Defaults()
{
    ApplicationServices services;
    services.prompt = std::make_unique<TerminalPasswordPrompt>();
    services.service_manager = std::make_unique<LaunchctlServiceManager>();
    services.executable = utils::ProcessUtils::GetExecutablePath();
    return services;
}

Application::Application(GuardConfig config, ApplicationServices services)
    : config_(std::move(config))
    , services_(std::move(services))
    , credentials_(std::make_unique<CredentialStore>(config_.credentialPath()))
    , lock_(std::make_unique<LockController>())
    , registrar_(std::make_unique<LaunchAgentRegistrar>(ServiceSpec::FromConfig(config_, services_.executable),
                                                        *services_.service_manager))
{
}

Application::~Application() = default;

int Application::Main(int argc, char** argv)
{
    const auto home_dir = GuardConfig::ResolveHomeDir();

    GuardConfig config;
    GuardError config_error;
    const bool config_ok = GuardConfig::Load(home_dir, config, config_error);
    if (!config_ok)
        config = GuardConfig::Defaults(home_dir);

    if (utils::LogManager::Initialize(static_cast<plog::Severity>(config.log_level), config.home_dir))
    {
        utils::LogManager::RegisterLogger<utils::LogManager::kMainLogInstance>(
            {.name = "main",
             .filepath = config.logPath(),
             .level_override = std::nullopt,
             .add_console_appender = config.log_to_console});
    }

    if (!config_ok)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, config_error.message,
                                          config_error.technicalInfo);
        utils::ErrorReporter::Flush(std::cerr);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    Application app(std::move(config), ApplicationServices::Defaults());
    return app.run(args);
}

int Application::run(const std::vector<std::string>& args)
{
    last_error_ = GuardError();

    int status = 1;
    if (args.empty())
        status = runSetup();
    else if (args.size() == 1 && args[0] == "start")
        status = runStart();
    else if (args.size() == 1 && args[0] == "stop")
        status = runStop();
    else if (args.size() == 1 && args[0] == "status")
        status = runStatus();
    else
        status = printUsage();

    flushErrors();
    return status;
}

int Application::runSetup()
{
    if (credentials_->isConfigured())
    {
        std::cout << "Password already set. Use 'focusguard start' or 'focusguard stop'." << std::endl;
        return 1;
    }

    GuardError error;
    if (!credentials_->setup(*services_.prompt, error))
        return fail(utils::ErrorCategory::Credential, error);

    std::cout << "Password saved. Run 'focusguard start' to begin monitoring." << std::endl;
    return 0;
}

int Application::runStart()
{
    GuardError error;
    if (!credentials_->verify(*services_.prompt, error))
        return fail(utils::ErrorCategory::Credential, error);

    if (!registrar_->install(error))
        return fail(utils::ErrorCategory::Autostart, error);

    if (!registrar_->activate(error))
        return fail(utils::ErrorCategory::Autostart, error);

    // Locking stays the last step so a failed start leaves the file writable
    if (!lock_->lock(config_.lock_target, error))
        return fail(utils::ErrorCategory::Lock, error);

    PLOG_INFO << "Monitoring started";
    std::cout << "Monitoring started." << std::endl;
    return 0;
}

int Application::runStop()
{
    GuardError error;
    if (!credentials_->verify(*services_.prompt, error))
        return fail(utils::ErrorCategory::Credential, error);

    if (!registrar_->deactivate(error))
        return fail(utils::ErrorCategory::Autostart, error);

    if (!lock_->unlock(config_.lock_target, error))
        return fail(utils::ErrorCategory::Lock, error);

    PLOG_INFO << "Monitoring stopped";
    std::cout << "Monitoring stopped." << std::endl;
    return 0;
}

int Application::runStatus()
{
    std::cout << "password:     " << (credentials_->isConfigured() ? "set" : "not set") << "\n"
              << "launch agent: " << (registrar_->isInstalled() ? "installed" : "not installed") << " ("
              << registrar_->spec().descriptor_path.string() << ")\n"
              << "controller:   " << (lock_->isLocked(config_.lock_target) ? "locked" : "writable") << " ("
              << config_.lock_target.string() << ")\n"
              << "targets:\n";
    for (const auto& target : config_.targets)
    {
        std::cout << "  " << target.name << " [" << GuardConfig::StrategyToString(target.strategy) << "] "
                  << target.argument << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int Application::printUsage()
{
    std::cout << "Usage: focusguard [start|stop|status]\n"
              << "  (no arguments)  set the password on first run\n"
              << "  start           verify password, install and load the monitor, lock the controller\n"
              << "  stop            verify password, unload the monitor, unlock the controller\n"
              << "  status          show password, launch agent and lock state" << std::endl;
    return 1;
}

int Application::fail(utils::ErrorCategory category, const GuardError& error)
{
    last_error_ = error;

    std::string details = ToString(error.kind);
    if (!error.technicalInfo.empty())
        details += ": " + error.technicalInfo;

    utils::ErrorReporter::ReportError(category, error.message, details);
    return 1;
}

void Application::flushErrors()
{
    utils::ErrorReporter::Flush(std::cerr);
}

} // namespace focusguard
