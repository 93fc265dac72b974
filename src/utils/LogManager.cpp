#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../log/AppendPerLineAppender.hpp"
#include "../log/GuardLineFormatter.hpp"

#include <system_error>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>

namespace utils
{

bool LogManager::s_initialized = false;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(plog::Severity default_level, const std::filesystem::path& log_dir)
{
    if (s_initialized)
        return true;

    s_default_level = default_level;

    if (!PrepareLogDirectory(log_dir))
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    // plog keeps one logger per instance id for the life of the process
    static bool registered = false;
    if (registered)
        return true;

    try
    {
        auto file_appender = std::make_unique<AppendPerLineAppender<GuardLineFormatter>>(config.filepath);

        plog::Severity level = config.level_override.value_or(s_default_level);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<GuardLineFormatter>>();
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        registered = true;
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<LogManager::kMainLogInstance>(const LoggerConfig&);

bool LogManager::PrepareLogDirectory(const std::filesystem::path& log_dir)
{
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     log_dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
