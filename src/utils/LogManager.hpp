#pragma once

#include <filesystem>
#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    static constexpr int kMainLogInstance = 0;

    struct LoggerConfig
    {
        std::string name;
        std::filesystem::path filepath;
        std::optional<plog::Severity> level_override;
        bool add_console_appender = false;
    };

    static bool Initialize(plog::Severity default_level, const std::filesystem::path& log_dir);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static bool PrepareLogDirectory(const std::filesystem::path& log_dir);

private:
    LogManager() = default;

    static bool s_initialized;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
