#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_error_queue;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
{
}

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                           const std::string& technical_details)
{
    std::string log_msg = "[" + CategoryToString(category) + "] " + user_message;
    if (!technical_details.empty())
        log_msg += " | " + technical_details;

    if (severity == ErrorSeverity::Warning)
        PLOG_WARNING << log_msg;
    else
        PLOG_ERROR << log_msg;

    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.emplace_back(category, severity, user_message, technical_details);

    // Oldest reports go first when nobody drains the queue
    if (s_error_queue.size() > kMaxQueueSize)
        s_error_queue.erase(s_error_queue.begin());
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    Report(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    Report(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> errors;
    errors.swap(s_error_queue);
    return errors;
}

std::size_t ErrorReporter::Flush(std::ostream& out)
{
    std::size_t errors = 0;
    for (const auto& report : GetPendingErrors())
    {
        out << FormatForConsole(report) << '\n';
        if (report.severity == ErrorSeverity::Error)
            ++errors;
    }
    out.flush();
    return errors;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
}

std::string ErrorReporter::FormatForConsole(const ErrorReport& report)
{
    return (report.severity == ErrorSeverity::Warning ? "Warning: " : "Error: ") + report.user_message;
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "init";
    case ErrorCategory::Credential:
        return "credential";
    case ErrorCategory::Lock:
        return "lock";
    case ErrorCategory::Autostart:
        return "autostart";
    case ErrorCategory::Monitor:
        return "monitor";
    case ErrorCategory::ProcessDetection:
        return "process";
    case ErrorCategory::Configuration:
        return "config";
    default:
        return "unknown";
    }
}

std::string ErrorReporter::GetTimestamp()
{
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf{};
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
