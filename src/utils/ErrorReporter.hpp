#pragma once

#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization,   // logging, state directory
    Credential,       // password setup / verification
    Lock,             // controller permission toggling
    Autostart,        // launch agent install, launchctl
    Monitor,          // relaunch and notification failures
    ProcessDetection, // process table scan
    Configuration,    // TOML parsing, invalid config
    Unknown
};

enum class ErrorSeverity
{
    Warning, // degraded, the command or loop carries on
    Error    // the command aborts with exit status 1
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Error;
    std::string user_message;      // printed to stderr by the dispatcher
    std::string technical_details; // log file only
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Every report goes to the plog log with its category and details, and is
 * queued so the command dispatcher can print the user message before it
 * exits. The monitor never flushes; its queue only bounds memory.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Lock,
 *                              "Failed to lock controller",
 *                              "chmod: Operation not permitted");
 *   ...
 *   ErrorReporter::Flush(std::cerr);
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                       const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Take all queued reports, oldest first, and empty the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    /**
     * @brief Print every queued report as "Error: ..." or "Warning: ..." and
     * empty the queue. Returns the number of Error-severity reports printed.
     */
    static std::size_t Flush(std::ostream& out);

    static void ClearErrors();

    static std::string FormatForConsole(const ErrorReport& report);
    static std::string CategoryToString(ErrorCategory category);

    // Current local time as "YYYY-MM-DD HH:MM:SS"
    static std::string GetTimestamp();

    static constexpr std::size_t kMaxQueueSize = 100;

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
};

} // namespace utils
