#include "ProcessDetector.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <algorithm>
#include <atomic>
#include <cctype>

#ifdef __APPLE__
#include <libproc.h>
#include <sys/param.h>
#include <sys/proc_info.h>
#include <cerrno>
#include <cstring>
#else
#include <filesystem>
#include <fstream>
#include <system_error>
#endif

bool ProcessDetector::isProcessRunning(const std::string& processName)
{
    if (processName.empty())
        return false;

    const std::string wanted = comparableName(processName);
    const auto names = listProcessNames();
    return std::any_of(names.begin(), names.end(),
                       [&](const std::string& name) { return namesMatch(name, wanted); });
}

std::string ProcessDetector::comparableName(const std::string& processName)
{
    return processName.substr(0, kMaxNameLength);
}

bool ProcessDetector::namesMatch(const std::string& lhs, const std::string& rhs)
{
    if (lhs.size() != rhs.size())
        return false;

    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b)
                      { return std::tolower(a) == std::tolower(b); });
}

std::vector<std::string> ProcessDetector::listProcessNames()
{
#ifdef __APPLE__
    return listProcessNamesDarwin();
#else
    return listProcessNamesProc();
#endif
}

#ifdef __APPLE__
namespace {
    std::atomic<bool> g_listpids_warning_reported{false};
}

std::vector<std::string> ProcessDetector::listProcessNamesDarwin()
{
    std::vector<std::string> names;

    int bytes = proc_listallpids(nullptr, 0);
    if (bytes <= 0)
    {
        if (!g_listpids_warning_reported.exchange(true))
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ProcessDetection,
                "Process scan failed",
                std::string("proc_listallpids: ") + std::strerror(errno));
        }
        return names;
    }

    // Leave headroom for processes spawned between the two calls
    std::vector<pid_t> pids(static_cast<size_t>(bytes) / sizeof(pid_t) + 64);
    int count = proc_listallpids(pids.data(), static_cast<int>(pids.size() * sizeof(pid_t)));
    if (count <= 0)
        return names;

    pids.resize(static_cast<size_t>(count));
    names.reserve(pids.size());

    char name_buffer[2 * MAXCOMLEN + 1];
    for (pid_t pid : pids)
    {
        if (pid <= 0)
            continue;

        int len = proc_name(pid, name_buffer, sizeof(name_buffer));
        if (len <= 0)
            continue;

        names.emplace_back(name_buffer, static_cast<size_t>(len));
    }
    return names;
}
#else
namespace {
    std::atomic<bool> g_procdir_warning_reported{false};
}

std::vector<std::string> ProcessDetector::listProcessNamesProc()
{
    std::vector<std::string> names;
    std::filesystem::path proc_dir("/proc");

    std::error_code ec;
    if (!std::filesystem::exists(proc_dir, ec))
    {
        if (!g_procdir_warning_reported.exchange(true))
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ProcessDetection,
                "Process scan unavailable",
                "/proc directory not found");
        }
        return names;
    }

    // Processes come and go during the scan, so only the non-throwing
    // iterator API is used
    std::filesystem::directory_iterator it(proc_dir, ec);
    for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec))
    {
        std::string dirname = it->path().filename().string();
        if (dirname.empty() ||
            !std::all_of(dirname.begin(), dirname.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
            continue;

        std::ifstream comm_file(it->path() / "comm");
        if (!comm_file.is_open())
            continue;

        std::string current_name;
        if (std::getline(comm_file, current_name))
            names.push_back(std::move(current_name));
    }

    if (ec)
    {
        PLOG_WARNING << "Scanning /proc failed: " << ec.message();
    }
    return names;
}
#endif
