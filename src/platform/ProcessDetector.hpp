#pragma once

#include <cstddef>
#include <string>
#include <vector>

class ProcessDetector
{
public:
    // Case-insensitive exact match against the short process name
    static bool isProcessRunning(const std::string& processName);

    static std::vector<std::string> listProcessNames();

    static bool namesMatch(const std::string& lhs, const std::string& rhs);

    // The kernel keeps a truncated short name: 15 bytes in /proc/<pid>/comm,
    // 2 * MAXCOMLEN bytes from proc_name(). Longer targets are compared by
    // that prefix.
#ifdef __APPLE__
    static constexpr std::size_t kMaxNameLength = 32;
#else
    static constexpr std::size_t kMaxNameLength = 15;
#endif
    static std::string comparableName(const std::string& processName);

private:
#ifdef __APPLE__
    static std::vector<std::string> listProcessNamesDarwin();
#else
    static std::vector<std::string> listProcessNamesProc();
#endif
};
