#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace utils
{

// POSIX process helpers used by the service manager and the relaunchers
class ProcessUtils
{
public:
    // Get the absolute path to the current executable
    static std::filesystem::path GetExecutablePath();

    // Run a program and wait for it to finish.
    // Returns the exit status, or -1 if the program could not be started or
    // was killed by a signal. When output is non-null it receives everything
    // the child wrote to stdout and stderr.
    static int RunProcess(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                          std::string* output = nullptr);
};

} // namespace utils
