#pragma once

#include <filesystem>
#include <string>

namespace focusguard
{

// Thin wrapper over /usr/bin/osascript, the automation entry point used for
// relaunching targets and posting notifications.
class Osascript
{
public:
    explicit Osascript(std::filesystem::path binary = "/usr/bin/osascript");

    // Runs the script with -e. Returns true on exit status 0.
    bool run(const std::string& script, std::string& output) const;

    // AppleScript string literal, quotes and backslashes escaped
    static std::string Quote(const std::string& text);

private:
    std::filesystem::path binary_;
};

} // namespace focusguard
