#include "Osascript.hpp"
#include "../platform/ProcessUtils.hpp"

#include <vector>

namespace focusguard
{

Osascript::Osascript(std::filesystem::path binary)
    : binary_(std::move(binary))
{
}

bool Osascript::run(const std::string& script, std::string& output) const
{
    output.clear();
    int status = utils::ProcessUtils::RunProcess(binary_, {"-e", script}, &output);

    while (!output.empty() && (output.back() == '\n' || output.back() == '\r'))
        output.pop_back();

    if (status != 0 && output.empty())
        output = "osascript exited with " + std::to_string(status);

    return status == 0;
}

std::string Osascript::Quote(const std::string& text)
{
    std::string quoted = "\"";
    for (char c : text)
    {
        if (c == '"' || c == '\\')
            quoted += '\\';
        quoted += c;
    }
    quoted += "\"";
    return quoted;
}

} // namespace focusguard
