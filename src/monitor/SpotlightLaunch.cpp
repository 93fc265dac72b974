#include "SpotlightLaunch.hpp"

#include <sstream>

namespace focusguard
{

SpotlightLaunch::SpotlightLaunch(std::string query, Osascript osascript)
    : query_(std::move(query))
    , osascript_(std::move(osascript))
{
}

bool SpotlightLaunch::relaunch(std::string& error_message)
{
    std::string output;
    if (!osascript_.run(script(), output))
    {
        error_message = output;
        return false;
    }
    return true;
}

std::string SpotlightLaunch::describe() const
{
    return "spotlight \"" + query_ + "\"";
}

std::string SpotlightLaunch::script() const
{
    // key code 49 is Space, 36 is Return
    std::ostringstream out;
    out << "tell application \"System Events\"\n"
        << "    key code 49 using {command down}\n"
        << "    delay 0.5\n"
        << "    keystroke " << Osascript::Quote(query_) << "\n"
        << "    delay 0.5\n"
        << "    key code 36\n"
        << "end tell";
    return out.str();
}

} // namespace focusguard
