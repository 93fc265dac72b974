#include "FixedBundleOpen.hpp"

#include <sstream>

namespace focusguard
{

FixedBundleOpen::FixedBundleOpen(std::string bundle_path, Osascript osascript)
    : bundle_path_(std::move(bundle_path))
    , osascript_(std::move(osascript))
{
}

bool FixedBundleOpen::relaunch(std::string& error_message)
{
    std::string output;
    if (!osascript_.run(script(), output))
    {
        error_message = output;
        return false;
    }
    return true;
}

std::string FixedBundleOpen::describe() const
{
    return "open " + bundle_path_;
}

std::string FixedBundleOpen::script() const
{
    std::ostringstream out;
    out << "tell application \"Terminal\" to do script \"open \" & quoted form of "
        << Osascript::Quote(bundle_path_);
    return out.str();
}

} // namespace focusguard
