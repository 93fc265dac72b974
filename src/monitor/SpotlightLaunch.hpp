#pragma once

#include "IRelauncher.hpp"
#include "Osascript.hpp"

namespace focusguard
{

// Opens Spotlight with Cmd+Space, types the query and presses Return
class SpotlightLaunch : public IRelauncher
{
public:
    explicit SpotlightLaunch(std::string query, Osascript osascript = Osascript());

    bool relaunch(std::string& error_message) override;
    std::string describe() const override;

    std::string script() const;

private:
    std::string query_;
    Osascript osascript_;
};

} // namespace focusguard
