#pragma once

#include "IRelauncher.hpp"
#include "Osascript.hpp"

namespace focusguard
{

// Asks Terminal to run `open <bundle>` for a fixed application bundle path
class FixedBundleOpen : public IRelauncher
{
public:
    explicit FixedBundleOpen(std::string bundle_path, Osascript osascript = Osascript());

    bool relaunch(std::string& error_message) override;
    std::string describe() const override;

    std::string script() const;

private:
    std::string bundle_path_;
    Osascript osascript_;
};

} // namespace focusguard
