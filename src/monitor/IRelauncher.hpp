#pragma once

#include "../config/GuardConfig.hpp"

#include <memory>
#include <string>

namespace focusguard
{

class IRelauncher
{
public:
    virtual ~IRelauncher() = default;

    // Attempt to bring the target back. Returns false and fills error_message
    // when the automation call reports failure.
    virtual bool relaunch(std::string& error_message) = 0;

    virtual std::string describe() const = 0;
};

// Factory function to create relaunchers based on the configured strategy
std::unique_ptr<IRelauncher> createRelauncher(RelaunchStrategy strategy, const std::string& argument);

} // namespace focusguard
