#include "IRelauncher.hpp"
#include "SpotlightLaunch.hpp"
#include "FixedBundleOpen.hpp"

#include <memory>

namespace focusguard
{
std::unique_ptr<IRelauncher> createRelauncher(RelaunchStrategy strategy, const std::string& argument)
{
    switch (strategy)
    {
    case RelaunchStrategy::Spotlight:
        return std::make_unique<SpotlightLaunch>(argument);
    case RelaunchStrategy::BundleOpen:
        return std::make_unique<FixedBundleOpen>(argument);
    default:
        return nullptr;
    }
}
} // namespace focusguard
