#pragma once

#include "../platform/ProcessDetector.hpp"

#include <string>

namespace focusguard
{

class IProcessProbe
{
public:
    virtual ~IProcessProbe() = default;
    virtual bool isRunning(const std::string& process_name) = 0;
};

class SystemProcessProbe : public IProcessProbe
{
public:
    bool isRunning(const std::string& process_name) override
    {
        return ProcessDetector::isProcessRunning(process_name);
    }
};

} // namespace focusguard
