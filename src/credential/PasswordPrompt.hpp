#pragma once

#include <string>

namespace focusguard
{

class IPasswordPrompt
{
public:
    virtual ~IPasswordPrompt() = default;

    // Show label and read one secret. Returns false on EOF or read error.
    virtual bool read(const std::string& label, std::string& out) = 0;
};

// Reads from stdin. Echo is turned off while a TTY is attached; piped input
// is read as a plain line.
class TerminalPasswordPrompt : public IPasswordPrompt
{
public:
    bool read(const std::string& label, std::string& out) override;
};

} // namespace focusguard
