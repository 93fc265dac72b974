#pragma once

#include "Osascript.hpp"

#include <string>

namespace focusguard
{

class INotifier
{
public:
    virtual ~INotifier() = default;
    virtual bool notify(const std::string& title, const std::string& message, std::string& error_message) = 0;
};

// Notification Center banner through `display notification`
class OsascriptNotifier : public INotifier
{
public:
    explicit OsascriptNotifier(Osascript osascript = Osascript())
        : osascript_(std::move(osascript))
    {
    }

    bool notify(const std::string& title, const std::string& message, std::string& error_message) override
    {
        std::string output;
        if (!osascript_.run("display notification " + Osascript::Quote(message) + " with title " +
                                Osascript::Quote(title),
                            output))
        {
            error_message = output;
            return false;
        }
        return true;
    }

private:
    Osascript osascript_;
};

} // namespace focusguard
