#include "PasswordPrompt.hpp"

#include <iostream>

#include <termios.h>
#include <unistd.h>

namespace focusguard
{

namespace
{

// Restores the saved terminal mode on every exit path
class EchoGuard
{
public:
    EchoGuard()
    {
        if (tcgetattr(STDIN_FILENO, &saved_) != 0)
            return;

        termios silent = saved_;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
    }

    ~EchoGuard()
    {
        if (active_)
            tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

private:
    termios saved_{};
    bool active_ = false;
};

void trimLineEnding(std::string& line)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
}

} // namespace

bool TerminalPasswordPrompt::read(const std::string& label, std::string& out)
{
    out.clear();
    std::cout << label << std::flush;

    if (!isatty(STDIN_FILENO))
    {
        if (!std::getline(std::cin, out))
            return false;
        trimLineEnding(out);
        return true;
    }

    bool ok = false;
    {
        EchoGuard guard;
        ok = static_cast<bool>(std::getline(std::cin, out));
    }
    std::cout << std::endl;

    if (!ok)
        return false;

    trimLineEnding(out);
    return true;
}

} // namespace focusguard
