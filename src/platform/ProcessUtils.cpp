#include "ProcessUtils.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#include <cstdint>
#endif

namespace utils
{

std::filesystem::path ProcessUtils::GetExecutablePath()
{
#ifdef __APPLE__
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string buffer(size, '\0');
    if (_NSGetExecutablePath(buffer.data(), &size) != 0)
    {
        PLOG_ERROR << "_NSGetExecutablePath failed";
        return {};
    }
    buffer.resize(std::strlen(buffer.c_str()));

    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(buffer, ec);
    if (ec)
        return std::filesystem::path(buffer);
    return resolved;
#else
    std::error_code ec;
    auto exePath = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
    {
        PLOG_ERROR << "Failed to read /proc/self/exe: " << ec.message();
        return {};
    }
    return exePath;
#endif
}

int ProcessUtils::RunProcess(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                             std::string* output)
{
    if (exePath.empty() || !std::filesystem::exists(exePath))
    {
        PLOG_ERROR << "Invalid executable path: " << exePath.string();
        return -1;
    }

    // Everything the child needs is prepared here: between fork and exec it
    // only calls dup2, execv and _exit
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(exePath.c_str()));
    for (const auto& arg : args)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int pipefd[2] = {-1, -1};
    if (output)
    {
        if (pipe(pipefd) == -1)
        {
            PLOG_ERROR << "pipe() failed: " << strerror(errno);
            return -1;
        }
        // The exec'd program only sees the dup2'd stdout/stderr copies
        if (fcntl(pipefd[0], F_SETFD, FD_CLOEXEC) == -1 || fcntl(pipefd[1], F_SETFD, FD_CLOEXEC) == -1)
        {
            PLOG_ERROR << "fcntl(FD_CLOEXEC) failed: " << strerror(errno);
            close(pipefd[0]);
            close(pipefd[1]);
            return -1;
        }
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        PLOG_ERROR << "fork() failed: " << strerror(errno);
        if (output)
        {
            close(pipefd[0]);
            close(pipefd[1]);
        }
        return -1;
    }

    if (pid == 0)
    {
        if (output)
        {
            if (dup2(pipefd[1], STDOUT_FILENO) == -1 || dup2(pipefd[1], STDERR_FILENO) == -1)
            {
                _exit(127);
            }
        }

        execv(argv[0], argv.data());
        _exit(127);
    }

    if (output)
    {
        close(pipefd[1]);

        char buffer[512];
        ssize_t n = 0;
        while ((n = read(pipefd[0], buffer, sizeof(buffer))) != 0)
        {
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                PLOG_WARNING << "read() from child failed: " << strerror(errno);
                break;
            }
            output->append(buffer, static_cast<size_t>(n));
        }
        close(pipefd[0]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            PLOG_ERROR << "waitpid() failed: " << strerror(errno);
            return -1;
        }
    }

    if (WIFEXITED(status))
        return WEXITSTATUS(status);

    PLOG_WARNING << exePath.string() << " terminated by signal " << WTERMSIG(status);
    return -1;
}

} // namespace utils
