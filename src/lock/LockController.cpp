#include "LockController.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <system_error>

namespace fs = std::filesystem;

namespace focusguard
{

namespace
{
constexpr fs::perms kWriteBits = fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write;
constexpr fs::perms kUnlockBits =
    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read;
} // namespace

bool LockController::lock(const fs::path& path, GuardError& error)
{
    if (!changePermissions(path, kWriteBits, fs::perm_options::remove, "lock", error))
        return false;

    PLOG_INFO << "Locked " << path.string();
    return true;
}

bool LockController::unlock(const fs::path& path, GuardError& error)
{
    if (!changePermissions(path, kUnlockBits, fs::perm_options::add, "unlock", error))
        return false;

    PLOG_INFO << "Unlocked " << path.string();
    return true;
}

bool LockController::isLocked(const fs::path& path) const
{
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status))
        return false;

    return (status.permissions() & kWriteBits) == fs::perms::none;
}

bool LockController::changePermissions(const fs::path& path, fs::perms perms, fs::perm_options options,
                                       const char* action, GuardError& error)
{
    if (path.empty())
    {
        error = GuardError(GuardErrorKind::Permission, std::string("Nothing to ") + action,
                           "controlling file path is empty", EINVAL);
        return false;
    }

    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        error = GuardError(GuardErrorKind::Permission, std::string("Failed to ") + action + " " + path.string(),
                           "file does not exist", ENOENT);
        return false;
    }

    fs::permissions(path, perms, options, ec);
    if (ec)
    {
        error = GuardError(GuardErrorKind::Permission, std::string("Failed to ") + action + " " + path.string(),
                           ec.message(), ec.value());
        return false;
    }
    return true;
}

} // namespace focusguard
