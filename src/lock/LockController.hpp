#pragma once

#include "../utils/GuardError.hpp"

#include <filesystem>

namespace focusguard
{

// Toggles write permission on the controlling file while the monitor runs.
// This only deters casual edits: the owner can chmod the file back at any time,
// so it is not access control.
class LockController
{
public:
    // Clear every write bit (read-only for owner, group and others)
    bool lock(const std::filesystem::path& path, GuardError& error);

    // Owner write plus group/other read. Execute bits are left alone.
    // The pre-lock mode is not recorded, so a lock/unlock round trip only
    // restores 0644 and 0755 style files exactly: 0600 comes back as 0644 and
    // 0775 as 0755.
    bool unlock(const std::filesystem::path& path, GuardError& error);

    bool isLocked(const std::filesystem::path& path) const;

private:
    bool changePermissions(const std::filesystem::path& path, std::filesystem::perms perms,
                           std::filesystem::perm_options options, const char* action, GuardError& error);
};

} // namespace focusguard
