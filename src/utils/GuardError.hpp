#pragma once

#include <string>

namespace focusguard
{

enum class GuardErrorKind
{
    None,
    Mismatch, // setup: the two password entries differ
    MissingCredential, // no (valid) password hash on disk
    Authentication, // entered password does not match the stored hash
    Write, // file or directory creation failed
    Permission, // lock/unlock refused by the filesystem
    ServiceManager, // launchctl rejected a load/unload
    Configuration // config.toml could not be parsed or is invalid
};

// Error information for a failed command step
struct GuardError
{
    GuardErrorKind kind; // What went wrong
    std::string message; // Human-readable error message
    std::string technicalInfo; // Technical details for logging
    int errorCode; // errno or process exit status, 0 if not applicable

    GuardError()
        : kind(GuardErrorKind::None)
        , errorCode(0)
    {
    }

    GuardError(GuardErrorKind k, const std::string& msg)
        : kind(k)
        , message(msg)
        , errorCode(0)
    {
    }

    GuardError(GuardErrorKind k, const std::string& msg, const std::string& tech, int code)
        : kind(k)
        , message(msg)
        , technicalInfo(tech)
        , errorCode(code)
    {
    }

    bool ok() const { return kind == GuardErrorKind::None; }
};

inline const char* ToString(GuardErrorKind kind)
{
    switch (kind)
    {
    case GuardErrorKind::None:
        return "None";
    case GuardErrorKind::Mismatch:
        return "MismatchError";
    case GuardErrorKind::MissingCredential:
        return "MissingCredentialError";
    case GuardErrorKind::Authentication:
        return "AuthenticationError";
    case GuardErrorKind::Write:
        return "WriteError";
    case GuardErrorKind::Permission:
        return "PermissionError";
    case GuardErrorKind::ServiceManager:
        return "ServiceManagerError";
    case GuardErrorKind::Configuration:
        return "ConfigurationError";
    default:
        return "UnknownError";
    }
}

} // namespace focusguard
