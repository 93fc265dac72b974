#pragma once

#include "../utils/GuardError.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace focusguard
{

class IPasswordPrompt;

// Single-file password gate. The record holds the SHA-256 hex digest of the
// secret followed by a newline. It is written once and never modified.
class CredentialStore
{
public:
    explicit CredentialStore(std::filesystem::path record_path);

    // True when the record exists and holds a well-formed digest
    bool isConfigured() const;

    // Prompt twice and persist the digest. Refuses to replace an existing record.
    bool setup(IPasswordPrompt& prompt, GuardError& error);

    bool verify(IPasswordPrompt& prompt, GuardError& error) const;

    const std::filesystem::path& recordPath() const { return record_path_; }

    static std::string HashSecret(const std::string& secret);
    static bool IsValidDigest(const std::string& digest);

private:
    std::optional<std::string> readRecord() const;
    bool writeRecord(const std::string& digest, GuardError& error);

    std::filesystem::path record_path_;
};

} // namespace focusguard
