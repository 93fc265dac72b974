#include "CredentialStore.hpp"
#include "PasswordPrompt.hpp"

#include <picosha2.h>
#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace focusguard
{

CredentialStore::CredentialStore(fs::path record_path)
    : record_path_(std::move(record_path))
{
}

bool CredentialStore::isConfigured() const
{
    return readRecord().has_value();
}

bool CredentialStore::setup(IPasswordPrompt& prompt, GuardError& error)
{
    std::error_code ec;
    if (fs::exists(record_path_, ec))
    {
        error = GuardError(GuardErrorKind::Write, "A password is already set", record_path_.string(), EEXIST);
        return false;
    }

    std::string first;
    std::string second;
    if (!prompt.read("Set a password: ", first) || !prompt.read("Confirm password: ", second))
    {
        error = GuardError(GuardErrorKind::Mismatch, "Password entry was cancelled");
        return false;
    }

    if (first != second)
    {
        error = GuardError(GuardErrorKind::Mismatch, "Passwords do not match");
        return false;
    }

    if (!writeRecord(HashSecret(first), error))
        return false;

    PLOG_INFO << "Password configured";
    return true;
}

bool CredentialStore::verify(IPasswordPrompt& prompt, GuardError& error) const
{
    auto stored = readRecord();
    if (!stored)
    {
        error = GuardError(GuardErrorKind::MissingCredential, "No password set. Run without arguments first.",
                           record_path_.string(), ENOENT);
        return false;
    }

    std::string entered;
    if (!prompt.read("Password: ", entered))
    {
        error = GuardError(GuardErrorKind::Authentication, "Password entry was cancelled");
        return false;
    }

    if (HashSecret(entered) != *stored)
    {
        error = GuardError(GuardErrorKind::Authentication, "Wrong password");
        return false;
    }

    return true;
}

std::string CredentialStore::HashSecret(const std::string& secret)
{
    return picosha2::hash256_hex_string(secret);
}

bool CredentialStore::IsValidDigest(const std::string& digest)
{
    return digest.size() == 2 * picosha2::k_digest_size &&
           std::all_of(digest.begin(), digest.end(),
                       [](unsigned char c) { return std::isdigit(c) || (c >= 'a' && c <= 'f'); });
}

std::optional<std::string> CredentialStore::readRecord() const
{
    std::ifstream file(record_path_);
    if (!file.is_open())
        return std::nullopt;

    std::string digest;
    std::getline(file, digest);
    while (!digest.empty() && std::isspace(static_cast<unsigned char>(digest.back())))
        digest.pop_back();

    if (!IsValidDigest(digest))
    {
        PLOG_WARNING << "Ignoring malformed password record: " << record_path_.string();
        return std::nullopt;
    }
    return digest;
}

bool CredentialStore::writeRecord(const std::string& digest, GuardError& error)
{
    std::error_code ec;
    fs::create_directories(record_path_.parent_path(), ec);
    if (ec)
    {
        error = GuardError(GuardErrorKind::Write, "Failed to create the state directory",
                           record_path_.parent_path().string() + ": " + ec.message(), ec.value());
        return false;
    }

    {
        std::ofstream file(record_path_, std::ios::trunc);
        if (!file)
        {
            error = GuardError(GuardErrorKind::Write, "Failed to write the password record",
                               record_path_.string() + ": " + std::strerror(errno), errno);
            return false;
        }
        file << digest << '\n';
        file.close();
        if (!file)
        {
            error = GuardError(GuardErrorKind::Write, "Failed to write the password record", record_path_.string(),
                               EIO);
            return false;
        }
    }

    fs::permissions(record_path_, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec)
    {
        PLOG_WARNING << "Could not restrict permissions on " << record_path_.string() << ": " << ec.message();
    }
    return true;
}

} // namespace focusguard
