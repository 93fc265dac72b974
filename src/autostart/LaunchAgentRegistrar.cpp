#include "LaunchAgentRegistrar.hpp"
#include "ServiceManager.hpp"
#include "../config/GuardConfig.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace focusguard
{

ServiceSpec ServiceSpec::FromConfig(const GuardConfig& config, const fs::path& executable)
{
    ServiceSpec spec;
    spec.label = config.serviceLabel();
    spec.executable = executable;
    spec.home_dir = config.home_dir;
    spec.script_path = config.monitorScriptPath();
    spec.descriptor_path = config.descriptorPath();
    spec.output_path = config.monitorOutputPath();
    return spec;
}

LaunchAgentRegistrar::LaunchAgentRegistrar(ServiceSpec spec, IServiceManager& manager)
    : spec_(std::move(spec))
    , manager_(manager)
{
}

bool LaunchAgentRegistrar::install(GuardError& error)
{
    const auto script_perms = fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                              fs::perms::others_read | fs::perms::others_exec;
    const auto descriptor_perms =
        fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read;

    if (!writeFile(spec_.script_path, RenderLauncherScript(spec_), script_perms, error))
        return false;

    if (!writeFile(spec_.descriptor_path, RenderDescriptor(spec_), descriptor_perms, error))
        return false;

    PLOG_INFO << "Installed launch agent " << spec_.label << " at " << spec_.descriptor_path.string();
    return true;
}

bool LaunchAgentRegistrar::activate(GuardError& error)
{
    if (!manager_.load(spec_.descriptor_path, error))
        return false;

    PLOG_INFO << "Loaded launch agent " << spec_.label;
    return true;
}

bool LaunchAgentRegistrar::deactivate(GuardError& error)
{
    if (!manager_.unload(spec_.descriptor_path, error))
        return false;

    PLOG_INFO << "Unloaded launch agent " << spec_.label << " (descriptor left in place)";
    return true;
}

bool LaunchAgentRegistrar::isInstalled() const
{
    std::error_code ec;
    return fs::is_regular_file(spec_.descriptor_path, ec);
}

std::string LaunchAgentRegistrar::RenderDescriptor(const ServiceSpec& spec)
{
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" "
           "\"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
        << "<plist version=\"1.0\">\n"
        << "<dict>\n"
        << "    <key>Label</key>\n"
        << "    <string>" << EscapeXml(spec.label) << "</string>\n"
        << "    <key>ProgramArguments</key>\n"
        << "    <array>\n"
        << "        <string>" << EscapeXml(spec.script_path.string()) << "</string>\n"
        << "    </array>\n"
        << "    <key>RunAtLoad</key>\n"
        << "    <" << (spec.run_at_load ? "true" : "false") << "/>\n"
        << "    <key>KeepAlive</key>\n"
        << "    <" << (spec.keep_alive ? "true" : "false") << "/>\n";
    if (!spec.output_path.empty())
    {
        out << "    <key>StandardOutPath</key>\n"
            << "    <string>" << EscapeXml(spec.output_path.string()) << "</string>\n"
            << "    <key>StandardErrorPath</key>\n"
            << "    <string>" << EscapeXml(spec.output_path.string()) << "</string>\n";
    }
    out << "</dict>\n"
        << "</plist>\n";
    return out.str();
}

std::string LaunchAgentRegistrar::RenderLauncherScript(const ServiceSpec& spec)
{
    std::ostringstream out;
    out << "#!/bin/sh\n"
        << "# Generated by focusguard start. Launched by launchd as " << spec.label << ".\n"
        << "exec " << ShellQuote(spec.executable.string()) << " --monitor-internal-mode --home "
        << ShellQuote(spec.home_dir.string()) << "\n";
    return out.str();
}

std::string LaunchAgentRegistrar::EscapeXml(const std::string& text)
{
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
        case '&':
            escaped += "&amp;";
            break;
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        case '"':
            escaped += "&quot;";
            break;
        case '\'':
            escaped += "&apos;";
            break;
        default:
            escaped += c;
            break;
        }
    }
    return escaped;
}

std::string LaunchAgentRegistrar::ShellQuote(const std::string& text)
{
    std::string quoted = "'";
    for (char c : text)
    {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

bool LaunchAgentRegistrar::writeFile(const fs::path& path, const std::string& content, fs::perms perms,
                                     GuardError& error)
{
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec)
    {
        error = GuardError(GuardErrorKind::Write, "Failed to create " + path.parent_path().string(), ec.message(),
                           ec.value());
        return false;
    }

    {
        std::ofstream file(path, std::ios::trunc | std::ios::binary);
        if (!file)
        {
            int err = errno;
            error = GuardError(GuardErrorKind::Write, "Failed to write " + path.string(), std::strerror(err), err);
            return false;
        }
        file << content;
        file.close();
        if (!file)
        {
            error = GuardError(GuardErrorKind::Write, "Failed to write " + path.string(), "short write", EIO);
            return false;
        }
    }

    fs::permissions(path, perms, fs::perm_options::replace, ec);
    if (ec)
    {
        error = GuardError(GuardErrorKind::Write, "Failed to set permissions on " + path.string(), ec.message(),
                           ec.value());
        return false;
    }
    return true;
}

} // namespace focusguard
