#pragma once

#include "../utils/GuardError.hpp"

#include <filesystem>
#include <string>

namespace focusguard
{

struct GuardConfig;
class IServiceManager;

struct ServiceSpec
{
    std::string label; // com.<user>.focusguard
    std::filesystem::path executable; // focusguard binary started in monitor mode
    std::filesystem::path home_dir;
    std::filesystem::path script_path; // generated launcher
    std::filesystem::path descriptor_path; // ~/Library/LaunchAgents/<label>.plist
    std::filesystem::path output_path; // stdout/stderr of the monitor
    bool run_at_load = true;
    bool keep_alive = true;

    static ServiceSpec FromConfig(const GuardConfig& config, const std::filesystem::path& executable);
};

// Installs and (de)activates the launch agent that keeps the monitor alive.
// deactivate() only unloads: the descriptor stays on disk after stop.
class LaunchAgentRegistrar
{
public:
    LaunchAgentRegistrar(ServiceSpec spec, IServiceManager& manager);

    // Writes the launcher script and the descriptor, overwriting both in place
    bool install(GuardError& error);

    bool activate(GuardError& error);
    bool deactivate(GuardError& error);

    bool isInstalled() const;
    const ServiceSpec& spec() const { return spec_; }

    static std::string RenderDescriptor(const ServiceSpec& spec);
    static std::string RenderLauncherScript(const ServiceSpec& spec);
    static std::string EscapeXml(const std::string& text);
    static std::string ShellQuote(const std::string& text);

private:
    bool writeFile(const std::filesystem::path& path, const std::string& content, std::filesystem::perms perms,
                   GuardError& error);

    ServiceSpec spec_;
    IServiceManager& manager_;
};

} // namespace focusguard
