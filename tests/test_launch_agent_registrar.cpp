#include <catch2/catch_test_macros.hpp>
#include "autostart/LaunchAgentRegistrar.hpp"
#include "autostart/ServiceManager.hpp"
#include "config/GuardConfig.hpp"
#include "utils/fakes.hpp"

#include <filesystem>

using namespace focusguard;
namespace fs = std::filesystem;

namespace {
ServiceSpec makeSpec(const fs::path& root)
{
    GuardConfig config = GuardConfig::Defaults(root / "home");
    config.launch_agents_dir = root / "LaunchAgents";
    config.user_name = "alice";
    return ServiceSpec::FromConfig(config, "/usr/local/bin/focusguard");
}
} // namespace

TEST_CASE("ServiceSpec - derived from config", "[autostart]")
{
    test_utils::TempDir dir;
    auto spec = makeSpec(dir.path());

    REQUIRE(spec.label == "com.alice.focusguard");
    REQUIRE(spec.descriptor_path == dir.path() / "LaunchAgents" / "com.alice.focusguard.plist");
    REQUIRE(spec.script_path == dir.path() / "home" / "monitor.sh");
    REQUIRE(spec.executable == fs::path("/usr/local/bin/focusguard"));
    REQUIRE(spec.run_at_load);
    REQUIRE(spec.keep_alive);
}

TEST_CASE("LaunchAgentRegistrar - install", "[autostart]")
{
    test_utils::TempDir dir;
    test_utils::FakeServiceManager manager;
    LaunchAgentRegistrar registrar(makeSpec(dir.path()), manager);

    SECTION("Writes an executable launcher script and the descriptor")
    {
        REQUIRE_FALSE(registrar.isInstalled());

        GuardError error;
        REQUIRE(registrar.install(error));
        REQUIRE(registrar.isInstalled());

        const auto& spec = registrar.spec();
        auto script_perms = fs::status(spec.script_path).permissions();
        REQUIRE((script_perms & fs::perms::owner_exec) != fs::perms::none);

        auto script = test_utils::readFile(spec.script_path);
        REQUIRE(script.rfind("#!/bin/sh\n", 0) == 0);
        REQUIRE(script.find("exec '/usr/local/bin/focusguard' --monitor-internal-mode --home '") != std::string::npos);

        auto plist = test_utils::readFile(spec.descriptor_path);
        REQUIRE(plist.find("<key>Label</key>\n    <string>com.alice.focusguard</string>") != std::string::npos);
        REQUIRE(plist.find("<string>" + spec.script_path.string() + "</string>") != std::string::npos);
        REQUIRE(plist.find("<key>RunAtLoad</key>\n    <true/>") != std::string::npos);
        REQUIRE(plist.find("<key>KeepAlive</key>\n    <true/>") != std::string::npos);

        // Installing never talks to launchd
        REQUIRE(manager.calls.empty());
    }

    SECTION("Re-install overwrites in place")
    {
        GuardError error;
        REQUIRE(registrar.install(error));
        auto first = test_utils::readFile(registrar.spec().descriptor_path);
        REQUIRE(registrar.install(error));
        REQUIRE(test_utils::readFile(registrar.spec().descriptor_path) == first);

        size_t plists = 0;
        for (const auto& entry : fs::directory_iterator(registrar.spec().descriptor_path.parent_path()))
        {
            if (entry.path().extension() == ".plist")
                ++plists;
        }
        REQUIRE(plists == 1);
    }

    SECTION("Unwritable location is a write error")
    {
        auto blocker = dir.path() / "blocker";
        test_utils::writeFile(blocker, "file, not a directory");

        ServiceSpec spec = registrar.spec();
        spec.descriptor_path = blocker / "agent.plist";
        LaunchAgentRegistrar broken(spec, manager);

        GuardError error;
        REQUIRE_FALSE(broken.install(error));
        REQUIRE(error.kind == GuardErrorKind::Write);
    }
}

TEST_CASE("LaunchAgentRegistrar - activate and deactivate", "[autostart]")
{
    test_utils::TempDir dir;
    test_utils::FakeServiceManager manager;
    LaunchAgentRegistrar registrar(makeSpec(dir.path()), manager);
    GuardError error;
    REQUIRE(registrar.install(error));

    SECTION("Load then unload by descriptor path")
    {
        REQUIRE(registrar.activate(error));
        REQUIRE(manager.loaded.count(registrar.spec().descriptor_path) == 1);

        REQUIRE(registrar.deactivate(error));
        REQUIRE(manager.loaded.empty());
        REQUIRE(manager.calls.size() == 2);

        // Deactivation leaves the descriptor on disk
        REQUIRE(registrar.isInstalled());
    }

    SECTION("Rejected load surfaces a service manager error")
    {
        manager.fail_load = true;
        REQUIRE_FALSE(registrar.activate(error));
        REQUIRE(error.kind == GuardErrorKind::ServiceManager);
    }

    SECTION("Loading twice is rejected")
    {
        REQUIRE(registrar.activate(error));
        GuardError second;
        REQUIRE_FALSE(registrar.activate(second));
        REQUIRE(second.kind == GuardErrorKind::ServiceManager);
    }
}

TEST_CASE("LaunchAgentRegistrar - escaping", "[autostart]")
{
    REQUIRE(LaunchAgentRegistrar::EscapeXml("a&b<c>\"d'") == "a&amp;b&lt;c&gt;&quot;d&apos;");
    REQUIRE(LaunchAgentRegistrar::ShellQuote("/Users/me/it's here") == "'/Users/me/it'\\''s here'");
    REQUIRE(LaunchAgentRegistrar::ShellQuote("") == "''");
}

TEST_CASE("LaunchctlServiceManager - drives the launchctl binary", "[autostart]")
{
    test_utils::TempDir dir;
    const auto args_file = dir.path() / "args.txt";
    const auto descriptor = dir.path() / "agent.plist";

    SECTION("Exit status 0 is success and arguments are passed through")
    {
        auto fake = test_utils::writeScript(dir.path() / "launchctl", "echo \"$@\" >> '" + args_file.string() + "'");
        LaunchctlServiceManager manager(fake);

        GuardError error;
        REQUIRE(manager.load(descriptor, error));
        REQUIRE(manager.unload(descriptor, error));
        REQUIRE(test_utils::readFile(args_file) ==
                "load -w " + descriptor.string() + "\nunload " + descriptor.string() + "\n");
    }

    SECTION("Non-zero exit is a service manager error carrying the output")
    {
        auto fake = test_utils::writeScript(dir.path() / "launchctl", "echo 'Load failed: 5: Input/output error'\nexit 5");
        LaunchctlServiceManager manager(fake);

        GuardError error;
        REQUIRE_FALSE(manager.load(descriptor, error));
        REQUIRE(error.kind == GuardErrorKind::ServiceManager);
        REQUIRE(error.errorCode == 5);
        REQUIRE(error.technicalInfo.find("Input/output error") != std::string::npos);
    }

    SECTION("A refusal printed with exit status 0 is still a service manager error")
    {
        auto fake = test_utils::writeScript(dir.path() / "launchctl",
                                            "echo \"$3\": service already loaded\nexit 0");
        LaunchctlServiceManager manager(fake);

        GuardError error;
        REQUIRE_FALSE(manager.load(descriptor, error));
        REQUIRE(error.kind == GuardErrorKind::ServiceManager);
        REQUIRE(error.technicalInfo.find("service already loaded") != std::string::npos);

        auto unload_fake = test_utils::writeScript(dir.path() / "launchctl-unload",
                                                   "echo 'Could not find specified service'");
        LaunchctlServiceManager unload_manager(unload_fake);

        GuardError unload_error;
        REQUIRE_FALSE(unload_manager.unload(descriptor, unload_error));
        REQUIRE(unload_error.kind == GuardErrorKind::ServiceManager);
        REQUIRE(unload_error.technicalInfo.find("Could not find specified service") != std::string::npos);
    }

    SECTION("Missing launchctl is a service manager error")
    {
        LaunchctlServiceManager manager(dir.path() / "no-such-launchctl");
        GuardError error;
        REQUIRE_FALSE(manager.unload(descriptor, error));
        REQUIRE(error.kind == GuardErrorKind::ServiceManager);
    }
}
