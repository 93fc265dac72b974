#include <catch2/catch_test_macros.hpp>
#include "platform/ProcessDetector.hpp"
#include "platform/ProcessUtils.hpp"
#include "utils/fakes.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

TEST_CASE("ProcessDetector - name matching", "[process]")
{
    REQUIRE(ProcessDetector::namesMatch("SelfControl", "selfcontrol"));
    REQUIRE(ProcessDetector::namesMatch("FOREST", "Forest"));
    REQUIRE_FALSE(ProcessDetector::namesMatch("Forest", "Forest Helper"));
    REQUIRE_FALSE(ProcessDetector::namesMatch("Forest", ""));
}

TEST_CASE("ProcessDetector - long names are compared by the kernel prefix", "[process]")
{
    const std::string long_name(ProcessDetector::kMaxNameLength + 8, 'x');
    REQUIRE(ProcessDetector::comparableName(long_name).size() == ProcessDetector::kMaxNameLength);
    REQUIRE(ProcessDetector::comparableName("Forest") == "Forest");

#ifndef __APPLE__
    std::ifstream comm("/proc/self/comm");
    std::string self;
    std::getline(comm, self);

    // A test binary whose name the kernel cut short is still found by its full name
    if (self.size() == ProcessDetector::kMaxNameLength)
    {
        REQUIRE(ProcessDetector::isProcessRunning(self + "_with_a_longer_tail"));
    }
#endif
}

TEST_CASE("ProcessDetector - live process table", "[process]")
{
    auto names = ProcessDetector::listProcessNames();
    REQUIRE_FALSE(names.empty());

    REQUIRE_FALSE(ProcessDetector::isProcessRunning("focusguard-no-such-process-42"));

#ifndef __APPLE__
    std::ifstream comm("/proc/self/comm");
    std::string self;
    std::getline(comm, self);
    REQUIRE_FALSE(self.empty());

    std::string upper = self;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    REQUIRE(ProcessDetector::isProcessRunning(upper));
#endif
}

TEST_CASE("ProcessUtils - running helpers", "[process]")
{
    SECTION("Exit status and output are returned")
    {
        std::string output;
        int status = utils::ProcessUtils::RunProcess("/bin/sh", {"-c", "echo out; echo err >&2; exit 4"}, &output);
        REQUIRE(status == 4);
        REQUIRE(output.find("out\n") != std::string::npos);
        REQUIRE(output.find("err\n") != std::string::npos);
    }

    SECTION("Arguments reach the child unchanged")
    {
        std::string output;
        int status = utils::ProcessUtils::RunProcess(
            "/bin/sh", {"-c", "printf '%s|' \"$@\"", "sh", "two words", "", "quote'd"}, &output);
        REQUIRE(status == 0);
        REQUIRE(output == "two words||quote'd|");
    }

    SECTION("Missing program is not a success")
    {
        test_utils::TempDir dir;
        int status = utils::ProcessUtils::RunProcess(dir.path() / "missing", {});
        REQUIRE(status != 0);
    }

    SECTION("Executable path is absolute")
    {
        auto path = utils::ProcessUtils::GetExecutablePath();
        REQUIRE(path.is_absolute());
    }
}
